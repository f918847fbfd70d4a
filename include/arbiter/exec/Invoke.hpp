//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/arbiter/exec/Invoke.hpp
// Purpose: Stable façade exposing execution of resolved calls.
// Key invariants: Mirrors exec::execute and exec::runToCompletion only.
// Ownership/Lifetime: Resolved calls must outlive the futures returned.
// Links: DESIGN.md
#pragma once

#include "exec/Invoker.hpp"
#include "support/cancellation.hpp"
