//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/arbiter/resolve/Resolve.hpp
// Purpose: Stable façade exposing call resolution entry points.
// Key invariants: Mirrors resolve::CallResolver public API only.
// Ownership/Lifetime: Callers retain ownership of calls, variants and contexts.
// Links: DESIGN.md
#pragma once

#include "descriptor/ArgumentContext.hpp"
#include "descriptor/BuiltinParsers.hpp"
#include "descriptor/SignatureVariant.hpp"
#include "resolve/CallResolver.hpp"
#include "types/TypeHierarchy.hpp"

/// @file include/arbiter/resolve/Resolve.hpp
/// @brief Public forwarding header so embedders can declare commands and
///        resolve calls without including src/ paths directly.
