//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Invoker.hpp
// Purpose: Runs the action bound to a resolved command call.
// Key invariants: A cancelled token prevents the action from starting; action
//                 failures surface through the returned future.
// Ownership/Lifetime: The resolved call must outlive the returned future.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "resolve/ResolvedCommandCall.hpp"
#include "support/cancellation.hpp"
#include "support/diag_expected.hpp"

#include <future>

namespace arbiter::exec
{

/// @brief Start the action of @p resolved.
/// @return Future of the action; holds OperationCancelled when @p cancel was
///         already cancelled, or the exception the action threw while starting.
std::future<void> execute(const resolve::ResolvedCommandCall &resolved,
                          const support::CancellationToken &cancel = {});

/// @brief Execute @p resolved and wait for completion.
/// @return Success, or an error diagnostic naming the callee when the action
///         threw or was cancelled.
support::Expected<void> runToCompletion(const resolve::ResolvedCommandCall &resolved,
                                        const support::CancellationToken &cancel = {});

} // namespace arbiter::exec
