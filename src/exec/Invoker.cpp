//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Invoker.cpp
// Purpose: Action invocation and completion handling.
// Key invariants: See Invoker.hpp.
// Ownership/Lifetime: Stateless.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "exec/Invoker.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace arbiter::exec
{

namespace
{

std::future<void> failed(std::exception_ptr error)
{
    std::promise<void> p;
    p.set_exception(std::move(error));
    return p.get_future();
}

} // namespace

std::future<void> execute(const resolve::ResolvedCommandCall &resolved,
                          const support::CancellationToken &cancel)
{
    if (cancel.isCancellationRequested())
        return failed(std::make_exception_ptr(support::OperationCancelled()));
    if (!resolved.variant)
        return failed(std::make_exception_ptr(std::logic_error("call has no resolved variant")));

    try
    {
        return resolved.variant->call(resolved, cancel);
    }
    catch (...)
    {
        return failed(std::current_exception());
    }
}

support::Expected<void> runToCompletion(const resolve::ResolvedCommandCall &resolved,
                                        const support::CancellationToken &cancel)
{
    auto future = execute(resolved, cancel);
    if (!future.valid())
        return support::makeError(resolved.calleeName, "action returned no result");

    try
    {
        future.get();
    }
    catch (const support::OperationCancelled &e)
    {
        return support::makeError(resolved.calleeName, e.what());
    }
    catch (const std::exception &e)
    {
        return support::makeError(resolved.calleeName,
                                  std::string("command failed: ") + e.what());
    }
    catch (...)
    {
        return support::makeError(resolved.calleeName, "command failed: unknown exception");
    }
    return {};
}

} // namespace arbiter::exec
