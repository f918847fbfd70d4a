//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/SignatureVariant.hpp
// Purpose: One overload of a command: receiver constraint, value parameters
//          and the action bound to them.
// Key invariants: Immutable once constructed; the variants registered under
//                 one callee name form its complete overload set.
// Ownership/Lifetime: Shared immutably via SignatureVariantRef; resolved
//                     calls keep their variant alive.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "descriptor/Parameter.hpp"
#include "support/cancellation.hpp"

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbiter::resolve
{
struct ResolvedCommandCall;
} // namespace arbiter::resolve

namespace arbiter::descriptor
{

/// @brief One overload of a command.
class SignatureVariant
{
  public:
    /// @brief Bound action; may complete asynchronously.
    /// @details The token is the one of the surrounding invocation; actions
    ///          performing long-running work are expected to observe it.
    using Action = std::function<std::future<void>(const resolve::ResolvedCommandCall &,
                                                   const support::CancellationToken &)>;

    /// @brief Synchronous body adapted by immediate().
    using Body = std::function<void(const resolve::ResolvedCommandCall &)>;

    SignatureVariant(std::optional<ReceiverParameter> receiver,
                     std::vector<ValueParameter> parameters,
                     Action action);

    /// @brief Wrap a synchronous body into an Action returning a ready future.
    /// @details Exceptions thrown by @p body are stored in the future.
    static Action immediate(Body body);

    const std::optional<ReceiverParameter> &receiverParameter() const
    {
        return receiver_;
    }

    const std::vector<ValueParameter> &valueParameters() const
    {
        return parameters_;
    }

    /// @brief Invoke the bound action.
    std::future<void> call(const resolve::ResolvedCommandCall &resolved,
                           const support::CancellationToken &cancel) const;

    /// @brief `CommandSignatureVariant(<receiver>: T, p1, p2)`.
    std::string toString() const;

  private:
    std::optional<ReceiverParameter> receiver_;
    std::vector<ValueParameter> parameters_;
    Action action_;
};

using SignatureVariantRef = std::shared_ptr<const SignatureVariant>;

/// @brief Convenience for std::make_shared<const SignatureVariant>.
SignatureVariantRef makeVariant(std::optional<ReceiverParameter> receiver,
                                std::vector<ValueParameter> parameters,
                                SignatureVariant::Action action);

} // namespace arbiter::descriptor
