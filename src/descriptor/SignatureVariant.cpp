//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/SignatureVariant.cpp
// Purpose: Signature variant construction, invocation and rendering.
// Key invariants: See SignatureVariant.hpp.
// Ownership/Lifetime: Variants own their parameters and action.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "descriptor/SignatureVariant.hpp"

#include <exception>
#include <utility>

namespace arbiter::descriptor
{

SignatureVariant::SignatureVariant(std::optional<ReceiverParameter> receiver,
                                   std::vector<ValueParameter> parameters,
                                   Action action)
    : receiver_(std::move(receiver)), parameters_(std::move(parameters)), action_(std::move(action))
{
}

SignatureVariant::Action SignatureVariant::immediate(Body body)
{
    return [body = std::move(body)](const resolve::ResolvedCommandCall &resolved,
                                    const support::CancellationToken &) {
        std::promise<void> done;
        try
        {
            body(resolved);
            done.set_value();
        }
        catch (...)
        {
            done.set_exception(std::current_exception());
        }
        return done.get_future();
    };
}

std::future<void> SignatureVariant::call(const resolve::ResolvedCommandCall &resolved,
                                         const support::CancellationToken &cancel) const
{
    return action_(resolved, cancel);
}

std::string SignatureVariant::toString() const
{
    std::string out = "CommandSignatureVariant(";
    bool first = true;
    if (receiver_)
    {
        out += receiver_->toString();
        first = false;
    }
    for (const auto &param : parameters_)
    {
        if (!first)
            out += ", ";
        out += descriptor::toString(param);
        first = false;
    }
    out += ')';
    return out;
}

SignatureVariantRef makeVariant(std::optional<ReceiverParameter> receiver,
                                std::vector<ValueParameter> parameters,
                                SignatureVariant::Action action)
{
    return std::make_shared<const SignatureVariant>(
        std::move(receiver), std::move(parameters), std::move(action));
}

} // namespace arbiter::descriptor
