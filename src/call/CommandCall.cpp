//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: call/CommandCall.cpp
// Purpose: ValueArgument construction and native-type queries.
// Key invariants: See CommandCall.hpp.
// Ownership/Lifetime: Value semantics.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "call/CommandCall.hpp"

#include <utility>

namespace arbiter::call
{

ValueArgument::ValueArgument(std::optional<types::Value> value,
                             std::optional<std::string> raw,
                             std::vector<TypeVariant> variants)
    : value_(std::move(value)), raw_(std::move(raw)), variants_(std::move(variants))
{
}

ValueArgument ValueArgument::fromToken(std::string raw, std::vector<TypeVariant> variants)
{
    return ValueArgument(std::nullopt, std::move(raw), std::move(variants));
}

ValueArgument ValueArgument::fromValue(types::Value value,
                                       std::optional<std::string> raw,
                                       std::vector<TypeVariant> variants)
{
    return ValueArgument(std::move(value), std::move(raw), std::move(variants));
}

types::TypeDescriptor ValueArgument::nativeType() const
{
    if (value_)
        return value_->type();
    return types::string();
}

types::Value ValueArgument::passThrough() const
{
    if (value_)
        return *value_;
    return types::Value::string(raw_.value_or(std::string()));
}

std::string ValueArgument::toString() const
{
    if (raw_)
        return *raw_;
    if (value_)
        return value_->toString();
    return std::string();
}

} // namespace arbiter::call
