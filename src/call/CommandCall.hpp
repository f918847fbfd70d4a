//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: call/CommandCall.hpp
// Purpose: Value objects produced by a call parser: the caller, the supplied
//          arguments and the unresolved call grouping them.
// Key invariants: A ValueArgument carries a value, a raw token, or both.
// Ownership/Lifetime: Plain value types; immutable once produced.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "types/TypeDescriptor.hpp"
#include "types/Value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace arbiter::call
{

/// @brief Identity of whoever issued a call.
/// @details @ref type is checked against a variant's receiver parameter.
struct Caller
{
    std::string name;            ///< Display identity, e.g. "console"
    types::TypeDescriptor type;  ///< Capability type of the caller
};

class ValueArgument;

/// @brief Already-typed alternative representation an argument offers.
/// @details Offered variants are tried before any textual conversion; the
///          mapping may still fail when it is actually performed.
struct TypeVariant
{
    std::string name;              ///< Label used in traces and diagnostics
    types::TypeDescriptor outType; ///< Type the mapping produces
    std::function<support::Expected<types::Value>(const ValueArgument &)> map;
};

/// @brief One supplied argument.
class ValueArgument
{
  public:
    /// @brief Untyped argument consisting only of raw text.
    static ValueArgument fromToken(std::string raw, std::vector<TypeVariant> variants = {});

    /// @brief Pre-typed argument, optionally keeping the text it came from.
    static ValueArgument fromValue(types::Value value,
                                   std::optional<std::string> raw = std::nullopt,
                                   std::vector<TypeVariant> variants = {});

    const std::optional<types::Value> &value() const
    {
        return value_;
    }

    const std::optional<std::string> &rawToken() const
    {
        return raw_;
    }

    const std::vector<TypeVariant> &typeVariants() const
    {
        return variants_;
    }

    /// @brief Type of the carried value, or String for raw text.
    types::TypeDescriptor nativeType() const;

    /// @brief The argument as passed through without conversion.
    types::Value passThrough() const;

    /// @brief Raw token when present, else the rendered carried value.
    std::string toString() const;

  private:
    ValueArgument(std::optional<types::Value> value,
                  std::optional<std::string> raw,
                  std::vector<TypeVariant> variants);

    std::optional<types::Value> value_;
    std::optional<std::string> raw_;
    std::vector<TypeVariant> variants_;
};

/// @brief Call as produced by the call parser, before resolution.
struct UnresolvedCall
{
    Caller caller;                        ///< Who issued the call
    std::string calleeName;               ///< One of the callee command's names
    std::vector<ValueArgument> arguments; ///< Explicit value arguments in order
};

} // namespace arbiter::call
