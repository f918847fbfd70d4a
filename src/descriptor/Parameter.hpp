//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parameter.hpp
/// @brief Declared parameters of a signature variant and argument matching.
///
/// @details Two kinds of value parameter exist:
///
/// | Kind                     | Matches                                       |
/// |--------------------------|-----------------------------------------------|
/// | PositionalParameter      | any argument convertible to its type          |
/// | StringConstantParameter  | only a raw token equal to its literal         |
///
/// Both are constructed through factories returning Expected so invalid
/// declarations (blank literals, non-array varargs) never reach resolution.
/// A ReceiverParameter constrains the caller rather than an argument.
///
/// accepting() computes how well one argument fits one parameter:
/// 1. a vararg parameter is matched against its element type;
/// 2. a native type that is a subtype of the expected type is Direct;
/// 3. otherwise the first offered variant producing a subtype is used;
/// 4. otherwise a contextual parser for the expected type is used, provided
///    the argument carries raw text for it to read;
/// 5. otherwise the argument is Impossible.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "call/CommandCall.hpp"
#include "descriptor/Acceptance.hpp"
#include "descriptor/ArgumentContext.hpp"
#include "support/diag_expected.hpp"
#include "types/TypeDescriptor.hpp"
#include "types/TypeHierarchy.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace arbiter::descriptor
{

/// @brief Ordinary typed parameter.
class PositionalParameter
{
  public:
    /// @brief Validate and build a positional parameter.
    /// @return Error when @p vararg is set and @p type is not an array type.
    static support::Expected<PositionalParameter> create(std::optional<std::string> name,
                                                         types::TypeDescriptor type,
                                                         bool optional = false,
                                                         bool vararg = false);

    /// @brief Required, non-vararg parameter.
    static PositionalParameter createRequired(std::string name, types::TypeDescriptor type);

    /// @brief Optional, non-vararg parameter.
    static PositionalParameter createOptional(std::string name, types::TypeDescriptor type);

    const std::optional<std::string> &name() const
    {
        return name_;
    }

    const types::TypeDescriptor &type() const
    {
        return type_;
    }

    bool isOptional() const
    {
        return optional_;
    }

    bool isVararg() const
    {
        return vararg_;
    }

    /// @brief `[vararg ]name: Type[ = ...]`.
    std::string toString() const;

  private:
    PositionalParameter(std::optional<std::string> name,
                        types::TypeDescriptor type,
                        bool optional,
                        bool vararg);

    std::optional<std::string> name_;
    types::TypeDescriptor type_;
    bool optional_;
    bool vararg_;
};

/// @brief Literal keyword parameter, e.g. the `add` in `foo add 5`.
class StringConstantParameter
{
  public:
    /// @brief Validate and build a constant parameter.
    /// @return Error when @p expectingValue is blank or contains whitespace.
    static support::Expected<StringConstantParameter> create(std::optional<std::string> name,
                                                             std::string expectingValue);

    const std::optional<std::string> &name() const
    {
        return name_;
    }

    const std::string &expectingValue() const
    {
        return expecting_;
    }

    types::TypeDescriptor type() const
    {
        return types::string();
    }

    bool isOptional() const
    {
        return false;
    }

    bool isVararg() const
    {
        return false;
    }

    /// @brief `<literal>`.
    std::string toString() const;

  private:
    StringConstantParameter(std::optional<std::string> name, std::string expectingValue);

    std::optional<std::string> name_;
    std::string expecting_;
};

/// @brief Sealed set of value parameter kinds.
using ValueParameter = std::variant<PositionalParameter, StringConstantParameter>;

/// @name Uniform queries over ValueParameter
/// @{
const std::optional<std::string> &parameterName(const ValueParameter &p);
types::TypeDescriptor parameterType(const ValueParameter &p);
bool isOptional(const ValueParameter &p);
bool isVararg(const ValueParameter &p);
std::string toString(const ValueParameter &p);
/// @}

/// @brief Build a constant parameter wrapped as ValueParameter.
support::Expected<ValueParameter> makeStringConstant(std::optional<std::string> name,
                                                     std::string expectingValue);

/// @brief Build a positional parameter wrapped as ValueParameter.
support::Expected<ValueParameter> makePositional(std::optional<std::string> name,
                                                 types::TypeDescriptor type,
                                                 bool optional = false,
                                                 bool vararg = false);

/// @brief Caller-identity constraint of a variant.
struct ReceiverParameter
{
    static constexpr std::string_view kName = "<receiver>";

    types::TypeDescriptor type; ///< Required caller type
    bool isOptional = false;    ///< Tolerate callers of another type

    /// @brief `<receiver>: Type`.
    std::string toString() const;
};

/// @brief Match @p argument against @p parameter.
/// @param context Conversion registry; may be null when none is available.
ArgumentAcceptance accepting(const ValueParameter &parameter,
                             const call::ValueArgument &argument,
                             const ArgumentContext *context,
                             const types::SubtypeRelation &relation);

/// @brief True when accepting() yields an acceptable outcome.
bool accepts(const ValueParameter &parameter,
             const call::ValueArgument &argument,
             const ArgumentContext *context,
             const types::SubtypeRelation &relation);

} // namespace arbiter::descriptor
