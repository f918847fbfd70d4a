//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/Parameter.cpp
// Purpose: Parameter factories, rendering and argument acceptance.
// Key invariants: Constant literals are non-blank and whitespace-free; vararg
//                 positional parameters have array types.
// Ownership/Lifetime: Value types.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "descriptor/Parameter.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace arbiter::descriptor
{

//===----------------------------------------------------------------------===//
// Construction
//===----------------------------------------------------------------------===//

PositionalParameter::PositionalParameter(std::optional<std::string> name,
                                         types::TypeDescriptor type,
                                         bool optional,
                                         bool vararg)
    : name_(std::move(name)), type_(std::move(type)), optional_(optional), vararg_(vararg)
{
}

support::Expected<PositionalParameter> PositionalParameter::create(std::optional<std::string> name,
                                                                   types::TypeDescriptor type,
                                                                   bool optional,
                                                                   bool vararg)
{
    if (vararg && !type.isArray())
    {
        return support::makeError(name.value_or(std::string()),
                                  "type must be an array type if vararg; given " + type.toString());
    }
    return PositionalParameter(std::move(name), std::move(type), optional, vararg);
}

PositionalParameter PositionalParameter::createRequired(std::string name, types::TypeDescriptor type)
{
    return PositionalParameter(std::move(name), std::move(type), false, false);
}

PositionalParameter PositionalParameter::createOptional(std::string name, types::TypeDescriptor type)
{
    return PositionalParameter(std::move(name), std::move(type), true, false);
}

StringConstantParameter::StringConstantParameter(std::optional<std::string> name,
                                                 std::string expectingValue)
    : name_(std::move(name)), expecting_(std::move(expectingValue))
{
}

support::Expected<StringConstantParameter> StringConstantParameter::create(
    std::optional<std::string> name, std::string expectingValue)
{
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    if (std::all_of(expectingValue.begin(), expectingValue.end(), isSpace))
        return support::makeError(name.value_or(std::string()), "expectingValue must not be blank");
    if (std::any_of(expectingValue.begin(), expectingValue.end(), isSpace))
    {
        return support::makeError(name.value_or(std::string()),
                                  "expectingValue must not contain whitespace");
    }
    return StringConstantParameter(std::move(name), std::move(expectingValue));
}

support::Expected<ValueParameter> makeStringConstant(std::optional<std::string> name,
                                                     std::string expectingValue)
{
    auto param = StringConstantParameter::create(std::move(name), std::move(expectingValue));
    if (!param)
        return param.error();
    return ValueParameter{std::move(param.value())};
}

support::Expected<ValueParameter> makePositional(std::optional<std::string> name,
                                                 types::TypeDescriptor type,
                                                 bool optional,
                                                 bool vararg)
{
    auto param = PositionalParameter::create(std::move(name), std::move(type), optional, vararg);
    if (!param)
        return param.error();
    return ValueParameter{std::move(param.value())};
}

//===----------------------------------------------------------------------===//
// Queries and rendering
//===----------------------------------------------------------------------===//

std::string PositionalParameter::toString() const
{
    std::string out;
    if (vararg_)
        out += "vararg ";
    if (name_)
        out += *name_ + ": ";
    out += type_.toString();
    if (optional_)
        out += " = ...";
    return out;
}

std::string StringConstantParameter::toString() const
{
    return "<" + expecting_ + ">";
}

std::string ReceiverParameter::toString() const
{
    return std::string(kName) + ": " + type.toString();
}

const std::optional<std::string> &parameterName(const ValueParameter &p)
{
    return std::visit([](const auto &param) -> const std::optional<std::string> & { return param.name(); },
                      p);
}

types::TypeDescriptor parameterType(const ValueParameter &p)
{
    return std::visit([](const auto &param) { return types::TypeDescriptor(param.type()); }, p);
}

bool isOptional(const ValueParameter &p)
{
    return std::visit([](const auto &param) { return param.isOptional(); }, p);
}

bool isVararg(const ValueParameter &p)
{
    return std::visit([](const auto &param) { return param.isVararg(); }, p);
}

std::string toString(const ValueParameter &p)
{
    return std::visit([](const auto &param) { return param.toString(); }, p);
}

//===----------------------------------------------------------------------===//
// Acceptance
//===----------------------------------------------------------------------===//

namespace
{
ArgumentAcceptance acceptingType(const types::TypeDescriptor &expected,
                                 const call::ValueArgument &argument,
                                 const ArgumentContext *context,
                                 const types::SubtypeRelation &relation)
{
    if (relation.isSubtypeOrEqual(argument.nativeType(), expected))
        return acceptance::Direct{};

    const auto &variants = argument.typeVariants();
    for (std::size_t i = 0; i < variants.size(); ++i)
    {
        // First match wins; competing variants are not ranked.
        if (relation.isSubtypeOrEqual(variants[i].outType, expected))
            return acceptance::WithTypeConversion{i};
    }

    if (context && argument.rawToken())
    {
        if (auto parser = context->lookup(expected, relation))
            return acceptance::WithContextualConversion{std::move(parser)};
    }
    return acceptance::Impossible{};
}

struct Acceptor
{
    const call::ValueArgument &argument;
    const ArgumentContext *context;
    const types::SubtypeRelation &relation;

    ArgumentAcceptance operator()(const StringConstantParameter &param) const
    {
        if (argument.rawToken() && *argument.rawToken() == param.expectingValue())
            return acceptance::Direct{};
        return acceptance::Impossible{};
    }

    ArgumentAcceptance operator()(const PositionalParameter &param) const
    {
        if (param.isVararg())
            return acceptingType(param.type().elementType(), argument, context, relation);
        return acceptingType(param.type(), argument, context, relation);
    }
};
} // namespace

ArgumentAcceptance accepting(const ValueParameter &parameter,
                             const call::ValueArgument &argument,
                             const ArgumentContext *context,
                             const types::SubtypeRelation &relation)
{
    return std::visit(Acceptor{argument, context, relation}, parameter);
}

bool accepts(const ValueParameter &parameter,
             const call::ValueArgument &argument,
             const ArgumentContext *context,
             const types::SubtypeRelation &relation)
{
    return isAcceptable(accepting(parameter, argument, context, relation));
}

} // namespace arbiter::descriptor
