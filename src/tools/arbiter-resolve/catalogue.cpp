//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/arbiter-resolve/catalogue.cpp
// Purpose: Declarations of the builtin demo commands.
// Key invariants: See catalogue.hpp.
// Ownership/Lifetime: Actions capture the output stream by pointer.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "tools/arbiter-resolve/catalogue.hpp"

#include "resolve/ResolvedCommandCall.hpp"

#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace arbiter::tools::cli
{

namespace
{

using descriptor::SignatureVariant;
using descriptor::ValueParameter;
using resolve::ResolvedCommandCall;

constexpr std::string_view kCommandSender = "CommandSender";
constexpr std::string_view kConsoleSender = "ConsoleCommandSender";
constexpr std::string_view kUserSender = "UserCommandSender";
constexpr std::string_view kMemberSender = "MemberCommandSender";

std::string joinWords(const types::Value::Array &words)
{
    std::string out;
    for (const auto &word : words)
    {
        if (!out.empty())
            out += ' ';
        out += word.asString();
    }
    return out;
}

} // namespace

support::Expected<Catalogue> Catalogue::create(std::ostream &out)
{
    Catalogue catalogue;
    std::ostream *os = &out;

    const std::pair<std::string_view, std::string_view> senders[] = {
        {kCommandSender, types::kAny},
        {kConsoleSender, kCommandSender},
        {kUserSender, kCommandSender},
        {kMemberSender, kUserSender},
    };
    for (const auto &[name, super] : senders)
    {
        auto declared = catalogue.hierarchy_.declare(std::string(name), {std::string(super)});
        if (!declared)
            return declared.error();
    }
    catalogue.context_ = descriptor::ArgumentContext::builtins();

    // foo <add> n: Int | foo target: String
    auto addKeyword = descriptor::makeStringConstant(std::nullopt, "add");
    if (!addKeyword)
        return addKeyword.error();
    CommandEntry foo{"foo", "add a number or name a target", {}};
    foo.variants.push_back(descriptor::makeVariant(
        std::nullopt,
        {addKeyword.value(), descriptor::PositionalParameter::createRequired("n", types::integer())},
        SignatureVariant::immediate([os](const ResolvedCommandCall &call) {
            *os << "foo: added " << call.arguments[1].asInt() << '\n';
        })));
    foo.variants.push_back(descriptor::makeVariant(
        std::nullopt,
        {descriptor::PositionalParameter::createRequired("target", types::string())},
        SignatureVariant::immediate([os](const ResolvedCommandCall &call) {
            *os << "foo: target " << call.arguments[0].asString() << '\n';
        })));
    catalogue.commands_.push_back(std::move(foo));

    // sum vararg numbers: Array<Int>
    auto numbers = descriptor::makePositional("numbers", types::arrayOf(types::integer()), false, true);
    if (!numbers)
        return numbers.error();
    CommandEntry sum{"sum", "add up any number of integers", {}};
    sum.variants.push_back(descriptor::makeVariant(
        std::nullopt,
        {numbers.value()},
        SignatureVariant::immediate([os](const ResolvedCommandCall &call) {
            std::int64_t total = 0;
            for (const auto &n : call.arguments[0].asArray())
                total += n.asInt();
            *os << "sum: " << total << '\n';
        })));
    catalogue.commands_.push_back(std::move(sum));

    // say (receiver: UserCommandSender) vararg words: Array<String>
    auto words = descriptor::makePositional("words", types::arrayOf(types::string()), false, true);
    if (!words)
        return words.error();
    CommandEntry say{"say", "broadcast a message; users only", {}};
    say.variants.push_back(descriptor::makeVariant(
        descriptor::ReceiverParameter{types::TypeDescriptor::nominal(std::string(kUserSender))},
        {words.value()},
        SignatureVariant::immediate([os](const ResolvedCommandCall &call) {
            *os << call.receiver->name << " says: " << joinWords(call.arguments[0].asArray())
                << '\n';
        })));
    catalogue.commands_.push_back(std::move(say));

    // greet [name: String]
    CommandEntry greet{"greet", "greet someone, or yourself", {}};
    greet.variants.push_back(descriptor::makeVariant(
        std::nullopt,
        {descriptor::PositionalParameter::createOptional("name", types::string())},
        SignatureVariant::immediate([os](const ResolvedCommandCall &call) {
            const auto &name = call.arguments[0];
            *os << "Hello, " << (name.isNull() ? call.caller.name : name.asString()) << "!\n";
        })));
    catalogue.commands_.push_back(std::move(greet));

    // divide a: Long, b: Long
    CommandEntry divide{"divide", "integer division", {}};
    divide.variants.push_back(descriptor::makeVariant(
        std::nullopt,
        {descriptor::PositionalParameter::createRequired("a", types::longInt()),
         descriptor::PositionalParameter::createRequired("b", types::longInt())},
        SignatureVariant::immediate([os](const ResolvedCommandCall &call) {
            const auto a = call.arguments[0].asInt();
            const auto b = call.arguments[1].asInt();
            if (b == 0)
                throw std::domain_error("division by zero");
            if (b == -1 && a == std::numeric_limits<std::int64_t>::min())
                throw std::overflow_error("quotient out of range");
            *os << "divide: " << a / b << '\n';
        })));
    catalogue.commands_.push_back(std::move(divide));

    return catalogue;
}

const CommandEntry *Catalogue::find(std::string_view name) const
{
    for (const auto &entry : commands_)
    {
        if (entry.name == name)
            return &entry;
    }
    return nullptr;
}

std::optional<call::Caller> Catalogue::callerFor(std::string_view role)
{
    if (role == "console")
        return call::Caller{"console", types::TypeDescriptor::nominal(std::string(kConsoleSender))};
    if (role == "user")
        return call::Caller{"user", types::TypeDescriptor::nominal(std::string(kUserSender))};
    if (role == "member")
        return call::Caller{"member", types::TypeDescriptor::nominal(std::string(kMemberSender))};
    return std::nullopt;
}

} // namespace arbiter::tools::cli
