// File: tests/unit/test_parameter_acceptance.cpp
// Purpose: Check parameter factories, rendering and argument acceptance.
// Key invariants: Subtype matches are Direct regardless of the registry;
//                 offered variants outrank contextual parsing; constants only
//                 accept their exact literal.
// Ownership/Lifetime: Test owns parameters, arguments and contexts.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "call/CommandCall.hpp"
#include "descriptor/Acceptance.hpp"
#include "descriptor/ArgumentContext.hpp"
#include "descriptor/Parameter.hpp"
#include "descriptor/SignatureVariant.hpp"
#include "resolve/ResolvedCommandCall.hpp"
#include "types/TypeHierarchy.hpp"
#include "types/Value.hpp"

#include <variant>

using namespace arbiter;
using namespace arbiter::descriptor;
using call::ValueArgument;
using types::TypeDescriptor;
using types::Value;

namespace
{

class Member final : public types::Object
{
  public:
    TypeDescriptor type() const override
    {
        return TypeDescriptor::nominal("Member");
    }

    std::string display() const override
    {
        return "member";
    }
};

types::TypeHierarchy memberHierarchy()
{
    types::TypeHierarchy h;
    EXPECT_TRUE(h.declare("User").hasValue());
    EXPECT_TRUE(h.declare("Member", {"User"}).hasValue());
    return h;
}

call::TypeVariant offering(TypeDescriptor out, std::int64_t value)
{
    return call::TypeVariant{"offered " + out.toString(),
                             out,
                             [value](const ValueArgument &) -> support::Expected<Value> {
                                 return Value::integer(value);
                             }};
}

void noop(const resolve::ResolvedCommandCall &) {}

} // namespace

TEST(Parameter, PositionalRendering)
{
    EXPECT_EQ(PositionalParameter::createRequired("n", types::integer()).toString(), "n: Int");
    EXPECT_EQ(PositionalParameter::createOptional("name", types::string()).toString(),
              "name: String = ...");

    auto vararg = PositionalParameter::create("xs", types::arrayOf(types::integer()), false, true);
    ASSERT_TRUE(vararg.hasValue());
    EXPECT_EQ(vararg.value().toString(), "vararg xs: Array<Int>");

    auto unnamed = PositionalParameter::create(std::nullopt, types::integer().asNullable());
    ASSERT_TRUE(unnamed.hasValue());
    EXPECT_EQ(unnamed.value().toString(), "Int?");
}

TEST(Parameter, VarargRequiresArrayType)
{
    auto bad = makePositional("xs", types::integer(), false, true);
    ASSERT_FALSE(bad.hasValue());
    EXPECT_NE(bad.error().message.find("array"), std::string::npos);
}

TEST(Parameter, StringConstantValidation)
{
    auto add = makeStringConstant(std::nullopt, "add");
    ASSERT_TRUE(add.hasValue());
    EXPECT_EQ(toString(add.value()), "<add>");
    EXPECT_EQ(parameterType(add.value()), types::string());
    EXPECT_FALSE(isOptional(add.value()));
    EXPECT_FALSE(isVararg(add.value()));

    EXPECT_FALSE(makeStringConstant("k", "").hasValue());
    EXPECT_FALSE(makeStringConstant("k", "   ").hasValue());
    EXPECT_FALSE(makeStringConstant("k", "two words").hasValue());
}

TEST(Parameter, ReceiverAndVariantRendering)
{
    ReceiverParameter receiver{TypeDescriptor::nominal("User")};
    EXPECT_EQ(receiver.toString(), "<receiver>: User");

    auto add = makeStringConstant(std::nullopt, "add");
    ASSERT_TRUE(add.hasValue());
    auto variant = makeVariant(receiver,
                               {add.value(), PositionalParameter::createRequired("n", types::integer())},
                               SignatureVariant::immediate(noop));
    EXPECT_EQ(variant->toString(), "CommandSignatureVariant(<receiver>: User, <add>, n: Int)");
    EXPECT_EQ(makeVariant(std::nullopt, {}, SignatureVariant::immediate(noop))
                  ->toString(),
              "CommandSignatureVariant()");
}

TEST(Acceptance, LevelsAreOrdered)
{
    EXPECT_GT(acceptanceLevel(acceptance::Direct{}),
              acceptanceLevel(acceptance::WithTypeConversion{0}));
    EXPECT_GT(acceptanceLevel(acceptance::WithTypeConversion{0}),
              acceptanceLevel(acceptance::WithContextualConversion{nullptr}));
    EXPECT_EQ(acceptanceLevel(acceptance::WithContextualConversion{nullptr}), 10);
    EXPECT_EQ(acceptanceLevel(acceptance::WithTypeConversion{0}), 20);
    EXPECT_FALSE(isAcceptable(acceptance::ResolutionAmbiguity{}));
    EXPECT_TRUE(isNotAcceptable(acceptance::Impossible{}));
    EXPECT_EQ(toString(ArgumentAcceptance{acceptance::Impossible{}}), "Impossible");
}

TEST(Acceptance, SubtypeIsDirectRegardlessOfRegistry)
{
    auto h = memberHierarchy();
    const ValueParameter param =
        PositionalParameter::createRequired("u", TypeDescriptor::nominal("User"));
    const auto arg = ValueArgument::fromValue(Value::object(std::make_shared<const Member>()));

    for (const auto &ctx : {ArgumentContext::empty(), ArgumentContext::builtins()})
    {
        auto acc = accepting(param, arg, ctx.get(), h);
        EXPECT_TRUE(std::holds_alternative<acceptance::Direct>(acc));
    }
    EXPECT_TRUE(std::holds_alternative<acceptance::Direct>(accepting(param, arg, nullptr, h)));
}

TEST(Acceptance, RawTokenAgainstStringIsDirect)
{
    types::TypeHierarchy h;
    const ValueParameter param = PositionalParameter::createRequired("s", types::string());
    auto acc = accepting(param, ValueArgument::fromToken("hello"), nullptr, h);
    EXPECT_TRUE(std::holds_alternative<acceptance::Direct>(acc));
}

TEST(Acceptance, OfferedVariantBeatsContextualParser)
{
    types::TypeHierarchy h;
    const ValueParameter param = PositionalParameter::createRequired("n", types::integer());
    const auto arg = ValueArgument::fromToken("5",
                                              {offering(types::longInt(), 1),
                                               offering(types::integer(), 2),
                                               offering(types::integer(), 3)});

    auto acc = accepting(param, arg, ArgumentContext::builtins().get(), h);
    ASSERT_TRUE(std::holds_alternative<acceptance::WithTypeConversion>(acc));
    EXPECT_EQ(std::get<acceptance::WithTypeConversion>(acc).variantIndex, 1u);
}

TEST(Acceptance, ContextualParserNeedsRawTokenAndRegistryEntry)
{
    types::TypeHierarchy h;
    const ValueParameter param = PositionalParameter::createRequired("n", types::integer());

    auto parsed = accepting(param, ValueArgument::fromToken("5"), ArgumentContext::builtins().get(), h);
    ASSERT_TRUE(std::holds_alternative<acceptance::WithContextualConversion>(parsed));
    EXPECT_EQ(toString(parsed), "WithContextualConversion(Int)");

    EXPECT_TRUE(isNotAcceptable(
        accepting(param, ValueArgument::fromToken("5"), ArgumentContext::empty().get(), h)));

    // A pre-typed value without text cannot be parsed.
    const auto typed = ValueArgument::fromValue(Value::string("5"));
    EXPECT_TRUE(
        isNotAcceptable(accepting(param, typed, ArgumentContext::builtins().get(), h)));
}

TEST(Acceptance, StringConstantRequiresExactToken)
{
    types::TypeHierarchy h;
    auto add = makeStringConstant(std::nullopt, "add");
    ASSERT_TRUE(add.hasValue());

    EXPECT_TRUE(accepts(add.value(), ValueArgument::fromToken("add"), nullptr, h));
    EXPECT_FALSE(accepts(add.value(), ValueArgument::fromToken("ADD"), nullptr, h));
    EXPECT_FALSE(accepts(add.value(), ValueArgument::fromToken("added"), nullptr, h));
    EXPECT_FALSE(accepts(add.value(), ValueArgument::fromValue(Value::string("add")), nullptr, h));
}

TEST(Acceptance, VarargMatchesElementType)
{
    types::TypeHierarchy h;
    auto xs = makePositional("xs", types::arrayOf(types::integer()), false, true);
    ASSERT_TRUE(xs.hasValue());

    EXPECT_TRUE(std::holds_alternative<acceptance::Direct>(
        accepting(xs.value(), ValueArgument::fromValue(Value::integer(1)), nullptr, h)));
    EXPECT_TRUE(std::holds_alternative<acceptance::WithContextualConversion>(accepting(
        xs.value(), ValueArgument::fromToken("2"), ArgumentContext::builtins().get(), h)));
}
