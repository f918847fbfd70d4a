// File: tests/unit/test_call_resolver.cpp
// Purpose: Drive overload resolution end to end over small command sets.
// Key invariants: The weakest argument decides a variant's score; ties are
//                 reported; only the selected variant's conversions run.
// Ownership/Lifetime: Fixtures own hierarchies, contexts and variants.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "call/CommandCall.hpp"
#include "descriptor/ArgumentContext.hpp"
#include "descriptor/Parameter.hpp"
#include "descriptor/SignatureVariant.hpp"
#include "resolve/CallResolver.hpp"
#include "resolve/ResolvedCommandCall.hpp"
#include "support/cancellation.hpp"
#include "support/diagnostics.hpp"
#include "types/TypeHierarchy.hpp"

#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace arbiter;
using descriptor::ArgumentContext;
using descriptor::PositionalParameter;
using descriptor::ReceiverParameter;
using descriptor::SignatureVariant;
using descriptor::SignatureVariantRef;
using descriptor::ValueParameter;
using resolve::ResolutionFailure;
using resolve::VariantMatch;
using types::TypeDescriptor;
using types::Value;

namespace
{

void noop(const resolve::ResolvedCommandCall &) {}

ValueParameter constant(const std::string &literal)
{
    auto p = descriptor::makeStringConstant(std::nullopt, literal);
    EXPECT_TRUE(p.hasValue());
    return p.value();
}

ValueParameter vararg(const std::string &name, TypeDescriptor element)
{
    auto p = descriptor::makePositional(name, types::arrayOf(std::move(element)), false, true);
    EXPECT_TRUE(p.hasValue());
    return p.value();
}

SignatureVariantRef variant(std::vector<ValueParameter> params,
                            std::optional<ReceiverParameter> receiver = std::nullopt)
{
    return descriptor::makeVariant(
        std::move(receiver), std::move(params), SignatureVariant::immediate(noop));
}

call::ValueArgument token(const std::string &raw)
{
    return call::ValueArgument::fromToken(raw);
}

class CallResolverTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ASSERT_TRUE(hierarchy.declare("CommandSender").hasValue());
        ASSERT_TRUE(hierarchy.declare("ConsoleCommandSender", {"CommandSender"}).hasValue());
        ASSERT_TRUE(hierarchy.declare("UserCommandSender", {"CommandSender"}).hasValue());
        ASSERT_TRUE(hierarchy.declare("MemberCommandSender", {"UserCommandSender"}).hasValue());
    }

    call::UnresolvedCall makeCall(std::string callee,
                                  std::vector<call::ValueArgument> args,
                                  const std::string &senderType = "ConsoleCommandSender")
    {
        return call::UnresolvedCall{call::Caller{"tester", TypeDescriptor::nominal(senderType)},
                                    std::move(callee),
                                    std::move(args)};
    }

    resolve::ResolveResult run(const call::UnresolvedCall &request,
                               const std::vector<SignatureVariantRef> &variants,
                               const descriptor::ArgumentContextRef &context =
                                   ArgumentContext::builtins())
    {
        return resolve::resolve(request, variants, context, hierarchy);
    }

    types::TypeHierarchy hierarchy;
};

/// The classic `foo` command: `foo <add> n: Int` and `foo target: String`.
struct FooCommand
{
    SignatureVariantRef add =
        variant({constant("add"), PositionalParameter::createRequired("n", types::integer())});
    SignatureVariantRef target =
        variant({PositionalParameter::createRequired("target", types::string())});

    std::vector<SignatureVariantRef> all() const
    {
        return {add, target};
    }
};

} // namespace

TEST_F(CallResolverTest, FooAddFiveSelectsConstantVariant)
{
    FooCommand foo;
    auto result = run(makeCall("foo", {token("add"), token("5")}), foo.all());
    ASSERT_TRUE(result.hasValue()) << result.error().message();

    const auto &resolved = result.value();
    EXPECT_EQ(resolved.variant, foo.add);
    EXPECT_EQ(resolved.calleeName, "foo");
    ASSERT_EQ(resolved.arguments.size(), 2u);
    EXPECT_EQ(resolved.arguments[0].asString(), "add");
    EXPECT_EQ(resolved.arguments[1].asInt(), 5);
    EXPECT_EQ(resolved.arguments[1].type(), types::integer());
    EXPECT_FALSE(resolved.receiver.has_value());
}

TEST_F(CallResolverTest, FooBarSelectsStringVariant)
{
    FooCommand foo;
    auto result = run(makeCall("foo", {token("bar")}), foo.all());
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_EQ(result.value().variant, foo.target);
    ASSERT_EQ(result.value().arguments.size(), 1u);
    EXPECT_EQ(result.value().arguments[0].asString(), "bar");
}

TEST_F(CallResolverTest, FooAddNotANumberFailsConversion)
{
    FooCommand foo;
    auto result = run(makeCall("foo", {token("add"), token("notanumber")}), foo.all());
    ASSERT_FALSE(result.hasValue());

    const auto &failure = result.error();
    EXPECT_EQ(failure.kind, ResolutionFailure::Kind::ArgumentConversionFailed);
    EXPECT_EQ(failure.calleeName, "foo");
    EXPECT_EQ(failure.candidatesConsidered, 2u);
    ASSERT_TRUE(failure.rawToken.has_value());
    EXPECT_EQ(*failure.rawToken, "notanumber");
    ASSERT_TRUE(failure.parameter.has_value());
    EXPECT_EQ(descriptor::toString(*failure.parameter), "n: Int");
    EXPECT_EQ(failure.reason, "cannot parse 'notanumber' as Int");
}

TEST_F(CallResolverTest, NoArgumentsMatchesNothing)
{
    FooCommand foo;
    auto result = run(makeCall("foo", {}), foo.all());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ResolutionFailure::Kind::NoMatchingVariant);
    EXPECT_EQ(result.error().message(), "no matching variant among 2 candidate(s)");
}

TEST_F(CallResolverTest, LeftoverArgumentsDisqualify)
{
    FooCommand foo;
    auto result = run(makeCall("foo", {token("bar"), token("baz")}), foo.all());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ResolutionFailure::Kind::NoMatchingVariant);
}

TEST_F(CallResolverTest, EmptyOverloadSetIsNoMatch)
{
    auto result = run(makeCall("nothing", {}), {});
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ResolutionFailure::Kind::NoMatchingVariant);
    EXPECT_EQ(result.error().candidatesConsidered, 0u);
}

TEST_F(CallResolverTest, EqualScoresAreAmbiguous)
{
    auto first = variant({PositionalParameter::createRequired("a", types::string())});
    auto second = variant({PositionalParameter::createRequired("b", types::string())});
    auto result = run(makeCall("twin", {token("x")}), {first, second});

    ASSERT_FALSE(result.hasValue());
    const auto &failure = result.error();
    EXPECT_EQ(failure.kind, ResolutionFailure::Kind::AmbiguousVariants);
    ASSERT_EQ(failure.candidates.size(), 2u);
    EXPECT_EQ(failure.candidates[0], first);
    EXPECT_EQ(failure.candidates[1], second);

    support::DiagnosticEngine diags;
    failure.report(diags);
    EXPECT_EQ(diags.errorCount(), 1u);
    ASSERT_EQ(diags.diagnostics().size(), 3u);
    EXPECT_EQ(diags.diagnostics()[1].severity, support::Severity::Note);
}

TEST_F(CallResolverTest, DirectBeatsContextualConversion)
{
    auto text = variant({PositionalParameter::createRequired("s", types::string())});
    auto number = variant({PositionalParameter::createRequired("n", types::integer())});
    auto result = run(makeCall("pick", {token("5")}), {number, text});

    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_EQ(result.value().variant, text);
}

TEST_F(CallResolverTest, VarargScoreIsWeakestElement)
{
    VariantMatch match;
    resolve::CallResolver resolver(hierarchy);
    auto sum = variant({vararg("xs", types::integer())});

    auto allTyped = makeCall("sum", {call::ValueArgument::fromValue(Value::integer(1)),
                                     call::ValueArgument::fromValue(Value::integer(2))});
    match = resolver.score(allTyped, sum, ArgumentContext::builtins().get());
    EXPECT_EQ(match.outcome, VariantMatch::Outcome::Matched);
    EXPECT_EQ(match.score, descriptor::kDirectLevel);

    auto mixed = makeCall("sum", {call::ValueArgument::fromValue(Value::integer(1)), token("2")});
    match = resolver.score(mixed, sum, ArgumentContext::builtins().get());
    EXPECT_EQ(match.outcome, VariantMatch::Outcome::Matched);
    EXPECT_EQ(match.score, descriptor::kContextualConversionLevel);

    auto bad = makeCall("sum", {token("1"), call::ValueArgument::fromValue(Value::boolean(true))});
    match = resolver.score(bad, sum, ArgumentContext::builtins().get());
    EXPECT_EQ(match.outcome, VariantMatch::Outcome::ArgumentRejected);
    EXPECT_TRUE(match.disqualified());
}

TEST_F(CallResolverTest, VarargCollectsIntoArray)
{
    auto sum = variant({vararg("xs", types::integer())});

    auto none = run(makeCall("sum", {}), {sum});
    ASSERT_TRUE(none.hasValue());
    ASSERT_EQ(none.value().arguments.size(), 1u);
    EXPECT_TRUE(none.value().arguments[0].asArray().empty());
    EXPECT_EQ(none.value().arguments[0].type(), types::arrayOf(types::integer()));

    auto three = run(makeCall("sum", {token("1"), token("2"), token("3")}), {sum});
    ASSERT_TRUE(three.hasValue()) << three.error().message();
    const auto &xs = three.value().arguments[0].asArray();
    ASSERT_EQ(xs.size(), 3u);
    EXPECT_EQ(xs[2].asInt(), 3);
}

TEST_F(CallResolverTest, VarargElementFailureNamesOffendingToken)
{
    auto sum = variant({vararg("xs", types::integer())});
    auto result = run(makeCall("sum", {token("1"), token("two")}), {sum});
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ResolutionFailure::Kind::ArgumentConversionFailed);
    EXPECT_EQ(result.error().rawToken, std::optional<std::string>("two"));
}

TEST_F(CallResolverTest, MissingOptionalBecomesTypedNull)
{
    auto greet = variant({PositionalParameter::createOptional("name", types::string())});

    auto without = run(makeCall("greet", {}), {greet});
    ASSERT_TRUE(without.hasValue());
    ASSERT_EQ(without.value().arguments.size(), 1u);
    EXPECT_TRUE(without.value().arguments[0].isNull());
    EXPECT_EQ(without.value().arguments[0].type(), types::string().asNullable());

    auto with = run(makeCall("greet", {token("ada")}), {greet});
    ASSERT_TRUE(with.hasValue());
    EXPECT_EQ(with.value().arguments[0].asString(), "ada");
}

TEST_F(CallResolverTest, StringConstantOnlyMatchesExactLiteral)
{
    auto reload = variant({constant("reload")});
    EXPECT_TRUE(run(makeCall("cfg", {token("reload")}), {reload}).hasValue());

    auto wrong = run(makeCall("cfg", {token("Reload")}), {reload});
    ASSERT_FALSE(wrong.hasValue());
    EXPECT_EQ(wrong.error().kind, ResolutionFailure::Kind::NoMatchingVariant);
}

TEST_F(CallResolverTest, ReceiverAcceptsSubtypes)
{
    auto say = variant({vararg("words", types::string())},
                       ReceiverParameter{TypeDescriptor::nominal("UserCommandSender")});

    auto result = run(makeCall("say", {token("hi")}, "MemberCommandSender"), {say});
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    ASSERT_TRUE(result.value().receiver.has_value());
    EXPECT_EQ(result.value().receiver->type, TypeDescriptor::nominal("MemberCommandSender"));
}

TEST_F(CallResolverTest, ReceiverRejectionIsReportedOrFolded)
{
    auto say = variant({vararg("words", types::string())},
                       ReceiverParameter{TypeDescriptor::nominal("UserCommandSender")});
    auto request = makeCall("say", {token("hi")}, "ConsoleCommandSender");

    auto strict = run(request, {say});
    ASSERT_FALSE(strict.hasValue());
    EXPECT_EQ(strict.error().kind, ResolutionFailure::Kind::ReceiverRejected);

    support::ResolverOptions options;
    options.foldReceiverRejection = true;
    resolve::CallResolver folding(hierarchy, options);
    auto folded = folding.resolve(request, {say}, ArgumentContext::builtins());
    ASSERT_FALSE(folded.hasValue());
    EXPECT_EQ(folded.error().kind, ResolutionFailure::Kind::NoMatchingVariant);
}

TEST_F(CallResolverTest, MixedRejectionIsNoMatch)
{
    auto say = variant({vararg("words", types::string())},
                       ReceiverParameter{TypeDescriptor::nominal("UserCommandSender")});
    auto keyword = variant({constant("status")});

    auto result = run(makeCall("mixed", {token("word")}), {say, keyword});
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ResolutionFailure::Kind::NoMatchingVariant);
}

TEST_F(CallResolverTest, OptionalReceiverToleratesOtherCallers)
{
    auto status = variant({}, ReceiverParameter{TypeDescriptor::nominal("UserCommandSender"), true});

    auto asConsole = run(makeCall("status", {}), {status});
    ASSERT_TRUE(asConsole.hasValue());
    EXPECT_FALSE(asConsole.value().receiver.has_value());

    auto asUser = run(makeCall("status", {}, "UserCommandSender"), {status});
    ASSERT_TRUE(asUser.hasValue());
    EXPECT_TRUE(asUser.value().receiver.has_value());
}

TEST_F(CallResolverTest, OverlayParserTakesPrecedence)
{
    auto number = variant({PositionalParameter::createRequired("n", types::integer())});
    auto overlay = descriptor::plus(
        ArgumentContext::builtins(),
        descriptor::ArgumentContextBuilder()
            .with(types::integer(),
                  "answer",
                  [](std::string_view, const descriptor::ParseContext &) -> support::Expected<Value> {
                      return Value::integer(42);
                  })
            .build());

    auto result = run(makeCall("n", {token("7")}), {number}, overlay);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().arguments[0].asInt(), 42);

    auto base = run(makeCall("n", {token("7")}), {number});
    ASSERT_TRUE(base.hasValue());
    EXPECT_EQ(base.value().arguments[0].asInt(), 7);
}

TEST_F(CallResolverTest, OfferedVariantIsAppliedOnlyForWinner)
{
    std::atomic<int> mapped{0};
    call::TypeVariant asInt{"asInt", types::integer(), [&mapped](const call::ValueArgument &)
                                                           -> support::Expected<Value> {
                                ++mapped;
                                return Value::integer(99);
                            }};
    auto number = variant({PositionalParameter::createRequired("n", types::integer())});

    auto request = makeCall("n", {call::ValueArgument::fromToken("ninety-nine", {asInt})});
    auto result = run(request, {number});
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_EQ(result.value().arguments[0].asInt(), 99);
    EXPECT_EQ(mapped.load(), 1);
}

TEST_F(CallResolverTest, MissingOfferedMappingNamesParameter)
{
    std::ostringstream trace;
    support::ResolverOptions options;
    options.trace.mode = support::TraceConfig::Verbose;
    options.trace.stream = &trace;

    call::TypeVariant unmapped{"asInt", types::integer(), nullptr};
    auto number = variant({PositionalParameter::createRequired("n", types::integer())});

    resolve::CallResolver resolver(hierarchy, options);
    auto result = resolver.resolve(
        makeCall("num", {call::ValueArgument::fromToken("seven", {unmapped})}), {number},
        ArgumentContext::builtins());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ResolutionFailure::Kind::ArgumentConversionFailed);
    EXPECT_EQ(result.error().reason, "offered conversion is unavailable");
    EXPECT_NE(trace.str().find(
                  "[arbiter] num:   conversion failed: n: offered conversion is unavailable"),
              std::string::npos);
}

TEST_F(CallResolverTest, ParsersReceiveCallerAndToken)
{
    std::string seenCaller;
    bool sawCancellable = false;
    auto context = descriptor::ArgumentContextBuilder()
                       .with(types::integer(),
                             "probe",
                             [&](std::string_view, const descriptor::ParseContext &ctx)
                                 -> support::Expected<Value> {
                                 seenCaller = ctx.caller.name;
                                 sawCancellable = ctx.cancel.canBeCancelled();
                                 return Value::integer(1);
                             })
                       .build();
    auto number = variant({PositionalParameter::createRequired("n", types::integer())});

    support::CancellationSource source;
    resolve::CallResolver resolver(hierarchy);
    auto result = resolver.resolve(makeCall("n", {token("1")}), {number}, context, source.token());
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(seenCaller, "tester");
    EXPECT_TRUE(sawCancellable);
}

TEST_F(CallResolverTest, CancelledTokenStopsConversion)
{
    support::CancellationSource source;
    auto context = descriptor::ArgumentContextBuilder()
                       .with(types::integer(),
                             "cancelling",
                             [&source](std::string_view, const descriptor::ParseContext &)
                                 -> support::Expected<Value> {
                                 source.cancel();
                                 return support::makeError("Int", "interrupted");
                             })
                       .build();
    auto pair = variant({PositionalParameter::createRequired("a", types::integer()),
                         PositionalParameter::createRequired("b", types::integer())});

    resolve::CallResolver resolver(hierarchy);
    auto result =
        resolver.resolve(makeCall("pair", {token("1"), token("2")}), {pair}, context, source.token());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, ResolutionFailure::Kind::Cancelled);

    auto again = resolver.resolve(
        makeCall("pair", {token("1"), token("2")}), {pair}, context, source.token());
    ASSERT_FALSE(again.hasValue());
    EXPECT_EQ(again.error().kind, ResolutionFailure::Kind::Cancelled);
}

TEST_F(CallResolverTest, VerboseTraceRecordsCandidates)
{
    std::ostringstream trace;
    support::ResolverOptions options;
    options.trace.mode = support::TraceConfig::Verbose;
    options.trace.stream = &trace;

    FooCommand foo;
    resolve::CallResolver resolver(hierarchy, options);
    auto result = resolver.resolve(makeCall("foo", {token("add"), token("5")}), foo.all(),
                                   ArgumentContext::builtins());
    ASSERT_TRUE(result.hasValue());

    const std::string text = trace.str();
    EXPECT_NE(text.find("[arbiter] foo: candidate #0 CommandSignatureVariant(<add>, n: Int) -> "
                        "matched, score 10"),
              std::string::npos);
    EXPECT_NE(text.find("candidate #1 CommandSignatureVariant(target: String) -> arity mismatch"),
              std::string::npos);
    EXPECT_NE(text.find("'5' -> n: Int via WithContextualConversion(Int)"), std::string::npos);
    EXPECT_NE(
        text.find("[arbiter] foo: resolved to CommandSignatureVariant(<add>, n: Int) (score 10)"),
        std::string::npos);
}

TEST_F(CallResolverTest, SummaryTraceOmitsCandidates)
{
    std::ostringstream trace;
    support::ResolverOptions options;
    options.trace.mode = support::TraceConfig::Summary;
    options.trace.stream = &trace;

    FooCommand foo;
    resolve::CallResolver resolver(hierarchy, options);
    auto result = resolver.resolve(makeCall("foo", {}), foo.all(), ArgumentContext::builtins());
    ASSERT_FALSE(result.hasValue());

    EXPECT_EQ(trace.str(), "[arbiter] foo: failed: no matching variant among 2 candidate(s)\n");
}
