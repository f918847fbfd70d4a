//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: resolve/CallResolver.cpp
// Purpose: Scoring, selection and argument conversion for command calls.
// Key invariants: See CallResolver.hpp.
// Ownership/Lifetime: Stateless apart from borrowed relation and options.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "resolve/CallResolver.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace arbiter::resolve
{

namespace
{

using descriptor::ArgumentAcceptance;
using support::TraceConfig;

std::string scoreLabel(int score)
{
    if (score == descriptor::kDirectLevel)
        return "direct";
    return std::to_string(score);
}

/// @brief Name of @p param, falling back to its rendering and then @p callee.
std::string parameterLabel(const descriptor::ValueParameter &param, const std::string &callee)
{
    if (const auto &name = descriptor::parameterName(param))
        return *name;
    const std::string rendered = descriptor::toString(param);
    return rendered.empty() ? callee : rendered;
}

ResolutionFailure makeFailure(ResolutionFailure::Kind kind,
                              const call::UnresolvedCall &call,
                              std::size_t considered)
{
    ResolutionFailure failure{kind, call.calleeName};
    failure.candidatesConsidered = considered;
    return failure;
}

/// @brief Turns one recorded acceptance into the argument's final value.
struct Converter
{
    const call::ValueArgument &argument;
    const descriptor::ParseContext &ctx;
    const std::string &subject; ///< Parameter being converted

    support::Expected<types::Value> operator()(const descriptor::acceptance::Direct &) const
    {
        return argument.passThrough();
    }

    support::Expected<types::Value> operator()(
        const descriptor::acceptance::WithTypeConversion &a) const
    {
        const auto &variants = argument.typeVariants();
        if (a.variantIndex >= variants.size() || !variants[a.variantIndex].map)
            return support::makeError(subject, "offered conversion is unavailable");
        return variants[a.variantIndex].map(argument);
    }

    support::Expected<types::Value> operator()(
        const descriptor::acceptance::WithContextualConversion &a) const
    {
        const auto &raw = argument.rawToken();
        if (!a.parser || !raw)
            return support::makeError(subject, "argument has no text to parse");
        return a.parser->parse(*raw, ctx);
    }

    support::Expected<types::Value> operator()(
        const descriptor::acceptance::ResolutionAmbiguity &) const
    {
        return support::makeError(subject, "conversion is ambiguous");
    }

    support::Expected<types::Value> operator()(const descriptor::acceptance::Impossible &) const
    {
        return support::makeError(subject, "no conversion available");
    }
};

} // namespace

const char *toString(VariantMatch::Outcome outcome)
{
    switch (outcome)
    {
        case VariantMatch::Outcome::Matched:
            return "matched";
        case VariantMatch::Outcome::ReceiverRejected:
            return "receiver rejected";
        case VariantMatch::Outcome::ArityMismatch:
            return "arity mismatch";
        case VariantMatch::Outcome::ArgumentRejected:
            return "argument rejected";
    }
    return "";
}

CallResolver::CallResolver(const types::SubtypeRelation &relation,
                           support::ResolverOptions options)
    : relation_(relation), options_(std::move(options)), trace_(options_.trace)
{
}

VariantMatch CallResolver::score(const call::UnresolvedCall &call,
                                 const descriptor::SignatureVariantRef &variant,
                                 const descriptor::ArgumentContext *context) const
{
    VariantMatch match;
    match.variant = variant;

    auto disqualify = [&match](VariantMatch::Outcome why) {
        match.outcome = why;
        match.score = descriptor::kImpossibleLevel;
        return match;
    };

    if (const auto &receiver = variant->receiverParameter())
    {
        if (relation_.isSubtypeOrEqual(call.caller.type, receiver->type))
            match.receiverBound = true;
        else if (!receiver->isOptional)
            return disqualify(VariantMatch::Outcome::ReceiverRejected);
    }

    const auto &params = variant->valueParameters();
    const auto &args = call.arguments;
    std::size_t next = 0;

    for (std::size_t i = 0; i < params.size(); ++i)
    {
        const auto &param = params[i];
        ParameterMatch pm;
        pm.parameterIndex = i;

        auto consume = [&](std::size_t argIndex) {
            ArgumentAcceptance acc =
                descriptor::accepting(param, args[argIndex], context, relation_);
            pm.argumentIndices.push_back(argIndex);
            pm.acceptances.push_back(acc);
            match.score = std::min(match.score, descriptor::acceptanceLevel(acc));
            return descriptor::isAcceptable(acc);
        };

        bool rejected = false;
        if (descriptor::isVararg(param))
        {
            while (next < args.size())
                rejected = !consume(next++) || rejected;
        }
        else if (next < args.size())
        {
            rejected = !consume(next++);
        }
        else if (descriptor::isOptional(param))
        {
            pm.skipped = true;
        }
        else
        {
            match.parameters.push_back(std::move(pm));
            return disqualify(VariantMatch::Outcome::ArityMismatch);
        }

        match.parameters.push_back(std::move(pm));
        if (rejected)
            return disqualify(VariantMatch::Outcome::ArgumentRejected);
    }

    if (next < args.size())
        return disqualify(VariantMatch::Outcome::ArityMismatch);
    return match;
}

void CallResolver::traceCandidate(const call::UnresolvedCall &call,
                                  std::size_t index,
                                  const VariantMatch &match) const
{
    std::ostringstream os;
    os << call.calleeName << ": candidate #" << index << ' ' << match.variant->toString()
       << " -> " << toString(match.outcome);
    if (!match.disqualified())
        os << ", score " << scoreLabel(match.score);
    trace_.emit(TraceConfig::Verbose, os.str());

    const auto &params = match.variant->valueParameters();
    for (const auto &pm : match.parameters)
    {
        for (std::size_t k = 0; k < pm.argumentIndices.size(); ++k)
        {
            std::ostringstream line;
            line << call.calleeName << ":   '" << call.arguments[pm.argumentIndices[k]].toString()
                 << "' -> " << descriptor::toString(params[pm.parameterIndex]) << " via "
                 << descriptor::toString(pm.acceptances[k]);
            trace_.emit(TraceConfig::Verbose, line.str());
        }
        if (pm.skipped)
            trace_.emit(TraceConfig::Verbose,
                        call.calleeName + ":   " +
                            descriptor::toString(params[pm.parameterIndex]) + " skipped");
    }
}

ResolveResult CallResolver::resolve(const call::UnresolvedCall &call,
                                    const std::vector<descriptor::SignatureVariantRef> &variants,
                                    const descriptor::ArgumentContextRef &context,
                                    const support::CancellationToken &cancel) const
{
    const std::size_t considered = variants.size();
    auto fail = [&](ResolutionFailure failure) -> ResolveResult {
        trace_.emit(TraceConfig::Summary, call.calleeName + ": failed: " + failure.message());
        return failure;
    };

    if (cancel.isCancellationRequested())
        return fail(makeFailure(ResolutionFailure::Kind::Cancelled, call, considered));

    std::vector<VariantMatch> matches;
    matches.reserve(variants.size());
    for (const auto &variant : variants)
    {
        matches.push_back(score(call, variant, context.get()));
        if (trace_.wants(TraceConfig::Verbose))
            traceCandidate(call, matches.size() - 1, matches.back());
    }

    int best = descriptor::kImpossibleLevel;
    std::vector<const VariantMatch *> top;
    for (const auto &m : matches)
    {
        if (m.disqualified())
            continue;
        if (m.score > best)
        {
            best = m.score;
            top.clear();
        }
        if (m.score == best)
            top.push_back(&m);
    }

    if (top.empty())
    {
        bool allReceiverRejected =
            !matches.empty() && std::all_of(matches.begin(), matches.end(), [](const auto &m) {
                return m.outcome == VariantMatch::Outcome::ReceiverRejected;
            });
        auto kind = allReceiverRejected && !options_.foldReceiverRejection
                        ? ResolutionFailure::Kind::ReceiverRejected
                        : ResolutionFailure::Kind::NoMatchingVariant;
        return fail(makeFailure(kind, call, considered));
    }

    if (top.size() > 1)
    {
        auto failure = makeFailure(ResolutionFailure::Kind::AmbiguousVariants, call, considered);
        for (const auto *m : top)
            failure.candidates.push_back(m->variant);
        return fail(std::move(failure));
    }

    auto result = convert(call, *top.front(), considered, cancel);
    if (!result)
        return fail(result.error());

    trace_.emit(TraceConfig::Summary,
                call.calleeName + ": resolved to " + top.front()->variant->toString() +
                    " (score " + scoreLabel(best) + ")");
    return result;
}

ResolveResult CallResolver::convert(const call::UnresolvedCall &call,
                                    const VariantMatch &match,
                                    std::size_t considered,
                                    const support::CancellationToken &cancel) const
{
    const auto &params = match.variant->valueParameters();
    const descriptor::ParseContext ctx{call.caller, cancel};

    ResolvedCommandCall resolved;
    resolved.calleeName = call.calleeName;
    resolved.caller = call.caller;
    resolved.variant = match.variant;
    if (match.receiverBound)
        resolved.receiver = call.caller;
    resolved.arguments.reserve(params.size());

    auto convertOne = [&](const descriptor::ValueParameter &param,
                          std::size_t argIndex,
                          const ArgumentAcceptance &acc) -> support::Expected<types::Value, ResolutionFailure> {
        if (cancel.isCancellationRequested())
            return makeFailure(ResolutionFailure::Kind::Cancelled, call, considered);

        const auto &argument = call.arguments[argIndex];
        const std::string subject = parameterLabel(param, call.calleeName);
        auto value = std::visit(Converter{argument, ctx, subject}, acc);
        if (value)
            return std::move(value.value());

        if (cancel.isCancellationRequested())
            return makeFailure(ResolutionFailure::Kind::Cancelled, call, considered);

        const auto &error = value.error();
        trace_.emit(TraceConfig::Verbose,
                    call.calleeName + ":   conversion failed: " +
                        (error.subject.empty() ? error.message
                                               : error.subject + ": " + error.message));

        auto failure =
            makeFailure(ResolutionFailure::Kind::ArgumentConversionFailed, call, considered);
        failure.parameter = param;
        failure.rawToken = argument.rawToken();
        failure.reason = error.message;
        return failure;
    };

    for (const auto &pm : match.parameters)
    {
        const auto &param = params[pm.parameterIndex];
        if (pm.skipped)
        {
            resolved.arguments.push_back(
                types::Value::null(descriptor::parameterType(param).asNullable()));
            continue;
        }

        if (descriptor::isVararg(param))
        {
            types::Value::Array elements;
            elements.reserve(pm.argumentIndices.size());
            for (std::size_t k = 0; k < pm.argumentIndices.size(); ++k)
            {
                auto element = convertOne(param, pm.argumentIndices[k], pm.acceptances[k]);
                if (!element)
                    return element.error();
                elements.push_back(std::move(element.value()));
            }
            resolved.arguments.push_back(
                types::Value::array(descriptor::parameterType(param), std::move(elements)));
            continue;
        }

        auto value = convertOne(param, pm.argumentIndices.front(), pm.acceptances.front());
        if (!value)
            return value.error();
        resolved.arguments.push_back(std::move(value.value()));
    }

    return resolved;
}

ResolveResult resolve(const call::UnresolvedCall &call,
                      const std::vector<descriptor::SignatureVariantRef> &variants,
                      const descriptor::ArgumentContextRef &context,
                      const types::SubtypeRelation &relation,
                      const support::CancellationToken &cancel)
{
    return CallResolver(relation).resolve(call, variants, context, cancel);
}

} // namespace arbiter::resolve
