//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: resolve/ResolutionFailure.cpp
// Purpose: Rendering of resolution failures.
// Key invariants: Every Kind has a message; ambiguity lists all candidates.
// Ownership/Lifetime: Stateless.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "resolve/ResolutionFailure.hpp"

namespace arbiter::resolve
{

const char *toString(ResolutionFailure::Kind kind)
{
    switch (kind)
    {
        case ResolutionFailure::Kind::NoMatchingVariant:
            return "NoMatchingVariant";
        case ResolutionFailure::Kind::AmbiguousVariants:
            return "AmbiguousVariants";
        case ResolutionFailure::Kind::ArgumentConversionFailed:
            return "ArgumentConversionFailed";
        case ResolutionFailure::Kind::ReceiverRejected:
            return "ReceiverRejected";
        case ResolutionFailure::Kind::Cancelled:
            return "Cancelled";
    }
    return "";
}

std::string ResolutionFailure::message() const
{
    switch (kind)
    {
        case Kind::NoMatchingVariant:
            return "no matching variant among " + std::to_string(candidatesConsidered) +
                   " candidate(s)";
        case Kind::AmbiguousVariants:
        {
            std::string out = "ambiguous call; " + std::to_string(candidates.size()) +
                              " variants match equally well:";
            for (const auto &candidate : candidates)
                out += " " + candidate->toString();
            return out;
        }
        case Kind::ArgumentConversionFailed:
        {
            std::string out = "cannot convert argument";
            if (rawToken)
                out += " '" + *rawToken + "'";
            if (parameter)
                out += " for parameter " + descriptor::toString(*parameter);
            if (!reason.empty())
                out += ": " + reason;
            return out;
        }
        case Kind::ReceiverRejected:
            return "caller is not accepted by any of " + std::to_string(candidatesConsidered) +
                   " candidate(s)";
        case Kind::Cancelled:
            return "resolution cancelled";
    }
    return std::string();
}

support::Diag ResolutionFailure::toDiagnostic() const
{
    return support::makeError(calleeName, message());
}

void ResolutionFailure::report(support::DiagnosticEngine &engine) const
{
    engine.report(toDiagnostic());
    for (const auto &candidate : candidates)
        engine.report({support::Severity::Note, "candidate: " + candidate->toString(), calleeName});
}

} // namespace arbiter::resolve
