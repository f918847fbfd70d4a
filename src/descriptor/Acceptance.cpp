//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/Acceptance.cpp
// Purpose: Levels and rendering of acceptance outcomes.
// Key invariants: The visitors below are exhaustive over ArgumentAcceptance.
// Ownership/Lifetime: Stateless.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "descriptor/Acceptance.hpp"

namespace arbiter::descriptor
{
namespace
{
struct LevelOf
{
    int operator()(const acceptance::Direct &) const
    {
        return kDirectLevel;
    }

    int operator()(const acceptance::WithTypeConversion &) const
    {
        return kTypeConversionLevel;
    }

    int operator()(const acceptance::WithContextualConversion &) const
    {
        return kContextualConversionLevel;
    }

    int operator()(const acceptance::ResolutionAmbiguity &) const
    {
        return kAmbiguityLevel;
    }

    int operator()(const acceptance::Impossible &) const
    {
        return kImpossibleLevel;
    }
};

struct NameOf
{
    std::string operator()(const acceptance::Direct &) const
    {
        return "Direct";
    }

    std::string operator()(const acceptance::WithTypeConversion &) const
    {
        return "WithTypeConversion";
    }

    std::string operator()(const acceptance::WithContextualConversion &c) const
    {
        return "WithContextualConversion(" + (c.parser ? c.parser->describe() : std::string()) +
               ")";
    }

    std::string operator()(const acceptance::ResolutionAmbiguity &) const
    {
        return "ResolutionAmbiguity";
    }

    std::string operator()(const acceptance::Impossible &) const
    {
        return "Impossible";
    }
};
} // namespace

int acceptanceLevel(const ArgumentAcceptance &a)
{
    return std::visit(LevelOf{}, a);
}

std::string toString(const ArgumentAcceptance &a)
{
    return std::visit(NameOf{}, a);
}

} // namespace arbiter::descriptor
