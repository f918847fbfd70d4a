//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/Acceptance.hpp
// Purpose: Outcome of matching one argument against one parameter.
// Key invariants: Higher levels are better; an acceptance is acceptable iff
//                 its level is strictly positive.
// Ownership/Lifetime: Value types; parsers are shared.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "descriptor/ArgumentParser.hpp"

#include <climits>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace arbiter::descriptor
{

/// @brief Acceptance kinds.
namespace acceptance
{
/// @brief Native type already conforms; no conversion.
struct Direct
{
};

/// @brief One of the argument's offered variants conforms.
struct WithTypeConversion
{
    std::size_t variantIndex; ///< Index into ValueArgument::typeVariants()
};

/// @brief The context holds a parser for the expected type.
struct WithContextualConversion
{
    ArgumentParserRef parser;
};

/// @brief Several conversions apply equally well.
/// @note Reserved; the matcher picks the first applicable offered variant
///       and never produces this kind.
struct ResolutionAmbiguity
{
    std::vector<std::size_t> candidates; ///< Indexes of competing offered variants
};

/// @brief No path from the argument to the parameter type.
struct Impossible
{
};
} // namespace acceptance

/// @brief Sealed set of acceptance outcomes.
using ArgumentAcceptance = std::variant<acceptance::Direct,
                                        acceptance::WithTypeConversion,
                                        acceptance::WithContextualConversion,
                                        acceptance::ResolutionAmbiguity,
                                        acceptance::Impossible>;

inline constexpr int kDirectLevel = INT_MAX;
inline constexpr int kTypeConversionLevel = 20;
inline constexpr int kContextualConversionLevel = 10;
inline constexpr int kAmbiguityLevel = 0;
inline constexpr int kImpossibleLevel = -1;

/// @brief Integer rank of @p a.
int acceptanceLevel(const ArgumentAcceptance &a);

/// @brief True when the level of @p a is positive.
inline bool isAcceptable(const ArgumentAcceptance &a)
{
    return acceptanceLevel(a) > 0;
}

inline bool isNotAcceptable(const ArgumentAcceptance &a)
{
    return !isAcceptable(a);
}

/// @brief Short name of the acceptance kind, e.g. "Direct".
std::string toString(const ArgumentAcceptance &a);

} // namespace arbiter::descriptor
