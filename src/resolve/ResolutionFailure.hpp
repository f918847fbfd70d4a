//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: resolve/ResolutionFailure.hpp
// Purpose: Structured description of why a call could not be resolved.
// Key invariants: Scoring never produces a failure by itself; conversion
//                 failures are only raised for the selected variant.
// Ownership/Lifetime: Value type; tied candidates are shared references.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "descriptor/Parameter.hpp"
#include "descriptor/SignatureVariant.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace arbiter::resolve
{

/// @brief Why resolution failed.
struct ResolutionFailure
{
    /// @brief Failure taxonomy.
    enum class Kind
    {
        NoMatchingVariant,        ///< Every candidate was disqualified
        AmbiguousVariants,        ///< Several candidates tied at the top score
        ArgumentConversionFailed, ///< The selected conversion raised an error
        ReceiverRejected,         ///< The caller failed every receiver check
        Cancelled                 ///< The invocation was cancelled while converting
    };

    Kind kind;
    std::string calleeName;
    std::size_t candidatesConsidered = 0;

    /// @brief Tied candidates for AmbiguousVariants.
    std::vector<descriptor::SignatureVariantRef> candidates;

    /// @brief Offending parameter for ArgumentConversionFailed.
    std::optional<descriptor::ValueParameter> parameter;

    /// @brief Raw token of the offending argument, when it had one.
    std::optional<std::string> rawToken;

    /// @brief Message of the underlying conversion error, if any.
    std::string reason;

    /// @brief One-line human readable description.
    std::string message() const;

    /// @brief Error diagnostic whose subject is the callee name.
    support::Diag toDiagnostic() const;

    /// @brief Report the error followed by one note per tied candidate.
    void report(support::DiagnosticEngine &engine) const;
};

/// @brief Stable spelling of @p kind, e.g. "NoMatchingVariant".
const char *toString(ResolutionFailure::Kind kind);

} // namespace arbiter::resolve
