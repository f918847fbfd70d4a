//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: resolve/CallResolver.hpp
// Purpose: Selects the best signature variant for an unresolved call and
//          converts its arguments.
// Key invariants: Scoring is side-effect free; only the selected variant's
//                 conversions run. A tie at the best score is reported as
//                 AmbiguousVariants, never broken arbitrarily.
// Ownership/Lifetime: Borrows the subtype relation, which must outlive the
//                     resolver. Options are copied.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//
//
// Resolution runs in two phases.
//
// Scoring walks each candidate's value parameters left to right against the
// call arguments. The score of a candidate is the lowest acceptance level of
// any argument it consumed (a single weak conversion drags the whole
// candidate down). Candidates failing the receiver check, missing a required
// argument, leaving arguments unconsumed, or finding an Impossible argument
// are disqualified.
//
// Conversion applies the recorded acceptances of the unique winner: Direct
// arguments pass through, offered type variants are mapped and contextual
// parsers read the raw token. Cancellation is checked before every step.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "call/CommandCall.hpp"
#include "descriptor/Acceptance.hpp"
#include "descriptor/ArgumentContext.hpp"
#include "descriptor/SignatureVariant.hpp"
#include "resolve/ResolutionFailure.hpp"
#include "resolve/ResolvedCommandCall.hpp"
#include "support/cancellation.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "support/trace.hpp"
#include "types/TypeHierarchy.hpp"

#include <cstddef>
#include <vector>

namespace arbiter::resolve
{

/// @brief How one parameter was matched during scoring.
struct ParameterMatch
{
    std::size_t parameterIndex = 0;
    std::vector<std::size_t> argumentIndices;                ///< Consumed arguments, in order
    std::vector<descriptor::ArgumentAcceptance> acceptances; ///< Parallel to argumentIndices
    bool skipped = false;                                    ///< Optional parameter left unbound
};

/// @brief Scoring result of one candidate.
struct VariantMatch
{
    enum class Outcome
    {
        Matched,
        ReceiverRejected,
        ArityMismatch,
        ArgumentRejected
    };

    descriptor::SignatureVariantRef variant;
    Outcome outcome = Outcome::Matched;
    int score = descriptor::kDirectLevel;
    bool receiverBound = false;
    std::vector<ParameterMatch> parameters;

    bool disqualified() const
    {
        return outcome != Outcome::Matched || score <= descriptor::kAmbiguityLevel;
    }
};

/// @brief Stable spelling of @p outcome for traces.
const char *toString(VariantMatch::Outcome outcome);

using ResolveResult = support::Expected<ResolvedCommandCall, ResolutionFailure>;

/// @brief Overload resolver for command calls.
class CallResolver
{
  public:
    explicit CallResolver(const types::SubtypeRelation &relation,
                          support::ResolverOptions options = {});

    /// @brief Score @p variant against @p call without converting anything.
    /// @param context Conversion registry; may be null.
    VariantMatch score(const call::UnresolvedCall &call,
                       const descriptor::SignatureVariantRef &variant,
                       const descriptor::ArgumentContext *context) const;

    /// @brief Resolve @p call against the overload set @p variants.
    /// @param context Conversion registry consulted for contextual parsing.
    /// @param cancel Token of the surrounding invocation, forwarded to parsers.
    ResolveResult resolve(const call::UnresolvedCall &call,
                          const std::vector<descriptor::SignatureVariantRef> &variants,
                          const descriptor::ArgumentContextRef &context,
                          const support::CancellationToken &cancel = {}) const;

    const support::ResolverOptions &options() const
    {
        return options_;
    }

  private:
    ResolveResult convert(const call::UnresolvedCall &call,
                          const VariantMatch &match,
                          std::size_t considered,
                          const support::CancellationToken &cancel) const;

    void traceCandidate(const call::UnresolvedCall &call,
                        std::size_t index,
                        const VariantMatch &match) const;

    const types::SubtypeRelation &relation_;
    support::ResolverOptions options_;
    support::TraceSink trace_;
};

/// @brief One-shot resolution with default options.
ResolveResult resolve(const call::UnresolvedCall &call,
                      const std::vector<descriptor::SignatureVariantRef> &variants,
                      const descriptor::ArgumentContextRef &context,
                      const types::SubtypeRelation &relation,
                      const support::CancellationToken &cancel = {});

} // namespace arbiter::resolve
