//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares resolver settings and their environment overrides.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/trace.hpp"

#include <optional>
#include <string_view>

namespace arbiter::support
{

/// @brief Holds settings that influence call resolution.
/// @invariant Flags are independent.
/// @ownership Value type.
struct ResolverOptions
{
    /// @brief Tracing configuration used by the resolver's trace sink.
    TraceConfig trace{};

    /// @brief Report callers rejected by every receiver check as
    ///        NoMatchingVariant instead of ReceiverRejected.
    bool foldReceiverRejection = false;

    /// @brief Copy of @p base with ARBITER_TRACE and ARBITER_FOLD_RECEIVER applied.
    /// @details Unrecognised values are ignored, preserving the value in @p base.
    static ResolverOptions fromEnvironment(ResolverOptions base);

    /// @brief Default options with the environment overrides applied.
    static ResolverOptions fromEnvironment();
};

/// @brief Parse an on/off switch spelled 1/true/on or 0/false/off.
/// @return Parsed flag, or nullopt for anything else.
std::optional<bool> parseSwitch(std::string_view text);

/// @brief Parse a trace mode spelled off/summary/verbose (or 0/1).
/// @return Parsed mode, or nullopt for anything else.
std::optional<TraceConfig::Mode> parseTraceMode(std::string_view text);

} // namespace arbiter::support
