//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.cpp
// Purpose: Parse resolver switches and apply environment overrides.
// Key invariants: Unrecognised spellings never change an option.
// Ownership/Lifetime: Pure functions over value types.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "support/options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace arbiter::support
{
namespace
{
std::string lowered(std::string_view text)
{
    std::string v{text};
    std::transform(v.begin(),
                   v.end(),
                   v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}
} // namespace

std::optional<bool> parseSwitch(std::string_view text)
{
    const std::string v = lowered(text);
    if (v == "1" || v == "true" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<TraceConfig::Mode> parseTraceMode(std::string_view text)
{
    const std::string v = lowered(text);
    if (v == "off" || v == "0" || v == "false")
        return TraceConfig::Off;
    if (v == "summary" || v == "1" || v == "on" || v == "true")
        return TraceConfig::Summary;
    if (v == "verbose" || v == "2")
        return TraceConfig::Verbose;
    return std::nullopt;
}

/// @brief Apply environment overrides on top of @p base.
///
/// @details Mirrors the runtime override handling of the interpreter tools:
///          each variable is read once per call, an empty or unrecognised
///          value leaves the corresponding field untouched.
ResolverOptions ResolverOptions::fromEnvironment(ResolverOptions base)
{
    if (const char *envTrace = std::getenv("ARBITER_TRACE"))
    {
        if (auto mode = parseTraceMode(envTrace))
            base.trace.mode = *mode;
    }
    if (const char *envFold = std::getenv("ARBITER_FOLD_RECEIVER"))
    {
        if (auto fold = parseSwitch(envFold))
            base.foldReceiverRejection = *fold;
    }
    return base;
}

ResolverOptions ResolverOptions::fromEnvironment()
{
    return fromEnvironment(ResolverOptions{});
}

} // namespace arbiter::support
