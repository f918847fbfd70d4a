//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/BuiltinParsers.cpp
// Purpose: Primitive contextual parsers and the builtin context.
// Key invariants: Every failure names the token and the target type.
// Ownership/Lifetime: The builtin context is created once and shared.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "descriptor/BuiltinParsers.hpp"

#include "descriptor/ArgumentContext.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <memory>

namespace arbiter::descriptor
{
namespace
{
support::Diag cannotParse(std::string_view raw, const std::string &target)
{
    return support::makeError(target, "cannot parse '" + std::string(raw) + "' as " + target);
}

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

IntegralParser::IntegralParser(types::TypeDescriptor type, std::int64_t min, std::int64_t max)
    : type_(std::move(type)), min_(min), max_(max)
{
}

support::Expected<types::Value> IntegralParser::parse(std::string_view raw,
                                                      const ParseContext &) const
{
    // from_chars rejects a leading '+'.
    std::string_view digits = raw;
    if (!digits.empty() && digits.front() == '+')
    {
        digits.remove_prefix(1);
        if (!digits.empty() && digits.front() == '-')
            return cannotParse(raw, type_.toString());
    }

    std::int64_t v = 0;
    const char *end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, v);
    if (digits.empty() || ec != std::errc() || ptr != end)
        return cannotParse(raw, type_.toString());
    if (v < min_ || v > max_)
    {
        return support::makeError(type_.toString(),
                                  "value " + std::string(raw) + " is out of range for " +
                                      type_.toString());
    }
    return types::Value::integral(v, type_);
}

std::string IntegralParser::describe() const
{
    return type_.toString();
}

FloatingParser::FloatingParser(types::TypeDescriptor type, bool singlePrecision)
    : type_(std::move(type)), single_(singlePrecision)
{
}

support::Expected<types::Value> FloatingParser::parse(std::string_view raw,
                                                      const ParseContext &) const
{
    std::string_view digits = raw;
    if (!digits.empty() && digits.front() == '+')
    {
        digits.remove_prefix(1);
        if (!digits.empty() && digits.front() == '-')
            return cannotParse(raw, type_.toString());
    }

    double v = 0.0;
    const char *end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, v);
    if (digits.empty() || ec != std::errc() || ptr != end)
        return cannotParse(raw, type_.toString());
    if (single_ && std::isfinite(v) && std::fabs(v) > std::numeric_limits<float>::max())
    {
        return support::makeError(type_.toString(),
                                  "value " + std::string(raw) + " is out of range for " +
                                      type_.toString());
    }
    return types::Value::floating(v, type_);
}

std::string FloatingParser::describe() const
{
    return type_.toString();
}

support::Expected<types::Value> BooleanParser::parse(std::string_view raw,
                                                     const ParseContext &) const
{
    const std::string v = lowered(raw);
    if (v == "true" || v == "yes" || v == "on" || v == "enabled" || v == "1")
        return types::Value::boolean(true);
    if (v == "false" || v == "no" || v == "off" || v == "disabled" || v == "0")
        return types::Value::boolean(false);
    return cannotParse(raw, types::boolean().toString());
}

std::string BooleanParser::describe() const
{
    return std::string(types::kBoolean);
}

support::Expected<types::Value> StringParser::parse(std::string_view raw,
                                                    const ParseContext &) const
{
    return types::Value::string(std::string(raw));
}

std::string StringParser::describe() const
{
    return std::string(types::kString);
}

/// @brief Context registering one parser per primitive type.
/// @details Integer widths follow the usual two's-complement ranges; Long
///          spans the full 64-bit range.
const ArgumentContextRef &ArgumentContext::builtins()
{
    static const ArgumentContextRef instance = []
    {
        using Limits8 = std::numeric_limits<std::int8_t>;
        using Limits16 = std::numeric_limits<std::int16_t>;
        using Limits32 = std::numeric_limits<std::int32_t>;
        using Limits64 = std::numeric_limits<std::int64_t>;

        ArgumentContextBuilder builder;
        builder
            .with(types::integer(),
                  std::make_shared<const IntegralParser>(types::integer(), Limits32::min(), Limits32::max()))
            .with(types::byte(),
                  std::make_shared<const IntegralParser>(types::byte(), Limits8::min(), Limits8::max()))
            .with(types::shortInt(),
                  std::make_shared<const IntegralParser>(
                      types::shortInt(), Limits16::min(), Limits16::max()))
            .with(types::boolean(), std::make_shared<const BooleanParser>())
            .with(types::string(), std::make_shared<const StringParser>())
            .with(types::longInt(),
                  std::make_shared<const IntegralParser>(
                      types::longInt(), Limits64::min(), Limits64::max()))
            .with(types::doubleFloat(),
                  std::make_shared<const FloatingParser>(types::doubleFloat(), false))
            .with(types::floating(), std::make_shared<const FloatingParser>(types::floating(), true));
        return builder.build();
    }();
    return instance;
}

} // namespace arbiter::descriptor
