// File: src/descriptor/BuiltinParsers.hpp
// Purpose: Contextual parsers for the primitive types and the context
//          registering them.
// Key invariants: Parsers consume the whole token; partial parses are errors.
// Ownership/Lifetime: Parser instances are shared singletons.
// Links: DESIGN.md
#pragma once

#include "descriptor/ArgumentParser.hpp"
#include "types/TypeDescriptor.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace arbiter::descriptor
{

/// @brief Signed integer parser range-checked for one integral type.
class IntegralParser final : public ArgumentParser
{
  public:
    IntegralParser(types::TypeDescriptor type, std::int64_t min, std::int64_t max);

    support::Expected<types::Value> parse(std::string_view raw,
                                          const ParseContext &ctx) const override;

    std::string describe() const override;

  private:
    types::TypeDescriptor type_;
    std::int64_t min_;
    std::int64_t max_;
};

/// @brief Decimal floating-point parser for Float or Double.
class FloatingParser final : public ArgumentParser
{
  public:
    /// @param singlePrecision Reject finite values outside the float range.
    FloatingParser(types::TypeDescriptor type, bool singlePrecision);

    support::Expected<types::Value> parse(std::string_view raw,
                                          const ParseContext &ctx) const override;

    std::string describe() const override;

  private:
    types::TypeDescriptor type_;
    bool single_;
};

/// @brief Accepts true/yes/on/enabled/1 and false/no/off/disabled/0, any case.
class BooleanParser final : public ArgumentParser
{
  public:
    support::Expected<types::Value> parse(std::string_view raw,
                                          const ParseContext &ctx) const override;

    std::string describe() const override;
};

/// @brief Identity conversion to String.
class StringParser final : public ArgumentParser
{
  public:
    support::Expected<types::Value> parse(std::string_view raw,
                                          const ParseContext &ctx) const override;

    std::string describe() const override;
};

} // namespace arbiter::descriptor
