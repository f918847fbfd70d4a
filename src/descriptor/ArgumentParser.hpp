// File: src/descriptor/ArgumentParser.hpp
// Purpose: Contract for contextual parsers turning raw tokens into typed values.
// Key invariants: Parsers are stateless from the engine's point of view and
//                 safe to share across concurrent resolutions.
// Ownership/Lifetime: Parsers are shared immutably through ArgumentParserRef.
// Links: DESIGN.md
#pragma once

#include "call/CommandCall.hpp"
#include "support/cancellation.hpp"
#include "support/diag_expected.hpp"
#include "types/Value.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace arbiter::descriptor
{

/// @brief Context handed to a parser for one conversion.
struct ParseContext
{
    const call::Caller &caller;              ///< Caller of the invocation being resolved
    const support::CancellationToken &cancel; ///< Cancellation of the surrounding invocation
};

/// @brief Converts a raw token into a value of one target type.
class ArgumentParser
{
  public:
    virtual ~ArgumentParser() = default;

    /// @brief Parse @p raw; failures are returned, never thrown.
    virtual support::Expected<types::Value> parse(std::string_view raw,
                                                  const ParseContext &ctx) const = 0;

    /// @brief Short label used in traces, e.g. "Int".
    virtual std::string describe() const = 0;
};

using ArgumentParserRef = std::shared_ptr<const ArgumentParser>;

/// @brief Adapter exposing a callable as an ArgumentParser.
class FunctionParser final : public ArgumentParser
{
  public:
    using Fn = std::function<support::Expected<types::Value>(std::string_view, const ParseContext &)>;

    FunctionParser(std::string label, Fn fn) : label_(std::move(label)), fn_(std::move(fn)) {}

    support::Expected<types::Value> parse(std::string_view raw,
                                          const ParseContext &ctx) const override
    {
        return fn_(raw, ctx);
    }

    std::string describe() const override
    {
        return label_;
    }

  private:
    std::string label_;
    Fn fn_;
};

} // namespace arbiter::descriptor
