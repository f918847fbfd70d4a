//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ArgumentContext.hpp
/// @brief Conversion registry mapping target types to contextual parsers.
///
/// @details An ArgumentContext answers "which parser can produce a value of
/// type T from a raw token?".  Contexts are immutable; layering one over
/// another never mutates either side and instead yields a new view:
///
/// ```cpp
/// ArgumentContextRef ctx = plus(ArgumentContext::builtins(), myOverrides);
/// ArgumentParserRef p = ctx->lookup(types::integer(), hierarchy);
/// ```
///
/// Lookup rules:
/// - keys compare by classifier, so `Int` and `Int?` share one entry;
/// - an entry whose key equals the requested type wins outright;
/// - otherwise the first entry, in priority order, whose key is a supertype
///   of the requested type is used;
/// - in a layered context the overriding layer is consulted first and the
///   base only when the override has no compatible key.
///
/// @invariant Contexts never change after construction.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "descriptor/ArgumentParser.hpp"
#include "types/TypeDescriptor.hpp"
#include "types/TypeHierarchy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace arbiter::descriptor
{

/// @brief One registry entry.
struct ParserPair
{
    types::TypeDescriptor type; ///< Key; stored without top-level nullability
    ArgumentParserRef parser;   ///< Parser producing values of @ref type
};

class ArgumentContext;

/// @brief Shared pointer to an immutable context.
using ArgumentContextRef = std::shared_ptr<const ArgumentContext>;

/// @brief Conversion registry interface.
class ArgumentContext
{
  public:
    virtual ~ArgumentContext() = default;

    /// @brief Most specific parser able to produce @p type, or null.
    virtual ArgumentParserRef lookup(const types::TypeDescriptor &type,
                                     const types::SubtypeRelation &relation) const = 0;

    /// @brief Entries in priority order, overriding layers first.
    virtual std::vector<ParserPair> toList() const = 0;

    /// @brief The shared empty context.
    static const ArgumentContextRef &empty();

    /// @brief Context holding the builtin primitive parsers.
    /// @see BuiltinParsers.hpp
    static const ArgumentContextRef &builtins();
};

/// @brief Context backed by a list of entries in priority order.
class SimpleArgumentContext final : public ArgumentContext
{
  public:
    explicit SimpleArgumentContext(std::vector<ParserPair> entries);

    ArgumentParserRef lookup(const types::TypeDescriptor &type,
                             const types::SubtypeRelation &relation) const override;

    std::vector<ParserPair> toList() const override
    {
        return entries_;
    }

  private:
    std::vector<ParserPair> entries_;
};

/// @brief Layer @p overrides over @p base.
/// @details Returns the other operand unchanged when either side is the
///          shared empty context.
ArgumentContextRef plus(const ArgumentContextRef &base, const ArgumentContextRef &overrides);

/// @brief Layer a partial list of entries over @p base.
/// @details The list is consulted in the order given: the first entry whose
///          key is a supertype-or-equal of the requested type wins, even
///          when a later entry has the exact key. Falls back to @p base.
ArgumentContextRef plus(const ArgumentContextRef &base, std::vector<ParserPair> overrides);

/// @brief Alias of plus(base, overrides).
inline ArgumentContextRef merge(const ArgumentContextRef &base, const ArgumentContextRef &overrides)
{
    return plus(base, overrides);
}

/// @brief Incrementally assembles a SimpleArgumentContext.
/// @details Later registrations for the same key replace earlier ones and the
///          built context orders entries most recently added first.
class ArgumentContextBuilder
{
  public:
    /// @brief Register @p parser for @p type.
    ArgumentContextBuilder &with(types::TypeDescriptor type, ArgumentParserRef parser);

    /// @brief Register a callable parser for @p type.
    ArgumentContextBuilder &with(types::TypeDescriptor type, std::string label, FunctionParser::Fn fn);

    /// @brief Number of registrations so far, duplicates included.
    std::size_t size() const
    {
        return entries_.size();
    }

    ArgumentContextRef build() const;

  private:
    std::vector<ParserPair> entries_;
};

} // namespace arbiter::descriptor
