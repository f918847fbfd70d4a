//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/ArgumentContext.cpp
// Purpose: Lookup, layering and building of conversion registries.
// Key invariants: Every operation here is a pure function of its inputs.
// Ownership/Lifetime: Layered views share their operands.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "descriptor/ArgumentContext.hpp"

#include <utility>

namespace arbiter::descriptor
{
namespace
{
/// @brief View consulting @p overrides before @p base.
class LayeredArgumentContext final : public ArgumentContext
{
  public:
    LayeredArgumentContext(ArgumentContextRef base, ArgumentContextRef overrides)
        : base_(std::move(base)), overrides_(std::move(overrides))
    {
    }

    ArgumentParserRef lookup(const types::TypeDescriptor &type,
                             const types::SubtypeRelation &relation) const override
    {
        if (auto parser = overrides_->lookup(type, relation))
            return parser;
        return base_->lookup(type, relation);
    }

    std::vector<ParserPair> toList() const override
    {
        std::vector<ParserPair> out = overrides_->toList();
        std::vector<ParserPair> rest = base_->toList();
        out.insert(out.end(), rest.begin(), rest.end());
        return out;
    }

  private:
    ArgumentContextRef base_;
    ArgumentContextRef overrides_;
};

std::vector<ParserPair> normalized(std::vector<ParserPair> entries)
{
    for (auto &entry : entries)
        entry.type = entry.type.asNullable(false);
    return entries;
}

/// @brief Partial override list layered over @p base.
/// @details The first entry whose key is a supertype-or-equal of the
///          requested type wins, regardless of later exact keys.
class ListOverlayContext final : public ArgumentContext
{
  public:
    ListOverlayContext(ArgumentContextRef base, std::vector<ParserPair> entries)
        : base_(std::move(base)), entries_(normalized(std::move(entries)))
    {
    }

    ArgumentParserRef lookup(const types::TypeDescriptor &type,
                             const types::SubtypeRelation &relation) const override
    {
        const types::TypeDescriptor target = type.asNullable(false);
        for (const auto &entry : entries_)
        {
            if (relation.isSubtypeOrEqual(target, entry.type))
                return entry.parser;
        }
        return base_->lookup(type, relation);
    }

    std::vector<ParserPair> toList() const override
    {
        std::vector<ParserPair> out = entries_;
        std::vector<ParserPair> rest = base_->toList();
        out.insert(out.end(), rest.begin(), rest.end());
        return out;
    }

  private:
    ArgumentContextRef base_;
    std::vector<ParserPair> entries_;
};
} // namespace

const ArgumentContextRef &ArgumentContext::empty()
{
    static const ArgumentContextRef instance =
        std::make_shared<const SimpleArgumentContext>(std::vector<ParserPair>{});
    return instance;
}

SimpleArgumentContext::SimpleArgumentContext(std::vector<ParserPair> entries)
    : entries_(normalized(std::move(entries)))
{
}

ArgumentParserRef SimpleArgumentContext::lookup(const types::TypeDescriptor &type,
                                                const types::SubtypeRelation &relation) const
{
    const types::TypeDescriptor target = type.asNullable(false);
    for (const auto &entry : entries_)
    {
        if (entry.type.sameClassifier(target))
            return entry.parser;
    }
    for (const auto &entry : entries_)
    {
        if (relation.isSubtypeOrEqual(target, entry.type))
            return entry.parser;
    }
    return nullptr;
}

ArgumentContextRef plus(const ArgumentContextRef &base, const ArgumentContextRef &overrides)
{
    if (overrides == ArgumentContext::empty())
        return base;
    if (base == ArgumentContext::empty())
        return overrides;
    return std::make_shared<const LayeredArgumentContext>(base, overrides);
}

ArgumentContextRef plus(const ArgumentContextRef &base, std::vector<ParserPair> overrides)
{
    if (overrides.empty())
        return base;
    return std::make_shared<const ListOverlayContext>(base, std::move(overrides));
}

ArgumentContextBuilder &ArgumentContextBuilder::with(types::TypeDescriptor type,
                                                     ArgumentParserRef parser)
{
    entries_.push_back(ParserPair{std::move(type), std::move(parser)});
    return *this;
}

ArgumentContextBuilder &ArgumentContextBuilder::with(types::TypeDescriptor type,
                                                     std::string label,
                                                     FunctionParser::Fn fn)
{
    return with(std::move(type),
                std::make_shared<const FunctionParser>(std::move(label), std::move(fn)));
}

/// @brief Keep the last registration per key, most recent first.
ArgumentContextRef ArgumentContextBuilder::build() const
{
    std::vector<ParserPair> distinct;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
    {
        bool shadowed = false;
        for (const auto &kept : distinct)
        {
            if (kept.type.sameClassifier(it->type))
            {
                shadowed = true;
                break;
            }
        }
        if (!shadowed)
            distinct.push_back(*it);
    }
    return std::make_shared<const SimpleArgumentContext>(std::move(distinct));
}

} // namespace arbiter::descriptor
