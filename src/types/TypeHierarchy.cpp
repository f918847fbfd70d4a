//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: types/TypeHierarchy.cpp
// Purpose: Implements the nominal subtype relation.
// Key invariants: See TypeHierarchy.hpp.
// Ownership/Lifetime: Owns the declared edge table.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "types/TypeHierarchy.hpp"

#include <unordered_set>

namespace arbiter::types
{

TypeHierarchy::TypeHierarchy()
{
    supers_.emplace(std::string(kAny), std::vector<std::string>{});
    for (std::string_view builtin :
         {kBoolean, kByte, kShort, kInt, kLong, kFloat, kDouble, kString})
    {
        supers_.emplace(std::string(builtin), std::vector<std::string>{std::string(kAny)});
    }
}

support::Expected<void> TypeHierarchy::declare(std::string name, std::vector<std::string> supertypes)
{
    if (isDeclared(name))
        return support::makeError(name, "type is already declared");
    for (const auto &super : supertypes)
    {
        if (!isDeclared(super))
            return support::makeError(name, "unknown supertype '" + super + "'");
    }
    if (supertypes.empty())
        supertypes.emplace_back(kAny);
    supers_.emplace(std::move(name), std::move(supertypes));
    return {};
}

bool TypeHierarchy::isDeclared(std::string_view name) const
{
    return supers_.find(std::string(name)) != supers_.end();
}

bool TypeHierarchy::isNominalSubtype(std::string_view sub, std::string_view super) const
{
    if (sub == super || super == kAny)
        return true;

    std::vector<std::string> worklist{std::string(sub)};
    std::unordered_set<std::string> seen;
    while (!worklist.empty())
    {
        std::string current = std::move(worklist.back());
        worklist.pop_back();
        if (!seen.insert(current).second)
            continue;
        auto it = supers_.find(current);
        if (it == supers_.end())
            continue;
        for (const auto &parent : it->second)
        {
            if (parent == super)
                return true;
            worklist.push_back(parent);
        }
    }
    return false;
}

bool TypeHierarchy::isSubtypeOrEqual(const TypeDescriptor &sub, const TypeDescriptor &super) const
{
    if (sub.isNullable() && !super.isNullable())
        return false;

    if (super.kind() == TypeDescriptor::Kind::Nominal && super.name() == kAny)
        return true;

    if (sub.isArray() || super.isArray())
    {
        if (!sub.isArray() || !super.isArray())
            return false;
        return isSubtypeOrEqual(sub.elementType(), super.elementType());
    }

    return isNominalSubtype(sub.name(), super.name());
}

} // namespace arbiter::types
