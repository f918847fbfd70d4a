//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: types/TypeHierarchy.hpp
// Purpose: Declares the subtype relation the resolver depends on and a
//          table-driven nominal hierarchy implementing it.
// Key invariants: The relation is reflexive and transitive; Any is the top of
//                 every nominal type; supertypes must be declared before use,
//                 which rules out cycles.
// Ownership/Lifetime: A hierarchy is populated at startup and then shared as
//                     an immutable object across concurrent resolutions.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "types/TypeDescriptor.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace arbiter::types
{

/// @brief Host-supplied subtype-or-equal relation.
/// @details The single primitive every compatibility check in the engine is
///          expressed in terms of.  Implementations must be a partial order.
class SubtypeRelation
{
  public:
    virtual ~SubtypeRelation() = default;

    /// @brief True when @p sub is a subtype of, or equal to, @p super.
    virtual bool isSubtypeOrEqual(const TypeDescriptor &sub,
                                  const TypeDescriptor &super) const = 0;
};

/// @brief Nominal type hierarchy with nullability and covariant arrays.
///
/// Rules applied by isSubtypeOrEqual():
/// - `T <: U?` iff the non-null form of T is a subtype of U;
/// - `T? <: U` never holds for a non-null U;
/// - `Array<A> <: Array<B>` iff `A <: B`; every array is a subtype of Any;
/// - nominal names follow the declared edges, closed reflexively and
///   transitively; names never declared only relate to themselves and Any.
class TypeHierarchy final : public SubtypeRelation
{
  public:
    /// @brief Hierarchy containing Any and the builtin primitive names.
    TypeHierarchy();

    /// @brief Declare nominal type @p name with direct @p supertypes.
    /// @return Error when @p name is already declared or a supertype is unknown.
    support::Expected<void> declare(std::string name, std::vector<std::string> supertypes = {});

    /// @brief True when @p name has been declared (Any and builtins included).
    bool isDeclared(std::string_view name) const;

    /// @brief Reflexive-transitive closure over declared nominal edges.
    bool isNominalSubtype(std::string_view sub, std::string_view super) const;

    bool isSubtypeOrEqual(const TypeDescriptor &sub, const TypeDescriptor &super) const override;

  private:
    std::unordered_map<std::string, std::vector<std::string>> supers_;
};

} // namespace arbiter::types
