//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file TypeDescriptor.hpp
/// @brief Structural type identity carried by arguments and parameters.
///
/// @details A TypeDescriptor is either a nominal type (identified by name) or
/// an array of another descriptor, and always records nullability. The engine
/// never inspects descriptors beyond equality and the externally supplied
/// subtype relation (see TypeHierarchy.hpp); array descriptors exist so that
/// vararg parameters can declare `Array<T>` and have matching performed against
/// the element type `T`.
///
/// ```cpp
/// TypeDescriptor n = types::integer();              // Int
/// TypeDescriptor s = types::string().asNullable();  // String?
/// TypeDescriptor v = types::arrayOf(types::string()); // Array<String>
/// ```
///
/// @invariant Descriptors are immutable after construction.
/// @invariant An Array descriptor always has an element descriptor.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace arbiter::types
{

/// @brief Immutable structural type identity.
class TypeDescriptor
{
  public:
    /// @brief Structural category of a descriptor.
    enum class Kind
    {
        Nominal, ///< Named type such as `Int` or `UserCommandSender`.
        Array    ///< Array of an element descriptor, used by varargs.
    };

    /// @brief Construct the non-null `Any` descriptor.
    TypeDescriptor();

    /// @brief Create a nominal descriptor.
    /// @param name Nominal type name; compared case-sensitively.
    /// @param nullable Whether the type admits null.
    static TypeDescriptor nominal(std::string name, bool nullable = false);

    /// @brief Create an array-of-@p element descriptor.
    static TypeDescriptor arrayOf(TypeDescriptor element, bool nullable = false);

    Kind kind() const
    {
        return kind_;
    }

    /// @brief Nominal name; `Array` for array descriptors.
    const std::string &name() const
    {
        return name_;
    }

    bool isNullable() const
    {
        return nullable_;
    }

    bool isArray() const
    {
        return kind_ == Kind::Array;
    }

    /// @brief Element descriptor of an array.
    /// @pre isArray() is true.
    const TypeDescriptor &elementType() const
    {
        return *element_;
    }

    /// @brief Copy of this descriptor with nullability set to @p nullable.
    TypeDescriptor asNullable(bool nullable = true) const;

    /// @brief Structural equality over kind, name, nullability and element.
    bool equals(const TypeDescriptor &other) const;

    /// @brief Equality ignoring the top-level nullability flag.
    /// @details Used to compare conversion-registry keys, which identify a
    ///          classifier rather than a full type.
    bool sameClassifier(const TypeDescriptor &other) const;

    /// @brief Render as `Name`, `Name?` or `Array<Elem>`.
    std::string toString() const;

  private:
    TypeDescriptor(Kind kind,
                   std::string name,
                   bool nullable,
                   std::shared_ptr<const TypeDescriptor> element);

    Kind kind_;
    std::string name_;
    bool nullable_;
    std::shared_ptr<const TypeDescriptor> element_;
};

inline bool operator==(const TypeDescriptor &a, const TypeDescriptor &b)
{
    return a.equals(b);
}

inline bool operator!=(const TypeDescriptor &a, const TypeDescriptor &b)
{
    return !a.equals(b);
}

std::ostream &operator<<(std::ostream &os, const TypeDescriptor &type);

//===----------------------------------------------------------------------===//
/// @name Builtin primitive types
/// @brief Canonical names and factories for the primitive descriptors.
/// @{
//===----------------------------------------------------------------------===//

inline constexpr std::string_view kAny = "Any";
inline constexpr std::string_view kBoolean = "Boolean";
inline constexpr std::string_view kByte = "Byte";
inline constexpr std::string_view kShort = "Short";
inline constexpr std::string_view kInt = "Int";
inline constexpr std::string_view kLong = "Long";
inline constexpr std::string_view kFloat = "Float";
inline constexpr std::string_view kDouble = "Double";
inline constexpr std::string_view kString = "String";

TypeDescriptor any();
TypeDescriptor boolean();
TypeDescriptor byte();
TypeDescriptor shortInt();
TypeDescriptor integer();
TypeDescriptor longInt();
TypeDescriptor floating();
TypeDescriptor doubleFloat();
TypeDescriptor string();

/// @brief Shorthand for TypeDescriptor::arrayOf.
TypeDescriptor arrayOf(TypeDescriptor element);

/// @}

} // namespace arbiter::types
