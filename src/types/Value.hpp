//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: types/Value.hpp
// Purpose: Runtime values flowing from arguments into resolved calls.
// Key invariants: Every Value carries the descriptor it was produced as; the
//                 payload alternative is fixed at construction.
// Ownership/Lifetime: Values own scalar, string and array payloads; domain
//                     objects are shared immutably.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "types/TypeDescriptor.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace arbiter::types
{

/// @brief Opaque domain object (contact, group, bot-like entities).
/// @details The engine only needs its type for matching and a display string
///          for diagnostics; lookups producing such objects live outside.
class Object
{
  public:
    virtual ~Object() = default;

    /// @brief Runtime type of the object.
    virtual TypeDescriptor type() const = 0;

    /// @brief Short human-readable rendering.
    virtual std::string display() const = 0;
};

/// @brief Typed runtime value.
class Value
{
  public:
    using Array = std::vector<Value>;
    using ObjectRef = std::shared_ptr<const Object>;
    using Payload =
        std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, ObjectRef>;

    /// @brief Null value of type `Any?`.
    Value();

    static Value null(TypeDescriptor type);
    static Value boolean(bool v);
    /// @brief Integral value; @p type selects Byte, Short, Int or Long.
    static Value integral(std::int64_t v, TypeDescriptor type);
    static Value integer(std::int64_t v);
    /// @brief Floating value; @p type selects Float or Double.
    static Value floating(double v, TypeDescriptor type);
    static Value string(std::string v);
    /// @brief Array value typed with the declared @p arrayType.
    static Value array(TypeDescriptor arrayType, Array elements);
    /// @brief Domain object value typed with @p object's runtime type.
    static Value object(ObjectRef object);

    const TypeDescriptor &type() const
    {
        return type_;
    }

    const Payload &payload() const
    {
        return payload_;
    }

    bool isNull() const
    {
        return std::holds_alternative<std::monostate>(payload_);
    }

    /// @name Typed accessors
    /// @pre The payload holds the requested alternative.
    /// @{
    bool asBool() const;
    std::int64_t asInt() const;
    double asDouble() const;
    const std::string &asString() const;
    const Array &asArray() const;
    const ObjectRef &asObject() const;
    /// @}

    /// @brief Render for traces and CLI output, e.g. `5`, `"bar"`, `[1, 2]`.
    std::string toString() const;

  private:
    Value(TypeDescriptor type, Payload payload);

    TypeDescriptor type_;
    Payload payload_;
};

} // namespace arbiter::types
