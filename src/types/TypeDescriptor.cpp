//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/types/TypeDescriptor.cpp
// Purpose: Construction, comparison and rendering of type descriptors.
// Key invariants: Array descriptors share their element through an immutable
//                 shared_ptr, so copies stay cheap and never alias mutably.
// Ownership/Lifetime: Value semantics.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "types/TypeDescriptor.hpp"

#include <utility>

namespace arbiter::types
{

TypeDescriptor::TypeDescriptor() : TypeDescriptor(Kind::Nominal, std::string(kAny), false, nullptr)
{
}

TypeDescriptor::TypeDescriptor(Kind kind,
                               std::string name,
                               bool nullable,
                               std::shared_ptr<const TypeDescriptor> element)
    : kind_(kind), name_(std::move(name)), nullable_(nullable), element_(std::move(element))
{
}

TypeDescriptor TypeDescriptor::nominal(std::string name, bool nullable)
{
    return TypeDescriptor(Kind::Nominal, std::move(name), nullable, nullptr);
}

TypeDescriptor TypeDescriptor::arrayOf(TypeDescriptor element, bool nullable)
{
    return TypeDescriptor(
        Kind::Array, "Array", nullable, std::make_shared<const TypeDescriptor>(std::move(element)));
}

TypeDescriptor TypeDescriptor::asNullable(bool nullable) const
{
    TypeDescriptor copy = *this;
    copy.nullable_ = nullable;
    return copy;
}

bool TypeDescriptor::sameClassifier(const TypeDescriptor &other) const
{
    if (kind_ != other.kind_ || name_ != other.name_)
        return false;
    if (kind_ == Kind::Array)
        return element_->equals(*other.element_);
    return true;
}

bool TypeDescriptor::equals(const TypeDescriptor &other) const
{
    return nullable_ == other.nullable_ && sameClassifier(other);
}

std::string TypeDescriptor::toString() const
{
    std::string out;
    if (kind_ == Kind::Array)
        out = "Array<" + element_->toString() + ">";
    else
        out = name_;
    if (nullable_)
        out += '?';
    return out;
}

std::ostream &operator<<(std::ostream &os, const TypeDescriptor &type)
{
    return os << type.toString();
}

TypeDescriptor any()
{
    return TypeDescriptor::nominal(std::string(kAny));
}

TypeDescriptor boolean()
{
    return TypeDescriptor::nominal(std::string(kBoolean));
}

TypeDescriptor byte()
{
    return TypeDescriptor::nominal(std::string(kByte));
}

TypeDescriptor shortInt()
{
    return TypeDescriptor::nominal(std::string(kShort));
}

TypeDescriptor integer()
{
    return TypeDescriptor::nominal(std::string(kInt));
}

TypeDescriptor longInt()
{
    return TypeDescriptor::nominal(std::string(kLong));
}

TypeDescriptor floating()
{
    return TypeDescriptor::nominal(std::string(kFloat));
}

TypeDescriptor doubleFloat()
{
    return TypeDescriptor::nominal(std::string(kDouble));
}

TypeDescriptor string()
{
    return TypeDescriptor::nominal(std::string(kString));
}

TypeDescriptor arrayOf(TypeDescriptor element)
{
    return TypeDescriptor::arrayOf(std::move(element));
}

} // namespace arbiter::types
