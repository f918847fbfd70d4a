//===----------------------------------------------------------------------===//
//
// Part of the Arbiter project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: types/Value.cpp
// Purpose: Value factories, accessors and rendering.
// Key invariants: See Value.hpp.
// Ownership/Lifetime: Value semantics.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "types/Value.hpp"

#include <sstream>
#include <utility>

namespace arbiter::types
{

Value::Value() : Value(any().asNullable(), std::monostate{}) {}

Value::Value(TypeDescriptor type, Payload payload)
    : type_(std::move(type)), payload_(std::move(payload))
{
}

Value Value::null(TypeDescriptor type)
{
    return Value(type.asNullable(), std::monostate{});
}

Value Value::boolean(bool v)
{
    return Value(types::boolean(), v);
}

Value Value::integral(std::int64_t v, TypeDescriptor type)
{
    return Value(std::move(type), v);
}

Value Value::integer(std::int64_t v)
{
    return Value(types::integer(), v);
}

Value Value::floating(double v, TypeDescriptor type)
{
    return Value(std::move(type), v);
}

Value Value::string(std::string v)
{
    return Value(types::string(), std::move(v));
}

Value Value::array(TypeDescriptor arrayType, Array elements)
{
    return Value(std::move(arrayType), std::move(elements));
}

Value Value::object(ObjectRef object)
{
    TypeDescriptor type = object->type();
    return Value(std::move(type), std::move(object));
}

bool Value::asBool() const
{
    return std::get<bool>(payload_);
}

std::int64_t Value::asInt() const
{
    return std::get<std::int64_t>(payload_);
}

double Value::asDouble() const
{
    return std::get<double>(payload_);
}

const std::string &Value::asString() const
{
    return std::get<std::string>(payload_);
}

const Value::Array &Value::asArray() const
{
    return std::get<Array>(payload_);
}

const Value::ObjectRef &Value::asObject() const
{
    return std::get<ObjectRef>(payload_);
}

namespace
{
struct Renderer
{
    std::ostringstream &os;

    void operator()(std::monostate) const
    {
        os << "null";
    }

    void operator()(bool v) const
    {
        os << (v ? "true" : "false");
    }

    void operator()(std::int64_t v) const
    {
        os << v;
    }

    void operator()(double v) const
    {
        os << v;
    }

    void operator()(const std::string &v) const
    {
        os << '"' << v << '"';
    }

    void operator()(const Value::Array &elements) const
    {
        os << '[';
        for (std::size_t i = 0; i < elements.size(); ++i)
        {
            if (i)
                os << ", ";
            os << elements[i].toString();
        }
        os << ']';
    }

    void operator()(const Value::ObjectRef &object) const
    {
        os << (object ? object->display() : std::string("null"));
    }
};
} // namespace

std::string Value::toString() const
{
    std::ostringstream os;
    std::visit(Renderer{os}, payload_);
    return os.str();
}

} // namespace arbiter::types
