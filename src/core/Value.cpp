//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the validating factories, accessors and deep equality of the
// exporter's value model.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Constructors and comparison for @ref litexport::core::Value.
/// @details Factories reject payloads that disagree with their type so that
///          encoders can trust the kind tag without re-checking.  Deep
///          equality follows the rules the cycle guard depends on: it is
///          structural, short-circuits on shared storage and terminates on
///          cyclic containers.

#include "core/Value.hpp"

#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace litexport::core
{
namespace
{

void requireKind(const TypeRef &t, bool ok, const char *factory)
{
    if (!t)
        throw std::invalid_argument(std::string(factory) + ": missing type");
    if (!ok)
        throw std::invalid_argument(std::string(factory) + ": type " + t->toString() +
                                    " has the wrong kind");
}

/// @brief Check that every element fits the container's element type.
void requireElements(const Type &container, const std::vector<Value> &elems)
{
    if (container.elem->kind == Type::Kind::Interface)
        return;
    for (std::size_t i = 0; i < elems.size(); ++i)
    {
        if (elems[i].kind == Value::Kind::Absent || !identical(elems[i].type, container.elem))
            throw std::invalid_argument("element " + std::to_string(i) + " of " +
                                        container.toString() + " has type " +
                                        typeName(elems[i]));
    }
}

using VisitSet = std::set<std::pair<const void *, const void *>>;

bool equalImpl(const Value &a, const Value &b, VisitSet &seen)
{
    if (a.kind != b.kind)
        return false;
    if (a.kind == Value::Kind::Absent)
        return true;
    if (!identical(a.type, b.type))
        return false;

    switch (a.kind)
    {
        case Value::Kind::Bool:
            return a.b == b.b;
        case Value::Kind::Int:
            return a.i64 == b.i64;
        case Value::Kind::Uint:
            return a.u64 == b.u64;
        case Value::Kind::Float:
            return a.f64 == b.f64;
        case Value::Kind::Text:
            return a.str == b.str;
        case Value::Kind::Sequence:
        case Value::Kind::Array:
        {
            if (!a.elems || !b.elems)
                return !a.elems && !b.elems;
            if (a.elems == b.elems)
                return true;
            if (a.elems->size() != b.elems->size())
                return false;
            // A pair already being compared further up is assumed equal; the
            // outer comparison decides.
            if (!seen.insert({a.elems.get(), b.elems.get()}).second)
                return true;
            for (std::size_t i = 0; i < a.elems->size(); ++i)
            {
                if (!equalImpl((*a.elems)[i], (*b.elems)[i], seen))
                    return false;
            }
            return true;
        }
        case Value::Kind::Opaque:
        case Value::Kind::Absent:
            return true;
    }
    return false;
}

} // namespace

Value Value::absent()
{
    return Value{};
}

Value Value::boolean(bool v, TypeRef t)
{
    requireKind(t, t && t->kind == Type::Kind::Bool, "Value::boolean");
    Value out;
    out.kind = Kind::Bool;
    out.type = std::move(t);
    out.b = v;
    return out;
}

Value Value::signedInt(TypeRef t, long long v)
{
    requireKind(t, t && isSignedKind(t->kind), "Value::signedInt");
    const int bits = bitWidth(t->kind);
    if (bits < 64)
    {
        const long long max = (1LL << (bits - 1)) - 1;
        const long long min = -max - 1;
        if (v < min || v > max)
            throw std::overflow_error(std::to_string(v) + " overflows " + t->toString());
    }
    Value out;
    out.kind = Kind::Int;
    out.type = std::move(t);
    out.i64 = v;
    return out;
}

Value Value::unsignedInt(TypeRef t, unsigned long long v)
{
    requireKind(t, t && isUnsignedKind(t->kind), "Value::unsignedInt");
    const int bits = bitWidth(t->kind);
    if (bits < 64 && v > ((1ULL << bits) - 1))
        throw std::overflow_error(std::to_string(v) + " overflows " + t->toString());
    Value out;
    out.kind = Kind::Uint;
    out.type = std::move(t);
    out.u64 = v;
    return out;
}

Value Value::floating(TypeRef t, double v)
{
    requireKind(t,
                t && (t->kind == Type::Kind::Float32 || t->kind == Type::Kind::Float64),
                "Value::floating");
    if (t->kind == Type::Kind::Float32)
    {
        if (std::isfinite(v) && std::fabs(v) > std::numeric_limits<float>::max())
            throw std::overflow_error(std::to_string(v) + " overflows " + t->toString());
        v = static_cast<double>(static_cast<float>(v));
    }
    Value out;
    out.kind = Kind::Float;
    out.type = std::move(t);
    out.f64 = v;
    return out;
}

Value Value::text(std::string s, TypeRef t)
{
    requireKind(t, t && t->kind == Type::Kind::String, "Value::text");
    Value out;
    out.kind = Kind::Text;
    out.type = std::move(t);
    out.str = std::move(s);
    return out;
}

Value Value::bytes(std::string_view data)
{
    auto byteType = Type::basic(Type::Kind::Uint8);
    std::vector<Value> elems;
    elems.reserve(data.size());
    for (unsigned char c : data)
        elems.push_back(unsignedInt(byteType, c));
    return sequence(Type::slice(byteType), std::move(elems));
}

Value Value::sequence(TypeRef t, std::vector<Value> elems)
{
    requireKind(t, t && t->kind == Type::Kind::Slice, "Value::sequence");
    requireElements(*t, elems);
    Value out;
    out.kind = Kind::Sequence;
    out.type = std::move(t);
    out.elems = std::make_shared<std::vector<Value>>(std::move(elems));
    return out;
}

Value Value::nilSequence(TypeRef t)
{
    requireKind(t, t && t->kind == Type::Kind::Slice, "Value::nilSequence");
    Value out;
    out.kind = Kind::Sequence;
    out.type = std::move(t);
    return out;
}

Value Value::array(TypeRef t, std::vector<Value> elems)
{
    requireKind(t, t && t->kind == Type::Kind::Array, "Value::array");
    if (elems.size() != t->length)
        throw std::invalid_argument("Value::array: " + t->toString() + " needs " +
                                    std::to_string(t->length) + " elements, got " +
                                    std::to_string(elems.size()));
    requireElements(*t, elems);
    Value out;
    out.kind = Kind::Array;
    out.type = std::move(t);
    out.elems = std::make_shared<std::vector<Value>>(std::move(elems));
    return out;
}

Value Value::opaque(TypeRef t)
{
    bool ok = false;
    if (t)
    {
        switch (t->kind)
        {
            case Type::Kind::Pointer:
            case Type::Kind::Struct:
            case Type::Kind::Map:
            case Type::Kind::Func:
            case Type::Kind::Chan:
            case Type::Kind::Uintptr:
            case Type::Kind::Complex64:
            case Type::Kind::Complex128:
                ok = true;
                break;
            default:
                break;
        }
    }
    requireKind(t, ok, "Value::opaque");
    Value out;
    out.kind = Kind::Opaque;
    out.type = std::move(t);
    return out;
}

Value Value::zero(const TypeRef &t)
{
    if (!t)
        throw std::invalid_argument("Value::zero: missing type");

    const Type::Kind k = t->kind;
    if (k == Type::Kind::Bool)
        return boolean(false, t);
    if (isSignedKind(k))
        return signedInt(t, 0);
    if (isUnsignedKind(k))
        return unsignedInt(t, 0);
    switch (k)
    {
        case Type::Kind::Float32:
        case Type::Kind::Float64:
            return floating(t, 0.0);
        case Type::Kind::String:
            return text("", t);
        case Type::Kind::Interface:
            return absent();
        case Type::Kind::Slice:
            return nilSequence(t);
        case Type::Kind::Array:
        {
            std::vector<Value> elems;
            elems.reserve(t->length);
            for (std::size_t i = 0; i < t->length; ++i)
                elems.push_back(zero(t->elem));
            return array(t, std::move(elems));
        }
        default:
            return opaque(t);
    }
}

bool Value::isNil() const
{
    return kind == Kind::Absent || (kind == Kind::Sequence && !elems);
}

std::size_t Value::size() const
{
    return elems ? elems->size() : 0;
}

const Value &Value::at(std::size_t i) const
{
    if (!elems || i >= elems->size())
        throw std::out_of_range("Value::at: index " + std::to_string(i) + " out of range");
    return (*elems)[i];
}

std::vector<Value> &Value::elements()
{
    if (!elems)
        throw std::logic_error("Value::elements: value has no element storage");
    return *elems;
}

bool deepEqual(const Value &a, const Value &b)
{
    VisitSet seen;
    return equalImpl(a, b, seen);
}

std::string typeName(const Value &v)
{
    if (v.kind == Value::Kind::Absent || !v.type)
        return "<nil>";
    return v.type->toString();
}

} // namespace litexport::core
