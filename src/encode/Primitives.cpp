//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the leaf encoders.  Each predicate accepts only values of an
// unnamed built-in type: a named type dressed as `int` or `string` is a
// user-defined type and is reported as unsupported by the chain.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Leaf encoders for scalar values.

#include "encode/Primitives.hpp"

#include "io/FormatUtils.hpp"
#include "io/StringEscape.hpp"

namespace litexport::encode
{

using core::Type;
using core::Value;

namespace
{

bool isUnnamed(const Value &v)
{
    return v.type && !v.type->isNamed();
}

/// @brief Whether @p v is a sequence of unnamed `uint8`, i.e. `[]byte`.
bool isByteSlice(const Value &v)
{
    return v.kind == Value::Kind::Sequence && isUnnamed(v) &&
           v.type->elem->kind == Type::Kind::Uint8 && !v.type->elem->isNamed();
}

std::string collectBytes(const Value &v)
{
    std::string out;
    out.reserve(v.size());
    for (std::size_t i = 0; i < v.size(); ++i)
        out.push_back(static_cast<char>(v.at(i).u64));
    return out;
}

} // namespace

std::string_view BoolEncoder::name() const
{
    return "bool";
}

bool BoolEncoder::supports(const Value &v) const
{
    return v.kind == Value::Kind::Bool && isUnnamed(v);
}

support::Expected<std::string> BoolEncoder::render(const Value &v)
{
    return std::string(v.b ? "true" : "false");
}

std::string_view AbsentEncoder::name() const
{
    return "nil";
}

bool AbsentEncoder::supports(const Value &v) const
{
    return v.kind == Value::Kind::Absent;
}

support::Expected<std::string> AbsentEncoder::render(const Value &)
{
    return std::string("nil");
}

NumberEncoder::NumberEncoder(bool explicitType) : explicitType_(explicitType) {}

std::string_view NumberEncoder::name() const
{
    return "number";
}

bool NumberEncoder::supports(const Value &v) const
{
    switch (v.kind)
    {
        case Value::Kind::Int:
        case Value::Kind::Uint:
        case Value::Kind::Float:
            return isUnnamed(v) && core::isNumericKind(v.type->kind);
        default:
            return false;
    }
}

/// @brief Print the digits, then optionally wrap them as `kind(digits)`.
/// @details Floats use the shortest plain decimal that reads back to the same
///          value at the value's own width, so `float32(3.14)` does not grow
///          the trailing digits of its double widening.
support::Expected<std::string> NumberEncoder::render(const Value &v)
{
    std::string digits;
    switch (v.kind)
    {
        case Value::Kind::Int:
            digits = io::formatSigned(v.i64);
            break;
        case Value::Kind::Uint:
            digits = io::formatUnsigned(v.u64);
            break;
        default:
            digits = io::formatFloat(v.f64, core::bitWidth(v.type->kind));
            break;
    }

    if (!explicitType_)
        return digits;
    return std::string(core::kindName(v.type->kind)) + "(" + digits + ")";
}

std::string_view TextEncoder::name() const
{
    return "text";
}

bool TextEncoder::supports(const Value &v) const
{
    return v.kind == Value::Kind::Text && isUnnamed(v);
}

support::Expected<std::string> TextEncoder::render(const Value &v)
{
    return io::quoteAscii(v.str);
}

std::string_view BytesEncoder::name() const
{
    return "bytes";
}

bool BytesEncoder::supports(const Value &v) const
{
    return isByteSlice(v) && io::isValidUtf8(collectBytes(v));
}

support::Expected<std::string> BytesEncoder::render(const Value &v)
{
    return "[]byte(" + io::quoteAscii(collectBytes(v)) + ")";
}

} // namespace litexport::encode
