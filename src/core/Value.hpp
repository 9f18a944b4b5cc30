//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Value struct, the input model of the exporter.  A
// Value is a tagged union over the absent marker, booleans, signed and
// unsigned integers, floating-point numbers, text, variable-length sequences,
// fixed-length arrays and opaque values whose kind has no literal form.
//
// Every value except the absent one carries its runtime type.  The kind tag is
// computed once when the value is built (see core/Adapt.hpp for the C++
// adapter) so encoders only dispatch over tags and never inspect host types.
//
// Containers:
// Sequences and arrays hold their elements in shared storage.  Copying a
// container Value copies the handle, not the elements, which is what allows a
// container to hold itself and therefore what the cycle guard has to catch.
// A sequence without storage is the nil sequence; a sequence with empty
// storage is the empty one.  The two are distinct values.
//
// Homogeneity:
// A container whose element type is concrete only accepts elements of that
// exact type.  A container whose element type is an interface accepts any
// element, including the absent value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Type.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace litexport::core
{

/// @brief Tagged value handed to the exporter.
struct Value
{
    /// @brief Enumerates the payload forms.
    enum class Kind
    {
        Absent,
        Bool,
        Int,
        Uint,
        Float,
        Text,
        Sequence,
        Array,
        Opaque
    };

    /// Discriminant selecting which payload is active.
    Kind kind{Kind::Absent};
    /// Runtime type; null only for Kind::Absent.
    TypeRef type;

    /// Payload for Kind::Bool.
    bool b{false};
    /// Payload for Kind::Int, sign-extended from the kind's width.
    long long i64{0};
    /// Payload for Kind::Uint.
    unsigned long long u64{0};
    /// Payload for Kind::Float; float32 values are stored widened.
    double f64{0.0};
    /// Payload for Kind::Text.
    std::string str;
    /// Element storage for Kind::Sequence and Kind::Array; null for a nil
    /// sequence.
    std::shared_ptr<std::vector<Value>> elems;

    /// @brief The absent ("nil") value.
    static Value absent();

    /// @brief Construct a boolean; @p t may name a bool type.
    static Value boolean(bool v, TypeRef t = Type::basic(Type::Kind::Bool));

    /// @brief Construct a signed integer of kind int..int64.
    /// @throws std::invalid_argument when @p t is not a signed kind.
    /// @throws std::overflow_error when @p v does not fit the kind's width.
    static Value signedInt(TypeRef t, long long v);

    /// @brief Construct an unsigned integer of kind uint..uint64.
    /// @throws std::invalid_argument when @p t is not an unsigned kind.
    /// @throws std::overflow_error when @p v does not fit the kind's width.
    static Value unsignedInt(TypeRef t, unsigned long long v);

    /// @brief Construct a float32 or float64 value.
    /// @details Float32 payloads are rounded to single precision on entry.
    static Value floating(TypeRef t, double v);

    /// @brief Construct a text value; @p t may name a string type.
    static Value text(std::string s, TypeRef t = Type::basic(Type::Kind::String));

    /// @brief Construct a `[]uint8` sequence holding the bytes of @p data.
    static Value bytes(std::string_view data);

    /// @brief Construct a non-nil sequence of type @p t.
    /// @throws std::invalid_argument when @p t is not a slice type or an
    ///         element does not match the element type.
    static Value sequence(TypeRef t, std::vector<Value> elems);

    /// @brief Construct the nil sequence of type @p t.
    static Value nilSequence(TypeRef t);

    /// @brief Construct a fixed-length array of type @p t.
    /// @throws std::invalid_argument when the element count differs from the
    ///         array length or an element does not match the element type.
    static Value array(TypeRef t, std::vector<Value> elems);

    /// @brief Construct a value whose kind has no literal form (pointer,
    ///        struct, map, func, chan, uintptr, complex).
    static Value opaque(TypeRef t);

    /// @brief Zero value of type @p t.
    /// @details The zero interface is the absent value and the zero slice is
    ///          the nil sequence; arrays are filled with zero elements.
    static Value zero(const TypeRef &t);

    /// @brief True for the absent value and for the nil sequence.
    bool isNil() const;

    /// @brief Number of elements of a container; zero otherwise.
    std::size_t size() const;

    /// @brief Element @p i of a container.
    const Value &at(std::size_t i) const;

    /// @brief Mutable element storage of a non-nil container.
    /// @details Mutations are visible through every copy of the container.
    std::vector<Value> &elements();
};

/// @brief Deep structural equality.
/// @details Types must be identical and payloads equal.  Containers sharing
///          storage are equal without visiting their elements, and a pair of
///          containers already under comparison is treated as equal so that
///          cyclic structures terminate.  NaN is never equal to itself.
bool deepEqual(const Value &a, const Value &b);

/// @brief Printed type of @p v, `<nil>` for the absent value.
std::string typeName(const Value &v);

} // namespace litexport::core
