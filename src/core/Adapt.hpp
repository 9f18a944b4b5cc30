//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/Adapt.hpp
// Purpose: Convert C++ values into the exporter's Value model.  This is the
//          only place where host types are inspected; everything downstream
//          dispatches over the kind tag computed here.
// Key invariants: TypeOf<T> and toValue(T) agree on the type they report; an
//                 empty std::vector becomes an empty (non-nil) sequence and a
//                 disengaged std::optional<std::vector<T>> the nil sequence.
// Ownership/Lifetime: Produced values own copies of the converted data.
// Links: DESIGN.md#core
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Value.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace litexport::core
{

/// @brief Static type of C++ type @p T.  Left undefined for types the
///        exporter cannot represent so that misuse fails to compile.
template <class T> struct TypeOf;

#define LITEXPORT_BASIC_TYPE_OF(CXX, KIND)                                                         \
    template <> struct TypeOf<CXX>                                                                 \
    {                                                                                              \
        static TypeRef get()                                                                       \
        {                                                                                          \
            return Type::basic(Type::Kind::KIND);                                                  \
        }                                                                                          \
    };

LITEXPORT_BASIC_TYPE_OF(bool, Bool)
LITEXPORT_BASIC_TYPE_OF(signed char, Int8)
LITEXPORT_BASIC_TYPE_OF(short, Int16)
LITEXPORT_BASIC_TYPE_OF(int, Int)
LITEXPORT_BASIC_TYPE_OF(long, Int64)
LITEXPORT_BASIC_TYPE_OF(long long, Int64)
LITEXPORT_BASIC_TYPE_OF(unsigned char, Uint8)
LITEXPORT_BASIC_TYPE_OF(unsigned short, Uint16)
LITEXPORT_BASIC_TYPE_OF(unsigned int, Uint)
LITEXPORT_BASIC_TYPE_OF(unsigned long, Uint64)
LITEXPORT_BASIC_TYPE_OF(unsigned long long, Uint64)
LITEXPORT_BASIC_TYPE_OF(float, Float32)
LITEXPORT_BASIC_TYPE_OF(double, Float64)
LITEXPORT_BASIC_TYPE_OF(std::string, String)
LITEXPORT_BASIC_TYPE_OF(std::string_view, String)
LITEXPORT_BASIC_TYPE_OF(const char *, String)

#undef LITEXPORT_BASIC_TYPE_OF

/// A Value used as an element type is the unconstrained placeholder.
template <> struct TypeOf<Value>
{
    static TypeRef get()
    {
        return Type::interfaceOf();
    }
};

template <class T> struct TypeOf<std::vector<T>>
{
    static TypeRef get()
    {
        return Type::slice(TypeOf<T>::get());
    }
};

template <class T> struct TypeOf<std::optional<std::vector<T>>>
{
    static TypeRef get()
    {
        return Type::slice(TypeOf<T>::get());
    }
};

template <class T, std::size_t N> struct TypeOf<std::array<T, N>>
{
    static TypeRef get()
    {
        return Type::array(N, TypeOf<T>::get());
    }
};

inline Value toValue(const Value &v)
{
    return v;
}

inline Value toValue(std::nullptr_t)
{
    return Value::absent();
}

/// Exactly bool; pointers, char and enums convert to bool implicitly and must
/// not be accepted here.
template <class T, std::enable_if_t<std::is_same_v<T, bool>, int> = 0> Value toValue(T v)
{
    return Value::boolean(v);
}

inline Value toValue(std::string s)
{
    return Value::text(std::move(s));
}

inline Value toValue(std::string_view s)
{
    return Value::text(std::string(s));
}

/// @throws std::invalid_argument for a null pointer.
inline Value toValue(const char *s)
{
    if (!s)
        throw std::invalid_argument("toValue: null C string");
    return Value::text(s);
}

/// @brief Convert an arithmetic value using the kind TypeOf<T> assigns.
template <class T,
          std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool> &&
                               !std::is_same_v<T, char>,
                           int> = 0>
Value toValue(T v)
{
    TypeRef t = TypeOf<T>::get();
    if constexpr (std::is_floating_point_v<T>)
        return Value::floating(std::move(t), static_cast<double>(v));
    else if constexpr (std::is_signed_v<T>)
        return Value::signedInt(std::move(t), static_cast<long long>(v));
    else
        return Value::unsignedInt(std::move(t), static_cast<unsigned long long>(v));
}

template <class T> Value toValue(const std::vector<T> &v);
template <class T> Value toValue(const std::optional<std::vector<T>> &v);
template <class T, std::size_t N> Value toValue(const std::array<T, N> &v);

namespace detail
{

/// @brief Convert every element of a range.
template <class Range> std::vector<Value> convertAll(const Range &range)
{
    std::vector<Value> out;
    out.reserve(range.size());
    for (const auto &item : range)
        out.push_back(toValue(item));
    return out;
}

/// std::vector<bool> hands out proxies; convert through bool explicitly.
inline std::vector<Value> convertAll(const std::vector<bool> &range)
{
    std::vector<Value> out;
    out.reserve(range.size());
    for (bool item : range)
        out.push_back(Value::boolean(item));
    return out;
}

} // namespace detail

template <class T> Value toValue(const std::vector<T> &v)
{
    return Value::sequence(TypeOf<std::vector<T>>::get(), detail::convertAll(v));
}

template <class T> Value toValue(const std::optional<std::vector<T>> &v)
{
    if (!v)
        return Value::nilSequence(TypeOf<std::vector<T>>::get());
    return toValue(*v);
}

template <class T, std::size_t N> Value toValue(const std::array<T, N> &v)
{
    return Value::array(TypeOf<std::array<T, N>>::get(), detail::convertAll(v));
}

} // namespace litexport::core
