//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE in the project root for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/io/FormatUtils.cpp
// Purpose: Provide locale-neutral integer and floating-point formatting
//          routines used by the numeric encoder.
// Key invariants: Outputs never use exponent notation or locale separators;
//                 floats carry the fewest digits that parse back exactly.
// Ownership/Lifetime: Helpers allocate new std::string instances and return
//                     them by value; no global state is cached.
// Links: DESIGN.md#io
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Implements locale-stable numeric formatting helpers.
/// @details `std::to_chars` without a precision argument yields the shortest
///          digits that round-trip.  Those digits are requested in scientific
///          form and then shifted into plain positional notation, so `1e23`
///          prints as `100000000000000000000000` rather than the exact binary
///          expansion that `chars_format::fixed` would produce.
///          Single-precision values are narrowed back to `float` first so the
///          shortest digits are chosen for that width.

#include "io/FormatUtils.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>

namespace litexport::io
{
namespace
{

/// Holds `-d.ddddddddddddddddde+ddd` with room to spare.
constexpr std::size_t kFloatBuffer = 64;

/// Rewrite shortest scientific text (`-1.25e+02`, `1e+23`) positionally.
std::string expandScientific(std::string_view sci)
{
    std::string out;
    if (!sci.empty() && sci.front() == '-')
    {
        out.push_back('-');
        sci.remove_prefix(1);
    }

    const auto ePos = sci.find('e');
    if (ePos == std::string_view::npos)
        throw std::runtime_error("formatFloat: missing exponent");

    std::string digits;
    for (char c : sci.substr(0, ePos))
    {
        if (c != '.')
            digits.push_back(c);
    }

    std::string_view expText = sci.substr(ePos + 1);
    if (!expText.empty() && expText.front() == '+')
        expText.remove_prefix(1);
    int exponent = 0;
    const auto parsed =
        std::from_chars(expText.data(), expText.data() + expText.size(), exponent);
    if (parsed.ec != std::errc() || parsed.ptr != expText.data() + expText.size())
        throw std::runtime_error("formatFloat: malformed exponent");

    if (digits == "0")
        return out + "0";

    // Number of digits that sit before the decimal point.
    const long point = 1L + exponent;
    const long count = static_cast<long>(digits.size());
    if (point <= 0)
    {
        out += "0.";
        out.append(static_cast<std::size_t>(-point), '0');
        out += digits;
    }
    else if (point >= count)
    {
        out += digits;
        out.append(static_cast<std::size_t>(point - count), '0');
    }
    else
    {
        out.append(digits, 0, static_cast<std::size_t>(point));
        out.push_back('.');
        out.append(digits, static_cast<std::size_t>(point), std::string::npos);
    }
    return out;
}

template <class T> std::string toChars(T value)
{
    std::array<char, kFloatBuffer> buf{};
    const auto result = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                      std::chars_format::scientific);
    if (result.ec != std::errc())
        throw std::runtime_error("formatFloat: buffer too small");
    const auto length = static_cast<std::size_t>(result.ptr - buf.data());
    return expandScientific(std::string_view(buf.data(), length));
}

} // namespace

std::string formatSigned(long long value)
{
    return std::to_string(value);
}

std::string formatUnsigned(unsigned long long value)
{
    return std::to_string(value);
}

std::string formatFloat(double value, int bits)
{
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return std::signbit(value) ? "-Inf" : "+Inf";
    if (bits == 32)
        return toChars(static_cast<float>(value));
    return toChars(value);
}

} // namespace litexport::io
