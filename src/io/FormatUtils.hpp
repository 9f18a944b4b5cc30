// File: src/io/FormatUtils.hpp
// Purpose: Declare locale-neutral integer and floating-point formatting used
//          by the numeric encoder.
// Key invariants: Float output is the shortest plain decimal that reads back
//                 to the same value at the requested width.
// Ownership/Lifetime: Stateless helpers returning new strings.
// License: MIT (see LICENSE).
// Links: DESIGN.md#io
#pragma once

#include <string>

namespace litexport::io
{

/// @brief Decimal spelling of a signed integer.
std::string formatSigned(long long value);

/// @brief Decimal spelling of an unsigned integer.
std::string formatUnsigned(unsigned long long value);

/// @brief Shortest round-trip decimal of @p value without an exponent.
/// @param value Value to print; float32 values are passed widened.
/// @param bits 32 to round-trip through float, otherwise double.
/// @return Digits such as "3.14" or "10000000000"; "NaN", "+Inf" and "-Inf"
///         for the special values.
std::string formatFloat(double value, int bits);

} // namespace litexport::io
