// File: src/io/StringEscape.hpp
// Purpose: Declare helpers for validating UTF-8 and producing ASCII-only
//          double-quoted string literals.
// Key invariants: quoteAscii output contains printable ASCII only and always
//                 starts and ends with a double quote.
// Ownership/Lifetime: Stateless utility functions.
// License: MIT (see LICENSE).
// Links: DESIGN.md#io
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace litexport::io
{

/// @brief Code point substituted for undecodable input.
inline constexpr char32_t kRuneError = 0xFFFD;

/// @brief Result of decoding one UTF-8 sequence.
struct DecodedRune
{
    char32_t rune{kRuneError}; ///< Decoded code point, kRuneError when invalid.
    std::size_t width{0};      ///< Bytes consumed; 1 for an invalid byte.
};

/// @brief Decode the UTF-8 sequence starting at @p pos.
/// @param input Byte string to decode from.
/// @param pos Offset of the first byte; must be less than input.size().
/// @return Code point and width; invalid, truncated, overlong and surrogate
///         encodings yield {kRuneError, 1}.
DecodedRune decodeRune(std::string_view input, std::size_t pos);

/// @brief Check whether @p input is entirely valid UTF-8.
bool isValidUtf8(std::string_view input);

/// @brief Produce a double-quoted literal for @p input using only ASCII.
/// @details Printable ASCII is copied, `"` and `\` are backslash-escaped, the
///          common control characters use their single-letter escapes, other
///          control bytes and invalid UTF-8 bytes become `\xNN`, and every
///          other code point becomes `\uNNNN` or `\UNNNNNNNN` (lowercase hex).
std::string quoteAscii(std::string_view input);

} // namespace litexport::io
