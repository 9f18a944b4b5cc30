//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/io/StringEscape.cpp
// Purpose: Implement UTF-8 decoding and ASCII-only string quoting for text
//          and byte-sequence literals.
// Links: DESIGN.md#io
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines the UTF-8 decoder and the literal quoting routine.
/// @details The decoder accepts exactly the shortest-form encodings of scalar
///          values; anything else decodes as a one-byte error so the quoting
///          routine can fall back to a `\x` escape for that byte.

#include "io/StringEscape.hpp"

namespace litexport::io
{
namespace
{

constexpr char kLowerHex[] = "0123456789abcdef";

bool isContinuation(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

/// @brief Append @p digits lowercase hex digits of @p value.
void appendHex(std::string &out, char32_t value, int digits)
{
    for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4)
        out.push_back(kLowerHex[(value >> shift) & 0xF]);
}

} // namespace

DecodedRune decodeRune(std::string_view input, std::size_t pos)
{
    const DecodedRune invalid{kRuneError, 1};
    const auto c0 = static_cast<unsigned char>(input[pos]);
    if (c0 < 0x80)
        return {c0, 1};

    std::size_t width = 0;
    char32_t rune = 0;
    char32_t minimum = 0;
    if ((c0 & 0xE0) == 0xC0)
    {
        width = 2;
        rune = c0 & 0x1F;
        minimum = 0x80;
    }
    else if ((c0 & 0xF0) == 0xE0)
    {
        width = 3;
        rune = c0 & 0x0F;
        minimum = 0x800;
    }
    else if ((c0 & 0xF8) == 0xF0)
    {
        width = 4;
        rune = c0 & 0x07;
        minimum = 0x10000;
    }
    else
    {
        return invalid;
    }

    if (pos + width > input.size())
        return invalid;
    for (std::size_t i = 1; i < width; ++i)
    {
        const auto c = static_cast<unsigned char>(input[pos + i]);
        if (!isContinuation(c))
            return invalid;
        rune = (rune << 6) | (c & 0x3F);
    }

    if (rune < minimum || rune > 0x10FFFF || (rune >= 0xD800 && rune <= 0xDFFF))
        return invalid;
    return {rune, width};
}

bool isValidUtf8(std::string_view input)
{
    std::size_t pos = 0;
    while (pos < input.size())
    {
        const DecodedRune r = decodeRune(input, pos);
        if (r.rune == kRuneError && r.width == 1)
            return false;
        pos += r.width;
    }
    return true;
}

/// @brief Quote @p input as an ASCII-only literal.
/// @details Walks the input one code point at a time.  A byte that does not
///          start a valid sequence is escaped on its own so that arbitrary
///          bytes survive; a correctly encoded U+FFFD is a normal code point
///          and is written as `\ufffd`.
std::string quoteAscii(std::string_view input)
{
    std::string out;
    out.reserve(input.size() + 2);
    out.push_back('"');

    std::size_t pos = 0;
    while (pos < input.size())
    {
        const DecodedRune r = decodeRune(input, pos);
        if (r.rune == kRuneError && r.width == 1)
        {
            out.append("\\x");
            appendHex(out, static_cast<unsigned char>(input[pos]), 2);
            ++pos;
            continue;
        }
        pos += r.width;

        const char32_t c = r.rune;
        if (c == '"' || c == '\\')
        {
            out.push_back('\\');
            out.push_back(static_cast<char>(c));
            continue;
        }
        if (c >= 0x20 && c < 0x7F)
        {
            out.push_back(static_cast<char>(c));
            continue;
        }
        switch (c)
        {
            case '\a':
                out.append("\\a");
                break;
            case '\b':
                out.append("\\b");
                break;
            case '\f':
                out.append("\\f");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            case '\v':
                out.append("\\v");
                break;
            default:
                if (c < 0x20 || c == 0x7F)
                {
                    out.append("\\x");
                    appendHex(out, c, 2);
                }
                else if (c < 0x10000)
                {
                    out.append("\\u");
                    appendHex(out, c, 4);
                }
                else
                {
                    out.append("\\U");
                    appendHex(out, c, 8);
                }
                break;
        }
    }

    out.push_back('"');
    return out;
}

} // namespace litexport::io
