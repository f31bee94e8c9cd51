#pragma once

#include <ash-core/assert.hh>
#include <ash-core/fwd.hh>
#include <ash-core/string_view.hh>

// =========================================================================================================
// UTF-8 encoding primitives
// =========================================================================================================
//
// see https://www.unicode.org/versions/Unicode15.0.0/ch03.pdf (table 3-7)
//
// Classification:
//   is_utf8_char_boundary(c)   - byte starts a sequence (is not a continuation byte 0b10xxxxxx)
//   is_unicode_scalar_value(c) - code point in [0, 0x10FFFF] excluding surrogates
//   is_valid_utf8(s)           - whole byte sequence is well-formed UTF-8
//
// Encoding:
//   utf8_encoded_size(c)       - number of bytes (1..4) needed to encode c
//   encode_utf8(c, dest)       - writes the encoding of c to dest, returns the byte count
//
// Decoding (input must be valid UTF-8):
//   decode_utf8_first(s)       - first char of s and its encoded size
//   decode_utf8_last(s)        - last char of s and its encoded size
//

namespace ash
{
/// Result of decoding a single char from a byte sequence
struct decoded_char
{
    char32_t value = 0;
    isize size = 0;
};

// =========================================================================================================
// Classification
// =========================================================================================================

/// Check if a byte starts a UTF-8 sequence
/// Continuation bytes (0x80..0xBF) are exactly the bytes that are < -0x40 when viewed as signed
/// Usage:
///   ash::is_utf8_char_boundary('a')    // true
///   ash::is_utf8_char_boundary('\xA3') // false, second byte of "£"
[[nodiscard]] constexpr bool is_utf8_char_boundary(char c)
{
    return static_cast<signed char>(c) >= -0x40;
}

/// Check if a code point may be encoded (not a surrogate, not beyond 0x10FFFF)
[[nodiscard]] constexpr bool is_unicode_scalar_value(char32_t c)
{
    return c <= 0x10FFFF && !(0xD800 <= c && c <= 0xDFFF);
}

/// Check if the byte sequence is well-formed UTF-8
/// Rejects overlong encodings, encoded surrogates, code points beyond 0x10FFFF, and truncated sequences
[[nodiscard]] constexpr bool is_valid_utf8(string_view s)
{
    auto const p = s.data();
    auto const n = s.size();
    auto const byte_at = [p](isize i) { return static_cast<u8>(p[i]); };
    auto const is_cont = [](u8 b) { return (b & 0xC0) == 0x80; };

    isize i = 0;
    while (i < n)
    {
        u8 const b0 = byte_at(i);

        if (b0 < 0x80)
        {
            ++i;
            continue;
        }

        // valid range of the second byte depends on the lead byte
        isize len = 0;
        u8 lo = 0x80;
        u8 hi = 0xBF;
        if (0xC2 <= b0 && b0 <= 0xDF)
            len = 2;
        else if (b0 == 0xE0)
        {
            len = 3;
            lo = 0xA0;
        }
        else if (0xE1 <= b0 && b0 <= 0xEC)
            len = 3;
        else if (b0 == 0xED)
        {
            len = 3;
            hi = 0x9F;
        }
        else if (0xEE <= b0 && b0 <= 0xEF)
            len = 3;
        else if (b0 == 0xF0)
        {
            len = 4;
            lo = 0x90;
        }
        else if (0xF1 <= b0 && b0 <= 0xF3)
            len = 4;
        else if (b0 == 0xF4)
        {
            len = 4;
            hi = 0x8F;
        }
        else
            return false;

        if (n - i < len)
            return false;

        u8 const b1 = byte_at(i + 1);
        if (b1 < lo || b1 > hi)
            return false;

        for (isize k = 2; k < len; ++k)
            if (!is_cont(byte_at(i + k)))
                return false;

        i += len;
    }

    return true;
}

// =========================================================================================================
// Encoding
// =========================================================================================================

/// Number of bytes needed to encode c
/// Precondition: is_unicode_scalar_value(c)
[[nodiscard]] constexpr isize utf8_encoded_size(char32_t c)
{
    if (c < 0x80)
        return 1;
    if (c < 0x800)
        return 2;
    if (c < 0x10000)
        return 3;
    return 4;
}

/// Writes the UTF-8 encoding of c to dest and returns the number of bytes written
/// dest must have room for utf8_encoded_size(c) bytes (4 is always enough)
/// Precondition: is_unicode_scalar_value(c)
/// Usage:
///   char buf[4];
///   auto n = ash::encode_utf8(U'£', buf); // n == 2, buf = "\xC2\xA3"
constexpr isize encode_utf8(char32_t c, char* dest)
{
    ASH_ASSERT(is_unicode_scalar_value(c), "invalid unicode scalar value");

    if (c < 0x80)
    {
        dest[0] = char(c);
        return 1;
    }
    if (c < 0x800)
    {
        dest[0] = char(0xC0 | (c >> 6));
        dest[1] = char(0x80 | (c & 0x3F));
        return 2;
    }
    if (c < 0x10000)
    {
        dest[0] = char(0xE0 | (c >> 12));
        dest[1] = char(0x80 | ((c >> 6) & 0x3F));
        dest[2] = char(0x80 | (c & 0x3F));
        return 3;
    }
    dest[0] = char(0xF0 | (c >> 18));
    dest[1] = char(0x80 | ((c >> 12) & 0x3F));
    dest[2] = char(0x80 | ((c >> 6) & 0x3F));
    dest[3] = char(0x80 | (c & 0x3F));
    return 4;
}

// =========================================================================================================
// Decoding
// =========================================================================================================

/// Decodes the first char of s
/// Precondition: s is non-empty and starts with a complete, valid UTF-8 sequence
[[nodiscard]] constexpr decoded_char decode_utf8_first(string_view s)
{
    ASH_ASSERT(!s.empty(), "cannot decode from an empty string");

    auto const b = [&](isize i) { return char32_t(static_cast<u8>(s.data()[i])); };
    auto const b0 = b(0);

    if (b0 < 0x80)
        return {b0, 1};

    isize size = b0 < 0xE0 ? 2 : b0 < 0xF0 ? 3 : 4;
    ASH_ASSERT(size <= s.size(), "truncated UTF-8 sequence");

    char32_t value = b0 & (0x7F >> size);
    for (isize i = 1; i < size; ++i)
        value = (value << 6) | (b(i) & 0x3F);

    return {value, size};
}

/// Decodes the last char of s
/// Precondition: s is non-empty and ends with a complete, valid UTF-8 sequence
[[nodiscard]] constexpr decoded_char decode_utf8_last(string_view s)
{
    ASH_ASSERT(!s.empty(), "cannot decode from an empty string");

    // walk back over at most 3 continuation bytes
    isize start = s.size() - 1;
    while (start > 0 && s.size() - start < 4 && !is_utf8_char_boundary(s.data()[start]))
        --start;

    auto const d = decode_utf8_first(s.subview(start));
    ASH_ASSERT(d.size == s.size() - start, "malformed UTF-8 sequence at end of string");
    return d;
}
} // namespace ash
