#ifndef PARLEY_CHARS_HPP
#define PARLEY_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/lang/html_chars.hpp"

namespace parley {

using ulight::is_ascii;
using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_ascii_hex_digit;
using ulight::is_ascii_upper_alpha;
using ulight::is_html_whitespace;

/// @brief Returns `true` if `c` is whitespace in the sense of the XML `S` production.
[[nodiscard]]
constexpr bool is_xml_whitespace(char8_t c) noexcept
{
    return c == u8' ' || c == u8'\t' || c == u8'\n' || c == u8'\r';
}

/// @brief Returns `true` if `c` can begin an XML name.
/// Any non-ASCII code unit is accepted;
/// the parser only needs to find the end of a name, not to validate every code point.
[[nodiscard]]
constexpr bool is_xml_name_start(char8_t c) noexcept
{
    return is_ascii_alpha(c) || c == u8'_' || c == u8':' || c >= 0x80;
}

[[nodiscard]]
constexpr bool is_xml_name_character(char8_t c) noexcept
{
    return is_xml_name_start(c) || is_ascii_digit(c) || c == u8'-' || c == u8'.';
}

/// @brief Returns `true` if `c` is a UTF-8 continuation byte, i.e. `0b10xx'xxxx`.
[[nodiscard]]
constexpr bool is_utf8_continuation(char8_t c) noexcept
{
    return (c & 0xc0) == 0x80;
}

[[nodiscard]]
constexpr char8_t to_ascii_lower(char8_t c) noexcept
{
    return is_ascii_upper_alpha(c) ? char8_t(c + (u8'a' - u8'A')) : c;
}

} // namespace parley

#endif
