#ifndef PARLEY_UNICODE_HPP
#define PARLEY_UNICODE_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "ulight/impl/unicode.hpp"

namespace parley::utf8 {

using ulight::utf8::Code_Point_View;
using ulight::utf8::decode_and_length_or_replacement;
using ulight::utf8::encode8_unchecked;
using ulight::utf8::is_valid;

/// @brief Returns the length of `str`, in code points.
/// Any illegal code units are counted as one code point,
/// which is consistent with treating them as a U+FFFD REPLACEMENT CHARACTER.
[[nodiscard]]
constexpr std::size_t count_code_points_or_replacement(std::u8string_view str) noexcept
{
    std::size_t result = 0;
    while (!str.empty()) {
        const auto [_, length] = decode_and_length_or_replacement(str);
        str.remove_prefix(std::size_t(length));
        ++result;
    }
    return result;
}

/// @brief Appends the UTF-8 encoding of `c` to `out`.
inline void append_code_point(std::u8string& out, char32_t c)
{
    out += encode8_unchecked(c).as_string();
}

} // namespace parley::utf8

#endif
