#ifndef PARLEY_STRINGS_HPP
#define PARLEY_STRINGS_HPP

#include <algorithm>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/chars.hpp"

namespace parley {

inline constexpr std::u8string_view all_xml_whitespace8 = u8"\t\n\r ";

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view str)
{
    return { reinterpret_cast<const char8_t*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
constexpr bool is_xml_blank(std::u8string_view str)
{
    return std::ranges::all_of(str, [](char8_t c) { return is_xml_whitespace(c); });
}

[[nodiscard]]
constexpr std::u8string_view trim_xml_whitespace(std::u8string_view str)
{
    const std::size_t first = str.find_first_not_of(all_xml_whitespace8);
    if (first == std::u8string_view::npos) {
        return {};
    }
    const std::size_t last = str.find_last_not_of(all_xml_whitespace8);
    return str.substr(first, last - first + 1);
}

/// @brief Removes a single leading `#` from `str`, if any.
/// This turns a local pointer like `#jane` into the id it points to.
[[nodiscard]]
constexpr std::u8string_view strip_pointer_hash(std::u8string_view str)
{
    return str.starts_with(u8'#') ? str.substr(1) : str;
}

/// @brief Returns the first whitespace-separated token in `str`,
/// or an empty string if there is none.
[[nodiscard]]
constexpr std::u8string_view first_token(std::u8string_view str)
{
    str = trim_xml_whitespace(str);
    const std::size_t end = str.find_first_of(all_xml_whitespace8);
    return end == std::u8string_view::npos ? str : str.substr(0, end);
}

/// @brief Invokes `f` with every whitespace-separated token in `str`.
template <std::invocable<std::u8string_view> F>
constexpr void for_each_token(std::u8string_view str, F f)
{
    while (true) {
        const std::size_t begin = str.find_first_not_of(all_xml_whitespace8);
        if (begin == std::u8string_view::npos) {
            return;
        }
        str.remove_prefix(begin);
        const std::size_t end = std::min(str.find_first_of(all_xml_whitespace8), str.size());
        f(str.substr(0, end));
        str.remove_prefix(end);
    }
}

[[nodiscard]]
inline std::u8string to_ascii_lower(std::u8string_view str)
{
    std::u8string result { str };
    for (char8_t& c : result) {
        c = to_ascii_lower(c);
    }
    return result;
}

/// @brief Appends the decimal representation of `x` to `out`.
template <std::integral T>
void append_integer(std::u8string& out, T x)
{
    char buffer[24];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), x);
    PARLEY_ASSERT(ec == std::errc {});
    out.append(buffer, end);
}

template <std::integral T>
[[nodiscard]]
std::u8string to_u8string(T x)
{
    std::u8string result;
    append_integer(result, x);
    return result;
}

/// @brief Parses a whole string as a decimal integer.
/// @return `true` on success, `false` if `str` is not entirely an integer.
template <std::integral T>
[[nodiscard]]
bool parse_integer(std::u8string_view str, T& out)
{
    const std::string_view chars = as_string_view(str);
    const auto [end, ec] = std::from_chars(chars.data(), chars.data() + chars.size(), out);
    return ec == std::errc {} && end == chars.data() + chars.size();
}

/// @brief Appends `x` to `out`, using the shortest representation that parses back to `x`.
void append_double(std::u8string& out, double x);

/// @brief Parses a whole string as a floating-point number.
[[nodiscard]]
bool parse_double(std::u8string_view str, double& out);

/// @brief Joins `parts` with `separator` in between.
[[nodiscard]]
std::u8string join(std::span<const std::u8string> parts, std::u8string_view separator);

} // namespace parley

#endif
