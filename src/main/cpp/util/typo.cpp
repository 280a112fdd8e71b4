#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "parley/util/levenshtein.hpp"
#include "parley/util/strings.hpp"
#include "parley/util/typo.hpp"
#include "parley/util/unicode.hpp"

namespace parley {

namespace {

void decode_into(std::pmr::u32string& out, std::u8string_view str)
{
    out.clear();
    out.reserve(str.size());
    std::ranges::copy(utf8::Code_Point_View { str }, std::back_inserter(out));
}

} // namespace

Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    const bool ascii_needle = std::ranges::all_of(needle, [](char8_t c) { return is_ascii(c); });

    std::pmr::u32string needle32 { memory };
    std::pmr::u32string hay32 { memory };
    if (!ascii_needle) {
        decode_into(needle32, needle);
    }
    std::pmr::vector<std::size_t> rows { memory };

    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        const std::u8string_view hay = haystack[i];
        const bool ascii_hay = std::ranges::all_of(hay, [](char8_t c) { return is_ascii(c); });

        std::size_t distance;
        if (ascii_needle && ascii_hay) {
            rows.resize(2 * (needle.size() + 1));
            distance = levenshtein_distance(hay, needle, rows);
        }
        else {
            if (ascii_needle && needle32.empty() && !needle.empty()) {
                decode_into(needle32, needle);
            }
            decode_into(hay32, hay);
            rows.resize(2 * (needle32.size() + 1));
            distance = levenshtein_distance(hay32, needle32, rows);
        }

        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

std::u8string_view closest_suggestion(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::size_t max_distance
)
{
    const Distant<std::size_t> match = closest_match(haystack, needle, std::pmr::get_default_resource());
    return match && match.distance <= max_distance ? haystack[match.value] : std::u8string_view {};
}

} // namespace parley
