#ifndef PARLEY_LEVENSHTEIN_HPP
#define PARLEY_LEVENSHTEIN_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <ranges>
#include <span>

#include "parley/util/assert.hpp"

namespace parley {

// https://en.wikipedia.org/wiki/Levenshtein_distance

/// @brief Computes the Levenshtein distance between `x` and `y`,
/// keeping only two rows of the distance matrix at a time.
/// @param rows Scratch space of at least `2 * (size(y) + 1)` elements.
// clang-format off
template <std::ranges::random_access_range R1, std::ranges::random_access_range R2>
  requires std::equality_comparable_with<std::ranges::range_value_t<R1>, std::ranges::range_value_t<R2>>
[[nodiscard]]
constexpr std::size_t levenshtein_distance(const R1& x, const R2& y, std::span<std::size_t> rows)
{
    const auto x_size = std::size_t(std::ranges::size(x));
    const auto y_size = std::size_t(std::ranges::size(y));
    if (x_size == 0) {
        return y_size;
    }
    if (y_size == 0) {
        return x_size;
    }
    PARLEY_ASSERT(rows.size() >= 2 * (y_size + 1));

    std::span<std::size_t> previous = rows.subspan(0, y_size + 1);
    std::span<std::size_t> current = rows.subspan(y_size + 1, y_size + 1);
    for (std::size_t j = 0; j <= y_size; ++j) {
        previous[j] = j;
    }

    const auto x_begin = std::ranges::begin(x);
    const auto y_begin = std::ranges::begin(y);

    for (std::size_t i = 1; i <= x_size; ++i) {
        current[0] = i;
        const auto& x_element = x_begin[std::ranges::range_difference_t<R1>(i - 1)];
        for (std::size_t j = 1; j <= y_size; ++j) {
            const auto& y_element = y_begin[std::ranges::range_difference_t<R2>(j - 1)];
            const std::size_t substitution = previous[j - 1] + (x_element == y_element ? 0 : 1);
            current[j] = std::min({ previous[j] + 1, current[j - 1] + 1, substitution });
        }
        std::swap(previous, current);
    }

    return previous[y_size];
}
// clang-format on

} // namespace parley

#endif
