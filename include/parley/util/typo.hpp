#ifndef PARLEY_TYPO_HPP
#define PARLEY_TYPO_HPP

#include <compare>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>

namespace parley {

template <typename T>
struct Distant {
    T value {};
    std::size_t distance = std::size_t(-1);

    [[nodiscard]]
    constexpr operator bool() const
    {
        return distance != std::size_t(-1);
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Distant& x, const Distant& y)
        = default;

    [[nodiscard]]
    friend constexpr std::strong_ordering operator<=>(const Distant& x, const Distant& y) noexcept
    {
        return x.distance <=> y.distance;
    }
};

/// @brief Finds the element of `haystack` with the least Levenshtein distance to `needle`.
/// Distances are measured in code points, so `"Élise"` is one edit away from `"Elise"`.
/// Ties go to the earlier element, which lets callers order candidates by preference,
/// like schema ids in catalog order.
/// The result is empty only if `haystack` is empty.
[[nodiscard]]
Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
);

/// @brief Returns what a misspelled schema id, tag type or entity reference most likely meant:
/// the closest element of `haystack` if it is at most `max_distance` edits away from `needle`,
/// or an empty view otherwise.
[[nodiscard]]
std::u8string_view closest_suggestion(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::size_t max_distance
);

} // namespace parley

#endif
