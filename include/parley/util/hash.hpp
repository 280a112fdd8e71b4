#ifndef PARLEY_HASH_HPP
#define PARLEY_HASH_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "parley/util/assert.hpp"

namespace parley {

inline constexpr std::uint64_t fnv1a_offset_basis = 0xcbf2'9ce4'8422'2325;
inline constexpr std::uint64_t fnv1a_prime = 0x0000'0100'0000'01b3;

/// @brief Incrementally computes a 64-bit FNV-1a hash.
/// The hash is stable across platforms and runs,
/// which makes it suitable for content-derived identifiers.
struct Fnv1a_Hasher {
    std::uint64_t state = fnv1a_offset_basis;

    constexpr Fnv1a_Hasher& add(std::u8string_view bytes) noexcept
    {
        for (const char8_t c : bytes) {
            state ^= std::uint64_t(c);
            state *= fnv1a_prime;
        }
        return *this;
    }

    /// @brief Adds a single separator byte,
    /// so that `add("ab").add("c")` and `add("a").add("bc")` differ.
    constexpr Fnv1a_Hasher& separate() noexcept
    {
        state ^= 0xff;
        state *= fnv1a_prime;
        return *this;
    }

    constexpr Fnv1a_Hasher& add(std::uint64_t x) noexcept
    {
        for (int i = 0; i < 8; ++i) {
            state ^= (x >> (i * 8)) & 0xff;
            state *= fnv1a_prime;
        }
        return *this;
    }
};

[[nodiscard]]
constexpr std::uint64_t fnv1a(std::u8string_view bytes) noexcept
{
    return Fnv1a_Hasher {}.add(bytes).state;
}

/// @brief Appends the lowest `digits` hexadecimal digits of `x` to `out`, in lower case,
/// most significant digit first.
inline void append_hex(std::u8string& out, std::uint64_t x, std::size_t digits)
{
    PARLEY_ASSERT(digits <= 16);
    constexpr std::u8string_view hex_digits = u8"0123456789abcdef";
    for (std::size_t i = digits; i-- != 0;) {
        out += hex_digits[(x >> (i * 4)) & 0xf];
    }
}

} // namespace parley

#endif
