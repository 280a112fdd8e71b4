#include <algorithm>
#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "parley/util/levenshtein.hpp"

namespace parley {
namespace {

[[nodiscard]]
std::size_t distance(std::u8string_view x, std::u8string_view y)
{
    std::vector<std::size_t> rows(2 * (y.size() + 1));
    return levenshtein_distance(x, y, rows);
}

TEST(Levenshtein, empty)
{
    EXPECT_EQ(distance(u8"", u8""), 0);
}

TEST(Levenshtein, create)
{
    EXPECT_EQ(distance(u8"", u8"abcdefg"), 7);
    EXPECT_EQ(distance(u8"abcdefg", u8""), 7);
}

TEST(Levenshtein, zero_distance)
{
    EXPECT_EQ(distance(u8"said", u8"said"), 0);
}

TEST(Levenshtein, pure_prepend)
{
    EXPECT_EQ(distance(u8"abc", u8"12345abc"), 5);
}

TEST(Levenshtein, pure_append)
{
    EXPECT_EQ(distance(u8"abc", u8"abc12345"), 5);
}

TEST(Levenshtein, insert)
{
    EXPECT_EQ(distance(u8"abcd", u8"a1b2c3d"), 3);
}

TEST(Levenshtein, substitute)
{
    EXPECT_EQ(distance(u8"persName", u8"perName"), 1);
    EXPECT_EQ(distance(u8"tei-novle", u8"tei-novel"), 2);
    EXPECT_EQ(distance(u8"kitten", u8"sitting"), 3);
}

// Verifies that distance computation is commutative.
TEST(Levenshtein, commutative_fuzzing)
{
    constexpr int iterations = 100;

    std::default_random_engine rng { 12345 };
    std::uniform_int_distribution<unsigned> size_distr { 0, 40 };
    std::uniform_int_distribution<unsigned> char_distr { u8'a', u8'e' };

    for (int i = 0; i < iterations; ++i) {
        std::u8string x(size_distr(rng), u8'\0');
        std::u8string y(size_distr(rng), u8'\0');
        for (char8_t& c : x) {
            c = char8_t(char_distr(rng));
        }
        for (char8_t& c : y) {
            c = char8_t(char_distr(rng));
        }

        const std::size_t xy = distance(x, y);
        const std::size_t yx = distance(y, x);
        EXPECT_EQ(xy, yx);
        EXPECT_LE(xy, std::max(x.size(), y.size()));
    }
}

} // namespace
} // namespace parley
