#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "tpp/util/levenshtein.hpp"

namespace tpp {
namespace {

[[nodiscard]]
std::size_t distance(std::u8string_view x, std::u8string_view y)
{
    std::vector<std::size_t> matrix((x.size() + 1) * (y.size() + 1));
    return code_unit_levenshtein_distance(x, y, matrix);
}

TEST(Levenshtein, empty)
{
    EXPECT_EQ(distance(u8"", u8""), 0);
}

TEST(Levenshtein, create)
{
    EXPECT_EQ(distance(u8"", u8"abcdefg"), 7);
}

TEST(Levenshtein, zero_distance)
{
    EXPECT_EQ(distance(u8"abcdefg", u8"abcdefg"), 0);
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
    EXPECT_EQ(distance(u8"endif", u8"endof"), 1);
}

TEST(Levenshtein, constant_evaluation)
{
    constexpr std::size_t result = [] {
        std::size_t matrix[4 * 5] {};
        return code_unit_levenshtein_distance(u8"for", u8"form", matrix);
    }();
    static_assert(result == 1);
}

// Verifies that distance computations are commutative.
TEST(Levenshtein, commutative_fuzzing)
{
    constexpr int iterations = 100;

    std::default_random_engine rng { 12345 };
    std::uniform_int_distribution<unsigned> distr { 0, 127 };

    for (int i = 0; i < iterations; ++i) {
        std::u8string x;
        std::u8string y;
        x.resize(distr(rng) % 32);
        y.resize(distr(rng) % 32);

        for (char8_t& c : x) {
            c = char8_t(distr(rng));
        }
        for (char8_t& c : y) {
            c = char8_t(distr(rng));
        }

        EXPECT_EQ(distance(x, y), distance(y, x));
    }
}

} // namespace
} // namespace tpp
