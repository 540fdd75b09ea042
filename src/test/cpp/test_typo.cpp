#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>

#include <gtest/gtest.h>

#include "tpp/util/typo.hpp"

namespace tpp {
namespace {

TEST(Typo, empty)
{
    constexpr std::span<const std::u8string_view> haystack;
    constexpr std::u8string_view needle = u8"block";

    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected {};
    EXPECT_FALSE(expected);

    const Distant actual = closest_match(haystack, needle, &memory);
    EXPECT_FALSE(actual);
    EXPECT_EQ(expected, actual);
}

TEST(Typo, exact_match)
{
    constexpr std::u8string_view haystack[] { u8"if", u8"extends", u8"include" };
    constexpr std::u8string_view needle = u8"extends";

    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 1, .distance = 0 };
    const Distant<std::size_t> actual = closest_match(haystack, needle, &memory);
    EXPECT_EQ(expected, actual);
}

TEST(Typo, fuzzy_match)
{
    constexpr std::u8string_view haystack[] { u8"if", u8"extends", u8"include" };
    constexpr std::u8string_view needle = u8"exends";

    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 1, .distance = 1 };
    const Distant<std::size_t> actual = closest_match(haystack, needle, &memory);
    EXPECT_EQ(expected, actual);
}

TEST(Typo, earlier_match_preferred)
{
    constexpr std::u8string_view haystack[] { u8"cat", u8"bat", u8"hat" };
    constexpr std::u8string_view needle = u8"mat";

    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 0, .distance = 1 };
    EXPECT_EQ(expected, closest_match(haystack, needle, &memory));
}

TEST(Typo, plausible_match)
{
    constexpr std::u8string_view haystack[] { u8"autoescape", u8"spaceless", u8"widthratio" };

    std::pmr::monotonic_buffer_resource memory;

    const Distant<std::size_t> typo = plausible_match(haystack, u8"spacless", &memory);
    ASSERT_TRUE(typo);
    EXPECT_EQ(typo.value, 1);

    EXPECT_FALSE(plausible_match(haystack, u8"xyz", &memory));
    // Exact matches are not typos.
    EXPECT_FALSE(plausible_match(haystack, u8"spaceless", &memory));
}

} // namespace
} // namespace tpp
