#ifndef TPP_TYPO_HPP
#define TPP_TYPO_HPP

#include <compare>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>

namespace tpp {

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

/// @brief Searches for the given `needle` in the `haystack` based on Levenshtein distance.
/// There may be multiple equally good matches,
/// in which case earlier elements are preferred over later elements in the `haystack`.
/// Distances are measured in code units,
/// which is adequate for directive and option names.
[[nodiscard]]
Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
);

/// @brief Like `closest_match`, but only yields a match if it is close enough to be
/// a plausible typo, i.e. if at most a third of `needle` has to change.
[[nodiscard]]
Distant<std::size_t> plausible_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
);

} // namespace tpp

#endif
