#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "tpp/util/levenshtein.hpp"
#include "tpp/util/typo.hpp"

namespace tpp {

Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<std::size_t> matrix_data { memory };

    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        const std::u8string_view hay = haystack[i];
        matrix_data.resize((hay.size() + 1) * (needle.size() + 1));
        const std::size_t distance
            = code_unit_levenshtein_distance(hay, needle, std::span { matrix_data });

        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

Distant<std::size_t> plausible_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    const Distant<std::size_t> result = closest_match(haystack, needle, memory);
    if (!result || result.distance == 0 || result.distance * 3 > needle.size() + 2) {
        return {};
    }
    return result;
}

} // namespace tpp
