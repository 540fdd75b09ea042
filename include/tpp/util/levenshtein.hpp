#ifndef TPP_LEVENSHTEIN_HPP
#define TPP_LEVENSHTEIN_HPP

#include <algorithm>
#include <cstddef>
#include <span>
#include <string_view>

#include "tpp/util/assert.hpp"

namespace tpp {

// https://en.wikipedia.org/wiki/Levenshtein_distance

/// @brief Computes the Levenshtein distance between `x` and `y` code unit by code unit.
/// @param matrix Scratch space of at least `(x.size() + 1) * (y.size() + 1)` elements.
[[nodiscard]]
constexpr std::size_t code_unit_levenshtein_distance(
    std::u8string_view x,
    std::u8string_view y,
    std::span<std::size_t> matrix
)
{
    const std::size_t x_size = x.size();
    const std::size_t y_size = y.size();
    TPP_ASSERT(matrix.size() >= (x_size + 1) * (y_size + 1));

    if (x_size == 0) {
        return y_size;
    }
    if (y_size == 0) {
        return x_size;
    }

    const auto at = [&](std::size_t i, std::size_t j) -> std::size_t& {
        return matrix[(i * (y_size + 1)) + j];
    };

    for (std::size_t i = 0; i <= x_size; ++i) {
        at(i, 0) = i;
    }
    for (std::size_t j = 0; j <= y_size; ++j) {
        at(0, j) = j;
    }

    // clang-format off
    for (std::size_t i = 1; i <= x_size; ++i) {
        for (std::size_t j = 1; j <= y_size; ++j) {
            const std::size_t sub_cost = x[i - 1] != y[j - 1];
            at(i, j) = std::min({
                at(i - 1, j    ) + 1,        // deletion
                at(i,     j - 1) + 1,        // insertion
                at(i - 1, j - 1) + sub_cost  // substitution
            });
        }
    }
    // clang-format on

    return at(x_size, y_size);
}

} // namespace tpp

#endif
