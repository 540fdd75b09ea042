#ifndef TPP_TRANSPARENT_COMPARISON_HPP
#define TPP_TRANSPARENT_COMPARISON_HPP

#include <cstddef>
#include <functional>
#include <string_view>

#include "tpp/fwd.hpp"

namespace tpp {

/// @brief A hash function which permits heterogeneous lookup in unordered containers,
/// so that maps keyed by owning strings can be searched with string views.
template <typename Char>
struct Basic_Transparent_String_View_Hash {
    using is_transparent = void;
    using char_type = Char;
    using string_view_type = std::basic_string_view<Char>;

    [[nodiscard]]
    std::size_t operator()(string_view_type v) const noexcept
    {
        return std::hash<string_view_type> {}(v);
    }
};

template <typename Char>
struct Basic_Transparent_String_View_Equals {
    using is_transparent = void;
    using char_type = Char;
    using string_view_type = std::basic_string_view<Char>;

    [[nodiscard]]
    bool operator()(string_view_type x, string_view_type y) const noexcept
    {
        return x == y;
    }
};

} // namespace tpp

#endif
