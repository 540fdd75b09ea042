#ifndef TPP_PATH_PATTERN_HPP
#define TPP_PATH_PATTERN_HPP

#include <memory>
#include <string>
#include <string_view>

#include "tpp/util/result.hpp"

#include "tpp/fwd.hpp"

namespace tpp {

enum struct Path_Pattern_Error : Default_Underlying {
    /// @brief The given pattern is not a valid regular expression.
    bad_pattern,
};

/// @brief A regular expression (ECMAScript flavor) that is matched against template paths.
///
/// A `Path_Pattern` has shared ownership over the underlying compiled regular expression,
/// meaning that copying is inexpensive.
/// Matching is safe from multiple threads at once.
struct Path_Pattern {
public:
    [[nodiscard]]
    static Result<Path_Pattern, Path_Pattern_Error> make(std::u8string_view pattern);

private:
    struct Impl;
    std::shared_ptr<const Impl> m_impl;
    std::u8string m_pattern;

    [[nodiscard]]
    Path_Pattern(std::shared_ptr<const Impl> impl, std::u8string_view pattern);

public:
    /// @brief Returns `true` if `path` matches this pattern in its entirety.
    [[nodiscard]]
    bool matches(std::u8string_view path) const;

    [[nodiscard]]
    std::u8string_view get_pattern() const
    {
        return m_pattern;
    }
};

} // namespace tpp

#endif
