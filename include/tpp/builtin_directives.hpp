#ifndef TPP_BUILTIN_DIRECTIVES_HPP
#define TPP_BUILTIN_DIRECTIVES_HPP

#include <optional>
#include <string>
#include <string_view>

#include "tpp/util/result.hpp"

#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"

namespace tpp {

/// @brief Adds the built-in directives of the template language to `registry`.
/// Adding stops at the first entry that cannot be added,
/// which happens if `registry` already contains an entry with a built-in name.
[[nodiscard]]
Result<void, Registry_Error> add_builtin_directives(Directive_Registry& registry);

/// @brief Returns a registry containing only the built-in directives.
[[nodiscard]]
Directive_Registry make_builtin_registry();

/// @brief Returns the output of `{% templatetag keyword %}`,
/// or `std::nullopt` if `keyword` is not a valid argument.
[[nodiscard]]
std::optional<std::u8string_view> templatetag_output(std::u8string_view keyword);

/// @brief Removes whitespace between `>` and `<` and trims the result,
/// like `{% spaceless %}`.
[[nodiscard]]
std::u8string strip_spaces_between_tags(std::u8string_view html);

/// @brief Formats a number the way it is rendered by the template engine:
/// integers without decimal point, other numbers with the shortest round-tripping representation.
[[nodiscard]]
std::u8string format_number_literal(std::u8string_view number);

} // namespace tpp

#endif
