#ifndef TPP_CHARS_HPP
#define TPP_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/lang/html_chars.hpp"

namespace tpp {

using ulight::is_ascii;
using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_ascii_upper_alpha;
using ulight::is_html_attribute_name_character;
using ulight::is_html_tag_name_character;
using ulight::is_html_whitespace;
using ulight::to_ascii_lower;

/// @brief Returns `true` if `c` can appear in a JavaScript identifier or numeric literal,
/// or in a CSS identifier.
/// Non-ASCII code units are treated as identifier characters,
/// which is conservative for minification purposes.
[[nodiscard]]
constexpr bool is_word_character(char8_t c)
{
    return is_ascii_alphanumeric(c) || c == u8'_' || c == u8'$' || c >= 0x80;
}

/// @brief Returns `true` if `c` can appear in the name of a template directive.
[[nodiscard]]
constexpr bool is_directive_name_character(char8_t c)
{
    return !is_html_whitespace(c) && c != u8'%' && c != u8'}' && c != u8'#';
}

} // namespace tpp

#endif
