#ifndef TPP_HTML_NAMES_HPP
#define TPP_HTML_NAMES_HPP

#include <algorithm>
#include <span>
#include <string_view>

#include "ulight/impl/lang/html.hpp"

namespace tpp {

/// @brief Returns `true` if `str` is a valid HTML tag identifier.
/// This includes both builtin tag names (which are purely alphabetic)
/// and custom tag names.
[[nodiscard]]
constexpr bool is_html_tag_name(std::u8string_view str)
{
    return ulight::html::is_tag_name(str);
}

/// @brief Returns `true` if `str` is a valid HTML attribute name.
[[nodiscard]]
constexpr bool is_html_attribute_name(std::u8string_view str)
{
    return ulight::html::is_attribute_name(str);
}

namespace html_tag {

// https://html.spec.whatwg.org/dev/syntax.html#void-elements
inline constexpr std::u8string_view void_elements[] {
    u8"area", u8"base", u8"br",   u8"col",  u8"embed",  u8"hr",    u8"img",
    u8"input", u8"link", u8"meta", u8"param", u8"source", u8"track", u8"wbr",
};

// https://html.spec.whatwg.org/dev/syntax.html#raw-text-elements
// https://html.spec.whatwg.org/dev/syntax.html#escapable-raw-text-elements
inline constexpr std::u8string_view raw_text_elements[] {
    u8"script",
    u8"style",
    u8"textarea",
    u8"title",
};

/// @brief Elements within which whitespace is significant.
inline constexpr std::u8string_view whitespace_preserving_elements[] {
    u8"pre", u8"script", u8"style", u8"textarea", u8"title", u8"plaintext", u8"xmp",
};

/// @brief Elements which start a new block in the default rendering of HTML.
/// Whitespace adjacent to these elements has no effect on the rendered document.
inline constexpr std::u8string_view block_elements[] {
    u8"address", u8"article", u8"aside",   u8"blockquote", u8"body",     u8"br",
    u8"caption", u8"col",     u8"colgroup", u8"dd",        u8"details",  u8"dialog",
    u8"div",     u8"dl",      u8"dt",      u8"fieldset",   u8"figcaption", u8"figure",
    u8"footer",  u8"form",    u8"h1",      u8"h2",         u8"h3",       u8"h4",
    u8"h5",      u8"h6",      u8"head",    u8"header",     u8"hgroup",   u8"hr",
    u8"html",    u8"li",      u8"link",    u8"main",       u8"meta",     u8"nav",
    u8"ol",      u8"option",  u8"p",       u8"script",     u8"section",  u8"select",
    u8"style",   u8"summary", u8"table",   u8"tbody",      u8"td",       u8"tfoot",
    u8"th",      u8"thead",   u8"title",   u8"tr",         u8"ul",       u8"base",
    u8"noscript", u8"template",
};

/// @brief Every element defined by the HTML standard, plus a few obsolete but common ones.
/// Only these elements are tracked structurally unless `parse-all-html-tags` is enabled.
inline constexpr std::u8string_view known_elements[] {
    u8"a",        u8"abbr",     u8"acronym",  u8"address",  u8"area",     u8"article",
    u8"aside",    u8"audio",    u8"b",        u8"base",     u8"bdi",      u8"bdo",
    u8"big",      u8"blockquote", u8"body",   u8"br",       u8"button",   u8"canvas",
    u8"caption",  u8"center",   u8"cite",     u8"code",     u8"col",      u8"colgroup",
    u8"data",     u8"datalist", u8"dd",       u8"del",      u8"details",  u8"dfn",
    u8"dialog",   u8"div",      u8"dl",       u8"dt",       u8"em",       u8"embed",
    u8"fieldset", u8"figcaption", u8"figure", u8"font",     u8"footer",   u8"form",
    u8"h1",       u8"h2",       u8"h3",       u8"h4",       u8"h5",       u8"h6",
    u8"head",     u8"header",   u8"hgroup",   u8"hr",       u8"html",     u8"i",
    u8"iframe",   u8"img",      u8"input",    u8"ins",      u8"kbd",      u8"label",
    u8"legend",   u8"li",       u8"link",     u8"main",     u8"map",      u8"mark",
    u8"menu",     u8"meta",     u8"meter",    u8"nav",      u8"noscript", u8"object",
    u8"ol",       u8"optgroup", u8"option",   u8"output",   u8"p",        u8"param",
    u8"picture",  u8"pre",      u8"progress", u8"q",        u8"rp",       u8"rt",
    u8"ruby",     u8"s",        u8"samp",     u8"script",   u8"search",   u8"section",
    u8"select",   u8"slot",     u8"small",    u8"source",   u8"span",     u8"strike",
    u8"strong",   u8"style",    u8"sub",      u8"summary",  u8"sup",      u8"svg",
    u8"table",    u8"tbody",    u8"td",       u8"template", u8"textarea", u8"tfoot",
    u8"th",       u8"thead",    u8"time",     u8"title",    u8"tr",       u8"track",
    u8"tt",       u8"u",        u8"ul",       u8"var",      u8"video",    u8"wbr",
};

} // namespace html_tag

namespace detail {

[[nodiscard]]
constexpr bool contains_name(std::span<const std::u8string_view> names, std::u8string_view name)
{
    return std::ranges::find(names, name) != names.end();
}

} // namespace detail

// The following functions expect `name` to be in lower case.

[[nodiscard]]
constexpr bool is_html_void_element(std::u8string_view name)
{
    return detail::contains_name(html_tag::void_elements, name);
}

[[nodiscard]]
constexpr bool is_html_raw_text_element(std::u8string_view name)
{
    return detail::contains_name(html_tag::raw_text_elements, name);
}

[[nodiscard]]
constexpr bool is_html_whitespace_preserving_element(std::u8string_view name)
{
    return detail::contains_name(html_tag::whitespace_preserving_elements, name);
}

[[nodiscard]]
constexpr bool is_html_block_element(std::u8string_view name)
{
    return detail::contains_name(html_tag::block_elements, name);
}

[[nodiscard]]
constexpr bool is_html_known_element(std::u8string_view name)
{
    return detail::contains_name(html_tag::known_elements, name);
}

} // namespace tpp

#endif
