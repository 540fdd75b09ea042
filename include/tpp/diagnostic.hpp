#ifndef TPP_DIAGNOSTIC_HPP
#define TPP_DIAGNOSTIC_HPP

#include <string_view>

#include "tpp/util/severity.hpp"
#include "tpp/util/source_position.hpp"

#include "tpp/fwd.hpp"

namespace tpp {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The span of code that is responsible for this diagnostic.
    File_Source_Span location;
    /// @brief The diagnostic message.
    /// The message is only guaranteed to be valid for the duration of the logger call.
    std::u8string_view message;
};

namespace diagnostic {

// GENERAL DIAGNOSTICS =============================================================================

/// @brief A template file could not be loaded.
inline constexpr std::u8string_view io = u8"io";

/// @brief A `{%`, `{{`, or `{#` tag was not closed on the same line, or it was empty.
inline constexpr std::u8string_view lex_invalid = u8"lex.invalid";

/// @brief A `{% !raw %}` block has no matching `{% !endraw %}`.
inline constexpr std::u8string_view lex_raw_unterminated = u8"lex.raw.unterminated";

/// @brief A block directive was opened but never closed.
inline constexpr std::u8string_view parse_unmatched_open = u8"parse.unmatched.open";

/// @brief A closing directive does not close the innermost open directive.
inline constexpr std::u8string_view parse_unmatched_close = u8"parse.unmatched.close";

/// @brief A branch keyword like `else` appeared outside of a directive that accepts it,
/// or after the exhaustive branch.
inline constexpr std::u8string_view parse_branch_misplaced = u8"parse.branch.misplaced";

/// @brief The arguments of a directive with a declared argument shape are malformed.
inline constexpr std::u8string_view parse_arguments = u8"parse.arguments";

/// @brief An inline directive is not known to the registry.
inline constexpr std::u8string_view directive_unknown = u8"directive.unknown";

/// @brief An `{% ! %}` option override names a flag that does not exist.
inline constexpr std::u8string_view option_unknown = u8"option.unknown";

/// @brief Template inheritance forms a cycle.
inline constexpr std::u8string_view inheritance_cycle = u8"inheritance.cycle";

/// @brief A template referenced by `extends` or `include` could not be loaded.
inline constexpr std::u8string_view inheritance_load = u8"inheritance.load";

// STRUCTURAL DIAGNOSTICS ==========================================================================

/// @brief The render paths of a directive leave different sets of open elements.
inline constexpr std::u8string_view structure_branch_diverge = u8"structure.branch.diverge";

/// @brief A directive inside a tag leaves its branches in different HTML lexer states.
inline constexpr std::u8string_view structure_branch_state = u8"structure.branch.state";

/// @brief A close tag does not match the innermost open element.
inline constexpr std::u8string_view structure_close_mismatch = u8"structure.close.mismatch";

/// @brief A close tag was found with no open element.
inline constexpr std::u8string_view structure_close_stray = u8"structure.close.stray";

/// @brief An element is still open at the end of the template.
inline constexpr std::u8string_view structure_unclosed = u8"structure.unclosed";

/// @brief A tag or attribute name is produced by a directive or expression.
inline constexpr std::u8string_view structure_dynamic_name = u8"structure.dynamic-name";

/// @brief The `html` option was changed in the middle of a tag.
inline constexpr std::u8string_view structure_option = u8"structure.option";

// PASS DIAGNOSTICS ================================================================================

/// @brief Evaluation of a pure directive failed.
inline constexpr std::u8string_view fold_failed = u8"fold.failed";

/// @brief A trailing comma before `}` in JavaScript.
inline constexpr std::u8string_view js_trailing_comma = u8"js.trailing-comma";

/// @brief An unterminated string, template literal, regular expression, or comment in JavaScript.
inline constexpr std::u8string_view js_unterminated = u8"js.unterminated";

/// @brief A bracket in JavaScript without a matching counterpart.
inline constexpr std::u8string_view js_unbalanced = u8"js.unbalanced";

/// @brief A JavaScript statement relies on automatic semicolon insertion.
inline constexpr std::u8string_view js_missing_semicolon = u8"js.missing-semicolon";

/// @brief A call of `gettext` in JavaScript has arguments other than concatenated strings.
inline constexpr std::u8string_view js_gettext = u8"js.gettext";

/// @brief Local JavaScript variables were not renamed because the code cannot be analyzed.
/// This is purely informational.
inline constexpr std::u8string_view js_rename_skipped = u8"js.rename-skipped";

/// @brief An unterminated string or comment in CSS.
inline constexpr std::u8string_view css_unterminated = u8"css.unterminated";

/// @brief An element was not merged or packed.
/// This is purely informational.
inline constexpr std::u8string_view merge_skipped = u8"merge.skipped";

/// @brief External packing was requested, but there is no packer.
inline constexpr std::u8string_view pack_unavailable = u8"pack.unavailable";

/// @brief The asset packer failed to pack a group of scripts or stylesheets.
inline constexpr std::u8string_view pack_failed = u8"pack.failed";

/// @brief The name of an attribute is not a valid HTML attribute name.
inline constexpr std::u8string_view validation_attribute_name = u8"validation.attribute.name";

/// @brief The same attribute appears twice on an element.
inline constexpr std::u8string_view validation_attribute_duplicate
    = u8"validation.attribute.duplicate";

/// @brief An `img` or `area` element has no `alt` attribute.
inline constexpr std::u8string_view validation_alt = u8"validation.alt";

/// @brief An `abbr` or `acronym` element has no `title` attribute.
inline constexpr std::u8string_view validation_title = u8"validation.title";

} // namespace diagnostic

} // namespace tpp

#endif
