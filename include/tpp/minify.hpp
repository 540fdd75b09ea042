#ifndef TPP_MINIFY_HPP
#define TPP_MINIFY_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "tpp/util/function_ref.hpp"
#include "tpp/util/severity.hpp"

#include "tpp/fwd.hpp"

namespace tpp {

/// @brief Receives problems found while minifying.
/// `begin` and `length` refer to the source that is being minified.
using Minify_Diagnostic_Consumer = Function_Ref<void(
    Severity severity,
    std::u8string_view id,
    std::size_t begin,
    std::size_t length,
    std::u8string_view message
)>;

/// @brief Optional analyses of `minify_javascript`, which are all disabled by default.
struct Javascript_Minify_Options {
    /// @brief Renames variables that are local to a function or block to the shortest names
    /// that are free in their scope.
    /// Top-level declarations and undeclared variables keep their names.
    /// Code that cannot be analyzed reliably, like code using `eval` or `with`,
    /// is left unchanged, which is reported as a `js.rename-skipped` debug diagnostic.
    bool rename_local_variables = false;
    /// @brief Reports statements that rely on automatic semicolon insertion
    /// as `js.missing-semicolon` errors.
    bool require_semicolons = false;
    /// @brief Reports calls of `gettext` whose arguments are anything but string literals
    /// concatenated with `+` as `js.gettext` errors.
    /// Such calls cannot be extracted for translation.
    bool check_gettext = false;
};

/// @brief Minifies JavaScript code.
/// Comments are removed, except for `/*!` comments.
/// Whitespace is removed where this does not change the meaning of the code;
/// line breaks are kept where automatic semicolon insertion may depend on them.
/// The output never contains `{{`, `{%`, or `{#` unless the source contains them within
/// strings, template literals, regular expressions, or `/*!` comments.
/// Minifying the output again yields the same output.
///
/// A comma immediately before `}` is reported as a `js.trailing-comma` error.
/// Unterminated strings, template literals, regular expressions,
/// and comments are reported as `js.unterminated` errors.
/// If an analysis of `options` is enabled, unbalanced brackets are reported as `js.unbalanced`.
/// @param out the minified code is appended to this string
/// @returns `true` iff no errors occurred
bool minify_javascript(
    std::u8string& out,
    std::u8string_view source,
    const Javascript_Minify_Options& options,
    Minify_Diagnostic_Consumer on_diagnostic = {}
);

/// @brief Equivalent to `minify_javascript(out, source, {}, on_diagnostic)`.
bool minify_javascript(
    std::u8string& out,
    std::u8string_view source,
    Minify_Diagnostic_Consumer on_diagnostic = {}
);

/// @brief Minifies CSS code.
/// Comments are removed, except for `/*!` comments,
/// whitespace is removed around `{`, `}`, `;`, `,`, and `>`, after `:` and `(`, and before `)`,
/// and semicolons before `}` are removed.
/// Unterminated strings and comments are reported as `css.unterminated` errors.
/// Minifying the output again yields the same output.
/// @param out the minified code is appended to this string
/// @returns `true` iff no errors occurred
bool minify_css(
    std::u8string& out,
    std::u8string_view source,
    Minify_Diagnostic_Consumer on_diagnostic = {}
);

} // namespace tpp

#endif
