#ifndef TPP_LEX_HPP
#define TPP_LEX_HPP

#include <memory_resource>
#include <string_view>
#include <vector>

#include "tpp/util/function_ref.hpp"
#include "tpp/util/source_position.hpp"

#include "tpp/fwd.hpp"

namespace tpp {

#define TPP_TOKEN_KIND_ENUM_DATA(F)                                                                \
    F(text, "TEXT")                                                                                \
    F(directive_open, "DIRECTIVE-OPEN")                                                            \
    F(directive_inline, "DIRECTIVE-INLINE")                                                        \
    F(directive_close, "DIRECTIVE-CLOSE")                                                          \
    F(expression, "EXPRESSION")                                                                    \
    F(comment, "COMMENT")                                                                          \
    F(option, "OPTION")                                                                            \
    F(raw_begin, "RAW-BEGIN")                                                                      \
    F(raw_text, "RAW-TEXT")                                                                        \
    F(raw_end, "RAW-END")

#define TPP_TOKEN_KIND_ENUMERATOR(id, name) id,

enum struct Token_Kind : Default_Underlying {
    TPP_TOKEN_KIND_ENUM_DATA(TPP_TOKEN_KIND_ENUMERATOR)
};

[[nodiscard]]
std::u8string_view token_kind_name(Token_Kind kind);

struct Token {
    Token_Kind kind;
    /// @brief The span of the whole token, including delimiters.
    Source_Span location;
    /// @brief For directive tokens, the name of the directive.
    /// For `directive_close`, this is the name without the `end` prefix,
    /// i.e. `if` for `{% endif %}`.
    /// Empty for all other tokens.
    std::u8string_view name = {};
    /// @brief The trimmed argument text of directives, expressions, and options.
    /// For `text`, `raw_text`, and `comment`, this is the unmodified body of the token.
    std::u8string_view arguments = {};
};

using Lex_Error_Consumer = Function_Ref<
    void(std::u8string_view id, const Source_Span& location, std::u8string_view message)>;

/// @brief Decides whether a `{% name %}` tag opens a block (`true`)
/// or is an inline directive (`false`).
using Block_Classifier = Function_Ref<bool(std::u8string_view name)>;

/// @brief Splits `source` into tokens, which are appended to `out`.
/// The spans of the emitted tokens partition `source` without gaps or overlaps,
/// even if errors occur.
/// @param is_block Classifies directive names which do not start with `end`.
/// @param on_error Invoked for every lexical error.
/// @param is_opaque Classifies block directives whose content is not lexed, like `comment`.
/// Everything up to the matching closing tag is emitted as a single `text` token.
/// @returns `true` if no errors occurred.
bool lex(
    std::pmr::vector<Token>& out,
    std::u8string_view source,
    Block_Classifier is_block,
    Lex_Error_Consumer on_error,
    Block_Classifier is_opaque = {}
);

} // namespace tpp

#endif
