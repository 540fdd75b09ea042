#ifndef TPP_PARSE_HPP
#define TPP_PARSE_HPP

#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "tpp/util/function_ref.hpp"
#include "tpp/util/source_position.hpp"

#include "tpp/ast.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"

namespace tpp {

using Parse_Error_Consumer = Function_Ref<
    void(std::u8string_view id, const File_Source_Span& location, std::u8string_view message)>;

/// @brief Builds a directive tree from tokens obtained by `lex`.
/// HTML is not interpreted at this stage; literal text is kept in text nodes.
/// @param out the top-level nodes are appended to this vector
/// @param tokens the tokens of `source`
/// @param file the file that `source` belongs to
/// @param registry supplies the branch keywords of block directives and argument shapes
/// @param on_error if not empty, invoked whenever a parse error is encountered
/// @returns `true` iff parsing succeeded without any errors
[[nodiscard]]
bool parse(
    ast::Node_List& out,
    std::span<const Token> tokens,
    std::u8string_view source,
    File_Id file,
    const Directive_Registry& registry,
    Parse_Error_Consumer on_error = {}
);

/// @brief Lexes `source` and, if successful, parses the resulting tokens.
/// Lexical errors are reported through `on_error` as well.
/// @returns `true` iff lexing and parsing succeeded without any errors
[[nodiscard]]
bool parse_and_build(
    ast::Node_List& out,
    std::u8string_view source,
    File_Id file,
    const Directive_Registry& registry,
    Parse_Error_Consumer on_error,
    std::pmr::memory_resource* memory
);

/// @brief Splits directive arguments at whitespace, except for whitespace within quoted strings.
/// For example, `"a b" c'd e'` is split into `"a b"` and `c'd e'`.
void split_arguments(std::vector<std::u8string_view>& out, std::u8string_view arguments);

[[nodiscard]]
std::vector<std::u8string_view> split_arguments(std::u8string_view arguments);

/// @brief Returns the value of `argument` if it is a string or number literal,
/// or `std::nullopt` otherwise (e.g. for variables and filter expressions).
/// String literals are quoted with `"` or `'`, and may contain the escapes `\"`, `\'`, and `\\`.
[[nodiscard]]
std::optional<Literal_Argument> literal_value(std::u8string_view argument);

/// @brief Returns `true` if `argument` begins with a quote that is not properly closed.
[[nodiscard]]
bool has_unterminated_quote(std::u8string_view argument);

} // namespace tpp

#endif
