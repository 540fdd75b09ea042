#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tpp/util/assert.hpp"
#include "tpp/util/chars.hpp"
#include "tpp/util/source_position.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/ast.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"
#include "tpp/lex.hpp"
#include "tpp/parse.hpp"

namespace tpp {
namespace {

[[nodiscard]]
constexpr bool is_quote(char8_t c)
{
    return c == u8'"' || c == u8'\'';
}

/// @brief Returns the length of the quoted string at the start of `str`,
/// including quotes, or zero if the string is not terminated.
[[nodiscard]]
constexpr std::size_t match_quoted(std::u8string_view str)
{
    TPP_DEBUG_ASSERT(!str.empty() && is_quote(str[0]));
    const char8_t quote = str[0];
    for (std::size_t i = 1; i < str.length(); ++i) {
        if (str[i] == u8'\\') {
            ++i;
        }
        else if (str[i] == quote) {
            return i + 1;
        }
    }
    return 0;
}

/// @brief Matches `-?(\d+(\.\d+)?|\.\d+)([eE][+-]?\d+)?`.
[[nodiscard]]
constexpr bool is_number_literal(std::u8string_view str)
{
    std::size_t i = 0;
    const auto digits = [&] {
        const std::size_t start = i;
        while (i < str.length() && is_ascii_digit(str[i])) {
            ++i;
        }
        return i - start;
    };
    if (i < str.length() && (str[i] == u8'-' || str[i] == u8'+')) {
        ++i;
    }
    const std::size_t integer_digits = digits();
    if (i < str.length() && str[i] == u8'.') {
        ++i;
        if (digits() == 0) {
            return false;
        }
    }
    else if (integer_digits == 0) {
        return false;
    }
    if (i < str.length() && (str[i] == u8'e' || str[i] == u8'E')) {
        ++i;
        if (i < str.length() && (str[i] == u8'-' || str[i] == u8'+')) {
            ++i;
        }
        if (digits() == 0) {
            return false;
        }
    }
    return i == str.length();
}

[[nodiscard]]
constexpr File_Source_Span in_file(const Source_Span& span, File_Id file)
{
    return { span, file };
}

struct [[nodiscard]] Parser {
private:
    ast::Node_List& m_out;
    const std::span<const Token> m_tokens;
    const std::u8string_view m_source;
    const File_Id m_file;
    const Directive_Registry& m_registry;
    const Parse_Error_Consumer m_on_error;

    std::size_t m_pos = 0;
    std::vector<std::u8string_view> m_open_names;
    bool m_success = true;

public:
    Parser(
        ast::Node_List& out,
        std::span<const Token> tokens,
        std::u8string_view source,
        File_Id file,
        const Directive_Registry& registry,
        Parse_Error_Consumer on_error
    )
        : m_out { out }
        , m_tokens { tokens }
        , m_source { source }
        , m_file { file }
        , m_registry { registry }
        , m_on_error { on_error }
    {
    }

    bool operator()()
    {
        // Without open blocks, no token ends the sequence.
        parse_sequence(m_out);
        TPP_ASSERT(eof());
        return m_success;
    }

private:
    [[nodiscard]]
    bool eof() const
    {
        return m_pos >= m_tokens.size();
    }

    [[nodiscard]]
    const Token& peek() const
    {
        TPP_ASSERT(!eof());
        return m_tokens[m_pos];
    }

    [[nodiscard]]
    File_Source_Span span_of(const Token& token) const
    {
        return in_file(token.location, m_file);
    }

    void error(std::u8string_view id, const File_Source_Span& location, std::u8string_view message)
    {
        if (m_on_error) {
            m_on_error(id, location, message);
        }
        m_success = false;
    }

    [[nodiscard]]
    bool is_open(std::u8string_view name) const
    {
        return std::ranges::find(m_open_names, name) != m_open_names.end();
    }

    /// @brief Returns `true` if the token ends the current sequence,
    /// i.e. if it is a branch keyword of the innermost open block,
    /// or the closing tag of any open block.
    [[nodiscard]]
    bool ends_sequence(const Token& token) const
    {
        if (m_open_names.empty()) {
            return false;
        }
        if (token.kind == Token_Kind::directive_inline) {
            return m_registry.is_branch_keyword(m_open_names.back(), token.name);
        }
        return token.kind == Token_Kind::directive_close && is_open(token.name);
    }

    void parse_sequence(ast::Node_List& out)
    {
        while (!eof()) {
            const Token& token = peek();
            if (ends_sequence(token)) {
                return;
            }
            parse_token(out);
        }
    }

    void parse_token(ast::Node_List& out)
    {
        const Token& token = peek();
        switch (token.kind) {
        case Token_Kind::text: {
            out.push_back(ast::Node::text(span_of(token), std::u8string { token.arguments }));
            ++m_pos;
            return;
        }
        case Token_Kind::expression: {
            out.push_back(ast::Node::expression(span_of(token), std::u8string { token.arguments }));
            ++m_pos;
            return;
        }
        case Token_Kind::comment: {
            out.push_back(ast::Node::comment(span_of(token), std::u8string { token.arguments }));
            ++m_pos;
            return;
        }
        case Token_Kind::option: {
            out.push_back(ast::Node::option(span_of(token), std::u8string { token.arguments }));
            ++m_pos;
            return;
        }
        case Token_Kind::raw_begin: {
            parse_raw(out);
            return;
        }
        case Token_Kind::raw_text:
        case Token_Kind::raw_end: {
            TPP_ASSERT_UNREACHABLE(u8"Raw text must be preceded by the beginning of a raw block.");
        }
        case Token_Kind::directive_open: {
            parse_block(out);
            return;
        }
        case Token_Kind::directive_inline: {
            ++m_pos;
            if (m_registry.is_any_branch_keyword(token.name) && !m_registry.contains(token.name)) {
                error(
                    diagnostic::parse_branch_misplaced, span_of(token),
                    u8"This branch keyword does not belong to any enclosing block."
                );
                return;
            }
            check_arguments(token);
            out.push_back(ast::Node::inline_directive(
                span_of(token), std::u8string { token.name }, std::u8string { token.arguments }
            ));
            return;
        }
        case Token_Kind::directive_close: {
            ++m_pos;
            error(
                diagnostic::parse_unmatched_close, span_of(token),
                u8"This closing tag does not match any open block."
            );
            return;
        }
        }
        TPP_ASSERT_UNREACHABLE(u8"Invalid token kind.");
    }

    void parse_raw(ast::Node_List& out)
    {
        const Token& begin = peek();
        TPP_ASSERT(begin.kind == Token_Kind::raw_begin);
        ++m_pos;

        std::u8string_view contents;
        Source_Span whole = begin.location;
        if (!eof() && peek().kind == Token_Kind::raw_text) {
            contents = peek().arguments;
            whole = whole.with_length(peek().location.end() - whole.begin);
            ++m_pos;
        }
        if (!eof() && peek().kind == Token_Kind::raw_end) {
            whole = whole.with_length(peek().location.end() - whole.begin);
            ++m_pos;
        }
        out.push_back(ast::Node::raw(in_file(whole, m_file), std::u8string { contents }));
    }

    void parse_block(ast::Node_List& out)
    {
        const Token& open = peek();
        TPP_ASSERT(open.kind == Token_Kind::directive_open);
        ++m_pos;

        const Directive_Entry* const entry = m_registry.find(open.name);
        TPP_ASSERT(entry && entry->block);
        check_arguments(open);

        if (entry->block->ignores_content) {
            parse_ignored_block(out, open);
            return;
        }

        std::vector<ast::Branch> branches;
        branches.push_back({ .keyword = std::u8string { open.name },
                             .arguments = std::u8string { open.arguments },
                             .location = span_of(open),
                             .children = {} });

        m_open_names.push_back(open.name);
        std::optional<File_Source_Span> end_span;
        std::u8string_view end_arguments;
        while (true) {
            parse_sequence(branches.back().children);
            if (eof()) {
                break;
            }
            const Token& token = peek();
            if (token.kind == Token_Kind::directive_close && token.name == open.name) {
                end_span = span_of(token);
                end_arguments = token.arguments;
                ++m_pos;
                break;
            }
            if (token.kind == Token_Kind::directive_inline) {
                TPP_ASSERT(m_registry.is_branch_keyword(open.name, token.name));
                const std::u8string_view exhaustive = entry->block->exhaustive_keyword;
                if (!exhaustive.empty() && branches.back().keyword == exhaustive) {
                    error(
                        diagnostic::parse_branch_misplaced, span_of(token),
                        u8"No further branches may follow the final branch of this block."
                    );
                }
                branches.push_back({ .keyword = std::u8string { token.name },
                                     .arguments = std::u8string { token.arguments },
                                     .location = span_of(token),
                                     .children = {} });
                ++m_pos;
                continue;
            }
            // The closing tag of an enclosing block ends this block prematurely.
            break;
        }
        m_open_names.pop_back();

        if (!end_span) {
            error(
                diagnostic::parse_unmatched_open, span_of(open),
                u8"This block is never closed."
            );
            end_span = span_of(open);
        }
        out.push_back(ast::Node::block_directive(
            span_of(open), std::u8string { open.name }, std::move(branches), *end_span,
            std::u8string { end_arguments }
        ));
    }

    /// @brief Parses a block whose content is not interpreted,
    /// such as `{% comment %}`.
    /// The content ends at the first closing tag with the same name, without nesting.
    void parse_ignored_block(ast::Node_List& out, const Token& open)
    {
        std::size_t close_index = m_pos;
        while (close_index < m_tokens.size()
               && !(m_tokens[close_index].kind == Token_Kind::directive_close
                    && m_tokens[close_index].name == open.name)) {
            ++close_index;
        }
        if (close_index == m_tokens.size()) {
            error(
                diagnostic::parse_unmatched_open, span_of(open),
                u8"This block is never closed."
            );
            m_pos = close_index;
            return;
        }
        const Token& close = m_tokens[close_index];
        const std::size_t content_begin = open.location.end();
        const Source_Position content_position
            = advanced(open.location, m_source.substr(open.location.begin), open.location.length);
        const Source_Span content_span { content_position, close.location.begin - content_begin };

        std::vector<ast::Branch> branches;
        branches.push_back({ .keyword = std::u8string { open.name },
                             .arguments = std::u8string { open.arguments },
                             .location = span_of(open),
                             .children = {} });
        if (!content_span.empty()) {
            branches.back().children.push_back(ast::Node::text(
                in_file(content_span, m_file),
                std::u8string { m_source.substr(content_begin, content_span.length) }
            ));
        }
        out.push_back(ast::Node::block_directive(
            span_of(open), std::u8string { open.name }, std::move(branches), span_of(close),
            std::u8string { close.arguments }
        ));
        m_pos = close_index + 1;
    }

    void check_arguments(const Token& token)
    {
        const Directive_Entry* const entry = m_registry.find(token.name);
        if (!entry || entry->shape == Argument_Shape::opaque) {
            return;
        }
        const std::vector<std::u8string_view> arguments = split_arguments(token.arguments);
        if (arguments.size() < entry->min_arguments || arguments.size() > entry->max_arguments) {
            error(
                diagnostic::parse_arguments, span_of(token),
                u8"Wrong number of arguments for this directive."
            );
            return;
        }
        for (const std::u8string_view argument : arguments) {
            if (has_unterminated_quote(argument)) {
                error(
                    diagnostic::parse_arguments, span_of(token),
                    u8"An argument of this directive contains an unterminated string."
                );
                return;
            }
            if (entry->shape == Argument_Shape::keywords
                && std::ranges::find(entry->keywords, argument) == entry->keywords.end()) {
                error(
                    diagnostic::parse_arguments, span_of(token),
                    u8"An argument of this directive is not one of the permitted keywords."
                );
                return;
            }
        }
    }
};

} // namespace

bool parse(
    ast::Node_List& out,
    std::span<const Token> tokens,
    std::u8string_view source,
    File_Id file,
    const Directive_Registry& registry,
    Parse_Error_Consumer on_error
)
{
    return Parser { out, tokens, source, file, registry, on_error }();
}

bool parse_and_build(
    ast::Node_List& out,
    std::u8string_view source,
    File_Id file,
    const Directive_Registry& registry,
    Parse_Error_Consumer on_error,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<Token> tokens { memory };
    const auto is_block = [&](std::u8string_view name) { return registry.is_block(name); };
    const auto is_opaque = [&](std::u8string_view name) {
        const Directive_Entry* const entry = registry.find(name);
        return entry && entry->block && entry->block->ignores_content;
    };
    const auto on_lex_error
        = [&](std::u8string_view id, const Source_Span& location, std::u8string_view message) {
              if (on_error) {
                  on_error(id, File_Source_Span { location, file }, message);
              }
          };
    if (!lex(tokens, source, is_block, on_lex_error, is_opaque)) {
        return false;
    }
    return parse(out, tokens, source, file, registry, on_error);
}

void split_arguments(std::vector<std::u8string_view>& out, std::u8string_view arguments)
{
    std::size_t i = 0;
    while (true) {
        while (i < arguments.length() && is_html_whitespace(arguments[i])) {
            ++i;
        }
        if (i == arguments.length()) {
            return;
        }
        const std::size_t start = i;
        while (i < arguments.length() && !is_html_whitespace(arguments[i])) {
            if (is_quote(arguments[i])) {
                const std::size_t quoted = match_quoted(arguments.substr(i));
                if (quoted != 0) {
                    i += quoted;
                    continue;
                }
                // An unterminated quote does not protect whitespace.
                while (i < arguments.length() && !is_html_whitespace(arguments[i])) {
                    ++i;
                }
                break;
            }
            ++i;
        }
        out.push_back(arguments.substr(start, i - start));
    }
}

std::vector<std::u8string_view> split_arguments(std::u8string_view arguments)
{
    std::vector<std::u8string_view> result;
    split_arguments(result, arguments);
    return result;
}

bool has_unterminated_quote(std::u8string_view argument)
{
    for (std::size_t i = 0; i < argument.length(); ++i) {
        if (is_quote(argument[i])) {
            const std::size_t quoted = match_quoted(argument.substr(i));
            if (quoted == 0) {
                return true;
            }
            i += quoted - 1;
        }
    }
    return false;
}

std::optional<Literal_Argument> literal_value(std::u8string_view argument)
{
    if (argument.empty()) {
        return {};
    }
    if (is_quote(argument[0])) {
        if (match_quoted(argument) != argument.length()) {
            return {};
        }
        const char8_t quote = argument[0];
        const std::u8string_view body = argument.substr(1, argument.length() - 2);
        std::u8string value;
        value.reserve(body.length());
        for (std::size_t i = 0; i < body.length(); ++i) {
            if (body[i] == u8'\\' && i + 1 < body.length()
                && (body[i + 1] == quote || body[i + 1] == u8'\\')) {
                ++i;
            }
            value.push_back(body[i]);
        }
        return Literal_Argument { Literal_Kind::string, std::move(value) };
    }
    if (is_number_literal(argument)) {
        return Literal_Argument { Literal_Kind::number, std::u8string { argument } };
    }
    return {};
}

} // namespace tpp
