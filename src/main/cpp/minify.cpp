#include <algorithm>
#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tpp/util/assert.hpp"
#include "tpp/util/chars.hpp"
#include "tpp/util/result.hpp"

#include "tpp/diagnostic.hpp"
#include "tpp/fwd.hpp"
#include "tpp/minify.hpp"

namespace tpp {
namespace {

[[nodiscard]]
constexpr bool is_js_whitespace(char8_t c)
{
    return c == u8' ' || c == u8'\t' || c == u8'\n' || c == u8'\r' || c == u8'\v' || c == u8'\f';
}

[[nodiscard]]
constexpr bool is_line_break(char8_t c)
{
    return c == u8'\n' || c == u8'\r';
}

/// @brief Keywords after which a `/` starts a regular expression rather than a division.
constexpr std::u8string_view js_regex_keywords[] {
    u8"return", u8"typeof", u8"case",  u8"do",     u8"else",       u8"in",
    u8"of",     u8"new",    u8"delete", u8"void",  u8"instanceof", u8"throw",
    u8"yield",  u8"await",
};

/// @brief Reserved words, which never name a variable.
constexpr std::u8string_view js_keywords[] {
    u8"await",  u8"break",   u8"case",     u8"catch",  u8"class",      u8"const",  u8"continue",
    u8"debugger", u8"default", u8"delete", u8"do",     u8"else",       u8"enum",   u8"export",
    u8"extends", u8"false",  u8"finally",  u8"for",    u8"function",   u8"if",     u8"import",
    u8"in",     u8"instanceof", u8"let",   u8"new",    u8"null",       u8"return", u8"super",
    u8"switch", u8"this",    u8"throw",    u8"true",   u8"try",        u8"typeof", u8"var",
    u8"void",   u8"while",   u8"with",     u8"yield",
};

/// @brief Keywords that are complete operands by themselves.
constexpr std::u8string_view js_operand_keywords[] {
    u8"this", u8"true", u8"false", u8"null", u8"super",
};

/// @brief Keywords that join two operands.
constexpr std::u8string_view js_binary_keywords[] {
    u8"in", u8"instanceof", u8"extends",
};

/// @brief Keywords that are followed by an optional `(...)` and an optional `{...}`.
constexpr std::u8string_view js_compound_keywords[] {
    u8"for", u8"if", u8"switch", u8"function", u8"try", u8"catch", u8"while", u8"with",
};

/// @brief Words that modify the following member name, as in `get x() {}`.
constexpr std::u8string_view js_member_modifiers[] {
    u8"get", u8"set", u8"static", u8"async",
};

enum struct Js_Token_Kind : Default_Underlying {
    word,
    number,
    string,
    template_literal,
    regex,
    punctuator,
};

struct Js_Token {
    Js_Token_Kind kind;
    std::size_t begin;
    std::u8string_view text;
    /// @brief Whitespace or comments precede this token.
    bool gap_before = false;
    /// @brief The whitespace or comments preceding this token contain a line break.
    bool line_break_before = false;
    /// @brief If not empty, this is printed instead of `text`.
    std::u8string_view replacement = {};

    [[nodiscard]]
    std::u8string_view output() const
    {
        return replacement.empty() ? text : replacement;
    }

    [[nodiscard]]
    bool is_operand() const
    {
        return kind != Js_Token_Kind::punctuator;
    }

    [[nodiscard]]
    bool is_punctuator(std::u8string_view punctuator) const
    {
        return kind == Js_Token_Kind::punctuator && text == punctuator;
    }

    [[nodiscard]]
    bool is_word(std::u8string_view word) const
    {
        return kind == Js_Token_Kind::word && text == word;
    }

    [[nodiscard]]
    bool is_keyword() const
    {
        return kind == Js_Token_Kind::word && std::ranges::contains(js_keywords, text);
    }

    [[nodiscard]]
    bool is_variable() const
    {
        return kind == Js_Token_Kind::word && !is_keyword();
    }

    [[nodiscard]]
    bool is_declaration_keyword() const
    {
        return is_word(u8"var") || is_word(u8"let") || is_word(u8"const");
    }

    [[nodiscard]]
    bool is_opening_bracket() const
    {
        return is_punctuator(u8"(") || is_punctuator(u8"[") || is_punctuator(u8"{");
    }

    [[nodiscard]]
    bool is_closing_bracket() const
    {
        return is_punctuator(u8")") || is_punctuator(u8"]") || is_punctuator(u8"}");
    }

    /// @brief Returns `true` if a statement can end with this token.
    [[nodiscard]]
    bool can_end_statement() const
    {
        return is_operand() || text == u8")" || text == u8"]" || text == u8"}" || text == u8"++"
            || text == u8"--";
    }

    /// @brief Returns `true` if a statement can begin with this token.
    [[nodiscard]]
    bool can_begin_statement() const
    {
        if (is_operand()) {
            return true;
        }
        constexpr std::u8string_view punctuators[] {
            u8"(", u8"[", u8"{", u8"+", u8"-", u8"++", u8"--", u8"!", u8"~",
        };
        return std::ranges::contains(punctuators, text);
    }
};

/// @brief A `/*!` comment, which is kept in front of the token at index `next_token`.
struct Js_Kept_Comment {
    std::size_t next_token;
    std::u8string_view text;
};

struct Js_Code {
    std::vector<Js_Token> tokens;
    std::vector<Js_Kept_Comment> comments;
};

/// @brief Returns the index one past the end of the string literal starting at `begin`,
/// or `std::u8string_view::npos` if it is unterminated.
[[nodiscard]]
std::size_t match_string(std::u8string_view source, std::size_t begin)
{
    const char8_t quote = source[begin];
    for (std::size_t i = begin + 1; i < source.size(); ++i) {
        const char8_t c = source[i];
        if (c == u8'\\') {
            ++i;
            continue;
        }
        if (c == quote) {
            return i + 1;
        }
        if (is_line_break(c)) {
            return std::u8string_view::npos;
        }
    }
    return std::u8string_view::npos;
}

/// @brief Returns the index one past the end of the template literal starting at `begin`,
/// or `std::u8string_view::npos` if it is unterminated.
/// Substitutions may contain nested strings and template literals.
[[nodiscard]]
std::size_t match_template_literal(std::u8string_view source, std::size_t begin)
{
    TPP_DEBUG_ASSERT(source[begin] == u8'`');
    std::size_t i = begin + 1;
    while (i < source.size()) {
        const char8_t c = source[i];
        if (c == u8'\\') {
            i += 2;
            continue;
        }
        if (c == u8'`') {
            return i + 1;
        }
        if (c != u8'$' || i + 1 >= source.size() || source[i + 1] != u8'{') {
            ++i;
            continue;
        }
        i += 2;
        std::size_t depth = 1;
        while (depth != 0) {
            if (i >= source.size()) {
                return std::u8string_view::npos;
            }
            switch (source[i]) {
            case u8'{':
                ++depth;
                ++i;
                break;
            case u8'}':
                --depth;
                ++i;
                break;
            case u8'\'':
            case u8'"': i = match_string(source, i); break;
            case u8'`': i = match_template_literal(source, i); break;
            default: ++i; break;
            }
            if (i == std::u8string_view::npos) {
                return i;
            }
        }
    }
    return std::u8string_view::npos;
}

/// @brief Returns the index one past the end of the regular expression literal
/// (including its flags) starting at `begin`,
/// or `std::u8string_view::npos` if it is unterminated.
[[nodiscard]]
std::size_t match_regex(std::u8string_view source, std::size_t begin)
{
    TPP_DEBUG_ASSERT(source[begin] == u8'/');
    bool in_class = false;
    for (std::size_t i = begin + 1; i < source.size(); ++i) {
        const char8_t c = source[i];
        if (is_line_break(c)) {
            return std::u8string_view::npos;
        }
        if (c == u8'\\') {
            ++i;
        }
        else if (c == u8'[') {
            in_class = true;
        }
        else if (c == u8']') {
            in_class = false;
        }
        else if (c == u8'/' && !in_class) {
            ++i;
            while (i < source.size() && is_word_character(source[i])) {
                ++i;
            }
            return i;
        }
    }
    return std::u8string_view::npos;
}

[[nodiscard]]
std::size_t match_number(std::u8string_view source, std::size_t begin)
{
    std::size_t i = begin;
    while (i < source.size()) {
        const char8_t c = source[i];
        if (is_word_character(c) || c == u8'.') {
            ++i;
            continue;
        }
        const char8_t previous = source[i - 1];
        if ((c == u8'+' || c == u8'-') && (previous == u8'e' || previous == u8'E')
            && i + 1 < source.size() && is_ascii_digit(source[i + 1])) {
            ++i;
            continue;
        }
        break;
    }
    return i;
}

[[nodiscard]]
std::size_t match_word(std::u8string_view source, std::size_t begin)
{
    std::size_t i = begin;
    while (i < source.size() && (is_word_character(source[i]) || source[i] == u8'\\')) {
        ++i;
    }
    return i;
}

/// @brief Returns `true` if `c` ends the output and a token beginning with `next`
/// would stick to it and begin a template tag.
[[nodiscard]]
constexpr bool forms_template_tag(char8_t c, char8_t next)
{
    return c == u8'{' && (next == u8'{' || next == u8'%' || next == u8'#');
}

void diagnose(
    Minify_Diagnostic_Consumer on_diagnostic,
    Severity severity,
    std::u8string_view id,
    std::size_t begin,
    std::size_t length,
    std::u8string_view message
)
{
    if (on_diagnostic) {
        on_diagnostic(severity, id, begin, length, message);
    }
}

/// @brief Splits JavaScript code into tokens, dropping whitespace and comments.
/// Lexing stops at the first unterminated literal or comment.
struct [[nodiscard]] Javascript_Lexer {
private:
    Js_Code& m_out;
    const std::u8string_view m_source;
    Minify_Diagnostic_Consumer m_on_diagnostic;

    std::size_t m_pos = 0;
    // Whitespace or comments were skipped since the previous token.
    bool m_gap = false;
    bool m_gap_has_line_break = false;
    bool m_success = true;

public:
    Javascript_Lexer(
        Js_Code& out,
        std::u8string_view source,
        Minify_Diagnostic_Consumer on_diagnostic
    )
        : m_out { out }
        , m_source { source }
        , m_on_diagnostic { on_diagnostic }
    {
    }

    bool operator()()
    {
        while (m_pos < m_source.size()) {
            if (!step()) {
                m_success = false;
                break;
            }
        }
        return m_success;
    }

    /// @brief Returns the position at which lexing stopped.
    [[nodiscard]]
    std::size_t position() const
    {
        return m_pos;
    }

private:
    [[nodiscard]]
    bool peek(std::u8string_view str) const
    {
        return m_source.substr(m_pos).starts_with(str);
    }

    [[nodiscard]]
    const Js_Token* previous() const
    {
        return m_out.tokens.empty() ? nullptr : &m_out.tokens.back();
    }

    [[nodiscard]]
    bool unterminated(std::u8string_view message)
    {
        diagnose(
            m_on_diagnostic, Severity::error, diagnostic::js_unterminated, m_pos,
            m_source.size() - m_pos, message
        );
        return false;
    }

    [[nodiscard]]
    bool is_regex_allowed() const
    {
        const Js_Token* const previous = this->previous();
        if (!previous) {
            return true;
        }
        switch (previous->kind) {
        case Js_Token_Kind::word: return std::ranges::contains(js_regex_keywords, previous->text);
        // A closing brace usually ends a block rather than an object literal.
        case Js_Token_Kind::punctuator:
            return previous->text == u8"}" || !previous->can_end_statement();
        default: return false;
        }
    }

    [[nodiscard]]
    bool step()
    {
        const char8_t c = m_source[m_pos];
        if (is_js_whitespace(c)) {
            m_gap = true;
            m_gap_has_line_break |= is_line_break(c);
            ++m_pos;
            return true;
        }
        if (peek(u8"//")) {
            m_gap = true;
            while (m_pos < m_source.size() && !is_line_break(m_source[m_pos])) {
                ++m_pos;
            }
            return true;
        }
        if (peek(u8"/*")) {
            return consume_block_comment();
        }
        if (c == u8'\'' || c == u8'"') {
            const std::size_t end = match_string(m_source, m_pos);
            if (end == std::u8string_view::npos) {
                return unterminated(u8"Unterminated string literal.");
            }
            emit(Js_Token_Kind::string, end);
            return true;
        }
        if (c == u8'`') {
            const std::size_t end = match_template_literal(m_source, m_pos);
            if (end == std::u8string_view::npos) {
                return unterminated(u8"Unterminated template literal.");
            }
            emit(Js_Token_Kind::template_literal, end);
            return true;
        }
        if (c == u8'/' && is_regex_allowed()) {
            const std::size_t end = match_regex(m_source, m_pos);
            if (end == std::u8string_view::npos) {
                return unterminated(u8"Unterminated regular expression literal.");
            }
            emit(Js_Token_Kind::regex, end);
            return true;
        }
        if (is_ascii_digit(c)
            || (c == u8'.' && m_pos + 1 < m_source.size() && is_ascii_digit(m_source[m_pos + 1]))) {
            emit(Js_Token_Kind::number, match_number(m_source, m_pos));
            return true;
        }
        if (is_word_character(c) || c == u8'\\') {
            emit(Js_Token_Kind::word, match_word(m_source, m_pos));
            return true;
        }
        // Increment and decrement are the only punctuators that need to be recognized as a whole
        // because they decide whether a following slash is a division.
        const bool is_double = peek(u8"++") || peek(u8"--");
        emit(Js_Token_Kind::punctuator, m_pos + (is_double ? 2 : 1));
        return true;
    }

    [[nodiscard]]
    bool consume_block_comment()
    {
        const std::size_t end = m_source.find(u8"*/", m_pos + 2);
        if (end == std::u8string_view::npos) {
            return unterminated(u8"Unterminated block comment.");
        }
        const std::u8string_view comment = m_source.substr(m_pos, end + 2 - m_pos);
        m_gap = true;
        m_gap_has_line_break |= comment.find_first_of(u8"\r\n") != std::u8string_view::npos;
        if (comment.starts_with(u8"/*!")) {
            m_out.comments.push_back({ .next_token = m_out.tokens.size(), .text = comment });
        }
        m_pos = end + 2;
        return true;
    }

    void emit(Js_Token_Kind kind, std::size_t end)
    {
        const Js_Token token { .kind = kind,
                               .begin = m_pos,
                               .text = m_source.substr(m_pos, end - m_pos),
                               .gap_before = m_gap,
                               .line_break_before = m_gap_has_line_break };
        TPP_DEBUG_ASSERT(!token.text.empty());

        const Js_Token* const previous = this->previous();
        if (previous && token.is_punctuator(u8"}") && previous->is_punctuator(u8",")) {
            diagnose(
                m_on_diagnostic, Severity::error, diagnostic::js_trailing_comma, previous->begin, 1,
                u8"Trailing comma before '}'. Old browsers reject this."
            );
            m_success = false;
        }

        m_out.tokens.push_back(token);
        m_gap = false;
        m_gap_has_line_break = false;
        m_pos = end;
    }
};

/// @brief Appends what separates `previous` and `token` in the output, if anything.
void print_separator(std::u8string& out, const Js_Token& previous, const Js_Token& token)
{
    if (token.line_break_before && previous.can_end_statement() && token.can_begin_statement()) {
        out += u8'\n';
        return;
    }
    if (out.empty()) {
        return;
    }
    const char8_t last = out.back();
    const char8_t next = token.output().front();
    const bool needs_space = (is_word_character(last) && is_word_character(next))
        || (previous.kind == Js_Token_Kind::number && next == u8'.')
        || (last == u8'+' && next == u8'+') //
        || (last == u8'-' && next == u8'-') //
        || (last == u8'/' && (next == u8'/' || next == u8'*'))
        || (last == u8'<' && next == u8'!') //
        || forms_template_tag(last, next);
    if (needs_space) {
        out += u8' ';
    }
}

void print_javascript(std::u8string& out, const Js_Code& code)
{
    std::size_t next_comment = 0;
    const auto print_comments_before = [&](std::size_t token_index) {
        for (; next_comment < code.comments.size()
             && code.comments[next_comment].next_token <= token_index;
             ++next_comment) {
            if (!out.empty() && out.back() == u8'/') {
                out += u8' ';
            }
            out += code.comments[next_comment].text;
        }
    };

    for (std::size_t i = 0; i < code.tokens.size(); ++i) {
        print_comments_before(i);
        const Js_Token& token = code.tokens[i];
        if (i != 0 && token.gap_before) {
            print_separator(out, code.tokens[i - 1], token);
        }
        out += token.output();
    }
    print_comments_before(code.tokens.size());
}

[[nodiscard]]
bool brackets_match(const Js_Token& open, const Js_Token& close)
{
    return (open.text == u8"(" && close.text == u8")")
        || (open.text == u8"[" && close.text == u8"]")
        || (open.text == u8"{" && close.text == u8"}");
}

/// @brief Matches the brackets in `tokens`.
/// @returns For each opening bracket, the index of its closing bracket,
/// and `std::u8string_view::npos` for every other token.
/// If the brackets are not balanced, the index of the first offending bracket.
[[nodiscard]]
Result<std::vector<std::size_t>, std::size_t> match_brackets(std::span<const Js_Token> tokens)
{
    std::vector<std::size_t> closing(tokens.size(), std::u8string_view::npos);
    std::vector<std::size_t> open;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].is_opening_bracket()) {
            open.push_back(i);
        }
        else if (tokens[i].is_closing_bracket()) {
            if (open.empty() || !brackets_match(tokens[open.back()], tokens[i])) {
                return { error_tag, i };
            }
            closing[open.back()] = i;
            open.pop_back();
        }
    }
    if (!open.empty()) {
        return { error_tag, open.back() };
    }
    return closing;
}

/// @brief Navigates a token sequence whose brackets are balanced.
/// A bracket pair with its content counts as a single node,
/// so the children of a pair are the tokens and pairs directly within it.
struct Js_Tree {
    std::span<Js_Token> tokens;
    std::span<const std::size_t> closing;

    /// @brief Returns the index of the node after the node at `i`.
    [[nodiscard]]
    std::size_t next(std::size_t i) const
    {
        return closing[i] != std::u8string_view::npos ? closing[i] + 1 : i + 1;
    }

    [[nodiscard]]
    std::vector<std::size_t> children(std::size_t begin, std::size_t end) const
    {
        std::vector<std::size_t> result;
        for (std::size_t i = begin; i < end; i = next(i)) {
            result.push_back(i);
        }
        return result;
    }
};

/// @brief Finds statements that rely on automatic semicolon insertion
/// and calls of `gettext` that extractors of translatable strings cannot read.
///
/// The semicolon rules are heuristic:
/// a variable or literal directly following a complete operand or a `(...)` or `[...]`
/// within the same block is assumed to begin a new statement,
/// and so is a keyword like `var` or `return` following one.
struct [[nodiscard]] Javascript_Validator {
private:
    Js_Tree m_tree;
    Minify_Diagnostic_Consumer m_on_diagnostic;

public:
    Javascript_Validator(Js_Tree tree, Minify_Diagnostic_Consumer on_diagnostic)
        : m_tree { tree }
        , m_on_diagnostic { on_diagnostic }
    {
    }

    bool check_semicolons()
    {
        bool success = check_statements(0, m_tree.tokens.size());
        for (std::size_t i = 0; i < m_tree.tokens.size(); ++i) {
            if (m_tree.tokens[i].is_punctuator(u8"{")
                && !check_statements(i + 1, m_tree.closing[i])) {
                success = false;
            }
        }
        return success;
    }

    bool check_gettext()
    {
        bool success = check_gettext_calls(0, m_tree.tokens.size());
        for (std::size_t i = 0; i < m_tree.tokens.size(); ++i) {
            if (m_tree.tokens[i].is_opening_bracket()
                && !check_gettext_calls(i + 1, m_tree.closing[i])) {
                success = false;
            }
        }
        return success;
    }

private:
    [[nodiscard]]
    const Js_Token& token(std::size_t i) const
    {
        return m_tree.tokens[i];
    }

    [[nodiscard]]
    bool error(std::u8string_view id, const Js_Token& at, std::u8string_view message) const
    {
        diagnose(m_on_diagnostic, Severity::error, id, at.begin, at.text.size(), message);
        return false;
    }

    [[nodiscard]]
    bool missing_semicolon(const Js_Token& at) const
    {
        return error(
            diagnostic::js_missing_semicolon, at, u8"Missing semicolon before this token."
        );
    }

    /// @brief Checks the statements within a block or at the top level.
    /// Only the first problem is reported.
    [[nodiscard]]
    bool check_statements(std::size_t begin, std::size_t end) const
    {
        const std::vector<std::size_t> nodes = m_tree.children(begin, end);
        const auto is_next = [&](std::size_t k, std::u8string_view punctuator) {
            return k + 1 < nodes.size() && token(nodes[k + 1]).is_punctuator(punctuator);
        };

        // The previous tokens form an expression that a semicolon would have to end.
        bool required = false;
        for (std::size_t k = 0; k < nodes.size(); ++k) {
            const Js_Token& current = token(nodes[k]);
            const Js_Token* const previous = k == 0 ? nullptr : &token(nodes[k - 1]);

            if (current.kind == Js_Token_Kind::word
                && std::ranges::contains(js_compound_keywords, current.text)) {
                if (required) {
                    return missing_semicolon(current);
                }
                // An assigned function expression needs a semicolon after its body.
                required = current.is_word(u8"function") && previous
                    && previous->is_punctuator(u8"=");
                if (current.is_word(u8"function")) {
                    if (is_next(k, u8"*")) {
                        ++k;
                    }
                    if (k + 1 < nodes.size() && token(nodes[k + 1]).is_variable()) {
                        ++k;
                    }
                }
                if (is_next(k, u8"(")) {
                    ++k;
                }
                if (is_next(k, u8"{")) {
                    ++k;
                }
                continue;
            }
            if (current.is_declaration_keyword()) {
                if (required) {
                    return missing_semicolon(current);
                }
                required = false;
                continue;
            }
            if (current.kind == Js_Token_Kind::word
                && std::ranges::contains(js_member_modifiers, current.text)
                && k + 1 < nodes.size()
                && (token(nodes[k + 1]).kind == Js_Token_Kind::word || is_next(k, u8"[")
                    || is_next(k, u8"*"))) {
                continue;
            }
            if (current.kind == Js_Token_Kind::punctuator) {
                required = current.is_punctuator(u8"(") || current.is_punctuator(u8"[");
                continue;
            }
            if (current.is_keyword()) {
                if (std::ranges::contains(js_binary_keywords, current.text)) {
                    required = false;
                    continue;
                }
                if (required) {
                    return missing_semicolon(current);
                }
                required = std::ranges::contains(js_operand_keywords, current.text);
                continue;
            }
            if (current.kind == Js_Token_Kind::template_literal
                || current.kind == Js_Token_Kind::regex) {
                // A template literal directly after an operand is a tagged template.
                required = true;
                continue;
            }
            if (required) {
                return missing_semicolon(current);
            }
            required = true;
        }
        return true;
    }

    [[nodiscard]]
    bool check_gettext_calls(std::size_t begin, std::size_t end) const
    {
        bool success = true;
        std::size_t previous = std::u8string_view::npos;
        for (std::size_t i = begin; i < end; previous = i, i = m_tree.next(i)) {
            if (!token(i).is_word(u8"gettext") || i + 1 >= end
                || !token(i + 1).is_punctuator(u8"(")) {
                continue;
            }
            if (previous != std::u8string_view::npos
                && (token(previous).is_punctuator(u8".")
                    || token(previous).is_word(u8"function"))) {
                continue;
            }
            if (!check_gettext_arguments(i + 1)) {
                success = false;
            }
        }
        return success;
    }

    /// @brief Checks that the arguments are string literals joined by `+`.
    [[nodiscard]]
    bool check_gettext_arguments(std::size_t open) const
    {
        constexpr std::u8string_view message = u8"Unexpected token inside gettext(...).";
        const std::size_t close = m_tree.closing[open];
        std::size_t count = 0;
        for (std::size_t i = open + 1; i < close; i = m_tree.next(i), ++count) {
            const bool valid = count % 2 == 0 ? token(i).kind == Js_Token_Kind::string
                                              : token(i).is_punctuator(u8"+");
            if (!valid) {
                return error(diagnostic::js_gettext, token(i), message);
            }
        }
        if (count != 0 && count % 2 == 0) {
            return error(diagnostic::js_gettext, token(close), message);
        }
        return true;
    }
};

/// @brief Returns the `index`-th generated variable name: `a`, ..., `z`, `aa`, `ab`, ...
[[nodiscard]]
std::u8string generated_name(std::size_t index)
{
    std::u8string result;
    ++index;
    while (index != 0) {
        --index;
        result.insert(result.begin(), char8_t(u8'a' + index % 26));
        index /= 26;
    }
    return result;
}

struct Js_Symbol {
    std::u8string_view name;
    /// @brief The indices of all tokens that name this variable, including its declarations.
    std::vector<std::size_t> references;
    /// @brief The variable keeps its name,
    /// for example because it is also used as a shorthand property.
    bool fixed = false;
    std::u8string new_name;
};

struct Js_Scope {
    /// @brief The index of the enclosing scope, or `npos` for the top level.
    std::size_t parent;
    /// @brief `true` for function bodies and the top level,
    /// which are the scopes of `var` declarations.
    bool is_function;
    std::map<std::u8string_view, std::size_t> symbols;
    /// @brief The indices of the symbols in declaration order.
    std::vector<std::size_t> declaration_order;
    std::vector<std::size_t> children;
};

/// @brief Renames local variables to the shortest free names.
///
/// A variable is local if it is declared with `var`, `let`, or `const`, or as a named function
/// or function parameter, within some function or block.
/// Top-level declarations are global and keep their names,
/// and so does every variable that is not declared anywhere.
/// Property names after `.` and object keys before `:` are not variable references.
///
/// Code that cannot be analyzed reliably is left untouched.
/// This includes code using `eval`, `with`, classes, modules, template literal substitutions,
/// destructuring declarations, or parameter lists with anything other than plain names.
struct [[nodiscard]] Variable_Renamer {
private:
    static constexpr std::size_t npos = std::u8string_view::npos;

    Js_Tree m_tree;
    Minify_Diagnostic_Consumer m_on_diagnostic;

    std::vector<Js_Scope> m_scopes;
    std::vector<Js_Symbol> m_symbols;
    /// @brief For each token, the symbol it refers to, or `npos`.
    std::vector<std::size_t> m_symbol_of;
    /// @brief For each `{` token, the scope it opens.
    std::vector<std::size_t> m_scope_of;
    /// @brief Maps the `{` of function bodies to the indices of their parameters.
    std::map<std::size_t, std::vector<std::size_t>> m_parameters;
    /// @brief Names that must not be used for renamed variables.
    std::set<std::u8string_view> m_taken_names;
    std::u8string_view m_unsupported;

public:
    Variable_Renamer(Js_Tree tree, Minify_Diagnostic_Consumer on_diagnostic)
        : m_tree { tree }
        , m_on_diagnostic { on_diagnostic }
        , m_symbol_of(tree.tokens.size(), npos)
        , m_scope_of(tree.tokens.size(), npos)
    {
    }

    Variable_Renamer(const Variable_Renamer&) = delete;
    Variable_Renamer& operator=(const Variable_Renamer&) = delete;

    /// @brief Sets the replacements of the renamed tokens.
    /// The replacements refer to strings owned by this object.
    void operator()()
    {
        if (const std::u8string_view reason = unsupported_construct(); !reason.empty()) {
            skip(reason);
            return;
        }
        m_scopes.push_back({ .parent = npos, .is_function = true });
        find_declarations(0, m_tree.tokens.size(), 0);
        if (!m_unsupported.empty()) {
            skip(m_unsupported);
            return;
        }
        link_references(0, m_tree.tokens.size(), 0, false);

        m_taken_names.insert(std::begin(js_keywords), std::end(js_keywords));
        for (const Js_Symbol& symbol : m_symbols) {
            if (symbol.fixed) {
                m_taken_names.insert(symbol.name);
            }
        }
        assign_names(0, m_taken_names);

        for (const Js_Symbol& symbol : m_symbols) {
            if (symbol.fixed || symbol.new_name == symbol.name) {
                continue;
            }
            for (const std::size_t reference : symbol.references) {
                m_tree.tokens[reference].replacement = symbol.new_name;
            }
        }
    }

private:
    void skip(std::u8string_view reason) const
    {
        std::u8string message = u8"Local variables are not renamed because the code uses ";
        message += reason;
        message += u8'.';
        diagnose(
            m_on_diagnostic, Severity::debug, diagnostic::js_rename_skipped, 0, 0, message
        );
    }

    [[nodiscard]]
    std::u8string_view unsupported_construct() const
    {
        for (const Js_Token& token : m_tree.tokens) {
            if (token.kind == Js_Token_Kind::template_literal && token.text.contains(u8"${")) {
                return u8"template literal substitutions";
            }
            if (token.is_word(u8"eval") || token.is_word(u8"with") || token.is_word(u8"class")
                || token.is_word(u8"import") || token.is_word(u8"export")) {
                return token.text;
            }
        }
        return {};
    }

    [[nodiscard]]
    const Js_Token& token(std::size_t i) const
    {
        return m_tree.tokens[i];
    }

    [[nodiscard]]
    std::size_t function_scope(std::size_t scope) const
    {
        while (!m_scopes[scope].is_function) {
            scope = m_scopes[scope].parent;
        }
        return scope;
    }

    void declare(std::size_t scope, std::size_t token_index)
    {
        if (scope == 0) {
            return;
        }
        const std::u8string_view name = token(token_index).text;
        Js_Scope& target = m_scopes[scope];
        const auto [it, inserted] = target.symbols.try_emplace(name, m_symbols.size());
        if (inserted) {
            m_symbols.push_back({ .name = name });
            target.declaration_order.push_back(it->second);
        }
        m_symbols[it->second].references.push_back(token_index);
        m_symbol_of[token_index] = it->second;
    }

    /// @brief Remembers the parameters of the function whose `function` keyword is at `i`,
    /// so that they can be declared once its body is reached.
    void bind_parameters(std::size_t i, std::size_t end)
    {
        std::size_t j = m_tree.next(i);
        if (j < end && token(j).is_punctuator(u8"*")) {
            j = m_tree.next(j);
        }
        if (j < end && token(j).is_variable()) {
            j = m_tree.next(j);
        }
        if (j >= end || !token(j).is_punctuator(u8"(")) {
            return;
        }
        const std::size_t body = m_tree.next(j);
        if (body >= end || !token(body).is_punctuator(u8"{")) {
            return;
        }
        std::vector<std::size_t>& parameters = m_parameters[body];
        const std::vector<std::size_t> nodes = m_tree.children(j + 1, m_tree.closing[j]);
        for (std::size_t k = 0; k < nodes.size(); ++k) {
            const bool valid = k % 2 == 0 ? token(nodes[k]).is_variable()
                                          : token(nodes[k]).is_punctuator(u8",");
            if (!valid) {
                m_unsupported = u8"a complex parameter list";
                return;
            }
            if (k % 2 == 0) {
                parameters.push_back(nodes[k]);
            }
        }
    }

    [[nodiscard]]
    std::size_t open_scope(std::size_t brace, std::size_t parent)
    {
        const auto parameters = m_parameters.find(brace);
        const std::size_t result = m_scopes.size();
        m_scopes.push_back({ .parent = parent, .is_function = parameters != m_parameters.end() });
        m_scopes[parent].children.push_back(result);
        m_scope_of[brace] = result;
        if (parameters != m_parameters.end()) {
            for (const std::size_t parameter : parameters->second) {
                declare(result, parameter);
            }
        }
        return result;
    }

    void find_declarations(std::size_t begin, std::size_t end, std::size_t scope)
    {
        // The next variable name is declared in `name_scope`.
        bool expect_name = false;
        std::size_t name_scope = scope;
        // Within a `var`, `let`, or `const` statement, whose names are declared in `list_scope`.
        bool in_declaration = false;
        std::size_t list_scope = scope;

        for (std::size_t i = begin; i < end; i = m_tree.next(i)) {
            const Js_Token& current = token(i);
            if (current.is_word(u8"function")) {
                expect_name = true;
                name_scope = function_scope(scope);
                bind_parameters(i, end);
                continue;
            }
            if (current.is_declaration_keyword()) {
                const std::size_t after = m_tree.next(i);
                if (after < end
                    && (token(after).is_punctuator(u8"{") || token(after).is_punctuator(u8"["))) {
                    m_unsupported = u8"destructuring";
                }
                expect_name = true;
                in_declaration = true;
                list_scope = current.is_word(u8"var") ? function_scope(scope) : scope;
                name_scope = list_scope;
                continue;
            }
            if (expect_name && current.is_variable()) {
                declare(name_scope, i);
                expect_name = false;
                continue;
            }
            expect_name = false;
            if (in_declaration) {
                if (current.is_punctuator(u8",")) {
                    expect_name = true;
                    name_scope = list_scope;
                    continue;
                }
                const bool statement_ends = current.is_punctuator(u8";")
                    || (current.line_break_before && token(i - 1).can_end_statement()
                        && current.can_begin_statement());
                if (statement_ends) {
                    in_declaration = false;
                }
            }
            if (current.is_punctuator(u8"{")) {
                const std::size_t block = open_scope(i, scope);
                find_declarations(i + 1, m_tree.closing[i], block);
            }
            else if (current.is_opening_bracket()) {
                find_declarations(i + 1, m_tree.closing[i], scope);
            }
        }
    }

    [[nodiscard]]
    std::optional<std::size_t> lookup(std::size_t scope, std::u8string_view name) const
    {
        for (; scope != npos; scope = m_scopes[scope].parent) {
            const auto it = m_scopes[scope].symbols.find(name);
            if (it != m_scopes[scope].symbols.end()) {
                return it->second;
            }
        }
        return {};
    }

    void link_references(std::size_t begin, std::size_t end, std::size_t scope, bool in_braces)
    {
        std::size_t before = npos;
        std::size_t before_that = npos;
        for (std::size_t i = begin; i < end; before_that = before, before = i, i = m_tree.next(i)) {
            const Js_Token& current = token(i);
            if (current.is_punctuator(u8"{")) {
                link_references(i + 1, m_tree.closing[i], m_scope_of[i], true);
                continue;
            }
            if (current.is_opening_bracket()) {
                link_references(i + 1, m_tree.closing[i], scope, false);
                continue;
            }
            if (!current.is_variable() || m_symbol_of[i] != npos) {
                continue;
            }
            const Js_Token* const previous = before == npos ? nullptr : &token(before);
            const Js_Token* const spread = before_that == npos ? nullptr : &token(before_that);
            const std::size_t after = m_tree.next(i);
            const Js_Token* const next = after < end ? &token(after) : nullptr;

            const bool is_spread = previous && previous->is_punctuator(u8".") && spread
                && spread->is_punctuator(u8".");
            if (previous && !is_spread
                && (previous->is_punctuator(u8".") || previous->is_word(u8"break")
                    || previous->is_word(u8"continue"))) {
                continue;
            }
            const bool starts_item = !previous || previous->is_punctuator(u8"{")
                || previous->is_punctuator(u8",") || previous->is_punctuator(u8";");
            if (next && next->is_punctuator(u8":") && starts_item) {
                // An object key or a label.
                continue;
            }

            const std::optional<std::size_t> symbol = lookup(scope, current.text);
            if (!symbol) {
                m_taken_names.insert(current.text);
                continue;
            }
            m_symbol_of[i] = *symbol;
            m_symbols[*symbol].references.push_back(i);
            if (in_braces && is_member_name(previous, after, end)) {
                // A shorthand property or method, whose name is also a key.
                m_symbols[*symbol].fixed = true;
            }
        }
    }

    /// @brief Returns `true` if a name within braces that follows `previous`
    /// and is followed by the node at `after` looks like the name of an object member.
    [[nodiscard]]
    bool is_member_name(const Js_Token* previous, std::size_t after, std::size_t end) const
    {
        const bool is_method = after < end && token(after).is_punctuator(u8"(")
            && m_tree.next(after) < end && token(m_tree.next(after)).is_punctuator(u8"{");
        if (previous
            && (std::ranges::contains(js_member_modifiers, previous->text)
                || previous->is_punctuator(u8"*"))) {
            return is_method;
        }
        const bool starts_member
            = !previous || previous->is_punctuator(u8"{") || previous->is_punctuator(u8",");
        return starts_member && (after >= end || token(after).is_punctuator(u8",") || is_method);
    }

    void assign_names(std::size_t scope, std::set<std::u8string_view> taken)
    {
        std::size_t index = 0;
        for (const std::size_t symbol_index : m_scopes[scope].declaration_order) {
            Js_Symbol& symbol = m_symbols[symbol_index];
            if (symbol.fixed) {
                continue;
            }
            do {
                symbol.new_name = generated_name(index++);
            } while (taken.contains(symbol.new_name));
            taken.insert(symbol.new_name);
        }
        for (const std::size_t child : m_scopes[scope].children) {
            assign_names(child, taken);
        }
    }
};

[[nodiscard]]
constexpr bool is_css_whitespace(char8_t c)
{
    return c == u8' ' || c == u8'\t' || c == u8'\n' || c == u8'\r' || c == u8'\f';
}

/// @brief Characters before which whitespace is removed.
[[nodiscard]]
constexpr bool strips_css_whitespace_before(char8_t c)
{
    return c == u8'{' || c == u8'}' || c == u8';' || c == u8',' || c == u8'>' || c == u8')';
}

/// @brief Characters after which whitespace is removed.
[[nodiscard]]
constexpr bool strips_css_whitespace_after(char8_t c)
{
    return c == u8'{' || c == u8'}' || c == u8';' || c == u8',' || c == u8'>' || c == u8':'
        || c == u8'(';
}

struct [[nodiscard]] Css_Minifier {
private:
    std::u8string& m_out;
    const std::u8string_view m_source;
    Minify_Diagnostic_Consumer m_on_diagnostic;

    const std::size_t m_out_begin;
    std::size_t m_pos = 0;
    bool m_pending_space = false;

public:
    Css_Minifier(
        std::u8string& out,
        std::u8string_view source,
        Minify_Diagnostic_Consumer on_diagnostic
    )
        : m_out { out }
        , m_source { source }
        , m_on_diagnostic { on_diagnostic }
        , m_out_begin { out.size() }
    {
    }

    bool operator()()
    {
        while (m_pos < m_source.size()) {
            if (!step()) {
                m_out.append(m_source.substr(m_pos));
                return false;
            }
        }
        return true;
    }

private:
    [[nodiscard]]
    bool unterminated(std::u8string_view message)
    {
        if (m_on_diagnostic) {
            m_on_diagnostic(
                Severity::error, diagnostic::css_unterminated, m_pos, m_source.size() - m_pos,
                message
            );
        }
        return false;
    }

    [[nodiscard]]
    bool step()
    {
        const char8_t c = m_source[m_pos];
        if (is_css_whitespace(c)) {
            m_pending_space = true;
            ++m_pos;
            return true;
        }
        if (m_source.substr(m_pos).starts_with(u8"/*")) {
            const std::size_t end = m_source.find(u8"*/", m_pos + 2);
            if (end == std::u8string_view::npos) {
                return unterminated(u8"Unterminated comment.");
            }
            const std::u8string_view comment = m_source.substr(m_pos, end + 2 - m_pos);
            if (comment.starts_with(u8"/*!")) {
                emit(comment);
            }
            else {
                m_pending_space = true;
            }
            m_pos = end + 2;
            return true;
        }
        if (c == u8'\'' || c == u8'"') {
            const std::size_t end = match_string(m_source, m_pos);
            if (end == std::u8string_view::npos) {
                return unterminated(u8"Unterminated string.");
            }
            emit(m_source.substr(m_pos, end - m_pos));
            m_pos = end;
            return true;
        }
        emit(m_source.substr(m_pos, 1));
        ++m_pos;
        return true;
    }

    void emit(std::u8string_view text)
    {
        const char8_t next = text.front();
        const bool at_start = m_out.size() == m_out_begin;
        if (!at_start) {
            const char8_t last = m_out.back();
            if (m_pending_space && !strips_css_whitespace_after(last)
                && !strips_css_whitespace_before(next)) {
                m_out += u8' ';
            }
            else if (next == u8'}' && last == u8';') {
                m_out.pop_back();
            }
            if (m_out.size() != m_out_begin && forms_template_tag(m_out.back(), next)) {
                m_out += u8' ';
            }
        }
        m_pending_space = false;
        m_out += text;
    }
};

} // namespace

bool minify_javascript(
    std::u8string& out,
    std::u8string_view source,
    Minify_Diagnostic_Consumer on_diagnostic
)
{
    return minify_javascript(out, source, Javascript_Minify_Options {}, on_diagnostic);
}

bool minify_javascript(
    std::u8string& out,
    std::u8string_view source,
    const Javascript_Minify_Options& options,
    Minify_Diagnostic_Consumer on_diagnostic
)
{
    Js_Code code;
    Javascript_Lexer lexer { code, source, on_diagnostic };
    bool success = lexer();
    if (lexer.position() != source.size()) {
        print_javascript(out, code);
        out.append(source.substr(lexer.position()));
        return false;
    }

    const bool validates = options.require_semicolons || options.check_gettext;
    if (!validates && !options.rename_local_variables) {
        print_javascript(out, code);
        return success;
    }

    const Result<std::vector<std::size_t>, std::size_t> closing = match_brackets(code.tokens);
    if (!closing) {
        const Js_Token& bracket = code.tokens[closing.error()];
        diagnose(
            on_diagnostic, validates ? Severity::error : Severity::debug, diagnostic::js_unbalanced,
            bracket.begin, bracket.text.size(), u8"This bracket has no matching counterpart."
        );
        print_javascript(out, code);
        return success && !validates;
    }

    const Js_Tree tree { .tokens = code.tokens, .closing = *closing };
    Javascript_Validator validator { tree, on_diagnostic };
    if (options.require_semicolons && !validator.check_semicolons()) {
        success = false;
    }
    if (options.check_gettext && !validator.check_gettext()) {
        success = false;
    }
    if (options.rename_local_variables) {
        // The renamer owns the new names, so it has to outlive printing.
        Variable_Renamer renamer { tree, on_diagnostic };
        renamer();
        print_javascript(out, code);
        return success;
    }
    print_javascript(out, code);
    return success;
}

bool minify_css(
    std::u8string& out,
    std::u8string_view source,
    Minify_Diagnostic_Consumer on_diagnostic
)
{
    return Css_Minifier { out, source, on_diagnostic }();
}

} // namespace tpp
