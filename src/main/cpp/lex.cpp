#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include "tpp/util/assert.hpp"
#include "tpp/util/chars.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/diagnostic.hpp"
#include "tpp/fwd.hpp"
#include "tpp/lex.hpp"

namespace tpp {

#define TPP_TOKEN_KIND_NAME_CASE(id, name)                                                         \
    case Token_Kind::id: return u8##name;

std::u8string_view token_kind_name(Token_Kind kind)
{
    switch (kind) {
        TPP_TOKEN_KIND_ENUM_DATA(TPP_TOKEN_KIND_NAME_CASE)
    }
    TPP_ASSERT_UNREACHABLE(u8"Invalid token kind.");
}

namespace {

enum struct Tag_Kind : Default_Underlying {
    /// @brief `{% ... %}`
    block,
    /// @brief `{{ ... }}`
    variable,
    /// @brief `{# ... #}`
    comment,
};

[[nodiscard]]
constexpr char8_t tag_closing_char(Tag_Kind kind)
{
    switch (kind) {
    case Tag_Kind::block: return u8'%';
    case Tag_Kind::variable: return u8'}';
    case Tag_Kind::comment: return u8'#';
    }
    TPP_ASSERT_UNREACHABLE(u8"Invalid tag kind.");
}

[[nodiscard]]
constexpr std::optional<Tag_Kind> match_tag_opening(std::u8string_view str)
{
    if (str.length() < 2 || str[0] != u8'{') {
        return {};
    }
    switch (str[1]) {
    case u8'%': return Tag_Kind::block;
    case u8'{': return Tag_Kind::variable;
    case u8'#': return Tag_Kind::comment;
    default: return {};
    }
}

/// @brief Returns the index of the first tag opening in `str`,
/// starting at `start`, or `str.length()` if there is none.
/// If `allow_variable` is `false`, `{{` is not considered to be a tag opening.
[[nodiscard]]
constexpr std::size_t
find_tag_opening(std::u8string_view str, std::size_t start = 0, bool allow_variable = true)
{
    for (std::size_t i = start; i + 1 < str.length(); ++i) {
        const std::optional<Tag_Kind> kind = match_tag_opening(str.substr(i));
        if (kind && (allow_variable || *kind != Tag_Kind::variable)) {
            return i;
        }
    }
    return str.length();
}

/// @brief Matches a complete tag of the given `kind` at the start of `str`,
/// which must be closed on the same line.
/// @returns The length of the tag including delimiters, or zero if the tag is not closed.
[[nodiscard]]
constexpr std::size_t match_tag(std::u8string_view str, Tag_Kind kind)
{
    const char8_t closing = tag_closing_char(kind);
    for (std::size_t i = 2; i + 1 < str.length(); ++i) {
        if (str[i] == u8'\n') {
            return 0;
        }
        if (str[i] == closing && str[i + 1] == u8'}') {
            return i + 2;
        }
    }
    return 0;
}

[[nodiscard]]
constexpr std::u8string_view tag_body(std::u8string_view tag)
{
    TPP_DEBUG_ASSERT(tag.length() >= 4);
    return tag.substr(2, tag.length() - 4);
}

inline constexpr std::u8string_view raw_begin_marker = u8"!raw";
inline constexpr std::u8string_view raw_end_marker = u8"!endraw";
inline constexpr std::u8string_view close_prefix = u8"end";

struct [[nodiscard]] Lexer {
private:
    std::pmr::vector<Token>& m_out;
    const std::u8string_view m_source;
    const Block_Classifier m_is_block;
    const Lex_Error_Consumer m_on_error;
    const Block_Classifier m_is_opaque;

    Source_Position m_pos {};
    bool m_success = true;

public:
    [[nodiscard]]
    Lexer(
        std::pmr::vector<Token>& out,
        std::u8string_view source,
        Block_Classifier is_block,
        Lex_Error_Consumer on_error,
        Block_Classifier is_opaque
    )
        : m_out { out }
        , m_source { source }
        , m_is_block { is_block }
        , m_on_error { on_error }
        , m_is_opaque { is_opaque }
    {
    }

    bool operator()()
    {
        while (!eof()) {
            const std::size_t text_length = find_tag_opening(peek_all());
            if (text_length != 0) {
                consume(Token_Kind::text, text_length, {}, peek_all().substr(0, text_length));
            }
            else {
                consume_tag();
            }
        }
        return m_success;
    }

private:
    void consume(
        Token_Kind kind,
        std::size_t length,
        std::u8string_view name = {},
        std::u8string_view arguments = {}
    )
    {
        TPP_DEBUG_ASSERT(length != 0);
        TPP_DEBUG_ASSERT(m_pos.begin + length <= m_source.length());
        m_out.push_back({ kind, Source_Span { m_pos, length }, name, arguments });
        advance_by(length);
    }

    void error(std::u8string_view id, const Source_Span& pos, std::u8string_view message)
    {
        if (m_on_error) {
            m_on_error(id, pos, message);
        }
        m_success = false;
    }

    void advance_by(std::size_t n)
    {
        TPP_DEBUG_ASSERT(m_pos.begin + n <= m_source.size());
        advance(m_pos, m_source.substr(m_pos.begin, n));
    }

    [[nodiscard]]
    std::u8string_view peek_all() const
    {
        TPP_DEBUG_ASSERT(m_pos.begin <= m_source.size());
        return m_source.substr(m_pos.begin);
    }

    [[nodiscard]]
    bool eof() const
    {
        return m_pos.begin == m_source.length();
    }

    /// @brief Emits the tag opening as text after an error, so that lexing can continue
    /// and the tokens still cover the source.
    void consume_invalid_tag(std::size_t length, std::u8string_view message)
    {
        error(diagnostic::lex_invalid, Source_Span { m_pos, length }, message);
        consume(Token_Kind::text, length, {}, peek_all().substr(0, length));
    }

    void consume_tag()
    {
        const std::u8string_view remainder = peek_all();
        const std::optional<Tag_Kind> kind = match_tag_opening(remainder);
        TPP_ASSERT(kind);

        const std::size_t length = match_tag(remainder, *kind);
        if (length == 0) {
            consume_invalid_tag(2, u8"This tag is not closed on the same line.");
            return;
        }
        const std::u8string_view body = tag_body(remainder.substr(0, length));
        const std::u8string_view trimmed = trim_whitespace(body);

        if (*kind != Tag_Kind::variable) {
            if (trimmed == raw_begin_marker) {
                const Source_Span begin_span { m_pos, length };
                consume(Token_Kind::raw_begin, length);
                consume_raw_block(begin_span);
                return;
            }
            if (trimmed == raw_end_marker) {
                consume_invalid_tag(length, u8"This raw block end has no matching begin.");
                return;
            }
            if (trimmed.starts_with(u8'!')) {
                consume(Token_Kind::option, length, {}, trim_whitespace(trimmed.substr(1)));
                return;
            }
        }

        switch (*kind) {
        case Tag_Kind::comment: {
            consume(Token_Kind::comment, length, {}, body);
            return;
        }
        case Tag_Kind::variable: {
            if (trimmed.empty()) {
                consume_invalid_tag(length, u8"Empty expression tag.");
                return;
            }
            consume(Token_Kind::expression, length, {}, trimmed);
            return;
        }
        case Tag_Kind::block: {
            if (trimmed.empty()) {
                consume_invalid_tag(length, u8"Empty directive tag.");
                return;
            }
            std::size_t name_length = 0;
            while (name_length < trimmed.length() && !is_html_whitespace(trimmed[name_length])) {
                ++name_length;
            }
            const std::u8string_view name = trimmed.substr(0, name_length);
            const std::u8string_view arguments = trim_whitespace_left(trimmed.substr(name_length));

            if (name.starts_with(close_prefix) && name.length() > close_prefix.length()) {
                consume(
                    Token_Kind::directive_close, length, name.substr(close_prefix.length()),
                    arguments
                );
                return;
            }
            const bool block = m_is_block && m_is_block(name);
            consume(
                block ? Token_Kind::directive_open : Token_Kind::directive_inline, length, name,
                arguments
            );
            if (block && m_is_opaque && m_is_opaque(name)) {
                consume_opaque_content(name);
            }
            return;
        }
        }
        TPP_ASSERT_UNREACHABLE(u8"Invalid tag kind.");
    }

    /// @brief Emits everything up to the closing tag of the block `name` as text.
    /// If there is no closing tag, the rest of the source becomes text,
    /// and the parser reports the unclosed block.
    void consume_opaque_content(std::u8string_view name)
    {
        const std::u8string_view remainder = peek_all();
        std::size_t i = 0;
        for (; i < remainder.length(); i += 2) {
            i = find_tag_opening(remainder, i, false);
            if (i == remainder.length()) {
                break;
            }
            if (match_tag_opening(remainder.substr(i)) != Tag_Kind::block) {
                continue;
            }
            const std::size_t length = match_tag(remainder.substr(i), Tag_Kind::block);
            if (length != 0 && is_closing_tag_of(tag_body(remainder.substr(i, length)), name)) {
                break;
            }
        }
        i = std::min(i, remainder.length());
        if (i != 0) {
            consume(Token_Kind::text, i, {}, remainder.substr(0, i));
        }
    }

    [[nodiscard]]
    static bool is_closing_tag_of(std::u8string_view body, std::u8string_view name)
    {
        const std::u8string_view trimmed = trim_whitespace(body);
        if (!trimmed.starts_with(close_prefix)) {
            return false;
        }
        const std::u8string_view rest = trimmed.substr(close_prefix.length());
        return rest.starts_with(name)
            && (rest.length() == name.length() || is_html_whitespace(rest[name.length()]));
    }

    void consume_raw_block(const Source_Span& begin_span)
    {
        const std::u8string_view remainder = peek_all();
        std::size_t i = 0;
        while (true) {
            i = find_tag_opening(remainder, i, false);
            if (i == remainder.length()) {
                break;
            }
            const std::optional<Tag_Kind> kind = match_tag_opening(remainder.substr(i));
            TPP_ASSERT(kind);
            const std::size_t length = match_tag(remainder.substr(i), *kind);
            if (length != 0
                && trim_whitespace(tag_body(remainder.substr(i, length))) == raw_end_marker) {
                if (i != 0) {
                    consume(Token_Kind::raw_text, i, {}, remainder.substr(0, i));
                }
                consume(Token_Kind::raw_end, length);
                return;
            }
            i += 2;
        }

        error(
            diagnostic::lex_raw_unterminated, begin_span,
            u8"This raw block is never terminated with `!endraw`."
        );
        if (!remainder.empty()) {
            consume(Token_Kind::raw_text, remainder.length(), {}, remainder);
        }
    }
};

} // namespace

bool lex(
    std::pmr::vector<Token>& out,
    std::u8string_view source,
    Block_Classifier is_block,
    Lex_Error_Consumer on_error,
    Block_Classifier is_opaque
)
{
    return Lexer { out, source, is_block, on_error, is_opaque }();
}

} // namespace tpp
