#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "tpp/util/source_position.hpp"

#include "tpp/diagnostic.hpp"
#include "tpp/fwd.hpp"
#include "tpp/lex.hpp"

namespace tpp {
namespace {

struct Lex_Error {
    std::u8string id;
    Source_Span location;
};

struct [[nodiscard]] Lex_Actual {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<Token> tokens { &memory };
    std::vector<Lex_Error> errors;
    bool success = false;
};

[[nodiscard]]
bool is_test_block(std::u8string_view name)
{
    return name == u8"if" || name == u8"for" || name == u8"block" || name == u8"comment";
}

[[nodiscard]]
bool is_test_opaque(std::u8string_view name)
{
    return name == u8"comment";
}

void run_lex(Lex_Actual& out, std::u8string_view source)
{
    const auto on_error = [&](std::u8string_view id, const Source_Span& location,
                              std::u8string_view) {
        out.errors.push_back({ std::u8string { id }, location });
    };
    out.success = lex(out.tokens, source, is_test_block, on_error, is_test_opaque);
}

/// @brief Checks that the tokens partition `source` without gaps or overlaps.
void expect_partition(std::span<const Token> tokens, std::u8string_view source)
{
    std::size_t expected_begin = 0;
    Source_Position expected_position {};
    for (const Token& token : tokens) {
        EXPECT_EQ(token.location.begin, expected_begin);
        EXPECT_EQ(token.location.line, expected_position.line);
        EXPECT_EQ(token.location.column, expected_position.column);
        EXPECT_NE(token.location.length, 0);
        expected_position = advanced(
            expected_position, source.substr(expected_begin), token.location.length
        );
        expected_begin += token.location.length;
    }
    EXPECT_EQ(expected_begin, source.length());
}

TEST(Lex, empty)
{
    Lex_Actual actual;
    run_lex(actual, u8"");
    EXPECT_TRUE(actual.success);
    EXPECT_TRUE(actual.tokens.empty());
}

TEST(Lex, text_only)
{
    constexpr std::u8string_view source = u8"<p>Hello, world!</p>\n";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 1);
    EXPECT_EQ(actual.tokens[0].kind, Token_Kind::text);
    EXPECT_EQ(actual.tokens[0].arguments, source);
}

TEST(Lex, directive_kinds)
{
    constexpr std::u8string_view source
        = u8"{% if user %}Hi {{ user.name }}{% else %}{# anon #}{% endif %}";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 6);

    EXPECT_EQ(actual.tokens[0].kind, Token_Kind::directive_open);
    EXPECT_EQ(actual.tokens[0].name, u8"if");
    EXPECT_EQ(actual.tokens[0].arguments, u8"user");

    EXPECT_EQ(actual.tokens[1].kind, Token_Kind::text);
    EXPECT_EQ(actual.tokens[1].arguments, u8"Hi ");

    EXPECT_EQ(actual.tokens[2].kind, Token_Kind::expression);
    EXPECT_EQ(actual.tokens[2].arguments, u8"user.name");

    EXPECT_EQ(actual.tokens[3].kind, Token_Kind::directive_inline);
    EXPECT_EQ(actual.tokens[3].name, u8"else");
    EXPECT_EQ(actual.tokens[3].arguments, u8"");

    EXPECT_EQ(actual.tokens[4].kind, Token_Kind::comment);
    EXPECT_EQ(actual.tokens[4].arguments, u8" anon ");

    EXPECT_EQ(actual.tokens[5].kind, Token_Kind::directive_close);
    EXPECT_EQ(actual.tokens[5].name, u8"if");

    expect_partition(actual.tokens, source);
}

TEST(Lex, option)
{
    constexpr std::u8string_view source = u8"a{% ! no-html  validate-html %}b";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 3);
    EXPECT_EQ(actual.tokens[1].kind, Token_Kind::option);
    EXPECT_EQ(actual.tokens[1].arguments, u8"no-html  validate-html");
    expect_partition(actual.tokens, source);
}

TEST(Lex, raw_block_hides_directives)
{
    constexpr std::u8string_view source
        = u8"x{% !raw %}<div><span>{% broken_tag %}{{ y{% !endraw %}z";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 5);
    EXPECT_EQ(actual.tokens[0].kind, Token_Kind::text);
    EXPECT_EQ(actual.tokens[1].kind, Token_Kind::raw_begin);
    EXPECT_EQ(actual.tokens[2].kind, Token_Kind::raw_text);
    EXPECT_EQ(actual.tokens[2].arguments, u8"<div><span>{% broken_tag %}{{ y");
    EXPECT_EQ(actual.tokens[3].kind, Token_Kind::raw_end);
    EXPECT_EQ(actual.tokens[4].kind, Token_Kind::text);
    expect_partition(actual.tokens, source);
}

TEST(Lex, raw_block_in_comment_syntax)
{
    constexpr std::u8string_view source = u8"{#!raw#}{%x%}{#!endraw#}";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 3);
    EXPECT_EQ(actual.tokens[0].kind, Token_Kind::raw_begin);
    EXPECT_EQ(actual.tokens[1].arguments, u8"{%x%}");
    EXPECT_EQ(actual.tokens[2].kind, Token_Kind::raw_end);
}

TEST(Lex, empty_raw_block)
{
    constexpr std::u8string_view source = u8"{% !raw %}{% !endraw %}";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 2);
    EXPECT_EQ(actual.tokens[0].kind, Token_Kind::raw_begin);
    EXPECT_EQ(actual.tokens[1].kind, Token_Kind::raw_end);
}

TEST(Lex, unterminated_raw_block)
{
    constexpr std::u8string_view source = u8"ab\n{% !raw %}<p>{% if %}";
    Lex_Actual actual;
    run_lex(actual, source);
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.errors.size(), 1);
    EXPECT_EQ(actual.errors[0].id, diagnostic::lex_raw_unterminated);
    EXPECT_EQ(actual.errors[0].location.begin, 3);
    EXPECT_EQ(actual.errors[0].location.line, 1);
    EXPECT_EQ(actual.errors[0].location.column, 0);
    EXPECT_EQ(actual.errors[0].location.length, 10);
    expect_partition(actual.tokens, source);
}

TEST(Lex, stray_raw_end)
{
    constexpr std::u8string_view source = u8"a{% !endraw %}b";
    Lex_Actual actual;
    run_lex(actual, source);
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.errors.size(), 1);
    EXPECT_EQ(actual.errors[0].id, diagnostic::lex_invalid);
    expect_partition(actual.tokens, source);
}

TEST(Lex, tag_not_closed_on_same_line)
{
    constexpr std::u8string_view source = u8"{% if\nx %}";
    Lex_Actual actual;
    run_lex(actual, source);
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.errors.size(), 1);
    EXPECT_EQ(actual.errors[0].id, diagnostic::lex_invalid);
    EXPECT_EQ(actual.errors[0].location.length, 2);
    expect_partition(actual.tokens, source);
}

TEST(Lex, empty_tags)
{
    constexpr std::u8string_view source = u8"{%  %}{{ }}";
    Lex_Actual actual;
    run_lex(actual, source);
    EXPECT_FALSE(actual.success);
    EXPECT_EQ(actual.errors.size(), 2);
    expect_partition(actual.tokens, source);
}

TEST(Lex, single_braces_are_text)
{
    constexpr std::u8string_view source = u8"function f() { return {a: 1}; }{";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 1);
    EXPECT_EQ(actual.tokens[0].arguments, source);
}

TEST(Lex, positions_across_lines)
{
    constexpr std::u8string_view source = u8"line one\n  {{ x }}\n{% block a %}{% endblock %}";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 5);
    EXPECT_EQ(actual.tokens[1].kind, Token_Kind::expression);
    EXPECT_EQ(actual.tokens[1].location.line, 1);
    EXPECT_EQ(actual.tokens[1].location.column, 2);
    EXPECT_EQ(actual.tokens[3].kind, Token_Kind::directive_open);
    EXPECT_EQ(actual.tokens[3].location.line, 2);
    EXPECT_EQ(actual.tokens[3].location.column, 0);
    expect_partition(actual.tokens, source);
}

TEST(Lex, unknown_names_are_inline)
{
    constexpr std::u8string_view source = u8"{% custom a b %}{% endcustom %}";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 2);
    EXPECT_EQ(actual.tokens[0].kind, Token_Kind::directive_inline);
    EXPECT_EQ(actual.tokens[0].arguments, u8"a b");
    EXPECT_EQ(actual.tokens[1].kind, Token_Kind::directive_close);
    EXPECT_EQ(actual.tokens[1].name, u8"custom");
}

TEST(Lex, comment_block_content_is_opaque)
{
    constexpr std::u8string_view source
        = u8"a{% comment %}{# x {{ y {% if %}{% endcommentary %}{% endcomment %}b";
    Lex_Actual actual;
    run_lex(actual, source);
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 5);
    EXPECT_EQ(actual.tokens[1].kind, Token_Kind::directive_open);
    EXPECT_EQ(actual.tokens[2].kind, Token_Kind::text);
    EXPECT_EQ(actual.tokens[2].arguments, u8"{# x {{ y {% if %}{% endcommentary %}");
    EXPECT_EQ(actual.tokens[3].kind, Token_Kind::directive_close);
    EXPECT_EQ(actual.tokens[3].name, u8"comment");
    expect_partition(actual.tokens, source);
}

TEST(Lex, unterminated_comment_block)
{
    constexpr std::u8string_view source = u8"{% comment %}\n{# x";
    Lex_Actual actual;
    run_lex(actual, source);
    EXPECT_TRUE(actual.success);
    ASSERT_EQ(actual.tokens.size(), 2);
    EXPECT_EQ(actual.tokens[1].kind, Token_Kind::text);
    expect_partition(actual.tokens, source);
}

TEST(Lex, partition_of_mixed_source)
{
    constexpr std::u8string_view sources[] {
        u8"{",
        u8"{{",
        u8"}}{%",
        u8"{% if a %}<a href=\"{{ u }}\">{% endif %}",
        u8"{# {% if %} #}{% !raw %}{% !raw %}{% !endraw %}",
        u8"a\r\nb{{ c }}\n\n{%x%}",
        u8"{% ! html %}{%%}{#",
        u8"{% comment %}{% endcomment",
        u8"{% comment %}{%endcomment%}{% comment %}",
    };
    for (const std::u8string_view source : sources) {
        Lex_Actual actual;
        run_lex(actual, source);
        expect_partition(actual.tokens, source);
    }
}

} // namespace
} // namespace tpp
