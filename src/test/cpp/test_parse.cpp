#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "tpp/util/source_position.hpp"

#include "tpp/ast.hpp"
#include "tpp/builtin_directives.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"
#include "tpp/parse.hpp"

namespace tpp {
namespace {

struct [[nodiscard]] Parse_Actual {
    std::pmr::monotonic_buffer_resource memory;
    ast::Node_List nodes;
    std::vector<std::u8string> errors;
    bool success = false;
};

void run_parse(Parse_Actual& out, std::u8string_view source)
{
    static const Directive_Registry registry = make_builtin_registry();
    const auto on_error
        = [&](std::u8string_view id, const File_Source_Span&, std::u8string_view) {
              out.errors.emplace_back(id);
          };
    out.success
        = parse_and_build(out.nodes, source, File_Id::main, registry, on_error, &out.memory);
}

TEST(Parse, text_and_expressions)
{
    Parse_Actual actual;
    run_parse(actual, u8"Hello {{ name|upper }}!");
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.nodes.size(), 3);
    EXPECT_TRUE(actual.nodes[0].is(ast::Node_Kind::text));
    EXPECT_EQ(actual.nodes[0].get_text(), u8"Hello ");
    EXPECT_TRUE(actual.nodes[1].is(ast::Node_Kind::expression));
    EXPECT_EQ(actual.nodes[1].get_text(), u8"name|upper");
    EXPECT_EQ(actual.nodes[2].get_text(), u8"!");
}

TEST(Parse, block_with_branches)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% if a %}x{% elif b %}y{% else %}z{% endif %}");
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.nodes.size(), 1);

    const ast::Node& node = actual.nodes[0];
    ASSERT_TRUE(node.is_block_directive());
    EXPECT_EQ(node.get_name(), u8"if");
    EXPECT_EQ(node.get_arguments(), u8"a");

    const auto branches = node.get_branches();
    ASSERT_EQ(branches.size(), 3);
    EXPECT_EQ(branches[0].keyword, u8"if");
    EXPECT_EQ(branches[1].keyword, u8"elif");
    EXPECT_EQ(branches[1].arguments, u8"b");
    EXPECT_EQ(branches[2].keyword, u8"else");
    for (const ast::Branch& branch : branches) {
        ASSERT_EQ(branch.children.size(), 1);
    }
    EXPECT_EQ(branches[2].children[0].get_text(), u8"z");

    ASSERT_TRUE(node.get_end_span());
    EXPECT_EQ(node.get_end_span()->begin, 35);
}

TEST(Parse, nested_blocks)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% for x in xs %}{% if x %}{{ x }}{% endif %}{% empty %}-{% endfor %}");
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.nodes.size(), 1);
    const auto branches = actual.nodes[0].get_branches();
    ASSERT_EQ(branches.size(), 2);
    EXPECT_EQ(branches[1].keyword, u8"empty");
    ASSERT_EQ(branches[0].children.size(), 1);
    EXPECT_TRUE(branches[0].children[0].is_block_directive());
    EXPECT_EQ(branches[0].children[0].get_name(), u8"if");
}

TEST(Parse, end_arguments)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% block content %}x{% endblock content %}");
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.nodes.size(), 1);
    EXPECT_EQ(actual.nodes[0].get_arguments(), u8"content");
    EXPECT_EQ(actual.nodes[0].get_end_arguments(), u8"content");
}

TEST(Parse, inline_directive)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% url \"home page\" id %}");
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.nodes.size(), 1);
    EXPECT_TRUE(actual.nodes[0].is(ast::Node_Kind::directive));
    EXPECT_FALSE(actual.nodes[0].is_block_directive());
    EXPECT_EQ(actual.nodes[0].get_name(), u8"url");
    EXPECT_EQ(actual.nodes[0].get_arguments(), u8"\"home page\" id");
}

TEST(Parse, raw_block)
{
    Parse_Actual actual;
    run_parse(actual, u8"a{% !raw %}{% if %}{{{% !endraw %}b");
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.nodes.size(), 3);
    const ast::Node& raw = actual.nodes[1];
    ASSERT_TRUE(raw.is(ast::Node_Kind::raw));
    EXPECT_EQ(raw.get_text(), u8"{% if %}{{");
    EXPECT_EQ(raw.get_source_span().begin, 1);
    EXPECT_EQ(raw.get_source_span().length, 33);
}

TEST(Parse, comment_block_ignores_content)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% comment %}{% if %}<div>{% endcomment %}");
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.nodes.size(), 1);
    const auto branches = actual.nodes[0].get_branches();
    ASSERT_EQ(branches.size(), 1);
    ASSERT_EQ(branches[0].children.size(), 1);
    EXPECT_EQ(branches[0].children[0].get_text(), u8"{% if %}<div>");
}

TEST(Parse, comments_and_options)
{
    Parse_Actual actual;
    run_parse(actual, u8"{# note #}{% ! no-html %}");
    ASSERT_TRUE(actual.success);
    ASSERT_EQ(actual.nodes.size(), 2);
    EXPECT_TRUE(actual.nodes[0].is(ast::Node_Kind::comment));
    EXPECT_EQ(actual.nodes[0].get_text(), u8" note ");
    EXPECT_TRUE(actual.nodes[1].is(ast::Node_Kind::option));
    EXPECT_EQ(actual.nodes[1].get_text(), u8"no-html");
}

TEST(Parse, unmatched_open)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% if a %}x");
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.errors.size(), 1);
    EXPECT_EQ(actual.errors[0], diagnostic::parse_unmatched_open);
}

TEST(Parse, unmatched_close)
{
    Parse_Actual actual;
    run_parse(actual, u8"x{% endfor %}");
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.errors.size(), 1);
    EXPECT_EQ(actual.errors[0], diagnostic::parse_unmatched_close);
}

TEST(Parse, enclosing_close_ends_inner_block)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% for x in xs %}{% if x %}{% endfor %}");
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.errors.size(), 1);
    EXPECT_EQ(actual.errors[0], diagnostic::parse_unmatched_open);
    ASSERT_EQ(actual.nodes.size(), 1);
    EXPECT_EQ(actual.nodes[0].get_name(), u8"for");
}

TEST(Parse, branch_outside_block)
{
    Parse_Actual actual;
    run_parse(actual, u8"a{% else %}b");
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.errors.size(), 1);
    EXPECT_EQ(actual.errors[0], diagnostic::parse_branch_misplaced);
}

TEST(Parse, branch_after_exhaustive_branch)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% if a %}{% else %}{% elif b %}{% endif %}");
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.errors.size(), 1);
    EXPECT_EQ(actual.errors[0], diagnostic::parse_branch_misplaced);
}

TEST(Parse, branch_of_other_block)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% with a=b %}{% empty %}{% endwith %}");
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.errors.size(), 1);
    EXPECT_EQ(actual.errors[0], diagnostic::parse_branch_misplaced);
}

TEST(Parse, argument_checks)
{
    constexpr std::u8string_view sources[] {
        u8"{% templatetag openparen %}",
        u8"{% templatetag %}",
        u8"{% templatetag openblock closeblock %}",
        u8"{% spaceless x %}{% endspaceless %}",
        u8"{% widthratio 1 2 %}",
        u8"{% firstof %}",
        u8"{% firstof \"abc %}",
    };
    for (const std::u8string_view source : sources) {
        Parse_Actual actual;
        run_parse(actual, source);
        EXPECT_FALSE(actual.success);
        ASSERT_EQ(actual.errors.size(), 1);
        EXPECT_EQ(actual.errors[0], diagnostic::parse_arguments);
    }
}

TEST(Parse, lex_errors_are_reported)
{
    Parse_Actual actual;
    run_parse(actual, u8"{% if a\n %}");
    EXPECT_FALSE(actual.success);
    ASSERT_FALSE(actual.errors.empty());
    EXPECT_EQ(actual.errors[0], diagnostic::lex_invalid);
}

TEST(Split_Arguments, whitespace_and_quotes)
{
    const std::vector<std::u8string_view> actual = split_arguments(u8"  \"a b\" c'd e'\tf ");
    const std::vector<std::u8string_view> expected { u8"\"a b\"", u8"c'd e'", u8"f" };
    EXPECT_EQ(actual, expected);
}

TEST(Split_Arguments, unterminated_quote)
{
    const std::vector<std::u8string_view> actual = split_arguments(u8"\"a b");
    const std::vector<std::u8string_view> expected { u8"\"a", u8"b" };
    EXPECT_EQ(actual, expected);
    EXPECT_TRUE(has_unterminated_quote(actual[0]));
    EXPECT_FALSE(has_unterminated_quote(u8"'x\\'y'"));
}

TEST(Literal_Value, strings)
{
    EXPECT_EQ(literal_value(u8"\"abc\""), (Literal_Argument { Literal_Kind::string, u8"abc" }));
    EXPECT_EQ(literal_value(u8"'a\\'b'"), (Literal_Argument { Literal_Kind::string, u8"a'b" }));
    EXPECT_EQ(literal_value(u8"\"\""), (Literal_Argument { Literal_Kind::string, u8"" }));
    EXPECT_EQ(literal_value(u8"\"abc"), std::nullopt);
    EXPECT_EQ(literal_value(u8"\"a\"b"), std::nullopt);
}

TEST(Literal_Value, numbers)
{
    for (const std::u8string_view number : { u8"10", u8"-1.5e3", u8".5", u8"+7" }) {
        const Literal_Argument expected { Literal_Kind::number, std::u8string { number } };
        EXPECT_EQ(literal_value(number), expected);
    }
    EXPECT_EQ(literal_value(u8"1."), std::nullopt);
    EXPECT_EQ(literal_value(u8"1e"), std::nullopt);
}

TEST(Literal_Value, variables)
{
    EXPECT_EQ(literal_value(u8"user"), std::nullopt);
    EXPECT_EQ(literal_value(u8"x|default:\"a\""), std::nullopt);
    EXPECT_EQ(literal_value(u8""), std::nullopt);
}

} // namespace
} // namespace tpp
