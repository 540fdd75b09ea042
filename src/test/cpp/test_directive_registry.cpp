#include <algorithm>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "tpp/util/result.hpp"

#include "tpp/builtin_directives.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"

namespace tpp {
namespace {

[[nodiscard]]
Directive_Entry pure_inline(std::u8string_view name)
{
    return Directive_Entry {
        .name = std::u8string { name },
        .purity = Purity::pure,
        .evaluator = [](const Fold_Input&) -> Result<std::u8string, std::u8string> {
            return std::u8string { u8"x" };
        },
    };
}

[[nodiscard]]
Result<std::u8string, std::u8string>
evaluate(std::u8string_view name, const std::vector<Literal_Argument>& arguments)
{
    static const Directive_Registry registry = make_builtin_registry();
    const Directive_Entry* const entry = registry.find(name);
    EXPECT_TRUE(entry && entry->evaluator);
    const Fold_Input input { .arguments = arguments, .raw_arguments = {}, .content = {} };
    return entry->evaluator(input);
}

[[nodiscard]]
Literal_Argument number(std::u8string_view value)
{
    return { Literal_Kind::number, std::u8string { value } };
}

[[nodiscard]]
Literal_Argument string(std::u8string_view value)
{
    return { Literal_Kind::string, std::u8string { value } };
}

TEST(Directive_Registry, add_and_find)
{
    Directive_Registry registry;
    ASSERT_TRUE(registry.add(pure_inline(u8"greeting")));
    ASSERT_TRUE(registry.add(Directive_Entry { .name = u8"user" }));

    const Directive_Entry* const entry = registry.find(u8"greeting");
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->is_pure());
    EXPECT_FALSE(entry->is_block());
    EXPECT_EQ(registry.find(u8"missing"), nullptr);

    const std::vector<std::u8string_view> expected_names { u8"greeting", u8"user" };
    EXPECT_TRUE(std::ranges::equal(registry.names(), expected_names));
}

TEST(Directive_Registry, invalid_entries)
{
    Directive_Registry registry;
    EXPECT_EQ(registry.add(Directive_Entry { .name = u8"" }).error(), Registry_Error::invalid_name);
    EXPECT_EQ(
        registry.add(Directive_Entry { .name = u8"!raw" }).error(), Registry_Error::invalid_name
    );
    EXPECT_EQ(
        registry.add(Directive_Entry { .name = u8"endthing" }).error(), Registry_Error::invalid_name
    );
    EXPECT_EQ(
        registry.add(Directive_Entry { .name = u8"a%b" }).error(), Registry_Error::invalid_name
    );
    EXPECT_EQ(
        registry.add(Directive_Entry { .name = u8"x", .purity = Purity::pure }).error(),
        Registry_Error::missing_evaluator
    );
    EXPECT_EQ(
        registry.add(Directive_Entry { .name = u8"x", .min_arguments = 2, .max_arguments = 1 })
            .error(),
        Registry_Error::invalid_arity
    );

    Directive_Entry bad_block { .name = u8"x", .block = Block_Info {} };
    bad_block.block->branch_keywords = { u8"otherwise" };
    bad_block.block->exhaustive_keyword = u8"else";
    EXPECT_EQ(registry.add(std::move(bad_block)).error(), Registry_Error::invalid_block);

    EXPECT_TRUE(registry.names().empty());
}

TEST(Directive_Registry, duplicate_name)
{
    Directive_Registry registry = make_builtin_registry();
    const Result<void, Registry_Error> result = registry.add(Directive_Entry { .name = u8"if" });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Registry_Error::duplicate_name);

    EXPECT_EQ(add_builtin_directives(registry).error(), Registry_Error::duplicate_name);
}

TEST(Directive_Registry, blocks_and_branches)
{
    const Directive_Registry registry = make_builtin_registry();
    EXPECT_TRUE(registry.is_block(u8"if"));
    EXPECT_TRUE(registry.is_block(u8"comment"));
    EXPECT_FALSE(registry.is_block(u8"url"));
    EXPECT_FALSE(registry.is_block(u8"nonexistent"));

    EXPECT_TRUE(registry.is_branch_keyword(u8"if", u8"elif"));
    EXPECT_TRUE(registry.is_branch_keyword(u8"for", u8"empty"));
    EXPECT_FALSE(registry.is_branch_keyword(u8"for", u8"else"));
    EXPECT_TRUE(registry.is_branch_keyword(u8"blocktrans", u8"plural"));
    EXPECT_TRUE(registry.is_any_branch_keyword(u8"plural"));
    EXPECT_FALSE(registry.is_any_branch_keyword(u8"if"));

    const Directive_Entry* const if_entry = registry.find(u8"if");
    ASSERT_NE(if_entry, nullptr);
    EXPECT_EQ(if_entry->block->kind, Block_Kind::conditional);
    EXPECT_EQ(if_entry->block->exhaustive_keyword, u8"else");
    EXPECT_EQ(if_entry->purity, Purity::context_dependent);
}

TEST(Directive_Registry, pure_builtins)
{
    const Directive_Registry registry = make_builtin_registry();
    for (const std::u8string_view name :
         { u8"comment", u8"spaceless", u8"templatetag", u8"widthratio", u8"firstof" }) {
        const Directive_Entry* const entry = registry.find(name);
        ASSERT_NE(entry, nullptr);
        EXPECT_TRUE(entry->is_pure());
    }
    EXPECT_TRUE(registry.find(u8"comment")->block->ignores_content);
}

TEST(Directive_Registry, suggest)
{
    const Directive_Registry registry = make_builtin_registry();
    std::pmr::monotonic_buffer_resource memory;
    EXPECT_EQ(registry.suggest(u8"exends", &memory), u8"extends");
    EXPECT_EQ(registry.suggest(u8"spacless", &memory), u8"spaceless");
    EXPECT_EQ(registry.suggest(u8"qqqqqqqqqqqqqqqqqqqqqq", &memory), u8"");
}

TEST(Builtin_Directives, templatetag)
{
    EXPECT_EQ(templatetag_output(u8"openblock"), u8"{%");
    EXPECT_EQ(templatetag_output(u8"closevariable"), u8"}}");
    EXPECT_EQ(templatetag_output(u8"opencomment"), u8"{#");
    EXPECT_EQ(templatetag_output(u8"openparen"), std::nullopt);

    const Result<std::u8string, std::u8string> result
        = evaluate(u8"templatetag", { { Literal_Kind::keyword, u8"openbrace" } });
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, u8"{");
}

TEST(Builtin_Directives, spaceless)
{
    EXPECT_EQ(strip_spaces_between_tags(u8"  <p>\n  <a>x y</a>  </p> "), u8"<p><a>x y</a></p>");
    EXPECT_EQ(strip_spaces_between_tags(u8"<b> text </b>"), u8"<b> text </b>");
}

TEST(Builtin_Directives, widthratio)
{
    const auto widthratio = [](std::u8string_view a, std::u8string_view b, std::u8string_view c) {
        return evaluate(u8"widthratio", { number(a), number(b), number(c) });
    };
    EXPECT_EQ(*widthratio(u8"175", u8"200", u8"100"), u8"88");
    EXPECT_EQ(*widthratio(u8"1", u8"8", u8"100"), u8"12");
    EXPECT_EQ(*widthratio(u8"3", u8"8", u8"100"), u8"38");
    EXPECT_EQ(*widthratio(u8"5", u8"0", u8"100"), u8"0");
    EXPECT_EQ(*widthratio(u8"50", u8"100", u8"100.7"), u8"50");

    const Result<std::u8string, std::u8string> not_numeric
        = evaluate(u8"widthratio", { string(u8"abc"), number(u8"100"), number(u8"100") });
    ASSERT_TRUE(not_numeric);
    EXPECT_EQ(*not_numeric, u8"");

    EXPECT_FALSE(evaluate(u8"widthratio", { number(u8"1"), number(u8"2"), string(u8"x") }));
    EXPECT_FALSE(evaluate(u8"widthratio", { number(u8"1"), number(u8"2"), string(u8"1.5") }));
}

TEST(Builtin_Directives, firstof)
{
    EXPECT_EQ(*evaluate(u8"firstof", { string(u8""), number(u8"0"), string(u8"x") }), u8"x");
    EXPECT_EQ(*evaluate(u8"firstof", { number(u8"0.0"), number(u8"007") }), u8"7");
    EXPECT_EQ(*evaluate(u8"firstof", { string(u8"<b>") }), u8"<b>");
    EXPECT_EQ(*evaluate(u8"firstof", { string(u8"") }), u8"");
}

TEST(Builtin_Directives, format_number_literal)
{
    EXPECT_EQ(format_number_literal(u8"42"), u8"42");
    EXPECT_EQ(format_number_literal(u8"-0"), u8"0");
    EXPECT_EQ(format_number_literal(u8"+5"), u8"5");
    EXPECT_EQ(format_number_literal(u8"1.50"), u8"1.5");
    EXPECT_EQ(format_number_literal(u8"2.0"), u8"2.0");
    EXPECT_EQ(format_number_literal(u8"1e3"), u8"1000.0");
    EXPECT_EQ(format_number_literal(u8"1e20"), u8"1e+20");
}

} // namespace
} // namespace tpp
