#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "tpp/util/result.hpp"

#include "tpp/options.hpp"
#include "tpp/path_pattern.hpp"

namespace tpp {
namespace {

[[nodiscard]]
Path_Pattern pattern(std::u8string_view str)
{
    Result<Path_Pattern, Path_Pattern_Error> result = Path_Pattern::make(str);
    EXPECT_TRUE(result);
    return *std::move(result);
}

TEST(Options, names)
{
    EXPECT_EQ(option_flag_name(Option_Flag::whitespace_compression), u8"whitespace-compression");
    EXPECT_EQ(option_flag_by_name(u8"validate-html"), Option_Flag::validate_html);
    EXPECT_EQ(option_flag_by_name(u8"no-html"), std::nullopt);
    EXPECT_EQ(option_flag_by_name(u8""), std::nullopt);
    EXPECT_EQ(option_flag_names().size(), option_flag_count);
}

TEST(Options, defaults)
{
    const Option_Set defaults = Option_Set::defaults();
    EXPECT_TRUE(defaults.contains(Option_Flag::whitespace_compression));
    EXPECT_TRUE(defaults.contains(Option_Flag::html));
    EXPECT_TRUE(defaults.contains(Option_Flag::validate_html));
    EXPECT_TRUE(defaults.contains(Option_Flag::resolve_inheritance));
    EXPECT_FALSE(defaults.contains(Option_Flag::merge_internal_javascript));
    EXPECT_FALSE(defaults.contains(Option_Flag::parse_all_html_tags));
    EXPECT_EQ(
        to_string(defaults), u8"whitespace-compression html validate-html resolve-inheritance"
    );
}

TEST(Options, set_operations)
{
    Option_Set options;
    EXPECT_EQ(to_string(options), u8"");
    options.enable(Option_Flag::compile_css).enable(Option_Flag::html);
    EXPECT_EQ(to_string(options), u8"html compile-css");
    options.disable(Option_Flag::html);
    EXPECT_EQ(options, Option_Set {}.with(Option_Flag::compile_css));
    EXPECT_NE(options.get_bits(), Option_Set {}.get_bits());
}

TEST(Options, apply_flags)
{
    Option_Set options = Option_Set::defaults();
    std::vector<std::u8string> unknown;
    const auto on_unknown = [&](std::u8string_view word) { unknown.emplace_back(word); };

    EXPECT_TRUE(apply_option_flags(
        options, u8"  no-whitespace-compression\tmerge-internal-css  ", on_unknown
    ));
    EXPECT_FALSE(options.contains(Option_Flag::whitespace_compression));
    EXPECT_TRUE(options.contains(Option_Flag::merge_internal_css));
    EXPECT_TRUE(unknown.empty());

    EXPECT_FALSE(apply_option_flags(options, u8"html bogus no-nothing", on_unknown));
    EXPECT_TRUE(options.contains(Option_Flag::html));
    const std::vector<std::u8string> expected_unknown { u8"bogus", u8"no-nothing" };
    EXPECT_EQ(unknown, expected_unknown);
}

TEST(Options, later_flags_win)
{
    Option_Set options;
    EXPECT_TRUE(apply_option_flags(options, u8"html no-html"));
    EXPECT_FALSE(options.contains(Option_Flag::html));
}

TEST(Options, parse_overrides)
{
    const std::vector<Option_Override> actual
        = parse_option_overrides(u8"compile-javascript no-validate-html");
    const std::vector<Option_Override> expected {
        { Option_Flag::compile_javascript, true },
        { Option_Flag::validate_html, false },
    };
    EXPECT_EQ(actual, expected);
}

TEST(Path_Pattern, matches)
{
    const Path_Pattern admin = pattern(u8"admin/.*\\.html");
    EXPECT_EQ(admin.get_pattern(), u8"admin/.*\\.html");
    EXPECT_TRUE(admin.matches(u8"admin/index.html"));
    EXPECT_TRUE(admin.matches(u8"admin/users/list.html"));
    // The whole path has to match.
    EXPECT_FALSE(admin.matches(u8"site/admin/index.html"));
    EXPECT_FALSE(admin.matches(u8"admin/index.txt"));
}

TEST(Path_Pattern, invalid)
{
    const Result<Path_Pattern, Path_Pattern_Error> result = Path_Pattern::make(u8"admin/(");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Path_Pattern_Error::bad_pattern);
}

TEST(Option_Config, no_scopes)
{
    const Option_Config config;
    EXPECT_EQ(config.resolve(u8"index.html"), Option_Set::defaults());
}

TEST(Option_Config, precedence)
{
    Option_Config config;
    config.scopes.push_back({
        .applications = {},
        .path_pattern = {},
        .overrides = { { Option_Flag::merge_internal_javascript, true } },
    });
    config.scopes.push_back({
        .applications = { u8"shop" },
        .path_pattern = {},
        .overrides = { { Option_Flag::whitespace_compression, false } },
    });
    config.scopes.push_back({
        .applications = {},
        .path_pattern = pattern(u8"emails/.*"),
        .overrides = { { Option_Flag::html, false },
                       { Option_Flag::whitespace_compression, true },
                       { Option_Flag::merge_internal_javascript, false } },
    });

    const Option_Set site = config.resolve(u8"index.html", u8"site");
    EXPECT_TRUE(site.contains(Option_Flag::merge_internal_javascript));
    EXPECT_TRUE(site.contains(Option_Flag::whitespace_compression));
    EXPECT_TRUE(site.contains(Option_Flag::html));

    const Option_Set shop = config.resolve(u8"index.html", u8"shop");
    EXPECT_FALSE(shop.contains(Option_Flag::whitespace_compression));
    EXPECT_TRUE(shop.contains(Option_Flag::merge_internal_javascript));

    // The path scope is declared last, so it overrides the application scope.
    const Option_Set shop_email = config.resolve(u8"emails/welcome.html", u8"shop");
    EXPECT_TRUE(shop_email.contains(Option_Flag::whitespace_compression));
    EXPECT_FALSE(shop_email.contains(Option_Flag::html));
    EXPECT_FALSE(shop_email.contains(Option_Flag::merge_internal_javascript));
}

TEST(Option_Scope, applies_to)
{
    const Option_Scope everything;
    EXPECT_TRUE(everything.applies_to(u8"a.html", u8""));

    const Option_Scope apps { .applications = { u8"blog", u8"shop" } };
    EXPECT_TRUE(apps.applies_to(u8"a.html", u8"shop"));
    EXPECT_FALSE(apps.applies_to(u8"a.html", u8"forum"));
    EXPECT_FALSE(apps.applies_to(u8"a.html", u8""));

    const Option_Scope both { .applications = { u8"blog" }, .path_pattern = pattern(u8"x/.*") };
    EXPECT_TRUE(both.applies_to(u8"x/a.html", u8""));
    EXPECT_TRUE(both.applies_to(u8"a.html", u8"blog"));
    EXPECT_FALSE(both.applies_to(u8"a.html", u8"shop"));
}

} // namespace
} // namespace tpp
