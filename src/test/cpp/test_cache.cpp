#include <cstddef>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "tpp/util/result.hpp"

#include "tpp/builtin_directives.hpp"
#include "tpp/cache.hpp"
#include "tpp/compile.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/options.hpp"
#include "tpp/template_loader.hpp"

#include "collecting_logger.hpp"

namespace tpp {
namespace {

struct [[nodiscard]] Cache_Fixture {
    Directive_Registry registry = make_builtin_registry();
    Collecting_Logger logger;
    Memory_Template_Loader loader;
    Compilation_Cache cache { loader, registry, logger };
};

TEST(Compilation_Cache, hit_returns_same_artifact)
{
    Cache_Fixture fixture;
    fixture.loader.set(u8"page", u8"<p>Hi</p>");

    const Cache_Result first = fixture.cache.compile(u8"page", Option_Set::defaults());
    const Cache_Result second = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(*first, *second);
    EXPECT_EQ((*first)->output, u8"<p>Hi</p>");
    EXPECT_EQ(fixture.cache.compile_count(), 1);
}

TEST(Compilation_Cache, keys)
{
    Cache_Fixture fixture;
    fixture.loader.set(u8"page", u8"<p>Hi</p>");
    const Option_Set options = Option_Set::defaults();

    const Cache_Result plain = fixture.cache.compile(u8"page", options);
    const Cache_Result debug = fixture.cache.compile(u8"page", options, true);
    const Cache_Result other_options
        = fixture.cache.compile(u8"page", options.with(Option_Flag::compile_css));
    ASSERT_TRUE(plain && debug && other_options);
    EXPECT_EQ(fixture.cache.compile_count(), 3);
    EXPECT_NE(*plain, *debug);
    EXPECT_NE(*plain, *other_options);
    EXPECT_TRUE((*debug)->output.starts_with(debug_marker_prefix));
    EXPECT_FALSE((*debug)->debug_map.empty());

    ASSERT_TRUE(fixture.cache.compile(u8"page", options, true));
    EXPECT_EQ(fixture.cache.compile_count(), 3);
}

TEST(Compilation_Cache, recompile)
{
    Cache_Fixture fixture;
    fixture.loader.set(u8"page", u8"<p>Hi</p>");
    const Cache_Result first = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_TRUE(first);

    fixture.loader.set(u8"page", u8"<p>Bye</p>");
    const Cache_Result stale = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_TRUE(stale);
    EXPECT_EQ((*stale)->output, u8"<p>Hi</p>");

    const Cache_Result fresh = fixture.cache.recompile(u8"page", Option_Set::defaults());
    ASSERT_TRUE(fresh);
    EXPECT_EQ((*fresh)->output, u8"<p>Bye</p>");
    EXPECT_EQ(fixture.cache.compile_count(), 2);

    // The previous artifact stays valid for those who hold it.
    EXPECT_EQ((*first)->output, u8"<p>Hi</p>");

    const Cache_Result hit = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_TRUE(hit);
    EXPECT_EQ(*hit, *fresh);
}

TEST(Compilation_Cache, invalidate)
{
    Cache_Fixture fixture;
    fixture.loader.set(u8"a", u8"a");
    fixture.loader.set(u8"b", u8"b");
    ASSERT_TRUE(fixture.cache.compile(u8"a", Option_Set::defaults()));
    ASSERT_TRUE(fixture.cache.compile(u8"a", Option_Set::defaults(), true));
    ASSERT_TRUE(fixture.cache.compile(u8"b", Option_Set::defaults()));
    EXPECT_EQ(fixture.cache.compile_count(), 3);

    fixture.cache.invalidate(u8"a");
    ASSERT_TRUE(fixture.cache.compile(u8"a", Option_Set::defaults()));
    ASSERT_TRUE(fixture.cache.compile(u8"a", Option_Set::defaults(), true));
    ASSERT_TRUE(fixture.cache.compile(u8"b", Option_Set::defaults()));
    EXPECT_EQ(fixture.cache.compile_count(), 5);

    fixture.cache.clear();
    ASSERT_TRUE(fixture.cache.compile(u8"b", Option_Set::defaults()));
    EXPECT_EQ(fixture.cache.compile_count(), 6);
}

TEST(Compilation_Cache, dependencies_are_not_tracked)
{
    Cache_Fixture fixture;
    fixture.loader.set(u8"base", u8"<p>{% block a %}base{% endblock %}</p>");
    fixture.loader.set(u8"page", u8"{% extends \"base\" %}");
    const Cache_Result first = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_TRUE(first);
    EXPECT_EQ((*first)->output, u8"<p>{%block a%}base{%endblock%}</p>");

    fixture.loader.set(u8"base", u8"<div>{% block a %}base{% endblock %}</div>");
    fixture.cache.invalidate(u8"base");
    const Cache_Result second = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_TRUE(second);
    EXPECT_EQ(*second, *first);

    fixture.cache.invalidate(u8"page");
    const Cache_Result third = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_TRUE(third);
    EXPECT_EQ((*third)->output, u8"<div>{%block a%}base{%endblock%}</div>");
}

TEST(Compilation_Cache, failures_are_not_cached)
{
    Cache_Fixture fixture;
    const Cache_Result missing = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, Compile_Error_Kind::io);
    EXPECT_TRUE(fixture.logger.was_logged(diagnostic::io));

    fixture.loader.set(u8"page", u8"{% if x %}");
    const Cache_Result broken = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().kind, Compile_Error_Kind::parse);

    fixture.loader.set(u8"page", u8"{% if x %}y{% endif %}");
    const Cache_Result fixed = fixture.cache.compile(u8"page", Option_Set::defaults());
    ASSERT_TRUE(fixed);
    EXPECT_EQ((*fixed)->output, u8"{%if x%}y{%endif%}");
    EXPECT_EQ(fixture.cache.compile_count(), 3);
}

TEST(Compilation_Cache, failed_entries_are_removed)
{
    Cache_Fixture fixture;
    fixture.loader.set(u8"good", u8"<p>Hi</p>");
    ASSERT_TRUE(fixture.cache.compile(u8"good", Option_Set::defaults()));
    EXPECT_EQ(fixture.cache.entry_count(), 1);

    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(fixture.cache.compile(u8"missing", Option_Set::defaults()));
        EXPECT_FALSE(fixture.cache.compile(u8"missing", Option_Set::defaults(), true));
    }
    EXPECT_EQ(fixture.cache.entry_count(), 1);
    EXPECT_EQ(fixture.cache.compile_count(), 7);

    // A failed recompilation keeps the artifact that was cached before.
    fixture.loader.set(u8"good", u8"{% if x %}");
    EXPECT_FALSE(fixture.cache.recompile(u8"good", Option_Set::defaults()));
    EXPECT_EQ(fixture.cache.entry_count(), 1);
    const Cache_Result stale = fixture.cache.compile(u8"good", Option_Set::defaults());
    ASSERT_TRUE(stale);
    EXPECT_EQ((*stale)->output, u8"<p>Hi</p>");
}

TEST(Compilation_Cache, concurrent_compilation_of_one_key)
{
    constexpr std::size_t thread_count = 8;

    Cache_Fixture fixture;
    fixture.loader.set(u8"page", u8"<ul>{% for x in xs %}<li>{{ x }}</li>{% endfor %}</ul>");

    std::vector<Shared_Artifact> artifacts(thread_count);
    {
        std::vector<std::jthread> threads;
        threads.reserve(thread_count);
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([&fixture, &artifacts, i] {
                Cache_Result result = fixture.cache.compile(u8"page", Option_Set::defaults());
                if (result) {
                    artifacts[i] = *result;
                }
            });
        }
    }

    EXPECT_EQ(fixture.cache.compile_count(), 1);
    for (const Shared_Artifact& artifact : artifacts) {
        ASSERT_NE(artifact, nullptr);
        EXPECT_EQ(artifact, artifacts.front());
    }
}

TEST(Compilation_Cache, concurrent_compilation_of_many_keys)
{
    constexpr std::size_t thread_count = 8;

    Cache_Fixture fixture;
    fixture.loader.set(u8"a", u8"<p>a</p>");
    fixture.loader.set(u8"b", u8"<p>b</p>");

    {
        std::vector<std::jthread> threads;
        threads.reserve(thread_count);
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([&fixture, i] {
                const bool debug = i % 2 == 0;
                const auto name = i % 4 < 2 ? u8"a" : u8"b";
                for (int repetition = 0; repetition < 10; ++repetition) {
                    const Cache_Result result
                        = fixture.cache.compile(name, Option_Set::defaults(), debug);
                    EXPECT_TRUE(result);
                }
            });
        }
    }

    EXPECT_EQ(fixture.cache.compile_count(), 4);
}

} // namespace
} // namespace tpp
