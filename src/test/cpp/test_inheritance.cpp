#include <filesystem>
#include <fstream>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "tpp/util/result.hpp"
#include "tpp/util/source_position.hpp"

#include "tpp/ast.hpp"
#include "tpp/builtin_directives.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"
#include "tpp/generate.hpp"
#include "tpp/inheritance.hpp"
#include "tpp/parse.hpp"
#include "tpp/services.hpp"
#include "tpp/template_loader.hpp"

#include "collecting_logger.hpp"

namespace tpp {
namespace {

struct [[nodiscard]] Inheritance_Actual {
    Memory_Template_Loader loader;
    Collecting_Logger logger;
    std::pmr::monotonic_buffer_resource memory;
    ast::Node_List nodes;
    std::vector<File_Id> dependencies;
    std::u8string output;
    bool success = false;
};

void run_resolve(
    Inheritance_Actual& out,
    std::u8string_view source,
    std::u8string_view template_name = u8""
)
{
    static const Directive_Registry registry = make_builtin_registry();
    const auto on_error
        = [&](std::u8string_view id, const File_Source_Span& location, std::u8string_view message) {
              out.logger.log(Severity::error, id, location, message);
          };
    ASSERT_TRUE(
        parse_and_build(out.nodes, source, File_Id::main, registry, on_error, &out.memory)
    );
    out.success = resolve_inheritance(
        out.nodes, template_name, out.loader, registry, out.dependencies, out.logger
    );
    generate(out.output, out.nodes);
}

TEST(Inheritance, no_inheritance)
{
    Inheritance_Actual actual;
    run_resolve(actual, u8"<p>{% block a %}x{% endblock %}</p>");
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(actual.output, u8"<p>{%block a%}x{%endblock%}</p>");
    EXPECT_TRUE(actual.dependencies.empty());
    EXPECT_TRUE(actual.logger.nothing_logged());
}

TEST(Inheritance, extends)
{
    Inheritance_Actual actual;
    actual.loader.set(
        u8"base.html",
        u8"<title>{% block title %}Base{% endblock %}</title>{% block body %}{% endblock %}"
    );
    run_resolve(
        actual,
        u8"{% extends \"base.html\" %}{% load static %}"
        u8"{% block title %}Child{% endblock title %}ignored"
    );
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(
        actual.output,
        u8"{%load static%}<title>{%block title%}Child{%endblock title%}</title>"
        u8"{%block body%}{%endblock%}"
    );
    ASSERT_EQ(actual.dependencies.size(), 1);
    EXPECT_EQ(actual.dependencies[0], File_Id(0));
}

TEST(Inheritance, block_super)
{
    Inheritance_Actual actual;
    actual.loader.set(u8"base", u8"{% block a %}A{% endblock %}");
    run_resolve(actual, u8"{% extends \"base\" %}{% block a %}[{{ block.super }}]{% endblock %}");
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(actual.output, u8"{%block a%}[A]{%endblock%}");
}

TEST(Inheritance, multi_level)
{
    Inheritance_Actual actual;
    actual.loader.set(u8"grand", u8"{% block a %}G{% endblock %}{% block b %}g{% endblock %}");
    actual.loader.set(
        u8"mid", u8"{% extends 'grand' %}{% block a %}M{{ block.super }}{% endblock %}"
    );
    run_resolve(actual, u8"{% extends \"mid\" %}{% block b %}C{% endblock %}");
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(actual.output, u8"{%block a%}MG{%endblock%}{%block b%}C{%endblock%}");

    const std::vector<File_Id> expected_dependencies { File_Id(0), File_Id(1) };
    EXPECT_EQ(actual.dependencies, expected_dependencies);
}

TEST(Inheritance, nested_blocks)
{
    Inheritance_Actual actual;
    actual.loader.set(
        u8"base", u8"{% block outer %}<{% block inner %}i{% endblock %}>{% endblock %}"
    );
    run_resolve(actual, u8"{% extends \"base\" %}{% block inner %}I{% endblock %}");
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(actual.output, u8"{%block outer%}<{%block inner%}I{%endblock%}>{%endblock%}");
}

TEST(Inheritance, dynamic_extends_is_kept)
{
    Inheritance_Actual actual;
    run_resolve(actual, u8"{% extends parent %}{% block a %}x{% endblock %}");
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(actual.output, u8"{%extends parent%}{%block a%}x{%endblock%}");
    EXPECT_TRUE(actual.dependencies.empty());
}

TEST(Inheritance, complex_block_super_is_kept)
{
    Inheritance_Actual actual;
    actual.loader.set(u8"base", u8"{% block a %}A{% endblock %}");
    run_resolve(
        actual, u8"{% extends \"base\" %}{% block a %}{{ block.super|upper }}{% endblock %}"
    );
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(
        actual.output, u8"{%extends \"base\"%}{%block a%}{{block.super|upper}}{%endblock%}"
    );
    EXPECT_TRUE(actual.dependencies.empty());
    EXPECT_FALSE(actual.logger.any_at_least(Severity::warning));
}

TEST(Inheritance, include)
{
    Inheritance_Actual actual;
    actual.loader.set(u8"header", u8"<h1>{{ title }}</h1>");
    run_resolve(
        actual, u8"a{% include \"header\" %}b{% if x %}{% include 'header' %}{% endif %}"
    );
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(actual.output, u8"a<h1>{{title}}</h1>b{%if x%}<h1>{{title}}</h1>{%endif%}");
    EXPECT_EQ(actual.dependencies.size(), 2);
}

TEST(Inheritance, include_blocks_not_overridden)
{
    Inheritance_Actual actual;
    actual.loader.set(u8"p.html", u8"{% block t %}A{% endblock %}");
    actual.loader.set(
        u8"base", u8"<main>{% include \"p.html\" %}</main>{% block u %}u{% endblock %}"
    );
    run_resolve(
        actual,
        u8"{% extends \"base\" %}{% block t %}B{% endblock %}{% block u %}U{% endblock %}"
    );
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(actual.output, u8"<main>{%block t%}A{%endblock%}</main>{%block u%}U{%endblock%}");
    EXPECT_EQ(actual.dependencies.size(), 2);
}

TEST(Inheritance, include_with_arguments_is_kept)
{
    Inheritance_Actual actual;
    actual.loader.set(u8"header", u8"<h1></h1>");
    run_resolve(actual, u8"{% include \"header\" with x=1 %}{% include name %}");
    EXPECT_TRUE(actual.success);
    EXPECT_EQ(actual.output, u8"{%include \"header\" with x=1%}{%include name%}");
    EXPECT_TRUE(actual.dependencies.empty());
}

TEST(Inheritance, include_cycle)
{
    Inheritance_Actual actual;
    actual.loader.set(u8"a", u8"{% include \"b\" %}");
    actual.loader.set(u8"b", u8"{% include \"a\" %}");
    run_resolve(actual, u8"{% include \"b\" %}", u8"a");
    EXPECT_FALSE(actual.success);
    EXPECT_EQ(actual.logger.count(diagnostic::inheritance_cycle), 1);
    EXPECT_EQ(actual.output, u8"{%include \"a\"%}");
}

TEST(Inheritance, extends_itself)
{
    Inheritance_Actual actual;
    actual.loader.set(u8"page", u8"{% extends \"page\" %}");
    run_resolve(actual, u8"{% extends \"page\" %}{% block a %}{% endblock %}", u8"page");
    EXPECT_FALSE(actual.success);
    EXPECT_EQ(actual.logger.count(diagnostic::inheritance_cycle), 1);
    EXPECT_TRUE(actual.dependencies.empty());
}

TEST(Inheritance, missing_template)
{
    Inheritance_Actual actual;
    run_resolve(actual, u8"x{% include \"missing\" %}");
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.logger.count(diagnostic::inheritance_load), 1);
    EXPECT_TRUE(actual.logger.diagnostics[0].message.contains(u8"missing"));
    EXPECT_EQ(actual.output, u8"x{%include \"missing\"%}");
}

TEST(Inheritance, parse_error_in_loaded_template)
{
    Inheritance_Actual actual;
    actual.loader.set(u8"broken", u8"{% if x %}");
    run_resolve(actual, u8"{% include \"broken\" %}");
    EXPECT_FALSE(actual.success);
    ASSERT_EQ(actual.logger.count(diagnostic::parse_unmatched_open), 1);
    EXPECT_EQ(actual.logger.diagnostics[0].location.file, File_Id(0));
}

TEST(Memory_Template_Loader, load_and_replace)
{
    Memory_Template_Loader loader;
    EXPECT_EQ(loader.load(u8"x").error(), Template_Load_Error::not_found);

    loader.set(u8"x", u8"1");
    const Result<Template_Entry, Template_Load_Error> first = loader.load(u8"x");
    ASSERT_TRUE(first);
    EXPECT_EQ(first->source, u8"1");
    EXPECT_EQ(first->name, u8"x");

    loader.set(u8"x", u8"2");
    const Result<Template_Entry, Template_Load_Error> second = loader.load(u8"x");
    ASSERT_TRUE(second);
    EXPECT_EQ(second->source, u8"2");
    EXPECT_NE(first->id, second->id);
    EXPECT_EQ(first->source, u8"1");

    const std::optional<Template_Entry> found = loader.find(first->id);
    ASSERT_TRUE(found);
    EXPECT_EQ(found->source, u8"1");
    EXPECT_FALSE(loader.find(File_Id(99)));
    EXPECT_FALSE(loader.find(File_Id::main));
}

TEST(Filesystem_Template_Loader, load)
{
    const std::filesystem::path root
        = std::filesystem::temp_directory_path() / "tpp_test_filesystem_loader";
    std::filesystem::create_directories(root / "emails");
    {
        std::ofstream file { root / "emails" / "welcome.html" };
        file << "<p>Welcome</p>";
    }

    Filesystem_Template_Loader loader { root };
    const Result<Template_Entry, Template_Load_Error> entry = loader.load(u8"emails/welcome.html");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->source, u8"<p>Welcome</p>");
    EXPECT_EQ(entry->name, u8"emails/welcome.html");
    EXPECT_TRUE(loader.find(entry->id));

    EXPECT_EQ(loader.load(u8"emails/missing.html").error(), Template_Load_Error::not_found);

    std::filesystem::remove_all(root);
}

} // namespace
} // namespace tpp
