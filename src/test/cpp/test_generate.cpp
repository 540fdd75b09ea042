#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "tpp/util/source_position.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/ast.hpp"
#include "tpp/builtin_directives.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"
#include "tpp/generate.hpp"
#include "tpp/normalize.hpp"
#include "tpp/options.hpp"
#include "tpp/parse.hpp"
#include "tpp/services.hpp"

namespace tpp {
namespace {

[[nodiscard]]
std::u8string protected_text(std::u8string_view text)
{
    std::u8string result;
    append_protected_text(result, text);
    return result;
}

struct [[nodiscard]] Generate_Actual {
    std::pmr::monotonic_buffer_resource memory;
    ast::Node_List nodes;
    std::u8string output;
    std::vector<Debug_Record> debug_map;
};

/// @brief Parses and normalizes `source`, and generates it,
/// with debug markers if `debug` is `true`.
void run_generate(Generate_Actual& out, std::u8string_view source, bool debug = false)
{
    static const Directive_Registry registry = make_builtin_registry();
    ast::Node_List parsed;
    ASSERT_TRUE(parse_and_build(parsed, source, File_Id::main, registry, {}, &out.memory));
    Ignorant_Logger logger { Severity::min };
    ASSERT_TRUE(
        normalize(out.nodes, std::move(parsed), registry, Option_Set::defaults(), logger)
    );
    generate(out.output, out.nodes, debug ? &out.debug_map : nullptr);
}

TEST(Append_Protected_Text, plain)
{
    EXPECT_EQ(protected_text(u8""), u8"");
    EXPECT_EQ(protected_text(u8"a{b}c"), u8"a{b}c");
    EXPECT_EQ(protected_text(u8"%}}}#}"), u8"%}}}#}");
}

TEST(Append_Protected_Text, template_tags)
{
    EXPECT_EQ(protected_text(u8"{%"), u8"{%templatetag openblock%}");
    EXPECT_EQ(protected_text(u8"{{x}}"), u8"{%templatetag openvariable%}x}}");
    EXPECT_EQ(protected_text(u8"a{#b"), u8"a{%templatetag opencomment%}b");
    EXPECT_EQ(protected_text(u8"x{"), u8"x{%templatetag openbrace%}");
    EXPECT_EQ(protected_text(u8"{{{"), u8"{%templatetag openvariable%}{%templatetag openbrace%}");
}

TEST(Generate, compact_tags)
{
    Generate_Actual actual;
    run_generate(
        actual, u8"{%  for x in xs  %}{{  x  }}{% empty %}-{% endfor %}{# note #}{% ! no-html %}"
    );
    EXPECT_EQ(
        actual.output, u8"{%for x in xs%}{{x}}{%empty%}-{%endfor%}{# note #}{#! no-html#}"
    );
}

TEST(Generate, raw_block)
{
    Generate_Actual actual;
    run_generate(actual, u8"{% !raw %}<div><span>{% broken_tag %}{% !endraw %}");
    EXPECT_EQ(actual.output, u8"{#!raw#}<div><span>{% broken_tag %}{#!endraw#}");
}

TEST(Generate, directives_among_attributes)
{
    Generate_Actual actual;
    run_generate(
        actual,
        u8"<a {% if x %} class=\"a\" {% else %} class=\"b\" {% endif %} href=\"#\">link</a>"
    );
    EXPECT_EQ(
        actual.output, u8"<a {%if x%} class=\"a\"{%else%} class=\"b\"{%endif%} href=\"#\">link</a>"
    );
}

TEST(Generate, self_closing)
{
    Generate_Actual actual;
    run_generate(actual, u8"<img src=\"a.png\"/><img src=a.png /><br>");
    EXPECT_EQ(actual.output, u8"<img src=\"a.png\"/><img src=a.png /><br>");
}

TEST(Generate, expression_ending_in_brace)
{
    const File_Source_Span span { Source_Span {}, File_Id::main };
    const ast::Node nodes[] { ast::Node::expression(span, u8"x|default:'}'") };
    std::u8string out;
    generate(out, nodes);
    EXPECT_EQ(out, u8"{{x|default:'}'}}");

    const ast::Node brace[] { ast::Node::expression(span, u8"{a}") };
    out.clear();
    generate(out, brace);
    EXPECT_EQ(out, u8"{{{a} }}");
}

TEST(Generate, debug_markers)
{
    Generate_Actual actual;
    run_generate(actual, u8"<p>Hi</p>", true);
    EXPECT_EQ(actual.output, u8"<!--tpp:0--><p><!--tpp:1-->Hi<!--/tpp:1--></p><!--/tpp:0-->");

    const std::vector<Debug_Record> expected {
        { .id = 0,
          .output_begin = 12,
          .output_length = 34,
          .file = File_Id::main,
          .line = 0,
          .column = 0,
          .length = 9 },
        { .id = 1,
          .output_begin = 27,
          .output_length = 2,
          .file = File_Id::main,
          .line = 0,
          .column = 3,
          .length = 2 },
    };
    EXPECT_EQ(actual.debug_map, expected);
}

TEST(Generate, no_debug_markers_in_raw_text_and_comments)
{
    Generate_Actual actual;
    run_generate(actual, u8"<script>a</script><!-- {{ x }} -->\n", true);
    EXPECT_EQ(actual.output, u8"<!--tpp:0--><script>a</script><!--/tpp:0--><!-- {{x}} -->\n");
    ASSERT_EQ(actual.debug_map.size(), 1);
}

TEST(Generate, debug_records_point_into_output)
{
    Generate_Actual actual;
    run_generate(
        actual, u8"<ul>\n  <li>{{ a }}</li>\n  <li title=\"{{ b }}\">b</li>\n</ul>", true
    );
    ASSERT_FALSE(actual.debug_map.empty());
    for (std::size_t i = 0; i < actual.debug_map.size(); ++i) {
        const Debug_Record& record = actual.debug_map[i];
        EXPECT_EQ(record.id, i);
        std::u8string open_marker { debug_marker_prefix };
        open_marker += as_u8string_view(std::to_string(i));
        open_marker += debug_marker_suffix;
        ASSERT_GE(record.output_begin, open_marker.length());
        EXPECT_EQ(
            actual.output.substr(record.output_begin - open_marker.length(), open_marker.length()),
            open_marker
        );
        std::u8string close_marker { debug_marker_end_prefix };
        close_marker += as_u8string_view(std::to_string(i));
        close_marker += debug_marker_suffix;
        EXPECT_EQ(
            actual.output.substr(
                record.output_begin + record.output_length, close_marker.length()
            ),
            close_marker
        );
    }
}

TEST(Generate, artifact)
{
    Generate_Actual actual;
    run_generate(actual, u8"<p>x</p>");
    const Option_Set options = Option_Set::defaults().with(Option_Flag::compile_css);
    const std::vector<File_Id> files { File_Id::main, File_Id(3) };
    const Compiled_Artifact artifact = generate(actual.nodes, options, files, false);
    EXPECT_EQ(artifact.output, u8"<p>x</p>");
    EXPECT_TRUE(artifact.debug_map.empty());
    EXPECT_EQ(artifact.options, options);
    EXPECT_EQ(artifact.files, files);
}

TEST(Generate_Static_Html, static_nodes)
{
    Generate_Actual actual;
    run_generate(actual, u8"<p class=\"a\" hidden>x {<br></p>");
    std::u8string out;
    ASSERT_TRUE(generate_static_html(out, actual.nodes));
    EXPECT_EQ(out, u8"<p class=\"a\" hidden>x {<br></p>");
}

TEST(Generate_Static_Html, dynamic_nodes)
{
    for (const std::u8string_view source :
         { u8"<p>{{ x }}</p>", u8"<p class=\"{{ c }}\">x</p>", u8"{% if x %}y{% endif %}" }) {
        Generate_Actual actual;
        run_generate(actual, source);
        std::u8string out;
        EXPECT_FALSE(generate_static_html(out, actual.nodes));
    }
}

} // namespace
} // namespace tpp
