#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tpp/util/assert.hpp"
#include "tpp/util/html_names.hpp"
#include "tpp/util/source_position.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/ast.hpp"
#include "tpp/fwd.hpp"
#include "tpp/generate.hpp"

namespace tpp {
namespace {

enum struct Generation_Context : Default_Underlying {
    /// @brief Between tags.
    content,
    /// @brief Within a raw text element like `<script>`, where markers would change the meaning.
    raw_text,
    /// @brief Among the attributes of a tag.
    tag,
    /// @brief Within an attribute value.
    attribute_value,
};

/// @brief Returns whether a position after `text` is within an HTML comment,
/// given whether the start of `text` is.
[[nodiscard]]
bool is_in_html_comment_after(bool in_comment, std::u8string_view text)
{
    std::size_t i = 0;
    while (i < text.length()) {
        const std::u8string_view delimiter = in_comment ? u8"-->" : u8"<!--";
        const std::size_t found = text.find(delimiter, i);
        if (found == std::u8string_view::npos) {
            break;
        }
        in_comment = !in_comment;
        i = found + delimiter.length();
    }
    return in_comment;
}

[[nodiscard]]
File_Source_Span full_span(const ast::Node& node)
{
    const std::optional<File_Source_Span>& end = node.get_end_span();
    return end ? node.get_source_span().until(*end) : node.get_source_span();
}

void append_number(std::u8string& out, std::size_t n)
{
    const std::string digits = std::to_string(n);
    out += as_u8string_view(digits);
}

struct [[nodiscard]] Generator {
private:
    std::u8string& m_out;
    std::vector<Debug_Record>* const m_debug_map;

    std::size_t m_next_id = 0;
    bool m_in_html_comment = false;
    // The lower-case name of a raw text element whose open tag was generated without
    // generating its close tag yet.
    std::u8string m_open_raw_text_element;

public:
    Generator(std::u8string& out, std::vector<Debug_Record>* debug_map)
        : m_out { out }
        , m_debug_map { debug_map }
    {
    }

    void generate_nodes(std::span<const ast::Node> nodes, Generation_Context context)
    {
        for (const ast::Node& node : nodes) {
            generate_node(node, context);
        }
    }

private:
    void generate_node(const ast::Node& node, Generation_Context context)
    {
        if (!wants_markers(node, context)) {
            generate_unmarked(node, context);
            return;
        }

        const std::size_t id = m_next_id++;
        m_out += debug_marker_prefix;
        append_number(m_out, id);
        m_out += debug_marker_suffix;

        const std::size_t output_begin = m_out.size();
        const std::size_t record_index = m_debug_map->size();
        const File_Source_Span span = full_span(node);
        m_debug_map->push_back({ .id = id,
                                 .output_begin = output_begin,
                                 .output_length = 0,
                                 .file = span.file,
                                 .line = span.line,
                                 .column = span.column,
                                 .length = span.length });

        generate_unmarked(node, context);

        (*m_debug_map)[record_index].output_length = m_out.size() - output_begin;
        m_out += debug_marker_end_prefix;
        append_number(m_out, id);
        m_out += debug_marker_suffix;
    }

    [[nodiscard]]
    bool wants_markers(const ast::Node& node, Generation_Context context) const
    {
        if (m_debug_map == nullptr || context != Generation_Context::content
            || m_in_html_comment || !m_open_raw_text_element.empty()) {
            return false;
        }
        switch (node.get_kind()) {
        case ast::Node_Kind::text: {
            return !is_html_whitespace(node.get_text())
                && !is_in_html_comment_after(false, node.get_text());
        }
        case ast::Node_Kind::expression:
        case ast::Node_Kind::element:
        case ast::Node_Kind::element_close: return true;
        case ast::Node_Kind::element_open: {
            return !is_html_raw_text_element(to_ascii_lower(node.get_name()));
        }
        case ast::Node_Kind::directive: return !changes_comment_state(node);
        default: return false;
        }
    }

    /// @brief Returns `true` if the output of `node` opens or closes an HTML comment
    /// without closing or reopening it.
    [[nodiscard]]
    static bool changes_comment_state(const ast::Node& node)
    {
        std::u8string output;
        Generator { output, nullptr }.generate_node(node, Generation_Context::content);
        return is_in_html_comment_after(false, output);
    }

    void generate_unmarked(const ast::Node& node, Generation_Context context)
    {
        // Attributes bring their own separating space;
        // everything else among them must not stick to the tag name or the previous value.
        if (context == Generation_Context::tag && !node.is(ast::Node_Kind::attribute)) {
            m_out += u8' ';
        }
        switch (node.get_kind()) {
        case ast::Node_Kind::text: {
            append_protected_text(m_out, node.get_text());
            if (context == Generation_Context::content && m_open_raw_text_element.empty()) {
                m_in_html_comment = is_in_html_comment_after(m_in_html_comment, node.get_text());
            }
            return;
        }
        case ast::Node_Kind::expression: {
            const std::u8string_view expression = node.get_text();
            m_out += u8"{{";
            m_out += expression;
            m_out += expression.ends_with(u8'}') ? u8" }}" : u8"}}";
            return;
        }
        case ast::Node_Kind::directive: {
            generate_directive(node, context);
            return;
        }
        case ast::Node_Kind::element: {
            generate_element(node);
            return;
        }
        case ast::Node_Kind::element_open: {
            generate_open_tag(node);
            std::u8string lower_name = to_ascii_lower(node.get_name());
            if (is_html_raw_text_element(lower_name)) {
                m_open_raw_text_element = std::move(lower_name);
            }
            return;
        }
        case ast::Node_Kind::element_close: {
            m_out += u8"</";
            m_out += node.get_name();
            m_out += u8'>';
            if (to_ascii_lower(node.get_name()) == m_open_raw_text_element) {
                m_open_raw_text_element.clear();
            }
            return;
        }
        case ast::Node_Kind::attribute: {
            generate_attribute(node);
            return;
        }
        case ast::Node_Kind::raw: {
            m_out += u8"{#!raw#}";
            m_out += node.get_text();
            m_out += u8"{#!endraw#}";
            return;
        }
        case ast::Node_Kind::comment: {
            m_out += u8"{#";
            m_out += node.get_text();
            m_out += u8"#}";
            return;
        }
        case ast::Node_Kind::option: {
            m_out += u8"{#! ";
            m_out += node.get_text();
            m_out += u8"#}";
            return;
        }
        }
        TPP_ASSERT_UNREACHABLE(u8"Invalid node kind.");
    }

    void generate_tag(std::u8string_view name, std::u8string_view arguments)
    {
        m_out += u8"{%";
        m_out += name;
        if (!arguments.empty()) {
            m_out += u8' ';
            m_out += arguments;
            if (arguments.ends_with(u8'%')) {
                m_out += u8' ';
            }
        }
        m_out += u8"%}";
    }

    void generate_directive(const ast::Node& node, Generation_Context context)
    {
        if (!node.is_block_directive()) {
            generate_tag(node.get_name(), node.get_arguments());
            return;
        }
        for (const ast::Branch& branch : node.get_branches()) {
            generate_tag(branch.keyword, branch.arguments);
            generate_nodes(branch.children, context);
        }
        std::u8string end_name = u8"end";
        end_name += node.get_name();
        generate_tag(end_name, node.get_end_arguments());
    }

    void generate_open_tag(const ast::Node& node)
    {
        m_out += u8'<';
        m_out += node.get_name();
        const ast::Node_List& items = node.get_attributes();
        generate_nodes(items, Generation_Context::tag);
        if (node.is_self_closing()) {
            const bool ends_in_unquoted_value = !items.empty()
                && items.back().is(ast::Node_Kind::attribute) && items.back().has_value()
                && items.back().get_quote() == 0;
            m_out += ends_in_unquoted_value ? u8" />" : u8"/>";
        }
        else {
            m_out += u8'>';
        }
    }

    void generate_element(const ast::Node& node)
    {
        generate_open_tag(node);
        const bool raw_text = is_html_raw_text_element(to_ascii_lower(node.get_name()));
        generate_nodes(
            node.get_children(),
            raw_text ? Generation_Context::raw_text : Generation_Context::content
        );
        if (node.get_end_span()) {
            m_out += u8"</";
            m_out += node.get_name();
            m_out += u8'>';
        }
    }

    void generate_attribute(const ast::Node& node)
    {
        m_out += u8' ';
        m_out += node.get_name();
        if (!node.has_value()) {
            return;
        }
        m_out += u8'=';
        if (node.get_quote() != 0) {
            m_out += node.get_quote();
        }
        generate_nodes(node.get_children(), Generation_Context::attribute_value);
        if (node.get_quote() != 0) {
            m_out += node.get_quote();
        }
    }
};

[[nodiscard]]
bool generate_static_node(std::u8string& out, const ast::Node& node)
{
    switch (node.get_kind()) {
    case ast::Node_Kind::text: {
        out += node.get_text();
        return true;
    }
    case ast::Node_Kind::element: {
        out += u8'<';
        out += node.get_name();
        for (const ast::Node& item : node.get_attributes()) {
            if (!item.is(ast::Node_Kind::attribute) || !ast::is_literal_text(item.get_children())) {
                return false;
            }
            out += u8' ';
            out += item.get_name();
            if (item.has_value()) {
                out += u8'=';
                if (item.get_quote() != 0) {
                    out += item.get_quote();
                }
                out += ast::literal_text(item.get_children());
                if (item.get_quote() != 0) {
                    out += item.get_quote();
                }
            }
        }
        out += node.is_self_closing() ? u8" />" : u8">";
        if (!generate_static_html(out, node.get_children())) {
            return false;
        }
        if (node.get_end_span()) {
            out += u8"</";
            out += node.get_name();
            out += u8'>';
        }
        return true;
    }
    default: return false;
    }
}

} // namespace

void append_protected_text(std::u8string& out, std::u8string_view text)
{
    for (std::size_t i = 0; i < text.length(); ++i) {
        if (text[i] != u8'{') {
            out += text[i];
            continue;
        }
        if (i + 1 == text.length()) {
            out += u8"{%templatetag openbrace%}";
            continue;
        }
        switch (text[i + 1]) {
        case u8'%': out += u8"{%templatetag openblock%}"; break;
        case u8'{': out += u8"{%templatetag openvariable%}"; break;
        case u8'#': out += u8"{%templatetag opencomment%}"; break;
        default: out += u8'{'; continue;
        }
        ++i;
    }
}

void generate(
    std::u8string& out,
    std::span<const ast::Node> nodes,
    std::vector<Debug_Record>* debug_map
)
{
    Generator { out, debug_map }.generate_nodes(nodes, Generation_Context::content);
}

Compiled_Artifact generate(
    std::span<const ast::Node> nodes,
    Option_Set options,
    std::vector<File_Id> files,
    bool debug
)
{
    Compiled_Artifact result { .output = {},
                               .debug_map = {},
                               .options = options,
                               .files = std::move(files) };
    generate(result.output, nodes, debug ? &result.debug_map : nullptr);
    return result;
}

bool generate_static_html(std::u8string& out, std::span<const ast::Node> nodes)
{
    for (const ast::Node& node : nodes) {
        if (!generate_static_node(out, node)) {
            return false;
        }
    }
    return true;
}

} // namespace tpp
