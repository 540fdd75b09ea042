#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tpp/util/ascii_algorithm.hpp"
#include "tpp/util/assert.hpp"
#include "tpp/util/source_position.hpp"

#include "tpp/ast.hpp"
#include "tpp/fwd.hpp"

namespace tpp::ast {

Node::Node(Node_Kind kind, const File_Source_Span& span)
    : m_kind { kind }
    , m_source_span { span }
{
}

Node Node::text(const File_Source_Span& span, std::u8string text)
{
    Node result { Node_Kind::text, span };
    result.m_text = std::move(text);
    return result;
}

Node Node::expression(const File_Source_Span& span, std::u8string expression)
{
    Node result { Node_Kind::expression, span };
    result.m_text = std::move(expression);
    return result;
}

Node Node::comment(const File_Source_Span& span, std::u8string body)
{
    Node result { Node_Kind::comment, span };
    result.m_text = std::move(body);
    return result;
}

Node Node::option(const File_Source_Span& span, std::u8string flags)
{
    Node result { Node_Kind::option, span };
    result.m_text = std::move(flags);
    return result;
}

Node Node::raw(const File_Source_Span& span, std::u8string contents)
{
    Node result { Node_Kind::raw, span };
    result.m_text = std::move(contents);
    return result;
}

Node Node::inline_directive(
    const File_Source_Span& span,
    std::u8string name,
    std::u8string arguments
)
{
    Node result { Node_Kind::directive, span };
    result.m_name = std::move(name);
    result.m_text = std::move(arguments);
    return result;
}

Node Node::block_directive(
    const File_Source_Span& span,
    std::u8string name,
    std::vector<Branch>&& branches,
    const File_Source_Span& end_span,
    std::u8string end_arguments
)
{
    TPP_ASSERT(!branches.empty());
    Node result { Node_Kind::directive, span };
    result.m_name = std::move(name);
    result.m_branches = std::move(branches);
    result.m_end_span = end_span;
    result.m_text = std::move(end_arguments);
    return result;
}

Node Node::element(
    const File_Source_Span& span,
    std::u8string name,
    Node_List&& attributes,
    Node_List&& children,
    bool self_closing,
    std::optional<File_Source_Span> end_span
)
{
    Node result { Node_Kind::element, span };
    result.m_name = std::move(name);
    result.m_attributes = std::move(attributes);
    result.m_children = std::move(children);
    result.m_self_closing = self_closing;
    result.m_end_span = end_span;
    return result;
}

Node Node::element_open(
    const File_Source_Span& span,
    std::u8string name,
    Node_List&& attributes,
    std::size_t pair_id
)
{
    Node result { Node_Kind::element_open, span };
    result.m_name = std::move(name);
    result.m_attributes = std::move(attributes);
    result.m_pair_id = pair_id;
    return result;
}

Node Node::element_close(const File_Source_Span& span, std::u8string name, std::size_t pair_id)
{
    Node result { Node_Kind::element_close, span };
    result.m_name = std::move(name);
    result.m_pair_id = pair_id;
    return result;
}

Node Node::attribute(
    const File_Source_Span& span,
    std::u8string name,
    std::optional<Node_List>&& value,
    char8_t quote
)
{
    Node result { Node_Kind::attribute, span };
    result.m_name = std::move(name);
    result.m_has_value = value.has_value();
    if (value) {
        result.m_children = std::move(*value);
    }
    result.m_quote = quote;
    return result;
}

bool is_literal_text(std::span<const Node> nodes)
{
    for (const Node& node : nodes) {
        if (!node.is(Node_Kind::text)) {
            return false;
        }
    }
    return true;
}

std::u8string literal_text(std::span<const Node> nodes)
{
    std::u8string result;
    for (const Node& node : nodes) {
        TPP_ASSERT(node.is(Node_Kind::text));
        result += node.get_text();
    }
    return result;
}

const Node* find_attribute(std::span<const Node> attributes, std::u8string_view name)
{
    for (const Node& item : attributes) {
        if (item.is(Node_Kind::attribute) && ascii::equals_ignore_case(item.get_name(), name)) {
            return &item;
        }
    }
    return nullptr;
}

std::optional<std::u8string>
find_literal_attribute(std::span<const Node> attributes, std::u8string_view name)
{
    const Node* const attribute = find_attribute(attributes, name);
    if (!attribute || !is_literal_text(attribute->get_children())) {
        return {};
    }
    return literal_text(attribute->get_children());
}

} // namespace tpp::ast
