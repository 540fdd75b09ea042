#ifndef TPP_AST_HPP
#define TPP_AST_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tpp/util/assert.hpp"
#include "tpp/util/source_position.hpp"

#include "tpp/fwd.hpp"

namespace tpp::ast {

#define TPP_NODE_KIND_ENUM_DATA(F)                                                                 \
    F(text, "text")                                                                                \
    F(expression, "expression")                                                                    \
    F(directive, "directive")                                                                      \
    F(element, "element")                                                                          \
    F(element_open, "element open tag")                                                            \
    F(element_close, "element close tag")                                                          \
    F(attribute, "attribute")                                                                      \
    F(raw, "raw block")                                                                            \
    F(comment, "comment")                                                                          \
    F(option, "option")

#define TPP_NODE_KIND_ENUMERATOR(id, name) id,

enum struct Node_Kind : Default_Underlying {
    TPP_NODE_KIND_ENUM_DATA(TPP_NODE_KIND_ENUMERATOR)
};

#define TPP_NODE_KIND_DISPLAY_NAME_CASE(id, name)                                                  \
    case Node_Kind::id: return u8##name;

[[nodiscard]]
constexpr std::u8string_view node_kind_display_name(Node_Kind kind)
{
    switch (kind) {
        TPP_NODE_KIND_ENUM_DATA(TPP_NODE_KIND_DISPLAY_NAME_CASE)
    }
    TPP_ASSERT_UNREACHABLE(u8"Invalid node kind.");
}

using Node_List = std::vector<Node>;

/// @brief One mutually exclusive render path of a block directive.
/// The first branch of a directive has the directive name as its keyword;
/// further branches are introduced by branch keywords like `elif` or `else`.
struct Branch {
    std::u8string keyword;
    std::u8string arguments;
    /// @brief The span of the tag which introduces the branch.
    File_Source_Span location;
    std::vector<Node> children;
};

/// @brief A node in the template tree.
/// Which members are meaningful depends on the kind of the node:
/// - `text`: the text (`get_text`)
/// - `expression`: the trimmed expression between `{{` and `}}` (`get_text`)
/// - `directive`: the name and either branches (block directives) or arguments (inline)
/// - `element`: tag name, attribute items, children, and the span of the close tag
/// - `element_open`: tag name, attribute items, and a pair id
/// - `element_close`: tag name and a pair id
/// - `attribute`: name, an optional value made of text, expressions, and directives, and a quote
/// - `raw`: the verbatim contents of a raw block (`get_text`)
/// - `comment`: the body of a `{# #}` comment (`get_text`)
/// - `option`: the flags of an option override (`get_text`)
///
/// Attribute items of elements are `attribute` nodes,
/// as well as expressions, comments, and directives whose branches contain attribute items.
struct Node {
public:
    [[nodiscard]]
    static Node text(const File_Source_Span& span, std::u8string text);

    [[nodiscard]]
    static Node expression(const File_Source_Span& span, std::u8string expression);

    [[nodiscard]]
    static Node comment(const File_Source_Span& span, std::u8string body);

    [[nodiscard]]
    static Node option(const File_Source_Span& span, std::u8string flags);

    [[nodiscard]]
    static Node raw(const File_Source_Span& span, std::u8string contents);

    /// @brief Creates an inline directive like `{% url "home" %}`.
    [[nodiscard]]
    static Node
    inline_directive(const File_Source_Span& span, std::u8string name, std::u8string arguments);

    /// @brief Creates a block directive like `{% if x %}...{% else %}...{% endif %}`.
    /// @param branches the branches; there is at least one
    /// @param end_span the span of the closing tag
    /// @param end_arguments arguments of the closing tag,
    /// like `content` in `{% endblock content %}`
    [[nodiscard]]
    static Node block_directive(
        const File_Source_Span& span,
        std::u8string name,
        std::vector<Branch>&& branches,
        const File_Source_Span& end_span,
        std::u8string end_arguments = {}
    );

    [[nodiscard]]
    static Node element(
        const File_Source_Span& span,
        std::u8string name,
        Node_List&& attributes,
        Node_List&& children,
        bool self_closing,
        std::optional<File_Source_Span> end_span
    );

    [[nodiscard]]
    static Node element_open(
        const File_Source_Span& span,
        std::u8string name,
        Node_List&& attributes,
        std::size_t pair_id
    );

    [[nodiscard]]
    static Node
    element_close(const File_Source_Span& span, std::u8string name, std::size_t pair_id);

    /// @brief Creates an attribute.
    /// @param value the value fragments, or `std::nullopt` for attributes without `=`
    /// @param quote `"`, `'`, or `\0` for unquoted values
    [[nodiscard]]
    static Node attribute(
        const File_Source_Span& span,
        std::u8string name,
        std::optional<Node_List>&& value,
        char8_t quote
    );

private:
    Node_Kind m_kind;
    File_Source_Span m_source_span;
    std::u8string m_name;
    std::u8string m_text;
    std::vector<Branch> m_branches;
    Node_List m_attributes;
    Node_List m_children;
    std::optional<File_Source_Span> m_end_span;
    std::size_t m_pair_id = 0;
    char8_t m_quote = 0;
    bool m_self_closing = false;
    bool m_has_value = false;

    [[nodiscard]]
    Node(Node_Kind kind, const File_Source_Span& span);

public:
    [[nodiscard]]
    Node_Kind get_kind() const
    {
        return m_kind;
    }

    [[nodiscard]]
    bool is(Node_Kind kind) const
    {
        return m_kind == kind;
    }

    [[nodiscard]]
    const File_Source_Span& get_source_span() const
    {
        return m_source_span;
    }

    /// @brief Returns the name of a directive, element, element tag, or attribute.
    [[nodiscard]]
    std::u8string_view get_name() const
    {
        TPP_ASSERT(
            m_kind == Node_Kind::directive || m_kind == Node_Kind::element
            || m_kind == Node_Kind::element_open || m_kind == Node_Kind::element_close
            || m_kind == Node_Kind::attribute
        );
        return m_name;
    }

    /// @brief Returns the text of text, expression, raw, comment, and option nodes.
    [[nodiscard]]
    std::u8string_view get_text() const
    {
        TPP_ASSERT(
            m_kind == Node_Kind::text || m_kind == Node_Kind::expression || m_kind == Node_Kind::raw
            || m_kind == Node_Kind::comment || m_kind == Node_Kind::option
        );
        return m_text;
    }

    void set_text(std::u8string text)
    {
        TPP_ASSERT(m_kind == Node_Kind::text);
        m_text = std::move(text);
    }

    /// @brief Returns `true` if this is a directive with branches,
    /// i.e. one that is closed by an `end` tag.
    [[nodiscard]]
    bool is_block_directive() const
    {
        return m_kind == Node_Kind::directive && !m_branches.empty();
    }

    /// @brief Returns the arguments of a directive.
    /// For block directives, these are the arguments of the opening tag.
    [[nodiscard]]
    std::u8string_view get_arguments() const
    {
        TPP_ASSERT(m_kind == Node_Kind::directive);
        return m_branches.empty() ? std::u8string_view { m_text }
                                  : std::u8string_view { m_branches.front().arguments };
    }

    /// @brief Returns the arguments of the closing tag of a block directive.
    [[nodiscard]]
    std::u8string_view get_end_arguments() const
    {
        TPP_ASSERT(is_block_directive());
        return m_text;
    }

    [[nodiscard]]
    std::span<const Branch> get_branches() const
    {
        TPP_ASSERT(m_kind == Node_Kind::directive);
        return m_branches;
    }

    [[nodiscard]]
    std::vector<Branch>& get_branches()
    {
        TPP_ASSERT(m_kind == Node_Kind::directive);
        return m_branches;
    }

    /// @brief Returns the attribute items of an element or element open tag.
    [[nodiscard]]
    const Node_List& get_attributes() const
    {
        TPP_ASSERT(m_kind == Node_Kind::element || m_kind == Node_Kind::element_open);
        return m_attributes;
    }

    [[nodiscard]]
    Node_List& get_attributes()
    {
        TPP_ASSERT(m_kind == Node_Kind::element || m_kind == Node_Kind::element_open);
        return m_attributes;
    }

    /// @brief Returns the children of an element, or the value fragments of an attribute.
    [[nodiscard]]
    const Node_List& get_children() const
    {
        TPP_ASSERT(m_kind == Node_Kind::element || m_kind == Node_Kind::attribute);
        return m_children;
    }

    [[nodiscard]]
    Node_List& get_children()
    {
        TPP_ASSERT(m_kind == Node_Kind::element || m_kind == Node_Kind::attribute);
        return m_children;
    }

    /// @brief Returns the span of the closing tag of an element or block directive, if any.
    [[nodiscard]]
    const std::optional<File_Source_Span>& get_end_span() const
    {
        return m_end_span;
    }

    [[nodiscard]]
    std::size_t get_pair_id() const
    {
        TPP_ASSERT(m_kind == Node_Kind::element_open || m_kind == Node_Kind::element_close);
        return m_pair_id;
    }

    void set_pair_id(std::size_t id)
    {
        TPP_ASSERT(m_kind == Node_Kind::element_open || m_kind == Node_Kind::element_close);
        m_pair_id = id;
    }

    /// @brief Returns `true` if the element was written as `<x/>`.
    [[nodiscard]]
    bool is_self_closing() const
    {
        return m_self_closing;
    }

    /// @brief Returns `true` if the attribute has a value, i.e. if it was written with `=`.
    [[nodiscard]]
    bool has_value() const
    {
        TPP_ASSERT(m_kind == Node_Kind::attribute);
        return m_has_value;
    }

    /// @brief Returns the quote character of an attribute value, or `0` if unquoted.
    [[nodiscard]]
    char8_t get_quote() const
    {
        TPP_ASSERT(m_kind == Node_Kind::attribute);
        return m_quote;
    }
};

/// @brief Returns `true` if `nodes` consists only of text nodes.
[[nodiscard]]
bool is_literal_text(std::span<const Node> nodes);

/// @brief Returns the concatenation of all text nodes in `nodes`.
/// `is_literal_text(nodes)` shall be `true`.
[[nodiscard]]
std::u8string literal_text(std::span<const Node> nodes);

/// @brief Returns the attribute named `name` (case-insensitive) among the top-level items of
/// `attributes`, or `nullptr` if there is none.
/// Attributes within directive branches are not considered.
[[nodiscard]]
const Node* find_attribute(std::span<const Node> attributes, std::u8string_view name);

/// @brief Returns the literal value of the attribute named `name`,
/// or `std::nullopt` if there is no such attribute,
/// or if its value is not literal text.
/// Attributes without value have an empty value.
[[nodiscard]]
std::optional<std::u8string>
find_literal_attribute(std::span<const Node> attributes, std::u8string_view name);

} // namespace tpp::ast

#endif
