#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tpp/util/chars.hpp"
#include "tpp/util/html_names.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/ast.hpp"
#include "tpp/fwd.hpp"
#include "tpp/normalize.hpp"
#include "tpp/options.hpp"
#include "tpp/passes.hpp"

namespace tpp {
namespace {

/// @brief Replaces every run of HTML whitespace with a single space.
[[nodiscard]]
std::u8string collapse_whitespace(std::u8string_view text)
{
    std::u8string result;
    result.reserve(text.size());
    bool in_whitespace = false;
    for (const char8_t c : text) {
        if (is_html_whitespace(c)) {
            if (!in_whitespace) {
                result += u8' ';
            }
            in_whitespace = true;
        }
        else {
            result += c;
            in_whitespace = false;
        }
    }
    return result;
}

/// @brief Returns `true` if whitespace next to `node` has no effect when rendered
/// because `node` starts or ends a block.
[[nodiscard]]
bool is_block_boundary(const ast::Node& node)
{
    switch (node.get_kind()) {
    case ast::Node_Kind::element:
    case ast::Node_Kind::element_open:
    case ast::Node_Kind::element_close: {
        return is_html_block_element(to_ascii_lower(node.get_name()));
    }
    default: return false;
    }
}

struct [[nodiscard]] Whitespace_Compressor {
private:
    Option_Set m_options;
    // Pair ids of whitespace-preserving elements which were opened by an `element_open` node.
    std::vector<std::size_t> m_open_preserving_pairs;
    // Nesting depth within whitespace-preserving `element` nodes.
    std::size_t m_preserving_depth = 0;

public:
    explicit Whitespace_Compressor(Option_Set options)
        : m_options { options }
    {
    }

    void operator()(ast::Node_List& nodes)
    {
        compress_list(nodes, true);
    }

private:
    [[nodiscard]]
    bool is_active() const
    {
        return m_options.contains(Option_Flag::whitespace_compression)
            && m_options.contains(Option_Flag::html) && m_preserving_depth == 0
            && m_open_preserving_pairs.empty();
    }

    /// @param edges_are_boundaries `true` if the start and end of `nodes` are block boundaries
    void compress_list(ast::Node_List& nodes, bool edges_are_boundaries)
    {
        for (std::size_t i = 0; i < nodes.size();) {
            ast::Node& node = nodes[i];
            switch (node.get_kind()) {
            case ast::Node_Kind::text: {
                if (is_active() && !compress_text(nodes, i, edges_are_boundaries)) {
                    nodes.erase(nodes.begin() + std::ptrdiff_t(i));
                    continue;
                }
                break;
            }
            case ast::Node_Kind::option: {
                apply_option_node(m_options, node);
                break;
            }
            case ast::Node_Kind::element: {
                apply_option_nodes(m_options, node.get_attributes());
                const std::u8string lower_name = to_ascii_lower(node.get_name());
                const bool preserving = is_html_whitespace_preserving_element(lower_name);
                if (preserving) {
                    ++m_preserving_depth;
                }
                compress_list(node.get_children(), is_html_block_element(lower_name));
                if (preserving) {
                    --m_preserving_depth;
                }
                break;
            }
            case ast::Node_Kind::element_open: {
                apply_option_nodes(m_options, node.get_attributes());
                if (is_html_whitespace_preserving_element(to_ascii_lower(node.get_name()))
                    && !std::ranges::contains(m_open_preserving_pairs, node.get_pair_id())) {
                    m_open_preserving_pairs.push_back(node.get_pair_id());
                }
                break;
            }
            case ast::Node_Kind::element_close: {
                std::erase(m_open_preserving_pairs, node.get_pair_id());
                break;
            }
            case ast::Node_Kind::directive: {
                compress_branches(node);
                break;
            }
            case ast::Node_Kind::expression:
            case ast::Node_Kind::attribute:
            case ast::Node_Kind::raw:
            case ast::Node_Kind::comment: break;
            }
            ++i;
        }
    }

    /// @brief Every branch starts with the elements that were open before the directive;
    /// afterwards, an element is open if any branch left it open.
    void compress_branches(ast::Node& directive)
    {
        const std::vector<std::size_t> entry_pairs = m_open_preserving_pairs;
        std::vector<std::size_t> exit_pairs = entry_pairs;
        for (ast::Branch& branch : directive.get_branches()) {
            m_open_preserving_pairs = entry_pairs;
            compress_list(branch.children, false);
            for (const std::size_t id : m_open_preserving_pairs) {
                if (!std::ranges::contains(exit_pairs, id)) {
                    exit_pairs.push_back(id);
                }
            }
        }
        m_open_preserving_pairs = std::move(exit_pairs);
    }

    /// @brief Merges the text node at `index` with the following text nodes
    /// and compresses its whitespace.
    /// @returns `false` if the text node should be removed
    [[nodiscard]]
    bool compress_text(ast::Node_List& nodes, std::size_t index, bool edges_are_boundaries)
    {
        std::u8string text { nodes[index].get_text() };
        File_Source_Span span = nodes[index].get_source_span();
        while (index + 1 < nodes.size() && nodes[index + 1].is(ast::Node_Kind::text)) {
            text += nodes[index + 1].get_text();
            span = span.until(nodes[index + 1].get_source_span());
            nodes.erase(nodes.begin() + std::ptrdiff_t(index + 1));
        }

        std::u8string collapsed = collapse_whitespace(text);
        if (collapsed.empty()) {
            return false;
        }
        if (collapsed == u8" ") {
            const bool boundary_before
                = index == 0 ? edges_are_boundaries : is_block_boundary(nodes[index - 1]);
            const bool boundary_after = index + 1 == nodes.size()
                ? edges_are_boundaries
                : is_block_boundary(nodes[index + 1]);
            if (boundary_before && boundary_after) {
                return false;
            }
        }
        nodes[index] = ast::Node::text(span, std::move(collapsed));
        return true;
    }
};

} // namespace

bool compress_whitespace(ast::Node_List& nodes, Option_Set options, Pass_Context&)
{
    Whitespace_Compressor { options }(nodes);
    return true;
}

} // namespace tpp
