#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tpp/util/ascii_algorithm.hpp"
#include "tpp/util/result.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/ast.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/fwd.hpp"
#include "tpp/normalize.hpp"
#include "tpp/options.hpp"
#include "tpp/passes.hpp"
#include "tpp/services.hpp"

namespace tpp {
namespace {

/// @brief An external script or stylesheet which can be packed.
struct External_Asset {
    Asset_Kind kind;
    /// @brief The name of the attribute holding the URL.
    std::u8string_view url_attribute;
    std::u8string url;
};

[[nodiscard]]
bool has_only_attributes(const ast::Node& element, std::span<const std::u8string_view> names)
{
    return std::ranges::all_of(element.get_attributes(), [&](const ast::Node& item) {
        return item.is(ast::Node_Kind::attribute)
            && std::ranges::any_of(names, [&](std::u8string_view name) {
                   return ascii::equals_ignore_case(item.get_name(), name);
               });
    });
}

[[nodiscard]]
bool literal_attribute_equals(
    const ast::Node& element,
    std::u8string_view name,
    std::u8string_view expected
)
{
    const std::optional<std::u8string> value
        = ast::find_literal_attribute(element.get_attributes(), name);
    return value && ascii::equals_ignore_case(trim_whitespace(*value), expected);
}

/// @brief Returns the asset that `node` refers to if it is a `<script src>` or
/// `<link rel=stylesheet href>` element with a literal URL and nothing else that matters.
[[nodiscard]]
std::optional<External_Asset> external_asset(const ast::Node& node)
{
    if (!node.is(ast::Node_Kind::element)) {
        return {};
    }
    if (ascii::equals_ignore_case(node.get_name(), u8"script")) {
        constexpr std::u8string_view allowed[] { u8"src", u8"type" };
        if (!has_only_attributes(node, allowed)
            || (ast::find_attribute(node.get_attributes(), u8"type")
                && !literal_attribute_equals(node, u8"type", u8"text/javascript"))
            || !ast::is_literal_text(node.get_children())
            || !is_html_whitespace(ast::literal_text(node.get_children()))) {
            return {};
        }
        std::optional<std::u8string> src
            = ast::find_literal_attribute(node.get_attributes(), u8"src");
        if (!src || src->empty()) {
            return {};
        }
        return External_Asset { Asset_Kind::javascript, u8"src", std::move(*src) };
    }
    if (ascii::equals_ignore_case(node.get_name(), u8"link")) {
        constexpr std::u8string_view allowed[] { u8"rel", u8"href", u8"type" };
        if (!has_only_attributes(node, allowed)
            || !literal_attribute_equals(node, u8"rel", u8"stylesheet")
            || (ast::find_attribute(node.get_attributes(), u8"type")
                && !literal_attribute_equals(node, u8"type", u8"text/css"))) {
            return {};
        }
        std::optional<std::u8string> href
            = ast::find_literal_attribute(node.get_attributes(), u8"href");
        if (!href || href->empty()) {
            return {};
        }
        return External_Asset { Asset_Kind::css, u8"href", std::move(*href) };
    }
    return {};
}

[[nodiscard]]
bool is_whitespace_text(const ast::Node& node)
{
    return node.is(ast::Node_Kind::text) && is_html_whitespace(node.get_text());
}

struct [[nodiscard]] Asset_Packer_Pass {
private:
    Pass_Context& m_context;
    Option_Set m_options;

public:
    Asset_Packer_Pass(Pass_Context& context, Option_Set options)
        : m_context { context }
        , m_options { options }
    {
    }

    void operator()(ast::Node_List& nodes)
    {
        pack_list(nodes, false);
    }

private:
    [[nodiscard]]
    bool is_enabled(Asset_Kind kind) const
    {
        return m_options.contains(
            kind == Asset_Kind::javascript ? Option_Flag::pack_external_javascript
                                           : Option_Flag::pack_external_css
        );
    }

    void pack_list(ast::Node_List& nodes, bool in_branch)
    {
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            ast::Node& node = nodes[i];
            switch (node.get_kind()) {
            case ast::Node_Kind::option: {
                apply_option_node(m_options, node);
                break;
            }
            case ast::Node_Kind::element: {
                apply_option_nodes(m_options, node.get_attributes());
                std::optional<External_Asset> asset = external_asset(node);
                if (asset && !in_branch && is_enabled(asset->kind)) {
                    pack_group(nodes, i, std::move(*asset));
                }
                else {
                    pack_list(node.get_children(), in_branch);
                }
                break;
            }
            case ast::Node_Kind::element_open: {
                apply_option_nodes(m_options, node.get_attributes());
                break;
            }
            case ast::Node_Kind::directive: {
                for (ast::Branch& branch : node.get_branches()) {
                    pack_list(branch.children, true);
                }
                break;
            }
            default: break;
            }
        }
    }

    /// @brief Packs the group of assets starting with `first` at `nodes[index]`.
    /// Only whitespace may separate the members of a group.
    void pack_group(ast::Node_List& nodes, std::size_t index, External_Asset&& first)
    {
        std::vector<std::u8string> urls { std::move(first.url) };
        std::size_t last = index;
        for (std::size_t j = index + 1; j < nodes.size(); ++j) {
            if (is_whitespace_text(nodes[j])) {
                continue;
            }
            std::optional<External_Asset> next = external_asset(nodes[j]);
            if (!next || next->kind != first.kind) {
                break;
            }
            urls.push_back(std::move(next->url));
            last = j;
        }
        if (urls.size() < 2) {
            return;
        }

        const File_Source_Span group_span
            = nodes[index].get_source_span().until(nodes[last].get_source_span());
        if (!m_context.packer) {
            m_context.logger.log(
                Severity::debug, diagnostic::pack_unavailable, group_span,
                u8"These elements are not packed because no asset packer is available."
            );
            return;
        }

        const std::vector<std::u8string_view> url_views(urls.begin(), urls.end());
        Result<std::u8string, std::u8string> bundle
            = m_context.packer->pack(first.kind, url_views);
        if (!bundle) {
            std::u8string message = u8"Packing failed: ";
            message += bundle.error();
            m_context.logger.log(Severity::warning, diagnostic::pack_failed, group_span, message);
            return;
        }

        ast::Node_List& attributes = nodes[index].get_attributes();
        for (ast::Node& attribute : attributes) {
            if (ascii::equals_ignore_case(attribute.get_name(), first.url_attribute)) {
                const File_Source_Span span = attribute.get_source_span();
                ast::Node_List value;
                value.push_back(ast::Node::text(span, std::move(*bundle)));
                attribute = ast::Node::attribute(
                    span, std::u8string { attribute.get_name() }, std::move(value), u8'"'
                );
                break;
            }
        }
        nodes.erase(
            nodes.begin() + std::ptrdiff_t(index + 1), nodes.begin() + std::ptrdiff_t(last + 1)
        );
    }
};

} // namespace

bool pack_external_assets(ast::Node_List& nodes, Option_Set options, Pass_Context& context)
{
    Asset_Packer_Pass { context, options }(nodes);
    return true;
}

} // namespace tpp
