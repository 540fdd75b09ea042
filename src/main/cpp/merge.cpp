#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tpp/util/ascii_algorithm.hpp"
#include "tpp/util/source_position.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/ast.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/fwd.hpp"
#include "tpp/minify.hpp"
#include "tpp/normalize.hpp"
#include "tpp/options.hpp"
#include "tpp/passes.hpp"
#include "tpp/services.hpp"

namespace tpp {
namespace {

constexpr std::u8string_view javascript_types[] {
    u8"text/javascript",        u8"application/javascript", u8"application/x-javascript",
    u8"text/ecmascript",        u8"application/ecmascript",
};

constexpr std::u8string_view no_merge_attribute = u8"data-no-merge";

[[nodiscard]]
bool is_type_of(const ast::Node& element, std::span<const std::u8string_view> accepted)
{
    const ast::Node* const type = ast::find_attribute(element.get_attributes(), u8"type");
    if (!type) {
        return true;
    }
    if (!ast::is_literal_text(type->get_children())) {
        return false;
    }
    const std::u8string value = ast::literal_text(type->get_children());
    const std::u8string_view trimmed = trim_whitespace(value);
    return std::ranges::any_of(accepted, [&](std::u8string_view t) {
        return ascii::equals_ignore_case(trimmed, t);
    });
}

/// @brief Returns the kind of an embedded script or stylesheet,
/// or `std::nullopt` if `node` is neither.
/// Scripts with a `src` attribute and scripts or styles of other types are not embedded.
[[nodiscard]]
std::optional<Asset_Kind> embedded_asset_kind(const ast::Node& node)
{
    if (!node.is(ast::Node_Kind::element) || !node.get_end_span()) {
        return {};
    }
    if (ascii::equals_ignore_case(node.get_name(), u8"script")) {
        if (ast::find_attribute(node.get_attributes(), u8"src")
            || !is_type_of(node, javascript_types)) {
            return {};
        }
        return Asset_Kind::javascript;
    }
    if (ascii::equals_ignore_case(node.get_name(), u8"style")) {
        constexpr std::u8string_view css_types[] { u8"text/css" };
        if (!is_type_of(node, css_types)) {
            return {};
        }
        return Asset_Kind::css;
    }
    return {};
}

struct Embedded_Asset {
    ast::Node_List* list;
    std::size_t index;
    Asset_Kind kind;
    /// @brief The options in effect at the element.
    Option_Set options;
    bool in_branch;
    bool minified = false;
    bool erased = false;

    [[nodiscard]]
    ast::Node& element() const
    {
        return (*list)[index];
    }
};

/// @brief A part of the code that is minified, with its origin.
struct Code_Part {
    std::size_t begin;
    std::u8string_view text;
    File_Source_Span origin;
};

struct [[nodiscard]] Asset_Merger {
private:
    Pass_Context& m_context;
    Option_Set m_options;
    std::vector<Embedded_Asset> m_assets;
    bool m_success = true;

public:
    Asset_Merger(Pass_Context& context, Option_Set options)
        : m_context { context }
        , m_options { options }
    {
    }

    bool operator()(ast::Node_List& nodes)
    {
        collect(nodes, false);
        merge(Asset_Kind::javascript);
        merge(Asset_Kind::css);
        compile();
        // Erasing in reverse document order keeps the locations of the remaining assets valid.
        for (auto it = m_assets.rbegin(); it != m_assets.rend(); ++it) {
            if (it->erased) {
                it->list->erase(it->list->begin() + std::ptrdiff_t(it->index));
            }
        }
        return m_success;
    }

private:
    void collect(ast::Node_List& nodes, bool in_branch)
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
                if (const std::optional<Asset_Kind> kind = embedded_asset_kind(node)) {
                    m_assets.push_back({ .list = &nodes,
                                         .index = i,
                                         .kind = *kind,
                                         .options = m_options,
                                         .in_branch = in_branch });
                }
                collect(node.get_children(), in_branch);
                break;
            }
            case ast::Node_Kind::element_open: {
                apply_option_nodes(m_options, node.get_attributes());
                break;
            }
            case ast::Node_Kind::directive: {
                for (ast::Branch& branch : node.get_branches()) {
                    collect(branch.children, true);
                }
                break;
            }
            default: break;
            }
        }
    }

    void skip(const ast::Node& element, std::u8string_view reason)
    {
        m_context.logger.log(
            Severity::debug, diagnostic::merge_skipped, element.get_source_span(), reason
        );
    }

    [[nodiscard]]
    static Option_Flag merge_flag(Asset_Kind kind)
    {
        return kind == Asset_Kind::javascript ? Option_Flag::merge_internal_javascript
                                              : Option_Flag::merge_internal_css;
    }

    [[nodiscard]]
    static Option_Flag compile_flag(Asset_Kind kind)
    {
        return kind == Asset_Kind::javascript ? Option_Flag::compile_javascript
                                              : Option_Flag::compile_css;
    }

    [[nodiscard]]
    bool is_mergeable(const Embedded_Asset& asset)
    {
        const ast::Node& element = asset.element();
        if (asset.in_branch) {
            skip(element, u8"This element is not merged because it is inside a directive.");
            return false;
        }
        if (ast::find_attribute(element.get_attributes(), no_merge_attribute)) {
            return false;
        }
        const auto is_type_attribute = [](const ast::Node& item) {
            return item.is(ast::Node_Kind::attribute)
                && ascii::equals_ignore_case(item.get_name(), u8"type");
        };
        if (!std::ranges::all_of(element.get_attributes(), is_type_attribute)) {
            skip(element, u8"This element is not merged because it has attributes besides type.");
            return false;
        }
        if (!ast::is_literal_text(element.get_children())) {
            skip(element, u8"This element is not merged because its content is not literal.");
            return false;
        }
        return true;
    }

    void merge(Asset_Kind kind)
    {
        std::vector<Embedded_Asset*> group;
        for (Embedded_Asset& asset : m_assets) {
            if (asset.kind == kind && asset.options.contains(merge_flag(kind))
                && is_mergeable(asset)) {
                group.push_back(&asset);
            }
        }
        if (group.empty()) {
            return;
        }

        std::u8string combined;
        std::vector<std::u8string> texts;
        texts.reserve(group.size());
        for (const Embedded_Asset* asset : group) {
            texts.push_back(ast::literal_text(asset->element().get_children()));
        }
        std::vector<Code_Part> parts;
        for (std::size_t i = 0; i < group.size(); ++i) {
            if (i != 0) {
                combined += kind == Asset_Kind::javascript ? u8";\n" : u8"\n";
            }
            parts.push_back({ .begin = combined.size(),
                              .text = texts[i],
                              .origin = content_origin(group[i]->element()) });
            combined += texts[i];
        }

        replace_content(*group.front(), minify(kind, combined, parts, group.front()->options));
        for (std::size_t i = 1; i < group.size(); ++i) {
            group[i]->erased = true;
        }
    }

    void compile()
    {
        for (Embedded_Asset& asset : m_assets) {
            if (asset.erased || asset.minified
                || !asset.options.contains(compile_flag(asset.kind))) {
                continue;
            }
            const ast::Node& element = asset.element();
            if (!ast::is_literal_text(element.get_children())) {
                skip(
                    element, u8"This element is not compiled because its content is not literal."
                );
                continue;
            }
            const std::u8string text = ast::literal_text(element.get_children());
            const Code_Part part { .begin = 0, .text = text, .origin = content_origin(element) };
            replace_content(asset, minify(asset.kind, text, { &part, 1 }, asset.options));
        }
    }

    [[nodiscard]]
    static File_Source_Span content_origin(const ast::Node& element)
    {
        const ast::Node_List& children = element.get_children();
        return children.empty() ? element.get_source_span() : children.front().get_source_span();
    }

    static void replace_content(Embedded_Asset& asset, std::u8string&& code)
    {
        ast::Node& element = asset.element();
        const File_Source_Span origin = content_origin(element);
        ast::Node_List& children = element.get_children();
        children.clear();
        if (!code.empty()) {
            children.push_back(ast::Node::text(origin, std::move(code)));
        }
        asset.minified = true;
    }

    [[nodiscard]]
    static Javascript_Minify_Options javascript_options(Option_Set options)
    {
        return { .rename_local_variables
                 = options.contains(Option_Flag::rename_javascript_variables),
                 .require_semicolons
                 = options.contains(Option_Flag::validate_javascript_semicolons),
                 .check_gettext = options.contains(Option_Flag::validate_javascript_gettext) };
    }

    /// @param options the options in effect at the first element of the code
    [[nodiscard]]
    std::u8string minify(
        Asset_Kind kind,
        std::u8string_view code,
        std::span<const Code_Part> parts,
        Option_Set options
    )
    {
        const auto on_diagnostic = [&](Severity severity, std::u8string_view id, std::size_t begin,
                                       std::size_t length, std::u8string_view message) {
            const auto part = std::ranges::find_if(parts, [&](const Code_Part& p) {
                return begin >= p.begin && begin <= p.begin + p.text.length();
            });
            File_Source_Span location = parts.front().origin;
            if (part != parts.end()) {
                const std::size_t offset = begin - part->begin;
                const std::size_t available = part->text.length() - offset;
                location = File_Source_Span {
                    advanced(part->origin, part->text, offset),
                    std::min(length, available),
                    part->origin.file,
                };
            }
            m_context.logger.log(severity, id, location, message);
            if (severity >= Severity::error) {
                m_success = false;
            }
        };

        std::u8string result;
        const bool success = kind == Asset_Kind::javascript
            ? minify_javascript(result, code, javascript_options(options), on_diagnostic)
            : minify_css(result, code, on_diagnostic);
        if (!success) {
            m_success = false;
        }
        return result;
    }
};

} // namespace

bool merge_scripts_and_styles(ast::Node_List& nodes, Option_Set options, Pass_Context& context)
{
    return Asset_Merger { context, options }(nodes);
}

} // namespace tpp
