#include <algorithm>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tpp/util/result.hpp"
#include "tpp/util/strings.hpp"
#include "tpp/util/transparent_comparison.hpp"

#include "tpp/ast.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"
#include "tpp/inheritance.hpp"
#include "tpp/parse.hpp"
#include "tpp/services.hpp"

namespace tpp {
namespace {

constexpr std::u8string_view block_super = u8"block.super";

using Block_Map = std::unordered_map<
    std::u8string,
    const ast::Node*,
    Transparent_String_View_Hash8,
    Transparent_String_View_Equals8>;

[[nodiscard]]
bool is_directive(const ast::Node& node, std::u8string_view name)
{
    return node.is(ast::Node_Kind::directive) && node.get_name() == name;
}

[[nodiscard]]
bool is_block(const ast::Node& node)
{
    return is_directive(node, u8"block") && node.is_block_directive();
}

[[nodiscard]]
std::u8string_view block_name(const ast::Node& block)
{
    std::u8string_view result;
    for_each_word(block.get_arguments(), [&](std::u8string_view word) {
        if (result.empty()) {
            result = word;
        }
    });
    return result;
}

[[nodiscard]]
bool is_block_super(const ast::Node& node)
{
    return node.is(ast::Node_Kind::expression) && trim_whitespace(node.get_text()) == block_super;
}

/// @brief Returns the value of the only argument if it is a string literal.
[[nodiscard]]
std::optional<std::u8string> single_string_argument(std::u8string_view arguments)
{
    const std::vector<std::u8string_view> parts = split_arguments(arguments);
    if (parts.size() != 1) {
        return {};
    }
    std::optional<Literal_Argument> value = literal_value(parts[0]);
    if (!value || value->kind != Literal_Kind::string) {
        return {};
    }
    return std::move(value->value);
}

/// @brief Returns `true` if `block.super` is used anywhere in `nodes`
/// other than as a plain `{{ block.super }}` expression.
[[nodiscard]]
bool has_complex_block_super(std::span<const ast::Node> nodes)
{
    for (const ast::Node& node : nodes) {
        if (node.is(ast::Node_Kind::expression)) {
            if (!is_block_super(node) && node.get_text().contains(block_super)) {
                return true;
            }
        }
        else if (node.is(ast::Node_Kind::directive)) {
            if (node.get_arguments().contains(block_super)) {
                return true;
            }
            for (const ast::Branch& branch : node.get_branches()) {
                if (branch.arguments.contains(block_super)
                    || has_complex_block_super(branch.children)) {
                    return true;
                }
            }
        }
    }
    return false;
}

void collect_blocks(Block_Map& out, std::span<const ast::Node> nodes)
{
    for (const ast::Node& node : nodes) {
        if (!node.is(ast::Node_Kind::directive)) {
            continue;
        }
        if (is_block(node)) {
            out.try_emplace(std::u8string { block_name(node) }, &node);
        }
        for (const ast::Branch& branch : node.get_branches()) {
            collect_blocks(out, branch.children);
        }
    }
}

/// @brief Replaces the blocks of a base template with the blocks of a child template.
struct [[nodiscard]] Block_Overrider {
    const Block_Map& child_blocks;
    const Block_Map& base_blocks;

    void override_blocks(ast::Node_List& nodes) const
    {
        for (ast::Node& node : nodes) {
            if (!node.is(ast::Node_Kind::directive)) {
                continue;
            }
            if (is_block(node)) {
                const auto it = child_blocks.find(block_name(node));
                if (it != child_blocks.end()) {
                    ast::Node_List super_content = node.get_branches().front().children;
                    override_blocks(super_content);
                    ast::Node replacement = *it->second;
                    fill_block(replacement, super_content);
                    node = std::move(replacement);
                    continue;
                }
            }
            for (ast::Branch& branch : node.get_branches()) {
                override_blocks(branch.children);
            }
        }
    }

private:
    /// @brief Substitutes `{{ block.super }}` within a block of the child template.
    void fill_block(ast::Node& block, const ast::Node_List& super_content) const
    {
        for (ast::Branch& branch : block.get_branches()) {
            branch.children = substitute(std::move(branch.children), super_content);
        }
    }

    [[nodiscard]]
    ast::Node_List substitute(ast::Node_List&& nodes, const ast::Node_List& super_content) const
    {
        ast::Node_List result;
        for (ast::Node& node : nodes) {
            if (is_block_super(node)) {
                result.insert(result.end(), super_content.begin(), super_content.end());
                continue;
            }
            if (is_block(node)) {
                // A nested block of the child template refers to the base block of its own name.
                ast::Node_List nested_super;
                const auto it = base_blocks.find(block_name(node));
                if (it != base_blocks.end()) {
                    nested_super = it->second->get_branches().front().children;
                    override_blocks(nested_super);
                }
                fill_block(node, nested_super);
            }
            else if (node.is(ast::Node_Kind::directive)) {
                for (ast::Branch& branch : node.get_branches()) {
                    branch.children = substitute(std::move(branch.children), super_content);
                }
            }
            result.push_back(std::move(node));
        }
        return result;
    }
};

enum struct Load_Mode : Default_Underlying {
    /// @brief Resolves both `extends` and `include` within the loaded template.
    full,
    /// @brief Resolves only the `extends` chain of the loaded template.
    /// Blocks within included templates cannot be overridden,
    /// so includes of a base template are resolved after its blocks are overridden.
    extends_only,
};

struct [[nodiscard]] Inheritance_Resolver {
private:
    Template_Loader& m_loader;
    const Directive_Registry& m_registry;
    std::vector<File_Id>& m_dependencies;
    Logger& m_logger;

    std::vector<std::u8string> m_chain;
    std::pmr::unsynchronized_pool_resource m_memory;
    bool m_success = true;

public:
    Inheritance_Resolver(
        std::u8string_view template_name,
        Template_Loader& loader,
        const Directive_Registry& registry,
        std::vector<File_Id>& dependencies,
        Logger& logger
    )
        : m_loader { loader }
        , m_registry { registry }
        , m_dependencies { dependencies }
        , m_logger { logger }
    {
        if (!template_name.empty()) {
            m_chain.emplace_back(template_name);
        }
    }

    bool operator()(ast::Node_List& nodes)
    {
        resolve(nodes);
        return m_success;
    }

private:
    void error(std::u8string_view id, const File_Source_Span& location, std::u8string_view message)
    {
        m_logger.log(Severity::error, id, location, message);
        m_success = false;
    }

    void resolve(ast::Node_List& nodes)
    {
        resolve_extends(nodes);
        resolve_includes(nodes);
    }

    void resolve_extends(ast::Node_List& nodes)
    {
        const auto extends = std::ranges::find_if(nodes, [](const ast::Node& node) {
            return is_directive(node, u8"extends") && !node.is_block_directive();
        });
        if (extends == nodes.end()) {
            return;
        }
        const std::optional<std::u8string> base_name
            = single_string_argument(extends->get_arguments());
        if (!base_name) {
            return;
        }
        if (has_complex_block_super(nodes)) {
            m_logger.log(
                Severity::debug, diagnostic::inheritance_load, extends->get_source_span(),
                u8"Inheritance is not resolved because block.super is used in a complex way."
            );
            return;
        }

        std::optional<ast::Node_List> base
            = load_template(*base_name, extends->get_source_span(), Load_Mode::extends_only);
        if (!base) {
            return;
        }

        Block_Map child_blocks;
        collect_blocks(child_blocks, nodes);
        // Overriding replaces nodes in the base, so the base blocks have to be copied first.
        const ast::Node_List base_copy = *base;
        Block_Map base_blocks;
        collect_blocks(base_blocks, base_copy);

        const Block_Overrider overrider { .child_blocks = child_blocks,
                                          .base_blocks = base_blocks };
        overrider.override_blocks(*base);

        ast::Node_List result;
        for (const ast::Node& node : nodes) {
            if (is_directive(node, u8"load")) {
                result.push_back(node);
            }
        }
        result.insert(
            result.end(), std::make_move_iterator(base->begin()),
            std::make_move_iterator(base->end())
        );
        nodes = std::move(result);
    }

    void resolve_includes(ast::Node_List& nodes)
    {
        ast::Node_List result;
        for (ast::Node& node : nodes) {
            if (node.is(ast::Node_Kind::directive)) {
                for (ast::Branch& branch : node.get_branches()) {
                    resolve_includes(branch.children);
                }
            }
            if (!is_directive(node, u8"include") || node.is_block_directive()) {
                result.push_back(std::move(node));
                continue;
            }
            const std::optional<std::u8string> name = single_string_argument(node.get_arguments());
            if (!name) {
                result.push_back(std::move(node));
                continue;
            }
            std::optional<ast::Node_List> included
                = load_template(*name, node.get_source_span(), Load_Mode::full);
            if (!included) {
                result.push_back(std::move(node));
                continue;
            }
            result.insert(
                result.end(), std::make_move_iterator(included->begin()),
                std::make_move_iterator(included->end())
            );
        }
        nodes = std::move(result);
    }

    [[nodiscard]]
    std::optional<ast::Node_List>
    load_template(std::u8string_view name, const File_Source_Span& location, Load_Mode mode)
    {
        if (std::ranges::contains(m_chain, name)) {
            std::u8string message = u8"The template \"";
            message += name;
            message += u8"\" extends or includes itself.";
            error(diagnostic::inheritance_cycle, location, message);
            return {};
        }

        Result<Template_Entry, Template_Load_Error> entry = m_loader.load(name);
        if (!entry) {
            std::u8string message = u8"Failed to load the template \"";
            message += name;
            message += u8"\": ";
            message += template_load_error_message(entry.error());
            error(diagnostic::inheritance_load, location, message);
            return {};
        }
        m_dependencies.push_back(entry->id);

        const auto on_parse_error = [&](std::u8string_view id, const File_Source_Span& span,
                                        std::u8string_view message) { error(id, span, message); };
        ast::Node_List nodes;
        if (!parse_and_build(
                nodes, entry->source, entry->id, m_registry, on_parse_error, &m_memory
            )) {
            return {};
        }

        m_chain.emplace_back(name);
        if (mode == Load_Mode::full) {
            resolve(nodes);
        }
        else {
            resolve_extends(nodes);
        }
        m_chain.pop_back();
        return nodes;
    }
};

} // namespace

bool resolve_inheritance(
    ast::Node_List& nodes,
    std::u8string_view template_name,
    Template_Loader& loader,
    const Directive_Registry& registry,
    std::vector<File_Id>& dependencies,
    Logger& logger
)
{
    return Inheritance_Resolver { template_name, loader, registry, dependencies, logger }(nodes);
}

} // namespace tpp
