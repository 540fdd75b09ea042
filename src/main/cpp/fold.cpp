#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tpp/util/result.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/ast.hpp"
#include "tpp/builtin_directives.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"
#include "tpp/generate.hpp"
#include "tpp/parse.hpp"
#include "tpp/passes.hpp"
#include "tpp/services.hpp"

namespace tpp {
namespace {

/// @brief Returns the text that a literal expression like `{{ "abc" }}` or `{{ 1.50 }}` renders,
/// or `std::nullopt` if the expression is not a single literal.
[[nodiscard]]
std::optional<std::u8string> literal_expression_text(std::u8string_view expression)
{
    const std::vector<std::u8string_view> parts = split_arguments(expression);
    if (parts.size() != 1) {
        return {};
    }
    std::optional<Literal_Argument> literal = literal_value(parts[0]);
    if (!literal) {
        return {};
    }
    if (literal->kind == Literal_Kind::number) {
        return format_number_literal(literal->value);
    }
    return std::move(literal->value);
}

/// @brief Returns `true` if `text` would be read back as markup rather than as plain text.
/// Folding such text would change the structure of the compiled template.
[[nodiscard]]
bool contains_markup(std::u8string_view text)
{
    return text.find_first_of(u8"<>&") != std::u8string_view::npos;
}

struct [[nodiscard]] Constant_Folder {
private:
    Pass_Context& m_context;
    bool m_success = true;

public:
    explicit Constant_Folder(Pass_Context& context)
        : m_context { context }
    {
    }

    bool operator()(ast::Node_List& nodes)
    {
        fold_list(nodes);
        return m_success;
    }

private:
    void fold_list(ast::Node_List& nodes)
    {
        for (std::size_t i = 0; i < nodes.size();) {
            ast::Node& node = nodes[i];
            switch (node.get_kind()) {
            case ast::Node_Kind::comment: {
                nodes.erase(nodes.begin() + std::ptrdiff_t(i));
                continue;
            }
            case ast::Node_Kind::expression: {
                std::optional<std::u8string> text = literal_expression_text(node.get_text());
                if (text && !contains_markup(*text)) {
                    node = ast::Node::text(node.get_source_span(), std::move(*text));
                }
                else if (text) {
                    log_markup_not_folded(node);
                }
                break;
            }
            case ast::Node_Kind::directive: {
                if (std::optional<std::u8string> text = fold_directive(node)) {
                    node = ast::Node::text(full_span(node), std::move(*text));
                }
                break;
            }
            case ast::Node_Kind::element: {
                fold_list(node.get_attributes());
                fold_list(node.get_children());
                break;
            }
            case ast::Node_Kind::element_open: {
                fold_list(node.get_attributes());
                break;
            }
            case ast::Node_Kind::attribute: {
                fold_list(node.get_children());
                break;
            }
            case ast::Node_Kind::text:
            case ast::Node_Kind::option:
            case ast::Node_Kind::element_close:
            case ast::Node_Kind::raw: break;
            }
            ++i;
        }
    }

    [[nodiscard]]
    static File_Source_Span full_span(const ast::Node& node)
    {
        const std::optional<File_Source_Span>& end = node.get_end_span();
        return end ? node.get_source_span().until(*end) : node.get_source_span();
    }

    void fold_branches(ast::Node& directive)
    {
        for (ast::Branch& branch : directive.get_branches()) {
            fold_list(branch.children);
        }
    }

    /// @brief Folds the content of `directive` and evaluates it if possible.
    /// @returns the output of the directive, or `std::nullopt` if it cannot be folded
    [[nodiscard]]
    std::optional<std::u8string> fold_directive(ast::Node& directive)
    {
        const Directive_Entry* const entry = m_context.registry.find(directive.get_name());
        if (!entry) {
            fold_branches(directive);
            if (!directive.is_block_directive()) {
                warn_unknown(directive);
            }
            return {};
        }
        if (!entry->is_pure()) {
            fold_branches(directive);
            return {};
        }
        if (!directive.is_block_directive() || (entry->block && entry->block->ignores_content)) {
            std::optional<std::u8string> result = evaluate(directive, *entry, {});
            if (result && contains_markup(*result)) {
                log_markup_not_folded(directive);
                return {};
            }
            return result;
        }

        fold_branches(directive);
        if (directive.get_branches().size() != 1) {
            return {};
        }
        std::u8string content;
        if (!generate_static_html(content, directive.get_branches().front().children)) {
            m_context.logger.log(
                Severity::debug, diagnostic::fold_failed, directive.get_source_span(),
                u8"This directive was not folded because its content is not static."
            );
            return {};
        }
        return evaluate(directive, *entry, content);
    }

    [[nodiscard]]
    std::optional<std::u8string> evaluate(
        const ast::Node& directive,
        const Directive_Entry& entry,
        std::optional<std::u8string_view> content
    )
    {
        const std::u8string_view raw_arguments = directive.get_arguments();
        std::vector<Literal_Argument> arguments;
        if (entry.shape != Argument_Shape::opaque) {
            for (const std::u8string_view part : split_arguments(raw_arguments)) {
                if (entry.shape == Argument_Shape::keywords) {
                    arguments.push_back({ Literal_Kind::keyword, std::u8string { part } });
                    continue;
                }
                std::optional<Literal_Argument> literal = literal_value(part);
                if (!literal) {
                    return {};
                }
                arguments.push_back(std::move(*literal));
            }
        }
        const Fold_Input input { .arguments = arguments,
                                 .raw_arguments = raw_arguments,
                                 .content = content };

        Result<std::u8string, std::u8string> result { error_tag, u8"" };
        try {
            result = entry.evaluator(input);
        } catch (const std::exception& e) {
            result = Result<std::u8string, std::u8string> { error_tag, to_u8string(e.what()) };
        }
        if (!result) {
            std::u8string message = u8"Evaluation of \"";
            message += entry.name;
            message += u8"\" failed: ";
            message += result.error();
            m_context.logger.log(
                Severity::error, diagnostic::fold_failed, full_span(directive), message
            );
            m_success = false;
            return {};
        }
        return std::move(*result);
    }

    void log_markup_not_folded(const ast::Node& node)
    {
        m_context.logger.log(
            Severity::debug, diagnostic::fold_failed, node.get_source_span(),
            u8"This was not folded because its output contains markup characters."
        );
    }

    void warn_unknown(const ast::Node& directive)
    {
        std::u8string message = u8"The directive \"";
        message += directive.get_name();
        message += u8"\" is not registered, so it is assumed to depend on the rendering context.";
        const std::u8string_view suggestion
            = m_context.registry.suggest(directive.get_name(), m_context.memory);
        if (!suggestion.empty()) {
            message += u8" Did you mean \"";
            message += suggestion;
            message += u8"\"?";
        }
        m_context.logger.log(
            Severity::soft_warning, diagnostic::directive_unknown, directive.get_source_span(),
            message
        );
    }
};

} // namespace

bool fold_constants(ast::Node_List& nodes, Option_Set, Pass_Context& context)
{
    // Folding is not affected by any option.
    return Constant_Folder { context }(nodes);
}

} // namespace tpp
