#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tpp/util/ascii_algorithm.hpp"
#include "tpp/util/html_names.hpp"
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

/// @brief Returns `true` if an attribute named `name` is among `items`,
/// including within the branches of directives.
[[nodiscard]]
bool has_attribute_anywhere(std::span<const ast::Node> items, std::u8string_view name)
{
    for (const ast::Node& item : items) {
        if (item.is(ast::Node_Kind::attribute)
            && ascii::equals_ignore_case(item.get_name(), name)) {
            return true;
        }
        if (item.is(ast::Node_Kind::directive)) {
            for (const ast::Branch& branch : item.get_branches()) {
                if (has_attribute_anywhere(branch.children, name)) {
                    return true;
                }
            }
        }
    }
    return false;
}

[[nodiscard]]
bool is_empty_class_attribute(const ast::Node& item)
{
    if (!item.is(ast::Node_Kind::attribute)
        || !ascii::equals_ignore_case(item.get_name(), u8"class")) {
        return false;
    }
    return !item.has_value()
        || (ast::is_literal_text(item.get_children())
            && is_html_whitespace(ast::literal_text(item.get_children())));
}

struct [[nodiscard]] Html_Validator {
private:
    Pass_Context& m_context;
    Option_Set m_options;
    bool m_success = true;

public:
    Html_Validator(Pass_Context& context, Option_Set options)
        : m_context { context }
        , m_options { options }
    {
    }

    bool operator()(ast::Node_List& nodes)
    {
        validate_list(nodes);
        return m_success;
    }

private:
    void validate_list(ast::Node_List& nodes)
    {
        for (ast::Node& node : nodes) {
            switch (node.get_kind()) {
            case ast::Node_Kind::option: {
                apply_option_node(m_options, node);
                break;
            }
            case ast::Node_Kind::element: {
                validate_tag(node);
                validate_list(node.get_children());
                break;
            }
            case ast::Node_Kind::element_open: {
                validate_tag(node);
                break;
            }
            case ast::Node_Kind::directive: {
                for (ast::Branch& branch : node.get_branches()) {
                    validate_list(branch.children);
                }
                break;
            }
            default: break;
            }
        }
    }

    void
    report(std::u8string_view id, const File_Source_Span& location, std::u8string_view message)
    {
        if (m_options.contains(Option_Flag::html_validation_warnings)) {
            m_context.logger.log(Severity::warning, id, location, message);
            return;
        }
        m_context.logger.log(Severity::error, id, location, message);
        m_success = false;
    }

    void validate_tag(ast::Node& element)
    {
        ast::Node_List& items = element.get_attributes();
        if (m_options.contains(Option_Flag::html_remove_empty_class_attributes)) {
            std::erase_if(items, is_empty_class_attribute);
        }
        if (m_options.contains(Option_Flag::validate_html)) {
            check_attribute_names(items);
            check_duplicates(items);
            if (m_options.contains(Option_Flag::html_check_alt_and_title_attributes)) {
                check_required_attributes(element);
            }
        }
        apply_option_nodes(m_options, items);
    }

    void check_attribute_names(std::span<const ast::Node> items)
    {
        for (const ast::Node& item : items) {
            if (item.is(ast::Node_Kind::attribute) && !is_html_attribute_name(item.get_name())) {
                std::u8string message = u8"\"";
                message += item.get_name();
                message += u8"\" is not a valid attribute name.";
                report(diagnostic::validation_attribute_name, item.get_source_span(), message);
            }
            if (item.is(ast::Node_Kind::directive)) {
                for (const ast::Branch& branch : item.get_branches()) {
                    check_attribute_names(branch.children);
                }
            }
        }
    }

    /// @brief Only attributes outside of directives are checked
    /// because attributes in different branches are alternatives.
    void check_duplicates(std::span<const ast::Node> items)
    {
        std::vector<std::u8string> seen;
        for (const ast::Node& item : items) {
            if (!item.is(ast::Node_Kind::attribute)) {
                continue;
            }
            std::u8string lower_name = to_ascii_lower(item.get_name());
            if (std::ranges::contains(seen, lower_name)) {
                std::u8string message = u8"The attribute \"";
                message += item.get_name();
                message += u8"\" appears more than once.";
                report(
                    diagnostic::validation_attribute_duplicate, item.get_source_span(), message
                );
                continue;
            }
            seen.push_back(std::move(lower_name));
        }
    }

    void check_required_attributes(const ast::Node& element)
    {
        const std::u8string lower_name = to_ascii_lower(element.get_name());
        if ((lower_name == u8"img" || lower_name == u8"area")
            && !has_attribute_anywhere(element.get_attributes(), u8"alt")) {
            std::u8string message = u8"The <";
            message += lower_name;
            message += u8"> element has no alt attribute.";
            report(diagnostic::validation_alt, element.get_source_span(), message);
        }
        if ((lower_name == u8"abbr" || lower_name == u8"acronym")
            && !has_attribute_anywhere(element.get_attributes(), u8"title")) {
            std::u8string message = u8"The <";
            message += lower_name;
            message += u8"> element has no title attribute.";
            report(diagnostic::validation_title, element.get_source_span(), message);
        }
    }
};

} // namespace

bool validate_html(ast::Node_List& nodes, Option_Set options, Pass_Context& context)
{
    return Html_Validator { context, options }(nodes);
}

} // namespace tpp
