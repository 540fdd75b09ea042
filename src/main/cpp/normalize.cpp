#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tpp/util/ascii_algorithm.hpp"
#include "tpp/util/assert.hpp"
#include "tpp/util/chars.hpp"
#include "tpp/util/html_names.hpp"
#include "tpp/util/source_position.hpp"
#include "tpp/util/strings.hpp"
#include "tpp/util/typo.hpp"

#include "tpp/ast.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"
#include "tpp/normalize.hpp"
#include "tpp/options.hpp"
#include "tpp/services.hpp"

namespace tpp {
namespace {

enum struct Html_State : Default_Underlying {
    /// @brief Between tags.
    content,
    /// @brief After `<` and the first letter of a tag name.
    tag_name,
    /// @brief After `</` and the first letter of a tag name.
    close_tag_name,
    /// @brief After the name of a close tag, until `>`.
    close_tag,
    /// @brief Inside an open tag, between attributes.
    tag,
    attribute_name,
    /// @brief After an attribute name and whitespace, where `=` may still follow.
    after_attribute_name,
    /// @brief After `=`, before the value.
    before_attribute_value,
    quoted_attribute_value,
    unquoted_attribute_value,
    /// @brief Inside `<script>`, `<style>`, `<textarea>`, or `<title>`.
    raw_text,
    /// @brief Inside `<!--`.
    html_comment,
};

/// @brief Returns `true` if the state lies between nodes rather than inside a tag.
[[nodiscard]]
constexpr bool is_between_tags(Html_State state)
{
    return state == Html_State::content || state == Html_State::raw_text
        || state == Html_State::html_comment;
}

[[nodiscard]]
constexpr bool is_value_state(Html_State state)
{
    return state == Html_State::quoted_attribute_value
        || state == Html_State::unquoted_attribute_value;
}

struct Lexical_State {
    Html_State state = Html_State::content;
    /// @brief The name of the element whose raw text we are in.
    std::u8string raw_element {};
    /// @brief The quote character within a quoted attribute value.
    char8_t quote = 0;
    /// @brief Identifies the tag that is being lexed.
    std::size_t tag_id = 0;
    /// @brief Identifies the attribute that is being lexed.
    std::size_t attribute_id = 0;

    [[nodiscard]]
    friend bool operator==(const Lexical_State&, const Lexical_State&)
        = default;

    /// @brief Returns `true` if both states are equivalent for the purpose of continuing
    /// after a directive which started between tags.
    [[nodiscard]]
    bool same_between_tags(const Lexical_State& other) const
    {
        return state == other.state && raw_element == other.raw_element;
    }
};

struct Open_Element {
    /// @brief The lower-case element name.
    std::u8string name;
    File_Source_Span span;
    /// @brief Identifies the node list that contains the `element_open` node.
    std::size_t frame;
    /// @brief The index of the `element_open` node within that list.
    std::size_t index;
    std::size_t pair_id;
};

struct Path_State {
    std::vector<Open_Element> stack;
    Lexical_State lexical;
};

[[nodiscard]]
bool same_open_elements(std::span<const Open_Element> x, std::span<const Open_Element> y)
{
    if (x.size() != y.size()) {
        return false;
    }
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (x[i].name != y[i].name) {
            return false;
        }
    }
    return true;
}

[[nodiscard]]
std::u8string describe_open_elements(std::span<const Open_Element> stack)
{
    if (stack.empty()) {
        return u8"none";
    }
    std::u8string result;
    for (const Open_Element& e : stack) {
        if (!result.empty()) {
            result += u8", ";
        }
        result += u8'<';
        result += e.name;
        result += u8'>';
    }
    return result;
}

[[nodiscard]]
File_Source_Position position_of(const File_Source_Span& span)
{
    return { span, span.file };
}

[[nodiscard]]
File_Source_Span span_between(const File_Source_Position& begin, const File_Source_Position& end)
{
    if (begin.file != end.file || end.begin < begin.begin) {
        return { Source_Position { begin }, 0, begin.file };
    }
    return { Source_Position { begin }, end.begin - begin.begin, begin.file };
}

struct Pending_Tag {
    File_Source_Position begin { {}, File_Id::main };
    std::u8string name;
    bool is_close = false;
    bool self_closing = false;
    /// @brief Whether the name has been recognized as a tag name
    /// which is interpreted as HTML.
    bool recognized = false;
    ast::Node_List items;
};

struct Pending_Attribute {
    File_Source_Position begin { {}, File_Id::main };
    std::u8string name;
    bool has_value = false;
    ast::Node_List value;
};

struct [[nodiscard]] Normalizer {
private:
    const Directive_Registry& m_registry;
    Option_Set m_options;
    Logger& m_logger;

    /// @brief The list that nodes between tags are appended to.
    ast::Node_List* m_list;
    std::size_t m_frame = 0;
    std::size_t m_next_frame = 1;
    /// @brief The list that attribute items of the pending tag are appended to.
    ast::Node_List* m_items = nullptr;
    /// @brief The list that value fragments of the pending attribute are appended to.
    ast::Node_List* m_value = nullptr;

    Path_State m_path;
    Pending_Tag m_tag;
    Pending_Attribute m_attribute;
    std::size_t m_next_markup_id = 1;

    /// @brief The start of the text that has not yet been emitted in the current text node.
    std::size_t m_segment_begin = 0;
    Source_Position m_segment_position {};
    /// @brief The index of `<` of the pending tag within the current text node.
    std::size_t m_tag_index = 0;

    std::vector<std::size_t> m_pair_parents;
    bool m_success = true;

public:
    Normalizer(
        ast::Node_List& out,
        const Directive_Registry& registry,
        Option_Set options,
        Logger& logger
    )
        : m_registry { registry }
        , m_options { options }
        , m_logger { logger }
        , m_list { &out }
    {
    }

    bool operator()(ast::Node_List&& in)
    {
        process_nodes(std::move(in));
        finish();
        for (ast::Node& node : *m_list) {
            canonicalize_pair_ids(node);
        }
        return m_success;
    }

private:
    void error(std::u8string_view id, const File_Source_Span& location, std::u8string_view message)
    {
        m_logger.log(Severity::error, id, location, message);
        m_success = false;
    }

    [[nodiscard]]
    std::size_t make_pair_id()
    {
        const std::size_t result = m_pair_parents.size();
        m_pair_parents.push_back(result);
        return result;
    }

    [[nodiscard]]
    std::size_t find_pair(std::size_t id)
    {
        while (m_pair_parents[id] != id) {
            m_pair_parents[id] = m_pair_parents[m_pair_parents[id]];
            id = m_pair_parents[id];
        }
        return id;
    }

    void unite_pairs(std::size_t x, std::size_t y)
    {
        x = find_pair(x);
        y = find_pair(y);
        if (x != y) {
            m_pair_parents[std::max(x, y)] = std::min(x, y);
        }
    }

    void canonicalize_pair_ids(ast::Node& node)
    {
        switch (node.get_kind()) {
        case ast::Node_Kind::element_open:
        case ast::Node_Kind::element_close: {
            if (node.get_pair_id() != no_pair_id) {
                node.set_pair_id(find_pair(node.get_pair_id()));
            }
            break;
        }
        case ast::Node_Kind::element: {
            for (ast::Node& child : node.get_children()) {
                canonicalize_pair_ids(child);
            }
            break;
        }
        case ast::Node_Kind::directive: {
            for (ast::Branch& branch : node.get_branches()) {
                for (ast::Node& child : branch.children) {
                    canonicalize_pair_ids(child);
                }
            }
            break;
        }
        default: break;
        }
    }

    [[nodiscard]]
    Html_State state() const
    {
        return m_path.lexical.state;
    }

    void set_state(Html_State state)
    {
        m_path.lexical.state = state;
    }

    void process_nodes(ast::Node_List&& nodes)
    {
        for (ast::Node& node : nodes) {
            process_node(std::move(node));
        }
    }

    void process_node(ast::Node&& node)
    {
        switch (node.get_kind()) {
        case ast::Node_Kind::text: {
            if (m_options.contains(Option_Flag::html)) {
                process_text(node);
            }
            else {
                m_list->push_back(std::move(node));
            }
            return;
        }
        case ast::Node_Kind::expression: {
            process_dynamic(std::move(node));
            return;
        }
        case ast::Node_Kind::directive: {
            if (node.is_block_directive()) {
                process_block(std::move(node));
            }
            else {
                process_dynamic(std::move(node));
            }
            return;
        }
        case ast::Node_Kind::raw: {
            process_dynamic(std::move(node));
            return;
        }
        case ast::Node_Kind::comment: {
            process_comment(std::move(node));
            return;
        }
        case ast::Node_Kind::option: {
            process_option(std::move(node));
            return;
        }
        case ast::Node_Kind::element:
        case ast::Node_Kind::element_open:
        case ast::Node_Kind::element_close:
        case ast::Node_Kind::attribute: break;
        }
        TPP_ASSERT_UNREACHABLE(u8"Only parsed nodes can be normalized.");
    }

    void dynamic_name_error(const ast::Node& node)
    {
        error(
            diagnostic::structure_dynamic_name, node.get_source_span(),
            u8"Tag and attribute names cannot be produced by directives or expressions."
        );
    }

    /// @brief Places a node that is not interpreted as HTML at the current position,
    /// such as an expression, an inline directive, or a raw block.
    void process_dynamic(ast::Node&& node)
    {
        if (!m_options.contains(Option_Flag::html) || is_between_tags(state())) {
            m_list->push_back(std::move(node));
            return;
        }
        switch (state()) {
        case Html_State::tag: {
            m_items->push_back(std::move(node));
            return;
        }
        case Html_State::after_attribute_name: {
            finish_attribute(position_of(node.get_source_span()));
            set_state(Html_State::tag);
            m_items->push_back(std::move(node));
            return;
        }
        case Html_State::before_attribute_value: {
            begin_unquoted_value();
            m_value->push_back(std::move(node));
            return;
        }
        case Html_State::quoted_attribute_value:
        case Html_State::unquoted_attribute_value: {
            m_value->push_back(std::move(node));
            return;
        }
        default: {
            dynamic_name_error(node);
            return;
        }
        }
    }

    void process_comment(ast::Node&& node)
    {
        if (!m_options.contains(Option_Flag::html) || is_between_tags(state())) {
            m_list->push_back(std::move(node));
            return;
        }
        switch (state()) {
        case Html_State::tag: m_items->push_back(std::move(node)); return;
        case Html_State::quoted_attribute_value:
        case Html_State::unquoted_attribute_value: m_value->push_back(std::move(node)); return;
        // Comments render nothing, so they can be dropped within names.
        default: return;
        }
    }

    void process_option(ast::Node&& node)
    {
        Option_Set updated = m_options;
        apply_option_flags(updated, node.get_text(), [&](std::u8string_view word) {
            warn_unknown_option(node, word);
        });

        const bool changes_html = updated.contains(Option_Flag::html)
                != m_options.contains(Option_Flag::html)
            || updated.contains(Option_Flag::parse_all_html_tags)
                != m_options.contains(Option_Flag::parse_all_html_tags);
        if (changes_html && m_options.contains(Option_Flag::html)
            && state() != Html_State::content) {
            error(
                diagnostic::structure_option, node.get_source_span(),
                u8"The html and parse-all-html-tags options can only be changed between tags."
            );
            updated.set(Option_Flag::html, m_options.contains(Option_Flag::html));
            updated.set(
                Option_Flag::parse_all_html_tags,
                m_options.contains(Option_Flag::parse_all_html_tags)
            );
        }
        m_options = updated;
        process_comment(std::move(node));
    }

    void warn_unknown_option(const ast::Node& node, std::u8string_view word)
    {
        std::u8string message = u8"Unknown option flag \"";
        message += word;
        message += u8"\".";
        const std::u8string_view name = word.starts_with(u8"no-") ? word.substr(3) : word;
        std::pmr::unsynchronized_pool_resource memory;
        if (const Distant<std::size_t> match
            = plausible_match(option_flag_names(), name, &memory)) {
            message += u8" Did you mean \"";
            message += option_flag_names()[match.value];
            message += u8"\"?";
        }
        m_logger.log(
            Severity::warning, diagnostic::option_unknown, node.get_source_span(), message
        );
    }

    // BLOCK DIRECTIVES ============================================================================

    void process_block(ast::Node&& node)
    {
        const Directive_Entry* const entry = m_registry.find(node.get_name());
        const Block_Kind kind
            = entry && entry->block ? entry->block->kind : Block_Kind::opaque;

        const bool html = m_options.contains(Option_Flag::html);
        if (html) {
            switch (state()) {
            case Html_State::tag_name:
            case Html_State::close_tag_name:
            case Html_State::close_tag:
            case Html_State::attribute_name: {
                dynamic_name_error(node);
                return;
            }
            case Html_State::after_attribute_name: {
                finish_attribute(position_of(node.get_source_span()));
                set_state(Html_State::tag);
                break;
            }
            case Html_State::before_attribute_value: {
                begin_unquoted_value();
                break;
            }
            default: break;
            }
        }

        if (kind != Block_Kind::opaque) {
            process_branches(node, *entry);
        }

        if (!html || is_between_tags(state())) {
            m_list->push_back(std::move(node));
        }
        else if (is_value_state(state())) {
            m_value->push_back(std::move(node));
        }
        else {
            TPP_ASSERT(state() == Html_State::tag);
            m_items->push_back(std::move(node));
        }
    }

    /// @brief Returns `true` if rendering the directive may produce none of its branches,
    /// or produce a branch any number of times,
    /// so that each branch has to leave the open elements as they were.
    [[nodiscard]]
    static bool requires_entry_state(const ast::Node& node, const Directive_Entry& entry)
    {
        TPP_ASSERT(entry.block);
        switch (entry.block->kind) {
        case Block_Kind::conditional: {
            const std::u8string_view exhaustive = entry.block->exhaustive_keyword;
            return exhaustive.empty() || node.get_branches().back().keyword != exhaustive;
        }
        case Block_Kind::loop:
        case Block_Kind::isolated: return true;
        case Block_Kind::scope:
        case Block_Kind::opaque: return false;
        }
        TPP_ASSERT_UNREACHABLE(u8"Invalid block kind.");
    }

    void process_branches(ast::Node& node, const Directive_Entry& entry)
    {
        std::vector<ast::Branch>& branches = node.get_branches();
        std::vector<ast::Node_List> inputs;
        inputs.reserve(branches.size());
        for (ast::Branch& branch : branches) {
            inputs.push_back(std::move(branch.children));
            branch.children.clear();
        }

        ast::Node_List* const saved_list = m_list;
        ast::Node_List* const saved_items = m_items;
        ast::Node_List* const saved_value = m_value;
        const std::size_t saved_frame = m_frame;
        const bool in_tag = m_options.contains(Option_Flag::html) && !is_between_tags(state());

        const Path_State entry_state = m_path;
        std::vector<Path_State> results;
        results.reserve(branches.size());

        for (std::size_t i = 0; i < branches.size(); ++i) {
            m_path = entry_state;
            if (in_tag) {
                if (is_value_state(state())) {
                    m_value = &branches[i].children;
                }
                else {
                    m_items = &branches[i].children;
                }
            }
            else {
                m_list = &branches[i].children;
                m_frame = m_next_frame++;
            }
            process_nodes(std::move(inputs[i]));
            results.push_back(std::move(m_path));
        }

        m_list = saved_list;
        m_items = saved_items;
        m_value = saved_value;
        m_frame = saved_frame;

        if (in_tag) {
            for (std::size_t i = 0; i < results.size(); ++i) {
                if (results[i].lexical != entry_state.lexical) {
                    error(
                        diagnostic::structure_branch_state, branches[i].location,
                        u8"Within a tag, every branch has to consist of whole attributes "
                        u8"or of whole parts of an attribute value."
                    );
                }
            }
            m_path = entry_state;
            return;
        }

        const bool keeps_entry = requires_entry_state(node, entry);
        const Path_State& reference = keeps_entry ? entry_state : results.front();
        bool consistent = true;
        for (std::size_t i = 0; i < results.size(); ++i) {
            const Path_State& result = results[i];
            if (!is_between_tags(result.lexical.state)) {
                error(
                    diagnostic::structure_branch_state, branches[i].location,
                    u8"This branch ends inside an HTML tag that it did not start in."
                );
                consistent = false;
                continue;
            }
            if (!result.lexical.same_between_tags(reference.lexical)) {
                error(
                    diagnostic::structure_branch_state, branches[i].location,
                    u8"This branch ends in a different HTML context (text, raw text, or comment) "
                    u8"than other ways of rendering this directive."
                );
                consistent = false;
                continue;
            }
            if (!same_open_elements(result.stack, reference.stack)) {
                std::u8string message = u8"This branch leaves the elements ";
                message += describe_open_elements(result.stack);
                message += u8" open, but ";
                message += keeps_entry ? u8"the elements open before the directive are "
                                       : u8"the first branch leaves ";
                message += describe_open_elements(reference.stack);
                message += u8'.';
                error(diagnostic::structure_branch_diverge, branches[i].location, message);
                consistent = false;
                continue;
            }
            for (std::size_t j = 0; j < result.stack.size(); ++j) {
                unite_pairs(result.stack[j].pair_id, reference.stack[j].pair_id);
            }
        }
        // After an error, continue as if the directive had not been there.
        m_path = consistent ? reference : entry_state;
    }

    // TEXT ========================================================================================

    [[nodiscard]]
    bool recognizes_tag_name(std::u8string_view name) const
    {
        if (m_options.contains(Option_Flag::parse_all_html_tags)) {
            return is_html_tag_name(name);
        }
        return is_html_known_element(to_ascii_lower(name));
    }

    void emit_segment(
        ast::Node_List& target,
        std::u8string_view text,
        std::size_t end,
        File_Id file
    )
    {
        if (end > m_segment_begin) {
            const Source_Span span { m_segment_position, end - m_segment_begin };
            target.push_back(ast::Node::text(
                File_Source_Span { span, file },
                std::u8string { text.substr(m_segment_begin, end - m_segment_begin) }
            ));
        }
    }

    void restart_segment(std::size_t index, const Source_Position& position)
    {
        m_segment_begin = index;
        m_segment_position = position;
    }

    void begin_tag(const File_Source_Position& position, std::size_t index, bool is_close)
    {
        m_tag = Pending_Tag { .begin = position, .name = {}, .is_close = is_close };
        m_tag_index = index;
        m_path.lexical.tag_id = m_next_markup_id++;
        m_items = &m_tag.items;
        set_state(is_close ? Html_State::close_tag_name : Html_State::tag_name);
    }

    /// @brief Decides whether the tag name that has been scanned so far is interpreted as HTML.
    /// If so, the text preceding the tag is emitted.
    /// Otherwise, the tag is treated as text.
    /// @returns `true` if the tag is interpreted as HTML
    bool recognize_tag(std::u8string_view text, File_Id file)
    {
        if (m_tag.recognized) {
            return true;
        }
        if (!recognizes_tag_name(m_tag.name)) {
            set_state(Html_State::content);
            m_items = nullptr;
            return false;
        }
        m_tag.recognized = true;
        emit_segment(*m_list, text, m_tag_index, file);
        return true;
    }

    void begin_attribute(const File_Source_Position& position)
    {
        m_attribute = Pending_Attribute { .begin = position };
        m_path.lexical.attribute_id = m_next_markup_id++;
        set_state(Html_State::attribute_name);
    }

    void begin_value(char8_t quote)
    {
        m_attribute.has_value = true;
        m_path.lexical.quote = quote;
        m_value = &m_attribute.value;
        set_state(
            quote == 0 ? Html_State::unquoted_attribute_value
                       : Html_State::quoted_attribute_value
        );
    }

    void begin_unquoted_value()
    {
        TPP_ASSERT(state() == Html_State::before_attribute_value);
        begin_value(0);
    }

    void finish_attribute(const File_Source_Position& end)
    {
        std::optional<ast::Node_List> value;
        if (m_attribute.has_value) {
            value = std::move(m_attribute.value);
        }
        m_items->push_back(ast::Node::attribute(
            span_between(m_attribute.begin, end), std::move(m_attribute.name), std::move(value),
            m_path.lexical.quote
        ));
        m_attribute = {};
        m_value = nullptr;
        m_path.lexical.quote = 0;
        m_path.lexical.attribute_id = 0;
    }

    void finish_tag(const File_Source_Position& end)
    {
        const File_Source_Span span = span_between(m_tag.begin, end);
        m_path.lexical.tag_id = 0;
        m_items = nullptr;
        set_state(Html_State::content);
        if (m_tag.is_close) {
            close_element(span);
        }
        else {
            open_element(span);
        }
        m_tag = {};
    }

    void open_element(const File_Source_Span& span)
    {
        std::u8string lower_name = to_ascii_lower(m_tag.name);
        if (is_html_void_element(lower_name) || m_tag.self_closing) {
            m_list->push_back(ast::Node::element(
                span, std::move(m_tag.name), std::move(m_tag.items), {}, m_tag.self_closing, {}
            ));
            return;
        }
        const std::size_t pair_id = make_pair_id();
        m_list->push_back(
            ast::Node::element_open(span, std::move(m_tag.name), std::move(m_tag.items), pair_id)
        );
        if (is_html_raw_text_element(lower_name)) {
            set_state(Html_State::raw_text);
            m_path.lexical.raw_element = lower_name;
        }
        m_path.stack.push_back({ .name = std::move(lower_name),
                                 .span = span,
                                 .frame = m_frame,
                                 .index = m_list->size() - 1,
                                 .pair_id = pair_id });
    }

    void close_element(const File_Source_Span& span)
    {
        m_path.lexical.raw_element.clear();
        const std::u8string lower_name = to_ascii_lower(m_tag.name);
        if (m_path.stack.empty()) {
            error(
                diagnostic::structure_close_stray, span,
                u8"This close tag does not match any open element."
            );
            m_list->push_back(ast::Node::element_close(span, std::move(m_tag.name), no_pair_id));
            return;
        }
        const Open_Element& top = m_path.stack.back();
        if (top.name != lower_name) {
            std::u8string message = u8"This close tag does not match the innermost open element <";
            message += top.name;
            message += u8">.";
            error(diagnostic::structure_close_mismatch, span, message);
            m_list->push_back(ast::Node::element_close(span, std::move(m_tag.name), no_pair_id));
            return;
        }

        if (top.frame != m_frame) {
            m_list->push_back(ast::Node::element_close(span, std::move(m_tag.name), top.pair_id));
            m_path.stack.pop_back();
            return;
        }

        ast::Node_List& list = *m_list;
        TPP_ASSERT(top.index < list.size());
        ast::Node& open = list[top.index];
        TPP_ASSERT(open.is(ast::Node_Kind::element_open));

        const auto children_begin = list.begin() + std::ptrdiff_t(top.index + 1);
        ast::Node_List children { std::make_move_iterator(children_begin),
                                  std::make_move_iterator(list.end()) };
        ast::Node element = ast::Node::element(
            open.get_source_span(), std::u8string { open.get_name() },
            std::move(open.get_attributes()), std::move(children), false, span
        );
        list.erase(list.begin() + std::ptrdiff_t(top.index), list.end());
        list.push_back(std::move(element));
        m_path.stack.pop_back();
    }

    void process_text(const ast::Node& node)
    {
        const std::u8string_view text = node.get_text();
        const File_Id file = node.get_source_span().file;
        Source_Position position = node.get_source_span();
        restart_segment(0, position);

        const auto here = [&] { return File_Source_Position { position, file }; };
        const auto advance_by = [&](std::size_t& i, std::size_t n) {
            for (std::size_t end = i + n; i < end; ++i) {
                advance(position, text[i]);
            }
        };

        std::size_t i = 0;
        while (i < text.size()) {
            const char8_t c = text[i];
            const std::u8string_view rest = text.substr(i);

            switch (state()) {
            case Html_State::content: {
                if (c != u8'<') {
                    advance_by(i, 1);
                    break;
                }
                if (rest.starts_with(u8"<!--")) {
                    set_state(Html_State::html_comment);
                    advance_by(i, 4);
                    break;
                }
                if (rest.length() >= 2 && is_ascii_alpha(rest[1])) {
                    begin_tag(here(), i, false);
                    advance_by(i, 1);
                    break;
                }
                if (rest.length() >= 3 && rest[1] == u8'/' && is_ascii_alpha(rest[2])) {
                    begin_tag(here(), i, true);
                    advance_by(i, 2);
                    break;
                }
                advance_by(i, 1);
                break;
            }

            case Html_State::html_comment: {
                if (rest.starts_with(u8"-->")) {
                    set_state(Html_State::content);
                    advance_by(i, 3);
                    break;
                }
                advance_by(i, 1);
                break;
            }

            case Html_State::raw_text: {
                const std::u8string_view element = m_path.lexical.raw_element;
                const std::size_t name_end = 2 + element.length();
                const bool closes = rest.starts_with(u8"</")
                    && ascii::equals_ignore_case(rest.substr(2, element.length()), element)
                    && (rest.length() == name_end || is_html_whitespace(rest[name_end])
                        || rest[name_end] == u8'/' || rest[name_end] == u8'>');
                if (!closes) {
                    advance_by(i, 1);
                    break;
                }
                emit_segment(*m_list, text, i, file);
                const std::u8string_view name = rest.substr(2, element.length());
                begin_tag(here(), i, true);
                m_tag.name = name;
                m_tag.recognized = true;
                advance_by(i, name_end);
                set_state(Html_State::close_tag);
                break;
            }

            case Html_State::tag_name:
            case Html_State::close_tag_name: {
                if (!is_html_whitespace(c) && c != u8'/' && c != u8'>') {
                    m_tag.name += c;
                    advance_by(i, 1);
                    break;
                }
                if (!recognize_tag(text, file)) {
                    break;
                }
                set_state(m_tag.is_close ? Html_State::close_tag : Html_State::tag);
                break;
            }

            case Html_State::close_tag: {
                advance_by(i, 1);
                if (c == u8'>') {
                    finish_tag(here());
                    restart_segment(i, position);
                }
                break;
            }

            case Html_State::tag: {
                if (is_html_whitespace(c)) {
                    advance_by(i, 1);
                    break;
                }
                if (c == u8'/') {
                    if (rest.starts_with(u8"/>")) {
                        m_tag.self_closing = true;
                    }
                    advance_by(i, 1);
                    break;
                }
                if (c == u8'>') {
                    advance_by(i, 1);
                    finish_tag(here());
                    restart_segment(i, position);
                    break;
                }
                m_tag.self_closing = false;
                begin_attribute(here());
                m_attribute.name += c;
                advance_by(i, 1);
                break;
            }

            case Html_State::attribute_name: {
                if (is_html_whitespace(c)) {
                    set_state(Html_State::after_attribute_name);
                    advance_by(i, 1);
                    break;
                }
                if (c == u8'=') {
                    set_state(Html_State::before_attribute_value);
                    m_attribute.has_value = true;
                    advance_by(i, 1);
                    break;
                }
                if (c == u8'>' || c == u8'/') {
                    finish_attribute(here());
                    set_state(Html_State::tag);
                    break;
                }
                m_attribute.name += c;
                advance_by(i, 1);
                break;
            }

            case Html_State::after_attribute_name: {
                if (is_html_whitespace(c)) {
                    advance_by(i, 1);
                    break;
                }
                if (c == u8'=') {
                    set_state(Html_State::before_attribute_value);
                    m_attribute.has_value = true;
                    advance_by(i, 1);
                    break;
                }
                finish_attribute(here());
                set_state(Html_State::tag);
                break;
            }

            case Html_State::before_attribute_value: {
                if (is_html_whitespace(c)) {
                    advance_by(i, 1);
                    break;
                }
                if (c == u8'"' || c == u8'\'') {
                    begin_value(c);
                    advance_by(i, 1);
                    restart_segment(i, position);
                    break;
                }
                if (c == u8'>') {
                    finish_attribute(here());
                    set_state(Html_State::tag);
                    break;
                }
                begin_value(0);
                restart_segment(i, position);
                break;
            }

            case Html_State::quoted_attribute_value: {
                if (c != m_path.lexical.quote) {
                    advance_by(i, 1);
                    break;
                }
                emit_segment(*m_value, text, i, file);
                advance_by(i, 1);
                finish_attribute(here());
                set_state(Html_State::tag);
                break;
            }

            case Html_State::unquoted_attribute_value: {
                if (!is_html_whitespace(c) && c != u8'>') {
                    advance_by(i, 1);
                    break;
                }
                emit_segment(*m_value, text, i, file);
                finish_attribute(here());
                set_state(Html_State::tag);
                break;
            }
            }
        }

        // The end of the text node.
        switch (state()) {
        case Html_State::content:
        case Html_State::raw_text:
        case Html_State::html_comment: {
            emit_segment(*m_list, text, text.size(), file);
            break;
        }
        case Html_State::quoted_attribute_value:
        case Html_State::unquoted_attribute_value: {
            emit_segment(*m_value, text, text.size(), file);
            break;
        }
        case Html_State::tag_name:
        case Html_State::close_tag_name: {
            if (!recognize_tag(text, file)) {
                emit_segment(*m_list, text, text.size(), file);
            }
            break;
        }
        default: break;
        }
    }

    void finish()
    {
        if (m_options.contains(Option_Flag::html) && !is_between_tags(state())) {
            const File_Source_Span tag_span { Source_Position { m_tag.begin }, 0,
                                              m_tag.begin.file };
            error(diagnostic::structure_unclosed, tag_span, u8"This tag is never closed.");
        }
        for (const Open_Element& element : m_path.stack) {
            std::u8string message = u8"The element <";
            message += element.name;
            message += u8"> is never closed.";
            error(diagnostic::structure_unclosed, element.span, message);
        }
    }
};

} // namespace

void apply_option_node(Option_Set& options, const ast::Node& option)
{
    TPP_ASSERT(option.is(ast::Node_Kind::option));
    apply_option_flags(options, option.get_text());
}

void apply_option_nodes(Option_Set& options, std::span<const ast::Node> nodes)
{
    for (const ast::Node& node : nodes) {
        switch (node.get_kind()) {
        case ast::Node_Kind::option: apply_option_node(options, node); break;
        case ast::Node_Kind::element:
            apply_option_nodes(options, node.get_attributes());
            apply_option_nodes(options, node.get_children());
            break;
        case ast::Node_Kind::element_open:
            apply_option_nodes(options, node.get_attributes());
            break;
        case ast::Node_Kind::attribute: apply_option_nodes(options, node.get_children()); break;
        case ast::Node_Kind::directive:
            for (const ast::Branch& branch : node.get_branches()) {
                apply_option_nodes(options, branch.children);
            }
            break;
        default: break;
        }
    }
}

bool normalize(
    ast::Node_List& out,
    ast::Node_List&& in,
    const Directive_Registry& registry,
    Option_Set options,
    Logger& logger
)
{
    return Normalizer { out, registry, options, logger }(std::move(in));
}

} // namespace tpp
