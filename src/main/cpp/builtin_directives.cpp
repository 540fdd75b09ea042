#include <charconv>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "tpp/util/assert.hpp"
#include "tpp/util/chars.hpp"
#include "tpp/util/result.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/builtin_directives.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"

namespace tpp {
namespace {

using Evaluation_Result = Result<std::u8string, std::u8string>;

[[nodiscard]]
Directive_Entry inline_entry(std::u8string_view name)
{
    return Directive_Entry { .name = std::u8string { name } };
}

[[nodiscard]]
Directive_Entry block_entry(
    std::u8string_view name,
    Block_Kind kind,
    std::initializer_list<std::u8string_view> branch_keywords = {},
    std::u8string_view exhaustive_keyword = {}
)
{
    Block_Info info { .kind = kind };
    for (const std::u8string_view keyword : branch_keywords) {
        info.branch_keywords.emplace_back(keyword);
    }
    info.exhaustive_keyword = exhaustive_keyword;
    return Directive_Entry { .name = std::u8string { name }, .block = std::move(info) };
}

[[nodiscard]]
std::optional<double> to_double(std::u8string_view str)
{
    str = trim_whitespace(str);
    if (str.starts_with(u8'+')) {
        str.remove_prefix(1);
    }
    const std::string_view chars = as_string_view(str);
    double result {};
    const auto [p, ec] = std::from_chars(chars.data(), chars.data() + chars.size(), result);
    if (ec != std::errc {} || p != chars.data() + chars.size()) {
        return {};
    }
    return result;
}

[[nodiscard]]
std::u8string to_u8chars(long long x)
{
    return to_u8string(std::to_string(x));
}

[[nodiscard]]
bool is_integer_literal(std::u8string_view str)
{
    return str.find_first_of(u8".eE") == std::u8string_view::npos;
}

/// @brief `{% widthratio value max_value max_width %}` computes
/// `round(value / max_value * max_width)`,
/// with ties rounded to even.
/// A zero `max_value` yields `0`, and non-numeric values yield an empty string.
Evaluation_Result evaluate_widthratio(const Fold_Input& input)
{
    if (input.arguments.size() != 3) {
        return Evaluation_Result { error_tag, u8"widthratio takes exactly three arguments." };
    }
    const Literal_Argument& width_arg = input.arguments[2];
    std::optional<double> max_width;
    if (width_arg.kind == Literal_Kind::number) {
        if (const std::optional<double> w = to_double(width_arg.value)) {
            max_width = std::trunc(*w);
        }
    }
    else if (is_integer_literal(trim_whitespace(width_arg.value))) {
        max_width = to_double(width_arg.value);
    }
    if (!max_width) {
        return Evaluation_Result { error_tag, u8"widthratio final argument must be a number." };
    }

    const std::optional<double> value = to_double(input.arguments[0].value);
    const std::optional<double> max_value = to_double(input.arguments[1].value);
    if (!value || !max_value) {
        return std::u8string {};
    }
    if (*max_value == 0) {
        return std::u8string { u8"0" };
    }
    const double ratio = std::nearbyint(*value / *max_value * *max_width);
    if (!std::isfinite(ratio)) {
        return std::u8string {};
    }
    return to_u8chars(static_cast<long long>(ratio));
}

/// @brief `{% firstof a b c %}` outputs the first argument that is truthy.
/// Literals are considered safe, so the output is not escaped.
Evaluation_Result evaluate_firstof(const Fold_Input& input)
{
    for (const Literal_Argument& arg : input.arguments) {
        if (arg.kind == Literal_Kind::number) {
            const std::optional<double> number = to_double(arg.value);
            if (number && *number != 0) {
                return format_number_literal(arg.value);
            }
        }
        else if (!arg.value.empty()) {
            return arg.value;
        }
    }
    return std::u8string {};
}

Evaluation_Result evaluate_templatetag(const Fold_Input& input)
{
    TPP_ASSERT(input.arguments.size() == 1);
    if (const std::optional<std::u8string_view> output
        = templatetag_output(input.arguments[0].value)) {
        return std::u8string { *output };
    }
    return Evaluation_Result { error_tag, u8"Invalid templatetag argument." };
}

Evaluation_Result evaluate_spaceless(const Fold_Input& input)
{
    return strip_spaces_between_tags(input.content.value_or(std::u8string_view {}));
}

Evaluation_Result evaluate_comment(const Fold_Input&)
{
    return std::u8string {};
}

constexpr std::pair<std::u8string_view, std::u8string_view> templatetag_mapping[] {
    { u8"openblock", u8"{%" },     { u8"closeblock", u8"%}" },
    { u8"openvariable", u8"{{" },  { u8"closevariable", u8"}}" },
    { u8"openbrace", u8"{" },      { u8"closebrace", u8"}" },
    { u8"opencomment", u8"{#" },   { u8"closecomment", u8"#}" },
};


} // namespace

std::optional<std::u8string_view> templatetag_output(std::u8string_view keyword)
{
    for (const auto& [name, output] : templatetag_mapping) {
        if (name == keyword) {
            return output;
        }
    }
    return {};
}

std::u8string strip_spaces_between_tags(std::u8string_view html)
{
    std::u8string result;
    result.reserve(html.size());
    for (std::size_t i = 0; i < html.size(); ++i) {
        result.push_back(html[i]);
        if (html[i] != u8'>') {
            continue;
        }
        std::size_t j = i + 1;
        while (j < html.size() && (is_html_whitespace(html[j]) || html[j] == u8'\v')) {
            ++j;
        }
        if (j != i + 1 && j < html.size() && html[j] == u8'<') {
            i = j - 1;
        }
    }
    return std::u8string { trim_whitespace(result) };
}

std::u8string format_number_literal(std::u8string_view number)
{
    number = trim_whitespace(number);
    if (is_integer_literal(number)) {
        const bool negative = number.starts_with(u8'-');
        if (negative || number.starts_with(u8'+')) {
            number.remove_prefix(1);
        }
        while (number.length() > 1 && number.front() == u8'0') {
            number.remove_prefix(1);
        }
        std::u8string result;
        if (negative && number != u8"0") {
            result += u8'-';
        }
        result += number;
        return result;
    }

    const std::optional<double> value = to_double(number);
    if (!value) {
        return std::u8string { number };
    }
    if (std::isinf(*value)) {
        return *value < 0 ? u8"-inf" : u8"inf";
    }
    if (std::isnan(*value)) {
        return u8"nan";
    }

    char buffer[64];
    const auto scientific = std::to_chars(
        std::begin(buffer), std::end(buffer), *value, std::chars_format::scientific
    );
    TPP_ASSERT(scientific.ec == std::errc {});
    const std::string_view scientific_chars { buffer, scientific.ptr };
    const std::string exponent_chars { scientific_chars.substr(scientific_chars.find('e') + 1) };
    const int exponent = std::stoi(exponent_chars);

    // Floating-point numbers are printed in positional notation for exponents in [-4, 16).
    if (exponent < -4 || exponent >= 16) {
        return to_u8string(scientific_chars);
    }
    const auto fixed
        = std::to_chars(std::begin(buffer), std::end(buffer), *value, std::chars_format::fixed);
    TPP_ASSERT(fixed.ec == std::errc {});
    std::u8string result = to_u8string(std::string_view { buffer, fixed.ptr });
    if (result.find(u8'.') == std::u8string::npos) {
        result += u8".0";
    }
    return result;
}

Result<void, Registry_Error> add_builtin_directives(Directive_Registry& registry)
{
    Result<void, Registry_Error> result;
    const auto add = [&](Directive_Entry&& entry) {
        if (result) {
            result = registry.add(std::move(entry));
        }
    };

    // Context-dependent blocks.
    add(block_entry(u8"if", Block_Kind::conditional, { u8"elif", u8"else" }, u8"else"));
    add(block_entry(u8"for", Block_Kind::loop, { u8"empty" }));
    for (const std::u8string_view name : { u8"ifequal", u8"ifnotequal", u8"ifchanged" }) {
        add(block_entry(name, Block_Kind::conditional, { u8"else" }, u8"else"));
    }
    add(block_entry(u8"with", Block_Kind::scope));
    add(block_entry(u8"block", Block_Kind::scope));
    add(block_entry(u8"autoescape", Block_Kind::scope));
    add(block_entry(u8"filter", Block_Kind::scope));
    add(block_entry(u8"cache", Block_Kind::scope));
    add(block_entry(u8"language", Block_Kind::scope));
    add(block_entry(u8"localize", Block_Kind::scope));
    // Translations may reorder their content, so each branch has to be balanced on its own.
    add(block_entry(u8"blocktrans", Block_Kind::isolated, { u8"plural" }));
    add(block_entry(u8"blocktranslate", Block_Kind::isolated, { u8"plural" }));

    // Context-dependent inline directives.
    for (const std::u8string_view name : {
             u8"extends", u8"include", u8"load", u8"url", u8"csrf_token", u8"cycle", u8"now",
             u8"regroup", u8"trans", u8"translate", u8"static", u8"resetcycle", u8"debug",
             u8"lorem", u8"get_current_language", u8"get_available_languages",
             u8"get_static_prefix", u8"get_media_prefix",
         }) {
        add(inline_entry(name));
    }

    // Pure directives.
    {
        Directive_Entry comment = block_entry(u8"comment", Block_Kind::opaque);
        comment.block->ignores_content = true;
        comment.purity = Purity::pure;
        comment.evaluator = evaluate_comment;
        add(std::move(comment));
    }
    {
        Directive_Entry spaceless = block_entry(u8"spaceless", Block_Kind::scope);
        spaceless.max_arguments = 0;
        spaceless.purity = Purity::pure;
        spaceless.evaluator = evaluate_spaceless;
        add(std::move(spaceless));
    }
    {
        Directive_Entry templatetag = inline_entry(u8"templatetag");
        templatetag.shape = Argument_Shape::keywords;
        templatetag.min_arguments = 1;
        templatetag.max_arguments = 1;
        for (const auto& mapping : templatetag_mapping) {
            templatetag.keywords.emplace_back(mapping.first);
        }
        templatetag.purity = Purity::pure;
        templatetag.evaluator = evaluate_templatetag;
        add(std::move(templatetag));
    }
    {
        // `{% widthratio a b c as var %}` has five arguments, but is never folded
        // because `as` and `var` are not literals.
        Directive_Entry widthratio = inline_entry(u8"widthratio");
        widthratio.shape = Argument_Shape::literals;
        widthratio.min_arguments = 3;
        widthratio.max_arguments = 5;
        widthratio.purity = Purity::pure;
        widthratio.evaluator = evaluate_widthratio;
        add(std::move(widthratio));
    }
    {
        Directive_Entry firstof = inline_entry(u8"firstof");
        firstof.shape = Argument_Shape::literals;
        firstof.min_arguments = 1;
        firstof.purity = Purity::pure;
        firstof.evaluator = evaluate_firstof;
        add(std::move(firstof));
    }
    return result;
}

Directive_Registry make_builtin_registry()
{
    Directive_Registry result;
    const Result<void, Registry_Error> success = add_builtin_directives(result);
    TPP_ASSERT(success.has_value());
    return result;
}

} // namespace tpp
