#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tpp/util/assert.hpp"
#include "tpp/util/function_ref.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/options.hpp"

namespace tpp {
namespace {

#define TPP_OPTION_FLAG_NAME(id, name, default_value) u8##name,

constexpr std::u8string_view flag_names[] {
    TPP_OPTION_FLAG_ENUM_DATA(TPP_OPTION_FLAG_NAME)
};

#define TPP_OPTION_FLAG_DEFAULT(id, name, default_value) default_value,

constexpr bool flag_defaults[] {
    TPP_OPTION_FLAG_ENUM_DATA(TPP_OPTION_FLAG_DEFAULT)
};

static_assert(std::size(flag_names) == option_flag_count);

constexpr std::u8string_view negation_prefix = u8"no-";

} // namespace

std::u8string_view option_flag_name(Option_Flag flag)
{
    const auto index = std::size_t(flag);
    TPP_ASSERT(index < option_flag_count);
    return flag_names[index];
}

std::optional<Option_Flag> option_flag_by_name(std::u8string_view name)
{
    const auto* const it = std::ranges::find(flag_names, name);
    if (it == std::end(flag_names)) {
        return {};
    }
    return Option_Flag(it - std::begin(flag_names));
}

std::span<const std::u8string_view> option_flag_names()
{
    return flag_names;
}

Option_Set Option_Set::defaults()
{
    Option_Set result;
    for (std::size_t i = 0; i < option_flag_count; ++i) {
        result.set(Option_Flag(i), flag_defaults[i]);
    }
    return result;
}

std::u8string to_string(Option_Set options)
{
    std::u8string result;
    for (std::size_t i = 0; i < option_flag_count; ++i) {
        if (!options.contains(Option_Flag(i))) {
            continue;
        }
        if (!result.empty()) {
            result += u8' ';
        }
        result += flag_names[i];
    }
    return result;
}

std::vector<Option_Override> parse_option_overrides(
    std::u8string_view flags,
    Function_Ref<void(std::u8string_view word)> on_unknown
)
{
    std::vector<Option_Override> result;
    for_each_word(flags, [&](std::u8string_view word) {
        const bool negated = word.starts_with(negation_prefix);
        const std::u8string_view name = negated ? word.substr(negation_prefix.length()) : word;
        if (const std::optional<Option_Flag> flag = option_flag_by_name(name)) {
            result.push_back({ *flag, !negated });
        }
        else if (on_unknown) {
            on_unknown(word);
        }
    });
    return result;
}

bool apply_option_flags(
    Option_Set& options,
    std::u8string_view flags,
    Function_Ref<void(std::u8string_view word)> on_unknown
)
{
    bool success = true;
    const auto on_unknown_word = [&](std::u8string_view word) {
        success = false;
        if (on_unknown) {
            on_unknown(word);
        }
    };
    for (const Option_Override& o : parse_option_overrides(flags, on_unknown_word)) {
        options.set(o.flag, o.enabled);
    }
    return success;
}

bool Option_Scope::applies_to(std::u8string_view template_path, std::u8string_view application)
    const
{
    if (applications.empty() && !path_pattern) {
        return true;
    }
    if (!application.empty() && std::ranges::contains(applications, application)) {
        return true;
    }
    return path_pattern && path_pattern->matches(template_path);
}

Option_Set Option_Config::resolve(std::u8string_view template_path, std::u8string_view application)
    const
{
    Option_Set result = defaults;
    for (const Option_Scope& scope : scopes) {
        if (!scope.applies_to(template_path, application)) {
            continue;
        }
        for (const Option_Override& o : scope.overrides) {
            result.set(o.flag, o.enabled);
        }
    }
    return result;
}

} // namespace tpp
