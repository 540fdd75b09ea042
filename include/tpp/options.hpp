#ifndef TPP_OPTIONS_HPP
#define TPP_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tpp/util/function_ref.hpp"

#include "tpp/fwd.hpp"
#include "tpp/path_pattern.hpp"

namespace tpp {

// clang-format off
#define TPP_OPTION_FLAG_ENUM_DATA(F)                                                               \
    F(whitespace_compression, "whitespace-compression", true)                                      \
    F(html, "html", true)                                                                          \
    F(merge_internal_javascript, "merge-internal-javascript", false)                               \
    F(merge_internal_css, "merge-internal-css", false)                                             \
    F(pack_external_javascript, "pack-external-javascript", false)                                 \
    F(pack_external_css, "pack-external-css", false)                                               \
    F(compile_css, "compile-css", false)                                                           \
    F(compile_javascript, "compile-javascript", false)                                             \
    F(rename_javascript_variables, "rename-javascript-variables", false)                           \
    F(validate_javascript_semicolons, "validate-javascript-semicolons", false)                     \
    F(validate_javascript_gettext, "validate-javascript-gettext", false)                           \
    F(parse_all_html_tags, "parse-all-html-tags", false)                                           \
    F(validate_html, "validate-html", true)                                                        \
    F(html_remove_empty_class_attributes, "html-remove-empty-class-attributes", false)             \
    F(html_check_alt_and_title_attributes, "html-check-alt-and-title-attributes", false)           \
    F(html_validation_warnings, "html-validation-warnings", false)                                 \
    F(resolve_inheritance, "resolve-inheritance", true)
// clang-format on

#define TPP_OPTION_FLAG_ENUMERATOR(id, name, default_value) id,

/// @brief An optimization or validation flag.
/// The order of enumerators is the canonical order of flags.
enum struct Option_Flag : Default_Underlying {
    TPP_OPTION_FLAG_ENUM_DATA(TPP_OPTION_FLAG_ENUMERATOR)
};

#define TPP_OPTION_FLAG_COUNT_ONE(id, name, default_value) +1

inline constexpr std::size_t option_flag_count
    = 0 TPP_OPTION_FLAG_ENUM_DATA(TPP_OPTION_FLAG_COUNT_ONE);

/// @brief Returns the name of the flag, like `whitespace-compression`.
[[nodiscard]]
std::u8string_view option_flag_name(Option_Flag flag);

/// @brief Returns the flag with the given name (without `no-` prefix),
/// or `std::nullopt` if there is none.
[[nodiscard]]
std::optional<Option_Flag> option_flag_by_name(std::u8string_view name);

/// @brief Returns the names of all flags in canonical order.
[[nodiscard]]
std::span<const std::u8string_view> option_flag_names();

/// @brief A set of enabled flags.
struct Option_Set {
private:
    std::uint32_t m_bits = 0;

    static_assert(option_flag_count <= 32);

    [[nodiscard]]
    static constexpr std::uint32_t bit(Option_Flag flag)
    {
        return std::uint32_t { 1 } << std::uint32_t(flag);
    }

public:
    /// @brief Returns the set of flags which are enabled by default.
    [[nodiscard]]
    static Option_Set defaults();

    [[nodiscard]]
    constexpr Option_Set() = default;

    [[nodiscard]]
    constexpr bool contains(Option_Flag flag) const
    {
        return (m_bits & bit(flag)) != 0;
    }

    constexpr void set(Option_Flag flag, bool enabled)
    {
        m_bits = enabled ? m_bits | bit(flag) : m_bits & ~bit(flag);
    }

    constexpr Option_Set& enable(Option_Flag flag)
    {
        set(flag, true);
        return *this;
    }

    constexpr Option_Set& disable(Option_Flag flag)
    {
        set(flag, false);
        return *this;
    }

    [[nodiscard]]
    constexpr Option_Set with(Option_Flag flag, bool enabled = true) const
    {
        Option_Set result = *this;
        result.set(flag, enabled);
        return result;
    }

    [[nodiscard]]
    constexpr std::uint32_t get_bits() const
    {
        return m_bits;
    }

    [[nodiscard]]
    friend constexpr bool operator==(Option_Set, Option_Set)
        = default;
};

/// @brief Returns the names of the enabled flags in canonical order, separated by spaces.
[[nodiscard]]
std::u8string to_string(Option_Set options);

/// @brief Applies whitespace-separated flags like `html no-whitespace-compression` to `options`.
/// A `no-` prefix disables a flag.
/// @param on_unknown invoked with every word which does not name a flag
/// @returns `true` if all words named a flag
bool apply_option_flags(
    Option_Set& options,
    std::u8string_view flags,
    Function_Ref<void(std::u8string_view word)> on_unknown = {}
);

struct Option_Override {
    Option_Flag flag;
    bool enabled;

    [[nodiscard]]
    friend constexpr bool operator==(const Option_Override&, const Option_Override&)
        = default;
};

/// @brief A set of overrides that applies to the templates of certain applications,
/// or to templates whose path matches a pattern.
/// A scope with neither applications nor a pattern applies to every template.
struct Option_Scope {
    std::vector<std::u8string> applications {};
    std::optional<Path_Pattern> path_pattern {};
    std::vector<Option_Override> overrides {};

    [[nodiscard]]
    bool applies_to(std::u8string_view template_path, std::u8string_view application) const;
};

/// @brief Maps templates to the options they are compiled with.
/// The defaults are overridden by every matching scope in declaration order,
/// so later, more specific scopes take precedence over earlier ones.
struct Option_Config {
    Option_Set defaults = Option_Set::defaults();
    std::vector<Option_Scope> scopes {};

    [[nodiscard]]
    Option_Set resolve(std::u8string_view template_path, std::u8string_view application = {}) const;
};

/// @brief Parses overrides like `html no-whitespace-compression`.
/// @param on_unknown invoked with every word which does not name a flag
/// @returns the parsed overrides, in order
[[nodiscard]]
std::vector<Option_Override> parse_option_overrides(
    std::u8string_view flags,
    Function_Ref<void(std::u8string_view word)> on_unknown = {}
);

} // namespace tpp

#endif
