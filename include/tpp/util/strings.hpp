#ifndef TPP_STRINGS_HPP
#define TPP_STRINGS_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "tpp/util/chars.hpp"

namespace tpp {

inline constexpr std::u8string_view all_html_whitespace8 = u8"\t\n\f\r ";

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

[[nodiscard]]
inline std::string to_string(std::u8string_view str)
{
    return std::string { as_string_view(str) };
}

[[nodiscard]]
inline std::u8string to_u8string(std::string_view str)
{
    return std::u8string { as_u8string_view(str) };
}

/// @brief Returns `true` if `str` consists entirely of HTML whitespace.
/// Empty strings are considered whitespace.
[[nodiscard]]
constexpr bool is_html_whitespace(std::u8string_view str)
{
    for (const char8_t c : str) {
        if (!is_html_whitespace(c)) {
            return false;
        }
    }
    return true;
}

[[nodiscard]]
constexpr std::size_t length_whitespace_left(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_html_whitespace(str[i])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::size_t length_whitespace_right(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_html_whitespace(str[str.length() - i - 1])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::u8string_view trim_whitespace_left(std::u8string_view str)
{
    return str.substr(length_whitespace_left(str));
}

[[nodiscard]]
constexpr std::u8string_view trim_whitespace_right(std::u8string_view str)
{
    return str.substr(0, str.length() - length_whitespace_right(str));
}

/// @brief Equivalent to `trim_whitespace_right(trim_whitespace_left(str))`.
[[nodiscard]]
constexpr std::u8string_view trim_whitespace(std::u8string_view str)
{
    return trim_whitespace_right(trim_whitespace_left(str));
}

/// @brief Returns `str` with all ASCII upper-case letters converted to lower case.
[[nodiscard]]
inline std::u8string to_ascii_lower(std::u8string_view str)
{
    std::u8string result { str };
    for (char8_t& c : result) {
        c = tpp::to_ascii_lower(c);
    }
    return result;
}

/// @brief Splits `str` at runs of HTML whitespace and invokes `f` with every non-empty part.
template <typename F> // NOLINTNEXTLINE(cppcoreguidelines-missing-std-forward)
constexpr void for_each_word(std::u8string_view str, F f)
{
    while (true) {
        str = trim_whitespace_left(str);
        if (str.empty()) {
            return;
        }
        std::size_t length = 0;
        while (length < str.length() && !is_html_whitespace(str[length])) {
            ++length;
        }
        f(str.substr(0, length));
        str.remove_prefix(length);
    }
}

} // namespace tpp

#endif
