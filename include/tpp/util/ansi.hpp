#ifndef TPP_ANSI_HPP
#define TPP_ANSI_HPP

#include <string_view>

namespace tpp::ansi {

inline constexpr std::u8string_view black = u8"\x1B[30m";
inline constexpr std::u8string_view red = u8"\x1B[31m";
inline constexpr std::u8string_view green = u8"\x1B[32m";
inline constexpr std::u8string_view blue = u8"\x1B[34m";
inline constexpr std::u8string_view magenta = u8"\x1B[35m";

inline constexpr std::u8string_view h_black = u8"\x1B[0;90m";
inline constexpr std::u8string_view h_red = u8"\x1B[0;91m";
inline constexpr std::u8string_view h_green = u8"\x1B[0;92m";
inline constexpr std::u8string_view h_yellow = u8"\x1B[0;93m";

inline constexpr std::u8string_view reset = u8"\033[0m";

} // namespace tpp::ansi

#endif
