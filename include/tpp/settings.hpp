#ifndef TPP_SETTINGS_HPP
#define TPP_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define TPP_DEBUG 1
#define TPP_IF_DEBUG(...) __VA_ARGS__
#define TPP_IF_NOT_DEBUG(...)
#else // release builds
#define TPP_IF_DEBUG(...)
#define TPP_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define TPP_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define TPP_GCC 1
#endif

#define TPP_UNREACHABLE() __builtin_unreachable()

namespace tpp {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = TPP_IF_DEBUG(true) TPP_IF_NOT_DEBUG(false);

/// @brief The number of bytes read at once when loading template files.
inline constexpr std::size_t file_chunk_size = 4096;

} // namespace tpp

#endif
