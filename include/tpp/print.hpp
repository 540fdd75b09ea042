#ifndef TPP_PRINT_HPP
#define TPP_PRINT_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "tpp/util/assert.hpp"
#include "tpp/util/source_position.hpp"

#include "tpp/fwd.hpp"

namespace tpp {

/// @brief Returns the line that contains the given index.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`.
[[nodiscard]]
std::u8string_view find_line(std::u8string_view source, std::size_t index);

/// @brief Prints a position within a file, consisting of the file name and line/column.
/// @param out the string to write to
/// @param file the file name
/// @param pos the position within the file
/// @param colors if `true`, ANSI escape sequences are used for highlighting
/// @param colon_suffix if `true`, appends a `:` to the string as part of the same token
void print_file_position(
    std::u8string& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colors,
    bool colon_suffix = true
);

/// @brief Prints the contents of the affected line within `source` as well as position indicators
/// which show the span which is affected by some diagnostic.
void print_affected_line(
    std::u8string& out,
    std::u8string_view source,
    const Source_Span& pos,
    bool colors
);

/// @brief Prints a diagnostic in the form `SEVERITY: file:line:column: message [id]`,
/// followed by the affected line if `source` is not empty.
/// @param file the name of the file that `diagnostic.location` refers to
/// @param source the source text of that file, or an empty string if unavailable
void print_diagnostic(
    std::u8string& out,
    const Diagnostic& diagnostic,
    std::u8string_view file,
    std::u8string_view source,
    bool colors
);

void print_io_error(std::u8string& out, std::u8string_view file, IO_Error_Code error, bool colors);

void print_assertion_error(std::u8string& out, const Assertion_Error& error, bool colors);

void print_internal_error_notice(std::u8string& out, bool colors);

std::ostream& operator<<(std::ostream& out, std::u8string_view str);

/// @brief Writes `str` to `std::cerr` and flushes.
void print_flush_stderr(std::u8string_view str);

} // namespace tpp

#endif
