#include <algorithm>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>

#include "tpp/util/ansi.hpp"
#include "tpp/util/assert.hpp"
#include "tpp/util/io.hpp"
#include "tpp/util/severity.hpp"
#include "tpp/util/source_position.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/diagnostic.hpp"
#include "tpp/fwd.hpp"
#include "tpp/print.hpp"

namespace tpp {

namespace {

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace ? ansi::black
        : severity <= Severity::debug  ? ansi::h_black
        : severity <= Severity::info   ? ansi::blue
        : severity <= Severity::soft_warning ? ansi::green
        : severity <= Severity::warning      ? ansi::h_yellow
        : severity <= Severity::error        ? ansi::h_red
        : severity <= Severity::fatal        ? ansi::red
                                             : ansi::magenta;
}

/// @brief Appends `text`, surrounded by `color` and a reset sequence if `colors` is `true`.
void append_colored(
    std::u8string& out,
    std::u8string_view text,
    std::u8string_view color,
    bool colors
)
{
    if (colors) {
        out += color;
    }
    out += text;
    if (colors) {
        out += ansi::reset;
    }
}

void do_print_affected_line(
    std::u8string& out,
    std::u8string_view source,
    std::size_t begin,
    std::size_t length,
    std::size_t line,
    std::size_t column,
    bool colors
)
{
    TPP_ASSERT(length > 0);

    const std::u8string_view cited_code = find_line(source, begin);

    const std::u8string line_chars = to_u8string(std::to_string(line + 1));
    constexpr std::size_t pad_max = 6;
    const std::size_t pad_length
        = pad_max - std::min(line_chars.length(), std::size_t { pad_max - 1 });
    out.append(pad_length, u8' ');
    append_colored(out, line_chars, ansi::h_yellow, colors);
    out += u8" | ";
    out += cited_code;
    out += u8'\n';

    const std::size_t align_length = std::max(pad_max, line_chars.length() + 1);
    out.append(align_length, u8' ');
    out += u8" | ";
    out.append(column, u8' ');

    const std::size_t indicator_length
        = column < cited_code.length() ? std::min(length, cited_code.length() - column) : 1;
    std::u8string indicator = u8"^";
    if (indicator_length > 1) {
        indicator.append(indicator_length - 1, u8'~');
    }
    append_colored(out, indicator, ansi::h_green, colors);
    out += u8'\n';
}

} // namespace

std::u8string_view find_line(std::u8string_view source, std::size_t index)
{
    TPP_ASSERT(index <= source.size());
    if (source.empty()) {
        return {};
    }
    if (index == source.size()) {
        // EOF positions may be past the end of the source by a single character.
        // For such positions, we yield the last line.
        --index;
    }

    std::size_t begin = index == 0 ? std::u8string_view::npos : source.rfind(u8'\n', index - 1);
    begin = begin != std::u8string_view::npos ? begin + 1 : 0;

    const std::size_t end = std::min(source.find(u8'\n', index), source.size());
    return source.substr(begin, end - begin);
}

void print_file_position(
    std::u8string& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colors,
    bool colon_suffix
)
{
    std::u8string position { file };
    position += u8':';
    position += to_u8string(std::to_string(pos.line + 1));
    position += u8':';
    position += to_u8string(std::to_string(pos.column + 1));
    if (colon_suffix) {
        position += u8':';
    }
    append_colored(out, position, ansi::h_black, colors);
}

void print_affected_line(
    std::u8string& out,
    std::u8string_view source,
    const Source_Span& pos,
    bool colors
)
{
    do_print_affected_line(
        out, source, pos.begin, std::max(pos.length, std::size_t { 1 }), pos.line, pos.column,
        colors
    );
}

void print_diagnostic(
    std::u8string& out,
    const Diagnostic& diagnostic,
    std::u8string_view file,
    std::u8string_view source,
    bool colors
)
{
    append_colored(
        out, severity_tag(diagnostic.severity), severity_highlight(diagnostic.severity), colors
    );
    out += u8": ";
    print_file_position(out, file, diagnostic.location, colors);
    out += u8' ';
    out += diagnostic.message;

    std::u8string id_suffix = u8" [";
    id_suffix += diagnostic.id;
    id_suffix += u8']';
    append_colored(out, id_suffix, ansi::h_black, colors);
    out += u8'\n';

    if (!source.empty() && diagnostic.location.begin <= source.size()) {
        print_affected_line(out, source, diagnostic.location, colors);
    }
}

void print_io_error(std::u8string& out, std::u8string_view file, IO_Error_Code error, bool colors)
{
    std::u8string location { file };
    location += u8':';
    append_colored(out, location, ansi::h_black, colors);
    out += u8' ';
    out += io_error_code_message(error);
    out += u8'\n';
}

void print_assertion_error(std::u8string& out, const Assertion_Error& error, bool colors)
{
    append_colored(out, u8"Assertion failed! ", ansi::h_red, colors);

    const std::u8string_view message = error.type == Assertion_Error_Type::expression
        ? u8"The following expression evaluated to 'false', but was expected to be 'true':"
        : u8"Code which must be unreachable has been reached.";
    out += message;
    out += u8"\n\n";

    const Source_Position pos { .line = error.location.line() - 1,
                                .column = error.location.column() - 1,
                                .begin = {} };
    print_file_position(out, as_u8string_view(error.location.file_name()), pos, colors);
    out += u8' ';
    append_colored(out, error.message, ansi::h_red, colors);
    out += u8"\n\n";
    print_internal_error_notice(out, colors);
}

void print_internal_error_notice(std::u8string& out, bool colors)
{
    constexpr std::u8string_view notice
        = u8"This is an internal error in the template preprocessor. Please report this bug.\n";
    append_colored(out, notice, ansi::h_yellow, colors);
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

void print_flush_stderr(std::u8string_view str)
{
    std::cerr << as_string_view(str);
    std::cerr.flush();
}

} // namespace tpp
