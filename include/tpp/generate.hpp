#ifndef TPP_GENERATE_HPP
#define TPP_GENERATE_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tpp/ast.hpp"
#include "tpp/fwd.hpp"
#include "tpp/options.hpp"

namespace tpp {

/// @brief Maps the output between `<!--tpp:N-->` and `<!--/tpp:N-->` to the source it came from.
struct Debug_Record {
    /// @brief The number `N` in the markers.
    std::size_t id;
    /// @brief The index in the output of the first character after the opening marker.
    std::size_t output_begin;
    /// @brief The length of the output between the markers.
    std::size_t output_length;
    File_Id file;
    /// @brief The zero-based line of the source.
    std::size_t line;
    /// @brief The zero-based column of the source.
    std::size_t column;
    /// @brief The length of the source span.
    std::size_t length;

    [[nodiscard]]
    friend bool operator==(const Debug_Record&, const Debug_Record&)
        = default;
};

/// @brief The result of compiling a template.
/// Artifacts are immutable once produced and shared between threads.
struct Compiled_Artifact {
    std::u8string output;
    /// @brief The debug records, ordered by `id`.
    /// Empty unless the template was compiled in debug mode.
    std::vector<Debug_Record> debug_map;
    /// @brief The options at the start of the template.
    Option_Set options;
    /// @brief The template itself, followed by every template that was inlined through
    /// inheritance, in the order in which they were loaded.
    std::vector<File_Id> files;
};

inline constexpr std::u8string_view debug_marker_prefix = u8"<!--tpp:";
inline constexpr std::u8string_view debug_marker_end_prefix = u8"<!--/tpp:";
inline constexpr std::u8string_view debug_marker_suffix = u8"-->";

/// @brief Serializes `nodes` into compact template source, which is appended to `out`.
/// Directives are written without inner padding like `{%if x%}` and `{{x}}`.
/// Text that would be mistaken for a template tag is protected with `{%templatetag%}`.
/// Raw blocks are surrounded by `{#!raw#}` and `{#!endraw#}`,
/// and option nodes are written as `{#! flags#}`.
/// @param debug_map if not null, debug markers are emitted for every node in content context
/// which produces output, and the corresponding records are appended to `*debug_map`
void generate(
    std::u8string& out,
    std::span<const ast::Node> nodes,
    std::vector<Debug_Record>* debug_map = nullptr
);

/// @brief Generates a compiled artifact for a template.
/// @param options the options at the start of the template
/// @param files the files that the template was built from
/// @param debug if `true`, the output is interleaved with debug markers
[[nodiscard]]
Compiled_Artifact generate(
    std::span<const ast::Node> nodes,
    Option_Set options,
    std::vector<File_Id> files,
    bool debug
);

/// @brief Serializes `nodes` into HTML if they consist only of text, elements,
/// and attributes with literal values.
/// Text is appended without `{%templatetag%}` protection because the result is content,
/// not template source.
/// @returns `true` if `nodes` were static;
/// otherwise `false`, in which case the contents of `out` are unspecified
[[nodiscard]]
bool generate_static_html(std::u8string& out, std::span<const ast::Node> nodes);

/// @brief Appends `text` to `out`, replacing every `{%`, `{{`, and `{#` as well as a trailing `{`
/// with the equivalent `{%templatetag%}`.
void append_protected_text(std::u8string& out, std::u8string_view text);

} // namespace tpp

#endif
