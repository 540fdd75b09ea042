#ifndef TPP_SOURCE_POSITION_HPP
#define TPP_SOURCE_POSITION_HPP

#include <cstddef>
#include <string_view>
#include <type_traits>

#include "tpp/util/assert.hpp"

#include "tpp/fwd.hpp"

namespace tpp {

/// Represents a position in a template source.
/// Lines and columns are zero-based; they are only made one-based when printed.
struct Source_Position {
    /// Line number.
    std::size_t line;
    /// Column number.
    std::size_t column;
    /// First index in the source that is part of the syntactical element.
    std::size_t begin;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Position, Source_Position)
        = default;
};

constexpr void advance(Source_Position& pos, char8_t c)
{
    switch (c) {
    case u8'\r': pos.column = 0; break;
    case u8'\n':
        pos.column = 0;
        pos.line += 1;
        break;
    default: pos.column += 1;
    }
    pos.begin += 1;
}

constexpr void advance(Source_Position& pos, std::u8string_view str)
{
    for (const char8_t c : str) {
        advance(pos, c);
    }
}

/// @brief Returns `pos` advanced by the first `n` characters of `text`,
/// where `text` is the source text beginning at `pos`.
[[nodiscard]]
constexpr Source_Position advanced(Source_Position pos, std::u8string_view text, std::size_t n)
{
    TPP_DEBUG_ASSERT(n <= text.length());
    advance(pos, text.substr(0, n));
    return pos;
}

/// Represents a contiguous range of characters in a template source.
struct Source_Span : Source_Position {
    std::size_t length;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Span, Source_Span)
        = default;

    /// @brief Returns a span with the same properties except that the length is `l`.
    [[nodiscard]]
    constexpr Source_Span with_length(std::size_t l) const
    {
        return { Source_Position { *this }, l }; // NOLINT(cppcoreguidelines-slicing)
    }

    [[nodiscard]]
    constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]]
    constexpr std::size_t end() const
    {
        return begin + length;
    }

    [[nodiscard]]
    constexpr bool contains(std::size_t pos) const
    {
        return pos >= begin && pos < end();
    }
};

template <typename File>
struct Basic_File_Source_Span : Source_Span {
    static_assert(std::is_trivially_copyable_v<File>);

    File file;

    [[nodiscard]]
    constexpr Basic_File_Source_Span(const Source_Span& local, File file)
        : Source_Span { local }
        , file { file }
    {
    }

    [[nodiscard]]
    constexpr Basic_File_Source_Span(const Source_Position& local, std::size_t length, File file)
        : Source_Span { local, length }
        , file { file }
    {
    }

    [[nodiscard]]
    friend constexpr auto operator<=>(Basic_File_Source_Span, Basic_File_Source_Span)
        = default;

    /// @brief Returns a span with the same properties except that the length is `l`.
    [[nodiscard]]
    constexpr Basic_File_Source_Span with_length(std::size_t l) const
    {
        return { Source_Span::with_length(l), file };
    }

    /// @brief Returns the span from the start of this span to the end of `last`.
    /// If `last` lies in a different file or before this span, `*this` is returned.
    [[nodiscard]]
    constexpr Basic_File_Source_Span until(const Basic_File_Source_Span& last) const
    {
        if (last.file != file || last.end() < begin) {
            return *this;
        }
        return with_length(last.end() - begin);
    }
};

/// Represents the location of a file, combined with the position within that file.
template <typename File>
struct Basic_File_Source_Position : Source_Position {
    static_assert(std::is_trivially_copyable_v<File>);

    File file;

    [[nodiscard]]
    constexpr Basic_File_Source_Position(Source_Position local, File file)
        : Source_Position(local)
        , file { file }
    {
    }

    [[nodiscard]]
    friend constexpr auto operator<=>(Basic_File_Source_Position, Basic_File_Source_Position)
        = default;
};

} // namespace tpp

#endif
