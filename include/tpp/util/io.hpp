#ifndef TPP_IO_HPP
#define TPP_IO_HPP

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tpp/util/function_ref.hpp"
#include "tpp/util/result.hpp"

#include "tpp/fwd.hpp"

namespace tpp {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to disk errors, security issues, bad file paths, or other issues.
    cannot_open,
    /// @brief An error occurred while reading a file.
    read_error,
    /// @brief An error occurred while writing a file.
    write_error,
    /// @brief The file is not properly encoded.
    /// For example, if an attempt is made to read a text file as UTF-8 that is not encoded as such.
    corrupted,
};

[[nodiscard]]
constexpr std::u8string_view io_error_code_message(IO_Error_Code code)
{
    switch (code) {
    case IO_Error_Code::cannot_open: return u8"The file could not be opened.";
    case IO_Error_Code::read_error: return u8"An I/O error occurred while reading the file.";
    case IO_Error_Code::write_error: return u8"An I/O error occurred while writing the file.";
    case IO_Error_Code::corrupted: return u8"The file is not properly UTF-8 encoded.";
    }
    return u8"Unknown I/O error.";
}

struct [[nodiscard]] Unique_File {
private:
    std::FILE* m_file = nullptr;

public:
    constexpr Unique_File() = default;

    constexpr Unique_File(std::FILE* f)
        : m_file { f }
    {
    }

    constexpr Unique_File(Unique_File&& other) noexcept
        : m_file { std::exchange(other.m_file, nullptr) }
    {
    }

    Unique_File(const Unique_File&) = delete;
    Unique_File& operator=(const Unique_File&) = delete;

    Unique_File& operator=(Unique_File&& other) noexcept
    {
        close();
        m_file = std::exchange(other.m_file, nullptr);
        return *this;
    }

    void close() noexcept
    {
        if (m_file) {
            std::fclose(m_file);
            m_file = nullptr;
        }
    }

    [[nodiscard]]
    constexpr std::FILE* get() const noexcept
    {
        return m_file;
    }

    [[nodiscard]]
    constexpr operator bool() const noexcept
    {
        return m_file != nullptr;
    }

    ~Unique_File()
    {
        close();
    }
};

/// @brief Forwards the arguments to `std::fopen` and wraps the result in `Unique_File`.
[[nodiscard]]
inline Unique_File fopen_unique(const char* path, const char* mode) noexcept
{
    return std::fopen(path, mode);
}

/// @brief Reads all bytes from a file and calls a given consumer with them, chunk by chunk.
/// @param consume_chunk Invoked repeatedly with temporary chunks of bytes.
/// The chunks may be located within the same underlying buffer,
/// so they should not be used after `consume_chunk` has been invoked.
/// @param path the file path
[[nodiscard]]
Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::u8string_view path
);

/// @brief Loads a UTF-8 encoded text file.
/// Fails with `IO_Error_Code::corrupted` if the file contents are not valid UTF-8.
[[nodiscard]]
Result<std::u8string, IO_Error_Code> load_utf8_file(std::u8string_view path);

/// @brief Writes `text` to the file at `path`, replacing its contents.
/// Parent directories are not created.
[[nodiscard]]
Result<void, IO_Error_Code> write_utf8_file(std::u8string_view path, std::u8string_view text);

/// @brief Appends every regular file within `directory` (recursively) to `out`
/// for which `filter` returns `true`.
/// If `filter` is null, every regular file is appended.
void find_files_recursively(
    std::vector<std::filesystem::path>& out,
    const std::filesystem::path& directory,
    Function_Ref<bool(const std::filesystem::directory_entry&)> filter = {}
);

} // namespace tpp

#endif
