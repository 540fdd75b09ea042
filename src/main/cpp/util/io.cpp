#include <cstddef>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "ulight/impl/unicode.hpp"

#include "tpp/util/function_ref.hpp"
#include "tpp/util/io.hpp"
#include "tpp/util/result.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/fwd.hpp"
#include "tpp/settings.hpp"

namespace tpp {

Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::u8string_view path
)
{
    const std::string c_path = to_string(path);
    const Unique_File stream = fopen_unique(c_path.c_str(), "rb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    std::byte buffer[file_chunk_size] {};
    std::size_t read_size;
    do {
        read_size = std::fread(buffer, 1, file_chunk_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        consume_chunk(std::span<const std::byte> { buffer, read_size });
    } while (read_size == file_chunk_size);

    return {};
}

Result<std::u8string, IO_Error_Code> load_utf8_file(std::u8string_view path)
{
    std::u8string result;
    const auto append_chunk = [&result](std::span<const std::byte> chunk) {
        const std::size_t old_size = result.size();
        result.resize(old_size + chunk.size());
        if (!chunk.empty()) {
            std::memcpy(result.data() + old_size, chunk.data(), chunk.size());
        }
    };
    if (auto r = file_to_bytes_chunked(append_chunk, path); !r) {
        return r.error();
    }
    if (!ulight::utf8::is_valid(result)) {
        return IO_Error_Code::corrupted;
    }
    return result;
}

Result<void, IO_Error_Code> write_utf8_file(std::u8string_view path, std::u8string_view text)
{
    const std::string c_path = to_string(path);
    const Unique_File file = fopen_unique(c_path.c_str(), "wb");
    if (!file) {
        return IO_Error_Code::cannot_open;
    }
    const std::size_t bytes_written = std::fwrite(text.data(), 1, text.size(), file.get());
    if (bytes_written != text.size() || std::fflush(file.get()) != 0) {
        return IO_Error_Code::write_error;
    }
    return {};
}

void find_files_recursively(
    std::vector<std::filesystem::path>& out,
    const std::filesystem::path& directory,
    const Function_Ref<bool(const std::filesystem::directory_entry&)> filter
)
{
    std::error_code error;
    for (auto it = std::filesystem::recursive_directory_iterator(directory, error);
         !error && it != std::filesystem::recursive_directory_iterator(); it.increment(error)) {
        if (it->is_regular_file() && (!filter || filter(*it))) {
            out.push_back(it->path());
        }
    }
}

} // namespace tpp
