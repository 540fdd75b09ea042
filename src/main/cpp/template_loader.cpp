#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "tpp/util/io.hpp"
#include "tpp/util/result.hpp"

#include "tpp/services.hpp"
#include "tpp/template_loader.hpp"

namespace tpp {
namespace {

[[nodiscard]]
constexpr Template_Load_Error io_error_to_load_error(IO_Error_Code error)
{
    switch (error) {
    case IO_Error_Code::cannot_open: return Template_Load_Error::not_found;
    case IO_Error_Code::read_error: return Template_Load_Error::read_error;
    case IO_Error_Code::corrupted: return Template_Load_Error::corrupted;
    default: return Template_Load_Error::error;
    }
}

[[nodiscard]]
Template_Entry make_entry(std::size_t index, const Owned_Template_Entry& owned)
{
    return { .id = File_Id(index), .source = owned.text, .name = owned.name };
}

[[nodiscard]]
std::optional<Template_Entry>
find_entry(const std::deque<Owned_Template_Entry>& entries, File_Id id)
{
    const auto value = int(id);
    if (value < 0 || std::size_t(value) >= entries.size()) {
        return {};
    }
    return make_entry(std::size_t(value), entries[std::size_t(value)]);
}

} // namespace

void Memory_Template_Loader::set(std::u8string_view name, std::u8string_view source)
{
    const std::scoped_lock lock { m_mutex };
    if (const auto it = m_sources.find(name); it != m_sources.end()) {
        it->second = source;
    }
    else {
        m_sources.emplace(name, source);
    }
}

Result<Template_Entry, Template_Load_Error> Memory_Template_Loader::load(std::u8string_view name)
{
    const std::scoped_lock lock { m_mutex };
    const auto it = m_sources.find(name);
    if (it == m_sources.end()) {
        return Template_Load_Error::not_found;
    }
    const auto& entry = m_entries.emplace_back(std::u8string { name }, it->second);
    return make_entry(m_entries.size() - 1, entry);
}

std::optional<Template_Entry> Memory_Template_Loader::find(File_Id id) const
{
    const std::scoped_lock lock { m_mutex };
    return find_entry(m_entries, id);
}

Filesystem_Template_Loader::Filesystem_Template_Loader(std::filesystem::path root)
    : m_root { std::move(root) }
{
}

Result<Template_Entry, Template_Load_Error>
Filesystem_Template_Loader::load(std::u8string_view name)
{
    const std::filesystem::path relative { name, std::filesystem::path::generic_format };
    const std::filesystem::path resolved = m_root / relative;

    Result<std::u8string, IO_Error_Code> text = load_utf8_file(resolved.generic_u8string());
    if (!text) {
        return io_error_to_load_error(text.error());
    }

    const std::scoped_lock lock { m_mutex };
    const auto& entry = m_entries.emplace_back(std::u8string { name }, std::move(*text));
    return make_entry(m_entries.size() - 1, entry);
}

std::optional<Template_Entry> Filesystem_Template_Loader::find(File_Id id) const
{
    const std::scoped_lock lock { m_mutex };
    return find_entry(m_entries, id);
}

} // namespace tpp
