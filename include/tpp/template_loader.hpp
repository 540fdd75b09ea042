#ifndef TPP_TEMPLATE_LOADER_HPP
#define TPP_TEMPLATE_LOADER_HPP

#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tpp/util/result.hpp"
#include "tpp/util/transparent_comparison.hpp"

#include "tpp/fwd.hpp"
#include "tpp/services.hpp"

namespace tpp {

struct Owned_Template_Entry {
    std::u8string name;
    std::u8string text;
};

/// @brief A `Template_Loader` that serves templates from memory.
/// Templates are registered with `set`, which may also replace an existing template;
/// entries obtained before the replacement stay valid.
struct Memory_Template_Loader final : Template_Loader {
private:
    mutable std::mutex m_mutex;
    std::unordered_map<
        std::u8string,
        std::u8string,
        Transparent_String_View_Hash8,
        Transparent_String_View_Equals8>
        m_sources;
    std::deque<Owned_Template_Entry> m_entries;

public:
    Memory_Template_Loader() = default;

    void set(std::u8string_view name, std::u8string_view source);

    [[nodiscard]]
    Result<Template_Entry, Template_Load_Error> load(std::u8string_view name) final;

    [[nodiscard]]
    std::optional<Template_Entry> find(File_Id id) const final;
};

/// @brief A `Template_Loader` that loads templates relative to a constant root directory.
/// Template names are generic (forward-slash) paths.
struct Filesystem_Template_Loader final : Template_Loader {
private:
    std::filesystem::path m_root;
    mutable std::mutex m_mutex;
    std::deque<Owned_Template_Entry> m_entries;

public:
    [[nodiscard]]
    explicit Filesystem_Template_Loader(std::filesystem::path root);

    [[nodiscard]]
    const std::filesystem::path& get_root() const
    {
        return m_root;
    }

    [[nodiscard]]
    Result<Template_Entry, Template_Load_Error> load(std::u8string_view name) final;

    [[nodiscard]]
    std::optional<Template_Entry> find(File_Id id) const final;
};

} // namespace tpp

#endif
