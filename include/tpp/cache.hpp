#ifndef TPP_CACHE_HPP
#define TPP_CACHE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>

#include "tpp/util/result.hpp"

#include "tpp/compile.hpp"
#include "tpp/fwd.hpp"
#include "tpp/generate.hpp"
#include "tpp/options.hpp"

namespace tpp {

using Shared_Artifact = std::shared_ptr<const Compiled_Artifact>;
using Cache_Result = Result<Shared_Artifact, Compile_Error>;

/// @brief Memoizes compiled artifacts by template name, option set, and debug mode.
///
/// A hit returns the very same artifact object as the compilation that populated the entry.
/// Recompiling or invalidating an entry does not invalidate templates that extend or include it.
///
/// The cache may be used from multiple threads at once.
/// Concurrent compilations of the same key run the pipeline only once;
/// compilations of different keys run in parallel.
struct Compilation_Cache {
private:
    struct Key {
        std::u8string name;
        std::uint32_t option_bits;
        bool debug;

        [[nodiscard]]
        friend bool operator<(const Key& x, const Key& y)
        {
            return std::tie(x.name, x.option_bits, x.debug)
                < std::tie(y.name, y.option_bits, y.debug);
        }
    };

    struct Entry {
        std::mutex mutex;
        Shared_Artifact artifact;
    };

    Template_Loader& m_loader;
    const Directive_Registry& m_registry;
    Logger& m_logger;
    Asset_Packer* m_packer;

    mutable std::mutex m_mutex;
    std::map<Key, std::shared_ptr<Entry>> m_entries;
    std::atomic<std::size_t> m_compile_count = 0;

public:
    /// @param logger receives the diagnostics of every compilation,
    /// possibly from multiple threads at once
    [[nodiscard]]
    Compilation_Cache(
        Template_Loader& loader,
        const Directive_Registry& registry,
        Logger& logger,
        Asset_Packer* packer = nullptr
    );

    Compilation_Cache(const Compilation_Cache&) = delete;
    Compilation_Cache& operator=(const Compilation_Cache&) = delete;

    /// @brief Returns the cached artifact for the key,
    /// or compiles the template and caches the result if there is none.
    /// Failed compilations are not cached.
    [[nodiscard]]
    Cache_Result compile(std::u8string_view name, Option_Set options, bool debug = false);

    /// @brief Like `compile`, but always runs the pipeline and replaces the cached artifact.
    [[nodiscard]]
    Cache_Result recompile(std::u8string_view name, Option_Set options, bool debug = false);

    /// @brief Removes all entries for the template with the given `name`.
    void invalidate(std::u8string_view name);

    /// @brief Removes all entries.
    void clear();

    /// @brief Returns the number of times that the pipeline was run.
    [[nodiscard]]
    std::size_t compile_count() const
    {
        return m_compile_count.load(std::memory_order::relaxed);
    }

    /// @brief Returns the number of keys that currently have an entry.
    [[nodiscard]]
    std::size_t entry_count() const;

private:
    [[nodiscard]]
    std::shared_ptr<Entry> get_entry(const Key& key);

    /// @brief Removes the entry for `key` if it is still `entry` and holds no artifact.
    /// The caller must hold the lock of `entry`.
    void discard_if_empty(const Key& key, const std::shared_ptr<Entry>& entry);

    [[nodiscard]]
    Cache_Result run(Entry& entry, std::u8string_view name, Option_Set options, bool debug);
};

} // namespace tpp

#endif
