#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "tpp/util/result.hpp"

#include "tpp/cache.hpp"
#include "tpp/compile.hpp"
#include "tpp/fwd.hpp"
#include "tpp/options.hpp"

namespace tpp {
Compilation_Cache::Compilation_Cache(
    Template_Loader& loader,
    const Directive_Registry& registry,
    Logger& logger,
    Asset_Packer* packer
)
    : m_loader { loader }
    , m_registry { registry }
    , m_logger { logger }
    , m_packer { packer }
{
}

Cache_Result Compilation_Cache::compile(std::u8string_view name, Option_Set options, bool debug)
{
    const Key key { .name = std::u8string { name },
                    .option_bits = options.get_bits(),
                    .debug = debug };
    const std::shared_ptr<Entry> entry = get_entry(key);
    const std::scoped_lock lock { entry->mutex };
    if (entry->artifact) {
        return entry->artifact;
    }
    Cache_Result result = run(*entry, name, options, debug);
    if (!result) {
        discard_if_empty(key, entry);
    }
    return result;
}

Cache_Result Compilation_Cache::recompile(std::u8string_view name, Option_Set options, bool debug)
{
    const Key key { .name = std::u8string { name },
                    .option_bits = options.get_bits(),
                    .debug = debug };
    const std::shared_ptr<Entry> entry = get_entry(key);
    const std::scoped_lock lock { entry->mutex };
    Cache_Result result = run(*entry, name, options, debug);
    if (!result) {
        discard_if_empty(key, entry);
    }
    return result;
}

void Compilation_Cache::invalidate(std::u8string_view name)
{
    const std::scoped_lock lock { m_mutex };
    std::erase_if(m_entries, [&](const auto& pair) { return pair.first.name == name; });
}

void Compilation_Cache::clear()
{
    const std::scoped_lock lock { m_mutex };
    m_entries.clear();
}

std::size_t Compilation_Cache::entry_count() const
{
    const std::scoped_lock lock { m_mutex };
    return m_entries.size();
}

auto Compilation_Cache::get_entry(const Key& key) -> std::shared_ptr<Entry>
{
    const std::scoped_lock lock { m_mutex };
    std::shared_ptr<Entry>& entry = m_entries[key];
    if (!entry) {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

void Compilation_Cache::discard_if_empty(const Key& key, const std::shared_ptr<Entry>& entry)
{
    // Entry locks are always taken before the map lock, never the other way around.
    const std::scoped_lock lock { m_mutex };
    const auto it = m_entries.find(key);
    if (it != m_entries.end() && it->second == entry && !entry->artifact) {
        m_entries.erase(it);
    }
}

Cache_Result
Compilation_Cache::run(Entry& entry, std::u8string_view name, Option_Set options, bool debug)
{
    ++m_compile_count;
    const Compile_Settings settings { .registry = m_registry,
                                      .logger = m_logger,
                                      .loader = &m_loader,
                                      .packer = m_packer,
                                      .debug = debug };
    Compile_Result result = compile_template(name, options, settings);
    if (!result) {
        return std::move(result.error());
    }
    entry.artifact = std::make_shared<const Compiled_Artifact>(std::move(*result));
    return entry.artifact;
}

} // namespace tpp
