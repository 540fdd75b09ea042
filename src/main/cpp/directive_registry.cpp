#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>

#include "tpp/util/chars.hpp"
#include "tpp/util/result.hpp"
#include "tpp/util/typo.hpp"

#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"

namespace tpp {
namespace {

[[nodiscard]]
bool is_directive_name(std::u8string_view name)
{
    if (name.empty() || name.starts_with(u8'!')) {
        return false;
    }
    if (name.starts_with(u8"end") && name.length() > 3) {
        return false;
    }
    return std::ranges::all_of(name, [](char8_t c) { return is_directive_name_character(c); });
}

} // namespace

std::u8string_view registry_error_message(Registry_Error error)
{
    switch (error) {
    case Registry_Error::duplicate_name: return u8"A directive with this name already exists.";
    case Registry_Error::invalid_name: return u8"The directive name is invalid.";
    case Registry_Error::missing_evaluator: return u8"A pure directive requires an evaluator.";
    case Registry_Error::invalid_arity:
        return u8"The minimum number of arguments exceeds the maximum.";
    case Registry_Error::invalid_block: return u8"The block information is invalid.";
    }
    TPP_ASSERT_UNREACHABLE(u8"Invalid registry error.");
}

Result<void, Registry_Error> Directive_Registry::add(Directive_Entry&& entry)
{
    if (!is_directive_name(entry.name)) {
        return Registry_Error::invalid_name;
    }
    if (m_entries.contains(entry.name)) {
        return Registry_Error::duplicate_name;
    }
    if (entry.is_pure() && !entry.evaluator) {
        return Registry_Error::missing_evaluator;
    }
    if (entry.min_arguments > entry.max_arguments) {
        return Registry_Error::invalid_arity;
    }
    if (entry.block) {
        const auto& keywords = entry.block->branch_keywords;
        for (const std::u8string& keyword : keywords) {
            if (!is_directive_name(keyword) || keyword == entry.name) {
                return Registry_Error::invalid_block;
            }
        }
        if (!entry.block->exhaustive_keyword.empty()
            && std::ranges::find(keywords, entry.block->exhaustive_keyword) == keywords.end()) {
            return Registry_Error::invalid_block;
        }
    }

    std::u8string key = entry.name;
    const auto [it, success] = m_entries.emplace(std::move(key), std::move(entry));
    TPP_ASSERT(success);
    m_names.push_back(it->first);
    return {};
}

const Directive_Entry* Directive_Registry::find(std::u8string_view name) const
{
    const auto it = m_entries.find(name);
    return it == m_entries.end() ? nullptr : &it->second;
}

bool Directive_Registry::is_block(std::u8string_view name) const
{
    const Directive_Entry* const entry = find(name);
    return entry && entry->is_block();
}

bool Directive_Registry::is_branch_keyword(std::u8string_view family, std::u8string_view keyword)
    const
{
    const Directive_Entry* const entry = find(family);
    if (!entry || !entry->block) {
        return false;
    }
    return std::ranges::find(entry->block->branch_keywords, keyword)
        != entry->block->branch_keywords.end();
}

bool Directive_Registry::is_any_branch_keyword(std::u8string_view keyword) const
{
    return std::ranges::any_of(m_entries, [&](const auto& pair) {
        const Directive_Entry& entry = pair.second;
        return entry.block
            && std::ranges::find(entry.block->branch_keywords, keyword)
            != entry.block->branch_keywords.end();
    });
}

std::u8string_view
Directive_Registry::suggest(std::u8string_view name, std::pmr::memory_resource* memory) const
{
    const Distant<std::size_t> match = plausible_match(m_names, name, memory);
    return match ? m_names[match.value] : std::u8string_view {};
}

} // namespace tpp
