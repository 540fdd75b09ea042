#ifndef TPP_DIRECTIVE_REGISTRY_HPP
#define TPP_DIRECTIVE_REGISTRY_HPP

#include <cstddef>
#include <functional>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tpp/util/result.hpp"
#include "tpp/util/transparent_comparison.hpp"
#include "tpp/util/typo.hpp"

#include "tpp/fwd.hpp"

namespace tpp {

/// @brief Whether a directive can be evaluated at compile time.
enum struct Purity : Default_Underlying {
    /// @brief The output depends only on the literal arguments (and literal content).
    pure,
    /// @brief The output depends on the per-request rendering context.
    context_dependent,
};

/// @brief How the arguments of a directive are checked and prepared for evaluation.
enum struct Argument_Shape : Default_Underlying {
    /// @brief Arguments are not inspected.
    opaque,
    /// @brief Arguments are whitespace-separated values, evaluable if they are quoted strings or
    /// numbers.
    literals,
    /// @brief Arguments are bare words from a fixed set of keywords.
    keywords,
};

/// @brief How the branches of a block directive are rendered,
/// which determines how open HTML elements are reconciled across them.
enum struct Block_Kind : Default_Underlying {
    /// @brief Exactly one branch is rendered, or none if there is no exhaustive branch.
    conditional,
    /// @brief The first branch is rendered any number of times;
    /// further branches are rendered instead of it.
    loop,
    /// @brief The content is rendered exactly once.
    scope,
    /// @brief Any branch is rendered any number of times, so each branch has to be balanced.
    isolated,
    /// @brief The content is not rendered as HTML; it is not tracked structurally.
    opaque,
};

struct Block_Info {
    Block_Kind kind = Block_Kind::scope;
    /// @brief Keywords which start a new branch, like `elif` and `else` for `if`.
    std::vector<std::u8string> branch_keywords {};
    /// @brief The keyword whose branch is rendered when no other branch is,
    /// like `else` for `if`.
    /// It has to be the last branch.
    /// Empty if there is none.
    std::u8string exhaustive_keyword {};
    /// @brief If `true`, the content is skipped by the parser up to the closing tag,
    /// without being interpreted.
    bool ignores_content = false;
};

enum struct Literal_Kind : Default_Underlying {
    /// @brief A quoted string, like `"abc"`.
    string,
    /// @brief An integer or floating-point number, like `10` or `1.5`.
    number,
    /// @brief A bare word, like `openblock`.
    keyword,
};

struct Literal_Argument {
    Literal_Kind kind;
    /// @brief The value of the argument, without quotes and with escapes resolved.
    std::u8string value;

    [[nodiscard]]
    friend bool operator==(const Literal_Argument&, const Literal_Argument&)
        = default;
};

struct Fold_Input {
    std::span<const Literal_Argument> arguments;
    /// @brief The whole argument string, as written.
    std::u8string_view raw_arguments;
    /// @brief The literal content of a block directive, or `std::nullopt` for inline directives
    /// and directives whose content is ignored.
    std::optional<std::u8string_view> content;
};

/// @brief Evaluates a pure directive at compile time.
/// Returns the literal output or an error message.
using Directive_Evaluator = std::function<Result<std::u8string, std::u8string>(const Fold_Input&)>;

struct Directive_Entry {
    std::u8string name;
    Argument_Shape shape = Argument_Shape::opaque;
    std::size_t min_arguments = 0;
    std::size_t max_arguments = std::size_t(-1);
    /// @brief The permitted keywords if `shape` is `Argument_Shape::keywords`.
    std::vector<std::u8string> keywords {};
    Purity purity = Purity::context_dependent;
    Directive_Evaluator evaluator {};
    /// @brief Information about the block if this is a block directive,
    /// or `std::nullopt` for inline directives.
    std::optional<Block_Info> block {};

    [[nodiscard]]
    bool is_block() const
    {
        return block.has_value();
    }

    [[nodiscard]]
    bool is_pure() const
    {
        return purity == Purity::pure;
    }
};

enum struct Registry_Error : Default_Underlying {
    /// @brief An entry with the same name already exists.
    duplicate_name,
    /// @brief The name is empty, contains characters that cannot appear in directive names,
    /// starts with `!`, or starts with `end` (which is reserved for closing tags).
    invalid_name,
    /// @brief A pure entry has no evaluator.
    missing_evaluator,
    /// @brief The minimum number of arguments exceeds the maximum.
    invalid_arity,
    /// @brief A branch keyword is invalid, or the exhaustive keyword is not a branch keyword.
    invalid_block,
};

[[nodiscard]]
std::u8string_view registry_error_message(Registry_Error error);

/// @brief The table of known directives.
/// The registry is populated once before any compilation takes place
/// and is only read during compilation,
/// which makes it safe to share between threads without synchronization.
struct Directive_Registry {
private:
    std::unordered_map<
        std::u8string,
        Directive_Entry,
        Transparent_String_View_Hash8,
        Transparent_String_View_Equals8>
        m_entries;
    std::vector<std::u8string_view> m_names;

public:
    Directive_Registry() = default;

    Directive_Registry(const Directive_Registry&) = delete;
    Directive_Registry& operator=(const Directive_Registry&) = delete;
    Directive_Registry(Directive_Registry&&) = default;
    Directive_Registry& operator=(Directive_Registry&&) = default;

    /// @brief Adds an entry.
    /// Failure indicates a programming error in the set of registered directives
    /// and should be treated as fatal during initialization.
    [[nodiscard]]
    Result<void, Registry_Error> add(Directive_Entry&& entry);

    /// @brief Returns the entry with the given `name`, or `nullptr` if there is none.
    [[nodiscard]]
    const Directive_Entry* find(std::u8string_view name) const;

    [[nodiscard]]
    bool contains(std::u8string_view name) const
    {
        return find(name) != nullptr;
    }

    /// @brief Returns `true` if `name` is a block directive.
    [[nodiscard]]
    bool is_block(std::u8string_view name) const;

    /// @brief Returns `true` if `keyword` starts a new branch in the block directive `family`.
    [[nodiscard]]
    bool is_branch_keyword(std::u8string_view family, std::u8string_view keyword) const;

    /// @brief Returns `true` if `keyword` is a branch keyword of any block directive.
    [[nodiscard]]
    bool is_any_branch_keyword(std::u8string_view keyword) const;

    /// @brief Returns the names of all entries in insertion order.
    [[nodiscard]]
    std::span<const std::u8string_view> names() const
    {
        return m_names;
    }

    /// @brief Returns the name of the entry that is most plausibly meant by `name`,
    /// or an empty string.
    [[nodiscard]]
    std::u8string_view suggest(std::u8string_view name, std::pmr::memory_resource* memory) const;
};

} // namespace tpp

#endif
