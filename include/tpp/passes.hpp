#ifndef TPP_PASSES_HPP
#define TPP_PASSES_HPP

#include <memory_resource>

#include "tpp/ast.hpp"
#include "tpp/fwd.hpp"
#include "tpp/options.hpp"

namespace tpp {

/// @brief The services that optimization passes have access to.
struct Pass_Context {
    const Directive_Registry& registry;
    Logger& logger;
    /// @brief The packer for external scripts and stylesheets, or `nullptr` if there is none.
    Asset_Packer* packer = nullptr;
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();
};

// Every pass walks the tree in document order, starting with the given options.
// Option nodes change the options for all following nodes.
// A pass returns `false` if it reported an error, which fails the compilation.

/// @brief Removes comments and replaces pure directives with literal arguments,
/// as well as expressions consisting of a single string or number literal,
/// with their output.
/// The content of a pure block directive is folded first;
/// the directive is only evaluated if its content is static HTML afterwards.
/// Evaluation failure is reported as a `fold.failed` error.
/// Inline directives which are not in the registry are reported as soft warnings.
[[nodiscard]]
bool fold_constants(ast::Node_List& nodes, Option_Set options, Pass_Context& context);

/// @brief Merges adjacent text nodes, collapses runs of HTML whitespace into a single space,
/// and removes text consisting only of whitespace between two block-level boundaries.
/// Whitespace-preserving elements like `<pre>`, raw blocks, and attribute values are left alone.
/// Only takes effect where both `whitespace-compression` and `html` are enabled.
/// Applying this pass to its own result has no further effect.
[[nodiscard]]
bool compress_whitespace(ast::Node_List& nodes, Option_Set options, Pass_Context& context);

/// @brief Merges internal scripts and stylesheets (`merge-internal-javascript`,
/// `merge-internal-css`) and minifies literal embedded scripts and stylesheets
/// (`compile-javascript`, `compile-css`).
/// Only elements outside of directive branches whose content is literal text are merged;
/// `data-no-merge` excludes an element from merging.
[[nodiscard]]
bool merge_scripts_and_styles(ast::Node_List& nodes, Option_Set options, Pass_Context& context);

/// @brief Hands groups of adjacent external scripts (`pack-external-javascript`) or stylesheets
/// (`pack-external-css`) with literal URLs to the asset packer of `context`,
/// and replaces each group with a single element referring to the bundle.
[[nodiscard]]
bool pack_external_assets(ast::Node_List& nodes, Option_Set options, Pass_Context& context);

/// @brief Checks the attributes of elements (`validate-html`),
/// and removes empty `class` attributes (`html-remove-empty-class-attributes`).
[[nodiscard]]
bool validate_html(ast::Node_List& nodes, Option_Set options, Pass_Context& context);

/// @brief Runs all passes in their fixed order:
/// folding, whitespace compression, merging, packing, and validation.
/// Whitespace is compressed once more at the end
/// because merging and packing can make text nodes adjacent.
/// @returns `true` iff all passes succeeded; no further passes run after a failing pass
[[nodiscard]]
bool run_passes(ast::Node_List& nodes, Option_Set options, Pass_Context& context);

} // namespace tpp

#endif
