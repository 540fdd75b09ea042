#ifndef TPP_NORMALIZE_HPP
#define TPP_NORMALIZE_HPP

#include <cstddef>
#include <span>

#include "tpp/ast.hpp"
#include "tpp/fwd.hpp"
#include "tpp/options.hpp"

namespace tpp {

/// @brief The pair id of `element_close` nodes which do not close any tracked element.
inline constexpr std::size_t no_pair_id = std::size_t(-1);

/// @brief Interprets the HTML within the text of a directive tree,
/// producing a tree of elements, attributes, and directives.
///
/// Open elements are tracked on a tag stack which is cloned for every branch of a block directive
/// and reconciled when the directive ends:
/// every render path of the directive has to leave the same elements open.
/// An element whose open and close tag are siblings becomes an `element` node;
/// otherwise, the tags become `element_open` and `element_close` nodes sharing a pair id.
///
/// A directive inside a tag has to leave all of its branches in the state it started in,
/// i.e. it has to produce whole attributes, or whole parts of an attribute value.
///
/// Option nodes are applied in document order and affect all following nodes,
/// including those after an enclosing directive.
/// @param out the normalized top-level nodes are appended to this vector
/// @param in the result of parsing (and possibly inheritance resolution)
/// @param registry supplies the block kinds of directives
/// @param options the options at the start of the template
/// @param logger receives structural errors and warnings about unknown option flags
/// @returns `true` iff no structural errors occurred
[[nodiscard]]
bool normalize(
    ast::Node_List& out,
    ast::Node_List&& in,
    const Directive_Registry& registry,
    Option_Set options,
    Logger& logger
);

/// @brief Applies the flags of an option node to `options`.
/// Unknown flags are ignored.
void apply_option_node(Option_Set& options, const ast::Node& option);

/// @brief Applies all option nodes within `nodes` (including nested ones) in document order.
void apply_option_nodes(Option_Set& options, std::span<const ast::Node> nodes);

} // namespace tpp

#endif
