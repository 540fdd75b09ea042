#ifndef TPP_INHERITANCE_HPP
#define TPP_INHERITANCE_HPP

#include <string_view>
#include <vector>

#include "tpp/ast.hpp"
#include "tpp/fwd.hpp"

namespace tpp {

/// @brief Statically resolves template inheritance in a parsed template.
///
/// A top-level `{% extends "name" %}` whose argument is a string literal is replaced by the
/// (recursively resolved) base template,
/// where every `{% block %}` is replaced by the block of the same name in `nodes`,
/// and `{{ block.super }}` refers to the content of the overridden block.
/// The top-level `{% load %}` directives of `nodes` are kept in front of the result.
///
/// `{% include "name" %}` with a string literal and no further arguments is replaced with the
/// (recursively resolved) contents of the included template.
///
/// Directives with non-literal arguments are left untouched,
/// as are templates whose blocks use `block.super` in a way other than `{{ block.super }}`.
/// @param nodes the parsed template, which is modified in place
/// @param template_name the name of the template that `nodes` was parsed from,
/// or an empty string if it was not obtained from `loader`
/// @param dependencies the ids of all loaded templates are appended to this vector
/// @param logger receives `inheritance.cycle`, `inheritance.load`, and parse errors
/// within loaded templates
/// @returns `true` iff no errors occurred
[[nodiscard]]
bool resolve_inheritance(
    ast::Node_List& nodes,
    std::u8string_view template_name,
    Template_Loader& loader,
    const Directive_Registry& registry,
    std::vector<File_Id>& dependencies,
    Logger& logger
);

} // namespace tpp

#endif
