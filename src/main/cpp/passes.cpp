#include "tpp/ast.hpp"
#include "tpp/options.hpp"
#include "tpp/passes.hpp"

namespace tpp {

bool run_passes(ast::Node_List& nodes, Option_Set options, Pass_Context& context)
{
    using Pass = bool(ast::Node_List&, Option_Set, Pass_Context&);
    static constexpr Pass* passes[] {
        fold_constants,           compress_whitespace, merge_scripts_and_styles,
        pack_external_assets,     validate_html,       compress_whitespace,
    };
    for (Pass* const pass : passes) {
        if (!pass(nodes, options, context)) {
            return false;
        }
    }
    return true;
}

} // namespace tpp
