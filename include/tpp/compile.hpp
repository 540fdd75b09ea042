#ifndef TPP_COMPILE_HPP
#define TPP_COMPILE_HPP

#include <optional>
#include <string>
#include <string_view>

#include "tpp/util/result.hpp"
#include "tpp/util/source_position.hpp"

#include "tpp/fwd.hpp"
#include "tpp/generate.hpp"
#include "tpp/options.hpp"

namespace tpp {

#define TPP_COMPILE_ERROR_KIND_ENUM_DATA(F)                                                        \
    F(io)                                                                                          \
    F(lex)                                                                                         \
    F(parse)                                                                                       \
    F(inheritance)                                                                                 \
    F(structure)                                                                                   \
    F(fold)                                                                                        \
    F(validation)                                                                                  \
    F(script)

#define TPP_COMPILE_ERROR_KIND_ENUMERATOR(id) id,

/// @brief The stage of the pipeline which failed.
enum struct Compile_Error_Kind : Default_Underlying {
    TPP_COMPILE_ERROR_KIND_ENUM_DATA(TPP_COMPILE_ERROR_KIND_ENUMERATOR)
};

[[nodiscard]]
std::u8string_view compile_error_kind_name(Compile_Error_Kind kind);

/// @brief Returns the kind of error that a diagnostic with the given `id` belongs to,
/// or `std::nullopt` if the id does not belong to any pipeline stage.
[[nodiscard]]
std::optional<Compile_Error_Kind> compile_error_kind_of(std::u8string_view id);

/// @brief The first error that made a compilation fail.
/// All diagnostics, including this one, are also sent to the logger of the compilation.
struct Compile_Error {
    Compile_Error_Kind kind;
    /// @brief The location of the error, or `std::nullopt` if the template could not be loaded.
    std::optional<File_Source_Span> location;
    std::u8string message;
};

using Compile_Result = Result<Compiled_Artifact, Compile_Error>;

/// @brief The services and settings of a compilation.
struct Compile_Settings {
    const Directive_Registry& registry;
    Logger& logger;
    /// @brief Loads templates referenced by `extends` and `include`.
    /// If null, inheritance is not resolved.
    Template_Loader* loader = nullptr;
    /// @brief Packs external scripts and stylesheets.
    /// If null, packing is skipped.
    Asset_Packer* packer = nullptr;
    /// @brief If `true`, the output contains debug markers and the artifact has a debug map.
    bool debug = false;
};

/// @brief Runs the full pipeline on `source` without any caching:
/// lexing and parsing, inheritance resolution, structural normalization,
/// the optimization passes, and generation.
/// @param source the template source, which has to outlive the call
/// @param file the file that `source` belongs to
/// @param name the name under which `source` is known to the loader,
/// or an empty string if it was not obtained from a loader
/// @param options the options at the start of the template
[[nodiscard]]
Compile_Result compile_source(
    std::u8string_view source,
    File_Id file,
    std::u8string_view name,
    Option_Set options,
    const Compile_Settings& settings
);

/// @brief Loads the template with the given `name` from `settings.loader` and compiles it.
/// Failure to load is reported as an error of kind `io`.
/// `settings.loader` shall not be null.
[[nodiscard]]
Compile_Result
compile_template(std::u8string_view name, Option_Set options, const Compile_Settings& settings);

} // namespace tpp

#endif
