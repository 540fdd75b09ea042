#include <algorithm>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tpp/util/assert.hpp"
#include "tpp/util/result.hpp"
#include "tpp/util/source_position.hpp"

#include "tpp/ast.hpp"
#include "tpp/compile.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/fwd.hpp"
#include "tpp/generate.hpp"
#include "tpp/inheritance.hpp"
#include "tpp/normalize.hpp"
#include "tpp/options.hpp"
#include "tpp/parse.hpp"
#include "tpp/passes.hpp"
#include "tpp/services.hpp"

namespace tpp {

std::u8string_view compile_error_kind_name(Compile_Error_Kind kind)
{
    using enum Compile_Error_Kind;
    switch (kind) {
#define TPP_COMPILE_ERROR_KIND_CASE(id) TPP_ENUM_STRING_CASE8(id);
        TPP_COMPILE_ERROR_KIND_ENUM_DATA(TPP_COMPILE_ERROR_KIND_CASE)
#undef TPP_COMPILE_ERROR_KIND_CASE
    }
    TPP_ASSERT_UNREACHABLE(u8"Invalid compile error kind.");
}

std::optional<Compile_Error_Kind> compile_error_kind_of(std::u8string_view id)
{
    struct Prefix_Kind {
        std::u8string_view prefix;
        Compile_Error_Kind kind;
    };
    static constexpr Prefix_Kind prefixes[] {
        { u8"lex.", Compile_Error_Kind::lex },
        { u8"parse.", Compile_Error_Kind::parse },
        { u8"inheritance.", Compile_Error_Kind::inheritance },
        { u8"structure.", Compile_Error_Kind::structure },
        { u8"option.", Compile_Error_Kind::structure },
        { u8"fold.", Compile_Error_Kind::fold },
        { u8"directive.", Compile_Error_Kind::fold },
        { u8"validation.", Compile_Error_Kind::validation },
        { u8"js.", Compile_Error_Kind::script },
        { u8"css.", Compile_Error_Kind::script },
    };
    if (id == diagnostic::io) {
        return Compile_Error_Kind::io;
    }
    for (const auto& [prefix, kind] : prefixes) {
        if (id.starts_with(prefix)) {
            return kind;
        }
    }
    return {};
}

namespace {

/// @brief Forwards diagnostics to another logger and remembers the first error.
struct Error_Recording_Logger final : Logger {
private:
    Logger& m_target;
    std::optional<Compile_Error> m_first_error;

public:
    [[nodiscard]]
    explicit Error_Recording_Logger(Logger& target)
        : Logger { std::min(target.get_min_severity(), Severity::error) }
        , m_target { target }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        if (diagnostic.severity >= Severity::error && !m_first_error) {
            const Compile_Error_Kind kind
                = compile_error_kind_of(diagnostic.id).value_or(Compile_Error_Kind::structure);
            m_first_error = Compile_Error { .kind = kind,
                                            .location = diagnostic.location,
                                            .message = std::u8string { diagnostic.message } };
        }
        if (m_target.can_log(diagnostic.severity)) {
            m_target(diagnostic);
        }
    }

    /// @brief Returns the first error that was logged,
    /// or an error of the given `fallback` kind if a stage failed without logging an error.
    [[nodiscard]]
    Compile_Error take_error(Compile_Error_Kind fallback, std::u8string_view message)
    {
        if (m_first_error) {
            return std::move(*m_first_error);
        }
        return Compile_Error { .kind = fallback,
                               .location = {},
                               .message = std::u8string { message } };
    }
};

} // namespace

Compile_Result compile_source(
    std::u8string_view source,
    File_Id file,
    std::u8string_view name,
    Option_Set options,
    const Compile_Settings& settings
)
{
    std::pmr::unsynchronized_pool_resource memory;
    Error_Recording_Logger logger { settings.logger };

    ast::Node_List parsed;
    const auto on_parse_error
        = [&](std::u8string_view id, const File_Source_Span& location, std::u8string_view message) {
              logger.log(Severity::error, id, location, message);
          };
    if (!parse_and_build(parsed, source, file, settings.registry, on_parse_error, &memory)) {
        return logger.take_error(Compile_Error_Kind::parse, u8"The template could not be parsed.");
    }

    std::vector<File_Id> files { file };
    if (settings.loader && options.contains(Option_Flag::resolve_inheritance)) {
        std::vector<File_Id> dependencies;
        const bool resolved = resolve_inheritance(
            parsed, name, *settings.loader, settings.registry, dependencies, logger
        );
        if (!resolved) {
            return logger.take_error(
                Compile_Error_Kind::inheritance, u8"Template inheritance could not be resolved."
            );
        }
        for (const File_Id dependency : dependencies) {
            if (!std::ranges::contains(files, dependency)) {
                files.push_back(dependency);
            }
        }
    }

    ast::Node_List nodes;
    if (!normalize(nodes, std::move(parsed), settings.registry, options, logger)) {
        return logger.take_error(
            Compile_Error_Kind::structure, u8"The HTML structure of the template is invalid."
        );
    }

    Pass_Context context { .registry = settings.registry,
                           .logger = logger,
                           .packer = settings.packer,
                           .memory = &memory };
    if (!run_passes(nodes, options, context)) {
        return logger.take_error(
            Compile_Error_Kind::validation, u8"An optimization or validation pass failed."
        );
    }

    return generate(nodes, options, std::move(files), settings.debug);
}

Compile_Result
compile_template(std::u8string_view name, Option_Set options, const Compile_Settings& settings)
{
    TPP_ASSERT(settings.loader);
    const Result<Template_Entry, Template_Load_Error> entry = settings.loader->load(name);
    if (!entry) {
        std::u8string message = u8"Failed to load \"";
        message += name;
        message += u8"\": ";
        message += template_load_error_message(entry.error());
        const File_Source_Span location { Source_Span {}, File_Id::main };
        settings.logger.log(Severity::error, diagnostic::io, location, message);
        return Compile_Error { .kind = Compile_Error_Kind::io,
                               .location = {},
                               .message = std::move(message) };
    }
    return compile_source(entry->source, entry->id, entry->name, options, settings);
}

} // namespace tpp
