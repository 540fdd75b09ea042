#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "tpp/util/ansi.hpp"
#include "tpp/util/io.hpp"
#include "tpp/util/result.hpp"
#include "tpp/util/strings.hpp"
#include "tpp/util/tty.hpp"

#include "tpp/builtin_directives.hpp"
#include "tpp/compile.hpp"
#include "tpp/diagnostic.hpp"
#include "tpp/directive_registry.hpp"
#include "tpp/fwd.hpp"
#include "tpp/options.hpp"
#include "tpp/print.hpp"
#include "tpp/services.hpp"
#include "tpp/template_loader.hpp"

namespace tpp {
namespace {

struct Stderr_Logger final : Logger {
private:
    const Template_Loader& m_loader;
    std::mutex m_mutex;
    std::u8string m_out;

public:
    [[nodiscard]]
    Stderr_Logger(const Template_Loader& loader, Severity min_severity)
        : Logger { min_severity }
        , m_loader { loader }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        std::u8string_view name = u8"(unknown)";
        std::u8string_view source;
        if (const std::optional<Template_Entry> entry = m_loader.find(diagnostic.location.file)) {
            name = entry->name;
            source = entry->source;
        }
        const std::scoped_lock lock { m_mutex };
        print_diagnostic(m_out, diagnostic, name, source, is_stderr_tty);
        print_flush_stderr(m_out);
        m_out.clear();
    }
};

/// @brief Returns the names of all files under `root` as generic paths relative to `root`,
/// sorted alphabetically.
[[nodiscard]]
std::vector<std::u8string> discover_templates(const std::filesystem::path& root)
{
    std::vector<std::filesystem::path> paths;
    find_files_recursively(paths, root);
    std::vector<std::u8string> result;
    result.reserve(paths.size());
    for (const std::filesystem::path& path : paths) {
        result.push_back(path.lexically_relative(root).generic_u8string());
    }
    std::ranges::sort(result);
    return result;
}

void print_error_line(std::u8string_view message)
{
    std::u8string out;
    if (is_stderr_tty) {
        out += ansi::h_red;
    }
    out += u8"error: ";
    if (is_stderr_tty) {
        out += ansi::reset;
    }
    out += message;
    out += u8'\n';
    print_flush_stderr(out);
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };

    args::ArgumentParser parser {
        "Compiles templates into smaller templates which render the same output."
    };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::PositionalList<std::string> inputs_arg {
        parser,
        "inputs",
        "Names of the templates to compile, relative to the template root",
    };
    args::Flag all_arg {
        parser,
        "all",
        "Compile every file under the template root",
        { 'a', "all" },
    };
    args::ValueFlag<std::string> root_arg {
        parser, "root", "Template root directory", { 'r', "root" }, "."
    };
    args::ValueFlag<std::string> output_arg {
        parser,
        "output",
        "Output directory for compiled templates",
        { 'o', "output" },
        args::Options::Required,
    };
    args::ValueFlagList<std::string> option_arg {
        parser,
        "option",
        "Option flags like \"no-whitespace-compression\", applied after the defaults",
        { 'O', "option" },
    };
    args::ValueFlag<std::string> app_arg {
        parser, "app", "Application id that the templates belong to", { "app" }
    };
    args::Flag debug_arg {
        parser, "debug", "Emit debug markers into the output", { 'd', "debug" }
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::info,
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }

    Option_Config config;
    Option_Scope command_line_scope;
    bool any_unknown_flags = false;
    for (const std::string& flags : option_arg.Get()) {
        const auto on_unknown = [&](std::u8string_view word) {
            std::u8string message = u8"Unknown option flag \"";
            message += word;
            message += u8"\".";
            print_error_line(message);
            any_unknown_flags = true;
        };
        std::vector<Option_Override> overrides
            = parse_option_overrides(as_u8string_view(flags), on_unknown);
        command_line_scope.overrides.insert(
            command_line_scope.overrides.end(), overrides.begin(), overrides.end()
        );
    }
    if (any_unknown_flags) {
        return EXIT_FAILURE;
    }
    config.scopes.push_back(std::move(command_line_scope));

    const std::filesystem::path root { root_arg.Get() };
    const std::filesystem::path output_directory { output_arg.Get() };
    const std::u8string application = to_u8string(app_arg.Get());

    std::vector<std::u8string> names;
    if (all_arg.Matched()) {
        names = discover_templates(root);
    }
    for (const std::string& input : inputs_arg.Get()) {
        names.push_back(to_u8string(input));
    }
    if (names.empty()) {
        print_error_line(u8"No templates to compile.");
        return EXIT_FAILURE;
    }

    Directive_Registry registry = make_builtin_registry();
    Filesystem_Template_Loader loader { root };
    Stderr_Logger logger { loader, severity_arg.Get() };
    const Compile_Settings settings { .registry = registry,
                                      .logger = logger,
                                      .loader = &loader,
                                      .packer = nullptr,
                                      .debug = debug_arg.Matched() };

    bool any_failed = false;
    for (const std::u8string& name : names) {
        const Option_Set options = config.resolve(name, application);
        const Compile_Result result = compile_template(name, options, settings);
        if (!result) {
            any_failed = true;
            continue;
        }

        const std::filesystem::path relative { name, std::filesystem::path::generic_format };
        const std::filesystem::path out_path = output_directory / relative;
        // Failure to create the directory surfaces as a write error below.
        std::error_code error;
        std::filesystem::create_directories(out_path.parent_path(), error);
        const Result<void, IO_Error_Code> written
            = write_utf8_file(out_path.generic_u8string(), result->output);
        if (!written) {
            std::u8string message;
            print_io_error(message, out_path.generic_u8string(), written.error(), is_stderr_tty);
            print_flush_stderr(message);
            any_failed = true;
        }
    }

    return any_failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace tpp

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return tpp::main(argc, argv);
}
