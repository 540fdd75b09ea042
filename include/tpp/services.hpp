#ifndef TPP_SERVICES_HPP
#define TPP_SERVICES_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "tpp/util/assert.hpp"
#include "tpp/util/result.hpp"

#include "tpp/diagnostic.hpp"
#include "tpp/fwd.hpp"

namespace tpp {

struct Template_Entry {
    File_Id id;
    std::u8string_view source;
    std::u8string_view name;
};

enum struct Template_Load_Error : Default_Underlying {
    /// @brief Generic I/O error.
    error,
    /// @brief The template was not found.
    not_found,
    /// @brief I/O (disk) error when reading the template.
    read_error,
    /// @brief The template contains corrupted UTF-8 data.
    corrupted,
};

[[nodiscard]]
constexpr std::u8string_view template_load_error_message(Template_Load_Error error)
{
    switch (error) {
    case Template_Load_Error::error: return u8"The template could not be loaded.";
    case Template_Load_Error::not_found: return u8"The template was not found.";
    case Template_Load_Error::read_error:
        return u8"An I/O error occurred while reading the template.";
    case Template_Load_Error::corrupted: return u8"The template is not properly UTF-8 encoded.";
    }
    return u8"Unknown template load error.";
}

/// @brief Loads templates into memory and stores their text persistently,
/// so that AST nodes and diagnostics can keep non-owning views into that text.
///
/// Implementations shall be safe to use from multiple threads at once
/// because the compilation cache compiles different units concurrently.
struct Template_Loader {
    /// @brief Loads the template with the given `name`.
    /// Every call loads the template anew, so that changes to the underlying storage
    /// are observed by recompilation.
    /// The returned entry remains valid for the lifetime of the loader.
    [[nodiscard]]
    virtual Result<Template_Entry, Template_Load_Error> load(std::u8string_view name)
        = 0;

    /// @brief Returns the entry that was previously returned by `load` with the given `id`,
    /// or `std::nullopt` if there is none.
    [[nodiscard]]
    virtual std::optional<Template_Entry> find(File_Id id) const
        = 0;

    virtual ~Template_Loader() = default;
};

enum struct Asset_Kind : Default_Underlying {
    javascript,
    css,
};

/// @brief Combines external scripts or stylesheets into a single published bundle.
/// Writing the bundle to disk or serving it is up to the implementation.
struct Asset_Packer {
    /// @brief Packs the assets with the given `urls` (in document order) into one bundle.
    /// @returns The URL of the bundle, or an error message.
    [[nodiscard]]
    virtual Result<std::u8string, std::u8string>
    pack(Asset_Kind kind, std::span<const std::u8string_view> urls)
        = 0;

    virtual ~Asset_Packer() = default;
};

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        TPP_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;

    /// @brief Logs a diagnostic if `can_log(severity)` is `true`.
    void log(
        Severity severity,
        std::u8string_view id,
        const File_Source_Span& location,
        std::u8string_view message
    )
    {
        if (can_log(severity)) {
            (*this)(Diagnostic { severity, id, location, message });
        }
    }

    constexpr virtual ~Logger() = default;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

} // namespace tpp

#endif
