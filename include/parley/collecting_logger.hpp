#ifndef PARLEY_COLLECTING_LOGGER_HPP
#define PARLEY_COLLECTING_LOGGER_HPP

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "parley/util/severity.hpp"
#include "parley/util/source_position.hpp"

#include "parley/diagnostic.hpp"
#include "parley/services.hpp"

namespace parley {

struct Collected_Diagnostic {
    Severity severity;
    std::u8string id;
    Source_Span location;
    std::u8string message;

    [[nodiscard]]
    explicit Collected_Diagnostic(const Diagnostic& d)
        : severity { d.severity }
        , id { d.id }
        , location { d.location }
        , message { d.message }
    {
    }
};

struct Collecting_Logger final : Logger {
    std::vector<Collected_Diagnostic> diagnostics;

    [[nodiscard]]
    explicit Collecting_Logger(Severity min_severity = Severity::min)
        : Logger { min_severity }
    {
    }

    void operator()(const Diagnostic diagnostic) final
    {
        diagnostics.emplace_back(diagnostic);
    }

    [[nodiscard]]
    bool nothing_logged() const
    {
        return diagnostics.empty();
    }

    [[nodiscard]]
    bool was_logged(const std::u8string_view id) const
    {
        return std::ranges::find(diagnostics, id, &Collected_Diagnostic::id) != diagnostics.end();
    }

    [[nodiscard]]
    std::size_t count(const std::u8string_view id) const
    {
        return std::size_t(std::ranges::count(diagnostics, id, &Collected_Diagnostic::id));
    }
};

} // namespace parley

#endif
