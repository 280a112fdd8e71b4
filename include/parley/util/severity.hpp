#ifndef PARLEY_SEVERITY_HPP
#define PARLEY_SEVERITY_HPP

#include <compare>
#include <string_view>

#include "parley/fwd.hpp"

namespace parley {

enum struct Severity : Default_Underlying {
    min,
    trace,
    debug,
    info,
    soft_warning,
    warning,
    error,
    fatal,
    max = fatal,
    none,
};

[[nodiscard]]
constexpr std::strong_ordering operator<=>(Severity x, Severity y) noexcept
{
    return Default_Underlying(x) <=> Default_Underlying(y);
}

[[nodiscard]]
constexpr bool severity_is_emittable(Severity x) noexcept
{
    return x >= Severity::min && x <= Severity::max;
}

[[nodiscard]]
constexpr std::u8string_view severity_tag(Severity severity)
{
    using enum Severity;
    switch (severity) {
    case min: return u8"MIN";
    case trace: return u8"TRACE";
    case debug: return u8"DEBUG";
    case info: return u8"INFO";
    case soft_warning: return u8"SOFTWARN";
    case warning: return u8"WARNING";
    case error: return u8"ERROR";
    case fatal: return u8"FATAL";
    case none: break;
    }
    return u8"???";
}

} // namespace parley

#endif
