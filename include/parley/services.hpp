#ifndef PARLEY_SERVICES_HPP
#define PARLEY_SERVICES_HPP

#include <cstdint>
#include <random>
#include <string>
#include <string_view>

#include "parley/util/assert.hpp"
#include "parley/util/severity.hpp"

#include "parley/diagnostic.hpp"
#include "parley/fwd.hpp"

namespace parley {

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
        PARLEY_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Logs a diagnostic without a source location
    /// if `can_log(severity)` is `true`.
    void log(Severity severity, std::u8string_view id, std::u8string_view message)
    {
        if (can_log(severity)) {
            (*this)({ .severity = severity, .id = id, .file = {}, .location = {}, .message = message });
        }
    }

    virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

enum struct Entity_Kind : Default_Underlying {
    character,
    place,
    organization,
    relationship,
};

/// @brief Generates identifiers for newly created entities and relationships.
/// Identifiers shall be unique over the lifetime of an editing session.
struct Id_Generator {
    [[nodiscard]]
    virtual std::u8string generate(Entity_Kind kind)
        = 0;
};

/// @brief Generates ids like `char-5f0c2a9d1e3b7c44` from a random engine.
struct Random_Id_Generator final : Id_Generator {
private:
    std::mt19937_64 m_engine;

public:
    [[nodiscard]]
    Random_Id_Generator();

    [[nodiscard]]
    explicit Random_Id_Generator(std::uint64_t seed)
        : m_engine { seed }
    {
    }

    [[nodiscard]]
    std::u8string generate(Entity_Kind kind) final;
};

/// @brief Generates ids like `char-1`, `place-2`, with a single counter shared by all kinds.
/// This is useful for reproducible output, such as in tests.
struct Counting_Id_Generator final : Id_Generator {
private:
    std::uint64_t m_next = 1;

public:
    [[nodiscard]]
    std::u8string generate(Entity_Kind kind) final;
};

/// @brief Provides timestamps for entity deltas.
struct Clock {
    /// @brief Returns the current time in milliseconds since the Unix epoch.
    [[nodiscard]]
    virtual std::int64_t now_ms()
        = 0;
};

struct System_Clock final : Clock {
    [[nodiscard]]
    std::int64_t now_ms() final;
};

inline constinit System_Clock system_clock;

/// @brief A `Clock` which always returns the same time.
struct Fixed_Clock final : Clock {
    std::int64_t time = 0;

    [[nodiscard]]
    constexpr explicit Fixed_Clock(std::int64_t time)
        : time { time }
    {
    }

    [[nodiscard]]
    std::int64_t now_ms() final
    {
        return time;
    }
};

/// @brief Returns the prefix used for ids of the given kind, like `char`.
[[nodiscard]]
constexpr std::u8string_view entity_id_prefix(Entity_Kind kind)
{
    switch (kind) {
    case Entity_Kind::character: return u8"char";
    case Entity_Kind::place: return u8"place";
    case Entity_Kind::organization: return u8"org";
    case Entity_Kind::relationship: return u8"rel";
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid entity kind.");
}

[[nodiscard]]
constexpr std::u8string_view entity_kind_name(Entity_Kind kind)
{
    switch (kind) {
    case Entity_Kind::character: return u8"character";
    case Entity_Kind::place: return u8"place";
    case Entity_Kind::organization: return u8"organization";
    case Entity_Kind::relationship: return u8"relationship";
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid entity kind.");
}

} // namespace parley

#endif
