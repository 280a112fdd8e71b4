#ifndef PARLEY_DIAGNOSTIC_HPP
#define PARLEY_DIAGNOSTIC_HPP

#include <string_view>

#include "parley/util/severity.hpp"
#include "parley/util/source_position.hpp"

#include "parley/fwd.hpp"

namespace parley {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The name of the file or resource the diagnostic refers to.
    /// May be empty if the diagnostic is not tied to any source text.
    std::u8string_view file;
    /// @brief The span of text that is responsible for this diagnostic.
    /// Empty (zero-length) if the diagnostic refers to no text in particular.
    Source_Span location;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// GENERAL DIAGNOSTICS =============================================================================

/// @brief Markup could not be parsed.
inline constexpr std::u8string_view parse = u8"parse";

/// @brief A file could not be read or written.
inline constexpr std::u8string_view file_io = u8"file.io";

// SCHEMA DIAGNOSTICS ==============================================================================

/// @brief A schema description could not be fetched from its source.
inline constexpr std::u8string_view schema_fetch = u8"schema.fetch";

/// @brief A schema description could not be compiled into constraints.
inline constexpr std::u8string_view schema_compile = u8"schema.compile";

/// @brief A schema id was requested that is not in the catalog.
inline constexpr std::u8string_view schema_unknown = u8"schema.unknown";

/// @brief A pattern combinator was found that the constraint compiler does not understand.
/// The pattern is skipped.
inline constexpr std::u8string_view schema_pattern_unrecognized = u8"schema.pattern.unrecognized";

/// @brief An element definition had no recognizable content pattern and no attributes,
/// so its content was assumed to be text only.
inline constexpr std::u8string_view schema_content_defaulted = u8"schema.content.defaulted";

/// @brief A `ref` pattern names a definition that does not exist.
inline constexpr std::u8string_view schema_ref_unresolved = u8"schema.ref.unresolved";

/// @brief A `ref` pattern is part of a reference cycle that does not pass through an element.
inline constexpr std::u8string_view schema_ref_circular = u8"schema.ref.circular";

/// @brief A compiled constraint table or validation result was taken from a cache.
inline constexpr std::u8string_view cache_hit = u8"cache.hit";

/// @brief Progressive fallback skipped a schema candidate.
inline constexpr std::u8string_view fallback_skip = u8"fallback.skip";

/// @brief Progressive fallback settled on a schema.
inline constexpr std::u8string_view fallback_result = u8"fallback.result";

// DOCUMENT DIAGNOSTICS ============================================================================

/// @brief A standoff entity record has no `xml:id` and was ignored.
inline constexpr std::u8string_view person_no_id = u8"document.person.no-id";

/// @brief A standoff entity record has a `xml:id` which was already used.
inline constexpr std::u8string_view entity_duplicate_id = u8"document.entity.duplicate-id";

/// @brief A standoff relation refers to an entity that does not exist.
inline constexpr std::u8string_view relation_unresolved = u8"document.relation.unresolved";

/// @brief A standoff value could not be interpreted, e.g. a non-numeric age.
inline constexpr std::u8string_view standoff_value_invalid = u8"document.standoff.invalid";

/// @brief A document contains no passages.
inline constexpr std::u8string_view no_passages = u8"document.passages.none";

// HISTORY DIAGNOSTICS =============================================================================

/// @brief A persisted history could not be parsed.
inline constexpr std::u8string_view history_load = u8"history.load";

/// @brief A delta loaded from a persisted history was rejected during replay.
inline constexpr std::u8string_view history_replay = u8"history.replay";

} // namespace diagnostic

} // namespace parley

#endif
