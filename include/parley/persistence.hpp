#ifndef PARLEY_PERSISTENCE_HPP
#define PARLEY_PERSISTENCE_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "parley/util/result.hpp"

#include "parley/delta.hpp"
#include "parley/fwd.hpp"

namespace parley {

enum struct Persistence_Error_Code : Default_Underlying {
    /// @brief The text is not valid JSON.
    malformed_json,
    /// @brief A required member is missing or has the wrong type.
    missing_member,
    /// @brief A member has a value outside of its domain, like an unknown operation.
    invalid_value,
    /// @brief The stored cursor lies beyond the end of the log.
    position_out_of_range,
};

[[nodiscard]]
std::u8string_view persistence_error_code_name(Persistence_Error_Code code);

struct Persistence_Error {
    Persistence_Error_Code code;
    /// @brief The index of the offending delta, or `std::size_t(-1)`
    /// if the error is not specific to any delta.
    std::size_t delta_index = std::size_t(-1);
    std::u8string message;
};

/// @brief A persisted delta log and its cursor.
struct Stored_History {
    std::vector<Entity_Delta> deltas;
    std::size_t position = 0;
};

/// @brief Writes `log` and `position` as an indented JSON document of the form
/// `{ "position": k, "deltas": [ { "op", "kind", "timestamp", "record" }, ... ] }`.
/// Each record holds the fields of the entity or relationship;
/// empty strings and absent optional values are omitted.
[[nodiscard]]
std::u8string write_history(std::span<const Entity_Delta> log, std::size_t position);

/// @brief Parses a document written by `write_history`.
/// Members that are not recognized are ignored.
/// The deltas are not validated against each other; use `replay` or `Entity_History::restore`.
[[nodiscard]]
Result<Stored_History, Persistence_Error>
load_history(std::u8string_view json, std::pmr::memory_resource* memory = std::pmr::get_default_resource());

} // namespace parley

#endif
