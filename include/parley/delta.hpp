#ifndef PARLEY_DELTA_HPP
#define PARLEY_DELTA_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "parley/util/result.hpp"

#include "parley/entities.hpp"
#include "parley/fwd.hpp"
#include "parley/services.hpp"
#include "parley/validation.hpp"

namespace parley {

enum struct Delta_Operation : Default_Underlying {
    create,
    update,
    /// @brief Deletion; named `remove` because `delete` is a keyword.
    remove,
};

/// @brief Returns `create`, `update`, or `delete`.
[[nodiscard]]
std::u8string_view delta_operation_name(Delta_Operation operation);

[[nodiscard]]
std::optional<Delta_Operation> parse_delta_operation(std::u8string_view name);

/// @brief Parses `character`, `place`, `organization`, or `relationship`.
[[nodiscard]]
std::optional<Entity_Kind> parse_entity_kind(std::u8string_view name);

using Entity_Record = std::variant<Character, Place, Organization, Relationship>;

/// @brief Returns the kind matching the alternative held by `record`.
[[nodiscard]]
Entity_Kind record_kind(const Entity_Record& record);

[[nodiscard]]
const std::u8string& record_id(const Entity_Record& record);

/// @brief One atomic change to an entity collection.
/// A log of deltas, replayed from an empty collection, reconstructs the collection.
struct Entity_Delta {
    Delta_Operation operation;
    /// @brief The declared kind, which shall match `record`.
    Entity_Kind kind;
    /// @brief For `create` and `update`, the new record.
    /// For `remove`, the record as it was before deletion;
    /// only its id is used when applying the delta.
    Entity_Record record;
    /// @brief Milliseconds since the Unix epoch.
    std::int64_t timestamp = 0;

    [[nodiscard]]
    friend bool operator==(const Entity_Delta&, const Entity_Delta&)
        = default;
};

/// @brief Validates `delta` and applies it to a copy of `entities`.
/// Creating a mutual relationship inserts both of its records.
/// Deleting an entity also deletes relationships to archived entities.
/// @param document see `validate_entity_delta`
[[nodiscard]]
Result<Entity_Set, Validation_Error>
apply_entity_delta(const Entity_Set& entities, const Entity_Delta& delta, const Document* document = nullptr);

/// @brief A delta together with the collection that results from applying it.
struct Applied_Delta {
    Entity_Set entities;
    Entity_Delta delta;
};

/// @brief The services needed to construct new deltas.
struct Delta_Services {
    Id_Generator& ids;
    Clock& clock;
};

/// @brief Creates a character.
/// The id is generated; an empty `xml_id` is derived from the name with `make_xml_id`.
[[nodiscard]]
Result<Applied_Delta, Validation_Error>
create_character(const Entity_Set& entities, Character character, Delta_Services services);

/// @brief Like `create_character`, but for places.
[[nodiscard]]
Result<Applied_Delta, Validation_Error>
create_place(const Entity_Set& entities, Place place, Delta_Services services);

/// @brief Like `create_character`, but for organizations.
[[nodiscard]]
Result<Applied_Delta, Validation_Error>
create_organization(const Entity_Set& entities, Organization organization, Delta_Services services);

/// @brief Replaces the entity with the id of `entity`.
/// The xml id and the kind of an entity cannot change.
[[nodiscard]]
Result<Applied_Delta, Validation_Error>
update_entity(const Entity_Set& entities, Entity entity, Clock& clock);

[[nodiscard]]
Result<Applied_Delta, Validation_Error> delete_entity(
    const Entity_Set& entities,
    std::u8string_view id,
    Clock& clock,
    const Document* document = nullptr
);

/// @brief Sets or clears the archived flag of an entity, as an update.
[[nodiscard]]
Result<Applied_Delta, Validation_Error>
archive_entity(const Entity_Set& entities, std::u8string_view id, Clock& clock, bool archived = true);

/// @brief Adds a relationship; an empty `id` is generated.
[[nodiscard]]
Result<Applied_Delta, Validation_Error>
add_relationship(const Entity_Set& entities, Relationship relationship, Delta_Services services);

/// @brief Removes a relationship, including its reciprocal record if it is mutual.
/// Either record of a mutual pair may be named.
[[nodiscard]]
Result<Applied_Delta, Validation_Error>
remove_relationship(const Entity_Set& entities, std::u8string_view id, Clock& clock);

} // namespace parley

#endif
