#ifndef PARLEY_ENTITIES_HPP
#define PARLEY_ENTITIES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "parley/fwd.hpp"
#include "parley/services.hpp"

namespace parley {

enum struct Sex : Default_Underlying {
    unspecified,
    male,
    female,
    other,
};

/// @brief Returns the standoff value of `sex`: `M`, `F`, `Other`, or an empty string.
[[nodiscard]]
std::u8string_view sex_value(Sex sex);

/// @brief Parses a standoff `sex/@value`.
/// Unknown values yield `std::nullopt`.
[[nodiscard]]
std::optional<Sex> parse_sex(std::u8string_view value);

struct Character {
    std::u8string id;
    std::u8string xml_id;
    std::u8string name;
    Sex sex = Sex::unspecified;
    std::optional<int> age;
    std::u8string occupation;
    std::u8string social_status;
    std::u8string marital_status;
    std::vector<std::u8string> traits;
    bool archived = false;

    [[nodiscard]]
    friend bool operator==(const Character&, const Character&)
        = default;
};

struct Geo_Coordinates {
    double latitude;
    double longitude;

    [[nodiscard]]
    friend bool operator==(const Geo_Coordinates&, const Geo_Coordinates&)
        = default;
};

struct Place {
    std::u8string id;
    std::u8string xml_id;
    std::u8string name;
    /// @brief The kind of place, like `city`.
    std::u8string place_type;
    std::optional<Geo_Coordinates> coordinates;
    bool archived = false;

    [[nodiscard]]
    friend bool operator==(const Place&, const Place&)
        = default;
};

struct Organization {
    std::u8string id;
    std::u8string xml_id;
    std::u8string name;
    /// @brief The kind of organization, like `regiment`.
    std::u8string org_type;
    std::u8string description;
    bool archived = false;

    [[nodiscard]]
    friend bool operator==(const Organization&, const Organization&)
        = default;
};

using Entity = std::variant<Character, Place, Organization>;

/// @brief A directed, typed link between two entities.
/// A mutual relationship is stored as two records, one in each direction,
/// both with `mutual == true`.
struct Relationship {
    std::u8string id;
    /// @brief The id (not the xml id) of the source entity.
    std::u8string from;
    /// @brief The id (not the xml id) of the target entity.
    std::u8string to;
    std::u8string type;
    std::u8string subtype;
    bool mutual = false;

    [[nodiscard]]
    friend bool operator==(const Relationship&, const Relationship&)
        = default;
};

[[nodiscard]]
Entity_Kind entity_kind(const Entity& entity);

[[nodiscard]]
const std::u8string& entity_id(const Entity& entity);

[[nodiscard]]
const std::u8string& entity_xml_id(const Entity& entity);

[[nodiscard]]
const std::u8string& entity_name(const Entity& entity);

[[nodiscard]]
bool is_archived(const Entity& entity);

void set_archived(Entity& entity, bool archived);

/// @brief Removes leading and trailing XML whitespace from the name and the other text fields
/// which are written as element content, like `occupation` or each of the `traits`.
void trim_entity_text(Entity& entity);

/// @brief Derives a slug from a display name:
/// ASCII letters are lower-cased, every run of ASCII characters other than letters and digits
/// becomes a single `-`, and leading and trailing `-` are removed.
/// Non-ASCII characters are kept as they are.
/// For example, `"Sherlock Holmes"` becomes `"sherlock-holmes"`,
/// and `"Élodie"` stays `"Élodie"`.
[[nodiscard]]
std::u8string make_xml_id(std::u8string_view name);

/// @brief Derives the xml id of a new entity of the given kind from its name.
/// This is `make_xml_id(name)`, except that a slug which cannot start an NCName,
/// like `"007-agent"`, is prefixed with `entity_id_prefix(kind)` and `-`,
/// and that an empty slug is replaced with `fallback_id`.
[[nodiscard]]
std::u8string derive_xml_id(std::u8string_view name, Entity_Kind kind, std::u8string_view fallback_id);

/// @brief Returns `true` if `str` is an XML NCName, i.e. a name without colons.
/// Only ASCII characters are restricted; non-ASCII characters are accepted as name characters.
[[nodiscard]]
bool is_ncname(std::u8string_view str);

/// @brief Returns the id of the record that mirrors the mutual relationship with id `id`.
[[nodiscard]]
std::u8string reciprocal_relationship_id(std::u8string_view id);

/// @brief Returns the record mirroring `relationship`, i.e. with swapped endpoints.
[[nodiscard]]
Relationship make_reciprocal(const Relationship& relationship);

/// @brief The entity collection of a document: characters, places, organizations,
/// and relationships between them.
/// Entities are kept in creation order.
struct Entity_Set {
    std::vector<Entity> entities;
    std::vector<Relationship> relationships;

    [[nodiscard]]
    bool empty() const
    {
        return entities.empty() && relationships.empty();
    }

    [[nodiscard]]
    const Entity* find(std::u8string_view id) const;

    [[nodiscard]]
    const Entity* find_by_xml_id(std::u8string_view xml_id) const;

    /// @brief Returns the index of the entity with the given id within `entities`,
    /// or `std::size_t(-1)`.
    [[nodiscard]]
    std::size_t index_of(std::u8string_view id) const;

    [[nodiscard]]
    const Relationship* find_relationship(std::u8string_view id) const;

    [[nodiscard]]
    std::size_t relationship_index_of(std::u8string_view id) const;

    /// @brief Returns the relationship with the given id,
    /// or if `id` names the reciprocal record of a mutual relationship,
    /// the record it mirrors.
    [[nodiscard]]
    const Relationship* find_primary_relationship(std::u8string_view id) const;

    /// @brief Returns the relationship from `from` to `to` of the given type, if any.
    [[nodiscard]]
    const Relationship*
    find_relationship(std::u8string_view from, std::u8string_view to, std::u8string_view type) const;

    [[nodiscard]]
    std::vector<const Character*> characters() const;

    /// @brief Returns the characters which are not archived.
    [[nodiscard]]
    std::vector<const Character*> active_characters() const;

    [[nodiscard]]
    std::vector<const Place*> places() const;

    [[nodiscard]]
    std::vector<const Organization*> organizations() const;

    [[nodiscard]]
    friend bool operator==(const Entity_Set&, const Entity_Set&)
        = default;
};

} // namespace parley

#endif
