#ifndef PARLEY_VALIDATION_HPP
#define PARLEY_VALIDATION_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "parley/util/result.hpp"

#include "parley/constraints.hpp"
#include "parley/document.hpp"
#include "parley/entities.hpp"
#include "parley/fwd.hpp"

namespace parley {

/// @brief Add an attribute that is missing.
struct Add_Attribute {
    std::u8string name;
    std::u8string value;

    [[nodiscard]]
    friend bool operator==(const Add_Attribute&, const Add_Attribute&)
        = default;
};

/// @brief Replace the value of an attribute.
struct Change_Attribute {
    std::u8string name;
    std::u8string value;

    [[nodiscard]]
    friend bool operator==(const Change_Attribute&, const Change_Attribute&)
        = default;
};

struct Remove_Attribute {
    std::u8string name;

    [[nodiscard]]
    friend bool operator==(const Remove_Attribute&, const Remove_Attribute&)
        = default;
};

/// @brief Use the given range instead, which no longer splits anything.
struct Expand_Selection {
    Text_Range range;

    [[nodiscard]]
    friend bool operator==(const Expand_Selection&, const Expand_Selection&)
        = default;
};

struct Change_Tag_Type {
    std::u8string type;

    [[nodiscard]]
    friend bool operator==(const Change_Tag_Type&, const Change_Tag_Type&)
        = default;
};

/// @brief Create an entity which a reference could point to.
struct Create_Entity {
    Entity_Kind kind;
    std::u8string xml_id;

    [[nodiscard]]
    friend bool operator==(const Create_Entity&, const Create_Entity&)
        = default;
};

/// @brief Use a different xml id for the entity.
struct Use_Xml_Id {
    std::u8string xml_id;

    [[nodiscard]]
    friend bool operator==(const Use_Xml_Id&, const Use_Xml_Id&)
        = default;
};

/// @brief Archive the entity instead of deleting it.
struct Archive_Entity {
    std::u8string id;

    [[nodiscard]]
    friend bool operator==(const Archive_Entity&, const Archive_Entity&)
        = default;
};

/// @brief A mechanically derivable change that would make a rejected mutation acceptable.
using Fix = std::variant<
    Add_Attribute,
    Change_Attribute,
    Remove_Attribute,
    Expand_Selection,
    Change_Tag_Type,
    Create_Entity,
    Use_Xml_Id,
    Archive_Entity>;

enum struct Validation_Error_Code : Default_Underlying {
    passage_not_found,
    tag_not_found,
    /// @brief A range does not satisfy `start <= end <= size(content)`.
    range_out_of_bounds,
    /// @brief A range boundary lies within a multi-byte UTF-8 sequence.
    range_not_on_boundary,
    unknown_tag_type,
    missing_required_attr,
    /// @brief An attribute is not declared for the tag type.
    unknown_attribute,
    invalid_attribute_value,
    /// @brief A reference attribute points to no known entity.
    invalid_idref,
    /// @brief A tag range partially overlaps an existing tag.
    splits_existing_tag,
    /// @brief The content model of the enclosing tag forbids the new tag,
    /// or the content model of the new tag forbids what it would enclose.
    child_not_allowed,
    missing_name,
    invalid_xml_id,
    duplicate_id,
    duplicate_xml_id,
    entity_not_found,
    /// @brief The record of a delta does not match its declared kind,
    /// or an update would change the kind of an entity.
    type_mismatch,
    xml_id_immutable,
    /// @brief A relationship refers to an entity that does not exist.
    unknown_entity,
    duplicate_relationship,
    /// @brief An entity cannot be deleted because something still refers to it.
    entity_referenced,
};

/// @brief Returns the upper-case name of the code, like `MISSING_REQUIRED_ATTR`.
[[nodiscard]]
std::u8string_view validation_error_code_name(Validation_Error_Code code);

struct Validation_Error {
    Validation_Error_Code code;
    std::u8string message;
    /// @brief Suggested fixes, the most plausible one first.
    std::vector<Fix> fixes;

    [[nodiscard]]
    const Fix* first_fix() const
    {
        return fixes.empty() ? nullptr : &fixes.front();
    }
};

/// @brief Checks whether a tag of the given type and with the given attributes
/// can be added over `range` of the passage with id `passage_id`.
[[nodiscard]]
Result<void, Validation_Error> validate_tag_addition(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    Text_Range range,
    std::u8string_view type,
    std::span<const xml::Attribute> attributes
);

/// @brief Checks whether an attribute of an existing tag can be set to `value`,
/// or removed if `value` is `std::nullopt`.
[[nodiscard]]
Result<void, Validation_Error> validate_attribute_change(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    std::u8string_view tag_id,
    std::u8string_view name,
    std::optional<std::u8string_view> value
);

/// @brief Checks whether an existing tag can be removed.
[[nodiscard]]
Result<void, Validation_Error>
validate_tag_removal(const Document& document, std::u8string_view passage_id, std::u8string_view tag_id);

/// @brief Checks whether `delta` can be applied to `entities`.
/// @param document If not null, tags of this document are considered when deleting entities,
/// so that an entity still referenced by a tag cannot be deleted.
[[nodiscard]]
Result<void, Validation_Error> validate_entity_delta(
    const Entity_Set& entities,
    const Entity_Delta& delta,
    const Document* document = nullptr
);

} // namespace parley

#endif
