#ifndef PARLEY_EDIT_HPP
#define PARLEY_EDIT_HPP

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include "parley/util/result.hpp"

#include "parley/constraints.hpp"
#include "parley/document.hpp"
#include "parley/fwd.hpp"
#include "parley/validation.hpp"
#include "parley/xml.hpp"

namespace parley {

/// @brief The element into which a new tag over some range would be inserted.
struct Tag_Placement {
    /// @brief The path of the enclosing element relative to the passage element.
    /// Empty if the passage element itself encloses the new tag.
    xml::Node_Path parent_path;
    /// @brief The offset of the enclosing element's content within the passage content.
    std::size_t parent_start = 0;
};

/// @brief Finds the innermost element of `passage` whose content contains `range`.
/// An empty range at the boundary of an element is placed outside that element.
[[nodiscard]]
Tag_Placement locate_tag_placement(const xml::Element& passage, Text_Range range);

/// @brief The children of an element, partitioned by a range,
/// with text nodes split at the range boundaries.
struct Split_Children {
    std::vector<xml::Node> before;
    std::vector<xml::Node> inside;
    std::vector<xml::Node> after;
};

/// @brief Partitions the children of `parent` into those before, inside, and after `range`.
/// `parent_start` is the offset of the content of `parent` within the passage.
/// No child element shall partially overlap `range`.
[[nodiscard]]
Split_Children split_children(const xml::Element& parent, std::size_t parent_start, Text_Range range);

/// @brief Adds a tag over `range` of a passage,
/// wrapping the enclosed text and elements into a new element.
/// On success, the revision is incremented and all indices are rebuilt.
[[nodiscard]]
Result<Document, Validation_Error> add_tag(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    Text_Range range,
    std::u8string_view type,
    std::span<const xml::Attribute> attributes = {}
);

/// @brief Removes a tag, keeping its content in place.
[[nodiscard]]
Result<Document, Validation_Error>
remove_tag(const Document& document, std::u8string_view passage_id, std::u8string_view tag_id);

[[nodiscard]]
Result<Document, Validation_Error> set_tag_attribute(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    std::u8string_view tag_id,
    std::u8string_view name,
    std::u8string_view value
);

[[nodiscard]]
Result<Document, Validation_Error> remove_tag_attribute(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    std::u8string_view tag_id,
    std::u8string_view name
);

/// @brief Applies an entity delta to the entities of `document`.
/// Deleting an entity that a tag still refers to is rejected.
[[nodiscard]]
Result<Document, Validation_Error> apply_entity_delta(const Document& document, const Entity_Delta& delta);

} // namespace parley

#endif
