#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/result.hpp"

#include "parley/constraints.hpp"
#include "parley/delta.hpp"
#include "parley/document.hpp"
#include "parley/edit.hpp"
#include "parley/validation.hpp"
#include "parley/xml.hpp"

namespace parley {
namespace {

[[nodiscard]]
std::size_t content_length(const xml::Node& node)
{
    if (const xml::Text* const t = node.as_text()) {
        return t->text.size();
    }
    std::size_t result = 0;
    for (const xml::Node& child : node.as_element()->children) {
        result += content_length(child);
    }
    return result;
}

} // namespace

Tag_Placement locate_tag_placement(const xml::Element& passage, Text_Range range)
{
    Tag_Placement result;
    const xml::Element* current = &passage;

    bool descended = true;
    while (descended) {
        descended = false;
        std::size_t offset = result.parent_start;
        for (std::size_t i = 0; i < current->children.size(); ++i) {
            const xml::Node& child = current->children[i];
            const std::size_t length = content_length(child);
            const Text_Range child_range { offset, offset + length };
            const bool encloses = child.is_element() && !child_range.empty()
                && child_range.contains(range)
                && (!range.empty() || (child_range.start < range.start && range.start < child_range.end));
            if (encloses) {
                result.parent_path.push_back(i);
                result.parent_start = offset;
                current = child.as_element();
                descended = true;
                break;
            }
            offset += length;
        }
    }
    return result;
}

Split_Children split_children(const xml::Element& parent, std::size_t parent_start, Text_Range range)
{
    Split_Children result;
    std::size_t offset = parent_start;

    for (const xml::Node& child : parent.children) {
        const std::size_t length = content_length(child);
        const Text_Range child_range { offset, offset + length };
        offset += length;

        if (const xml::Text* const t = child.as_text()) {
            const auto piece = [&](std::size_t begin, std::size_t end) -> std::u8string_view {
                if (begin >= end) {
                    return {};
                }
                return std::u8string_view { t->text }.substr(
                    begin - child_range.start, end - begin
                );
            };
            const std::size_t split_start = std::clamp(range.start, child_range.start, child_range.end);
            const std::size_t split_end = std::clamp(range.end, child_range.start, child_range.end);
            xml::append_text(result.before, piece(child_range.start, split_start));
            xml::append_text(result.inside, piece(split_start, split_end));
            xml::append_text(result.after, piece(split_end, child_range.end));
            continue;
        }

        if (child_range.empty()) {
            if (child_range.start <= range.start) {
                result.before.push_back(child);
            }
            else if (child_range.start >= range.end) {
                result.after.push_back(child);
            }
            else {
                result.inside.push_back(child);
            }
        }
        else if (child_range.end <= range.start) {
            result.before.push_back(child);
        }
        else if (child_range.start >= range.end) {
            result.after.push_back(child);
        }
        else {
            PARLEY_ASSERT(range.contains(child_range));
            result.inside.push_back(child);
        }
    }
    return result;
}

namespace {

/// @brief Copies the state of `document` for modification,
/// with the revision already incremented.
[[nodiscard]]
std::shared_ptr<Document_Data> next_revision(const Document& document)
{
    auto result = std::make_shared<Document_Data>(document.get_data());
    ++result->revision;
    return result;
}

[[nodiscard]]
Document commit(std::shared_ptr<Document_Data> data)
{
    rebuild_text_index(*data);
    return Document { std::shared_ptr<const Document_Data> { std::move(data) } };
}

[[nodiscard]]
xml::Node_Path concat_paths(const xml::Node_Path& x, const xml::Node_Path& y)
{
    xml::Node_Path result = x;
    result.insert(result.end(), y.begin(), y.end());
    return result;
}

} // namespace

Result<Document, Validation_Error> add_tag(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    Text_Range range,
    std::u8string_view type,
    std::span<const xml::Attribute> attributes
)
{
    if (Result<void, Validation_Error> r
        = validate_tag_addition(document, constraints, passage_id, range, type, attributes);
        !r) {
        return std::move(r).error();
    }
    const Passage* const passage = document.find_passage(passage_id);
    PARLEY_ASSERT(passage);

    std::shared_ptr<Document_Data> data = next_revision(document);
    xml::Element& passage_element = xml::element_at(data->root, passage->path);
    const Tag_Placement placement = locate_tag_placement(passage_element, range);
    xml::Element& parent = xml::element_at(passage_element, placement.parent_path);

    Split_Children split = split_children(parent, placement.parent_start, range);
    xml::Element tag {
        .name = std::u8string { type },
        .attributes = { attributes.begin(), attributes.end() },
        .children = std::move(split.inside),
    };

    std::vector<xml::Node> children = std::move(split.before);
    children.push_back(xml::Node { std::move(tag) });
    children.insert(
        children.end(), std::make_move_iterator(split.after.begin()),
        std::make_move_iterator(split.after.end())
    );
    parent.children = std::move(children);
    xml::normalize_text(parent.children);

    return commit(std::move(data));
}

Result<Document, Validation_Error>
remove_tag(const Document& document, std::u8string_view passage_id, std::u8string_view tag_id)
{
    if (Result<void, Validation_Error> r = validate_tag_removal(document, passage_id, tag_id); !r) {
        return std::move(r).error();
    }
    const Passage* const passage = document.find_passage(passage_id);
    const Tag* const tag = passage->find_tag(tag_id);
    PARLEY_ASSERT(tag && !tag->path.empty());

    std::shared_ptr<Document_Data> data = next_revision(document);
    const xml::Node_Path full_path = concat_paths(passage->path, tag->path);
    const std::span<const std::size_t> parent_path { full_path.data(), full_path.size() - 1 };
    xml::Element& parent = xml::element_at(data->root, parent_path);
    const std::size_t index = full_path.back();

    std::vector<xml::Node> content = std::move(parent.children[index].as_element()->children);
    parent.children.erase(parent.children.begin() + std::ptrdiff_t(index));
    parent.children.insert(
        parent.children.begin() + std::ptrdiff_t(index), std::make_move_iterator(content.begin()),
        std::make_move_iterator(content.end())
    );
    xml::normalize_text(parent.children);

    return commit(std::move(data));
}

namespace {

[[nodiscard]]
Result<Document, Validation_Error> change_tag_attribute(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    std::u8string_view tag_id,
    std::u8string_view name,
    std::optional<std::u8string_view> value
)
{
    if (Result<void, Validation_Error> r
        = validate_attribute_change(document, constraints, passage_id, tag_id, name, value);
        !r) {
        return std::move(r).error();
    }
    const Passage* const passage = document.find_passage(passage_id);
    const Tag* const tag = passage->find_tag(tag_id);

    std::shared_ptr<Document_Data> data = next_revision(document);
    xml::Element& element = xml::element_at(data->root, concat_paths(passage->path, tag->path));
    if (value) {
        element.set_attribute(name, *value);
    }
    else {
        element.remove_attribute(name);
    }
    return commit(std::move(data));
}

} // namespace

Result<Document, Validation_Error> set_tag_attribute(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    std::u8string_view tag_id,
    std::u8string_view name,
    std::u8string_view value
)
{
    return change_tag_attribute(document, constraints, passage_id, tag_id, name, value);
}

Result<Document, Validation_Error> remove_tag_attribute(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    std::u8string_view tag_id,
    std::u8string_view name
)
{
    return change_tag_attribute(document, constraints, passage_id, tag_id, name, std::nullopt);
}

Result<Document, Validation_Error> apply_entity_delta(const Document& document, const Entity_Delta& delta)
{
    Result<Entity_Set, Validation_Error> entities
        = apply_entity_delta(document.get_entities(), delta, &document);
    if (!entities) {
        return std::move(entities).error();
    }
    std::shared_ptr<Document_Data> data = next_revision(document);
    data->entities = std::move(*entities);
    return Document { std::shared_ptr<const Document_Data> { std::move(data) } };
}

} // namespace parley
