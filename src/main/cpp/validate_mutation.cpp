#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/result.hpp"
#include "parley/util/strings.hpp"
#include "parley/util/typo.hpp"

#include "parley/constraints.hpp"
#include "parley/delta.hpp"
#include "parley/document.hpp"
#include "parley/edit.hpp"
#include "parley/entities.hpp"
#include "parley/settings.hpp"
#include "parley/validation.hpp"

namespace parley {

std::u8string_view validation_error_code_name(Validation_Error_Code code)
{
    using enum Validation_Error_Code;
    switch (code) {
    case passage_not_found: return u8"PASSAGE_NOT_FOUND";
    case tag_not_found: return u8"TAG_NOT_FOUND";
    case range_out_of_bounds: return u8"RANGE_OUT_OF_BOUNDS";
    case range_not_on_boundary: return u8"RANGE_NOT_ON_BOUNDARY";
    case unknown_tag_type: return u8"UNKNOWN_TAG_TYPE";
    case missing_required_attr: return u8"MISSING_REQUIRED_ATTR";
    case unknown_attribute: return u8"UNKNOWN_ATTRIBUTE";
    case invalid_attribute_value: return u8"INVALID_ATTRIBUTE_VALUE";
    case invalid_idref: return u8"INVALID_IDREF";
    case splits_existing_tag: return u8"SPLITS_EXISTING_TAG";
    case child_not_allowed: return u8"CHILD_NOT_ALLOWED";
    case missing_name: return u8"MISSING_NAME";
    case invalid_xml_id: return u8"INVALID_XML_ID";
    case duplicate_id: return u8"DUPLICATE_ID";
    case duplicate_xml_id: return u8"DUPLICATE_XML_ID";
    case entity_not_found: return u8"ENTITY_NOT_FOUND";
    case type_mismatch: return u8"TYPE_MISMATCH";
    case xml_id_immutable: return u8"XML_ID_IMMUTABLE";
    case unknown_entity: return u8"UNKNOWN_ENTITY";
    case duplicate_relationship: return u8"DUPLICATE_RELATIONSHIP";
    case entity_referenced: return u8"ENTITY_REFERENCED";
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid validation error code.");
}

namespace {

[[nodiscard]]
Validation_Error make_error(Validation_Error_Code code, std::u8string message, std::vector<Fix> fixes = {})
{
    return Validation_Error { code, std::move(message), std::move(fixes) };
}

[[nodiscard]]
std::u8string quoted(std::u8string_view text)
{
    std::u8string result = u8"\"";
    result += text;
    result += u8'"';
    return result;
}

[[nodiscard]]
std::u8string_view closest_name(std::span<const std::u8string_view> candidates, std::u8string_view needle)
{
    return closest_suggestion(candidates, needle, max_typo_distance);
}

[[nodiscard]]
bool is_xml_namespace_attribute(std::u8string_view name)
{
    return name.starts_with(u8"xml:") || name == u8"xmlns" || name.starts_with(u8"xmlns:");
}

/// @brief Fixes which point a reference attribute at known entities,
/// or offer to create one if none exist.
[[nodiscard]]
std::vector<Fix> reference_fixes(
    const Entity_Set& entities,
    std::u8string_view attribute,
    std::u8string_view missing_xml_id,
    bool attribute_present
)
{
    std::vector<Fix> result;
    std::vector<std::u8string_view> xml_ids;
    for (const Entity& entity : entities.entities) {
        if (!is_archived(entity)) {
            xml_ids.push_back(entity_xml_id(entity));
        }
    }
    if (xml_ids.empty()) {
        result.push_back(Create_Entity { Entity_Kind::character, std::u8string { missing_xml_id } });
        return result;
    }
    // The most similar candidate comes first.
    if (!missing_xml_id.empty()) {
        const std::u8string_view closest = closest_name(xml_ids, missing_xml_id);
        if (!closest.empty()) {
            const auto it = std::ranges::find(xml_ids, closest);
            std::rotate(xml_ids.begin(), it, it + 1);
        }
    }
    const std::size_t count = std::min(xml_ids.size(), max_entity_fix_candidates);
    for (std::size_t i = 0; i < count; ++i) {
        std::u8string value = u8"#";
        value += xml_ids[i];
        if (attribute_present) {
            result.push_back(Change_Attribute { std::u8string { attribute }, std::move(value) });
        }
        else {
            result.push_back(Add_Attribute { std::u8string { attribute }, std::move(value) });
        }
    }
    return result;
}

/// @brief Checks a single attribute value against its constraint.
[[nodiscard]]
Result<void, Validation_Error> check_attribute_value(
    const Entity_Set& entities,
    std::u8string_view tag_type,
    std::u8string_view name,
    std::u8string_view value,
    const Attribute_Constraint& constraint
)
{
    const auto invalid = [&](std::u8string_view expectation, std::vector<Fix> fixes) {
        std::u8string message = u8"The value ";
        message += quoted(value);
        message += u8" of attribute ";
        message += quoted(name);
        message += u8" of <";
        message += tag_type;
        message += u8"> is invalid: ";
        message += expectation;
        return make_error(Validation_Error_Code::invalid_attribute_value, std::move(message), std::move(fixes));
    };

    switch (constraint.type) {
    case Attribute_Type::string:
    case Attribute_Type::token: return {};

    case Attribute_Type::id:
    case Attribute_Type::ncname: {
        if (is_ncname(value)) {
            return {};
        }
        std::vector<Fix> fixes;
        if (std::u8string slug = make_xml_id(value); is_ncname(slug)) {
            fixes.push_back(Change_Attribute { std::u8string { name }, std::move(slug) });
        }
        return invalid(u8"expected a name without spaces or colons.", std::move(fixes));
    }

    case Attribute_Type::enumerated: {
        const std::vector<std::u8string>& allowed = constraint.allowed_values;
        if (std::ranges::find(allowed, value) != allowed.end()) {
            return {};
        }
        std::vector<std::u8string_view> views { allowed.begin(), allowed.end() };
        std::vector<Fix> fixes;
        const std::u8string_view closest = closest_name(views, value);
        if (!closest.empty()) {
            fixes.push_back(Change_Attribute { std::u8string { name }, std::u8string { closest } });
        }
        for (const std::u8string& v : allowed) {
            if (v != closest) {
                fixes.push_back(Change_Attribute { std::u8string { name }, v });
            }
        }
        std::u8string expectation = u8"expected one of ";
        expectation += join(allowed, u8", ");
        expectation += u8'.';
        return invalid(expectation, std::move(fixes));
    }

    case Attribute_Type::idref: {
        std::u8string_view unresolved;
        for_each_token(value, [&](std::u8string_view token) {
            if (unresolved.empty() && !entities.find_by_xml_id(strip_pointer_hash(token))) {
                unresolved = token;
            }
        });
        if (unresolved.empty() && !trim_xml_whitespace(value).empty()) {
            return {};
        }
        const std::u8string_view missing = strip_pointer_hash(unresolved);
        std::u8string message = u8"The attribute ";
        message += quoted(name);
        message += u8" of <";
        message += tag_type;
        message += u8"> refers to ";
        message += missing.empty() ? std::u8string { u8"nothing" } : quoted(missing);
        message += u8", which is not a known entity.";
        return make_error(
            Validation_Error_Code::invalid_idref, std::move(message),
            reference_fixes(entities, name, missing, true)
        );
    }
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid attribute type.");
}

/// @brief Checks that `name` is declared for `tag_type` and that `value` satisfies it.
[[nodiscard]]
Result<void, Validation_Error> check_attribute(
    const Entity_Set& entities,
    const Tag_Constraint& constraint,
    std::u8string_view tag_type,
    std::u8string_view name,
    std::u8string_view value
)
{
    if (is_xml_namespace_attribute(name)) {
        return {};
    }
    const Attribute_Constraint* const attribute = constraint.find_attribute(name);
    if (!attribute) {
        std::u8string message = u8"The attribute ";
        message += quoted(name);
        message += u8" is not declared for <";
        message += tag_type;
        message += u8">.";
        return make_error(
            Validation_Error_Code::unknown_attribute, std::move(message),
            { Remove_Attribute { std::u8string { name } } }
        );
    }
    return check_attribute_value(entities, tag_type, name, value, *attribute);
}

[[nodiscard]]
Validation_Error missing_attribute_error(
    const Entity_Set& entities,
    const Tag_Constraint& constraint,
    std::u8string_view tag_type,
    std::u8string_view name
)
{
    std::u8string message = u8"The tag <";
    message += tag_type;
    message += u8"> requires the attribute ";
    message += quoted(name);
    message += u8'.';

    const Attribute_Constraint* const attribute = constraint.find_attribute(name);
    std::u8string default_value;
    if (attribute && attribute->type == Attribute_Type::enumerated
        && !attribute->allowed_values.empty()) {
        default_value = attribute->allowed_values.front();
    }
    std::vector<Fix> fixes;
    fixes.push_back(Add_Attribute { std::u8string { name }, std::move(default_value) });
    if (attribute && attribute->type == Attribute_Type::idref) {
        std::vector<Fix> more = reference_fixes(entities, name, {}, false);
        fixes.insert(fixes.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
    }
    return make_error(Validation_Error_Code::missing_required_attr, std::move(message), std::move(fixes));
}

[[nodiscard]]
Validation_Error unknown_tag_error(const Constraint_Table& constraints, std::u8string_view type)
{
    std::u8string message = u8"The tag type <";
    message += type;
    message += u8"> is not defined by the schema.";
    std::vector<Fix> fixes;
    const std::vector<std::u8string_view> names = constraints.tag_names();
    if (const std::u8string_view closest = closest_name(names, type); !closest.empty()) {
        fixes.push_back(Change_Tag_Type { std::u8string { closest } });
    }
    return make_error(Validation_Error_Code::unknown_tag_type, std::move(message), std::move(fixes));
}

/// @brief Returns the largest code point boundary not greater than `offset`.
[[nodiscard]]
std::size_t floor_boundary(std::u8string_view text, std::size_t offset)
{
    while (offset > 0 && offset < text.size() && is_utf8_continuation(text[offset])) {
        --offset;
    }
    return offset;
}

/// @brief Returns the smallest code point boundary not less than `offset`.
[[nodiscard]]
std::size_t ceil_boundary(std::u8string_view text, std::size_t offset)
{
    while (offset < text.size() && is_utf8_continuation(text[offset])) {
        ++offset;
    }
    return offset;
}

[[nodiscard]]
Result<void, Validation_Error> check_range(const Passage& passage, Text_Range range)
{
    const std::u8string_view content = passage.content;
    if (range.start > range.end || range.end > content.size()) {
        std::u8string message = u8"The range [";
        append_integer(message, range.start);
        message += u8", ";
        append_integer(message, range.end);
        message += u8") does not lie within the passage content of length ";
        append_integer(message, content.size());
        message += u8'.';
        std::vector<Fix> fixes;
        if (range.start <= range.end && range.start <= content.size()) {
            fixes.push_back(Expand_Selection { { range.start, content.size() } });
        }
        return make_error(Validation_Error_Code::range_out_of_bounds, std::move(message), std::move(fixes));
    }
    const Text_Range aligned { floor_boundary(content, range.start), ceil_boundary(content, range.end) };
    if (aligned != range) {
        return make_error(
            Validation_Error_Code::range_not_on_boundary,
            u8"The range boundaries must not lie within a multi-byte character.",
            { Expand_Selection { aligned } }
        );
    }
    return {};
}

[[nodiscard]]
Result<void, Validation_Error> check_overlaps(const Passage& passage, Text_Range range)
{
    for (const Tag& tag : passage.tags) {
        if (!tag.range.partially_overlaps(range)) {
            continue;
        }
        const Text_Range united { std::min(tag.range.start, range.start),
                                  std::max(tag.range.end, range.end) };
        std::u8string message = u8"The range would split the existing <";
        message += tag.type;
        message += u8"> tag ";
        message += quoted(tag.id);
        message += u8'.';
        return make_error(
            Validation_Error_Code::splits_existing_tag, std::move(message),
            { Expand_Selection { united } }
        );
    }
    return {};
}

[[nodiscard]]
Result<void, Validation_Error> check_content_models(
    const Constraint_Table& constraints,
    const xml::Element& passage_element,
    Text_Range range,
    std::u8string_view type,
    const Tag_Constraint& tag_constraint
)
{
    const Tag_Placement placement = locate_tag_placement(passage_element, range);
    const xml::Element& parent = xml::element_at(passage_element, placement.parent_path);

    const Content_Model* const parent_model = constraints.find_content_model(parent.name);
    if (parent_model && !parent_model->inferred && !parent_model->allows_child(type)) {
        std::u8string message = u8"The tag <";
        message += parent.name;
        message += u8"> does not allow <";
        message += type;
        message += u8"> inside.";
        std::vector<Fix> fixes;
        std::vector<std::u8string_view> allowed { parent_model->allowed_children.begin(),
                                                  parent_model->allowed_children.end() };
        if (const std::u8string_view closest = closest_name(allowed, type); !closest.empty()) {
            fixes.push_back(Change_Tag_Type { std::u8string { closest } });
        }
        return make_error(Validation_Error_Code::child_not_allowed, std::move(message), std::move(fixes));
    }

    const Content_Model& model = tag_constraint.content;
    if (model.inferred) {
        return {};
    }
    const Split_Children split = split_children(parent, placement.parent_start, range);
    for (const xml::Node& node : split.inside) {
        if (const xml::Text* const t = node.as_text()) {
            if (!model.allows_text() && !is_xml_blank(t->text)) {
                std::u8string message = u8"The tag <";
                message += type;
                message += u8"> does not allow text inside.";
                return make_error(Validation_Error_Code::child_not_allowed, std::move(message));
            }
        }
        else if (const xml::Element* const e = node.as_element(); !model.allows_child(e->name)) {
            std::u8string message = u8"The tag <";
            message += type;
            message += u8"> does not allow the enclosed <";
            message += e->name;
            message += u8"> inside.";
            return make_error(Validation_Error_Code::child_not_allowed, std::move(message));
        }
    }
    return {};
}

[[nodiscard]]
Validation_Error passage_not_found_error(std::u8string_view passage_id)
{
    std::u8string message = u8"There is no passage with id ";
    message += quoted(passage_id);
    message += u8'.';
    return make_error(Validation_Error_Code::passage_not_found, std::move(message));
}

[[nodiscard]]
Validation_Error tag_not_found_error(std::u8string_view tag_id)
{
    std::u8string message = u8"There is no tag with id ";
    message += quoted(tag_id);
    message += u8" in the passage.";
    return make_error(Validation_Error_Code::tag_not_found, std::move(message));
}

} // namespace

Result<void, Validation_Error> validate_tag_addition(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    Text_Range range,
    std::u8string_view type,
    std::span<const xml::Attribute> attributes
)
{
    const Passage* const passage = document.find_passage(passage_id);
    if (!passage) {
        return passage_not_found_error(passage_id);
    }
    if (Result<void, Validation_Error> r = check_range(*passage, range); !r) {
        return r;
    }
    const Tag_Constraint* const constraint = constraints.find_tag(type);
    if (!constraint) {
        return unknown_tag_error(constraints, type);
    }

    const Entity_Set& entities = document.get_entities();
    for (const std::u8string& required : constraint->required_attributes) {
        if (std::ranges::find(attributes, required, &xml::Attribute::name) == attributes.end()) {
            return missing_attribute_error(entities, *constraint, type, required);
        }
    }
    for (const xml::Attribute& attribute : attributes) {
        if (Result<void, Validation_Error> r
            = check_attribute(entities, *constraint, type, attribute.name, attribute.value);
            !r) {
            return r;
        }
    }

    if (Result<void, Validation_Error> r = check_overlaps(*passage, range); !r) {
        return r;
    }
    const xml::Element& passage_element = xml::element_at(document.get_root(), passage->path);
    return check_content_models(constraints, passage_element, range, type, *constraint);
}

Result<void, Validation_Error> validate_attribute_change(
    const Document& document,
    const Constraint_Table& constraints,
    std::u8string_view passage_id,
    std::u8string_view tag_id,
    std::u8string_view name,
    std::optional<std::u8string_view> value
)
{
    const Passage* const passage = document.find_passage(passage_id);
    if (!passage) {
        return passage_not_found_error(passage_id);
    }
    const Tag* const tag = passage->find_tag(tag_id);
    if (!tag) {
        return tag_not_found_error(tag_id);
    }
    const Tag_Constraint* const constraint = constraints.find_tag(tag->type);
    if (!constraint) {
        return unknown_tag_error(constraints, tag->type);
    }

    if (!value) {
        if (!constraint->is_required(name)) {
            return {};
        }
        std::u8string message = u8"The attribute ";
        message += quoted(name);
        message += u8" is required for <";
        message += tag->type;
        message += u8"> and cannot be removed.";
        return make_error(Validation_Error_Code::missing_required_attr, std::move(message));
    }
    return check_attribute(document.get_entities(), *constraint, tag->type, name, *value);
}

Result<void, Validation_Error>
validate_tag_removal(const Document& document, std::u8string_view passage_id, std::u8string_view tag_id)
{
    const Passage* const passage = document.find_passage(passage_id);
    if (!passage) {
        return passage_not_found_error(passage_id);
    }
    if (!passage->find_tag(tag_id)) {
        return tag_not_found_error(tag_id);
    }
    return {};
}

namespace {

[[nodiscard]]
std::u8string unique_xml_id(const Entity_Set& entities, std::u8string_view base)
{
    for (std::size_t n = 2;; ++n) {
        std::u8string candidate { base };
        candidate += u8'-';
        append_integer(candidate, n);
        if (!entities.find_by_xml_id(candidate)) {
            return candidate;
        }
    }
}

[[nodiscard]]
Result<void, Validation_Error> check_entity_fields(const Entity_Set& entities, const Entity& entity)
{
    if (trim_xml_whitespace(entity_name(entity)).empty()) {
        std::u8string message = u8"The ";
        message += entity_kind_name(entity_kind(entity));
        message += u8" must have a name.";
        return make_error(Validation_Error_Code::missing_name, std::move(message));
    }
    const std::u8string& xml_id = entity_xml_id(entity);
    if (!is_ncname(xml_id)) {
        std::u8string message = u8"The xml id ";
        message += quoted(xml_id);
        message += u8" is not a valid name.";
        std::u8string candidate
            = derive_xml_id(entity_name(entity), entity_kind(entity), entity_id(entity));
        if (!is_ncname(candidate)) {
            return make_error(Validation_Error_Code::invalid_xml_id, std::move(message));
        }
        if (entities.find_by_xml_id(candidate)) {
            candidate = unique_xml_id(entities, candidate);
        }
        return make_error(
            Validation_Error_Code::invalid_xml_id, std::move(message), { Use_Xml_Id { std::move(candidate) } }
        );
    }
    return {};
}

[[nodiscard]]
Validation_Error entity_not_found_error(std::u8string_view id)
{
    std::u8string message = u8"There is no entity with id ";
    message += quoted(id);
    message += u8'.';
    return make_error(Validation_Error_Code::entity_not_found, std::move(message));
}

[[nodiscard]]
Result<void, Validation_Error> validate_entity_create(const Entity_Set& entities, const Entity& entity)
{
    if (Result<void, Validation_Error> r = check_entity_fields(entities, entity); !r) {
        return r;
    }
    const std::u8string& id = entity_id(entity);
    if (id.empty() || entities.find(id) || entities.find_relationship(id)) {
        std::u8string message = u8"The id ";
        message += quoted(id);
        message += id.empty() ? u8" is empty." : u8" is already in use.";
        return make_error(Validation_Error_Code::duplicate_id, std::move(message));
    }
    const std::u8string& xml_id = entity_xml_id(entity);
    if (entities.find_by_xml_id(xml_id)) {
        std::u8string message = u8"The xml id ";
        message += quoted(xml_id);
        message += u8" is already in use.";
        return make_error(
            Validation_Error_Code::duplicate_xml_id, std::move(message),
            { Use_Xml_Id { unique_xml_id(entities, xml_id) } }
        );
    }
    return {};
}

[[nodiscard]]
Result<void, Validation_Error> validate_entity_update(const Entity_Set& entities, const Entity& entity)
{
    const Entity* const existing = entities.find(entity_id(entity));
    if (!existing) {
        return entity_not_found_error(entity_id(entity));
    }
    if (existing->index() != entity.index()) {
        std::u8string message = u8"The entity ";
        message += quoted(entity_id(entity));
        message += u8" is a ";
        message += entity_kind_name(entity_kind(*existing));
        message += u8" and cannot become a ";
        message += entity_kind_name(entity_kind(entity));
        message += u8'.';
        return make_error(Validation_Error_Code::type_mismatch, std::move(message));
    }
    if (entity_xml_id(*existing) != entity_xml_id(entity)) {
        std::u8string message = u8"The xml id of ";
        message += quoted(entity_id(entity));
        message += u8" cannot change, because references to it would break.";
        return make_error(
            Validation_Error_Code::xml_id_immutable, std::move(message),
            { Use_Xml_Id { entity_xml_id(*existing) } }
        );
    }
    return check_entity_fields(entities, entity);
}

[[nodiscard]]
Result<void, Validation_Error>
validate_entity_delete(const Entity_Set& entities, const Entity& entity, const Document* document)
{
    const std::u8string& id = entity_id(entity);
    const Entity* const existing = entities.find(id);
    if (!existing) {
        return entity_not_found_error(id);
    }
    if (existing->index() != entity.index()) {
        std::u8string message = u8"The entity ";
        message += quoted(id);
        message += u8" is not a ";
        message += entity_kind_name(entity_kind(entity));
        message += u8'.';
        return make_error(Validation_Error_Code::type_mismatch, std::move(message));
    }

    const auto referenced = [&](std::u8string message) {
        message += u8" Archive the entity instead.";
        return make_error(
            Validation_Error_Code::entity_referenced, std::move(message), { Archive_Entity { id } }
        );
    };

    for (const Relationship& r : entities.relationships) {
        if (r.from != id && r.to != id) {
            continue;
        }
        const std::u8string& other_id = r.from == id ? r.to : r.from;
        const Entity* const other = entities.find(other_id);
        if (other && !is_archived(*other)) {
            std::u8string message = u8"The entity ";
            message += quoted(id);
            message += u8" is referenced by the relationship ";
            message += quoted(r.id);
            message += u8" (";
            message += r.type;
            message += u8") with the active entity ";
            message += quoted(other_id);
            message += u8'.';
            return referenced(std::move(message));
        }
    }

    if (document) {
        const std::vector<const Tag*> tags = document->find_referencing_tags(entity_xml_id(*existing));
        if (!tags.empty()) {
            std::u8string message = u8"The entity ";
            message += quoted(id);
            message += u8" is referenced by the <";
            message += tags.front()->type;
            message += u8"> tag ";
            message += quoted(tags.front()->id);
            if (tags.size() > 1) {
                message += u8" and ";
                append_integer(message, tags.size() - 1);
                message += u8" more";
            }
            message += u8'.';
            return referenced(std::move(message));
        }
    }
    return {};
}

[[nodiscard]]
Result<void, Validation_Error>
validate_relationship_fields(const Entity_Set& entities, const Relationship& relationship, std::u8string_view replaced_id)
{
    if (trim_xml_whitespace(relationship.type).empty()) {
        return make_error(Validation_Error_Code::missing_name, u8"A relationship must have a type.");
    }
    for (const std::u8string* const endpoint : { &relationship.from, &relationship.to }) {
        if (!entities.find(*endpoint)) {
            std::u8string message = u8"The relationship refers to the unknown entity ";
            message += quoted(*endpoint);
            message += u8'.';
            return make_error(Validation_Error_Code::unknown_entity, std::move(message));
        }
    }
    const Relationship* const duplicate
        = entities.find_relationship(relationship.from, relationship.to, relationship.type);
    const bool duplicate_is_replaced = duplicate
        && (duplicate->id == replaced_id || duplicate->id == reciprocal_relationship_id(replaced_id));
    if (duplicate && !duplicate_is_replaced) {
        std::u8string message = u8"A relationship ";
        message += quoted(relationship.type);
        message += u8" from ";
        message += quoted(relationship.from);
        message += u8" to ";
        message += quoted(relationship.to);
        message += u8" already exists as ";
        message += quoted(duplicate->id);
        message += u8'.';
        return make_error(Validation_Error_Code::duplicate_relationship, std::move(message));
    }
    return {};
}

[[nodiscard]]
Result<void, Validation_Error>
validate_relationship_delta(const Entity_Set& entities, Delta_Operation operation, const Relationship& relationship)
{
    switch (operation) {
    case Delta_Operation::create: {
        const bool id_taken = relationship.id.empty() || entities.find_relationship(relationship.id)
            || entities.find(relationship.id)
            || (relationship.mutual
                && entities.find_relationship(reciprocal_relationship_id(relationship.id)));
        if (id_taken) {
            std::u8string message = u8"The relationship id ";
            message += quoted(relationship.id);
            message += relationship.id.empty() ? u8" is empty." : u8" is already in use.";
            return make_error(Validation_Error_Code::duplicate_id, std::move(message));
        }
        return validate_relationship_fields(entities, relationship, {});
    }
    case Delta_Operation::update: {
        const Relationship* const existing = entities.find_primary_relationship(relationship.id);
        if (!existing || existing->id != relationship.id) {
            std::u8string message = u8"There is no relationship with id ";
            message += quoted(relationship.id);
            message += u8'.';
            return make_error(Validation_Error_Code::entity_not_found, std::move(message));
        }
        if (relationship.mutual && !existing->mutual
            && entities.find_relationship(reciprocal_relationship_id(relationship.id))) {
            std::u8string message = u8"The id of the reciprocal relationship ";
            message += quoted(reciprocal_relationship_id(relationship.id));
            message += u8" is already in use.";
            return make_error(Validation_Error_Code::duplicate_id, std::move(message));
        }
        return validate_relationship_fields(entities, relationship, relationship.id);
    }
    case Delta_Operation::remove: {
        if (!entities.find_primary_relationship(relationship.id)) {
            std::u8string message = u8"There is no relationship with id ";
            message += quoted(relationship.id);
            message += u8'.';
            return make_error(Validation_Error_Code::entity_not_found, std::move(message));
        }
        return {};
    }
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid delta operation.");
}

[[nodiscard]]
Entity to_entity(const Entity_Record& record)
{
    switch (record.index()) {
    case 0: return std::get<0>(record);
    case 1: return std::get<1>(record);
    case 2: return std::get<2>(record);
    default: break;
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Record is not an entity.");
}

} // namespace

Result<void, Validation_Error>
validate_entity_delta(const Entity_Set& entities, const Entity_Delta& delta, const Document* document)
{
    if (record_kind(delta.record) != delta.kind) {
        std::u8string message = u8"The delta declares a ";
        message += entity_kind_name(delta.kind);
        message += u8", but holds a ";
        message += entity_kind_name(record_kind(delta.record));
        message += u8'.';
        return make_error(Validation_Error_Code::type_mismatch, std::move(message));
    }
    if (const auto* const relationship = std::get_if<Relationship>(&delta.record)) {
        return validate_relationship_delta(entities, delta.operation, *relationship);
    }

    const Entity entity = to_entity(delta.record);
    switch (delta.operation) {
    case Delta_Operation::create: return validate_entity_create(entities, entity);
    case Delta_Operation::update: return validate_entity_update(entities, entity);
    case Delta_Operation::remove: return validate_entity_delete(entities, entity, document);
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid delta operation.");
}

} // namespace parley
