#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/strings.hpp"
#include "parley/util/xml_writer.hpp"

#include "parley/document.hpp"
#include "parley/entities.hpp"
#include "parley/serialize.hpp"
#include "parley/services.hpp"
#include "parley/xml.hpp"

namespace parley {
namespace {

[[nodiscard]]
std::u8string pointer_to(std::u8string_view xml_id)
{
    std::u8string result = u8"#";
    result += xml_id;
    return result;
}

/// @brief Returns the value of `@n` needed to restore `id` on loading,
/// or an empty string if the default id derived from the xml id is correct.
[[nodiscard]]
std::u8string_view id_attribute_value(Entity_Kind kind, std::u8string_view id, std::u8string_view xml_id)
{
    const std::u8string_view prefix = entity_id_prefix(kind);
    const bool is_default = id.size() == prefix.size() + 1 + xml_id.size() && id.starts_with(prefix)
        && id[prefix.size()] == u8'-' && id.ends_with(xml_id);
    return is_default ? std::u8string_view {} : id;
}

void write_desc_element(XML_Writer& writer, std::u8string_view name, std::u8string_view type, std::u8string_view desc)
{
    writer.write_line_break();
    writer.open_tag_with_attributes(name).write_attribute_if_present(u8"type", type).end();
    writer.write_text_element(u8"desc", desc);
    writer.close_tag(name);
}

void write_character(XML_Writer& writer, const Character& character)
{
    writer.write_line_break();
    writer.open_tag_with_attributes(u8"person")
        .write_attribute(u8"xml:id", character.xml_id)
        .write_attribute_if_present(
            u8"n", id_attribute_value(Entity_Kind::character, character.id, character.xml_id)
        )
        .write_attribute_if_present(u8"status", character.archived ? u8"archived" : u8"")
        .end();

    writer.write_line_break().write_text_element(u8"persName", character.name);
    if (character.sex != Sex::unspecified) {
        writer.write_line_break();
        writer.open_tag_with_attributes(u8"sex")
            .write_attribute(u8"value", sex_value(character.sex))
            .end_empty();
    }
    if (character.age) {
        std::u8string age;
        append_integer(age, *character.age);
        writer.write_line_break();
        writer.open_tag_with_attributes(u8"age").write_attribute(u8"value", age).end_empty();
    }
    if (!character.occupation.empty()) {
        writer.write_line_break().write_text_element(u8"occupation", character.occupation);
    }
    if (!character.social_status.empty()) {
        writer.write_line_break().write_text_element(u8"socecStatus", character.social_status);
    }
    if (!character.marital_status.empty()) {
        write_desc_element(writer, u8"state", u8"marital", character.marital_status);
    }
    for (const std::u8string& trait : character.traits) {
        write_desc_element(writer, u8"trait", {}, trait);
    }

    writer.write_closing_line_break();
    writer.close_tag(u8"person");
}

void write_place(XML_Writer& writer, const Place& place)
{
    writer.write_line_break();
    writer.open_tag_with_attributes(u8"place")
        .write_attribute(u8"xml:id", place.xml_id)
        .write_attribute_if_present(u8"n", id_attribute_value(Entity_Kind::place, place.id, place.xml_id))
        .write_attribute_if_present(u8"type", place.place_type)
        .write_attribute_if_present(u8"status", place.archived ? u8"archived" : u8"")
        .end();

    writer.write_line_break().write_text_element(u8"placeName", place.name);
    if (place.coordinates) {
        std::u8string geo;
        append_double(geo, place.coordinates->latitude);
        geo += u8' ';
        append_double(geo, place.coordinates->longitude);
        writer.write_line_break().open_tag(u8"location");
        writer.write_text_element(u8"geo", geo);
        writer.close_tag(u8"location");
    }

    writer.write_closing_line_break();
    writer.close_tag(u8"place");
}

void write_organization(XML_Writer& writer, const Organization& org)
{
    writer.write_line_break();
    writer.open_tag_with_attributes(u8"org")
        .write_attribute(u8"xml:id", org.xml_id)
        .write_attribute_if_present(u8"n", id_attribute_value(Entity_Kind::organization, org.id, org.xml_id))
        .write_attribute_if_present(u8"type", org.org_type)
        .write_attribute_if_present(u8"status", org.archived ? u8"archived" : u8"")
        .end();

    writer.write_line_break().write_text_element(u8"orgName", org.name);
    if (!org.description.empty()) {
        writer.write_line_break().write_text_element(u8"desc", org.description);
    }

    writer.write_closing_line_break();
    writer.close_tag(u8"org");
}

[[nodiscard]]
std::u8string_view list_name(Entity_Kind kind)
{
    switch (kind) {
    case Entity_Kind::character: return u8"listPerson";
    case Entity_Kind::place: return u8"listPlace";
    case Entity_Kind::organization: return u8"listOrg";
    case Entity_Kind::relationship: return u8"listRelation";
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid entity kind.");
}

void write_entity(XML_Writer& writer, const Entity& entity)
{
    switch (entity.index()) {
    case 0: write_character(writer, std::get<Character>(entity)); return;
    case 1: write_place(writer, std::get<Place>(entity)); return;
    case 2: write_organization(writer, std::get<Organization>(entity)); return;
    default: break;
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid entity alternative.");
}

void write_relationships(XML_Writer& writer, const Entity_Set& entities)
{
    bool opened = false;
    for (const Relationship& relationship : entities.relationships) {
        // The reciprocal record of a mutual pair is implied by the primary one.
        if (entities.find_primary_relationship(relationship.id) != &relationship) {
            continue;
        }
        const Entity* const from = entities.find(relationship.from);
        const Entity* const to = entities.find(relationship.to);
        if (!from || !to) {
            continue;
        }
        if (!opened) {
            writer.write_line_break().open_tag(u8"listRelation");
            opened = true;
        }
        writer.write_line_break();
        writer.open_tag_with_attributes(u8"relation")
            .write_attribute(u8"xml:id", relationship.id)
            .write_attribute(u8"name", relationship.type)
            .write_attribute_if_present(u8"subtype", relationship.subtype)
            .write_attribute(u8"active", pointer_to(entity_xml_id(*from)))
            .write_attribute(u8"passive", pointer_to(entity_xml_id(*to)))
            .write_attribute_if_present(u8"mutual", relationship.mutual ? u8"true" : u8"")
            .end_empty();
    }
    if (opened) {
        writer.write_closing_line_break();
        writer.close_tag(u8"listRelation");
    }
}

[[nodiscard]]
bool is_standoff_list(std::u8string_view name)
{
    return name == u8"listPerson" || name == u8"listPlace" || name == u8"listOrg"
        || name == u8"listRelation";
}

/// @brief Returns `true` if `element` has character data other than whitespace as direct children.
/// Such elements are written without any added whitespace.
[[nodiscard]]
bool has_character_data(const xml::Element& element)
{
    for (const xml::Node& child : element.children) {
        if (const xml::Text* const text = child.as_text(); text && !is_xml_blank(text->text)) {
            return true;
        }
    }
    return false;
}

struct Document_Serializer {
    XML_Writer& writer;
    const Entity_Set& entities;

    void write_inline(const xml::Element& element)
    {
        auto attributes = writer.open_tag_with_attributes(element.name);
        for (const xml::Attribute& a : element.attributes) {
            attributes.write_attribute(a.name, a.value);
        }
        if (element.children.empty()) {
            attributes.end_empty();
            return;
        }
        attributes.end();
        for (const xml::Node& child : element.children) {
            if (const xml::Text* const text = child.as_text()) {
                writer.write_inner_text(text->text);
            }
            else {
                write_inline(*child.as_element());
            }
        }
        writer.close_tag(element.name);
    }

    void write_standoff(const xml::Element* existing)
    {
        writer.write_line_break();
        auto attributes = writer.open_tag_with_attributes(u8"standOff");
        if (existing) {
            for (const xml::Attribute& a : existing->attributes) {
                attributes.write_attribute(a.name, a.value);
            }
        }
        attributes.end();
        if (existing) {
            for (const xml::Node& child : existing->children) {
                const xml::Element* const e = child.as_element();
                if (e && !is_standoff_list(e->name)) {
                    write_block_child(*e);
                }
            }
        }
        write_standoff_lists(writer, entities);
        writer.write_closing_line_break();
        writer.close_tag(u8"standOff");
    }

    void write_block_child(const xml::Element& element)
    {
        writer.write_line_break();
        write_element(element);
    }

    void write_element(const xml::Element& element)
    {
        if (is_passage_element(element.name) || has_character_data(element)
            || element.children.empty()) {
            write_inline(element);
            return;
        }
        auto attributes = writer.open_tag_with_attributes(element.name);
        for (const xml::Attribute& a : element.attributes) {
            attributes.write_attribute(a.name, a.value);
        }
        attributes.end();
        for (const xml::Node& child : element.children) {
            if (const xml::Element* const e = child.as_element()) {
                write_block_child(*e);
            }
        }
        writer.write_closing_line_break();
        writer.close_tag(element.name);
    }

    void write_root(const xml::Element& root)
    {
        if (is_passage_element(root.name) || has_character_data(root)) {
            write_inline(root);
            return;
        }
        auto attributes = writer.open_tag_with_attributes(root.name);
        for (const xml::Attribute& a : root.attributes) {
            attributes.write_attribute(a.name, a.value);
        }
        attributes.end();

        bool standoff_written = false;
        for (const xml::Node& child : root.children) {
            const xml::Element* const e = child.as_element();
            if (!e) {
                continue;
            }
            if (e->name == u8"standOff") {
                if (!standoff_written && (!entities.empty() || e->children.size() != 0)) {
                    write_standoff(e);
                }
                standoff_written = true;
                continue;
            }
            write_block_child(*e);
        }
        if (!standoff_written && !entities.empty()) {
            write_standoff(nullptr);
        }
        writer.write_closing_line_break();
        writer.close_tag(root.name);
    }
};

} // namespace

void write_standoff_lists(XML_Writer& writer, const Entity_Set& entities)
{
    std::size_t i = 0;
    while (i < entities.entities.size()) {
        const Entity_Kind kind = entity_kind(entities.entities[i]);
        writer.write_line_break().open_tag(list_name(kind));
        for (; i < entities.entities.size() && entity_kind(entities.entities[i]) == kind; ++i) {
            write_entity(writer, entities.entities[i]);
        }
        writer.write_closing_line_break();
        writer.close_tag(list_name(kind));
    }
    write_relationships(writer, entities);
}

std::u8string serialize_document(const Document& document)
{
    std::u8string result;
    XML_Writer writer { result };
    writer.write_declaration();
    Document_Serializer serializer { writer, document.get_entities() };
    serializer.write_root(document.get_root());
    PARLEY_ASSERT(writer.is_done());
    result += u8'\n';
    return result;
}

} // namespace parley
