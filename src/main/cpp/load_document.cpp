#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/hash.hpp"
#include "parley/util/result.hpp"
#include "parley/util/strings.hpp"

#include "parley/diagnostic.hpp"
#include "parley/document.hpp"
#include "parley/entities.hpp"
#include "parley/parse.hpp"
#include "parley/services.hpp"
#include "parley/settings.hpp"
#include "parley/xml.hpp"

namespace parley {

bool is_passage_element(std::u8string_view name)
{
    return name == u8"p" || name == u8"ab" || name == u8"l";
}

bool is_speech_element(std::u8string_view name)
{
    return name == u8"said" || name == u8"q";
}

bool is_reference_attribute(std::u8string_view name)
{
    return name == u8"who" || name == u8"toWhom" || name == u8"ref" || name == u8"corresp";
}

const std::u8string* Tag::find_attribute(std::u8string_view name) const
{
    const auto it = std::ranges::find(attributes, name, &xml::Attribute::name);
    return it == attributes.end() ? nullptr : &it->value;
}

const Tag* Passage::find_tag(std::u8string_view tag_id) const
{
    const auto it = std::ranges::find(tags, tag_id, &Tag::id);
    return it == tags.end() ? nullptr : &*it;
}

const Passage* Document::find_passage(std::u8string_view passage_id) const
{
    const auto it = std::ranges::find(m_data->passages, passage_id, &Passage::id);
    return it == m_data->passages.end() ? nullptr : &*it;
}

const Tag* Document::find_tag(std::u8string_view tag_id) const
{
    for (const Passage& passage : m_data->passages) {
        if (const Tag* const tag = passage.find_tag(tag_id)) {
            return tag;
        }
    }
    return nullptr;
}

std::vector<const Tag*> Document::find_referencing_tags(std::u8string_view xml_id) const
{
    std::vector<const Tag*> result;
    for (const Passage& passage : m_data->passages) {
        for (const Tag& tag : passage.tags) {
            const bool refers = std::ranges::any_of(tag.attributes, [&](const xml::Attribute& a) {
                if (!is_reference_attribute(a.name)) {
                    return false;
                }
                bool found = false;
                for_each_token(a.value, [&](std::u8string_view token) {
                    found |= strip_pointer_hash(token) == xml_id;
                });
                return found;
            });
            if (refers) {
                result.push_back(&tag);
            }
        }
    }
    return result;
}

std::uint64_t next_document_lineage()
{
    static std::atomic<std::uint64_t> next { 1 };
    return next.fetch_add(1, std::memory_order_relaxed);
}

namespace {

/// @brief Collects the tags of one passage,
/// tracking the offset of each element within the passage content.
struct Tag_Collector final : xml::Node_Visitor {
private:
    struct Open_Element {
        std::size_t tag_index;
        std::size_t start;
    };

    const std::u8string_view m_passage_id;
    std::vector<Tag>& m_out;
    std::u8string& m_content;
    std::vector<Open_Element> m_open;
    xml::Node_Path m_path;
    /// @brief The number of children visited so far at each depth.
    std::vector<std::size_t> m_child_counts;
    bool m_inside_passage = false;

public:
    Tag_Collector(std::u8string_view passage_id, std::vector<Tag>& out, std::u8string& content)
        : m_passage_id { passage_id }
        , m_out { out }
        , m_content { content }
    {
    }

    bool enter(const xml::Element& element) final
    {
        if (!m_inside_passage) {
            // The passage element itself.
            m_inside_passage = true;
            m_child_counts.push_back(0);
            return true;
        }
        m_path.push_back(m_child_counts.back()++);
        m_child_counts.push_back(0);
        m_open.push_back({ m_out.size(), m_content.size() });
        m_out.push_back(Tag {
            .id = {},
            .type = element.name,
            .attributes = element.attributes,
            .range = {},
            .path = m_path,
        });
        return true;
    }

    void leave(const xml::Element&) final
    {
        m_child_counts.pop_back();
        if (m_open.empty()) {
            return;
        }
        const Open_Element open = m_open.back();
        m_open.pop_back();
        m_out[open.tag_index].range = { open.start, m_content.size() };
        m_path.pop_back();
    }

    void text(const xml::Text& text) final
    {
        ++m_child_counts.back();
        m_content += text.text;
    }

    /// @brief Assigns ids to all collected tags,
    /// which requires their ranges to be complete.
    void assign_ids()
    {
        for (std::size_t i = 0; i < m_out.size(); ++i) {
            Tag& tag = m_out[i];
            std::uint64_t occurrence = 0;
            for (std::size_t j = 0; j < i; ++j) {
                occurrence += m_out[j].type == tag.type && m_out[j].range == tag.range;
            }
            Fnv1a_Hasher hasher;
            hasher.add(m_passage_id)
                .separate()
                .add(tag.type)
                .separate()
                .add(std::uint64_t(tag.range.start))
                .add(std::uint64_t(tag.range.end))
                .add(occurrence);
            tag.id = u8"tag-";
            append_hex(tag.id, hasher.state, content_id_hex_digits);
        }
    }
};

void find_passages(
    const xml::Element& element,
    xml::Node_Path& path,
    std::vector<xml::Node_Path>& out
)
{
    if (is_passage_element(element.name)) {
        out.push_back(path);
        return;
    }
    if (element.name == u8"teiHeader" || element.name == u8"standOff") {
        return;
    }
    for (std::size_t i = 0; i < element.children.size(); ++i) {
        if (const xml::Element* const child = element.children[i].as_element()) {
            path.push_back(i);
            find_passages(*child, path, out);
            path.pop_back();
        }
    }
}

[[nodiscard]]
std::u8string make_passage_id(std::u8string_view content, std::map<std::uint64_t, std::size_t>& seen)
{
    const std::uint64_t hash = fnv1a(content);
    std::u8string result = u8"passage-";
    append_hex(result, hash, content_id_hex_digits);
    const std::size_t repetitions = seen[hash]++;
    if (repetitions != 0) {
        result += u8'-';
        append_integer(result, repetitions);
    }
    return result;
}

} // namespace

void rebuild_text_index(Document_Data& data)
{
    data.passages.clear();
    data.dialogue.clear();

    std::vector<xml::Node_Path> passage_paths;
    xml::Node_Path path;
    find_passages(data.root, path, passage_paths);

    std::map<std::uint64_t, std::size_t> seen_hashes;
    for (std::size_t i = 0; i < passage_paths.size(); ++i) {
        const xml::Element& element = xml::element_at(data.root, passage_paths[i]);

        Passage passage { .id = {}, .index = i, .content = {}, .tags = {}, .path = passage_paths[i] };
        passage.content = element.text_content();
        passage.id = make_passage_id(passage.content, seen_hashes);

        std::u8string content;
        Tag_Collector collector { passage.id, passage.tags, content };
        xml::walk(element, collector);
        PARLEY_DEBUG_ASSERT(content == passage.content);
        collector.assign_ids();

        for (const Tag& tag : passage.tags) {
            if (!is_speech_element(tag.type)) {
                continue;
            }
            const std::u8string* const who = tag.find_attribute(u8"who");
            const std::u8string* const to_whom = tag.find_attribute(u8"toWhom");
            data.dialogue.push_back({
                .id = tag.id,
                .passage_id = passage.id,
                .speaker = who ? std::u8string { strip_pointer_hash(first_token(*who)) }
                               : std::u8string {},
                .addressee = to_whom ? std::u8string { strip_pointer_hash(first_token(*to_whom)) }
                                     : std::u8string {},
                .content = passage.content.substr(tag.range.start, tag.range.length()),
                .range = tag.range,
            });
        }
        data.passages.push_back(std::move(passage));
    }
}

namespace {

[[nodiscard]]
std::u8string child_text(const xml::Element& element, std::u8string_view child_name)
{
    const xml::Element* const child = element.find_child(child_name);
    return child ? std::u8string { trim_xml_whitespace(child->text_content()) } : std::u8string {};
}

[[nodiscard]]
std::u8string_view attribute_or_empty(const xml::Element& element, std::u8string_view name)
{
    const std::u8string* const value = element.find_attribute(name);
    return value ? std::u8string_view { *value } : std::u8string_view {};
}

struct Standoff_Reader {
    Logger& logger;
    Entity_Set& out;

    void invalid(std::u8string_view id, std::u8string_view what, std::u8string_view value)
    {
        if (!logger.can_log(Severity::warning)) {
            return;
        }
        std::u8string message = u8"The ";
        message += what;
        message += u8" \"";
        message += value;
        message += u8"\" of \"";
        message += id;
        message += u8"\" is not valid and was ignored.";
        logger.log(Severity::warning, diagnostic::standoff_value_invalid, message);
    }

    /// @brief Returns the xml id of a standoff record,
    /// or an empty string if the record has none or a duplicate one.
    [[nodiscard]]
    std::u8string_view record_xml_id(const xml::Element& record)
    {
        const std::u8string_view xml_id = attribute_or_empty(record, u8"xml:id");
        if (xml_id.empty()) {
            std::u8string message = u8"A <";
            message += record.name;
            message += u8"> without xml:id was ignored.";
            logger.log(Severity::warning, diagnostic::person_no_id, message);
            return {};
        }
        if (out.find_by_xml_id(xml_id)) {
            std::u8string message = u8"A <";
            message += record.name;
            message += u8"> with the duplicate xml:id \"";
            message += xml_id;
            message += u8"\" was ignored.";
            logger.log(Severity::warning, diagnostic::entity_duplicate_id, message);
            return {};
        }
        return xml_id;
    }

    [[nodiscard]]
    std::u8string record_id(const xml::Element& record, Entity_Kind kind, std::u8string_view xml_id)
    {
        // Entities created in an editing session keep their original id in @n.
        const std::u8string_view n = attribute_or_empty(record, u8"n");
        if (!n.empty()) {
            return std::u8string { n };
        }
        std::u8string result { entity_id_prefix(kind) };
        result += u8'-';
        result += xml_id;
        return result;
    }

    void read_person(const xml::Element& person)
    {
        const std::u8string_view xml_id = record_xml_id(person);
        if (xml_id.empty()) {
            return;
        }
        Character character;
        character.id = record_id(person, Entity_Kind::character, xml_id);
        character.xml_id = xml_id;
        character.name = child_text(person, u8"persName");
        if (character.name.empty()) {
            character.name = xml_id;
        }
        if (const xml::Element* const sex = person.find_child(u8"sex")) {
            const std::u8string_view value = attribute_or_empty(*sex, u8"value");
            if (const std::optional<Sex> parsed = parse_sex(value)) {
                character.sex = *parsed;
            }
            else {
                invalid(xml_id, u8"sex", value);
            }
        }
        if (const xml::Element* const age = person.find_child(u8"age")) {
            const std::u8string_view value = attribute_or_empty(*age, u8"value");
            int parsed = 0;
            if (parse_integer(value, parsed) && parsed >= 0) {
                character.age = parsed;
            }
            else {
                invalid(xml_id, u8"age", value);
            }
        }
        character.occupation = child_text(person, u8"occupation");
        character.social_status = child_text(person, u8"socecStatus");
        for (const xml::Node& node : person.children) {
            const xml::Element* const child = node.as_element();
            if (!child) {
                continue;
            }
            if (child->name == u8"trait") {
                character.traits.push_back(child_text(*child, u8"desc"));
            }
            else if (child->name == u8"state" && attribute_or_empty(*child, u8"type") == u8"marital") {
                character.marital_status = child_text(*child, u8"desc");
            }
        }
        character.archived = attribute_or_empty(person, u8"status") == u8"archived";
        out.entities.push_back(std::move(character));
    }

    void read_place(const xml::Element& place_element)
    {
        const std::u8string_view xml_id = record_xml_id(place_element);
        if (xml_id.empty()) {
            return;
        }
        Place place;
        place.id = record_id(place_element, Entity_Kind::place, xml_id);
        place.xml_id = xml_id;
        place.name = child_text(place_element, u8"placeName");
        if (place.name.empty()) {
            place.name = xml_id;
        }
        place.place_type = attribute_or_empty(place_element, u8"type");
        if (const xml::Element* const location = place_element.find_child(u8"location")) {
            const std::u8string geo = child_text(*location, u8"geo");
            std::vector<std::u8string_view> parts;
            for_each_token(geo, [&](std::u8string_view token) { parts.push_back(token); });
            Geo_Coordinates coordinates {};
            if (parts.size() == 2 && parse_double(parts[0], coordinates.latitude)
                && parse_double(parts[1], coordinates.longitude)) {
                place.coordinates = coordinates;
            }
            else if (!geo.empty()) {
                invalid(xml_id, u8"location", geo);
            }
        }
        place.archived = attribute_or_empty(place_element, u8"status") == u8"archived";
        out.entities.push_back(std::move(place));
    }

    void read_org(const xml::Element& org_element)
    {
        const std::u8string_view xml_id = record_xml_id(org_element);
        if (xml_id.empty()) {
            return;
        }
        Organization org;
        org.id = record_id(org_element, Entity_Kind::organization, xml_id);
        org.xml_id = xml_id;
        org.name = child_text(org_element, u8"orgName");
        if (org.name.empty()) {
            org.name = xml_id;
        }
        org.org_type = attribute_or_empty(org_element, u8"type");
        org.description = child_text(org_element, u8"desc");
        org.archived = attribute_or_empty(org_element, u8"status") == u8"archived";
        out.entities.push_back(std::move(org));
    }

    void read_relation(const xml::Element& relation)
    {
        const std::u8string_view name = attribute_or_empty(relation, u8"name");
        const std::u8string_view active
            = strip_pointer_hash(first_token(attribute_or_empty(relation, u8"active")));
        const std::u8string_view passive
            = strip_pointer_hash(first_token(attribute_or_empty(relation, u8"passive")));
        const Entity* const from = out.find_by_xml_id(active);
        const Entity* const to = out.find_by_xml_id(passive);
        if (!from || !to) {
            std::u8string message = u8"The relation \"";
            message += name;
            message += u8"\" between \"";
            message += active;
            message += u8"\" and \"";
            message += passive;
            message += u8"\" refers to an unknown entity and was ignored.";
            logger.log(Severity::warning, diagnostic::relation_unresolved, message);
            return;
        }

        Relationship relationship;
        relationship.id = attribute_or_empty(relation, u8"xml:id");
        if (relationship.id.empty()) {
            relationship.id = name;
            relationship.id += u8'-';
            relationship.id += active;
            relationship.id += u8'-';
            relationship.id += passive;
        }
        if (out.find_relationship(relationship.id)) {
            std::u8string message = u8"A <relation> with the duplicate id \"";
            message += relationship.id;
            message += u8"\" was ignored.";
            logger.log(Severity::warning, diagnostic::entity_duplicate_id, message);
            return;
        }
        relationship.from = entity_id(*from);
        relationship.to = entity_id(*to);
        relationship.type = name;
        relationship.subtype = attribute_or_empty(relation, u8"subtype");
        relationship.mutual = attribute_or_empty(relation, u8"mutual") == u8"true";

        out.relationships.push_back(relationship);
        if (relationship.mutual) {
            out.relationships.push_back(make_reciprocal(relationship));
        }
    }

    void read_list(const xml::Element& list)
    {
        for (const xml::Node& node : list.children) {
            const xml::Element* const e = node.as_element();
            if (!e) {
                continue;
            }
            if (e->name == u8"person") {
                read_person(*e);
            }
            else if (e->name == u8"place") {
                read_place(*e);
            }
            else if (e->name == u8"org") {
                read_org(*e);
            }
            else if (e->name == u8"listPerson" || e->name == u8"listPlace"
                     || e->name == u8"listOrg") {
                read_list(*e);
            }
        }
    }

    void read_relations(const xml::Element& list)
    {
        for (const xml::Node& node : list.children) {
            const xml::Element* const e = node.as_element();
            if (e && e->name == u8"relation") {
                read_relation(*e);
            }
            else if (e && e->name == u8"listRelation") {
                read_relations(*e);
            }
        }
    }

    void operator()(const xml::Element& standoff)
    {
        // Relations refer to entities, so all entity lists are read first.
        for (const xml::Node& node : standoff.children) {
            const xml::Element* const e = node.as_element();
            if (e && (e->name == u8"listPerson" || e->name == u8"listPlace" || e->name == u8"listOrg")) {
                read_list(*e);
            }
        }
        for (const xml::Node& node : standoff.children) {
            const xml::Element* const e = node.as_element();
            if (e && e->name == u8"listRelation") {
                read_relations(*e);
            }
        }
    }
};

[[nodiscard]]
Document_Metadata read_metadata(const xml::Element& root)
{
    Document_Metadata result;
    const xml::Element* const header = root.find_child(u8"teiHeader");
    if (!header) {
        return result;
    }
    const xml::Element* const file_desc = header->find_child(u8"fileDesc");
    const xml::Element* const title_stmt = file_desc ? file_desc->find_child(u8"titleStmt") : nullptr;
    if (title_stmt) {
        result.title = child_text(*title_stmt, u8"title");
        result.author = child_text(*title_stmt, u8"author");
    }
    return result;
}

} // namespace

Result<Document, Parse_Error> load_document(std::u8string_view text, Logger& logger)
{
    Result<xml::Element, Parse_Error> root = parse_xml(text);
    if (!root) {
        if (logger.can_log(Severity::error)) {
            logger({ .severity = Severity::error,
                     .id = diagnostic::parse,
                     .file = {},
                     .location = root.error().location,
                     .message = root.error().message });
        }
        return std::move(root).error();
    }

    auto data = std::make_shared<Document_Data>();
    data->lineage = next_document_lineage();
    data->source_text = text;
    data->root = std::move(*root);
    data->revision = 0;
    data->metadata = read_metadata(data->root);

    Standoff_Reader reader { logger, data->entities };
    for (const xml::Node& node : data->root.children) {
        const xml::Element* const e = node.as_element();
        if (e && e->name == u8"standOff") {
            reader(*e);
        }
    }

    rebuild_text_index(*data);
    if (data->passages.empty()) {
        logger.log(Severity::info, diagnostic::no_passages, u8"The document contains no passages.");
    }
    return Document { std::shared_ptr<const Document_Data> { std::move(data) } };
}

} // namespace parley
