#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/regex.hpp>

#include "parley/util/assert.hpp"
#include "parley/util/strings.hpp"

#include "parley/entities.hpp"

namespace parley {

std::u8string_view sex_value(Sex sex)
{
    switch (sex) {
    case Sex::unspecified: return u8"";
    case Sex::male: return u8"M";
    case Sex::female: return u8"F";
    case Sex::other: return u8"Other";
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid sex.");
}

std::optional<Sex> parse_sex(std::u8string_view value)
{
    if (value == u8"M" || value == u8"1") {
        return Sex::male;
    }
    if (value == u8"F" || value == u8"2") {
        return Sex::female;
    }
    if (value == u8"Other" || value == u8"9") {
        return Sex::other;
    }
    if (value.empty() || value == u8"0") {
        return Sex::unspecified;
    }
    return std::nullopt;
}

Entity_Kind entity_kind(const Entity& entity)
{
    switch (entity.index()) {
    case 0: return Entity_Kind::character;
    case 1: return Entity_Kind::place;
    case 2: return Entity_Kind::organization;
    default: break;
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Valueless entity.");
}

const std::u8string& entity_id(const Entity& entity)
{
    return std::visit([](const auto& e) -> const std::u8string& { return e.id; }, entity);
}

const std::u8string& entity_xml_id(const Entity& entity)
{
    return std::visit([](const auto& e) -> const std::u8string& { return e.xml_id; }, entity);
}

const std::u8string& entity_name(const Entity& entity)
{
    return std::visit([](const auto& e) -> const std::u8string& { return e.name; }, entity);
}

bool is_archived(const Entity& entity)
{
    return std::visit([](const auto& e) { return e.archived; }, entity);
}

void set_archived(Entity& entity, bool archived)
{
    std::visit([&](auto& e) { e.archived = archived; }, entity);
}

namespace {

void trim_in_place(std::u8string& str)
{
    const std::u8string_view trimmed = trim_xml_whitespace(str);
    if (trimmed.size() != str.size()) {
        str = std::u8string { trimmed };
    }
}

const boost::regex ncname_pattern { R"([A-Za-z_][A-Za-z0-9._\-]*)" };
// ASCII characters other than lower-case letters and digits; non-ASCII bytes are kept.
const boost::regex slug_separator_pattern { R"([\x01-/:-`{-\x7f]+)" };
const boost::regex slug_trim_pattern { "^-|-$" };

} // namespace

void trim_entity_text(Entity& entity)
{
    std::visit([](auto& e) { trim_in_place(e.name); }, entity);
    if (auto* const character = std::get_if<Character>(&entity)) {
        trim_in_place(character->occupation);
        trim_in_place(character->social_status);
        trim_in_place(character->marital_status);
        for (std::u8string& trait : character->traits) {
            trim_in_place(trait);
        }
    }
    else if (auto* const organization = std::get_if<Organization>(&entity)) {
        trim_in_place(organization->description);
    }
}

std::u8string make_xml_id(std::u8string_view name)
{
    const std::string lower { as_string_view(to_ascii_lower(name)) };
    std::string slug = boost::regex_replace(lower, slug_separator_pattern, "-");
    slug = boost::regex_replace(slug, slug_trim_pattern, "");
    return std::u8string { as_u8string_view(slug) };
}

std::u8string derive_xml_id(std::u8string_view name, Entity_Kind kind, std::u8string_view fallback_id)
{
    std::u8string slug = make_xml_id(name);
    if (slug.empty()) {
        slug = fallback_id;
    }
    if (is_ncname(slug)) {
        return slug;
    }
    std::u8string result { entity_id_prefix(kind) };
    result += u8'-';
    result += slug;
    return result;
}

bool is_ncname(std::u8string_view str)
{
    // Non-ASCII characters are treated like letters, which accepts every valid UTF-8 name
    // and a few names that the full XML grammar would reject.
    std::string chars { as_string_view(str) };
    for (char& c : chars) {
        if (!is_ascii(char8_t(c))) {
            c = 'a';
        }
    }
    return boost::regex_match(chars, ncname_pattern);
}

std::u8string reciprocal_relationship_id(std::u8string_view id)
{
    std::u8string result { id };
    result += u8"-reciprocal";
    return result;
}

Relationship make_reciprocal(const Relationship& relationship)
{
    return Relationship {
        .id = reciprocal_relationship_id(relationship.id),
        .from = relationship.to,
        .to = relationship.from,
        .type = relationship.type,
        .subtype = relationship.subtype,
        .mutual = relationship.mutual,
    };
}

const Entity* Entity_Set::find(std::u8string_view id) const
{
    const std::size_t index = index_of(id);
    return index == std::size_t(-1) ? nullptr : &entities[index];
}

const Entity* Entity_Set::find_by_xml_id(std::u8string_view xml_id) const
{
    const auto it = std::ranges::find_if(entities, [&](const Entity& e) {
        return entity_xml_id(e) == xml_id;
    });
    return it == entities.end() ? nullptr : &*it;
}

std::size_t Entity_Set::index_of(std::u8string_view id) const
{
    for (std::size_t i = 0; i < entities.size(); ++i) {
        if (entity_id(entities[i]) == id) {
            return i;
        }
    }
    return std::size_t(-1);
}

const Relationship* Entity_Set::find_relationship(std::u8string_view id) const
{
    const std::size_t index = relationship_index_of(id);
    return index == std::size_t(-1) ? nullptr : &relationships[index];
}

std::size_t Entity_Set::relationship_index_of(std::u8string_view id) const
{
    const auto it = std::ranges::find(relationships, id, &Relationship::id);
    return it == relationships.end() ? std::size_t(-1)
                                     : std::size_t(it - relationships.begin());
}

const Relationship* Entity_Set::find_primary_relationship(std::u8string_view id) const
{
    constexpr std::u8string_view suffix = u8"-reciprocal";
    if (id.ends_with(suffix)) {
        const Relationship* const mirrored = find_relationship(id.substr(0, id.size() - suffix.size()));
        if (mirrored && mirrored->mutual) {
            return mirrored;
        }
    }
    return find_relationship(id);
}

const Relationship* Entity_Set::find_relationship(
    std::u8string_view from,
    std::u8string_view to,
    std::u8string_view type
) const
{
    const auto it = std::ranges::find_if(relationships, [&](const Relationship& r) {
        return r.from == from && r.to == to && r.type == type;
    });
    return it == relationships.end() ? nullptr : &*it;
}

namespace {

template <typename T>
[[nodiscard]]
std::vector<const T*> all_of_kind(const std::vector<Entity>& entities, bool include_archived)
{
    std::vector<const T*> result;
    for (const Entity& entity : entities) {
        if (const T* const e = std::get_if<T>(&entity); e && (include_archived || !e->archived)) {
            result.push_back(e);
        }
    }
    return result;
}

} // namespace

std::vector<const Character*> Entity_Set::characters() const
{
    return all_of_kind<Character>(entities, true);
}

std::vector<const Character*> Entity_Set::active_characters() const
{
    return all_of_kind<Character>(entities, false);
}

std::vector<const Place*> Entity_Set::places() const
{
    return all_of_kind<Place>(entities, true);
}

std::vector<const Organization*> Entity_Set::organizations() const
{
    return all_of_kind<Organization>(entities, true);
}

} // namespace parley
