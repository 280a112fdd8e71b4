#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/json_writer.hpp"
#include "parley/util/result.hpp"
#include "parley/util/strings.hpp"

#include "parley/delta.hpp"
#include "parley/entities.hpp"
#include "parley/json.hpp"
#include "parley/persistence.hpp"
#include "parley/services.hpp"

namespace parley {

std::u8string_view persistence_error_code_name(Persistence_Error_Code code)
{
    switch (code) {
        using enum Persistence_Error_Code;
        PARLEY_ENUM_STRING_CASE8(malformed_json);
        PARLEY_ENUM_STRING_CASE8(missing_member);
        PARLEY_ENUM_STRING_CASE8(invalid_value);
        PARLEY_ENUM_STRING_CASE8(position_out_of_range);
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid persistence error code.");
}

namespace {

void write_optional_member(JSON_Writer& writer, std::u8string_view name, std::u8string_view value)
{
    if (!value.empty()) {
        writer.write_member(name, value);
    }
}

void write_archived(JSON_Writer& writer, bool archived)
{
    if (archived) {
        writer.key(u8"archived").write_bool(true);
    }
}

void write_record_fields(JSON_Writer& writer, const Character& character)
{
    writer.write_member(u8"id", character.id);
    writer.write_member(u8"xml_id", character.xml_id);
    writer.write_member(u8"name", character.name);
    write_optional_member(writer, u8"sex", sex_value(character.sex));
    if (character.age) {
        writer.key(u8"age").write_integer(*character.age);
    }
    write_optional_member(writer, u8"occupation", character.occupation);
    write_optional_member(writer, u8"social_status", character.social_status);
    write_optional_member(writer, u8"marital_status", character.marital_status);
    if (!character.traits.empty()) {
        writer.key(u8"traits").begin_array();
        for (const std::u8string& trait : character.traits) {
            writer.write_string(trait);
        }
        writer.end_array();
    }
    write_archived(writer, character.archived);
}

void write_record_fields(JSON_Writer& writer, const Place& place)
{
    writer.write_member(u8"id", place.id);
    writer.write_member(u8"xml_id", place.xml_id);
    writer.write_member(u8"name", place.name);
    write_optional_member(writer, u8"type", place.place_type);
    if (place.coordinates) {
        writer.key(u8"coordinates").begin_object();
        writer.key(u8"latitude").write_number(place.coordinates->latitude);
        writer.key(u8"longitude").write_number(place.coordinates->longitude);
        writer.end_object();
    }
    write_archived(writer, place.archived);
}

void write_record_fields(JSON_Writer& writer, const Organization& org)
{
    writer.write_member(u8"id", org.id);
    writer.write_member(u8"xml_id", org.xml_id);
    writer.write_member(u8"name", org.name);
    write_optional_member(writer, u8"type", org.org_type);
    write_optional_member(writer, u8"description", org.description);
    write_archived(writer, org.archived);
}

void write_record_fields(JSON_Writer& writer, const Relationship& relationship)
{
    writer.write_member(u8"id", relationship.id);
    writer.write_member(u8"from", relationship.from);
    writer.write_member(u8"to", relationship.to);
    writer.write_member(u8"type", relationship.type);
    write_optional_member(writer, u8"subtype", relationship.subtype);
    if (relationship.mutual) {
        writer.key(u8"mutual").write_bool(true);
    }
}

/// @brief Reads the members of one stored delta, remembering the first failure.
struct Record_Reader {
    const json::Object& object;
    std::size_t index;
    std::optional<Persistence_Error> error {};

    void fail(Persistence_Error_Code code, std::u8string_view what)
    {
        if (error) {
            return;
        }
        std::u8string message = u8"Delta ";
        append_integer(message, index);
        message += u8": ";
        message += what;
        error = Persistence_Error { code, index, std::move(message) };
    }

    [[nodiscard]]
    std::u8string required_string(std::u8string_view name)
    {
        if (const json::String* const value = object.find_string(name)) {
            return std::u8string { std::u8string_view { *value } };
        }
        std::u8string what = u8"missing string member \"";
        what += name;
        what += u8"\".";
        fail(Persistence_Error_Code::missing_member, what);
        return {};
    }

    [[nodiscard]]
    std::u8string optional_string(std::u8string_view name)
    {
        if (const json::String* const value = object.find_string(name)) {
            return std::u8string { std::u8string_view { *value } };
        }
        return {};
    }

    [[nodiscard]]
    bool optional_bool(std::u8string_view name)
    {
        const bool* const value = object.find_bool(name);
        return value && *value;
    }

    [[nodiscard]]
    Character read_character()
    {
        Character result { .id = required_string(u8"id"),
                           .xml_id = required_string(u8"xml_id"),
                           .name = required_string(u8"name") };
        if (const std::optional<Sex> sex = parse_sex(optional_string(u8"sex"))) {
            result.sex = *sex;
        }
        else {
            fail(Persistence_Error_Code::invalid_value, u8"unknown value of \"sex\".");
        }
        if (const json::Number* const age = object.find_number(u8"age")) {
            if (*age < 0 || *age != std::floor(*age) || *age > 100'000) {
                fail(Persistence_Error_Code::invalid_value, u8"\"age\" is not a valid age.");
            }
            else {
                result.age = int(*age);
            }
        }
        result.occupation = optional_string(u8"occupation");
        result.social_status = optional_string(u8"social_status");
        result.marital_status = optional_string(u8"marital_status");
        if (const json::Array* const traits = object.find_array(u8"traits")) {
            for (const json::Value& trait : *traits) {
                if (const json::String* const text = trait.as_string()) {
                    result.traits.emplace_back(std::u8string_view { *text });
                }
                else {
                    fail(Persistence_Error_Code::invalid_value, u8"\"traits\" must hold strings.");
                }
            }
        }
        result.archived = optional_bool(u8"archived");
        return result;
    }

    [[nodiscard]]
    Place read_place()
    {
        Place result { .id = required_string(u8"id"),
                       .xml_id = required_string(u8"xml_id"),
                       .name = required_string(u8"name"),
                       .place_type = optional_string(u8"type") };
        if (const json::Object* const coordinates = object.find_object(u8"coordinates")) {
            const json::Number* const latitude = coordinates->find_number(u8"latitude");
            const json::Number* const longitude = coordinates->find_number(u8"longitude");
            if (latitude && longitude) {
                result.coordinates = Geo_Coordinates { *latitude, *longitude };
            }
            else {
                fail(
                    Persistence_Error_Code::missing_member,
                    u8"\"coordinates\" requires \"latitude\" and \"longitude\"."
                );
            }
        }
        result.archived = optional_bool(u8"archived");
        return result;
    }

    [[nodiscard]]
    Organization read_organization()
    {
        return { .id = required_string(u8"id"),
                 .xml_id = required_string(u8"xml_id"),
                 .name = required_string(u8"name"),
                 .org_type = optional_string(u8"type"),
                 .description = optional_string(u8"description"),
                 .archived = optional_bool(u8"archived") };
    }

    [[nodiscard]]
    Relationship read_relationship()
    {
        return { .id = required_string(u8"id"),
                 .from = required_string(u8"from"),
                 .to = required_string(u8"to"),
                 .type = required_string(u8"type"),
                 .subtype = optional_string(u8"subtype"),
                 .mutual = optional_bool(u8"mutual") };
    }

    [[nodiscard]]
    Entity_Record read_record(Entity_Kind kind)
    {
        switch (kind) {
        case Entity_Kind::character: return read_character();
        case Entity_Kind::place: return read_place();
        case Entity_Kind::organization: return read_organization();
        case Entity_Kind::relationship: return read_relationship();
        }
        PARLEY_ASSERT_UNREACHABLE(u8"Invalid entity kind.");
    }
};

[[nodiscard]]
Result<Entity_Delta, Persistence_Error> read_delta(const json::Value& value, std::size_t index)
{
    const json::Object* const object = value.as_object();
    if (!object) {
        std::u8string message = u8"Delta ";
        append_integer(message, index);
        message += u8" is not an object.";
        return Persistence_Error { Persistence_Error_Code::invalid_value, index, std::move(message) };
    }
    Record_Reader reader { *object, index };

    const std::optional<Delta_Operation> operation
        = parse_delta_operation(reader.required_string(u8"op"));
    const std::optional<Entity_Kind> kind = parse_entity_kind(reader.required_string(u8"kind"));
    if (reader.error) {
        return std::move(*reader.error);
    }
    if (!operation) {
        reader.fail(Persistence_Error_Code::invalid_value, u8"unknown \"op\".");
        return std::move(*reader.error);
    }
    if (!kind) {
        reader.fail(Persistence_Error_Code::invalid_value, u8"unknown \"kind\".");
        return std::move(*reader.error);
    }

    std::int64_t timestamp = 0;
    if (const json::Number* const stored = object->find_number(u8"timestamp")) {
        timestamp = std::int64_t(*stored);
    }

    const json::Object* const record_object = object->find_object(u8"record");
    if (!record_object) {
        reader.fail(Persistence_Error_Code::missing_member, u8"missing object member \"record\".");
        return std::move(*reader.error);
    }
    Record_Reader record_reader { *record_object, index };
    Entity_Record record = record_reader.read_record(*kind);
    if (record_reader.error) {
        return std::move(*record_reader.error);
    }
    return Entity_Delta { .operation = *operation,
                          .kind = *kind,
                          .record = std::move(record),
                          .timestamp = timestamp };
}

} // namespace

std::u8string write_history(std::span<const Entity_Delta> log, std::size_t position)
{
    PARLEY_ASSERT(position <= log.size());
    std::u8string result;
    JSON_Writer writer { result };
    writer.begin_object();
    writer.key(u8"position").write_integer(position);
    writer.key(u8"deltas").begin_array();
    for (const Entity_Delta& delta : log) {
        writer.begin_object();
        writer.write_member(u8"op", delta_operation_name(delta.operation));
        writer.write_member(u8"kind", entity_kind_name(delta.kind));
        writer.key(u8"timestamp").write_integer(delta.timestamp);
        writer.key(u8"record").begin_object();
        std::visit([&](const auto& record) { write_record_fields(writer, record); }, delta.record);
        writer.end_object();
        writer.end_object();
    }
    writer.end_array();
    writer.end_object();
    PARLEY_ASSERT(writer.is_done());
    result += u8'\n';
    return result;
}

Result<Stored_History, Persistence_Error>
load_history(std::u8string_view json, std::pmr::memory_resource* memory)
{
    const std::optional<json::Value> root = json::load(json, memory);
    if (!root) {
        return Persistence_Error { Persistence_Error_Code::malformed_json,
                                   std::size_t(-1),
                                   u8"The history is not valid JSON." };
    }
    const json::Object* const object = root->as_object();
    if (!object) {
        return Persistence_Error { Persistence_Error_Code::invalid_value,
                                   std::size_t(-1),
                                   u8"The history shall be a JSON object." };
    }
    const json::Array* const deltas = object->find_array(u8"deltas");
    if (!deltas) {
        return Persistence_Error { Persistence_Error_Code::missing_member,
                                   std::size_t(-1),
                                   u8"Missing array member \"deltas\"." };
    }

    Stored_History result;
    result.deltas.reserve(deltas->size());
    for (std::size_t i = 0; i < deltas->size(); ++i) {
        Result<Entity_Delta, Persistence_Error> delta = read_delta((*deltas)[i], i);
        if (!delta) {
            return std::move(delta).error();
        }
        result.deltas.push_back(std::move(*delta));
    }

    // Without a stored cursor, every delta is considered applied.
    result.position = result.deltas.size();
    if (const json::Number* const position = object->find_number(u8"position")) {
        if (*position < 0 || *position != std::floor(*position)
            || *position > double(result.deltas.size())) {
            return Persistence_Error { Persistence_Error_Code::position_out_of_range,
                                       std::size_t(-1),
                                       u8"\"position\" lies outside the delta log." };
        }
        result.position = std::size_t(*position);
    }
    return result;
}

} // namespace parley
