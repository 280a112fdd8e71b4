#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/result.hpp"

#include "parley/delta.hpp"
#include "parley/entities.hpp"
#include "parley/services.hpp"
#include "parley/validation.hpp"

namespace parley {

std::u8string_view delta_operation_name(Delta_Operation operation)
{
    switch (operation) {
    case Delta_Operation::create: return u8"create";
    case Delta_Operation::update: return u8"update";
    case Delta_Operation::remove: return u8"delete";
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid delta operation.");
}

std::optional<Delta_Operation> parse_delta_operation(std::u8string_view name)
{
    if (name == u8"create") {
        return Delta_Operation::create;
    }
    if (name == u8"update") {
        return Delta_Operation::update;
    }
    if (name == u8"delete") {
        return Delta_Operation::remove;
    }
    return {};
}

std::optional<Entity_Kind> parse_entity_kind(std::u8string_view name)
{
    for (const auto kind : { Entity_Kind::character, Entity_Kind::place, Entity_Kind::organization,
                             Entity_Kind::relationship }) {
        if (name == entity_kind_name(kind)) {
            return kind;
        }
    }
    return {};
}

Entity_Kind record_kind(const Entity_Record& record)
{
    // The alternatives of Entity_Record are declared in the order of Entity_Kind.
    static_assert(std::variant_size_v<Entity_Record> == 4);
    return Entity_Kind(record.index());
}

const std::u8string& record_id(const Entity_Record& record)
{
    return std::visit([](const auto& r) -> const std::u8string& { return r.id; }, record);
}

namespace {

[[nodiscard]]
Entity to_entity(Entity_Record&& record)
{
    switch (record.index()) {
    case 0: return std::move(std::get<0>(record));
    case 1: return std::move(std::get<1>(record));
    case 2: return std::move(std::get<2>(record));
    default: break;
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Record is not an entity.");
}

[[nodiscard]]
Entity_Record to_record(Entity&& entity)
{
    return std::visit([](auto&& e) -> Entity_Record { return std::move(e); }, std::move(entity));
}

void erase_relationships_of(Entity_Set& entities, std::u8string_view id)
{
    std::erase_if(entities.relationships, [&](const Relationship& r) { //
        return r.from == id || r.to == id;
    });
}

void erase_relationship(Entity_Set& entities, std::u8string_view id)
{
    const std::size_t index = entities.relationship_index_of(id);
    if (index != std::size_t(-1)) {
        entities.relationships.erase(entities.relationships.begin() + std::ptrdiff_t(index));
    }
}

void apply_relationship(Entity_Set& entities, Delta_Operation operation, const Relationship& relationship)
{
    switch (operation) {
    case Delta_Operation::create: {
        entities.relationships.push_back(relationship);
        if (relationship.mutual) {
            entities.relationships.push_back(make_reciprocal(relationship));
        }
        return;
    }
    case Delta_Operation::update: {
        const std::size_t index = entities.relationship_index_of(relationship.id);
        PARLEY_ASSERT(index != std::size_t(-1));
        entities.relationships[index] = relationship;

        const std::u8string reciprocal_id = reciprocal_relationship_id(relationship.id);
        const std::size_t reciprocal_index = entities.relationship_index_of(reciprocal_id);
        if (!relationship.mutual) {
            erase_relationship(entities, reciprocal_id);
        }
        else if (reciprocal_index != std::size_t(-1)) {
            entities.relationships[reciprocal_index] = make_reciprocal(relationship);
        }
        else {
            entities.relationships.insert(
                entities.relationships.begin() + std::ptrdiff_t(index + 1), make_reciprocal(relationship)
            );
        }
        return;
    }
    case Delta_Operation::remove: {
        const Relationship* const primary = entities.find_primary_relationship(relationship.id);
        PARLEY_ASSERT(primary);
        const std::u8string primary_id = primary->id;
        const bool mutual = primary->mutual;
        erase_relationship(entities, primary_id);
        if (mutual) {
            erase_relationship(entities, reciprocal_relationship_id(primary_id));
        }
        return;
    }
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid delta operation.");
}

void apply_entity(Entity_Set& entities, Delta_Operation operation, Entity&& entity)
{
    switch (operation) {
    case Delta_Operation::create: {
        entities.entities.push_back(std::move(entity));
        return;
    }
    case Delta_Operation::update: {
        const std::size_t index = entities.index_of(entity_id(entity));
        PARLEY_ASSERT(index != std::size_t(-1));
        entities.entities[index] = std::move(entity);
        return;
    }
    case Delta_Operation::remove: {
        const std::u8string id = entity_id(entity);
        const std::size_t index = entities.index_of(id);
        PARLEY_ASSERT(index != std::size_t(-1));
        entities.entities.erase(entities.entities.begin() + std::ptrdiff_t(index));
        // Only relationships to archived entities can remain at this point.
        erase_relationships_of(entities, id);
        return;
    }
    }
    PARLEY_ASSERT_UNREACHABLE(u8"Invalid delta operation.");
}

} // namespace

Result<Entity_Set, Validation_Error>
apply_entity_delta(const Entity_Set& entities, const Entity_Delta& delta, const Document* document)
{
    if (Result<void, Validation_Error> r = validate_entity_delta(entities, delta, document); !r) {
        return std::move(r).error();
    }
    Entity_Set result = entities;
    if (const auto* const relationship = std::get_if<Relationship>(&delta.record)) {
        apply_relationship(result, delta.operation, *relationship);
    }
    else {
        Entity entity = to_entity(Entity_Record { delta.record });
        // Loading trims element content, so stored text must be trimmed too.
        trim_entity_text(entity);
        apply_entity(result, delta.operation, std::move(entity));
    }
    return result;
}

namespace {

[[nodiscard]]
Result<Applied_Delta, Validation_Error> apply_new_delta(const Entity_Set& entities, Entity_Delta&& delta)
{
    Result<Entity_Set, Validation_Error> result = apply_entity_delta(entities, delta);
    if (!result) {
        return std::move(result).error();
    }
    return Applied_Delta { .entities = std::move(*result), .delta = std::move(delta) };
}

template <typename T>
[[nodiscard]]
Result<Applied_Delta, Validation_Error>
create_entity(const Entity_Set& entities, T entity, Entity_Kind kind, Delta_Services services)
{
    entity.id = services.ids.generate(kind);
    Entity trimmed { std::move(entity) };
    trim_entity_text(trimmed);
    T& record = std::get<T>(trimmed);
    if (record.xml_id.empty()) {
        record.xml_id = derive_xml_id(record.name, kind, record.id);
    }
    return apply_new_delta(
        entities,
        Entity_Delta {
            .operation = Delta_Operation::create,
            .kind = kind,
            .record = std::move(record),
            .timestamp = services.clock.now_ms(),
        }
    );
}

} // namespace

Result<Applied_Delta, Validation_Error>
create_character(const Entity_Set& entities, Character character, Delta_Services services)
{
    return create_entity(entities, std::move(character), Entity_Kind::character, services);
}

Result<Applied_Delta, Validation_Error>
create_place(const Entity_Set& entities, Place place, Delta_Services services)
{
    return create_entity(entities, std::move(place), Entity_Kind::place, services);
}

Result<Applied_Delta, Validation_Error>
create_organization(const Entity_Set& entities, Organization organization, Delta_Services services)
{
    return create_entity(entities, std::move(organization), Entity_Kind::organization, services);
}

Result<Applied_Delta, Validation_Error>
update_entity(const Entity_Set& entities, Entity entity, Clock& clock)
{
    trim_entity_text(entity);
    const Entity_Kind kind = entity_kind(entity);
    return apply_new_delta(
        entities,
        Entity_Delta {
            .operation = Delta_Operation::update,
            .kind = kind,
            .record = to_record(std::move(entity)),
            .timestamp = clock.now_ms(),
        }
    );
}

Result<Applied_Delta, Validation_Error> delete_entity(
    const Entity_Set& entities,
    std::u8string_view id,
    Clock& clock,
    const Document* document
)
{
    const Entity* const existing = entities.find(id);
    if (!existing) {
        std::u8string message = u8"There is no entity with id \"";
        message += id;
        message += u8"\".";
        return Validation_Error { Validation_Error_Code::entity_not_found, std::move(message), {} };
    }
    Entity_Delta delta {
        .operation = Delta_Operation::remove,
        .kind = entity_kind(*existing),
        .record = to_record(Entity { *existing }),
        .timestamp = clock.now_ms(),
    };
    Result<Entity_Set, Validation_Error> result = apply_entity_delta(entities, delta, document);
    if (!result) {
        return std::move(result).error();
    }
    return Applied_Delta { .entities = std::move(*result), .delta = std::move(delta) };
}

Result<Applied_Delta, Validation_Error>
archive_entity(const Entity_Set& entities, std::u8string_view id, Clock& clock, bool archived)
{
    const Entity* const existing = entities.find(id);
    if (!existing) {
        std::u8string message = u8"There is no entity with id \"";
        message += id;
        message += u8"\".";
        return Validation_Error { Validation_Error_Code::entity_not_found, std::move(message), {} };
    }
    Entity updated = *existing;
    set_archived(updated, archived);
    return update_entity(entities, std::move(updated), clock);
}

Result<Applied_Delta, Validation_Error>
add_relationship(const Entity_Set& entities, Relationship relationship, Delta_Services services)
{
    if (relationship.id.empty()) {
        relationship.id = services.ids.generate(Entity_Kind::relationship);
    }
    return apply_new_delta(
        entities,
        Entity_Delta {
            .operation = Delta_Operation::create,
            .kind = Entity_Kind::relationship,
            .record = std::move(relationship),
            .timestamp = services.clock.now_ms(),
        }
    );
}

Result<Applied_Delta, Validation_Error>
remove_relationship(const Entity_Set& entities, std::u8string_view id, Clock& clock)
{
    const Relationship* const primary = entities.find_primary_relationship(id);
    if (!primary) {
        std::u8string message = u8"There is no relationship with id \"";
        message += id;
        message += u8"\".";
        return Validation_Error { Validation_Error_Code::entity_not_found, std::move(message), {} };
    }
    return apply_new_delta(
        entities,
        Entity_Delta {
            .operation = Delta_Operation::remove,
            .kind = Entity_Kind::relationship,
            .record = *primary,
            .timestamp = clock.now_ms(),
        }
    );
}

} // namespace parley
