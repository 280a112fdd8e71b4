#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/result.hpp"

#include "parley/delta.hpp"
#include "parley/entities.hpp"
#include "parley/history.hpp"
#include "parley/validation.hpp"

namespace parley {

Result<Entity_Set, Replay_Error>
replay(const Entity_Set& base, std::span<const Entity_Delta> log, std::size_t position)
{
    PARLEY_ASSERT(position <= log.size());
    Entity_Set result = base;
    for (std::size_t i = 0; i < position; ++i) {
        Result<Entity_Set, Validation_Error> next = apply_entity_delta(result, log[i]);
        if (!next) {
            return Replay_Error { i, std::move(next).error() };
        }
        result = std::move(*next);
    }
    return result;
}

Result<History_State, Replay_Error>
undo(std::span<const Entity_Delta> log, std::size_t position, const Entity_Set& base)
{
    PARLEY_ASSERT(position <= log.size());
    const std::size_t target = position == 0 ? 0 : position - 1;
    Result<Entity_Set, Replay_Error> entities = replay(base, log, target);
    if (!entities) {
        return std::move(entities).error();
    }
    return History_State { std::move(*entities), target };
}

Result<History_State, Replay_Error>
redo(std::span<const Entity_Delta> log, std::size_t position, const Entity_Set& base)
{
    PARLEY_ASSERT(position <= log.size());
    const std::size_t target = position == log.size() ? position : position + 1;
    Result<Entity_Set, Replay_Error> entities = replay(base, log, target);
    if (!entities) {
        return std::move(entities).error();
    }
    return History_State { std::move(*entities), target };
}

Result<Entity_History, Replay_Error>
Entity_History::restore(Entity_Set base, std::vector<Entity_Delta> log, std::size_t position)
{
    PARLEY_ASSERT(position <= log.size());
    // Every delta must be replayable, including those after the cursor,
    // so that a later redo cannot fail.
    Result<Entity_Set, Replay_Error> full = replay(base, log, log.size());
    if (!full) {
        return std::move(full).error();
    }
    Entity_History result { std::move(base) };
    result.m_log = std::move(log);
    result.m_position = position;
    result.rebuild();
    return result;
}

Result<void, Validation_Error> Entity_History::apply(const Entity_Delta& delta, const Document* document)
{
    Result<Entity_Set, Validation_Error> next = apply_entity_delta(m_current, delta, document);
    if (!next) {
        return std::move(next).error();
    }
    record({ .entities = std::move(*next), .delta = delta });
    return {};
}

void Entity_History::record(Applied_Delta applied)
{
    m_log.resize(m_position);
    m_log.push_back(std::move(applied.delta));
    m_position = m_log.size();
    m_current = std::move(applied.entities);
}

bool Entity_History::undo()
{
    if (!can_undo()) {
        return false;
    }
    --m_position;
    rebuild();
    return true;
}

bool Entity_History::redo()
{
    if (!can_redo()) {
        return false;
    }
    ++m_position;
    rebuild();
    return true;
}

void Entity_History::go_to(std::size_t position)
{
    PARLEY_ASSERT(position <= m_log.size());
    if (position != m_position) {
        m_position = position;
        rebuild();
    }
}

void Entity_History::rebuild()
{
    Result<Entity_Set, Replay_Error> entities = replay(m_base, m_log, m_position);
    // Every delta in the log was accepted when it was recorded,
    // and replay is deterministic, so it is accepted again.
    PARLEY_ASSERT(entities);
    m_current = std::move(*entities);
}

} // namespace parley
