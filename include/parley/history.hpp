#ifndef PARLEY_HISTORY_HPP
#define PARLEY_HISTORY_HPP

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include "parley/util/result.hpp"

#include "parley/delta.hpp"
#include "parley/entities.hpp"
#include "parley/fwd.hpp"
#include "parley/validation.hpp"

namespace parley {

/// @brief A delta of a log that could not be replayed.
struct Replay_Error {
    /// @brief The index of the rejected delta within the log.
    std::size_t index;
    Validation_Error error;
};

/// @brief Applies `log[0, position)` to `base`, in order.
/// The result depends only on its inputs; nothing is cached between calls.
[[nodiscard]]
Result<Entity_Set, Replay_Error>
replay(const Entity_Set& base, std::span<const Entity_Delta> log, std::size_t position);

/// @brief An entity collection together with the log cursor it corresponds to.
struct History_State {
    Entity_Set entities;
    std::size_t position;
};

/// @brief Moves the cursor back by one and replays the log up to it.
/// If `position` is zero, nothing is undone and the state at position zero is returned.
[[nodiscard]]
Result<History_State, Replay_Error>
undo(std::span<const Entity_Delta> log, std::size_t position, const Entity_Set& base = {});

/// @brief Moves the cursor forward by one and replays the log up to it.
/// If `position` is already at the end of the log, the cursor stays in place.
[[nodiscard]]
Result<History_State, Replay_Error>
redo(std::span<const Entity_Delta> log, std::size_t position, const Entity_Set& base = {});

/// @brief A linear undo history of entity deltas.
/// The state at any position is obtained by replaying the log from the base collection,
/// never by reverting deltas.
struct Entity_History {
private:
    Entity_Set m_base;
    std::vector<Entity_Delta> m_log;
    std::size_t m_position = 0;
    Entity_Set m_current;

public:
    [[nodiscard]]
    Entity_History() = default;

    [[nodiscard]]
    explicit Entity_History(Entity_Set base)
        : m_base { std::move(base) }
        , m_current { m_base }
    {
    }

    /// @brief Creates a history from a persisted log and cursor.
    /// The log is replayed up to `position`, which must succeed.
    [[nodiscard]]
    static Result<Entity_History, Replay_Error>
    restore(Entity_Set base, std::vector<Entity_Delta> log, std::size_t position);

    [[nodiscard]]
    const Entity_Set& get_base() const
    {
        return m_base;
    }

    [[nodiscard]]
    std::span<const Entity_Delta> get_log() const
    {
        return m_log;
    }

    [[nodiscard]]
    std::size_t get_position() const
    {
        return m_position;
    }

    /// @brief Returns the collection at the current position.
    [[nodiscard]]
    const Entity_Set& current() const
    {
        return m_current;
    }

    [[nodiscard]]
    bool can_undo() const
    {
        return m_position != 0;
    }

    [[nodiscard]]
    bool can_redo() const
    {
        return m_position != m_log.size();
    }

    /// @brief Validates and applies `delta` to the current collection.
    /// On success, any deltas after the current position are discarded first,
    /// and the delta is appended.
    [[nodiscard]]
    Result<void, Validation_Error> apply(const Entity_Delta& delta, const Document* document = nullptr);

    /// @brief Like `apply`, but for a delta that was already applied to `current()`.
    /// `applied.entities` shall be the result of applying `applied.delta` to `current()`.
    void record(Applied_Delta applied);

    /// @brief Moves one step back.
    /// @return `false` if there was nothing to undo.
    bool undo();

    /// @brief Moves one step forward.
    /// @return `false` if there was nothing to redo.
    bool redo();

    /// @brief Moves to an arbitrary position in `[0, size(log)]`.
    void go_to(std::size_t position);

private:
    void rebuild();
};

} // namespace parley

#endif
