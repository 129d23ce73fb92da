/**
 * @file ActionQueue.hpp
 * @brief Thread-safe per-tick intent buffer, one slot per agent.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SIM_ACTIONQUEUE_HPP
    #define PXV_SIM_ACTIONQUEUE_HPP

#include <pxv/sim/Action.hpp>
#include <pxv/world/EntityId.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/NonCopyable.hpp>

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace pxv::sim {

/**
 * @class ActionQueue
 * @brief Many-producer / single-consumer buffer between the connection
 *        handlers and the tick engine.
 *
 * Each agent owns one pending slot per tick. A later submission for the
 * same agent overwrites the earlier one and takes its place at the back
 * of the submission order; the overwritten intent leaves no trace.
 * The only lock is held for the slot write, so producers for different
 * agents wait on each other for at most that long.
 */
class ActionQueue final : public core::NonMovable<ActionQueue>
{
public:
    ActionQueue() = default;
    ~ActionQueue() = default;

    /**
     * @brief Stores @p action as the pending intent of @p agentId.
     *
     * Callable concurrently from any number of threads.
     */
    void submit(world::EntityId agentId, Action action);

    /**
     * @brief Atomically empties the queue.
     * @return Pending actions in submission order (oldest first).
     *
     * Tick engine only.
     */
    [[nodiscard]] std::vector<PendingAction> drainAll();

    /** @brief Tick number stamped on subsequent submissions. */
    void setCurrentTick(core::u64 tick) noexcept;

    /** @brief Returns @c true if no agent has a pending intent. */
    [[nodiscard]] bool empty() const noexcept;

    /** @brief Number of agents with a pending intent. */
    [[nodiscard]] core::u32 size() const noexcept;

    /** @brief Submissions that replaced a pending intent, since creation. */
    [[nodiscard]] core::u64 overwriteCount() const noexcept;

    /** @brief Discards every pending intent. */
    void clear();

private:
    mutable std::mutex                                   _mutex;
    std::unordered_map<world::EntityId, PendingAction>   _slots;
    core::u64                                            _nextSequence{0};
    core::u64                                            _overwrites{0};
    std::atomic<core::u64>                               _currentTick{0};
};

} // namespace pxv::sim

#endif // PXV_SIM_ACTIONQUEUE_HPP
