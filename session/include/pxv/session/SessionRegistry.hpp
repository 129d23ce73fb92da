/**
 * @file SessionRegistry.hpp
 * @brief Agent id to session map, publisher fan-out and eviction policy.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SESSION_SESSIONREGISTRY_HPP
    #define PXV_SESSION_SESSIONREGISTRY_HPP

#include <pxv/session/Session.hpp>
#include <pxv/session/IOutboundChannel.hpp>
#include <pxv/sim/WorldSnapshot.hpp>
#include <pxv/world/EntityId.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>
#include <pxv/core/NonCopyable.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pxv::session {

/**
 * @struct Admission
 * @brief A registered agent waiting to be placed in the world.
 */
struct Admission
{
    world::EntityId agentId{};
    std::string     name;
};

/**
 * @struct BroadcastReport
 * @brief Result of fanning one snapshot out to every connected session.
 */
struct BroadcastReport
{
    core::u32 delivered{0};
    core::u32 failed{0};
    core::u32 skipped{0};   ///< Connected but absent from the snapshot.
};

/**
 * @class SessionRegistry
 * @brief Thread-safe session table shared by the connection layer and the
 *        tick engine.
 *
 * Connection handlers register, touch and unregister sessions from their
 * own threads. The tick engine takes admissions and evictions during
 * Draining and fans snapshots out during Publishing. Channels are copied
 * out under the lock and delivered to outside it, so a slow client never
 * holds the table. A delivery failure only affects the failing session:
 * it is logged, disconnected and later evicted.
 */
class SessionRegistry final : public core::NonMovable<SessionRegistry>
{
public:
    using Clock = Session::Clock;

    /**
     * @param disconnectGraceTicks Ticks a disconnected agent stays in the world.
     * @param idleTimeout          Inactivity that disconnects a session (0 disables).
     */
    SessionRegistry(core::u32 disconnectGraceTicks, std::chrono::milliseconds idleTimeout);
    ~SessionRegistry();

    /**
     * @brief Binds @p agentId to a new pending session.
     * @return AlreadyExists if the id already has a session,
     *         InvalidArgument for a null id or channel.
     */
    [[nodiscard]] core::Expected<void> registerAgent(world::EntityId agentId, std::string name,
                                                     std::shared_ptr<IOutboundChannel> channel);

    /**
     * @brief Marks the session disconnected. Its agent stays in the world
     *        until the grace period elapses.
     * @return NotFound if no session exists.
     */
    [[nodiscard]] core::Expected<void> unregisterAgent(world::EntityId agentId);

    /** @brief Refreshes the idle timer of @p agentId, if registered. */
    void touch(world::EntityId agentId);

    /**
     * @brief Pending sessions to spawn this tick; they become connected.
     *
     * Tick engine only.
     */
    [[nodiscard]] std::vector<Admission> takePendingAdmissions();

    /**
     * @brief Agents whose session is gone for good.
     *
     * Disconnects idle sessions, stamps newly noticed disconnects with
     * @p tick and removes every session whose grace period has elapsed.
     * Sessions whose agent never spawned are dropped without being
     * reported. Tick engine only.
     */
    [[nodiscard]] std::vector<world::EntityId> collectEvictions(core::u64 tick,
                                                                Clock::time_point now = Clock::now());

    /**
     * @brief Delivers each connected agent's slice of @p snapshot.
     *
     * Tick engine only.
     */
    BroadcastReport broadcast(const sim::WorldSnapshot &snapshot);

    [[nodiscard]] std::optional<SessionState> state(world::EntityId agentId) const;

    /** @brief Sessions in kConnected state. */
    [[nodiscard]] core::u32 activeCount() const;

    /** @brief Sessions in any state. */
    [[nodiscard]] core::u32 size() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pxv::session

#endif // PXV_SESSION_SESSIONREGISTRY_HPP
