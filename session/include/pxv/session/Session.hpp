/**
 * @file Session.hpp
 * @brief One connected client bound to one agent.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SESSION_SESSION_HPP
    #define PXV_SESSION_SESSION_HPP

#include <pxv/session/IOutboundChannel.hpp>
#include <pxv/world/EntityId.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/NonCopyable.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pxv::session {

/**
 * @enum SessionState
 * @brief Lifecycle of a session.
 */
enum class SessionState : core::u8
{
    kPending,       ///< Registered; its agent spawns at the next Draining.
    kConnected,     ///< Agent is in the world and receives updates.
    kDisconnected   ///< Awaiting eviction of its agent.
};

[[nodiscard]] std::string_view toString(SessionState state) noexcept;

/**
 * @class Session
 * @brief Per-client state: agent binding, outbound channel, activity.
 *
 * Owned by SessionRegistry, which serialises every access.
 */
class Session final : public core::NonCopyable<Session>
{
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    Session(world::EntityId agentId, std::string name, std::shared_ptr<IOutboundChannel> channel);
    ~Session();

    [[nodiscard]] world::EntityId agentId() const noexcept { return _agentId; }
    [[nodiscard]] const std::string &name() const noexcept { return _name; }

    [[nodiscard]] SessionState state() const noexcept { return _state; }
    void setState(SessionState newState) noexcept;

    [[nodiscard]] const std::shared_ptr<IOutboundChannel> &channel() const noexcept { return _channel; }

    /** @brief @c true once the agent was placed in the world. */
    [[nodiscard]] bool spawned() const noexcept { return _spawned; }
    void markSpawned() noexcept { _spawned = true; }

    /**
     * @brief Moves to kDisconnected and closes the channel.
     * @param reason Logged by the registry.
     */
    void disconnect(std::string reason);

    [[nodiscard]] const std::string &disconnectReason() const noexcept { return _reason; }

    /** @brief Tick at which eviction noticed the disconnect. */
    [[nodiscard]] std::optional<core::u64> disconnectedAtTick() const noexcept { return _disconnectedAt; }
    void setDisconnectedAtTick(core::u64 tick) noexcept { _disconnectedAt = tick; }

    [[nodiscard]] TimePoint lastActivity() const noexcept { return _lastActivity; }

    /** @brief Marks activity (message received). */
    void touch(TimePoint now = Clock::now()) noexcept { _lastActivity = now; }

    [[nodiscard]] core::u64 deliveredCount() const noexcept { return _delivered; }
    void countDelivery() noexcept { ++_delivered; }

private:
    world::EntityId                     _agentId;
    std::string                         _name;
    std::shared_ptr<IOutboundChannel>   _channel;
    SessionState                        _state{SessionState::kPending};
    bool                                _spawned{false};
    std::string                         _reason;
    std::optional<core::u64>            _disconnectedAt;
    TimePoint                           _lastActivity;
    core::u64                           _delivered{0};
};

} // namespace pxv::session

#endif // PXV_SESSION_SESSION_HPP
