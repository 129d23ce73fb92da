/**
 * @file Session.cpp
 * @brief Session implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/session/Session.hpp>

namespace pxv::session {

std::string_view toString(SessionState state) noexcept
{
    switch (state)
    {
    case SessionState::kPending:      return "pending";
    case SessionState::kConnected:    return "connected";
    case SessionState::kDisconnected: return "disconnected";
    }
    return "?";
}

Session::Session(world::EntityId agentId, std::string name, std::shared_ptr<IOutboundChannel> channel)
    : _agentId{agentId}
    , _name{std::move(name)}
    , _channel{std::move(channel)}
    , _lastActivity{Clock::now()}
{}

Session::~Session() = default;

void Session::setState(SessionState newState) noexcept { _state = newState; }

void Session::disconnect(std::string reason)
{
    if (_state == SessionState::kDisconnected)
    {
        return;
    }
    _state = SessionState::kDisconnected;
    _reason = std::move(reason);
    if (_channel)
    {
        _channel->close();
    }
}

} // namespace pxv::session
