/**
 * @file SessionRegistry.cpp
 * @brief SessionRegistry implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/session/SessionRegistry.hpp>
#include <pxv/core/Log.hpp>

#include <algorithm>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace pxv::session {

namespace {

constexpr std::string_view kTag = "Sessions";

struct Target
{
    world::EntityId                   agentId;
    std::shared_ptr<IOutboundChannel> channel;
};

} // anonymous namespace

struct SessionRegistry::Impl
{
    core::u32                                                       graceTicks;
    std::chrono::milliseconds                                       idleTimeout;
    mutable std::mutex                                              mutex;
    std::unordered_map<world::EntityId, std::unique_ptr<Session>>   sessions;
};

SessionRegistry::SessionRegistry(core::u32 disconnectGraceTicks, std::chrono::milliseconds idleTimeout)
    : _impl{std::make_unique<Impl>()}
{
    _impl->graceTicks = disconnectGraceTicks;
    _impl->idleTimeout = idleTimeout;
}

SessionRegistry::~SessionRegistry() = default;

core::Expected<void> SessionRegistry::registerAgent(world::EntityId agentId, std::string name,
                                                    std::shared_ptr<IOutboundChannel> channel)
{
    if (!agentId.isValid() || !channel)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "registerAgent needs a valid agent id and channel");
    }

    std::lock_guard lock{_impl->mutex};
    if (_impl->sessions.contains(agentId))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "agent " + agentId.toString() + " already has a session");
    }

    _impl->sessions.emplace(agentId, std::make_unique<Session>(agentId, std::move(name), std::move(channel)));
    core::Log::info(kTag, "agent " + agentId.toString() + " registered");
    return {};
}

core::Expected<void> SessionRegistry::unregisterAgent(world::EntityId agentId)
{
    std::lock_guard lock{_impl->mutex};
    auto it = _impl->sessions.find(agentId);
    if (it == _impl->sessions.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "no session for agent " + agentId.toString());
    }

    it->second->disconnect("client disconnected");
    core::Log::info(kTag, "agent " + agentId.toString() + " disconnected");
    return {};
}

void SessionRegistry::touch(world::EntityId agentId)
{
    std::lock_guard lock{_impl->mutex};
    if (auto it = _impl->sessions.find(agentId); it != _impl->sessions.end())
    {
        it->second->touch();
    }
}

std::vector<Admission> SessionRegistry::takePendingAdmissions()
{
    std::vector<Admission> admissions;

    std::lock_guard lock{_impl->mutex};
    for (auto &[id, session] : _impl->sessions)
    {
        if (session->state() != SessionState::kPending)
        {
            continue;
        }
        session->setState(SessionState::kConnected);
        session->markSpawned();
        admissions.push_back({id, session->name()});
    }

    // Deterministic spawn order regardless of hash layout.
    std::sort(admissions.begin(), admissions.end(),
              [](const Admission &a, const Admission &b) { return a.agentId < b.agentId; });
    return admissions;
}

std::vector<world::EntityId> SessionRegistry::collectEvictions(core::u64 tick, Clock::time_point now)
{
    std::vector<world::EntityId> evicted;

    std::lock_guard lock{_impl->mutex};
    for (auto it = _impl->sessions.begin(); it != _impl->sessions.end(); )
    {
        Session &session = *it->second;

        if (session.state() == SessionState::kConnected && _impl->idleTimeout.count() > 0
            && now - session.lastActivity() > _impl->idleTimeout)
        {
            session.disconnect("idle timeout");
            core::Log::info(kTag, "agent " + session.agentId().toString() + " timed out");
        }

        if (session.state() != SessionState::kDisconnected)
        {
            ++it;
            continue;
        }

        if (!session.disconnectedAtTick())
        {
            session.setDisconnectedAtTick(tick);
        }

        if (tick < *session.disconnectedAtTick() + _impl->graceTicks)
        {
            ++it;
            continue;
        }

        if (session.spawned())
        {
            evicted.push_back(session.agentId());
        }
        core::Log::info(kTag, "agent " + session.agentId().toString() + " evicted ("
                              + session.disconnectReason() + ")");
        it = _impl->sessions.erase(it);
    }

    std::sort(evicted.begin(), evicted.end());
    return evicted;
}

BroadcastReport SessionRegistry::broadcast(const sim::WorldSnapshot &snapshot)
{
    std::vector<Target> targets;
    {
        std::lock_guard lock{_impl->mutex};
        targets.reserve(_impl->sessions.size());
        for (const auto &[id, session] : _impl->sessions)
        {
            if (session->state() == SessionState::kConnected)
            {
                targets.push_back({id, session->channel()});
            }
        }
    }

    BroadcastReport report;
    std::vector<world::EntityId> delivered;
    std::vector<std::pair<world::EntityId, core::Error>> failures;

    for (const Target &target : targets)
    {
        const sim::AgentView *view = snapshot.find(target.agentId);
        if (view == nullptr)
        {
            ++report.skipped;
            continue;
        }

        AgentUpdate update;
        update.tick = snapshot.tick();
        update.self = *view;
        update.world = snapshot.info();

        if (auto result = target.channel->deliver(update); !result)
        {
            ++report.failed;
            failures.emplace_back(target.agentId, std::move(result.error()));
            continue;
        }
        ++report.delivered;
        delivered.push_back(target.agentId);
    }

    std::lock_guard lock{_impl->mutex};
    for (world::EntityId agentId : delivered)
    {
        if (auto it = _impl->sessions.find(agentId); it != _impl->sessions.end())
        {
            it->second->countDelivery();
        }
    }
    for (auto &[agentId, error] : failures)
    {
        core::Log::warn(kTag, "delivery to agent " + agentId.toString() + " failed at tick "
                              + std::to_string(snapshot.tick()) + ": "
                              + std::string{core::toString(error.code())} + ": " + error.message());
        if (auto it = _impl->sessions.find(agentId); it != _impl->sessions.end())
        {
            it->second->disconnect("delivery failed");
        }
    }
    return report;
}

std::optional<SessionState> SessionRegistry::state(world::EntityId agentId) const
{
    std::lock_guard lock{_impl->mutex};
    if (auto it = _impl->sessions.find(agentId); it != _impl->sessions.end())
    {
        return it->second->state();
    }
    return std::nullopt;
}

core::u32 SessionRegistry::activeCount() const
{
    std::lock_guard lock{_impl->mutex};
    core::u32 count = 0;
    for (const auto &[id, session] : _impl->sessions)
    {
        if (session->state() == SessionState::kConnected)
        {
            ++count;
        }
    }
    return count;
}

core::u32 SessionRegistry::size() const
{
    std::lock_guard lock{_impl->mutex};
    return static_cast<core::u32>(_impl->sessions.size());
}

} // namespace pxv::session
