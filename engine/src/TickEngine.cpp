/**
 * @file TickEngine.cpp
 * @brief TickEngine implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/engine/TickEngine.hpp>
#include <pxv/sim/ActionResolver.hpp>
#include <pxv/sim/ResourceSpawner.hpp>
#include <pxv/core/Assert.hpp>
#include <pxv/core/Log.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace pxv::engine {

namespace {

constexpr std::string_view kTag = "TickEngine";

} // anonymous namespace

std::string_view toString(TickPhase phase) noexcept
{
    switch (phase)
    {
    case TickPhase::kIdle:       return "idle";
    case TickPhase::kDraining:   return "draining";
    case TickPhase::kResolving:  return "resolving";
    case TickPhase::kPublishing: return "publishing";
    case TickPhase::kStopped:    return "stopped";
    }
    return "?";
}

struct TickEngine::Impl
{
    sim::Config                              config;
    sim::ActionQueue                        &queue;
    session::SessionRegistry                &sessions;

    world::EntityIdAllocator                 ids;
    std::unique_ptr<world::World>            world;
    std::unique_ptr<sim::ActionResolver>     resolver;
    std::unique_ptr<sim::ResourceSpawner>    spawner;

    std::atomic<core::u64>                   tick{0};
    std::atomic<TickPhase>                   phase{TickPhase::kIdle};
    std::atomic<bool>                        running{false};

    std::mutex                               stopMutex;
    std::condition_variable                  stopCv;
    bool                                     stopRequested{false};

    mutable std::mutex                       snapshotMutex;
    std::shared_ptr<const sim::WorldSnapshot> lastSnapshot;

    Impl(sim::Config cfg, sim::ActionQueue &q, session::SessionRegistry &s)
        : config{std::move(cfg)}
        , queue{q}
        , sessions{s}
    {}

    void drain(core::u64 tickNumber, std::vector<sim::PendingAction> &pending);
    void resolve(core::u64 tickNumber, const std::vector<sim::PendingAction> &pending,
                 sim::ActionOutcomes &outcomes);
    void logStatus(core::u64 tickNumber) const;
};

void TickEngine::Impl::drain(core::u64 tickNumber, std::vector<sim::PendingAction> &pending)
{
    for (world::EntityId agentId : sessions.collectEvictions(tickNumber))
    {
        if (auto removed = world->despawn(agentId); !removed)
        {
            core::Log::warn(kTag, "evicting agent " + agentId.toString() + ": " + removed.error().message());
            continue;
        }
        core::Log::info(kTag, "agent " + agentId.toString() + " left the world");
    }

    const world::Position centre{world->width() / 2, world->height() / 2};
    for (session::Admission &admission : sessions.takePendingAdmissions())
    {
        if (auto spawned = world->spawnAgent(admission.agentId, admission.name, centre); !spawned)
        {
            core::Log::error(kTag, "spawning agent " + admission.agentId.toString() + ": "
                                   + spawned.error().message());
            if (auto dropped = sessions.unregisterAgent(admission.agentId); !dropped)
            {
                core::Log::warn(kTag, dropped.error().message());
            }
            continue;
        }
        core::Log::info(kTag, "agent " + admission.agentId.toString() + " (" + admission.name
                              + ") joined at (" + std::to_string(centre.x) + ", "
                              + std::to_string(centre.y) + ")");
    }

    pending = queue.drainAll();
}

void TickEngine::Impl::resolve(core::u64 tickNumber, const std::vector<sim::PendingAction> &pending,
                               sim::ActionOutcomes &outcomes)
{
    for (const sim::PendingAction &action : pending)
    {
        outcomes.insert_or_assign(action.agentId, resolver->resolve(action, tickNumber));
    }
}

void TickEngine::Impl::logStatus(core::u64 tickNumber) const
{
    const world::EntityStore &store = world->store();
    core::Log::info(kTag, "tick " + std::to_string(tickNumber)
                          + ": sessions=" + std::to_string(sessions.activeCount())
                          + " agents=" + std::to_string(store.agentCount())
                          + " resources=" + std::to_string(store.resourceCount())
                          + " overwrites=" + std::to_string(queue.overwriteCount()));
}

TickEngine::TickEngine(sim::Config config, sim::ActionQueue &queue, session::SessionRegistry &sessions)
    : _impl{std::make_unique<Impl>(std::move(config), queue, sessions)}
{}

TickEngine::~TickEngine()
{
    requestStop();
}

core::Expected<void> TickEngine::init()
{
    if (_impl->world)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "tick engine already initialised");
    }
    PXV_TRY_VOID(_impl->config.validate());

    _impl->world = std::make_unique<world::World>(_impl->config.width(), _impl->config.height());
    _impl->resolver = std::make_unique<sim::ActionResolver>(*_impl->world, _impl->config);
    _impl->spawner = std::make_unique<sim::ResourceSpawner>(*_impl->world, _impl->config, _impl->ids);

    (void) PXV_TRY(_impl->spawner->scatterInitial());

    core::Log::info(kTag, "world " + std::to_string(_impl->config.width()) + "x"
                          + std::to_string(_impl->config.height()) + ", tick "
                          + std::to_string(_impl->config.tickInterval().count()) + " ms, seed "
                          + std::to_string(_impl->config.seed()));
    return {};
}

core::Expected<world::EntityId> TickEngine::admitAgent(std::string name,
                                                       std::shared_ptr<session::IOutboundChannel> channel)
{
    const world::EntityId id = _impl->ids.next();
    PXV_TRY_VOID(_impl->sessions.registerAgent(id, std::move(name), std::move(channel)));
    return id;
}

core::Expected<std::shared_ptr<const sim::WorldSnapshot>> TickEngine::step()
{
    if (!_impl->world)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "tick engine not initialised");
    }

    const core::u64 tickNumber = _impl->tick.load(std::memory_order_relaxed) + 1;

    _impl->phase.store(TickPhase::kDraining, std::memory_order_release);
    std::vector<sim::PendingAction> pending;
    _impl->drain(tickNumber, pending);

    _impl->phase.store(TickPhase::kResolving, std::memory_order_release);
    sim::ActionOutcomes outcomes;
    _impl->resolve(tickNumber, pending, outcomes);
    if (auto respawned = _impl->spawner->onTick(tickNumber); !respawned)
    {
        core::Log::error(kTag, "tick " + std::to_string(tickNumber) + ": respawn failed: "
                               + respawned.error().message());
    }

    _impl->phase.store(TickPhase::kPublishing, std::memory_order_release);
    auto snapshot = sim::WorldSnapshot::capture(*_impl->world, tickNumber, outcomes);
    const session::BroadcastReport report = _impl->sessions.broadcast(*snapshot);
    if (report.failed > 0)
    {
        core::Log::warn(kTag, "tick " + std::to_string(tickNumber) + ": "
                              + std::to_string(report.failed) + " deliveries failed");
    }
    {
        std::lock_guard lock{_impl->snapshotMutex};
        _impl->lastSnapshot = snapshot;
    }
    _impl->tick.store(tickNumber, std::memory_order_release);
    _impl->queue.setCurrentTick(tickNumber);

    const core::u32 interval = _impl->config.statusLogInterval();
    if (interval > 0 && tickNumber % interval == 0)
    {
        _impl->logStatus(tickNumber);
    }

    _impl->phase.store(TickPhase::kIdle, std::memory_order_release);
    return snapshot;
}

void TickEngine::run()
{
    if (!_impl->world)
    {
        core::Log::error(kTag, "run() called before init()");
        return;
    }

    using Clock = std::chrono::steady_clock;
    const auto interval = _impl->config.tickInterval();

    _impl->running.store(true, std::memory_order_release);
    core::Log::info(kTag, "running");

    auto next = Clock::now() + interval;
    while (true)
    {
        _impl->phase.store(TickPhase::kIdle, std::memory_order_release);
        {
            std::unique_lock lock{_impl->stopMutex};
            if (_impl->stopCv.wait_until(lock, next, [this] { return _impl->stopRequested; }))
            {
                break;
            }
        }

        if (auto result = step(); !result)
        {
            core::Log::error(kTag, "tick " + std::to_string(tick() + 1) + " failed: "
                                   + result.error().message());
        }

        next += interval;
        const auto now = Clock::now();
        if (next < now)
        {
            core::Log::warn(kTag, "tick " + std::to_string(tick()) + " overran its interval");
            next = now;
        }
    }

    _impl->phase.store(TickPhase::kStopped, std::memory_order_release);
    _impl->running.store(false, std::memory_order_release);
    core::Log::info(kTag, "stopped at tick " + std::to_string(tick()));
}

void TickEngine::requestStop() noexcept
{
    {
        std::lock_guard lock{_impl->stopMutex};
        _impl->stopRequested = true;
    }
    _impl->stopCv.notify_all();
}

bool TickEngine::isRunning() const noexcept
{
    return _impl->running.load(std::memory_order_acquire);
}

TickPhase TickEngine::phase() const noexcept
{
    return _impl->phase.load(std::memory_order_acquire);
}

core::u64 TickEngine::tick() const noexcept
{
    return _impl->tick.load(std::memory_order_acquire);
}

const world::World &TickEngine::world() const noexcept
{
    PXV_ASSERT(_impl->world);
    return *_impl->world;
}

const sim::Config &TickEngine::config() const noexcept
{
    return _impl->config;
}

std::shared_ptr<const sim::WorldSnapshot> TickEngine::lastSnapshot() const
{
    std::lock_guard lock{_impl->snapshotMutex};
    return _impl->lastSnapshot;
}

} // namespace pxv::engine
