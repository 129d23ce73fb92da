/**
 * @file TickEngine.hpp
 * @brief Fixed-interval world scheduler: Idle, Draining, Resolving, Publishing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PXV_ENGINE_TICKENGINE_HPP
    #define PXV_ENGINE_TICKENGINE_HPP

#include <pxv/sim/Config.hpp>
#include <pxv/sim/ActionQueue.hpp>
#include <pxv/sim/WorldSnapshot.hpp>
#include <pxv/session/SessionRegistry.hpp>
#include <pxv/session/IOutboundChannel.hpp>
#include <pxv/world/World.hpp>
#include <pxv/world/EntityId.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>
#include <pxv/core/NonCopyable.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace pxv::engine {

/** @brief Where the engine currently is in its tick cycle. */
enum class TickPhase : core::u8
{
    kIdle,
    kDraining,
    kResolving,
    kPublishing,
    kStopped
};

[[nodiscard]] std::string_view toString(TickPhase phase) noexcept;

/**
 * @brief Sole owner and mutator of the world.
 *
 * One tick runs to completion without yielding; the only suspension
 * point is Idle, between ticks. Connection threads reach the engine only
 * through the ActionQueue (intents in), the SessionRegistry (updates out)
 * and admitAgent().
 */
class TickEngine final : public core::NonMovable<TickEngine>
{
public:
    /**
     * @param config   Immutable world configuration.
     * @param queue    Intent buffer filled by connection handlers.
     * @param sessions Session table used for admission, eviction and fan-out.
     */
    TickEngine(sim::Config config, sim::ActionQueue &queue, session::SessionRegistry &sessions);
    ~TickEngine();

    /**
     * @brief Validates the config and scatters the initial resources.
     * @return InvalidArgument for a bad config, InvalidState if called twice.
     */
    [[nodiscard]] core::Expected<void> init();

    /**
     * @brief Allocates an agent id and registers its session.
     *
     * Thread-safe. The agent is placed at the centre cell during the next
     * Draining phase and receives updates from that tick on.
     */
    [[nodiscard]] core::Expected<world::EntityId> admitAgent(std::string name,
                                                             std::shared_ptr<session::IOutboundChannel> channel);

    /**
     * @brief Runs one full tick (Draining, Resolving, Publishing).
     * @return The snapshot published for the new tick.
     *
     * Engine thread only; run() calls it once per tick interval.
     */
    [[nodiscard]] core::Expected<std::shared_ptr<const sim::WorldSnapshot>> step();

    /** @brief Runs ticks every Config::tickInterval() until requestStop(). */
    void run();

    /** @brief Wakes run() out of Idle and makes it return. Thread-safe. */
    void requestStop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] TickPhase phase() const noexcept;

    /** @brief Number of completed ticks (the last published tick number). */
    [[nodiscard]] core::u64 tick() const noexcept;

    /** @brief Live world. Engine thread only. */
    [[nodiscard]] const world::World &world() const noexcept;

    [[nodiscard]] const sim::Config &config() const noexcept;

    /** @brief Last published snapshot (null before the first tick). */
    [[nodiscard]] std::shared_ptr<const sim::WorldSnapshot> lastSnapshot() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pxv::engine

#endif // PXV_ENGINE_TICKENGINE_HPP
