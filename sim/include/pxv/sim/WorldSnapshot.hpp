/**
 * @file WorldSnapshot.hpp
 * @brief Immutable per-tick view of the world handed to the publisher.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SIM_WORLDSNAPSHOT_HPP
    #define PXV_SIM_WORLDSNAPSHOT_HPP

#include <pxv/sim/Action.hpp>
#include <pxv/world/World.hpp>
#include <pxv/world/Entity.hpp>
#include <pxv/world/Inventory.hpp>
#include <pxv/core/Types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pxv::sim {

/**
 * @struct WorldInfo
 * @brief Aggregate counters shared by every agent's update.
 */
struct WorldInfo
{
    core::i32   width{0};
    core::i32   height{0};
    core::usize totalAgents{0};
    core::usize totalResources{0};
    core::usize totalEntities{0};
};

/**
 * @struct AgentView
 * @brief One agent as seen at the end of a tick.
 */
struct AgentView
{
    world::EntityId              id{};
    std::string                  name;
    world::Position              position{};
    world::Inventory             inventory{};
    std::optional<ActionOutcome> lastAction;
};

using ActionOutcomes = std::unordered_map<world::EntityId, ActionOutcome>;

/**
 * @class WorldSnapshot
 * @brief Read-only copy of what clients may see after tick N.
 *
 * Built once by the tick engine at the end of Resolving and shared as a
 * @c shared_ptr<const WorldSnapshot>; nothing in it aliases live world
 * state, so readers on other threads never observe a half-applied tick.
 */
class WorldSnapshot final
{
public:
    /**
     * @brief Copies agent state out of @p world.
     * @param tick     Tick number the snapshot describes.
     * @param outcomes Actions resolved during that tick, keyed by agent.
     */
    [[nodiscard]] static std::shared_ptr<const WorldSnapshot> capture(const world::World &world,
                                                                      core::u64 tick,
                                                                      const ActionOutcomes &outcomes);

    [[nodiscard]] core::u64 tick() const noexcept                    { return _tick; }
    [[nodiscard]] const WorldInfo &info() const noexcept             { return _info; }

    /** @brief Agents sorted by id. */
    [[nodiscard]] const std::vector<AgentView> &agents() const noexcept { return _agents; }

    /** @brief Binary search by id; nullptr when absent. */
    [[nodiscard]] const AgentView *find(world::EntityId id) const noexcept;

private:
    WorldSnapshot() = default;

    core::u64              _tick{0};
    WorldInfo              _info{};
    std::vector<AgentView> _agents;
};

} // namespace pxv::sim

#endif // PXV_SIM_WORLDSNAPSHOT_HPP
