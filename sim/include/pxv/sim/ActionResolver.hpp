/**
 * @file ActionResolver.hpp
 * @brief Applies one pending action to the world.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SIM_ACTIONRESOLVER_HPP
    #define PXV_SIM_ACTIONRESOLVER_HPP

#include <pxv/sim/Action.hpp>
#include <pxv/sim/Config.hpp>
#include <pxv/world/World.hpp>
#include <pxv/core/Expected.hpp>

namespace pxv::sim {

/**
 * @class ActionResolver
 * @brief Resolution rules for move / harvest / craft.
 *
 * Errors raised by one action are contained: they become a kRejected
 * outcome for that agent and are logged, never propagated. After each
 * action the entities it touched are checked for grid/store agreement;
 * a disagreement is a core bug and halts the process.
 *
 * Policies:
 *  - move: a target outside the grid leaves the agent where it is (no-op);
 *    agents and resources may share a cell.
 *  - harvest: takes up to harvestAmount from the earliest-placed resource
 *    in the agent's cell; a resource that reaches zero is removed. When two
 *    agents drain the same resource in one tick, the one resolved first
 *    takes the larger share.
 *  - craft: ORE >= oreCost and FUEL >= fuelCost yields one COMPONENTS,
 *    otherwise nothing is debited (no-op).
 */
class ActionResolver final
{
public:
    ActionResolver(world::World &world, const Config &config) noexcept;

    /**
     * @brief Resolves @p pending during tick @p tick.
     * @return Outcome recorded against the acting agent.
     */
    [[nodiscard]] ActionOutcome resolve(const PendingAction &pending, core::u64 tick);

private:
    [[nodiscard]] core::Expected<ActionStatus> resolveMove(world::EntityId agentId, MoveParams params);
    [[nodiscard]] core::Expected<ActionStatus> resolveHarvest(world::EntityId agentId,
                                                              world::EntityId &touched);
    [[nodiscard]] core::Expected<ActionStatus> resolveCraft(world::EntityId agentId);

    void verifyTouched(world::EntityId agentId, world::EntityId other) const;

    world::World &_world;
    const Config &_config;
};

} // namespace pxv::sim

#endif // PXV_SIM_ACTIONRESOLVER_HPP
