/**
 * @file ResourceSpawner.hpp
 * @brief World events: initial scatter and periodic resource top-up.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SIM_RESOURCESPAWNER_HPP
    #define PXV_SIM_RESOURCESPAWNER_HPP

#include <pxv/sim/Config.hpp>
#include <pxv/world/World.hpp>
#include <pxv/world/EntityId.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>

#include <random>

namespace pxv::sim {

/**
 * @class ResourceSpawner
 * @brief Places new Resource entities into random empty cells.
 *
 * Draws from a Mersenne Twister seeded with Config::seed(), so a given
 * config and tick sequence always yields the same placements. Runs on
 * the tick engine thread only.
 */
class ResourceSpawner final
{
public:
    ResourceSpawner(world::World &world, const Config &config, world::EntityIdAllocator &ids);

    /**
     * @brief Scatters Config::initialResources() resources.
     * @return Number placed (fewer when the grid runs out of empty cells).
     */
    [[nodiscard]] core::Expected<core::u32> scatterInitial();

    /**
     * @brief Runs the respawn schedule for @p tick.
     *
     * On every tick that is a multiple of respawnIntervalTicks, tops the
     * world up to maxResources. A zero interval disables respawn.
     *
     * @return Number placed this tick.
     */
    [[nodiscard]] core::Expected<core::u32> onTick(core::u64 tick);

private:
    [[nodiscard]] core::Expected<core::u32> spawnUpTo(core::u32 count);

    world::World              &_world;
    const Config              &_config;
    world::EntityIdAllocator  &_ids;
    std::mt19937_64            _rng;
};

} // namespace pxv::sim

#endif // PXV_SIM_RESOURCESPAWNER_HPP
