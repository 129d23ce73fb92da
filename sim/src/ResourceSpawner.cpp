/**
 * @file ResourceSpawner.cpp
 * @brief ResourceSpawner implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/sim/ResourceSpawner.hpp>
#include <pxv/core/Log.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace pxv::sim {

namespace {

constexpr std::string_view kTag = "Spawner";

} // anonymous namespace

ResourceSpawner::ResourceSpawner(world::World &world, const Config &config, world::EntityIdAllocator &ids)
    : _world{world}
    , _config{config}
    , _ids{ids}
    , _rng{config.seed()}
{}

core::Expected<core::u32> ResourceSpawner::scatterInitial()
{
    const core::u32 placed = PXV_TRY(spawnUpTo(_config.initialResources()));
    core::Log::info(kTag, "scattered " + std::to_string(placed) + " initial resources");
    return placed;
}

core::Expected<core::u32> ResourceSpawner::onTick(core::u64 tick)
{
    const core::u32 interval = _config.respawnIntervalTicks();
    if (interval == 0 || tick == 0 || tick % interval != 0)
    {
        return 0u;
    }

    const core::usize live = _world.store().resourceCount();
    if (live >= _config.maxResources())
    {
        return 0u;
    }

    const core::u32 placed = PXV_TRY(spawnUpTo(_config.maxResources() - static_cast<core::u32>(live)));
    if (placed > 0)
    {
        core::Log::debug(kTag, "tick " + std::to_string(tick) + ": respawned " + std::to_string(placed));
    }
    return placed;
}

core::Expected<core::u32> ResourceSpawner::spawnUpTo(core::u32 count)
{
    std::vector<world::Position> cells = _world.grid().emptyCells();
    if (count == 0 || cells.empty())
    {
        return 0u;
    }

    std::uniform_int_distribution<int> typeDist{0, 1};
    std::uniform_int_distribution<core::u32> qtyDist{_config.resourceQuantityMin(),
                                                     _config.resourceQuantityMax()};

    // Partial Fisher-Yates: the first `target` cells end up distinct and uniformly chosen.
    const core::usize target = std::min<core::usize>(count, cells.size());
    for (core::usize i = 0; i < target; ++i)
    {
        std::uniform_int_distribution<core::usize> pick{i, cells.size() - 1};
        std::swap(cells[i], cells[pick(_rng)]);

        const auto type = typeDist(_rng) == 0 ? world::ResourceType::kOre : world::ResourceType::kFuel;
        const core::u32 quantity = qtyDist(_rng);
        PXV_TRY_VOID(_world.spawnResource(_ids.next(), type, quantity, cells[i]));
    }
    return static_cast<core::u32>(target);
}

} // namespace pxv::sim
