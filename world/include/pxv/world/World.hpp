/**
 * @file World.hpp
 * @brief World Grid + Entity Store, mutated together as one transaction.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_WORLD_WORLD_HPP
    #define PXV_WORLD_WORLD_HPP

#include <pxv/world/Entity.hpp>
#include <pxv/world/EntityStore.hpp>
#include <pxv/world/WorldGrid.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>
#include <pxv/core/NonCopyable.hpp>

#include <initializer_list>
#include <optional>
#include <string>

namespace pxv::world {

/**
 * @struct HarvestResult
 * @brief What one harvest transfer moved.
 */
struct HarvestResult
{
    EntityId     resource{};
    ResourceType type{ResourceType::kOre};
    core::u32    taken{0};
    bool         depleted{false};
};

/**
 * @class World
 * @brief Single-owner aggregate of WorldGrid and EntityStore.
 *
 * Every mutating method either updates both structures or neither, so
 * that for every live entity the grid lists its id in exactly the cell
 * named by its stored position and nowhere else. Not thread-safe: the
 * tick engine is the only caller.
 */
class World final : public core::NonMovable<World>
{
public:
    World(core::i32 width, core::i32 height);

    [[nodiscard]] const WorldGrid &grid() const noexcept     { return _grid; }
    [[nodiscard]] const EntityStore &store() const noexcept  { return _store; }

    [[nodiscard]] core::i32 width() const noexcept  { return _grid.width(); }
    [[nodiscard]] core::i32 height() const noexcept { return _grid.height(); }

    /** @brief Adds a new entity at its stored position. */
    [[nodiscard]] core::Expected<void> spawn(Entity entity);

    [[nodiscard]] core::Expected<void> spawnAgent(EntityId id, std::string name, Position pos);
    [[nodiscard]] core::Expected<void> spawnResource(EntityId id, ResourceType type,
                                                     core::u32 quantity, Position pos);

    /** @brief Removes an entity from both grid and store. */
    [[nodiscard]] core::Expected<void> despawn(EntityId id);

    /**
     * @brief Moves an entity to @p target.
     * @return OutOfBounds (nothing changed) or NotFound.
     */
    [[nodiscard]] core::Expected<void> moveEntity(EntityId id, Position target);

    /** @brief First resource placed in cell @p pos, if any. */
    [[nodiscard]] std::optional<EntityId> firstResourceAt(Position pos) const;

    /**
     * @brief Takes up to @p amount from @p resourceId into @p agentId's
     *        inventory; removes the resource once it is empty.
     */
    [[nodiscard]] core::Expected<HarvestResult> harvest(EntityId agentId, EntityId resourceId,
                                                        core::u32 amount);

    /**
     * @brief Debits every cost and credits @p product, all or nothing.
     * @return InsufficientResource if the inventory cannot cover @p costs.
     */
    [[nodiscard]] core::Expected<void> craft(EntityId agentId,
                                             std::initializer_list<ItemCount> costs,
                                             ItemCount product);

    /**
     * @brief Cheap agreement check after touching @p id: its stored cell
     *        lists it, and the grid holds exactly one membership per
     *        stored entity (so nothing dangles after a removal).
     * @return InvariantViolation describing the disagreement.
     */
    [[nodiscard]] core::Expected<void> verifyEntity(EntityId id) const;

    /**
     * @brief Full scan: every grid membership names a stored entity at
     *        exactly that cell, and membership count equals store size.
     */
    [[nodiscard]] core::Expected<void> verifyConsistency() const;

private:
    friend struct WorldTestAccess;

    WorldGrid   _grid;
    EntityStore _store;
};

} // namespace pxv::world

#endif // PXV_WORLD_WORLD_HPP
