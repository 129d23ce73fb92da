/**
 * @file World.cpp
 * @brief World implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/world/World.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace pxv::world {

namespace {

[[nodiscard]] std::string describe(Position pos)
{
    return "(" + std::to_string(pos.x) + ", " + std::to_string(pos.y) + ")";
}

} // anonymous namespace

World::World(core::i32 width, core::i32 height)
    : _grid{width, height}
{}

core::Expected<void> World::spawn(Entity entity)
{
    if (!entity.id.isValid())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "spawn: null entity id");
    }
    if (_store.contains(entity.id))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "spawn: entity " + entity.id.toString() + " already exists");
    }

    PXV_TRY_VOID(_grid.place(entity.id, entity.position.x, entity.position.y));
    _store.upsert(std::move(entity));
    return {};
}

core::Expected<void> World::spawnAgent(EntityId id, std::string name, Position pos)
{
    return spawn(Entity::makeAgent(id, pos, std::move(name)));
}

core::Expected<void> World::spawnResource(EntityId id, ResourceType type,
                                          core::u32 quantity, Position pos)
{
    return spawn(Entity::makeResource(id, pos, type, quantity));
}

core::Expected<void> World::despawn(EntityId id)
{
    const Entity *entity = PXV_TRY(std::as_const(_store).get(id));
    PXV_TRY_VOID(_grid.remove(id, entity->position.x, entity->position.y));
    return _store.remove(id);
}

core::Expected<void> World::moveEntity(EntityId id, Position target)
{
    Entity *entity = PXV_TRY(_store.get(id));

    if (!_grid.isInBounds(target))
    {
        return core::makeError(core::ErrorCode::kOutOfBounds,
                               "move: target " + describe(target) + " is outside the grid");
    }
    if (target == entity->position)
    {
        return {};
    }

    const Position from = entity->position;
    PXV_TRY_VOID(_grid.remove(id, from.x, from.y));
    if (auto placed = _grid.place(id, target.x, target.y); !placed)
    {
        // Roll back so grid and store keep agreeing on the old cell.
        [[maybe_unused]] auto restored = _grid.place(id, from.x, from.y);
        return std::unexpected(std::move(placed.error()));
    }
    entity->position = target;
    return {};
}

std::optional<EntityId> World::firstResourceAt(Position pos) const
{
    for (EntityId id : _grid.occupantsAt(pos))
    {
        auto entity = _store.get(id);
        if (entity && (*entity)->isResource())
        {
            return id;
        }
    }
    return std::nullopt;
}

core::Expected<HarvestResult> World::harvest(EntityId agentId, EntityId resourceId,
                                             core::u32 amount)
{
    const Entity *agent = PXV_TRY(std::as_const(_store).get(agentId));
    const Entity *resource = PXV_TRY(std::as_const(_store).get(resourceId));

    if (!agent->isAgent() || !resource->isResource())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "harvest: expected an agent and a resource");
    }
    if (agent->position != resource->position)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "harvest: resource " + resourceId.toString()
                               + " is not co-located with agent " + agentId.toString());
    }

    HarvestResult result;
    result.resource = resourceId;
    result.type = resource->asResource().type;

    // Never draw more than the inventory can hold, so nothing is lost in transit.
    amount = std::min(amount, agent->asAgent().inventory.room(toItemKind(result.type)));
    if (amount == 0)
    {
        return result;
    }
    result.taken = PXV_TRY(_store.drawResource(resourceId, amount));
    PXV_TRY_VOID(_store.credit(agentId, toItemKind(result.type), result.taken));

    const Entity *after = PXV_TRY(std::as_const(_store).get(resourceId));
    if (after->asResource().quantity == 0)
    {
        PXV_TRY_VOID(despawn(resourceId));
        result.depleted = true;
    }
    return result;
}

core::Expected<void> World::craft(EntityId agentId,
                                  std::initializer_list<ItemCount> costs,
                                  ItemCount product)
{
    const Entity *agent = PXV_TRY(std::as_const(_store).get(agentId));
    if (agent->isAgent() && product.amount > agent->asAgent().inventory.room(product.kind))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "craft: no room for " + std::string{toString(product.kind)});
    }
    PXV_TRY_VOID(_store.debit(agentId, costs));
    return _store.credit(agentId, product.kind, product.amount);
}

core::Expected<void> World::verifyEntity(EntityId id) const
{
    if (_grid.membershipCount() != _store.size())
    {
        return core::makeError(core::ErrorCode::kInvariantViolation,
                               "grid holds " + std::to_string(_grid.membershipCount())
                               + " memberships for " + std::to_string(_store.size()) + " entities");
    }

    auto entity = _store.get(id);
    if (!entity)
    {
        return {};
    }

    const Position pos = (*entity)->position;
    if (!_grid.isInBounds(pos))
    {
        return core::makeError(core::ErrorCode::kInvariantViolation,
                               "entity " + id.toString() + " stored at out-of-bounds " + describe(pos));
    }
    if (!_grid.contains(id, pos.x, pos.y))
    {
        return core::makeError(core::ErrorCode::kInvariantViolation,
                               "entity " + id.toString() + " stored at " + describe(pos)
                               + " but missing from that grid cell");
    }
    return {};
}

core::Expected<void> World::verifyConsistency() const
{
    if (_grid.membershipCount() != _store.size())
    {
        return core::makeError(core::ErrorCode::kInvariantViolation,
                               "grid holds " + std::to_string(_grid.membershipCount())
                               + " memberships for " + std::to_string(_store.size()) + " entities");
    }

    for (core::i32 y = 0; y < _grid.height(); ++y)
    {
        for (core::i32 x = 0; x < _grid.width(); ++x)
        {
            for (EntityId id : _grid.occupantsAt(x, y))
            {
                auto entity = _store.get(id);
                if (!entity)
                {
                    return core::makeError(core::ErrorCode::kInvariantViolation,
                                           "grid lists unknown entity " + id.toString()
                                           + " at " + describe({x, y}));
                }
                if ((*entity)->position != Position{x, y})
                {
                    return core::makeError(core::ErrorCode::kInvariantViolation,
                                           "grid lists entity " + id.toString() + " at " + describe({x, y})
                                           + " but the store has it at " + describe((*entity)->position));
                }
            }
        }
    }
    return {};
}

} // namespace pxv::world
