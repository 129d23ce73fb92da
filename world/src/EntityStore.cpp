/**
 * @file EntityStore.cpp
 * @brief EntityStore implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/world/EntityStore.hpp>

#include <algorithm>
#include <map>

namespace pxv::world {

struct EntityStore::Impl
{
    std::map<EntityId, Entity> entities;
    core::usize                agents{0};

    void track(const Entity &entity, int delta) noexcept
    {
        if (entity.isAgent())
        {
            agents = static_cast<core::usize>(static_cast<core::isize>(agents) + delta);
        }
    }

    [[nodiscard]] core::Expected<Agent *> agent(EntityId id)
    {
        auto it = entities.find(id);
        if (it == entities.end())
        {
            return core::makeError(core::ErrorCode::kNotFound,
                                   "agent " + id.toString() + " not found");
        }
        if (!it->second.isAgent())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "entity " + id.toString() + " is not an agent");
        }
        return &it->second.asAgent();
    }
};

EntityStore::EntityStore()
    : _impl{std::make_unique<Impl>()}
{}

EntityStore::~EntityStore() = default;

EntityStore::EntityStore(EntityStore &&) noexcept = default;
EntityStore &EntityStore::operator=(EntityStore &&) noexcept = default;

core::Expected<Entity *> EntityStore::get(EntityId id)
{
    auto it = _impl->entities.find(id);
    if (it == _impl->entities.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "entity " + id.toString() + " not found");
    }
    return &it->second;
}

core::Expected<const Entity *> EntityStore::get(EntityId id) const
{
    auto it = _impl->entities.find(id);
    if (it == _impl->entities.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "entity " + id.toString() + " not found");
    }
    return &it->second;
}

bool EntityStore::contains(EntityId id) const noexcept
{
    return _impl->entities.contains(id);
}

bool EntityStore::upsert(Entity entity)
{
    auto it = _impl->entities.find(entity.id);
    if (it != _impl->entities.end())
    {
        _impl->track(it->second, -1);
        _impl->track(entity, +1);
        it->second = std::move(entity);
        return false;
    }

    _impl->track(entity, +1);
    const auto id = entity.id;
    _impl->entities.emplace(id, std::move(entity));
    return true;
}

core::Expected<void> EntityStore::remove(EntityId id)
{
    auto it = _impl->entities.find(id);
    if (it == _impl->entities.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "entity " + id.toString() + " not found");
    }

    _impl->track(it->second, -1);
    _impl->entities.erase(it);
    return {};
}

core::Expected<void> EntityStore::credit(EntityId agentId, ItemKind kind, core::u32 amount)
{
    Agent *agent = PXV_TRY(_impl->agent(agentId));
    return agent->inventory.credit(kind, amount);
}

core::Expected<void> EntityStore::debit(EntityId agentId, std::initializer_list<ItemCount> costs)
{
    Agent *agent = PXV_TRY(_impl->agent(agentId));
    return agent->inventory.debit(costs);
}

core::Expected<core::u32> EntityStore::drawResource(EntityId resourceId, core::u32 amount)
{
    auto it = _impl->entities.find(resourceId);
    if (it == _impl->entities.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "resource " + resourceId.toString() + " not found");
    }
    if (!it->second.isResource())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "entity " + resourceId.toString() + " is not a resource");
    }

    auto &resource = it->second.asResource();
    const core::u32 taken = std::min(amount, resource.quantity);
    resource.quantity -= taken;
    return taken;
}

void EntityStore::forEach(const std::function<void(const Entity &)> &callback) const
{
    for (const auto &[id, entity] : _impl->entities)
    {
        callback(entity);
    }
}

std::vector<EntityId> EntityStore::agentIds() const
{
    std::vector<EntityId> ids;
    ids.reserve(_impl->agents);
    for (const auto &[id, entity] : _impl->entities)
    {
        if (entity.isAgent())
        {
            ids.push_back(id);
        }
    }
    return ids;
}

core::usize EntityStore::size() const noexcept
{
    return _impl->entities.size();
}

core::usize EntityStore::agentCount() const noexcept
{
    return _impl->agents;
}

core::usize EntityStore::resourceCount() const noexcept
{
    return _impl->entities.size() - _impl->agents;
}

} // namespace pxv::world
