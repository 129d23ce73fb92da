/**
 * @file WorldSnapshot.cpp
 * @brief WorldSnapshot implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/sim/WorldSnapshot.hpp>

#include <algorithm>

namespace pxv::sim {

std::shared_ptr<const WorldSnapshot> WorldSnapshot::capture(const world::World &world,
                                                            core::u64 tick,
                                                            const ActionOutcomes &outcomes)
{
    std::shared_ptr<WorldSnapshot> snapshot{new WorldSnapshot()};
    snapshot->_tick = tick;

    const world::EntityStore &store = world.store();
    snapshot->_info.width          = world.width();
    snapshot->_info.height         = world.height();
    snapshot->_info.totalAgents    = store.agentCount();
    snapshot->_info.totalResources = store.resourceCount();
    snapshot->_info.totalEntities  = store.size();

    snapshot->_agents.reserve(store.agentCount());
    store.forEach([&](const world::Entity &entity) {
        if (!entity.isAgent())
        {
            return;
        }
        const world::Agent &agent = entity.asAgent();

        AgentView view;
        view.id        = entity.id;
        view.name      = agent.name;
        view.position  = entity.position;
        view.inventory = agent.inventory;
        if (auto it = outcomes.find(entity.id); it != outcomes.end())
        {
            view.lastAction = it->second;
        }
        snapshot->_agents.push_back(std::move(view));
    });

    std::sort(snapshot->_agents.begin(), snapshot->_agents.end(),
              [](const AgentView &a, const AgentView &b) { return a.id < b.id; });
    return snapshot;
}

const AgentView *WorldSnapshot::find(world::EntityId id) const noexcept
{
    auto it = std::lower_bound(_agents.begin(), _agents.end(), id,
                               [](const AgentView &view, world::EntityId key) { return view.id < key; });
    if (it == _agents.end() || it->id != id)
    {
        return nullptr;
    }
    return &*it;
}

} // namespace pxv::sim
