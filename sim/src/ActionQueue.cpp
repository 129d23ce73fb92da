/**
 * @file ActionQueue.cpp
 * @brief ActionQueue implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/sim/ActionQueue.hpp>

#include <algorithm>

namespace pxv::sim {

void ActionQueue::submit(world::EntityId agentId, Action action)
{
    const core::u64 tick = _currentTick.load(std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock{_mutex};
    auto [it, inserted] = _slots.try_emplace(agentId);
    if (!inserted)
    {
        ++_overwrites;
    }
    it->second.agentId = agentId;
    it->second.action = std::move(action);
    it->second.submittedTick = tick;
    it->second.sequence = _nextSequence++;
}

std::vector<PendingAction> ActionQueue::drainAll()
{
    std::unordered_map<world::EntityId, PendingAction> taken;
    {
        std::lock_guard<std::mutex> lock{_mutex};
        taken.swap(_slots);
    }

    std::vector<PendingAction> ordered;
    ordered.reserve(taken.size());
    for (auto &[id, pending] : taken)
    {
        ordered.push_back(std::move(pending));
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const PendingAction &a, const PendingAction &b) {
                  return a.sequence < b.sequence;
              });
    return ordered;
}

void ActionQueue::setCurrentTick(core::u64 tick) noexcept
{
    _currentTick.store(tick, std::memory_order_relaxed);
}

bool ActionQueue::empty() const noexcept
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _slots.empty();
}

core::u32 ActionQueue::size() const noexcept
{
    std::lock_guard<std::mutex> lock{_mutex};
    return static_cast<core::u32>(_slots.size());
}

core::u64 ActionQueue::overwriteCount() const noexcept
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _overwrites;
}

void ActionQueue::clear()
{
    std::lock_guard<std::mutex> lock{_mutex};
    _slots.clear();
}

} // namespace pxv::sim
