/**
 * @file TestActionQueue.cpp
 * @brief Unit tests for pxv::sim::ActionQueue.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/sim/ActionQueue.hpp>

#include <set>
#include <thread>
#include <vector>

namespace pxv::sim {

using world::EntityId;

TEST_CASE("ActionQueue drains in submission order", "[sim][queue]")
{
    ActionQueue queue;
    queue.submit(EntityId{3}, Action::makeHarvest());
    queue.submit(EntityId{1}, Action::makeCraft());
    queue.submit(EntityId{2}, Action::makeMove(1, 0));

    REQUIRE(queue.size() == 3);

    auto drained = queue.drainAll();
    REQUIRE(drained.size() == 3);
    REQUIRE(drained[0].agentId == EntityId{3});
    REQUIRE(drained[1].agentId == EntityId{1});
    REQUIRE(drained[2].agentId == EntityId{2});
    REQUIRE(drained[2].action.move.dx == 1);
    REQUIRE(queue.empty());
    REQUIRE(queue.drainAll().empty());
}

TEST_CASE("ActionQueue keeps only the last intent per agent", "[sim][queue]")
{
    ActionQueue queue;
    queue.submit(EntityId{1}, Action::makeMove(0, 1));
    queue.submit(EntityId{2}, Action::makeHarvest());
    queue.submit(EntityId{1}, Action::makeCraft());

    REQUIRE(queue.size() == 2);
    REQUIRE(queue.overwriteCount() == 1);

    auto drained = queue.drainAll();
    REQUIRE(drained.size() == 2);
    REQUIRE(drained[0].agentId == EntityId{2});
    REQUIRE(drained[1].agentId == EntityId{1});
    REQUIRE(drained[1].action.kind == ActionKind::kCraft);
}

TEST_CASE("ActionQueue stamps the current tick", "[sim][queue]")
{
    ActionQueue queue;
    queue.setCurrentTick(41);
    queue.submit(EntityId{1}, Action::makeHarvest());

    auto drained = queue.drainAll();
    REQUIRE(drained.size() == 1);
    REQUIRE(drained[0].submittedTick == 41);
}

TEST_CASE("ActionQueue accepts concurrent producers", "[sim][queue]")
{
    constexpr int kThreads = 8;
    constexpr int kSubmissionsPerThread = 500;

    ActionQueue queue;
    std::vector<std::thread> producers;
    for (int t = 0; t < kThreads; ++t)
    {
        producers.emplace_back([&queue, t] {
            const EntityId agent{static_cast<core::u32>(t + 1)};
            for (int i = 0; i < kSubmissionsPerThread; ++i)
            {
                queue.submit(agent, Action::makeMove(i, t));
            }
        });
    }
    for (auto &producer : producers)
    {
        producer.join();
    }

    auto drained = queue.drainAll();
    REQUIRE(drained.size() == kThreads);
    REQUIRE(queue.overwriteCount() == kThreads * (kSubmissionsPerThread - 1));

    std::set<core::u64> sequences;
    for (const auto &pending : drained)
    {
        REQUIRE(pending.action.move.dx == kSubmissionsPerThread - 1);
        REQUIRE(pending.action.move.dy == static_cast<core::i32>(pending.agentId.raw() - 1));
        sequences.insert(pending.sequence);
    }
    REQUIRE(sequences.size() == kThreads);
}

} // namespace pxv::sim
