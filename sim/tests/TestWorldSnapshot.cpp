/**
 * @file TestWorldSnapshot.cpp
 * @brief Snapshot capture from a live world.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/sim/WorldSnapshot.hpp>

namespace pxv::sim {

using world::EntityId;

TEST_CASE("Snapshot copies agents and world counters", "[sim][snapshot]")
{
    world::World world{12, 8};
    REQUIRE(world.spawnAgent(EntityId{5}, "late", {1, 1}).has_value());
    REQUIRE(world.spawnAgent(EntityId{2}, "early", {3, 4}).has_value());
    REQUIRE(world.spawnResource(EntityId{9}, world::ResourceType::kOre, 10, {0, 0}).has_value());

    ActionOutcomes outcomes;
    ActionOutcome moved;
    moved.kind = ActionKind::kMove;
    moved.name = "move";
    moved.status = ActionStatus::kApplied;
    moved.tick = 7;
    outcomes.emplace(EntityId{2}, moved);

    auto snapshot = WorldSnapshot::capture(world, 7, outcomes);

    REQUIRE(snapshot->tick() == 7);
    REQUIRE(snapshot->info().width == 12);
    REQUIRE(snapshot->info().height == 8);
    REQUIRE(snapshot->info().totalAgents == 2);
    REQUIRE(snapshot->info().totalResources == 1);
    REQUIRE(snapshot->info().totalEntities == 3);

    REQUIRE(snapshot->agents().size() == 2);
    REQUIRE(snapshot->agents()[0].id == EntityId{2});
    REQUIRE(snapshot->agents()[1].id == EntityId{5});

    const AgentView *early = snapshot->find(EntityId{2});
    REQUIRE(early != nullptr);
    REQUIRE(early->name == "early");
    REQUIRE(early->position == world::Position{3, 4});
    REQUIRE(early->lastAction.has_value());
    REQUIRE(early->lastAction->succeeded());

    REQUIRE_FALSE(snapshot->find(EntityId{5})->lastAction.has_value());
    REQUIRE(snapshot->find(EntityId{9}) == nullptr);
}

TEST_CASE("Snapshot does not follow later world changes", "[sim][snapshot]")
{
    world::World world{4, 4};
    REQUIRE(world.spawnAgent(EntityId{1}, "a", {0, 0}).has_value());

    auto snapshot = WorldSnapshot::capture(world, 1, {});
    REQUIRE(world.moveEntity(EntityId{1}, {2, 2}).has_value());

    REQUIRE(snapshot->find(EntityId{1})->position == world::Position{0, 0});
}

} // namespace pxv::sim
