/**
 * @file TestActionResolver.cpp
 * @brief Resolution rules for move, harvest and craft.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/sim/ActionResolver.hpp>

namespace pxv::sim {

using world::EntityId;
using world::ItemKind;
using world::Position;
using world::ResourceType;

namespace {

PendingAction pending(EntityId agent, Action action)
{
    PendingAction slot;
    slot.agentId = agent;
    slot.action = std::move(action);
    return slot;
}

const world::Entity &lookup(const world::World &world, EntityId id)
{
    return *world.store().get(id).value();
}

core::u32 stock(const world::World &world, EntityId agent, ItemKind kind)
{
    return lookup(world, agent).asAgent().inventory.count(kind);
}

} // anonymous namespace

TEST_CASE("Move applies a relative displacement", "[sim][resolver][move]")
{
    const Config config = Config::Builder{}.width(20).height(20).build();
    world::World world{20, 20};
    ActionResolver resolver{world, config};

    const EntityId agent{1};

    SECTION("inside the grid the agent moves")
    {
        REQUIRE(world.spawnAgent(agent, "a", {5, 5}).has_value());
        auto outcome = resolver.resolve(pending(agent, Action::makeMove(1, 0)), 1);
        REQUIRE(outcome.status == ActionStatus::kApplied);
        REQUIRE(lookup(world, agent).position == Position{6, 5});
        REQUIRE(world.grid().contains(agent, 6, 5));
        REQUIRE(world.grid().occupantsAt(5, 5).empty());
    }

    SECTION("a target past the edge is a no-op")
    {
        REQUIRE(world.spawnAgent(agent, "a", {19, 5}).has_value());
        auto outcome = resolver.resolve(pending(agent, Action::makeMove(1, 0)), 1);
        REQUIRE(outcome.status == ActionStatus::kNoOp);
        REQUIRE(outcome.error == core::ErrorCode::kNone);
        REQUIRE(lookup(world, agent).position == Position{19, 5});
    }

    SECTION("large displacements are only bounds-checked")
    {
        REQUIRE(world.spawnAgent(agent, "a", {0, 0}).has_value());
        REQUIRE(resolver.resolve(pending(agent, Action::makeMove(7, 12)), 1).succeeded());
        REQUIRE(lookup(world, agent).position == Position{7, 12});
        REQUIRE(resolver.resolve(pending(agent, Action::makeMove(-8, 0)), 2).status == ActionStatus::kNoOp);
    }

    SECTION("agents and resources may share a cell")
    {
        REQUIRE(world.spawnAgent(agent, "a", {2, 2}).has_value());
        REQUIRE(world.spawnAgent(EntityId{2}, "b", {3, 2}).has_value());
        REQUIRE(world.spawnResource(EntityId{3}, ResourceType::kOre, 5, {3, 2}).has_value());
        REQUIRE(resolver.resolve(pending(agent, Action::makeMove(1, 0)), 1).succeeded());
        REQUIRE(world.grid().occupantsAt(3, 2).size() == 3);
    }

    REQUIRE(world.verifyConsistency().has_value());
}

TEST_CASE("Repeated harvests remove the resource exactly at depletion", "[sim][resolver][harvest]")
{
    const Config config = Config::Builder{}.harvestAmount(4).build();
    world::World world{20, 20};
    ActionResolver resolver{world, config};

    const EntityId agent{1};
    const EntityId fuel{2};
    REQUIRE(world.spawnAgent(agent, "a", {4, 4}).has_value());
    REQUIRE(world.spawnResource(fuel, ResourceType::kFuel, 10, {4, 4}).has_value());

    core::u64 tick = 1;
    REQUIRE(resolver.resolve(pending(agent, Action::makeHarvest()), tick++).succeeded());
    REQUIRE(resolver.resolve(pending(agent, Action::makeHarvest()), tick++).succeeded());
    REQUIRE(world.store().contains(fuel));
    REQUIRE(lookup(world, fuel).asResource().quantity == 2);

    REQUIRE(resolver.resolve(pending(agent, Action::makeHarvest()), tick++).succeeded());
    REQUIRE_FALSE(world.store().contains(fuel));
    REQUIRE(world.grid().occupantsAt(4, 4).size() == 1);
    REQUIRE(stock(world, agent, ItemKind::kFuel) == 10);

    auto empty = resolver.resolve(pending(agent, Action::makeHarvest()), tick++);
    REQUIRE(empty.status == ActionStatus::kNoOp);
    REQUIRE(stock(world, agent, ItemKind::kFuel) == 10);
    REQUIRE(world.verifyConsistency().has_value());
}

TEST_CASE("Contested harvest favours drain order", "[sim][resolver][harvest]")
{
    const Config config = Config::Builder{}.harvestAmount(2).build();
    world::World world{20, 20};
    ActionResolver resolver{world, config};

    const EntityId first{1};
    const EntityId second{2};
    const EntityId ore{3};
    REQUIRE(world.spawnAgent(first, "a", {7, 7}).has_value());
    REQUIRE(world.spawnAgent(second, "b", {7, 7}).has_value());
    REQUIRE(world.spawnResource(ore, ResourceType::kOre, 3, {7, 7}).has_value());

    REQUIRE(resolver.resolve(pending(first, Action::makeHarvest()), 1).succeeded());
    REQUIRE(stock(world, first, ItemKind::kOre) == 2);
    REQUIRE(lookup(world, ore).asResource().quantity == 1);

    REQUIRE(resolver.resolve(pending(second, Action::makeHarvest()), 1).succeeded());
    REQUIRE(stock(world, second, ItemKind::kOre) == 1);
    REQUIRE_FALSE(world.store().contains(ore));
    REQUIRE(world.verifyConsistency().has_value());
}

TEST_CASE("Harvest takes from the earliest-placed resource", "[sim][resolver][harvest]")
{
    const Config config = Config::Builder{}.harvestAmount(1).build();
    world::World world{20, 20};
    ActionResolver resolver{world, config};

    const EntityId agent{1};
    REQUIRE(world.spawnResource(EntityId{2}, ResourceType::kFuel, 5, {0, 0}).has_value());
    REQUIRE(world.spawnResource(EntityId{3}, ResourceType::kOre, 5, {0, 0}).has_value());
    REQUIRE(world.spawnAgent(agent, "a", {0, 0}).has_value());

    REQUIRE(resolver.resolve(pending(agent, Action::makeHarvest()), 1).succeeded());
    REQUIRE(stock(world, agent, ItemKind::kFuel) == 1);
    REQUIRE(stock(world, agent, ItemKind::kOre) == 0);
}

TEST_CASE("Craft needs the full recipe", "[sim][resolver][craft]")
{
    const Config config = Config::Builder{}.craftCost(3, 2).build();
    world::World world{20, 20};
    ActionResolver resolver{world, config};

    const EntityId agent{1};
    REQUIRE(world.spawnAgent(agent, "a", {0, 0}).has_value());
    REQUIRE(world.spawnResource(EntityId{2}, ResourceType::kOre, 2, {0, 0}).has_value());
    REQUIRE(world.spawnResource(EntityId{3}, ResourceType::kFuel, 2, {1, 0}).has_value());

    const Config gather = Config::Builder{}.harvestAmount(2).build();
    ActionResolver harvester{world, gather};
    REQUIRE(harvester.resolve(pending(agent, Action::makeHarvest()), 1).succeeded());
    REQUIRE(harvester.resolve(pending(agent, Action::makeMove(1, 0)), 1).succeeded());
    REQUIRE(harvester.resolve(pending(agent, Action::makeHarvest()), 1).succeeded());

    SECTION("one ore short is a no-op")
    {
        auto outcome = resolver.resolve(pending(agent, Action::makeCraft()), 2);
        REQUIRE(outcome.status == ActionStatus::kNoOp);
        REQUIRE(stock(world, agent, ItemKind::kOre) == 2);
        REQUIRE(stock(world, agent, ItemKind::kFuel) == 2);
        REQUIRE(stock(world, agent, ItemKind::kComponents) == 0);
    }

    SECTION("an exact recipe consumes everything")
    {
        const Config cheap = Config::Builder{}.craftCost(2, 2).build();
        ActionResolver crafter{world, cheap};
        REQUIRE(crafter.resolve(pending(agent, Action::makeCraft()), 2).succeeded());
        REQUIRE(stock(world, agent, ItemKind::kOre) == 0);
        REQUIRE(stock(world, agent, ItemKind::kFuel) == 0);
        REQUIRE(stock(world, agent, ItemKind::kComponents) == 1);
    }
}

TEST_CASE("Errors are contained in the outcome", "[sim][resolver]")
{
    const Config config = Config::Builder{}.build();
    world::World world{20, 20};
    ActionResolver resolver{world, config};
    REQUIRE(world.spawnAgent(EntityId{1}, "a", {0, 0}).has_value());

    SECTION("unknown action names are rejected")
    {
        auto outcome = resolver.resolve(pending(EntityId{1}, Action::makeUnknown("teleport")), 3);
        REQUIRE(outcome.status == ActionStatus::kRejected);
        REQUIRE(outcome.error == core::ErrorCode::kUnknownAction);
        REQUIRE(outcome.name == "teleport");
        REQUIRE(outcome.tick == 3);
    }

    SECTION("an agent that left the world is NotFound")
    {
        auto outcome = resolver.resolve(pending(EntityId{9}, Action::makeHarvest()), 3);
        REQUIRE(outcome.status == ActionStatus::kRejected);
        REQUIRE(outcome.error == core::ErrorCode::kNotFound);
    }

    REQUIRE(lookup(world, EntityId{1}).position == Position{0, 0});
}

} // namespace pxv::sim
