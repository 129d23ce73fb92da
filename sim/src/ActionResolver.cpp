/**
 * @file ActionResolver.cpp
 * @brief ActionResolver implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/sim/ActionResolver.hpp>
#include <pxv/core/Assert.hpp>
#include <pxv/core/Log.hpp>

#include <string>

namespace pxv::sim {

namespace {

constexpr std::string_view kTag = "Resolver";

} // anonymous namespace

ActionResolver::ActionResolver(world::World &world, const Config &config) noexcept
    : _world{world}
    , _config{config}
{}

ActionOutcome ActionResolver::resolve(const PendingAction &pending, core::u64 tick)
{
    ActionOutcome outcome;
    outcome.kind = pending.action.kind;
    outcome.name = pending.action.name;
    outcome.tick = tick;

    const world::EntityId agentId = pending.agentId;
    world::EntityId touched{};

    core::Expected<ActionStatus> status = [&]() -> core::Expected<ActionStatus> {
        auto entity = _world.store().get(agentId);
        if (!entity || !(*entity)->isAgent())
        {
            return core::makeError(core::ErrorCode::kNotFound,
                                   "agent " + agentId.toString() + " is not in the world");
        }

        switch (pending.action.kind)
        {
        case ActionKind::kMove:    return resolveMove(agentId, pending.action.move);
        case ActionKind::kHarvest: return resolveHarvest(agentId, touched);
        case ActionKind::kCraft:   return resolveCraft(agentId);
        case ActionKind::kUnknown: break;
        }
        return core::makeError(core::ErrorCode::kUnknownAction,
                               "unknown action '" + pending.action.name + "'");
    }();

    if (status)
    {
        outcome.status = *status;
    }
    else
    {
        outcome.status = ActionStatus::kRejected;
        outcome.error = status.error().code();
        core::Log::warn(kTag, "agent " + agentId.toString() + ": "
                              + std::string{core::toString(outcome.error)} + ": "
                              + status.error().message());
    }

    verifyTouched(agentId, touched);
    return outcome;
}

core::Expected<ActionStatus> ActionResolver::resolveMove(world::EntityId agentId, MoveParams params)
{
    const world::Entity *agent = PXV_TRY(_world.store().get(agentId));

    if (params.dx == 0 && params.dy == 0)
    {
        return ActionStatus::kNoOp;
    }

    const core::i64 tx = static_cast<core::i64>(agent->position.x) + params.dx;
    const core::i64 ty = static_cast<core::i64>(agent->position.y) + params.dy;
    if (tx < 0 || ty < 0 || tx >= _world.width() || ty >= _world.height())
    {
        core::Log::debug(kTag, "agent " + agentId.toString() + ": move out of bounds ignored");
        return ActionStatus::kNoOp;
    }

    PXV_TRY_VOID(_world.moveEntity(agentId, {static_cast<core::i32>(tx), static_cast<core::i32>(ty)}));
    return ActionStatus::kApplied;
}

core::Expected<ActionStatus> ActionResolver::resolveHarvest(world::EntityId agentId,
                                                            world::EntityId &touched)
{
    const world::Entity *agent = PXV_TRY(_world.store().get(agentId));

    const auto resourceId = _world.firstResourceAt(agent->position);
    if (!resourceId)
    {
        core::Log::debug(kTag, "agent " + agentId.toString() + ": nothing to harvest");
        return ActionStatus::kNoOp;
    }

    touched = *resourceId;
    const world::HarvestResult result = PXV_TRY(_world.harvest(agentId, *resourceId, _config.harvestAmount()));
    if (result.depleted)
    {
        core::Log::debug(kTag, "resource " + resourceId->toString() + " depleted");
    }
    return result.taken > 0 ? ActionStatus::kApplied : ActionStatus::kNoOp;
}

core::Expected<ActionStatus> ActionResolver::resolveCraft(world::EntityId agentId)
{
    auto crafted = _world.craft(agentId,
                                {{world::ItemKind::kOre,  _config.craftOreCost()},
                                 {world::ItemKind::kFuel, _config.craftFuelCost()}},
                                {world::ItemKind::kComponents, 1});
    if (!crafted)
    {
        if (crafted.error().code() == core::ErrorCode::kInsufficientResource)
        {
            core::Log::debug(kTag, "agent " + agentId.toString() + ": not enough stock to craft");
            return ActionStatus::kNoOp;
        }
        if (crafted.error().code() == core::ErrorCode::kInvalidArgument)
        {
            core::Log::debug(kTag, "agent " + agentId.toString() + ": " + crafted.error().message());
            return ActionStatus::kNoOp;
        }
        return std::unexpected(std::move(crafted.error()));
    }
    return ActionStatus::kApplied;
}

void ActionResolver::verifyTouched(world::EntityId agentId, world::EntityId other) const
{
    if (auto agent = _world.verifyEntity(agentId); !agent)
    {
        core::fatalInvariant(agent.error());
    }
    if (other.isValid())
    {
        if (auto resource = _world.verifyEntity(other); !resource)
        {
            core::fatalInvariant(resource.error());
        }
    }
}

} // namespace pxv::sim
