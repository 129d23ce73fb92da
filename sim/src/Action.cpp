/**
 * @file Action.cpp
 * @brief Action factories and name mapping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/sim/Action.hpp>

namespace pxv::sim {

std::string_view toString(ActionKind kind) noexcept
{
    switch (kind)
    {
    case ActionKind::kMove:    return "move";
    case ActionKind::kHarvest: return "harvest";
    case ActionKind::kCraft:   return "craft";
    case ActionKind::kUnknown: break;
    }
    return "unknown";
}

ActionKind parseActionKind(std::string_view name) noexcept
{
    if (name == "move")    return ActionKind::kMove;
    if (name == "harvest") return ActionKind::kHarvest;
    if (name == "craft")   return ActionKind::kCraft;
    return ActionKind::kUnknown;
}

std::string_view toString(ActionStatus status) noexcept
{
    switch (status)
    {
    case ActionStatus::kApplied:  return "applied";
    case ActionStatus::kNoOp:     return "no-op";
    case ActionStatus::kRejected: return "rejected";
    }
    return "unknown";
}

Action Action::makeMove(core::i32 dx, core::i32 dy)
{
    return Action{ActionKind::kMove, MoveParams{dx, dy}, std::string{toString(ActionKind::kMove)}};
}

Action Action::makeHarvest()
{
    return Action{ActionKind::kHarvest, {}, std::string{toString(ActionKind::kHarvest)}};
}

Action Action::makeCraft()
{
    return Action{ActionKind::kCraft, {}, std::string{toString(ActionKind::kCraft)}};
}

Action Action::makeUnknown(std::string name)
{
    return Action{ActionKind::kUnknown, {}, std::move(name)};
}

} // namespace pxv::sim
