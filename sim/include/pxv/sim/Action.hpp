/**
 * @file Action.hpp
 * @brief Agent intents, their queued form and their resolved outcome.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SIM_ACTION_HPP
    #define PXV_SIM_ACTION_HPP

#include <pxv/world/EntityId.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/Error.hpp>

#include <string>
#include <string_view>

namespace pxv::sim {

/**
 * @enum ActionKind
 * @brief Recognised intents. kUnknown carries any other name so that the
 *        tick engine, not the transport, decides to reject it.
 */
enum class ActionKind : core::u8
{
    kMove,
    kHarvest,
    kCraft,
    kUnknown
};

/** @brief Wire name ("move", "harvest", "craft", "unknown"). */
[[nodiscard]] std::string_view toString(ActionKind kind) noexcept;

/** @brief Maps a wire name to its kind; anything unrecognised is kUnknown. */
[[nodiscard]] ActionKind parseActionKind(std::string_view name) noexcept;

/**
 * @struct MoveParams
 * @brief Relative displacement. Magnitude is not limited; only the
 *        resulting cell is bounds-checked.
 */
struct MoveParams
{
    core::i32 dx{0};
    core::i32 dy{0};
};

/**
 * @struct Action
 * @brief One intent as submitted by a client.
 */
struct Action
{
    ActionKind  kind{ActionKind::kUnknown};
    MoveParams  move{};
    std::string name;

    [[nodiscard]] static Action makeMove(core::i32 dx, core::i32 dy);
    [[nodiscard]] static Action makeHarvest();
    [[nodiscard]] static Action makeCraft();
    [[nodiscard]] static Action makeUnknown(std::string name);
};

/**
 * @struct PendingAction
 * @brief Queue slot: {agent, action, tick at submission, submission order}.
 */
struct PendingAction
{
    world::EntityId agentId{};
    Action          action{};
    core::u64       submittedTick{0};
    core::u64       sequence{0};
};

/**
 * @enum ActionStatus
 * @brief How resolution ended for one action.
 */
enum class ActionStatus : core::u8
{
    kApplied,   ///< World state changed as requested.
    kNoOp,      ///< Tolerated: nothing to do (blocked move, empty cell, short stock).
    kRejected   ///< Contained error (unknown action, vanished agent).
};

[[nodiscard]] std::string_view toString(ActionStatus status) noexcept;

/**
 * @struct ActionOutcome
 * @brief Result recorded against the acting agent for one tick.
 */
struct ActionOutcome
{
    ActionKind      kind{ActionKind::kUnknown};
    std::string     name;
    ActionStatus    status{ActionStatus::kNoOp};
    core::ErrorCode error{core::ErrorCode::kNone};
    core::u64       tick{0};

    [[nodiscard]] bool succeeded() const noexcept { return status == ActionStatus::kApplied; }
};

} // namespace pxv::sim

#endif // PXV_SIM_ACTION_HPP
