/**
 * @file Envelope.hpp
 * @brief JSON wire envelopes exchanged with agent clients.
 *
 * Client to server: {"action": <name>, "params": {...}}.
 * Server to client: connection_established, action_confirmed, game_state
 * and error messages, one JSON object per line.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_NET_PROTOCOL_ENVELOPE_HPP
    #define PXV_NET_PROTOCOL_ENVELOPE_HPP

#include <pxv/session/AgentUpdate.hpp>
#include <pxv/sim/Action.hpp>
#include <pxv/world/EntityId.hpp>
#include <pxv/core/Expected.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace pxv::net::protocol {

/** @brief Greeting sent once the agent is admitted. */
inline constexpr std::string_view kWelcomeMessage = "Connected to Proxiverse server";

/**
 * @brief Parses one client command.
 *
 * Unrecognised action names decode successfully as ActionKind::kUnknown;
 * the tick engine rejects them.
 *
 * @return ProtocolViolation with a client-facing message for malformed input.
 */
[[nodiscard]] core::Expected<sim::Action> decodeCommand(std::string_view text);

/** @brief {"type":"connection_established","agent_id":...,"message":...} */
[[nodiscard]] std::string encodeWelcome(world::EntityId agentId);

/** @brief {"type":"error","message":...} */
[[nodiscard]] std::string encodeError(std::string_view message);

/**
 * @brief Reply to a resolved action: action_confirmed, or an error for an
 *        action name the server does not know.
 */
[[nodiscard]] std::string encodeActionResult(const sim::ActionOutcome &outcome);

/** @brief {"type":"game_state","tick":...,"agent_state":{...},"world_info":{...}} */
[[nodiscard]] std::string encodeGameState(const session::AgentUpdate &update);

/**
 * @brief Every message one update produces, in send order: the action
 *        result first (if the agent acted this tick), then game_state.
 */
[[nodiscard]] std::vector<std::string> encodeUpdate(const session::AgentUpdate &update);

} // namespace pxv::net::protocol

#endif // PXV_NET_PROTOCOL_ENVELOPE_HPP
