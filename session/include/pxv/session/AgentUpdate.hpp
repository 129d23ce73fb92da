/**
 * @file AgentUpdate.hpp
 * @brief Per-agent slice of a tick snapshot, as pushed to one client.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SESSION_AGENTUPDATE_HPP
    #define PXV_SESSION_AGENTUPDATE_HPP

#include <pxv/sim/WorldSnapshot.hpp>
#include <pxv/core/Types.hpp>

namespace pxv::session {

/**
 * @struct AgentUpdate
 * @brief What one agent learns after tick @c tick: its own state, the
 *        outcome of its action (if any) and the world counters.
 */
struct AgentUpdate
{
    core::u64       tick{0};
    sim::AgentView  self{};
    sim::WorldInfo  world{};
};

} // namespace pxv::session

#endif // PXV_SESSION_AGENTUPDATE_HPP
