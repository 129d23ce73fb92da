/**
 * @file IOutboundChannel.hpp
 * @brief Abstract per-agent delivery path used by the publisher.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SESSION_IOUTBOUNDCHANNEL_HPP
    #define PXV_SESSION_IOUTBOUNDCHANNEL_HPP

#include <pxv/session/AgentUpdate.hpp>
#include <pxv/core/Expected.hpp>

namespace pxv::session {

/**
 * @class IOutboundChannel
 * @brief Where the registry hands an agent's update.
 *
 * deliver() is called from the tick engine thread and must not block on
 * the network; implementations buffer and let another thread do the I/O.
 */
class IOutboundChannel
{
public:
    virtual ~IOutboundChannel() = default;

    /**
     * @brief Hands @p update to the client side.
     * @return ChannelClosed or BufferOverflow when it could not be taken.
     */
    [[nodiscard]] virtual core::Expected<void> deliver(const AgentUpdate &update) = 0;

    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

    /** @brief Refuses further deliveries and wakes any waiting reader. */
    virtual void close() noexcept = 0;
};

} // namespace pxv::session

#endif // PXV_SESSION_IOUTBOUNDCHANNEL_HPP
