/**
 * @file TcpServer.hpp
 * @brief POSIX TCP listener speaking newline-delimited JSON envelopes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_NET_TRANSPORT_TCPSERVER_HPP
    #define PXV_NET_TRANSPORT_TCPSERVER_HPP

#include <pxv/engine/TickEngine.hpp>
#include <pxv/sim/ActionQueue.hpp>
#include <pxv/session/SessionRegistry.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>
#include <pxv/core/NonCopyable.hpp>

#include <memory>

namespace pxv::net::transport {

/**
 * @class TcpServer
 * @brief Accepts agent connections and bridges them to the core.
 *
 * Each connection gets one reader thread (decode, ActionQueue::submit)
 * and one writer thread (drain the agent's Mailbox, encode, send). The
 * tick engine never touches a socket. Dropping a connection unregisters
 * its session; the agent stays in the world until evicted.
 */
class TcpServer final : public core::NonCopyable<TcpServer>
{
public:
    /**
     * @param port            TCP port to listen on (0 picks an ephemeral port).
     * @param engine          Admits agents.
     * @param queue           Receives decoded intents.
     * @param sessions        Tracks activity and disconnects.
     * @param mailboxCapacity Outbound updates buffered per connection.
     */
    TcpServer(core::u16 port, engine::TickEngine &engine, sim::ActionQueue &queue,
              session::SessionRegistry &sessions, core::u32 mailboxCapacity);
    ~TcpServer();

    /** @brief Creates, binds and listens. */
    [[nodiscard]] core::Expected<void> open();

    /** @brief Accept loop; returns shortly after requestStop(). */
    void serve();

    /** @brief Makes serve() return. Thread-safe. */
    void requestStop() noexcept;

    /**
     * @brief Stops accepting, drops every connection and joins their threads.
     *
     * Call once serve() has returned (the destructor does it too).
     */
    void close();

    /** @brief Port actually bound (valid after open()). */
    [[nodiscard]] core::u16 port() const noexcept;

    /** @brief Live connections. */
    [[nodiscard]] core::u32 connectionCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pxv::net::transport

#endif // PXV_NET_TRANSPORT_TCPSERVER_HPP
