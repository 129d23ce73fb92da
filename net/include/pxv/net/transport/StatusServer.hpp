/**
 * @file StatusServer.hpp
 * @brief Minimal HTTP listener serving the server status page.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_NET_TRANSPORT_STATUSSERVER_HPP
    #define PXV_NET_TRANSPORT_STATUSSERVER_HPP

#include <pxv/net/protocol/StatusPage.hpp>
#include <pxv/engine/TickEngine.hpp>
#include <pxv/session/SessionRegistry.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>
#include <pxv/core/NonCopyable.hpp>

#include <memory>

namespace pxv::net::transport {

/**
 * @class StatusServer
 * @brief Answers "GET /" with an HTML page and "GET /status" with JSON.
 *
 * Requests are handled one at a time on the thread running serve(); each
 * connection is closed after its response. Only read-only views of the
 * engine and the registry are used.
 */
class StatusServer final : public core::NonCopyable<StatusServer>
{
public:
    /**
     * @param port     TCP port to listen on (0 picks an ephemeral port).
     * @param engine   Source of the last published tick.
     * @param sessions Source of the connected-agent count.
     * @param gamePort Agent port advertised on the page.
     */
    StatusServer(core::u16 port, const engine::TickEngine &engine,
                 const session::SessionRegistry &sessions, core::u16 gamePort);
    ~StatusServer();

    [[nodiscard]] core::Expected<void> open();

    /** @brief Accept loop; returns shortly after requestStop(). */
    void serve();

    void requestStop() noexcept;

    /** @brief Closes the listener. Call once serve() has returned. */
    void close();

    [[nodiscard]] core::u16 port() const noexcept;

    /** @brief Current summary, as served at /status. */
    [[nodiscard]] protocol::ServerStatus collect() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pxv::net::transport

#endif // PXV_NET_TRANSPORT_STATUSSERVER_HPP
