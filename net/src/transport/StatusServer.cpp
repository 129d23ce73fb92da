/**
 * @file StatusServer.cpp
 * @brief POSIX HTTP status listener implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/net/transport/StatusServer.hpp>
#include <pxv/core/Constants.hpp>
#include <pxv/core/Log.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace pxv::net::transport {

namespace {

constexpr std::string_view kTag = "Status";
constexpr std::chrono::milliseconds kPollInterval{100};
constexpr std::chrono::seconds kRequestTimeout{1};

constexpr std::string_view kJson = "application/json";
constexpr std::string_view kHtml = "text/html; charset=utf-8";

[[nodiscard]] std::string errnoMessage(const char *what)
{
    return std::string{what} + " failed: " + std::strerror(errno);
}

/** @brief Reads until the end of the request head, the size cap, or the timeout. */
[[nodiscard]] core::Expected<std::string> readHead(int fd)
{
    std::string head;
    char chunk[1024];
    while (head.find("\r\n\r\n") == std::string::npos)
    {
        if (head.size() > core::kMaxHttpRequestLength)
        {
            return core::makeError(core::ErrorCode::kProtocolViolation, "request head too large");
        }
        const auto received = ::recv(fd, chunk, sizeof(chunk), 0);
        if (received == 0)
        {
            break;
        }
        if (received < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return core::makeError(core::ErrorCode::kIoError, errnoMessage("recv()"));
        }
        head.append(chunk, static_cast<std::size_t>(received));
    }
    return head;
}

void sendAll(int fd, const std::string &data)
{
    std::size_t offset = 0;
    while (offset < data.size())
    {
        const auto sent = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (sent < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            core::Log::debug(kTag, errnoMessage("send()"));
            return;
        }
        offset += static_cast<std::size_t>(sent);
    }
}

} // anonymous namespace

struct StatusServer::Impl
{
    core::u16                       port;
    const engine::TickEngine       &engine;
    const session::SessionRegistry &sessions;
    core::u16                       gamePort;

    int                             listenFd{-1};
    std::atomic<bool>               stopping{false};

    Impl(core::u16 p, const engine::TickEngine &e, const session::SessionRegistry &s, core::u16 game)
        : port{p}
        , engine{e}
        , sessions{s}
        , gamePort{game}
    {}

    void handle(int clientFd, const protocol::ServerStatus &status);
};

void StatusServer::Impl::handle(int clientFd, const protocol::ServerStatus &status)
{
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(kRequestTimeout.count());
    if (::setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
    {
        core::Log::warn(kTag, errnoMessage("setsockopt(SO_RCVTIMEO)"));
    }

    auto head = readHead(clientFd);
    if (!head)
    {
        core::Log::debug(kTag, head.error().message());
        sendAll(clientFd, protocol::makeHttpResponse(400, kJson, R"({"error":"bad request"})"));
        return;
    }

    auto request = protocol::parseRequestLine(*head);
    if (!request)
    {
        core::Log::debug(kTag, request.error().message());
        sendAll(clientFd, protocol::makeHttpResponse(400, kJson, R"({"error":"bad request"})"));
        return;
    }

    if (request->method != "GET")
    {
        sendAll(clientFd, protocol::makeHttpResponse(405, kJson, R"({"error":"method not allowed"})"));
        return;
    }

    if (request->path == "/")
    {
        sendAll(clientFd, protocol::makeHttpResponse(200, kHtml, protocol::renderStatusHtml(status)));
    }
    else if (request->path == "/status")
    {
        sendAll(clientFd, protocol::makeHttpResponse(200, kJson, protocol::encodeStatusJson(status)));
    }
    else
    {
        sendAll(clientFd, protocol::makeHttpResponse(404, kJson, R"({"error":"not found"})"));
    }
    core::Log::debug(kTag, request->method + " " + request->path);
}

StatusServer::StatusServer(core::u16 port, const engine::TickEngine &engine,
                           const session::SessionRegistry &sessions, core::u16 gamePort)
    : _impl{std::make_unique<Impl>(port, engine, sessions, gamePort)}
{}

StatusServer::~StatusServer()
{
    close();
}

core::Expected<void> StatusServer::open()
{
    if (_impl->listenFd >= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "status server already open");
    }

    _impl->listenFd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (_impl->listenFd < 0)
    {
        return core::makeError(core::ErrorCode::kIoError, errnoMessage("socket()"));
    }

    int reuse = 1;
    if (::setsockopt(_impl->listenFd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
    {
        core::Log::warn(kTag, errnoMessage("setsockopt(SO_REUSEADDR)"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_impl->port);
    addr.sin_addr.s_addr = INADDR_ANY;

    if (::bind(_impl->listenFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0
        || ::listen(_impl->listenFd, SOMAXCONN) < 0)
    {
        auto error = core::makeError(core::ErrorCode::kIoError, errnoMessage("bind()/listen()"));
        ::close(_impl->listenFd);
        _impl->listenFd = -1;
        return error;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(_impl->listenFd, reinterpret_cast<sockaddr*>(&addr), &len) == 0)
    {
        _impl->port = ntohs(addr.sin_port);
    }

    _impl->stopping.store(false, std::memory_order_release);
    core::Log::info(kTag, "status page on http://localhost:" + std::to_string(_impl->port) + "/");
    return {};
}

void StatusServer::serve()
{
    while (!_impl->stopping.load(std::memory_order_acquire) && _impl->listenFd >= 0)
    {
        pollfd pfd{_impl->listenFd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(kPollInterval.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            core::Log::error(kTag, errnoMessage("poll()"));
            break;
        }
        if (ready == 0 || (pfd.revents & POLLIN) == 0)
        {
            continue;
        }

        const int clientFd = ::accept(_impl->listenFd, nullptr, nullptr);
        if (clientFd < 0)
        {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
            {
                core::Log::warn(kTag, errnoMessage("accept()"));
            }
            continue;
        }
        _impl->handle(clientFd, collect());
        ::close(clientFd);
    }
}

void StatusServer::requestStop() noexcept
{
    _impl->stopping.store(true, std::memory_order_release);
}

void StatusServer::close()
{
    _impl->stopping.store(true, std::memory_order_release);
    if (_impl->listenFd >= 0)
    {
        ::close(_impl->listenFd);
        _impl->listenFd = -1;
        core::Log::info(kTag, "status listener closed");
    }
}

core::u16 StatusServer::port() const noexcept
{
    return _impl->port;
}

protocol::ServerStatus StatusServer::collect() const
{
    protocol::ServerStatus status;
    status.gamePort = _impl->gamePort;
    status.connectedAgents = _impl->sessions.activeCount();

    if (auto snapshot = _impl->engine.lastSnapshot())
    {
        const sim::WorldInfo &info = snapshot->info();
        status.tick = snapshot->tick();
        status.width = info.width;
        status.height = info.height;
        status.totalAgents = info.totalAgents;
        status.totalResources = info.totalResources;
        status.totalEntities = info.totalEntities;
    }
    else
    {
        status.width = _impl->engine.config().width();
        status.height = _impl->engine.config().height();
    }
    return status;
}

} // namespace pxv::net::transport
