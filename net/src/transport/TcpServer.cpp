/**
 * @file TcpServer.cpp
 * @brief POSIX TCP transport implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/net/transport/TcpServer.hpp>
#include <pxv/net/protocol/Envelope.hpp>
#include <pxv/session/Mailbox.hpp>
#include <pxv/core/Constants.hpp>
#include <pxv/core/Log.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <list>
#include <mutex>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace pxv::net::transport {

namespace {

constexpr std::string_view kTag = "Net";
constexpr std::chrono::milliseconds kPollInterval{100};
constexpr std::string_view kSessionEnded = "Session ended";

[[nodiscard]] std::string errnoMessage(const char *what)
{
    return std::string{what} + " failed: " + std::strerror(errno);
}

/**
 * @brief One accepted client: its socket, agent binding and I/O threads.
 */
struct Connection
{
    int                                fd{-1};
    world::EntityId                    agentId{};
    std::shared_ptr<session::Mailbox>  mailbox;
    std::mutex                         sendMutex;
    std::atomic<bool>                  peerGone{false};
    std::atomic<bool>                  readerDone{false};
    std::atomic<bool>                  writerDone{false};
    std::thread                        reader;
    std::thread                        writer;

    [[nodiscard]] bool finished() const noexcept
    {
        return readerDone.load(std::memory_order_acquire) && writerDone.load(std::memory_order_acquire);
    }

    /** @brief Sends @p line plus the newline terminator. */
    [[nodiscard]] core::Expected<void> sendLine(std::string line)
    {
        line.push_back('\n');

        std::lock_guard lock{sendMutex};
        std::size_t offset = 0;
        while (offset < line.size())
        {
            const auto sent = ::send(fd, line.data() + offset, line.size() - offset, MSG_NOSIGNAL);
            if (sent < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return core::makeError(core::ErrorCode::kIoError, errnoMessage("send()"));
            }
            offset += static_cast<std::size_t>(sent);
        }
        return {};
    }

    void shutdownSocket() noexcept
    {
        if (fd >= 0)
        {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    void join()
    {
        if (reader.joinable())
        {
            reader.join();
        }
        if (writer.joinable())
        {
            writer.join();
        }
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
};

} // anonymous namespace

struct TcpServer::Impl
{
    core::u16                   port;
    engine::TickEngine         &engine;
    sim::ActionQueue           &queue;
    session::SessionRegistry   &sessions;
    core::u32                   mailboxCapacity;

    int                         listenFd{-1};
    std::atomic<bool>           stopping{false};
    core::u32                   accepted{0};

    mutable std::mutex          connectionsMutex;
    std::list<std::unique_ptr<Connection>> connections;

    Impl(core::u16 p, engine::TickEngine &e, sim::ActionQueue &q, session::SessionRegistry &s, core::u32 cap)
        : port{p}
        , engine{e}
        , queue{q}
        , sessions{s}
        , mailboxCapacity{cap}
    {}

    void accept(int clientFd);
    void readLoop(Connection &connection);
    void writeLoop(Connection &connection);
    void handleLine(Connection &connection, std::string_view line);
    void reapFinished();
};

void TcpServer::Impl::accept(int clientFd)
{
    auto connection = std::make_unique<Connection>();
    connection->fd = clientFd;
    connection->mailbox = std::make_shared<session::Mailbox>(mailboxCapacity);

    const std::string name = "RemoteAgent_" + std::to_string(++accepted);
    auto admitted = engine.admitAgent(name, connection->mailbox);
    if (!admitted)
    {
        core::Log::warn(kTag, "admission refused: " + admitted.error().message());
        if (auto sent = connection->sendLine(protocol::encodeError(admitted.error().message())); !sent)
        {
            core::Log::debug(kTag, sent.error().message());
        }
        ::close(clientFd);
        return;
    }
    connection->agentId = *admitted;

    if (auto sent = connection->sendLine(protocol::encodeWelcome(connection->agentId)); !sent)
    {
        core::Log::warn(kTag, "agent " + connection->agentId.toString() + ": " + sent.error().message());
    }

    core::Log::info(kTag, "accepted " + name + " as agent " + connection->agentId.toString());

    Connection &ref = *connection;
    ref.reader = std::thread([this, &ref] { readLoop(ref); });
    ref.writer = std::thread([this, &ref] { writeLoop(ref); });

    std::lock_guard lock{connectionsMutex};
    connections.push_back(std::move(connection));
}

void TcpServer::Impl::readLoop(Connection &connection)
{
    std::string buffer;
    char chunk[1024];

    while (!stopping.load(std::memory_order_acquire))
    {
        const auto received = ::recv(connection.fd, chunk, sizeof(chunk), 0);
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
            core::Log::debug(kTag, "agent " + connection.agentId.toString() + ": " + errnoMessage("recv()"));
            break;
        }

        buffer.append(chunk, static_cast<std::size_t>(received));

        std::size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos)
        {
            std::string_view line{buffer.data(), newline};
            if (!line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }
            if (!line.empty())
            {
                handleLine(connection, line);
            }
            buffer.erase(0, newline + 1);
        }

        if (buffer.size() > core::kMaxLineLength)
        {
            core::Log::warn(kTag, "agent " + connection.agentId.toString() + ": line too long, dropping");
            if (auto sent = connection.sendLine(protocol::encodeError("Message too long")); !sent)
            {
                core::Log::debug(kTag, sent.error().message());
            }
            break;
        }
    }

    connection.peerGone.store(true, std::memory_order_release);
    if (auto gone = sessions.unregisterAgent(connection.agentId); !gone)
    {
        core::Log::debug(kTag, gone.error().message());
    }
    connection.mailbox->close();
    connection.shutdownSocket();
    connection.readerDone.store(true, std::memory_order_release);
}

void TcpServer::Impl::handleLine(Connection &connection, std::string_view line)
{
    if (sessions.state(connection.agentId).value_or(session::SessionState::kDisconnected)
        == session::SessionState::kDisconnected)
    {
        if (auto sent = connection.sendLine(protocol::encodeError(kSessionEnded)); !sent)
        {
            core::Log::debug(kTag, sent.error().message());
        }
        return;
    }
    sessions.touch(connection.agentId);

    auto action = protocol::decodeCommand(line);
    if (!action)
    {
        core::Log::debug(kTag, "agent " + connection.agentId.toString() + ": " + action.error().message());
        if (auto sent = connection.sendLine(protocol::encodeError(action.error().message())); !sent)
        {
            core::Log::debug(kTag, sent.error().message());
        }
        return;
    }

    queue.submit(connection.agentId, std::move(*action));
}

void TcpServer::Impl::writeLoop(Connection &connection)
{
    session::AgentUpdate update;
    while (true)
    {
        if (!connection.mailbox->waitPop(update, kPollInterval))
        {
            if (stopping.load(std::memory_order_acquire))
            {
                break;
            }
            if (connection.mailbox->isOpen())
            {
                continue;
            }

            // Evicted by the registry: tell the client and hang up so the reader exits too.
            if (!connection.peerGone.load(std::memory_order_acquire))
            {
                core::Log::info(kTag, "agent " + connection.agentId.toString() + ": session ended, closing connection");
                if (auto sent = connection.sendLine(protocol::encodeError(kSessionEnded)); !sent)
                {
                    core::Log::debug(kTag, sent.error().message());
                }
            }
            connection.shutdownSocket();
            break;
        }

        bool failed = false;
        for (std::string &message : protocol::encodeUpdate(update))
        {
            if (auto sent = connection.sendLine(std::move(message)); !sent)
            {
                core::Log::warn(kTag, "agent " + connection.agentId.toString() + ": " + sent.error().message());
                failed = true;
                break;
            }
        }
        if (failed)
        {
            connection.mailbox->close();
            connection.shutdownSocket();
            break;
        }
    }
    connection.writerDone.store(true, std::memory_order_release);
}

void TcpServer::Impl::reapFinished()
{
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard lock{connectionsMutex};
        for (auto it = connections.begin(); it != connections.end(); )
        {
            if ((*it)->finished())
            {
                finished.push_back(std::move(*it));
                it = connections.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }
    for (auto &connection : finished)
    {
        connection->join();
    }
}

TcpServer::TcpServer(core::u16 port, engine::TickEngine &engine, sim::ActionQueue &queue,
                     session::SessionRegistry &sessions, core::u32 mailboxCapacity)
    : _impl{std::make_unique<Impl>(port, engine, queue, sessions, mailboxCapacity)}
{}

TcpServer::~TcpServer()
{
    close();
}

core::Expected<void> TcpServer::open()
{
    if (_impl->listenFd >= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "server already open");
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
    core::Log::info(kTag, "listening on port " + std::to_string(_impl->port));
    return {};
}

void TcpServer::serve()
{
    while (!_impl->stopping.load(std::memory_order_acquire) && _impl->listenFd >= 0)
    {
        pollfd pfd{_impl->listenFd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(kPollInterval.count()));
        _impl->reapFinished();

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
        _impl->accept(clientFd);
    }
}

void TcpServer::requestStop() noexcept
{
    _impl->stopping.store(true, std::memory_order_release);
}

void TcpServer::close()
{
    _impl->stopping.store(true, std::memory_order_release);

    std::list<std::unique_ptr<Connection>> connections;
    {
        std::lock_guard lock{_impl->connectionsMutex};
        connections.swap(_impl->connections);
    }
    for (auto &connection : connections)
    {
        connection->mailbox->close();
        connection->shutdownSocket();
    }
    for (auto &connection : connections)
    {
        connection->join();
    }

    if (_impl->listenFd >= 0)
    {
        ::close(_impl->listenFd);
        _impl->listenFd = -1;
        core::Log::info(kTag, "listener closed");
    }
}

core::u16 TcpServer::port() const noexcept
{
    return _impl->port;
}

core::u32 TcpServer::connectionCount() const
{
    std::lock_guard lock{_impl->connectionsMutex};
    return static_cast<core::u32>(_impl->connections.size());
}

} // namespace pxv::net::transport
