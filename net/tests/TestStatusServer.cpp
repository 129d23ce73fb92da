/**
 * @file TestStatusServer.cpp
 * @brief HTTP status page: request parsing, rendering and a loopback GET.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/net/transport/StatusServer.hpp>
#include <pxv/net/protocol/StatusPage.hpp>

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <string>
#include <thread>

namespace pxv::net {

using json = nlohmann::json;

namespace {

struct HttpReply
{
    int         code{0};
    std::string body;
};

/** One request per connection; the server closes after answering. */
HttpReply httpRequest(core::u16 port, const std::string &request)
{
    HttpReply reply;
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    timeval tv{};
    tv.tv_sec = 2;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0)
    {
        ::close(fd);
        return reply;
    }
    ::send(fd, request.data(), request.size(), MSG_NOSIGNAL);

    std::string raw;
    char chunk[1024];
    ssize_t n;
    while ((n = ::recv(fd, chunk, sizeof(chunk), 0)) > 0)
    {
        raw.append(chunk, static_cast<core::usize>(n));
    }
    ::close(fd);

    if (raw.starts_with("HTTP/1.1 ") && raw.size() >= 12)
    {
        reply.code = std::stoi(raw.substr(9, 3));
    }
    if (const auto split = raw.find("\r\n\r\n"); split != std::string::npos)
    {
        reply.body = raw.substr(split + 4);
    }
    return reply;
}

} // anonymous namespace

TEST_CASE("parseRequestLine extracts method and path", "[net][status]")
{
    auto request = protocol::parseRequestLine("GET /status?verbose=1 HTTP/1.1\r\nHost: localhost\r\n\r\n");
    REQUIRE(request.has_value());
    REQUIRE(request->method == "GET");
    REQUIRE(request->path == "/status");

    REQUIRE(protocol::parseRequestLine("GET / HTTP/1.0\r\n\r\n")->path == "/");
    REQUIRE_FALSE(protocol::parseRequestLine("hello\r\n\r\n").has_value());
    REQUIRE_FALSE(protocol::parseRequestLine("GET /status SPDY/3\r\n\r\n").has_value());
    REQUIRE_FALSE(protocol::parseRequestLine("GET status HTTP/1.1\r\n\r\n").has_value());
}

TEST_CASE("Status renderings carry the world summary", "[net][status]")
{
    protocol::ServerStatus status;
    status.tick = 150;
    status.width = 20;
    status.height = 10;
    status.totalAgents = 2;
    status.totalResources = 17;
    status.totalEntities = 19;
    status.connectedAgents = 2;
    status.gamePort = 8765;

    const json j = json::parse(protocol::encodeStatusJson(status));
    REQUIRE(j["status"] == "online");
    REQUIRE(j["tick"] == 150);
    REQUIRE(j["dimensions"] == json::array({20, 10}));
    REQUIRE(j["total_resources"] == 17);
    REQUIRE(j["connected_agents"] == 2);
    REQUIRE(j["game_port"] == 8765);

    const std::string html = protocol::renderStatusHtml(status);
    REQUIRE(html.find("World Tick:</strong> 150") != std::string::npos);
    REQUIRE(html.find("World Size:</strong> 20x10") != std::string::npos);
    REQUIRE(html.find("Total Resources:</strong> 17") != std::string::npos);

    const std::string response = protocol::makeHttpResponse(200, "application/json", "{}");
    REQUIRE(response.starts_with("HTTP/1.1 200 OK\r\n"));
    REQUIRE(response.find("Content-Length: 2\r\n") != std::string::npos);
    REQUIRE(response.ends_with("\r\n\r\n{}"));
}

TEST_CASE("StatusServer answers GET requests over loopback", "[net][status]")
{
    const sim::Config config = sim::Config::Builder{}
                                   .width(20)
                                   .height(20)
                                   .initialResources(5)
                                   .respawnIntervalTicks(0)
                                   .build();
    sim::ActionQueue queue;
    session::SessionRegistry sessions{config.disconnectGraceTicks(), config.idleTimeout()};
    engine::TickEngine engine{config, queue, sessions};
    REQUIRE(engine.init().has_value());

    transport::StatusServer server{0, engine, sessions, 8765};
    REQUIRE(server.open().has_value());
    REQUIRE(server.port() != 0);

    const protocol::ServerStatus before = server.collect();
    REQUIRE(before.tick == 0);
    REQUIRE(before.width == 20);
    REQUIRE(before.connectedAgents == 0);

    REQUIRE(engine.step().has_value());
    REQUIRE(engine.step().has_value());

    std::thread serving{[&server] { server.serve(); }};
    const HttpReply status = httpRequest(server.port(), "GET /status HTTP/1.1\r\nHost: localhost\r\n\r\n");
    const HttpReply page = httpRequest(server.port(), "GET / HTTP/1.1\r\n\r\n");
    const HttpReply missing = httpRequest(server.port(), "GET /missing HTTP/1.1\r\n\r\n");
    const HttpReply posted = httpRequest(server.port(), "POST /status HTTP/1.1\r\n\r\n");
    const HttpReply garbage = httpRequest(server.port(), "garbage\r\n\r\n");
    server.requestStop();
    serving.join();
    server.close();

    REQUIRE(status.code == 200);
    const json j = json::parse(status.body, nullptr, false);
    REQUIRE_FALSE(j.is_discarded());
    REQUIRE(j["tick"] == 2);
    REQUIRE(j["dimensions"] == json::array({20, 20}));
    REQUIRE(j["total_resources"] == 5);
    REQUIRE(j["connected_agents"] == 0);

    REQUIRE(page.code == 200);
    REQUIRE(page.body.find("World Tick:</strong> 2") != std::string::npos);

    REQUIRE(missing.code == 404);
    REQUIRE(posted.code == 405);
    REQUIRE(garbage.code == 400);
}

} // namespace pxv::net
