// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Proxiverse world server entry-point.
///
/// Headless server: one tick engine thread, one accept thread, an optional
/// HTTP status thread, and a reader/writer thread pair per connected agent.
// /////////////////////////////////////////////////////////////////////////////

#include <pxv/engine/TickEngine.hpp>
#include <pxv/net/transport/StatusServer.hpp>
#include <pxv/net/transport/TcpServer.hpp>
#include <pxv/session/SessionRegistry.hpp>
#include <pxv/sim/ActionQueue.hpp>
#include <pxv/sim/Config.hpp>
#include <pxv/core/Constants.hpp>
#include <pxv/core/Log.hpp>
#include <pxv/core/Types.hpp>

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace {

volatile std::sig_atomic_t gStopRequested = 0;

void onSignal(int /*signum*/)
{
    gStopRequested = 1;
}

struct Options
{
    pxv::core::u16 port{pxv::core::kDefaultPort};
    pxv::core::u16 statusPort{pxv::core::kDefaultStatusPort};
    pxv::sim::Config::Builder builder{};
    bool verbose{false};
};

void printUsage(const char *program)
{
    std::fprintf(stderr,
                 "usage: %s [--port N] [--status-port N (0 disables)] [--width N] [--height N] [--tick-ms N] [--seed N] [--verbose]\n",
                 program);
}

template <typename T>
[[nodiscard]] std::optional<T> parseNumber(std::string_view text)
{
    T value{};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<Options> parseArgs(int argc, char *argv[])
{
    Options options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--verbose")
        {
            options.verbose = true;
            continue;
        }
        if (i + 1 >= argc)
        {
            return std::nullopt;
        }
        const std::string_view value{argv[++i]};

        if (arg == "--port")
        {
            auto port = parseNumber<pxv::core::u16>(value);
            if (!port) return std::nullopt;
            options.port = *port;
        }
        else if (arg == "--status-port")
        {
            auto port = parseNumber<pxv::core::u16>(value);
            if (!port) return std::nullopt;
            options.statusPort = *port;
        }
        else if (arg == "--width")
        {
            auto width = parseNumber<pxv::core::i32>(value);
            if (!width) return std::nullopt;
            options.builder.width(*width);
        }
        else if (arg == "--height")
        {
            auto height = parseNumber<pxv::core::i32>(value);
            if (!height) return std::nullopt;
            options.builder.height(*height);
        }
        else if (arg == "--tick-ms")
        {
            auto ms = parseNumber<pxv::core::u32>(value);
            if (!ms) return std::nullopt;
            options.builder.tickInterval(std::chrono::milliseconds{*ms});
        }
        else if (arg == "--seed")
        {
            auto seed = parseNumber<pxv::core::u64>(value);
            if (!seed) return std::nullopt;
            options.builder.seed(*seed);
        }
        else
        {
            return std::nullopt;
        }
    }
    return options;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    auto options = parseArgs(argc, argv);
    if (!options)
    {
        printUsage(argv[0]);
        return 2;
    }

    pxv::core::Log::setMinLevel(options->verbose ? pxv::core::LogLevel::kDebug : pxv::core::LogLevel::kInfo);
    pxv::core::Log::info("Server", "=== Proxiverse Server ===");

    const pxv::sim::Config config = options->builder.build();

    pxv::sim::ActionQueue queue;
    pxv::session::SessionRegistry sessions{config.disconnectGraceTicks(), config.idleTimeout()};
    pxv::engine::TickEngine engine{config, queue, sessions};

    if (auto result = engine.init(); !result)
    {
        pxv::core::Log::error("Server", "init failed: " + result.error().message());
        return 1;
    }

    pxv::net::transport::TcpServer server{options->port, engine, queue, sessions, config.mailboxCapacity()};
    if (auto result = server.open(); !result)
    {
        pxv::core::Log::error("Server", "listen failed: " + result.error().message());
        return 1;
    }

    std::optional<pxv::net::transport::StatusServer> status;
    if (options->statusPort != 0)
    {
        status.emplace(options->statusPort, engine, sessions, server.port());
        if (auto result = status->open(); !result)
        {
            pxv::core::Log::error("Server", "status listen failed: " + result.error().message());
            return 1;
        }
    }

    std::signal(SIGINT, &onSignal);
    std::signal(SIGTERM, &onSignal);

    std::thread tickThread{[&engine] { engine.run(); }};
    std::thread acceptThread{[&server] { server.serve(); }};
    std::thread statusThread;
    if (status)
    {
        statusThread = std::thread{[&status] { status->serve(); }};
    }

    pxv::core::Log::info("Server", "running, Ctrl+C to stop");
    while (gStopRequested == 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }

    pxv::core::Log::info("Server", "shutting down");
    server.requestStop();
    engine.requestStop();
    if (status)
    {
        status->requestStop();
    }
    acceptThread.join();
    tickThread.join();
    if (statusThread.joinable())
    {
        statusThread.join();
    }
    server.close();
    if (status)
    {
        status->close();
    }

    pxv::core::Log::info("Server", "exited cleanly at tick " + std::to_string(engine.tick()));
    return 0;
}
