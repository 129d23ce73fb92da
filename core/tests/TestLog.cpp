/**
 * @file TestLog.cpp
 * @brief Unit tests for the pxv::core::Log facade.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/core/Log.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace pxv::core {

namespace {

struct Entry
{
    LogLevel    level;
    std::string tag;
    std::string message;
};

class CapturingLogger final : public ILogger
{
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        std::lock_guard lock{_mutex};
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;

private:
    std::mutex _mutex;
};

/** Installs a capturing sink for the scope of one test. */
struct ScopedLogger
{
    CapturingLogger sink;
    LogLevel        previous{Log::minLevel()};

    ScopedLogger()  { Log::setLogger(&sink); }
    ~ScopedLogger()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(previous);
    }
};

} // anonymous namespace

TEST_CASE("Log routes tagged messages to the installed sink", "[core][log]")
{
    ScopedLogger scoped;
    Log::setMinLevel(LogLevel::kDebug);

    Log::info("World", "hello");
    Log::warn("Sessions", "slow client");

    REQUIRE(scoped.sink.entries.size() == 2);
    REQUIRE(scoped.sink.entries[0].level == LogLevel::kInfo);
    REQUIRE(scoped.sink.entries[0].tag == "World");
    REQUIRE(scoped.sink.entries[0].message == "hello");
    REQUIRE(scoped.sink.entries[1].level == LogLevel::kWarn);
    REQUIRE(scoped.sink.entries[1].tag == "Sessions");
}

TEST_CASE("Log drops messages below the minimum level", "[core][log]")
{
    ScopedLogger scoped;
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("TickEngine", "noise");
    Log::info("TickEngine", "noise");
    Log::error("TickEngine", "kept");

    REQUIRE(scoped.sink.entries.size() == 1);
    REQUIRE(scoped.sink.entries[0].level == LogLevel::kError);
}

TEST_CASE("Untagged overloads use the default tag", "[core][log]")
{
    ScopedLogger scoped;
    Log::setMinLevel(LogLevel::kDebug);

    Log::info("plain");

    REQUIRE(scoped.sink.entries.size() == 1);
    REQUIRE(scoped.sink.entries[0].tag == "pxv");
}

} // namespace pxv::core
