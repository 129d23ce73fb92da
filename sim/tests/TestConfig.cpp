/**
 * @file TestConfig.cpp
 * @brief Unit tests for pxv::sim::Config and its Builder.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/sim/Config.hpp>

#include <chrono>

namespace pxv::sim {

using namespace std::chrono_literals;

TEST_CASE("Config defaults are valid", "[sim][config]")
{
    const Config config = Config::Builder{}.build();

    REQUIRE(config.width() == 20);
    REQUIRE(config.height() == 20);
    REQUIRE(config.tickInterval() == 1000ms);
    REQUIRE(config.harvestAmount() == 10);
    REQUIRE(config.craftOreCost() == 1);
    REQUIRE(config.craftFuelCost() == 1);
    REQUIRE(config.mailboxCapacity() == 64);
    REQUIRE(config.validate().has_value());
}

TEST_CASE("Config builder overrides each field", "[sim][config]")
{
    const Config config = Config::Builder{}
        .width(8)
        .height(4)
        .tickInterval(50ms)
        .harvestAmount(2)
        .craftCost(3, 2)
        .resourceQuantity(5, 5)
        .seed(7)
        .disconnectGraceTicks(3)
        .idleTimeout(250ms)
        .build();

    REQUIRE(config.width() == 8);
    REQUIRE(config.height() == 4);
    REQUIRE(config.tickInterval() == 50ms);
    REQUIRE(config.harvestAmount() == 2);
    REQUIRE(config.craftOreCost() == 3);
    REQUIRE(config.craftFuelCost() == 2);
    REQUIRE(config.resourceQuantityMin() == 5);
    REQUIRE(config.resourceQuantityMax() == 5);
    REQUIRE(config.seed() == 7);
    REQUIRE(config.disconnectGraceTicks() == 3);
    REQUIRE(config.idleTimeout() == 250ms);
    REQUIRE(config.validate().has_value());
}

TEST_CASE("Config validation rejects unusable settings", "[sim][config]")
{
    auto invalid = [](const Config &config) {
        auto result = config.validate();
        return !result.has_value() && result.error().code() == core::ErrorCode::kInvalidArgument;
    };

    REQUIRE(invalid(Config::Builder{}.width(0).build()));
    REQUIRE(invalid(Config::Builder{}.height(-3).build()));
    REQUIRE(invalid(Config::Builder{}.tickInterval(0ms).build()));
    REQUIRE(invalid(Config::Builder{}.harvestAmount(0).build()));
    REQUIRE(invalid(Config::Builder{}.resourceQuantity(10, 5).build()));
    REQUIRE(invalid(Config::Builder{}.mailboxCapacity(48).build()));
}

} // namespace pxv::sim
