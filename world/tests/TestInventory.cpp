/**
 * @file TestInventory.cpp
 * @brief Unit tests for pxv::world::Inventory.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/world/Inventory.hpp>

#include <limits>

namespace pxv::world {

TEST_CASE("Absent items read as zero", "[world][inventory]")
{
    Inventory inventory;
    REQUIRE(inventory.count(ItemKind::kOre) == 0);
    REQUIRE(inventory.count(ItemKind::kFuel) == 0);
    REQUIRE(inventory.count(ItemKind::kComponents) == 0);
}

TEST_CASE("Debit is all or nothing", "[world][inventory]")
{
    Inventory inventory;
    REQUIRE(inventory.credit(ItemKind::kOre, 3).has_value());
    REQUIRE(inventory.credit(ItemKind::kFuel, 1).has_value());

    SECTION("a short item leaves every count untouched")
    {
        auto result = inventory.debit({{ItemKind::kOre, 2}, {ItemKind::kFuel, 2}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInsufficientResource);
        REQUIRE(inventory.count(ItemKind::kOre) == 3);
        REQUIRE(inventory.count(ItemKind::kFuel) == 1);
    }

    SECTION("a covered cost is applied to every item")
    {
        REQUIRE(inventory.covers({{ItemKind::kOre, 3}, {ItemKind::kFuel, 1}}));
        REQUIRE(inventory.debit({{ItemKind::kOre, 3}, {ItemKind::kFuel, 1}}).has_value());
        REQUIRE(inventory.count(ItemKind::kOre) == 0);
        REQUIRE(inventory.count(ItemKind::kFuel) == 0);
    }

    SECTION("single-item debit never goes negative")
    {
        REQUIRE_FALSE(inventory.debit(ItemKind::kFuel, 2).has_value());
        REQUIRE(inventory.count(ItemKind::kFuel) == 1);
    }
}

TEST_CASE("Credit refuses to overflow a count", "[world][inventory]")
{
    constexpr core::u32 kMax = std::numeric_limits<core::u32>::max();

    Inventory inventory;
    REQUIRE(inventory.room(ItemKind::kOre) == kMax);
    REQUIRE(inventory.credit(ItemKind::kOre, kMax - 2).has_value());
    REQUIRE(inventory.room(ItemKind::kOre) == 2);

    auto overflow = inventory.credit(ItemKind::kOre, 3);
    REQUIRE_FALSE(overflow.has_value());
    REQUIRE(overflow.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(inventory.count(ItemKind::kOre) == kMax - 2);

    REQUIRE(inventory.credit(ItemKind::kOre, 2).has_value());
    REQUIRE(inventory.count(ItemKind::kOre) == kMax);
    REQUIRE(inventory.room(ItemKind::kFuel) == kMax);
}

TEST_CASE("Item names round-trip case-insensitively", "[world][inventory]")
{
    REQUIRE(toString(ItemKind::kComponents) == "COMPONENTS");
    REQUIRE(parseItemKind("ore") == ItemKind::kOre);
    REQUIRE(parseItemKind("Fuel") == ItemKind::kFuel);
    REQUIRE_FALSE(parseItemKind("gold").has_value());
    REQUIRE(toItemKind(ResourceType::kFuel) == ItemKind::kFuel);
}

} // namespace pxv::world
