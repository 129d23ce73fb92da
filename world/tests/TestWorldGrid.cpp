/**
 * @file TestWorldGrid.cpp
 * @brief Unit tests for pxv::world::WorldGrid.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/world/WorldGrid.hpp>

#include <algorithm>

namespace pxv::world {

TEST_CASE("WorldGrid bounds", "[world][grid]")
{
    WorldGrid grid{20, 10};

    REQUIRE(grid.isInBounds(0, 0));
    REQUIRE(grid.isInBounds(19, 9));
    REQUIRE_FALSE(grid.isInBounds(20, 0));
    REQUIRE_FALSE(grid.isInBounds(0, 10));
    REQUIRE_FALSE(grid.isInBounds(-1, 3));
    REQUIRE(grid.occupantsAt(-1, -1).empty());
}

TEST_CASE("WorldGrid place and remove", "[world][grid]")
{
    WorldGrid grid{5, 5};
    const EntityId a{1};
    const EntityId b{2};

    REQUIRE(grid.place(a, 2, 2).has_value());
    REQUIRE(grid.place(b, 2, 2).has_value());

    auto occupants = grid.occupantsAt(2, 2);
    REQUIRE(occupants.size() == 2);
    REQUIRE(occupants[0] == a);
    REQUIRE(occupants[1] == b);
    REQUIRE(grid.membershipCount() == 2);

    SECTION("placing twice in one cell is rejected")
    {
        REQUIRE(grid.place(a, 2, 2).error().code() == core::ErrorCode::kAlreadyExists);
    }

    SECTION("placing outside the grid is rejected")
    {
        REQUIRE(grid.place(EntityId{3}, 5, 0).error().code() == core::ErrorCode::kOutOfBounds);
        REQUIRE(grid.membershipCount() == 2);
    }

    SECTION("removing keeps the order of the others")
    {
        REQUIRE(grid.remove(a, 2, 2).has_value());
        REQUIRE(grid.occupantsAt(2, 2).size() == 1);
        REQUIRE(grid.occupantsAt(2, 2)[0] == b);
        REQUIRE(grid.remove(a, 2, 2).error().code() == core::ErrorCode::kNotFound);
    }
}

TEST_CASE("WorldGrid nearby clips to the grid", "[world][grid]")
{
    WorldGrid grid{4, 4};
    REQUIRE(grid.place(EntityId{1}, 0, 0).has_value());
    REQUIRE(grid.place(EntityId{2}, 1, 1).has_value());
    REQUIRE(grid.place(EntityId{3}, 3, 3).has_value());

    auto near = grid.nearby(0, 0, 1);
    REQUIRE(near.size() == 2);
    REQUIRE(std::find(near.begin(), near.end(), EntityId{3}) == near.end());

    REQUIRE(grid.nearby(2, 2, 1).size() == 2);
}

TEST_CASE("WorldGrid lists empty cells row-major", "[world][grid]")
{
    WorldGrid grid{2, 2};
    REQUIRE(grid.place(EntityId{7}, 1, 0).has_value());

    auto cells = grid.emptyCells();
    REQUIRE(cells.size() == 3);
    REQUIRE(cells[0] == Position{0, 0});
    REQUIRE(cells[1] == Position{0, 1});
    REQUIRE(cells[2] == Position{1, 1});
}

} // namespace pxv::world
