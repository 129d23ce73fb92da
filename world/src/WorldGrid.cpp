/**
 * @file WorldGrid.cpp
 * @brief WorldGrid implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/world/WorldGrid.hpp>
#include <pxv/core/Assert.hpp>

#include <algorithm>

namespace pxv::world {

WorldGrid::WorldGrid(core::i32 width, core::i32 height)
    : _width{width}
    , _height{height}
{
    PXV_VERIFY(width > 0 && height > 0);
    _cells.resize(static_cast<core::usize>(width) * static_cast<core::usize>(height));
}

bool WorldGrid::isInBounds(core::i32 x, core::i32 y) const noexcept
{
    return x >= 0 && x < _width && y >= 0 && y < _height;
}

core::usize WorldGrid::indexOf(core::i32 x, core::i32 y) const noexcept
{
    return static_cast<core::usize>(y) * static_cast<core::usize>(_width)
         + static_cast<core::usize>(x);
}

std::span<const EntityId> WorldGrid::occupantsAt(core::i32 x, core::i32 y) const noexcept
{
    if (!isInBounds(x, y))
    {
        return {};
    }
    return _cells[indexOf(x, y)];
}

bool WorldGrid::contains(EntityId id, core::i32 x, core::i32 y) const noexcept
{
    const auto cell = occupantsAt(x, y);
    return std::find(cell.begin(), cell.end(), id) != cell.end();
}

core::Expected<void> WorldGrid::place(EntityId id, core::i32 x, core::i32 y)
{
    if (!isInBounds(x, y))
    {
        return core::makeError(core::ErrorCode::kOutOfBounds,
                               "place: (" + std::to_string(x) + ", " + std::to_string(y)
                               + ") is outside the grid");
    }

    auto &cell = _cells[indexOf(x, y)];
    if (std::find(cell.begin(), cell.end(), id) != cell.end())
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "place: entity " + id.toString() + " already in cell");
    }

    cell.push_back(id);
    ++_memberships;
    return {};
}

core::Expected<void> WorldGrid::remove(EntityId id, core::i32 x, core::i32 y)
{
    if (!isInBounds(x, y))
    {
        return core::makeError(core::ErrorCode::kOutOfBounds,
                               "remove: (" + std::to_string(x) + ", " + std::to_string(y)
                               + ") is outside the grid");
    }

    auto &cell = _cells[indexOf(x, y)];
    auto it = std::find(cell.begin(), cell.end(), id);
    if (it == cell.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "remove: entity " + id.toString() + " not in cell");
    }

    cell.erase(it);
    --_memberships;
    return {};
}

std::vector<EntityId> WorldGrid::nearby(core::i32 x, core::i32 y, core::i32 radius) const
{
    std::vector<EntityId> found;
    for (core::i32 cy = y - radius; cy <= y + radius; ++cy)
    {
        for (core::i32 cx = x - radius; cx <= x + radius; ++cx)
        {
            const auto cell = occupantsAt(cx, cy);
            found.insert(found.end(), cell.begin(), cell.end());
        }
    }
    return found;
}

std::vector<Position> WorldGrid::emptyCells() const
{
    std::vector<Position> empty;
    for (core::i32 y = 0; y < _height; ++y)
    {
        for (core::i32 x = 0; x < _width; ++x)
        {
            if (_cells[indexOf(x, y)].empty())
            {
                empty.push_back({x, y});
            }
        }
    }
    return empty;
}

} // namespace pxv::world
