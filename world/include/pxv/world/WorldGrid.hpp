/**
 * @file WorldGrid.hpp
 * @brief Fixed-size 2D lattice of cell-occupancy sets.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_WORLD_WORLDGRID_HPP
    #define PXV_WORLD_WORLDGRID_HPP

#include <pxv/world/Entity.hpp>
#include <pxv/world/EntityId.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>

#include <span>
#include <vector>

namespace pxv::world {

/**
 * @class WorldGrid
 * @brief Pure spatial index: which entity ids occupy which cell.
 *
 * Cells keep their occupants in placement order, which makes every query
 * deterministic. The grid knows nothing about entity contents; keeping it
 * in agreement with the EntityStore is the job of World.
 */
class WorldGrid final
{
public:
    /**
     * @brief Creates an empty grid.
     * @param width  Number of columns (> 0).
     * @param height Number of rows (> 0).
     */
    WorldGrid(core::i32 width, core::i32 height);

    [[nodiscard]] core::i32 width() const noexcept  { return _width; }
    [[nodiscard]] core::i32 height() const noexcept { return _height; }

    /** @brief 0 <= x < width and 0 <= y < height. */
    [[nodiscard]] bool isInBounds(core::i32 x, core::i32 y) const noexcept;
    [[nodiscard]] bool isInBounds(Position pos) const noexcept { return isInBounds(pos.x, pos.y); }

    /**
     * @brief Occupants of a cell, in placement order.
     * @return Empty span for an out-of-bounds coordinate.
     */
    [[nodiscard]] std::span<const EntityId> occupantsAt(core::i32 x, core::i32 y) const noexcept;
    [[nodiscard]] std::span<const EntityId> occupantsAt(Position pos) const noexcept
    {
        return occupantsAt(pos.x, pos.y);
    }

    /** @brief Whether @p id occupies cell (x, y). */
    [[nodiscard]] bool contains(EntityId id, core::i32 x, core::i32 y) const noexcept;

    /**
     * @brief Adds @p id to cell (x, y).
     * @return OutOfBounds outside the grid, AlreadyExists if already there.
     */
    [[nodiscard]] core::Expected<void> place(EntityId id, core::i32 x, core::i32 y);

    /**
     * @brief Removes @p id from cell (x, y).
     * @return OutOfBounds outside the grid, NotFound if not there.
     */
    [[nodiscard]] core::Expected<void> remove(EntityId id, core::i32 x, core::i32 y);

    /**
     * @brief Occupants of every in-bounds cell within a square of side
     *        2 * radius + 1 centred on (x, y), row by row.
     */
    [[nodiscard]] std::vector<EntityId> nearby(core::i32 x, core::i32 y, core::i32 radius) const;

    /** @brief Cells with no occupant, row-major. */
    [[nodiscard]] std::vector<Position> emptyCells() const;

    /** @brief Total number of (cell, id) memberships. */
    [[nodiscard]] core::usize membershipCount() const noexcept { return _memberships; }

private:
    [[nodiscard]] core::usize indexOf(core::i32 x, core::i32 y) const noexcept;

    core::i32                          _width;
    core::i32                          _height;
    std::vector<std::vector<EntityId>> _cells;
    core::usize                        _memberships{0};
};

} // namespace pxv::world

#endif // PXV_WORLD_WORLDGRID_HPP
