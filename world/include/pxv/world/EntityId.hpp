/**
 * @file EntityId.hpp
 * @brief Opaque entity identifier and its thread-safe allocator.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_WORLD_ENTITYID_HPP
    #define PXV_WORLD_ENTITYID_HPP

#include <pxv/core/Types.hpp>

#include <atomic>
#include <compare>
#include <functional>
#include <limits>
#include <string>

namespace pxv::world {

/**
 * @class EntityId
 * @brief 32-bit entity identifier, immutable once assigned.
 *
 * Identifiers are never recycled during the life of a world, so a stale
 * id always resolves to NotFound instead of a different entity.
 */
class EntityId final
{
public:
    /** @brief Null sentinel. */
    static constexpr core::u32 kNull = std::numeric_limits<core::u32>::max();

    /** @brief Default-constructs a null entity. */
    constexpr EntityId() noexcept = default;

    /**
     * @brief Constructs from a raw value.
     * @param raw Identifier value.
     */
    constexpr explicit EntityId(core::u32 raw) noexcept
        : _raw{raw}
    {}

    /** @brief Returns the raw value. */
    [[nodiscard]] constexpr core::u32 raw() const noexcept { return _raw; }

    /** @brief Tests whether the entity is valid (non-null). */
    [[nodiscard]] constexpr bool isValid() const noexcept
    {
        return _raw != kNull;
    }

    /** @brief Decimal string form used on the wire and in logs. */
    [[nodiscard]] std::string toString() const { return std::to_string(_raw); }

    [[nodiscard]] constexpr bool operator==(EntityId other) const noexcept
    {
        return _raw == other._raw;
    }

    [[nodiscard]] constexpr auto operator<=>(EntityId other) const noexcept
    {
        return _raw <=> other._raw;
    }

private:
    core::u32 _raw{kNull};
};

/**
 * @class EntityIdAllocator
 * @brief Monotonic identifier source, safe to call from any thread.
 */
class EntityIdAllocator final
{
public:
    /** @param first First identifier handed out. */
    explicit EntityIdAllocator(core::u32 first = 1) noexcept
        : _next{first}
    {}

    EntityIdAllocator(const EntityIdAllocator &) = delete;
    EntityIdAllocator &operator=(const EntityIdAllocator &) = delete;

    [[nodiscard]] EntityId next() noexcept
    {
        return EntityId{_next.fetch_add(1, std::memory_order_relaxed)};
    }

private:
    std::atomic<core::u32> _next;
};

} // namespace pxv::world

// -------------------------------------------------------------------------- //
//  std::hash specialisation                                                  //
// -------------------------------------------------------------------------- //
template <>
struct std::hash<pxv::world::EntityId>
{
    [[nodiscard]] std::size_t operator()(pxv::world::EntityId id) const noexcept
    {
        return std::hash<pxv::core::u32>{}(id.raw());
    }
};

#endif // PXV_WORLD_ENTITYID_HPP
