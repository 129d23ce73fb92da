/**
 * @file Entity.hpp
 * @brief Canonical entity record: a closed set of variants {Resource, Agent}.
 *
 * Both variants share the positional fields held by Entity; the variant
 * index is the explicit kind tag, so dispatch is a switch on kind()
 * rather than virtual calls.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_WORLD_ENTITY_HPP
    #define PXV_WORLD_ENTITY_HPP

#include <pxv/world/EntityId.hpp>
#include <pxv/world/Inventory.hpp>
#include <pxv/core/Types.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace pxv::world {

/**
 * @struct Position
 * @brief Integer lattice coordinate.
 */
struct Position
{
    core::i32 x{0};
    core::i32 y{0};

    [[nodiscard]] constexpr bool operator==(const Position &) const noexcept = default;
};

/**
 * @struct Resource
 * @brief Depletable deposit. Removed from the world when quantity hits 0.
 */
struct Resource
{
    ResourceType type{ResourceType::kOre};
    core::u32    quantity{0};
};

/**
 * @struct Agent
 * @brief Client-controlled entity.
 *
 * Holds no reference to its connection: the session layer finds the
 * agent by id, never the other way around.
 */
struct Agent
{
    std::string name;
    Inventory   inventory;
};

/**
 * @enum EntityKind
 * @brief Kind tag; values match the variant alternative indices.
 */
enum class EntityKind : core::u8
{
    kResource = 0,
    kAgent    = 1
};

[[nodiscard]] std::string_view toString(EntityKind kind) noexcept;

/**
 * @struct Entity
 * @brief Entity record stored by EntityStore.
 */
struct Entity
{
    EntityId                       id{};
    Position                       position{};
    std::variant<Resource, Agent>  body{};

    [[nodiscard]] EntityKind kind() const noexcept
    {
        return static_cast<EntityKind>(body.index());
    }

    [[nodiscard]] bool isAgent() const noexcept    { return kind() == EntityKind::kAgent; }
    [[nodiscard]] bool isResource() const noexcept { return kind() == EntityKind::kResource; }

    [[nodiscard]] Agent &asAgent()                   { return std::get<Agent>(body); }
    [[nodiscard]] const Agent &asAgent() const       { return std::get<Agent>(body); }
    [[nodiscard]] Resource &asResource()             { return std::get<Resource>(body); }
    [[nodiscard]] const Resource &asResource() const { return std::get<Resource>(body); }

    [[nodiscard]] static Entity makeAgent(EntityId id, Position pos, std::string name)
    {
        return Entity{id, pos, Agent{std::move(name), {}}};
    }

    [[nodiscard]] static Entity makeResource(EntityId id, Position pos,
                                             ResourceType type, core::u32 quantity)
    {
        return Entity{id, pos, Resource{type, quantity}};
    }
};

} // namespace pxv::world

#endif // PXV_WORLD_ENTITY_HPP
