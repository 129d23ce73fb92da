/**
 * @file Inventory.hpp
 * @brief Item tags and the non-negative per-agent item counter.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_WORLD_INVENTORY_HPP
    #define PXV_WORLD_INVENTORY_HPP

#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>

#include <array>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace pxv::world {

/**
 * @enum ResourceType
 * @brief Kinds of harvestable deposits.
 */
enum class ResourceType : core::u8
{
    kOre,
    kFuel
};

/**
 * @enum ItemKind
 * @brief Inventory keys: raw resources plus crafted products.
 */
enum class ItemKind : core::u8
{
    kOre,
    kFuel,
    kComponents,

    kCount
};

inline constexpr core::usize kItemKindCount = static_cast<core::usize>(ItemKind::kCount);

/** @brief Inventory key credited when a resource of @p type is harvested. */
[[nodiscard]] constexpr ItemKind toItemKind(ResourceType type) noexcept
{
    return type == ResourceType::kOre ? ItemKind::kOre : ItemKind::kFuel;
}

/** @brief Wire name of an item ("ORE", "FUEL", "COMPONENTS"). */
[[nodiscard]] std::string_view toString(ItemKind kind) noexcept;

/** @brief Wire name of a resource type ("ORE", "FUEL"). */
[[nodiscard]] std::string_view toString(ResourceType type) noexcept;

/** @brief Parses a case-insensitive item name. */
[[nodiscard]] std::optional<ItemKind> parseItemKind(std::string_view name) noexcept;

/**
 * @struct ItemCount
 * @brief (item, amount) pair used to express costs.
 */
struct ItemCount
{
    ItemKind  kind;
    core::u32 amount;
};

/**
 * @class Inventory
 * @brief Mapping item -> count where an absent key reads as zero.
 *
 * Counts can never go negative: a debit that exceeds the stock of any
 * item fails with InsufficientResource and leaves every count untouched.
 */
class Inventory final
{
public:
    Inventory() = default;

    [[nodiscard]] core::u32 count(ItemKind kind) const noexcept;

    /** @brief Units of @p kind that can still be credited before the count saturates. */
    [[nodiscard]] core::u32 room(ItemKind kind) const noexcept;

    /**
     * @brief Adds @p amount units of @p kind.
     * @return InvalidArgument (count untouched) if the count would overflow.
     */
    [[nodiscard]] core::Expected<void> credit(ItemKind kind, core::u32 amount);

    /** @brief Removes @p amount units of @p kind, all or nothing. */
    [[nodiscard]] core::Expected<void> debit(ItemKind kind, core::u32 amount);

    /** @brief Removes every listed cost atomically, all or nothing. */
    [[nodiscard]] core::Expected<void> debit(std::initializer_list<ItemCount> costs);

    /** @brief Whether every listed cost is covered. */
    [[nodiscard]] bool covers(std::initializer_list<ItemCount> costs) const noexcept;

    [[nodiscard]] bool operator==(const Inventory &other) const noexcept = default;

private:
    std::array<core::u32, kItemKindCount> _counts{};
};

} // namespace pxv::world

#endif // PXV_WORLD_INVENTORY_HPP
