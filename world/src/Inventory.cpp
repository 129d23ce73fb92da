/**
 * @file Inventory.cpp
 * @brief Inventory and item-name helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/world/Inventory.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

namespace pxv::world {

namespace {

[[nodiscard]] constexpr core::usize slot(ItemKind kind) noexcept
{
    return static_cast<core::usize>(kind);
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
               return std::toupper(static_cast<unsigned char>(l))
                   == std::toupper(static_cast<unsigned char>(r));
           });
}

} // anonymous namespace

std::string_view toString(ItemKind kind) noexcept
{
    switch (kind)
    {
    case ItemKind::kOre:        return "ORE";
    case ItemKind::kFuel:       return "FUEL";
    case ItemKind::kComponents: return "COMPONENTS";
    case ItemKind::kCount:      break;
    }
    return "UNKNOWN";
}

std::string_view toString(ResourceType type) noexcept
{
    return toString(toItemKind(type));
}

std::optional<ItemKind> parseItemKind(std::string_view name) noexcept
{
    for (core::usize i = 0; i < kItemKindCount; ++i)
    {
        const auto kind = static_cast<ItemKind>(i);
        if (equalsIgnoreCase(name, toString(kind)))
        {
            return kind;
        }
    }
    return std::nullopt;
}

core::u32 Inventory::count(ItemKind kind) const noexcept
{
    return _counts[slot(kind)];
}

core::u32 Inventory::room(ItemKind kind) const noexcept
{
    return std::numeric_limits<core::u32>::max() - _counts[slot(kind)];
}

core::Expected<void> Inventory::credit(ItemKind kind, core::u32 amount)
{
    if (amount > room(kind))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "crediting " + std::to_string(amount) + " " + std::string{toString(kind)}
                               + " would overflow a count of " + std::to_string(count(kind)));
    }
    _counts[slot(kind)] += amount;
    return {};
}

core::Expected<void> Inventory::debit(ItemKind kind, core::u32 amount)
{
    return debit({ItemCount{kind, amount}});
}

bool Inventory::covers(std::initializer_list<ItemCount> costs) const noexcept
{
    std::array<core::u64, kItemKindCount> needed{};
    for (const auto &cost : costs)
    {
        needed[slot(cost.kind)] += cost.amount;
    }
    for (core::usize i = 0; i < kItemKindCount; ++i)
    {
        if (needed[i] > _counts[i])
        {
            return false;
        }
    }
    return true;
}

core::Expected<void> Inventory::debit(std::initializer_list<ItemCount> costs)
{
    if (!covers(costs))
    {
        return core::makeError(core::ErrorCode::kInsufficientResource,
                               "inventory cannot cover the requested debit");
    }
    for (const auto &cost : costs)
    {
        _counts[slot(cost.kind)] -= cost.amount;
    }
    return {};
}

} // namespace pxv::world
