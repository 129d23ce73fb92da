// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief World configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Injected into the tick engine at construction and never changed for
/// the life of a running world.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <pxv/core/Types.hpp>
#include <pxv/core/Constants.hpp>
#include <pxv/core/Expected.hpp>

#include <chrono>

namespace pxv::sim {

/// @brief Immutable world configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& width(core::i32 cells) noexcept;
        Builder& height(core::i32 cells) noexcept;
        Builder& tickInterval(std::chrono::milliseconds interval) noexcept;
        Builder& harvestAmount(core::u32 amount) noexcept;
        Builder& craftCost(core::u32 ore, core::u32 fuel) noexcept;
        Builder& initialResources(core::u32 count) noexcept;
        Builder& respawnIntervalTicks(core::u32 ticks) noexcept;
        Builder& maxResources(core::u32 count) noexcept;
        Builder& resourceQuantity(core::u32 min, core::u32 max) noexcept;
        Builder& seed(core::u64 value) noexcept;
        Builder& disconnectGraceTicks(core::u32 ticks) noexcept;
        Builder& idleTimeout(std::chrono::milliseconds timeout) noexcept;
        Builder& mailboxCapacity(core::u32 updates) noexcept;
        Builder& statusLogInterval(core::u32 ticks) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::i32 width_{core::kDefaultWidth};
        core::i32 height_{core::kDefaultHeight};
        std::chrono::milliseconds tickInterval_{core::kDefaultTickIntervalMs};
        core::u32 harvestAmount_{core::kDefaultHarvestAmount};
        core::u32 craftOreCost_{core::kDefaultCraftOreCost};
        core::u32 craftFuelCost_{core::kDefaultCraftFuelCost};
        core::u32 initialResources_{core::kDefaultInitialResources};
        core::u32 respawnIntervalTicks_{core::kDefaultRespawnInterval};
        core::u32 maxResources_{core::kDefaultMaxResources};
        core::u32 resourceQtyMin_{core::kDefaultResourceQtyMin};
        core::u32 resourceQtyMax_{core::kDefaultResourceQtyMax};
        core::u64 seed_{core::kDefaultSeed};
        core::u32 disconnectGraceTicks_{core::kDefaultDisconnectGrace};
        std::chrono::milliseconds idleTimeout_{core::kDefaultIdleTimeoutMs};
        core::u32 mailboxCapacity_{core::kDefaultMailboxCapacity};
        core::u32 statusLogInterval_{core::kDefaultStatusLogInterval};
    };

    [[nodiscard]] core::i32 width() const noexcept                 { return width_; }
    [[nodiscard]] core::i32 height() const noexcept                { return height_; }
    [[nodiscard]] std::chrono::milliseconds tickInterval() const noexcept { return tickInterval_; }
    [[nodiscard]] core::u32 harvestAmount() const noexcept         { return harvestAmount_; }
    [[nodiscard]] core::u32 craftOreCost() const noexcept          { return craftOreCost_; }
    [[nodiscard]] core::u32 craftFuelCost() const noexcept         { return craftFuelCost_; }
    [[nodiscard]] core::u32 initialResources() const noexcept      { return initialResources_; }
    [[nodiscard]] core::u32 respawnIntervalTicks() const noexcept  { return respawnIntervalTicks_; }
    [[nodiscard]] core::u32 maxResources() const noexcept          { return maxResources_; }
    [[nodiscard]] core::u32 resourceQuantityMin() const noexcept   { return resourceQtyMin_; }
    [[nodiscard]] core::u32 resourceQuantityMax() const noexcept   { return resourceQtyMax_; }
    [[nodiscard]] core::u64 seed() const noexcept                  { return seed_; }
    [[nodiscard]] core::u32 disconnectGraceTicks() const noexcept  { return disconnectGraceTicks_; }
    [[nodiscard]] std::chrono::milliseconds idleTimeout() const noexcept { return idleTimeout_; }
    [[nodiscard]] core::u32 mailboxCapacity() const noexcept       { return mailboxCapacity_; }
    [[nodiscard]] core::u32 statusLogInterval() const noexcept     { return statusLogInterval_; }

    /// @brief Rejects settings the world cannot run with.
    /// @return InvalidArgument naming the first offending parameter.
    [[nodiscard]] core::Expected<void> validate() const;

private:
    friend class Builder;

    core::i32 width_{core::kDefaultWidth};
    core::i32 height_{core::kDefaultHeight};
    std::chrono::milliseconds tickInterval_{core::kDefaultTickIntervalMs};
    core::u32 harvestAmount_{core::kDefaultHarvestAmount};
    core::u32 craftOreCost_{core::kDefaultCraftOreCost};
    core::u32 craftFuelCost_{core::kDefaultCraftFuelCost};
    core::u32 initialResources_{core::kDefaultInitialResources};
    core::u32 respawnIntervalTicks_{core::kDefaultRespawnInterval};
    core::u32 maxResources_{core::kDefaultMaxResources};
    core::u32 resourceQtyMin_{core::kDefaultResourceQtyMin};
    core::u32 resourceQtyMax_{core::kDefaultResourceQtyMax};
    core::u64 seed_{core::kDefaultSeed};
    core::u32 disconnectGraceTicks_{core::kDefaultDisconnectGrace};
    std::chrono::milliseconds idleTimeout_{core::kDefaultIdleTimeoutMs};
    core::u32 mailboxCapacity_{core::kDefaultMailboxCapacity};
    core::u32 statusLogInterval_{core::kDefaultStatusLogInterval};
};

} // namespace pxv::sim
