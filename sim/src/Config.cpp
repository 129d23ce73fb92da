// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation and validation.
// /////////////////////////////////////////////////////////////////////////////

#include <pxv/sim/Config.hpp>

#include <bit>

namespace pxv::sim {

Config::Builder& Config::Builder::width(core::i32 cells) noexcept
{
    width_ = cells;
    return *this;
}

Config::Builder& Config::Builder::height(core::i32 cells) noexcept
{
    height_ = cells;
    return *this;
}

Config::Builder& Config::Builder::tickInterval(std::chrono::milliseconds interval) noexcept
{
    tickInterval_ = interval;
    return *this;
}

Config::Builder& Config::Builder::harvestAmount(core::u32 amount) noexcept
{
    harvestAmount_ = amount;
    return *this;
}

Config::Builder& Config::Builder::craftCost(core::u32 ore, core::u32 fuel) noexcept
{
    craftOreCost_ = ore;
    craftFuelCost_ = fuel;
    return *this;
}

Config::Builder& Config::Builder::initialResources(core::u32 count) noexcept
{
    initialResources_ = count;
    return *this;
}

Config::Builder& Config::Builder::respawnIntervalTicks(core::u32 ticks) noexcept
{
    respawnIntervalTicks_ = ticks;
    return *this;
}

Config::Builder& Config::Builder::maxResources(core::u32 count) noexcept
{
    maxResources_ = count;
    return *this;
}

Config::Builder& Config::Builder::resourceQuantity(core::u32 min, core::u32 max) noexcept
{
    resourceQtyMin_ = min;
    resourceQtyMax_ = max;
    return *this;
}

Config::Builder& Config::Builder::seed(core::u64 value) noexcept
{
    seed_ = value;
    return *this;
}

Config::Builder& Config::Builder::disconnectGraceTicks(core::u32 ticks) noexcept
{
    disconnectGraceTicks_ = ticks;
    return *this;
}

Config::Builder& Config::Builder::idleTimeout(std::chrono::milliseconds timeout) noexcept
{
    idleTimeout_ = timeout;
    return *this;
}

Config::Builder& Config::Builder::mailboxCapacity(core::u32 updates) noexcept
{
    mailboxCapacity_ = updates;
    return *this;
}

Config::Builder& Config::Builder::statusLogInterval(core::u32 ticks) noexcept
{
    statusLogInterval_ = ticks;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg.width_                = width_;
    cfg.height_               = height_;
    cfg.tickInterval_         = tickInterval_;
    cfg.harvestAmount_        = harvestAmount_;
    cfg.craftOreCost_         = craftOreCost_;
    cfg.craftFuelCost_        = craftFuelCost_;
    cfg.initialResources_     = initialResources_;
    cfg.respawnIntervalTicks_ = respawnIntervalTicks_;
    cfg.maxResources_         = maxResources_;
    cfg.resourceQtyMin_       = resourceQtyMin_;
    cfg.resourceQtyMax_       = resourceQtyMax_;
    cfg.seed_                 = seed_;
    cfg.disconnectGraceTicks_ = disconnectGraceTicks_;
    cfg.idleTimeout_          = idleTimeout_;
    cfg.mailboxCapacity_      = mailboxCapacity_;
    cfg.statusLogInterval_    = statusLogInterval_;
    return cfg;
}

core::Expected<void> Config::validate() const
{
    if (width_ <= 0 || height_ <= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "width and height must be positive");
    }
    if (tickInterval_.count() <= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "tick interval must be positive");
    }
    if (harvestAmount_ == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "harvest amount must be positive");
    }
    if (resourceQtyMin_ == 0 || resourceQtyMin_ > resourceQtyMax_)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "resource quantity bounds must satisfy 0 < min <= max");
    }
    if (!std::has_single_bit(mailboxCapacity_))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "mailbox capacity must be a power of two");
    }
    return {};
}

} // namespace pxv::sim
