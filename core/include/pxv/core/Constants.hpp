/**
 * @file Constants.hpp
 * @brief Compile-time defaults for the world, the economy and the server.
 *
 * Every runtime-tunable parameter of sim::Config starts from the value
 * declared here.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PXV_CORE_CONSTANTS_HPP
    #define PXV_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace pxv::core {

inline constexpr i32   kDefaultWidth              = 20;
inline constexpr i32   kDefaultHeight             = 20;
inline constexpr u32   kDefaultTickIntervalMs     = 1'000;

inline constexpr u32   kDefaultHarvestAmount      = 10;
inline constexpr u32   kDefaultCraftOreCost       = 1;
inline constexpr u32   kDefaultCraftFuelCost      = 1;

inline constexpr u32   kDefaultInitialResources   = 20;
inline constexpr u32   kDefaultRespawnInterval    = 10;
inline constexpr u32   kDefaultMaxResources       = 50;
inline constexpr u32   kDefaultResourceQtyMin     = 20;
inline constexpr u32   kDefaultResourceQtyMax     = 100;
inline constexpr u64   kDefaultSeed               = 42;

inline constexpr u32   kDefaultDisconnectGrace    = 0;
inline constexpr u32   kDefaultIdleTimeoutMs      = 0;
inline constexpr u32   kDefaultMailboxCapacity    = 64;
inline constexpr u32   kDefaultStatusLogInterval  = 100;

inline constexpr u16   kDefaultPort               = 8765;
inline constexpr u16   kDefaultStatusPort         = 8766;
inline constexpr usize kMaxLineLength             = 4096;
inline constexpr usize kMaxHttpRequestLength      = 8192;

} // namespace pxv::core

#endif // PXV_CORE_CONSTANTS_HPP
