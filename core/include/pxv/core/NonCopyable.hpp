/**
 * @file NonCopyable.hpp
 * @brief CRTP bases pinning object identity.
 *
 * NonCopyable forbids copies but lets ownership move (entity stores,
 * sessions). NonMovable also forbids moves, for objects other components
 * hold by reference for their whole life (the world, the action queue,
 * the session registry, the tick engine, mailboxes).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PXV_CORE_NON_COPYABLE_HPP
    #define PXV_CORE_NON_COPYABLE_HPP

namespace pxv::core {

/**
 * @brief Deletes copy construction and assignment; moves stay available.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    constexpr NonCopyable() noexcept = default;
    ~NonCopyable() = default;

public:
    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

protected:
    NonCopyable(NonCopyable &&) noexcept = default;
    NonCopyable &operator=(NonCopyable &&) noexcept = default;
};

/**
 * @brief Deletes copies and moves: the address of a Derived never changes
 *        hands, so references handed out at construction stay valid.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonMovable {
protected:
    constexpr NonMovable() noexcept = default;
    ~NonMovable() = default;

public:
    NonMovable(const NonMovable &) = delete;
    NonMovable &operator=(const NonMovable &) = delete;
    NonMovable(NonMovable &&) = delete;
    NonMovable &operator=(NonMovable &&) = delete;
};

} // namespace pxv::core

#endif // PXV_CORE_NON_COPYABLE_HPP
