/**
 * @file Expected.hpp
 * @brief Result type of every fallible core operation and its propagation macros.
 *
 * World mutations, queue and session calls, codec and transport functions
 * all return Expected<T>. Errors that belong to a single agent's action
 * are turned into an ActionOutcome by the resolver; everything else is
 * propagated upwards with PXV_TRY / PXV_TRY_VOID.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PXV_CORE_EXPECTED_HPP
    #define PXV_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace pxv::core {

/// @brief Either a T or the Error that prevented it.
template <typename T>
using Expected = std::expected<T, Error>;

namespace detail {

/// @brief Re-wraps the error of a failed Expected<U> for an Expected<T> return.
template <typename Result>
[[nodiscard]] Unexpected forwardError(Result &&failed)
{
    return Unexpected{std::forward<Result>(failed).error()};
}

} // namespace detail

} // namespace pxv::core

/**
 * @brief Evaluates @p expr once; on error returns it from the enclosing
 *        function, otherwise yields the value.
 *
 * Relies on GNU statement expressions. Discard an unused value with
 * `(void) PXV_TRY(...)`.
 */
#define PXV_TRY(expr)                                                      \
    ({                                                                     \
        auto &&pxvTried_ = (expr);                                         \
        if (!pxvTried_) [[unlikely]]                                       \
            return ::pxv::core::detail::forwardError(std::move(pxvTried_)); \
        std::move(*pxvTried_);                                             \
    })

/**
 * @brief Statement form of PXV_TRY for Expected<void> (or an ignored value).
 */
#define PXV_TRY_VOID(expr)                                                 \
    do {                                                                   \
        if (auto &&pxvTried_ = (expr); !pxvTried_) [[unlikely]]            \
            return ::pxv::core::detail::forwardError(std::move(pxvTried_)); \
    } while (false)

#endif // PXV_CORE_EXPECTED_HPP
