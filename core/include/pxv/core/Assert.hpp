/**
 * @file Assert.hpp
 * @brief Debug assertions, contract checks and the fatal-invariant halt.
 *
 * Provides PXV_ASSERT (debug-only), PXV_VERIFY (always evaluated), and
 * PXV_UNREACHABLE (marks provably dead code paths).  The macros print the
 * failing expression together with the file, line, and function before
 * aborting.  In release builds PXV_ASSERT is a no-op.
 *
 * fatalInvariant() is the single terminating path for simulation state
 * corruption: it reports the Error through the logging facade and aborts.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PXV_CORE_ASSERT_HPP
    #define PXV_CORE_ASSERT_HPP

    #include "Error.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace pxv::core {

/**
 * @brief Logs @p error at FATAL level with its origin and aborts.
 */
[[noreturn]] void fatalInvariant(const Error &error);

} // namespace pxv::core

namespace pxv::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[PXV ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace pxv::core::detail

    #ifdef PXV_DEBUG
        #define PXV_ASSERT(cond)                                          \
            do {                                                           \
                if (!(cond)) [[unlikely]]                                  \
                    ::pxv::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define PXV_ASSERT(cond) ((void)0)
    #endif

    #define PXV_VERIFY(cond)                                              \
        do {                                                               \
            if (!(cond)) [[unlikely]]                                      \
                ::pxv::core::detail::assertFail(#cond);                    \
        } while (false)

    #define PXV_UNREACHABLE()                                             \
        do {                                                               \
            ::pxv::core::detail::assertFail("UNREACHABLE");                \
            __builtin_unreachable();                                       \
        } while (false)

#endif // PXV_CORE_ASSERT_HPP
