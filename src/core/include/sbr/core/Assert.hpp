/**
 * @file Assert.hpp
 * @brief Contract-checking macros with source location.
 *
 * SBR_ASSERT is compiled only when SBR_DEBUG is defined, SBR_VERIFY is
 * always evaluated and SBR_UNREACHABLE marks dead paths.  A failing check
 * goes through the Log façade at fatal level, then aborts: a broken
 * contract in the reconciler is a bug in the calling session layer.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SBR_CORE_ASSERT_HPP
    #define SBR_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <source_location>

namespace sbr::core::detail {

[[noreturn]] void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
);

} // namespace sbr::core::detail

    #ifdef SBR_DEBUG
        #define SBR_ASSERT(cond)                                          \
            do {                                                           \
                if (SBR_UNLIKELY(!(cond)))                                 \
                    ::sbr::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define SBR_ASSERT(cond) ((void)0)
    #endif

    #define SBR_VERIFY(cond)                                              \
        do {                                                               \
            if (SBR_UNLIKELY(!(cond)))                                     \
                ::sbr::core::detail::assertFail(#cond);                    \
        } while (false)

    #define SBR_UNREACHABLE()                                             \
        do {                                                               \
            ::sbr::core::detail::assertFail("UNREACHABLE");                \
            __builtin_unreachable();                                       \
        } while (false)

#endif // SBR_CORE_ASSERT_HPP
