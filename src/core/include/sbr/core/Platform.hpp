/**
 * @file Platform.hpp
 * @brief Compiler detection, branch hints and the CPU pause used by
 *        spinning primitives.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SBR_CORE_PLATFORM_HPP
    #define SBR_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define SBR_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define SBR_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define SBR_COMPILER_MSVC  1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(SBR_COMPILER_GCC) || defined(SBR_COMPILER_CLANG)
        #define SBR_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define SBR_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define SBR_LIKELY(x)       (x)
        #define SBR_UNLIKELY(x)     (x)
    #endif

// ---- CPU Pause Hint ------------------------------------------------------

    #if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
        #include <immintrin.h>
        #define SBR_CPU_PAUSE() _mm_pause()
    #elif defined(__aarch64__) || defined(_M_ARM64)
        #define SBR_CPU_PAUSE() __asm__ volatile("yield")
    #else
        #define SBR_CPU_PAUSE() ((void)0)
    #endif

#endif // SBR_CORE_PLATFORM_HPP
