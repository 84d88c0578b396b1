/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and portability macros.
 *
 * Detects the compiler at preprocessing time and provides
 * branch-prediction hints.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ITRIG_CORE_PLATFORM_HPP
    #define ITRIG_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define ITRIG_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define ITRIG_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define ITRIG_COMPILER_MSVC  1
    #else
        #define ITRIG_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(ITRIG_COMPILER_GCC) || defined(ITRIG_COMPILER_CLANG)
        #define ITRIG_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define ITRIG_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #elif defined(ITRIG_COMPILER_MSVC)
        #define ITRIG_LIKELY(x)       (x)
        #define ITRIG_UNLIKELY(x)     (x)
    #else
        #define ITRIG_LIKELY(x)       (x)
        #define ITRIG_UNLIKELY(x)     (x)
    #endif

#endif // ITRIG_CORE_PLATFORM_HPP
