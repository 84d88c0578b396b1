/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * ITRIG_ASSERT is evaluated in debug builds only (ITRIG_DEBUG).  A failing
 * check prints the expression with file, line and function, then aborts.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ITRIG_CORE_ASSERT_HPP
    #define ITRIG_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace itrig::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[ITRIG ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), static_cast<unsigned>(loc.line()), loc.function_name(), expr
    );
    std::abort();
}

} // namespace itrig::core::detail

    #ifdef ITRIG_DEBUG
        #define ITRIG_ASSERT(cond)                                        \
            do {                                                           \
                if (ITRIG_UNLIKELY(!(cond)))                               \
                    ::itrig::core::detail::assertFail(#cond);              \
            } while (false)
    #else
        #define ITRIG_ASSERT(cond) ((void)0)
    #endif

#endif // ITRIG_CORE_ASSERT_HPP
