/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides CBB_ASSERT (debug-only), CBB_VERIFY (always evaluated), and
 * CBB_UNREACHABLE (marks provably dead code paths).  The macros report the
 * failing expression together with the file, line, and function before
 * aborting.  In release builds CBB_ASSERT is a no-op.
 *
 * These guard internal invariants only; recoverable failures travel as
 * Expected<T>.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef CBB_CORE_ASSERT_HPP
    #define CBB_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace cbb::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[CBB ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace cbb::core::detail

    #ifdef CBB_DEBUG
        #define CBB_ASSERT(cond)                                          \
            do {                                                           \
                if (CBB_UNLIKELY(!(cond)))                                 \
                    ::cbb::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define CBB_ASSERT(cond) ((void)0)
    #endif

    #define CBB_VERIFY(cond)                                              \
        do {                                                               \
            if (CBB_UNLIKELY(!(cond)))                                     \
                ::cbb::core::detail::assertFail(#cond);                    \
        } while (false)

    #define CBB_UNREACHABLE()                                             \
        do {                                                               \
            ::cbb::core::detail::assertFail("UNREACHABLE");                \
            __builtin_unreachable();                                       \
        } while (false)

#endif // CBB_CORE_ASSERT_HPP
