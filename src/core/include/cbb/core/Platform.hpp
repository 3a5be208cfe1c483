/**
 * @file Platform.hpp
 * @brief Branch-prediction hint used by the assertion macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef CBB_CORE_PLATFORM_HPP
    #define CBB_CORE_PLATFORM_HPP

    #if defined(__GNUC__) || defined(__clang__)
        #define CBB_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define CBB_UNLIKELY(x) (x)
    #endif

#endif // CBB_CORE_PLATFORM_HPP
