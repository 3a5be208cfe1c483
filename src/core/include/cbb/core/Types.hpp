/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every module.
 *
 * Provides fixed-width integer and floating-point aliases plus the
 * identifiers used to key time series (owner ids and second timestamps).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef CBB_CORE_TYPES_HPP
    #define CBB_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace cbb::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

/// @brief Identifier of the entity owning a time series (e.g. a subject).
using OwnerId = i64;

/// @brief Integer timestamp in seconds, strictly increasing per owner.
using Timestamp = i64;

} // namespace cbb::core

#endif // CBB_CORE_TYPES_HPP
