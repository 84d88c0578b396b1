/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every IntTrig module.
 *
 * Fixed-width integer aliases used throughout the runtime core and the
 * offline tooling.  The runtime core restricts itself to the integer
 * aliases; f64 exists for the table generator only.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ITRIG_CORE_TYPES_HPP
    #define ITRIG_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace itrig::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f64 = double;

using usize = std::size_t;

} // namespace itrig::core

#endif // ITRIG_CORE_TYPES_HPP
