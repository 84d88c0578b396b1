/**
 * @file Constants.hpp
 * @brief Compile-time constants of the binary angle domain.
 *
 * A full turn is 2^14 angle units.  Bits 12-13 of an angle select the
 * quadrant, bits 8-11 the table segment and bits 0-7 the interpolation
 * weight inside that segment.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ITRIG_CORE_CONSTANTS_HPP
    #define ITRIG_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace itrig::core {

inline constexpr u32 kAngleBits          = 14;
inline constexpr u32 kAnglesInCycle      = 1u << kAngleBits;   // 16384
inline constexpr u32 kAngleMask          = kAnglesInCycle - 1; // 0x3FFF
inline constexpr u32 kAnglesInQuadrant   = kAnglesInCycle / 4; // 4096

inline constexpr u32 kQuadrantHighMask   = 0x2000;
inline constexpr u32 kQuadrantLowMask    = 0x1000;

inline constexpr u32 kIndexWidth         = 4;
inline constexpr u32 kIndexOffset        = 8;
inline constexpr u32 kInterpWidth        = 8;
inline constexpr u32 kInterpOffset       = 0;
inline constexpr i32 kInterpScale        = 1 << kInterpWidth;  // 256

inline constexpr i32 kAmplitude          = 32767;

} // namespace itrig::core

#endif // ITRIG_CORE_CONSTANTS_HPP
