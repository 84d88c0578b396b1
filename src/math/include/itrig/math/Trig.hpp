/**
 * @file Trig.hpp
 * @brief Integer sine and cosine over a 16384-unit circle.
 *
 * Angles are binary angle measure: 16384 units per turn, 4096 per
 * quadrant.  Results are scaled to [-32767, 32767].  Evaluation uses
 * integer arithmetic only: one quarter-wave table lookup pair and one
 * linear interpolation step with a 1/256 weight, with quadrant symmetry
 * (mirror and sign flip) reconstructing the other three quadrants.
 *
 * Only the low 14 bits of an angle are significant; bits 14-15 are
 * ignored, so every u16 is a valid input.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ITRIG_MATH_TRIG_HPP
    #define ITRIG_MATH_TRIG_HPP

    #include <itrig/core/Types.hpp>

namespace itrig::math {

/**
 * @brief Table-driven integer trigonometry.
 */
class Trig final {
public:
    Trig() = delete;

    /**
     * @brief Compute the sine of a binary angle.
     * @param angle Angle in units of 1/16384 turn.
     * @return sin(angle) scaled to [-32767, 32767].
     */
    [[nodiscard]] static core::i32 sin(core::u16 angle) noexcept;

    /**
     * @brief Compute the cosine of a binary angle.
     *
     * Evaluated as sin(angle + 4096) with the sum wrapped back into the
     * 14-bit angle domain.
     *
     * @param angle Angle in units of 1/16384 turn.
     * @return cos(angle) scaled to [-32767, 32767].
     */
    [[nodiscard]] static core::i32 cos(core::u16 angle) noexcept;

    /**
     * @brief Simultaneously compute sine and cosine.
     * @param angle  Angle in units of 1/16384 turn.
     * @param[out] outSin Result sine value.
     * @param[out] outCos Result cosine value.
     */
    static void sincos(core::u16 angle, core::i32 &outSin, core::i32 &outCos) noexcept;
};

} // namespace itrig::math

#endif // ITRIG_MATH_TRIG_HPP
