/**
 * @file Trig.cpp
 * @brief Quadrant folding and linear interpolation over the sine table.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "itrig/math/Trig.hpp"

#include "itrig/core/Constants.hpp"
#include "itrig/math/BitField.hpp"
#include "itrig/math/SineTable.hpp"

namespace itrig::math {

core::i32 Trig::sin(core::u16 angle) noexcept
{
    const auto interp = static_cast<core::i32>(
        bits::extract<core::kInterpWidth, core::kInterpOffset>(angle));
    auto index = static_cast<core::u32>(
        bits::extract<core::kIndexWidth, core::kIndexOffset>(angle));

    // Quadrants 0 and 2 read the table forward, 1 and 3 read it mirrored.
    const bool ascending = (angle & core::kQuadrantLowMask) == 0;
    const bool negative  = (angle & core::kQuadrantHighMask) != 0;

    if (!ascending)
        index = SineTable::kSampleCount - 1 - index;

    const auto x1 = static_cast<core::i32>(SineTable::lookup(index));
    const auto x2 = static_cast<core::i32>(SineTable::lookup(index + 1));

    const core::i32 approximation = ((x2 - x1) * interp) / core::kInterpScale;

    const core::i32 sine = ascending ? x1 + approximation : x2 - approximation;
    return negative ? -sine : sine;
}

core::i32 Trig::cos(core::u16 angle) noexcept
{
    const auto shifted = static_cast<core::u16>(
        (static_cast<core::u32>(angle) + core::kAnglesInQuadrant) & core::kAngleMask);
    return sin(shifted);
}

void Trig::sincos(core::u16 angle, core::i32 &outSin, core::i32 &outCos) noexcept
{
    outSin = sin(angle);
    outCos = cos(angle);
}

} // namespace itrig::math
