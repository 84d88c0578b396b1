/**
 * @file SineTable.hpp
 * @brief Quarter-wave sine table in binary angle units.
 *
 * Sixteen samples of sin(theta) for theta = 0, 256, ..., 3840 angle units
 * (one quadrant is 4096 units), scaled to 32767, followed by a sentinel
 * entry holding sin(4096) = 32767.  The sentinel gives the last sample a
 * successor, so interpolating between entry i and i + 1 is defined for
 * every segment index i in [0, 15].
 *
 * The values are produced offline by the table generator
 * (see itrig/tablegen/TableGenerator.hpp) and stored as immutable
 * compile-time data.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ITRIG_MATH_SINE_TABLE_HPP
    #define ITRIG_MATH_SINE_TABLE_HPP

    #include <itrig/core/Assert.hpp>
    #include <itrig/core/Constants.hpp>
    #include <itrig/core/Expected.hpp>
    #include <itrig/core/Types.hpp>

    #include <array>

namespace itrig::math {

/**
 * @brief Immutable 17-entry sine table (16 samples + sentinel).
 */
class SineTable final {
public:
    SineTable() = delete;

    static constexpr core::u32 kSampleCount  = 1u << core::kIndexWidth;
    static constexpr core::u32 kEntryCount   = kSampleCount + 1;
    static constexpr core::u16 kMaxMagnitude = static_cast<core::u16>(core::kAmplitude);

    using Data = std::array<core::u16, kEntryCount>;

    /**
     * @brief Unchecked lookup.
     * @param index Entry index in [0, kEntryCount - 1].
     * @return Table magnitude at @p index.
     */
    [[nodiscard]] static constexpr core::u16 lookup(core::u32 index) noexcept
    {
        ITRIG_ASSERT(index < kEntryCount);
        return kData[index];
    }

    /**
     * @brief Bounds-checked lookup.
     * @param index Entry index.
     * @return The magnitude, or kOutOfRange when @p index > kSampleCount.
     */
    [[nodiscard]] static core::Expected<core::u16> at(core::u32 index);

    /// @brief Whole table, sentinel included.
    [[nodiscard]] static constexpr const Data &data() noexcept { return kData; }

private:
    static constexpr Data kData = {
        0x0000, 0x0c8c, 0x18f9, 0x2528, 0x30fb, 0x3c56, 0x471c, 0x5133,
        0x5a82, 0x62f1, 0x6a6d, 0x70e2, 0x7641, 0x7a7c, 0x7d89, 0x7f61,
        0x7fff
    };
};

namespace detail {

[[nodiscard]] constexpr bool isNonDecreasing(const SineTable::Data &table)
{
    for (core::u32 i = 1; i < table.size(); ++i)
        if (table[i] < table[i - 1])
            return false;
    return true;
}

} // namespace detail

static_assert(SineTable::kEntryCount == SineTable::kSampleCount + 1, "table must carry a sentinel entry");
static_assert(SineTable::data().front() == 0, "sin(0) must be zero");
static_assert(SineTable::data().back() == SineTable::kMaxMagnitude, "sentinel must hold the full amplitude");
static_assert(detail::isNonDecreasing(SineTable::data()), "quarter-wave table must be non-decreasing");

} // namespace itrig::math

#endif // ITRIG_MATH_SINE_TABLE_HPP
