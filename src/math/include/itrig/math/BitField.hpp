/**
 * @file BitField.hpp
 * @brief Bit-field extraction helpers used to decompose binary angles.
 *
 * An angle is split into quadrant flags, a table index and an
 * interpolation fraction by shifting and masking; these helpers name
 * that operation.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ITRIG_MATH_BIT_FIELD_HPP
    #define ITRIG_MATH_BIT_FIELD_HPP

    #include <itrig/core/Assert.hpp>
    #include <itrig/core/Types.hpp>

    #include <limits>
    #include <type_traits>

namespace itrig::math::bits {

/**
 * @brief Mask with the low @p width bits set.
 *
 * @p width may equal the bit width of @p T, in which case every bit is set.
 */
template <typename T>
    requires std::is_unsigned_v<T>
[[nodiscard]] constexpr T mask(core::u32 width) noexcept
{
    ITRIG_ASSERT(width <= static_cast<core::u32>(std::numeric_limits<T>::digits));
    if (width >= static_cast<core::u32>(std::numeric_limits<T>::digits))
        return std::numeric_limits<T>::max();
    return static_cast<T>((T{1} << width) - T{1});
}

/**
 * @brief Extract @p width bits of @p value starting at bit @p offset.
 * @param value  Source word.
 * @param width  Number of bits to keep.
 * @param offset Position of the lowest extracted bit.
 * @return The bit-field in [0, 2^width - 1].
 *
 * Requires width + offset to fit the word; checked in debug builds.
 */
template <typename T>
    requires std::is_unsigned_v<T>
[[nodiscard]] constexpr T extract(T value, core::u32 width, core::u32 offset) noexcept
{
    ITRIG_ASSERT(width + offset <= static_cast<core::u32>(std::numeric_limits<T>::digits));
    if (offset >= static_cast<core::u32>(std::numeric_limits<T>::digits))
        return T{0};
    return static_cast<T>((value >> offset) & mask<T>(width));
}

/**
 * @brief Compile-time-parameterised variant of extract().
 */
template <core::u32 Width, core::u32 Offset, typename T>
    requires std::is_unsigned_v<T>
[[nodiscard]] constexpr T extract(T value) noexcept
{
    static_assert(Width > 0, "bit-field must be at least one bit wide");
    static_assert(Width + Offset <= static_cast<core::u32>(std::numeric_limits<T>::digits),
                  "bit-field exceeds the word size");
    return static_cast<T>((value >> Offset) & mask<T>(Width));
}

} // namespace itrig::math::bits

#endif // ITRIG_MATH_BIT_FIELD_HPP
