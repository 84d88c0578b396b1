/**
 * @file TestBitField.cpp
 * @brief Unit tests for math::bits.
 */

#include <catch2/catch_test_macros.hpp>

#include "itrig/core/Constants.hpp"
#include "itrig/core/Types.hpp"
#include "itrig/math/BitField.hpp"

namespace itrig::math {

TEST_CASE("bits::mask sets the low bits", "[math][bits]")
{
    REQUIRE(bits::mask<core::u16>(0) == 0x0000);
    REQUIRE(bits::mask<core::u16>(4) == 0x000F);
    REQUIRE(bits::mask<core::u16>(8) == 0x00FF);
    REQUIRE(bits::mask<core::u16>(16) == 0xFFFF);
    REQUIRE(bits::mask<core::u32>(32) == 0xFFFFFFFFu);
}

TEST_CASE("bits::extract shifts then masks", "[math][bits]")
{
    SECTION("runtime width and offset")
    {
        REQUIRE(bits::extract<core::u16>(0xABCD, 4, 0) == 0xD);
        REQUIRE(bits::extract<core::u16>(0xABCD, 4, 4) == 0xC);
        REQUIRE(bits::extract<core::u16>(0xABCD, 8, 8) == 0xAB);
        REQUIRE(bits::extract<core::u16>(0xABCD, 16, 0) == 0xABCD);
        REQUIRE(bits::extract<core::u32>(0x80000000u, 1, 31) == 1u);
    }

    SECTION("compile-time width and offset")
    {
        STATIC_REQUIRE(bits::extract<4, 8>(core::u16{0x0F00}) == 0xF);
        STATIC_REQUIRE(bits::extract<8, 0>(core::u16{0x12FE}) == 0xFE);
        STATIC_REQUIRE(bits::extract<2, 12>(core::u16{0x3000}) == 0x3);
    }

    SECTION("matches division and modulo")
    {
        for (core::u32 v = 0; v < 0x10000; v += 97)
        {
            const auto value = static_cast<core::u16>(v);
            REQUIRE(bits::extract<core::u16>(value, 4, 8) == (v / 256) % 16);
            REQUIRE(bits::extract<core::u16>(value, 8, 0) == v % 256);
        }
    }
}

TEST_CASE("bits::extract decomposes a binary angle", "[math][bits]")
{
    // 0x2A7F: quadrant 2, segment 10, fraction 0x7F
    const core::u16 angle = 0x2A7F;

    REQUIRE(bits::extract<core::kInterpWidth, core::kInterpOffset>(angle) == 0x7F);
    REQUIRE(bits::extract<core::kIndexWidth, core::kIndexOffset>(angle) == 10);
    REQUIRE(bits::extract<core::u16>(angle, 2, 12) == 2);
}

} // namespace itrig::math
