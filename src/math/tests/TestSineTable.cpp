/**
 * @file TestSineTable.cpp
 * @brief Unit tests for math::SineTable.
 */

#include <catch2/catch_test_macros.hpp>

#include "itrig/math/SineTable.hpp"

namespace itrig::math {

TEST_CASE("SineTable carries 16 samples and a sentinel", "[math][table]")
{
    STATIC_REQUIRE(SineTable::kSampleCount == 16);
    STATIC_REQUIRE(SineTable::kEntryCount == 17);
    STATIC_REQUIRE(SineTable::data().size() == SineTable::kEntryCount);

    REQUIRE(SineTable::lookup(0) == 0);
    REQUIRE(SineTable::lookup(8) == 0x5a82);
    REQUIRE(SineTable::lookup(15) == 0x7f61);
    REQUIRE(SineTable::lookup(16) == 0x7fff);
}

TEST_CASE("SineTable values are the reference magnitudes", "[math][table]")
{
    const SineTable::Data expected = {
        0, 3212, 6393, 9512, 12539, 15446, 18204, 20787,
        23170, 25329, 27245, 28898, 30273, 31356, 32137, 32609,
        32767
    };
    REQUIRE(SineTable::data() == expected);
}

TEST_CASE("SineTable::at checks bounds against the sentinel", "[math][table]")
{
    SECTION("sentinel is addressable")
    {
        auto r = SineTable::at(16);
        REQUIRE(r.has_value());
        REQUIRE(*r == 32767);
    }

    SECTION("first entry")
    {
        auto r = SineTable::at(0);
        REQUIRE(r.has_value());
        REQUIRE(*r == 0);
    }

    SECTION("past the sentinel fails")
    {
        auto r = SineTable::at(17);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == core::ErrorCode::kOutOfRange);
    }

    SECTION("far out of range fails")
    {
        auto r = SineTable::at(0xFFFFFFFFu);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == core::ErrorCode::kOutOfRange);
    }
}

TEST_CASE("SineTable is non-decreasing", "[math][table]")
{
    for (core::u32 i = 1; i < SineTable::kEntryCount; ++i)
        REQUIRE(SineTable::lookup(i) >= SineTable::lookup(i - 1));
}

} // namespace itrig::math
