/**
 * @file TestTableGenerator.cpp
 * @brief Unit tests for tablegen::TableGenerator.
 */

#include <catch2/catch_test_macros.hpp>

#include "itrig/math/SineTable.hpp"
#include "itrig/tablegen/Config.hpp"
#include "itrig/tablegen/TableGenerator.hpp"

#include <string>
#include <vector>

namespace itrig::tablegen {

TEST_CASE("TableGenerator reproduces the runtime sine table", "[tablegen][generator]")
{
    const auto config = Config::Builder{}.build();
    auto table = TableGenerator::generate(config);

    REQUIRE(table.has_value());
    REQUIRE(table->size() == math::SineTable::kEntryCount);

    const auto& runtime = math::SineTable::data();
    REQUIRE(std::vector<core::u16>(runtime.begin(), runtime.end()) == table.value());
}

TEST_CASE("TableGenerator honours sample count and amplitude", "[tablegen][generator]")
{
    SECTION("finer table")
    {
        auto table = TableGenerator::generate(Config::Builder{}.sampleCount(64).build());
        REQUIRE(table.has_value());
        REQUIRE(table->size() == 65);
        REQUIRE(table->front() == 0);
        REQUIRE(table->back() == 32767);
        // every fourth entry coincides with the 16-sample table
        REQUIRE((*table)[32] == math::SineTable::lookup(8));
        REQUIRE(TableGenerator::validate(table.value(), 65, 32767).has_value());
    }

    SECTION("smaller amplitude")
    {
        auto table = TableGenerator::generate(Config::Builder{}.amplitude(1000).build());
        REQUIRE(table.has_value());
        REQUIRE(table->back() == 1000);
        REQUIRE((*table)[8] == 707);
    }

    SECTION("single sample")
    {
        auto table = TableGenerator::generate(Config::Builder{}.sampleCount(1).build());
        REQUIRE(table.has_value());
        REQUIRE(table.value() == std::vector<core::u16>{0, 32767});
    }
}

TEST_CASE("TableGenerator rejects unusable configurations", "[tablegen][generator]")
{
    SECTION("zero samples")
    {
        auto r = TableGenerator::generate(Config::Builder{}.sampleCount(0).build());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("non power of two")
    {
        auto r = TableGenerator::generate(Config::Builder{}.sampleCount(12).build());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("too many samples")
    {
        auto r = TableGenerator::generate(Config::Builder{}.sampleCount(8192).build());
        REQUIRE_FALSE(r.has_value());
    }

    SECTION("amplitude reaching 32768")
    {
        auto r = TableGenerator::generate(Config::Builder{}.amplitude(32768).build());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("zero amplitude")
    {
        auto r = TableGenerator::generate(Config::Builder{}.amplitude(0).build());
        REQUIRE_FALSE(r.has_value());
    }
}

TEST_CASE("TableGenerator::validate enforces the table contract", "[tablegen][generator]")
{
    const auto& runtime = math::SineTable::data();
    std::vector<core::u16> table(runtime.begin(), runtime.end());

    SECTION("runtime table passes")
    {
        REQUIRE(TableGenerator::validate(table, 17, 32767).has_value());
    }

    SECTION("missing sentinel")
    {
        table.pop_back();
        auto r = TableGenerator::validate(table, 17, 32767);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == core::ErrorCode::kCorruptedData);
    }

    SECTION("non-zero first entry")
    {
        table.front() = 1;
        REQUIRE_FALSE(TableGenerator::validate(table, 17, 32767).has_value());
    }

    SECTION("wrong sentinel value")
    {
        table.back() = 32768;
        REQUIRE_FALSE(TableGenerator::validate(table, 17, 32767).has_value());
    }

    SECTION("decreasing entry")
    {
        table[5] = static_cast<core::u16>(table[4] - 1);
        auto r = TableGenerator::validate(table, 17, 32767);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == core::ErrorCode::kCorruptedData);
    }

    SECTION("empty table")
    {
        REQUIRE_FALSE(TableGenerator::validate({}, 0, 32767).has_value());
    }
}

TEST_CASE("TableGenerator::compare reports the first difference", "[tablegen][generator]")
{
    const std::vector<core::u16> reference = {0, 10, 20, 30};

    REQUIRE(TableGenerator::compare(reference, reference).has_value());

    const std::vector<core::u16> shifted = {0, 10, 21, 30};
    auto r = TableGenerator::compare(shifted, reference);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code() == core::ErrorCode::kMismatch);
    REQUIRE(r.error().message().find("entry 2") != std::string::npos);

    const std::vector<core::u16> shorter = {0, 10, 20};
    REQUIRE_FALSE(TableGenerator::compare(shorter, reference).has_value());
}

} // namespace itrig::tablegen
