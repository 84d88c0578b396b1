/**
 * @file TestLog.cpp
 * @brief Unit tests for core::Log.
 */

#include <catch2/catch_test_macros.hpp>

#include "itrig/core/Log.hpp"

#include <string>
#include <vector>

namespace itrig::core {

namespace {

class CapturingLogger final : public ILogger {
public:
    struct Entry {
        LogLevel    level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

class ScopedLogger {
public:
    explicit ScopedLogger(ILogger* logger) : _previousLevel(Log::minLevel())
    {
        Log::setLogger(logger);
    }

    ~ScopedLogger()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(_previousLevel);
    }

private:
    LogLevel _previousLevel;
};

} // namespace

TEST_CASE("Log routes messages to the installed logger", "[core][log]")
{
    CapturingLogger sink;
    ScopedLogger scope(&sink);
    Log::setMinLevel(LogLevel::kDebug);

    Log::info("GEN", "generated");
    Log::warn("fallback tag");

    REQUIRE(sink.entries.size() == 2);
    REQUIRE(sink.entries[0].level == LogLevel::kInfo);
    REQUIRE(sink.entries[0].tag == "GEN");
    REQUIRE(sink.entries[0].message == "generated");
    REQUIRE(sink.entries[1].level == LogLevel::kWarn);
    REQUIRE(sink.entries[1].tag == "itrig");
}

TEST_CASE("Log drops messages below the minimum level", "[core][log]")
{
    CapturingLogger sink;
    ScopedLogger scope(&sink);
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("CLI", "hidden");
    Log::info("CLI", "hidden");
    Log::warn("CLI", "shown");
    Log::error("CLI", "shown");
    Log::fatal("CLI", "shown");

    REQUIRE(sink.entries.size() == 3);
    REQUIRE(sink.entries.front().level == LogLevel::kWarn);
    REQUIRE(sink.entries.back().level == LogLevel::kFatal);
}

TEST_CASE("Log::setLogger(nullptr) restores the default sink", "[core][log]")
{
    CapturingLogger sink;
    {
        ScopedLogger scope(&sink);
        Log::info("inside");
    }
    Log::info("outside");

    REQUIRE(sink.entries.size() == 1);
}

} // namespace itrig::core
