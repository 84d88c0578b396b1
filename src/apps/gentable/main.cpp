// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief inttrig-gentable entry-point.
///
/// Generates the quarter-wave sine table offline and prints it, or
/// verifies a packed big-endian table against a fresh generation.
///
/// Exit codes: 0 success, 1 verification failure, 2 usage error.
// /////////////////////////////////////////////////////////////////////////////

#include <itrig/core/Log.hpp>
#include <itrig/core/Types.hpp>
#include <itrig/tablegen/Config.hpp>
#include <itrig/tablegen/TableCodec.hpp>
#include <itrig/tablegen/TableGenerator.hpp>

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

using namespace itrig;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitMismatch = 1;
constexpr int kExitUsage    = 2;

void reportError(std::string_view what, const core::Error& err)
{
    core::Log::error("CLI", std::string{what} + ": [" + std::string{core::toString(err.code())}
        + "] " + err.message());
}

void printTable(const std::vector<core::u16>& table, tablegen::OutputFormat format)
{
    switch (format)
    {
    case tablegen::OutputFormat::kHex:
        std::printf("%s\n", tablegen::codec::toHex(tablegen::codec::encode(table)).c_str());
        break;
    case tablegen::OutputFormat::kArray:
        std::printf("%s", tablegen::codec::toCppArray(table, "kSineTable").c_str());
        break;
    case tablegen::OutputFormat::kList:
        for (const core::u16 value : table)
            std::printf("%u\n", static_cast<unsigned>(value));
        break;
    }
}

int verify(const tablegen::Config& config, const std::vector<core::u16>& reference)
{
    auto bytes = tablegen::codec::fromHex(config.verifyHex());
    if (!bytes)
    {
        reportError("verify", bytes.error());
        return kExitUsage;
    }

    auto table = tablegen::codec::decode(bytes.value());
    if (!table)
    {
        reportError("verify", table.error());
        return kExitMismatch;
    }

    auto valid = tablegen::TableGenerator::validate(table.value(), config.entryCount(), config.amplitude());
    if (!valid)
    {
        reportError("verify", valid.error());
        return kExitMismatch;
    }

    auto same = tablegen::TableGenerator::compare(table.value(), reference);
    if (!same)
    {
        reportError("verify", same.error());
        return kExitMismatch;
    }

    core::Log::info("CLI", "table verified: " + std::to_string(table->size()) + " entries match");
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    auto config = tablegen::parseArguments(args);
    if (!config)
    {
        reportError("arguments", config.error());
        std::fprintf(stderr, "%.*s", static_cast<int>(tablegen::usage().size()), tablegen::usage().data());
        return kExitUsage;
    }

    if (config->helpRequested())
    {
        std::printf("%.*s", static_cast<int>(tablegen::usage().size()), tablegen::usage().data());
        return kExitOk;
    }

    if (config->verbose())
        core::Log::setMinLevel(core::LogLevel::kDebug);

    auto table = tablegen::TableGenerator::generate(config.value());
    if (!table)
    {
        reportError("generate", table.error());
        return kExitUsage;
    }

    if (config->verifyMode())
        return verify(config.value(), table.value());

    auto valid = tablegen::TableGenerator::validate(table.value(), config->entryCount(), config->amplitude());
    if (!valid)
    {
        reportError("generate", valid.error());
        return kExitMismatch;
    }

    printTable(table.value(), config->format());
    return kExitOk;
}
