// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation and argument parsing.
// /////////////////////////////////////////////////////////////////////////////

#include <itrig/tablegen/Config.hpp>

#include <charconv>
#include <string>
#include <utility>

namespace itrig::tablegen {

namespace {

core::Expected<core::u32> parseUnsigned(std::string_view flag, std::string_view text)
{
    core::u32 value = 0;
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::string{flag} + ": expected an unsigned integer, got '" + std::string{text} + "'");
    }
    return value;
}

} // anonymous namespace

core::Expected<OutputFormat> parseFormat(std::string_view name)
{
    if (name == "hex")   return OutputFormat::kHex;
    if (name == "array") return OutputFormat::kArray;
    if (name == "list")  return OutputFormat::kList;
    return core::makeError(core::ErrorCode::kInvalidArgument,
        "unknown output format '" + std::string{name} + "' (expected hex, array or list)");
}

Config::Builder& Config::Builder::sampleCount(core::u32 n) noexcept
{
    sampleCount_ = n;
    return *this;
}

Config::Builder& Config::Builder::amplitude(core::u32 a) noexcept
{
    amplitude_ = a;
    return *this;
}

Config::Builder& Config::Builder::format(OutputFormat f) noexcept
{
    format_ = f;
    return *this;
}

Config::Builder& Config::Builder::verbose(bool enabled) noexcept
{
    verbose_ = enabled;
    return *this;
}

Config::Builder& Config::Builder::verifyHex(std::string hex)
{
    verifyHex_ = std::move(hex);
    return *this;
}

Config::Builder& Config::Builder::helpRequested(bool requested) noexcept
{
    helpRequested_ = requested;
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg.sampleCount_   = sampleCount_;
    cfg.amplitude_     = amplitude_;
    cfg.format_        = format_;
    cfg.verbose_       = verbose_;
    cfg.verifyHex_     = verifyHex_;
    cfg.helpRequested_ = helpRequested_;
    return cfg;
}

core::Expected<Config> parseArguments(std::span<const std::string_view> args)
{
    Config::Builder builder;

    for (core::usize i = 0; i < args.size(); ++i)
    {
        const std::string_view flag = args[i];

        if (flag == "--help" || flag == "-h")
        {
            builder.helpRequested(true);
            continue;
        }
        if (flag == "--verbose" || flag == "-v")
        {
            builder.verbose(true);
            continue;
        }

        if (flag != "--samples" && flag != "--amplitude" && flag != "--format" && flag != "--verify")
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                "unknown option '" + std::string{flag} + "'");
        }
        if (i + 1 >= args.size())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::string{flag} + ": missing value");
        }
        const std::string_view value = args[++i];

        if (flag == "--samples")
            builder.sampleCount(ITRIG_TRY(parseUnsigned(flag, value)));
        else if (flag == "--amplitude")
            builder.amplitude(ITRIG_TRY(parseUnsigned(flag, value)));
        else if (flag == "--format")
            builder.format(ITRIG_TRY(parseFormat(value)));
        else
            builder.verifyHex(std::string{value});
    }

    return builder.build();
}

std::string_view usage() noexcept
{
    return "usage: inttrig-gentable [options]\n"
           "  --samples N      samples per quadrant, power of two (default 16)\n"
           "  --amplitude A    value of sin(90 deg), at most 32767 (default 32767)\n"
           "  --format F       hex | array | list (default hex)\n"
           "  --verify HEX     check a packed big-endian table against the generator\n"
           "  --verbose        debug logging\n"
           "  --help           this text\n";
}

} // namespace itrig::tablegen
