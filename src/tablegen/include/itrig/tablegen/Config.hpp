// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Table generator configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder or
/// parsed from command-line arguments.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <itrig/core/Constants.hpp>
#include <itrig/core/Expected.hpp>
#include <itrig/core/Types.hpp>

#include <span>
#include <string>
#include <string_view>

namespace itrig::tablegen {

/// @brief How the generated table is printed.
enum class OutputFormat : core::u8 {
    kHex,   ///< Packed big-endian bytes as one hex string.
    kArray, ///< C++ std::array initializer.
    kList   ///< One decimal value per line.
};

/// @brief Parses a format name ("hex", "array", "list").
[[nodiscard]] core::Expected<OutputFormat> parseFormat(std::string_view name);

/// @brief Immutable generator configuration.
class Config
{
public:
    static constexpr core::u32 kDefaultSampleCount = 1u << core::kIndexWidth;
    static constexpr core::u32 kDefaultAmplitude   = static_cast<core::u32>(core::kAmplitude);

    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& sampleCount(core::u32 n) noexcept;
        Builder& amplitude(core::u32 a) noexcept;
        Builder& format(OutputFormat f) noexcept;
        Builder& verbose(bool enabled) noexcept;
        Builder& verifyHex(std::string hex);
        Builder& helpRequested(bool requested) noexcept;

        [[nodiscard]] Config build() const;

    private:
        core::u32    sampleCount_{kDefaultSampleCount};
        core::u32    amplitude_{kDefaultAmplitude};
        OutputFormat format_{OutputFormat::kHex};
        bool         verbose_{false};
        std::string  verifyHex_;
        bool         helpRequested_{false};
    };

    [[nodiscard]] core::u32          sampleCount()   const noexcept { return sampleCount_; }
    [[nodiscard]] core::u32          amplitude()     const noexcept { return amplitude_; }
    [[nodiscard]] OutputFormat       format()        const noexcept { return format_; }
    [[nodiscard]] bool               verbose()       const noexcept { return verbose_; }
    [[nodiscard]] const std::string& verifyHex()     const noexcept { return verifyHex_; }
    [[nodiscard]] bool               verifyMode()    const noexcept { return !verifyHex_.empty(); }
    [[nodiscard]] bool               helpRequested() const noexcept { return helpRequested_; }

    /// @brief Number of table entries, sentinel included.
    [[nodiscard]] core::u32 entryCount() const noexcept { return sampleCount_ + 1; }

private:
    friend class Builder;

    core::u32    sampleCount_{kDefaultSampleCount};
    core::u32    amplitude_{kDefaultAmplitude};
    OutputFormat format_{OutputFormat::kHex};
    bool         verbose_{false};
    std::string  verifyHex_;
    bool         helpRequested_{false};
};

/// @brief Builds a Config from command-line arguments (program name excluded).
///
/// Recognised flags: --samples N, --amplitude A, --format hex|array|list,
/// --verify HEX, --verbose, --help.  Unknown flags, missing values and
/// non-numeric values yield kInvalidArgument.
[[nodiscard]] core::Expected<Config> parseArguments(std::span<const std::string_view> args);

/// @brief Usage text printed by --help.
[[nodiscard]] std::string_view usage() noexcept;

} // namespace itrig::tablegen
