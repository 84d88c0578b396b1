// /////////////////////////////////////////////////////////////////////////////
/// @file TableGenerator.cpp
/// @brief TableGenerator implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <itrig/tablegen/TableGenerator.hpp>
#include <itrig/core/Constants.hpp>
#include <itrig/core/Log.hpp>

#include <bit>
#include <cmath>
#include <numbers>
#include <string>

namespace itrig::tablegen {

core::Expected<std::vector<core::u16>> TableGenerator::generate(const Config& config)
{
    const core::u32 samples   = config.sampleCount();
    const core::u32 amplitude = config.amplitude();

    if (samples == 0 || !std::has_single_bit(samples) || samples > kMaxSampleCount)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "sample count must be a power of two in [1, " + std::to_string(kMaxSampleCount)
                + "], got " + std::to_string(samples));
    }
    if (amplitude == 0 || amplitude > static_cast<core::u32>(core::kAmplitude))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "amplitude must be in [1, " + std::to_string(core::kAmplitude) + "], got "
                + std::to_string(amplitude));
    }

    std::vector<core::u16> table;
    table.reserve(samples + 1);

    const core::f64 step  = std::numbers::pi / (2.0 * static_cast<core::f64>(samples));
    const core::f64 scale = static_cast<core::f64>(amplitude);
    for (core::u32 k = 0; k <= samples; ++k)
    {
        const core::f64 value = std::sin(step * static_cast<core::f64>(k)) * scale;
        table.push_back(static_cast<core::u16>(std::lround(value)));
    }

    // sin(pi/2) may land a hair below 1.0; the sentinel is exact by definition.
    table.back() = static_cast<core::u16>(amplitude);

    core::Log::debug("GEN", "generated " + std::to_string(table.size()) + " entries, amplitude "
        + std::to_string(amplitude));
    return table;
}

core::ExpectedVoid TableGenerator::validate(std::span<const core::u16> table,
                                            core::u32 expectedEntries,
                                            core::u32 amplitude)
{
    if (table.size() != expectedEntries || table.empty())
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
            "table has " + std::to_string(table.size()) + " entries, expected "
                + std::to_string(expectedEntries));
    }
    if (table.front() != 0)
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
            "first entry is " + std::to_string(table.front()) + ", expected 0");
    }
    if (table.back() != amplitude)
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
            "sentinel entry is " + std::to_string(table.back()) + ", expected "
                + std::to_string(amplitude));
    }
    for (core::usize i = 1; i < table.size(); ++i)
    {
        if (table[i] < table[i - 1])
        {
            return core::makeError(core::ErrorCode::kCorruptedData,
                "entry " + std::to_string(i) + " decreases (" + std::to_string(table[i - 1])
                    + " -> " + std::to_string(table[i]) + ")");
        }
    }
    return {};
}

core::ExpectedVoid TableGenerator::compare(std::span<const core::u16> table,
                                           std::span<const core::u16> reference)
{
    if (table.size() != reference.size())
    {
        return core::makeError(core::ErrorCode::kMismatch,
            "table has " + std::to_string(table.size()) + " entries, reference has "
                + std::to_string(reference.size()));
    }
    for (core::usize i = 0; i < table.size(); ++i)
    {
        if (table[i] != reference[i])
        {
            return core::makeError(core::ErrorCode::kMismatch,
                "entry " + std::to_string(i) + " is " + std::to_string(table[i])
                    + ", reference is " + std::to_string(reference[i]));
        }
    }
    return {};
}

} // namespace itrig::tablegen
