// /////////////////////////////////////////////////////////////////////////////
/// @file TableGenerator.hpp
/// @brief Offline generator and validator for quarter-wave sine tables.
///
/// Computes the reference table from std::sin.  This is build/test-time
/// tooling: the runtime trig core never links against it and stays
/// free of floating point.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <itrig/core/Expected.hpp>
#include <itrig/core/Types.hpp>
#include <itrig/tablegen/Config.hpp>

#include <span>
#include <vector>

namespace itrig::tablegen {

/// @brief Largest accepted sample count (one entry per angle unit of a quadrant).
inline constexpr core::u32 kMaxSampleCount = 4096;

// /////////////////////////////////////////////////////////////////////////////
/// @class TableGenerator
/// @brief Produces sampleCount + 1 entries of round(sin(k * pi / (2 * n)) * A).
///
/// Entry k samples the quadrant at k / sampleCount of a quarter turn;
/// the last entry is the sentinel sin(90 deg) = amplitude.  With the
/// default configuration the output equals math::SineTable::data().
// /////////////////////////////////////////////////////////////////////////////
class TableGenerator final
{
public:
    TableGenerator() = delete;

    /// @brief Generates a table for @p config.
    /// @return The entries, or kInvalidArgument for an unusable sample
    ///         count or amplitude.
    [[nodiscard]] static core::Expected<std::vector<core::u16>> generate(const Config& config);

    /// @brief Checks the generator/core contract on @p table.
    ///
    /// The table must have exactly @p expectedEntries entries, start at 0,
    /// end at @p amplitude and never decrease.
    /// @return kCorruptedData describing the first violation.
    [[nodiscard]] static core::ExpectedVoid validate(std::span<const core::u16> table,
                                                     core::u32 expectedEntries,
                                                     core::u32 amplitude);

    /// @brief Compares @p table entry by entry against @p reference.
    /// @return kMismatch naming the first differing index.
    [[nodiscard]] static core::ExpectedVoid compare(std::span<const core::u16> table,
                                                    std::span<const core::u16> reference);
};

} // namespace itrig::tablegen
