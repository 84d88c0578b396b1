// /////////////////////////////////////////////////////////////////////////////
/// @file TableCodec.hpp
/// @brief Packed big-endian serialization of sine tables.
///
/// The packed form stores each u16 entry as two bytes, most significant
/// byte first.  The default 17-entry table packs to 34 bytes, usually
/// exchanged as a 68-digit hex string.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <itrig/core/Expected.hpp>
#include <itrig/core/Types.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace itrig::tablegen::codec {

/// @brief Packs @p table as big-endian u16 values.
[[nodiscard]] std::vector<core::u8> encode(std::span<const core::u16> table);

/// @brief Unpacks big-endian u16 values.
/// @return The entries, or kCorruptedData when the byte count is odd.
[[nodiscard]] core::Expected<std::vector<core::u16>> decode(std::span<const core::u8> bytes);

/// @brief Lower-case hex rendering of @p bytes, no prefix, no separators.
[[nodiscard]] std::string toHex(std::span<const core::u8> bytes);

/// @brief Parses a hex string, optionally prefixed with "0x".
/// @return The bytes, or kInvalidArgument on an odd digit count or a
///         non-hex character.
[[nodiscard]] core::Expected<std::vector<core::u8>> fromHex(std::string_view hex);

/// @brief Renders @p table as a `constexpr std::array<std::uint16_t, N>`
///        definition named @p name, eight entries per line.
[[nodiscard]] std::string toCppArray(std::span<const core::u16> table, std::string_view name);

} // namespace itrig::tablegen::codec
