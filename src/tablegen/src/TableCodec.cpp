// /////////////////////////////////////////////////////////////////////////////
/// @file TableCodec.cpp
/// @brief Packed table codec implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <itrig/tablegen/TableCodec.hpp>

#include <cstdio>

namespace itrig::tablegen::codec {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

constexpr int hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::vector<core::u8> encode(std::span<const core::u16> table)
{
    std::vector<core::u8> bytes;
    bytes.reserve(table.size() * 2);
    for (const core::u16 value : table)
    {
        bytes.push_back(static_cast<core::u8>(value >> 8));
        bytes.push_back(static_cast<core::u8>(value & 0xFF));
    }
    return bytes;
}

core::Expected<std::vector<core::u16>> decode(std::span<const core::u8> bytes)
{
    if (bytes.size() % 2 != 0)
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
            "packed table has an odd byte count (" + std::to_string(bytes.size()) + ")");
    }

    std::vector<core::u16> table;
    table.reserve(bytes.size() / 2);
    for (core::usize i = 0; i < bytes.size(); i += 2)
    {
        table.push_back(static_cast<core::u16>((static_cast<core::u32>(bytes[i]) << 8) | bytes[i + 1]));
    }
    return table;
}

std::string toHex(std::span<const core::u8> bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const core::u8 b : bytes)
    {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

core::Expected<std::vector<core::u8>> fromHex(std::string_view hex)
{
    if (hex.starts_with("0x") || hex.starts_with("0X"))
        hex.remove_prefix(2);

    if (hex.size() % 2 != 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "hex string has an odd digit count (" + std::to_string(hex.size()) + ")");
    }

    std::vector<core::u8> bytes;
    bytes.reserve(hex.size() / 2);
    for (core::usize i = 0; i < hex.size(); i += 2)
    {
        const int hi = hexValue(hex[i]);
        const int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0)
        {
            const core::usize bad = hi < 0 ? i : i + 1;
            return core::makeError(core::ErrorCode::kInvalidArgument,
                "invalid hex digit '" + std::string(1, hex[bad]) + "' at position "
                    + std::to_string(bad));
        }
        bytes.push_back(static_cast<core::u8>((hi << 4) | lo));
    }
    return bytes;
}

std::string toCppArray(std::span<const core::u16> table, std::string_view name)
{
    std::string out = "inline constexpr std::array<std::uint16_t, " + std::to_string(table.size())
        + "> " + std::string{name} + " = {";

    char entry[8];
    for (core::usize i = 0; i < table.size(); ++i)
    {
        if (i % 8 == 0)
            out += "\n    ";
        std::snprintf(entry, sizeof(entry), "0x%04x", static_cast<unsigned>(table[i]));
        out += entry;
        if (i + 1 < table.size())
            out += (i % 8 == 7) ? "," : ", ";
    }
    out += "\n};\n";
    return out;
}

} // namespace itrig::tablegen::codec
