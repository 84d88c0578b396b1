/**
 * @file SineTable.cpp
 * @brief Checked access to the quarter-wave sine table.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "itrig/math/SineTable.hpp"

#include <string>

namespace itrig::math {

core::Expected<core::u16> SineTable::at(core::u32 index)
{
    if (index >= kEntryCount)
    {
        return core::makeError(
            core::ErrorCode::kOutOfRange,
            "sine table index " + std::to_string(index) + " exceeds last entry "
                + std::to_string(kEntryCount - 1));
    }
    return kData[index];
}

} // namespace itrig::math
