/**
 * cobskit - Constants shared by the COBS and COBS/R codec families.
 */
#pragma once

#include <cstddef>
#include <cstdint>

namespace cobskit
{

    // Selects the family an algorithm runs as. Reduced is COBS/R: the final length code may be
    // replaced by the final data byte.
    enum class Variant : std::uint8_t
    {
        Standard,
        Reduced
    };

    // Length code of a run that hit the cap and is not followed by an implied zero.
    inline constexpr std::uint8_t kMaxCode = 0xFF;

    // Data bytes carried by a capped run.
    inline constexpr std::size_t kMaxRunLength = kMaxCode - 1;

    inline constexpr std::uint8_t kFrameDelimiter = 0x00;

} // namespace cobskit
