// ==============================================================================
// Layer 0: Core Utilities
// bit_field.h - MSB-first bit field access on byte spans
// ==============================================================================
// Layer 0: NO dependencies on higher layers
// - No allocation, no exceptions, no I/O
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace Taper::Mp3 {

/// @brief Read an unsigned bit field stored MSB-first.
///
/// Bit 0 is the most significant bit of byte 0, matching the bit numbering
/// used by MPEG audio headers and side info.
///
/// @param data Source bytes
/// @param bitOffset Offset of the first bit of the field
/// @param bitCount Width of the field (1-32)
/// @return Field value, or 0 if the field does not fit inside @p data
[[nodiscard]] constexpr uint32_t readBits(std::span<const uint8_t> data,
                                          size_t bitOffset,
                                          size_t bitCount) noexcept {
    if (bitCount == 0 || bitCount > 32 || bitOffset + bitCount > data.size() * 8) {
        return 0;
    }

    uint32_t value = 0;
    for (size_t bit = bitOffset; bit < bitOffset + bitCount; ++bit) {
        const uint8_t byte = data[bit / 8];
        const uint32_t bitValue = (byte >> (7 - (bit % 8))) & 1u;
        value = (value << 1) | bitValue;
    }
    return value;
}

/// @brief Write an unsigned bit field stored MSB-first.
///
/// Only the bits of the field are touched; neighbouring bits in the first and
/// last byte are preserved. Bits of @p value above @p bitCount are ignored.
///
/// @return false if the field does not fit inside @p data (nothing written)
constexpr bool writeBits(std::span<uint8_t> data,
                         size_t bitOffset,
                         size_t bitCount,
                         uint32_t value) noexcept {
    if (bitCount == 0 || bitCount > 32 || bitOffset + bitCount > data.size() * 8) {
        return false;
    }

    for (size_t i = 0; i < bitCount; ++i) {
        const size_t bit = bitOffset + i;
        const uint32_t bitValue = (value >> (bitCount - 1 - i)) & 1u;
        const auto mask = static_cast<uint8_t>(1u << (7 - (bit % 8)));
        uint8_t& byte = data[bit / 8];
        byte = bitValue ? static_cast<uint8_t>(byte | mask)
                        : static_cast<uint8_t>(byte & ~mask);
    }
    return true;
}

/// Read a big-endian 32-bit word (no bounds check beyond the span's size).
[[nodiscard]] constexpr uint32_t readBigEndian32(std::span<const uint8_t> data) noexcept {
    if (data.size() < 4) {
        return 0;
    }
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

} // namespace Taper::Mp3
