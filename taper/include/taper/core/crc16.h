// ==============================================================================
// Layer 0: Core Utilities
// crc16.h - CRC-16 used by protected MPEG audio frames
// ==============================================================================
// Polynomial 0x8005 (x^16 + x^15 + x^2 + 1), MSB first, initial value 0xFFFF.
// ==============================================================================

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace Taper::Mp3 {

inline constexpr uint16_t kCrc16Polynomial = 0x8005;
inline constexpr uint16_t kCrc16InitialValue = 0xFFFF;

namespace detail {

/// CRC of the low @p bits bits of @p value, continuing from @p crc.
[[nodiscard]] constexpr uint16_t crc16Bits(uint32_t value, int bits, uint16_t crc) noexcept {
    while (bits > 0) {
        --bits;
        const bool inputBit = ((value >> bits) & 1u) != 0;
        const bool topBit = (crc & 0x8000u) != 0;
        crc = static_cast<uint16_t>((crc & 0x7FFFu) << 1);
        if (inputBit != topBit) {
            crc ^= kCrc16Polynomial;
        }
    }
    return crc;
}

[[nodiscard]] constexpr std::array<uint16_t, 256> makeCrc16Table() noexcept {
    std::array<uint16_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        table[i] = crc16Bits(i, 8, 0);
    }
    return table;
}

inline constexpr std::array<uint16_t, 256> kCrc16Table = makeCrc16Table();

} // namespace detail

/// @brief Continue a CRC-16 over whole bytes.
/// @param data Bytes to checksum
/// @param crc Running value (kCrc16InitialValue to start)
[[nodiscard]] constexpr uint16_t crc16(std::span<const uint8_t> data,
                                       uint16_t crc = kCrc16InitialValue) noexcept {
    for (const uint8_t byte : data) {
        crc = static_cast<uint16_t>(((crc & 0xFFu) << 8) ^
                                    detail::kCrc16Table[((crc >> 8) ^ byte) & 0xFFu]);
    }
    return crc;
}

} // namespace Taper::Mp3
