// ==============================================================================
// Layer 1: Frame Codec
// frame_header.h - 32-bit MPEG audio frame header
// ==============================================================================
// Layout (MSB first):
//   AAAAAAAA AAABBCCD EEEEFFGH IIJJKLMM
//   A sync (11)      B version (2)     C layer (2)       D protection (1)
//   E bitrate (4)    F samplerate (2)  G padding (1)     H private (1)
//   I channel (2)    J mode ext (2)    K copyright (1)   L original (1)
//   M emphasis (2)
// ==============================================================================

#pragma once

#include <taper/core/bit_field.h>
#include <taper/core/mpeg_tables.h>

#include <cstddef>
#include <cstdint>
#include <span>

namespace Taper::Mp3 {

/// Mask of the 11 sync bits
inline constexpr uint32_t kSyncMask = 0xFFE00000u;

/// @brief Decoded view of a frame header word.
///
/// Value type; holds only the raw 32-bit word. All queries are derived from
/// it, so a header can never get out of step with its bytes.
class FrameHeader {
public:
    constexpr FrameHeader() noexcept = default;
    explicit constexpr FrameHeader(uint32_t raw) noexcept : raw_(raw) {}

    /// Decode the first four bytes of @p data (big-endian).
    [[nodiscard]] static constexpr FrameHeader fromBytes(std::span<const uint8_t> data) noexcept {
        return FrameHeader(readBigEndian32(data));
    }

    [[nodiscard]] constexpr uint32_t raw() const noexcept { return raw_; }

    // =========================================================================
    // Fields
    // =========================================================================

    [[nodiscard]] constexpr uint32_t versionIndex() const noexcept { return (raw_ >> 19) & 0x3u; }
    [[nodiscard]] constexpr uint32_t layerIndex() const noexcept { return (raw_ >> 17) & 0x3u; }
    [[nodiscard]] constexpr uint32_t protectionBit() const noexcept { return (raw_ >> 16) & 0x1u; }
    [[nodiscard]] constexpr uint32_t bitrateIndex() const noexcept { return (raw_ >> 12) & 0xFu; }
    [[nodiscard]] constexpr uint32_t samplerateIndex() const noexcept { return (raw_ >> 10) & 0x3u; }
    [[nodiscard]] constexpr bool padded() const noexcept { return ((raw_ >> 9) & 0x1u) != 0; }
    [[nodiscard]] constexpr uint32_t privateBit() const noexcept { return (raw_ >> 8) & 0x1u; }
    [[nodiscard]] constexpr uint32_t channelMode() const noexcept { return (raw_ >> 6) & 0x3u; }
    [[nodiscard]] constexpr uint32_t modeExtension() const noexcept { return (raw_ >> 4) & 0x3u; }
    [[nodiscard]] constexpr uint32_t copyrightBit() const noexcept { return (raw_ >> 3) & 0x1u; }
    [[nodiscard]] constexpr uint32_t originalBit() const noexcept { return (raw_ >> 2) & 0x1u; }
    [[nodiscard]] constexpr uint32_t emphasis() const noexcept { return raw_ & 0x3u; }

    /// Layer number as printed (1, 2 or 3), 0 if reserved
    [[nodiscard]] constexpr int layer() const noexcept {
        return (layerIndex() == kLayerReserved) ? 0 : static_cast<int>(4 - layerIndex());
    }

    // =========================================================================
    // Derived Queries
    // =========================================================================

    [[nodiscard]] constexpr bool hasSync() const noexcept {
        return (raw_ & kSyncMask) == kSyncMask;
    }

    /// @brief True if the word is a usable frame header.
    ///
    /// Rejects reserved version, layer, bitrate and samplerate values.
    /// Free format (bitrate index 0) is accepted.
    [[nodiscard]] constexpr bool isValid() const noexcept {
        return hasSync() &&
               versionIndex() != kVersionReserved &&
               layerIndex() != kLayerReserved &&
               bitrateIndex() != kBitrateIndexBad &&
               Mp3::sampleRateHz(versionIndex(), samplerateIndex()) != 0;
    }

    [[nodiscard]] constexpr bool isLayer3() const noexcept { return layerIndex() == kLayer3; }
    [[nodiscard]] constexpr bool isFreeFormat() const noexcept { return bitrateIndex() == kBitrateIndexFree; }
    [[nodiscard]] constexpr bool hasCrc() const noexcept { return protectionBit() == 0; }
    [[nodiscard]] constexpr bool isMono() const noexcept { return channelMode() == kChannelModeMono; }

    [[nodiscard]] constexpr uint32_t bitrateKbps() const noexcept {
        return Mp3::bitrateKbps(versionIndex(), layerIndex(), bitrateIndex());
    }

    [[nodiscard]] constexpr uint32_t sampleRateHz() const noexcept {
        return Mp3::sampleRateHz(versionIndex(), samplerateIndex());
    }

    /// Total frame size in bytes, 0 for free format
    [[nodiscard]] constexpr size_t frameSize() const noexcept {
        return frameSizeBytes(versionIndex(), layerIndex(), bitrateIndex(),
                              samplerateIndex(), padded());
    }

    /// Header plus CRC
    [[nodiscard]] constexpr size_t prefixSize() const noexcept {
        return hasCrc() ? 6 : 4;
    }

    /// Layer III side info size, 0 for other layers
    [[nodiscard]] constexpr size_t sideInfoSize() const noexcept {
        return isLayer3() ? sideInfoSizeBytes(versionIndex(), channelMode()) : 0;
    }

    [[nodiscard]] constexpr size_t channels() const noexcept { return channelCount(channelMode()); }
    [[nodiscard]] constexpr size_t granules() const noexcept { return granuleCount(versionIndex()); }

    /// @brief True if @p other could be the next frame of a free format stream.
    ///
    /// Compares version, layer, protection, bitrate (free) and samplerate.
    [[nodiscard]] constexpr bool matchesStream(FrameHeader other) const noexcept {
        constexpr uint32_t kStreamMask = 0xFFFFFC00u;
        return (raw_ & kStreamMask) == (other.raw_ & kStreamMask);
    }

    friend constexpr bool operator==(FrameHeader a, FrameHeader b) noexcept = default;

private:
    uint32_t raw_ = 0;
};

} // namespace Taper::Mp3
