// ==============================================================================
// Layer 0: Core Utilities
// mpeg_tables.h - MPEG audio lookup tables and frame geometry
// ==============================================================================
// Indices are the raw header field values:
//   version index: 0 = MPEG-2.5, 1 = reserved, 2 = MPEG-2, 3 = MPEG-1
//   layer index:   0 = reserved, 1 = Layer III, 2 = Layer II, 3 = Layer I
// ==============================================================================

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace Taper::Mp3 {

// =============================================================================
// Field Values
// =============================================================================

inline constexpr uint32_t kVersionMpeg25 = 0;
inline constexpr uint32_t kVersionReserved = 1;
inline constexpr uint32_t kVersionMpeg2 = 2;
inline constexpr uint32_t kVersionMpeg1 = 3;

inline constexpr uint32_t kLayerReserved = 0;
inline constexpr uint32_t kLayer3 = 1;
inline constexpr uint32_t kLayer2 = 2;
inline constexpr uint32_t kLayer1 = 3;

inline constexpr uint32_t kChannelModeStereo = 0;
inline constexpr uint32_t kChannelModeJointStereo = 1;
inline constexpr uint32_t kChannelModeDualChannel = 2;
inline constexpr uint32_t kChannelModeMono = 3;

inline constexpr uint32_t kBitrateIndexFree = 0;
inline constexpr uint32_t kBitrateIndexBad = 15;

/// Header (4) + CRC (2) + largest side info (32)
inline constexpr size_t kMaxFramePrefixBytes = 38;

// =============================================================================
// Tables
// =============================================================================

namespace detail {

// kbps, indexed by bitrate index (0 = free format, 15 = bad)
inline constexpr std::array<uint16_t, 16> kBitratesV1L1 = {
    0, 32, 64, 96, 128, 160, 192, 224, 256, 288, 320, 352, 384, 416, 448, 0};
inline constexpr std::array<uint16_t, 16> kBitratesV1L2 = {
    0, 32, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 384, 0};
inline constexpr std::array<uint16_t, 16> kBitratesV1L3 = {
    0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 0};
inline constexpr std::array<uint16_t, 16> kBitratesV2L1 = {
    0, 32, 48, 56, 64, 80, 96, 112, 128, 144, 160, 176, 192, 224, 256, 0};
inline constexpr std::array<uint16_t, 16> kBitratesV2L23 = {
    0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160, 0};

// Hz, [version index][samplerate index]
inline constexpr std::array<std::array<uint32_t, 4>, 4> kSampleRates = {{
    {11025, 12000, 8000, 0},
    {0, 0, 0, 0},
    {22050, 24000, 16000, 0},
    {44100, 48000, 32000, 0},
}};

// Bit offset of each granule record in the side info, granule-major
inline constexpr std::array<size_t, 4> kGranuleOffsetsV1Stereo = {20, 79, 138, 197};
inline constexpr std::array<size_t, 2> kGranuleOffsetsV1Mono = {18, 77};
inline constexpr std::array<size_t, 2> kGranuleOffsetsLsfStereo = {10, 73};
inline constexpr std::array<size_t, 1> kGranuleOffsetsLsfMono = {9};

} // namespace detail

// =============================================================================
// Functions
// =============================================================================

[[nodiscard]] constexpr bool isLowSamplingFrequency(uint32_t versionIndex) noexcept {
    return versionIndex != kVersionMpeg1;
}

/// @brief Bitrate in kbps.
/// @return 0 for free format or any reserved/invalid combination
[[nodiscard]] constexpr uint32_t bitrateKbps(uint32_t versionIndex,
                                             uint32_t layerIndex,
                                             uint32_t bitrateIndex) noexcept {
    if (versionIndex > 3 || versionIndex == kVersionReserved ||
        layerIndex == kLayerReserved || layerIndex > 3 || bitrateIndex > 15) {
        return 0;
    }

    if (versionIndex == kVersionMpeg1) {
        switch (layerIndex) {
            case kLayer1: return detail::kBitratesV1L1[bitrateIndex];
            case kLayer2: return detail::kBitratesV1L2[bitrateIndex];
            default: return detail::kBitratesV1L3[bitrateIndex];
        }
    }

    return (layerIndex == kLayer1) ? detail::kBitratesV2L1[bitrateIndex]
                                   : detail::kBitratesV2L23[bitrateIndex];
}

/// @brief Sample rate in Hz, or 0 for a reserved combination.
[[nodiscard]] constexpr uint32_t sampleRateHz(uint32_t versionIndex,
                                              uint32_t samplerateIndex) noexcept {
    if (versionIndex > 3 || samplerateIndex > 3) {
        return 0;
    }
    return detail::kSampleRates[versionIndex][samplerateIndex];
}

/// @brief PCM samples per channel in one frame, or 0 if reserved.
[[nodiscard]] constexpr uint32_t samplesPerFrame(uint32_t versionIndex,
                                                 uint32_t layerIndex) noexcept {
    if (versionIndex > 3 || versionIndex == kVersionReserved ||
        layerIndex == kLayerReserved || layerIndex > 3) {
        return 0;
    }
    if (layerIndex == kLayer1) {
        return 384;
    }
    if (layerIndex == kLayer3 && isLowSamplingFrequency(versionIndex)) {
        return 576;
    }
    return 1152;
}

/// @brief Size of one padding slot in bytes (4 for Layer I, 1 otherwise).
[[nodiscard]] constexpr uint32_t slotSize(uint32_t layerIndex) noexcept {
    return (layerIndex == kLayer1) ? 4u : 1u;
}

/// @brief Total frame size in bytes (header included).
///
/// Layer I:    (12 * bitrate / samplerate + padding) * 4
/// Layer II:   144 * bitrate / samplerate + padding
/// Layer III:  144 * bitrate / samplerate + padding   (MPEG-1)
///             72 * bitrate / samplerate + padding    (MPEG-2/2.5)
///
/// @return 0 for free format frames or reserved field values
[[nodiscard]] constexpr size_t frameSizeBytes(uint32_t versionIndex,
                                              uint32_t layerIndex,
                                              uint32_t bitrateIndex,
                                              uint32_t samplerateIndex,
                                              bool padded) noexcept {
    const uint32_t kbps = bitrateKbps(versionIndex, layerIndex, bitrateIndex);
    const uint32_t rate = sampleRateHz(versionIndex, samplerateIndex);
    if (kbps == 0 || rate == 0) {
        return 0;
    }

    const uint64_t bitsPerSecond = static_cast<uint64_t>(kbps) * 1000u;
    if (layerIndex == kLayer1) {
        return static_cast<size_t>((12u * bitsPerSecond / rate + (padded ? 1u : 0u)) * 4u);
    }

    const uint64_t multiplier =
        (layerIndex == kLayer3 && isLowSamplingFrequency(versionIndex)) ? 72u : 144u;
    return static_cast<size_t>(multiplier * bitsPerSecond / rate + (padded ? 1u : 0u));
}

/// @brief Size of the Layer III side info structure in bytes.
///
/// This is also the offset of a Xing/Info tag from the end of the header
/// (and CRC, when present).
[[nodiscard]] constexpr size_t sideInfoSizeBytes(uint32_t versionIndex,
                                                 uint32_t channelMode) noexcept {
    const bool mono = (channelMode == kChannelModeMono);
    if (isLowSamplingFrequency(versionIndex)) {
        return mono ? 9 : 17;
    }
    return mono ? 17 : 32;
}

[[nodiscard]] constexpr size_t channelCount(uint32_t channelMode) noexcept {
    return (channelMode == kChannelModeMono) ? 1 : 2;
}

[[nodiscard]] constexpr size_t granuleCount(uint32_t versionIndex) noexcept {
    return isLowSamplingFrequency(versionIndex) ? 1 : 2;
}

/// @brief Bit offsets of the granule records in the side info, granule-major
/// (granule 0 channel 0, granule 0 channel 1, granule 1 channel 0, ...).
[[nodiscard]] constexpr std::span<const size_t> granuleBitOffsets(
    uint32_t versionIndex, uint32_t channelMode) noexcept {
    const bool mono = (channelMode == kChannelModeMono);
    if (isLowSamplingFrequency(versionIndex)) {
        return mono ? std::span<const size_t>(detail::kGranuleOffsetsLsfMono)
                    : std::span<const size_t>(detail::kGranuleOffsetsLsfStereo);
    }
    return mono ? std::span<const size_t>(detail::kGranuleOffsetsV1Mono)
                : std::span<const size_t>(detail::kGranuleOffsetsV1Stereo);
}

} // namespace Taper::Mp3
