// ==============================================================================
// Layer 1: Frame Codec
// side_info.h - Layer III side info field access
// ==============================================================================
// Granule record layout (bits, relative to the record offset):
//   part2_3_length 12 | big_values 9 | global_gain 8 | scalefac_compress 4/9 ...
// ==============================================================================

#pragma once

#include <taper/codec/frame_header.h>
#include <taper/core/bit_field.h>
#include <taper/core/mpeg_tables.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

namespace Taper::Mp3 {

inline constexpr size_t kPart23LengthBits = 12;
inline constexpr size_t kBigValuesBits = 9;
inline constexpr size_t kGlobalGainBits = 8;

/// Offset of global_gain inside a granule record
inline constexpr size_t kGlobalGainRecordOffset = kPart23LengthBits + kBigValuesBits;

/// @brief Non-owning view over the side info bytes of one Layer III frame.
///
/// @tparam Byte uint8_t for a writable view, const uint8_t for read-only.
///
/// Writes go straight into the viewed bytes; the owning frame refreshes its
/// CRC in Mp3Frame::encode().
template <typename Byte>
class BasicSideInfo {
public:
    BasicSideInfo(FrameHeader header, std::span<Byte> bytes) noexcept
        : header_(header), bytes_(bytes) {}

    [[nodiscard]] size_t channels() const noexcept { return header_.channels(); }
    [[nodiscard]] size_t granules() const noexcept { return header_.granules(); }
    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return bytes_; }

    /// False if the view is shorter than the side info of this header
    [[nodiscard]] bool isComplete() const noexcept {
        return header_.isLayer3() && bytes_.size() >= header_.sideInfoSize();
    }

    /// main_data_begin: 9 bits (MPEG-1) or 8 bits (LSF) at offset 0
    [[nodiscard]] uint32_t mainDataBegin() const noexcept {
        const size_t bits = isLowSamplingFrequency(header_.versionIndex()) ? 8 : 9;
        return readBits(bytes(), 0, bits);
    }

    [[nodiscard]] uint32_t part23Length(size_t granule, size_t channel) const noexcept {
        return readBits(bytes(), recordOffset(granule, channel), kPart23LengthBits);
    }

    [[nodiscard]] uint32_t bigValues(size_t granule, size_t channel) const noexcept {
        return readBits(bytes(), recordOffset(granule, channel) + kPart23LengthBits,
                        kBigValuesBits);
    }

    [[nodiscard]] int globalGain(size_t granule, size_t channel) const noexcept {
        return static_cast<int>(
            readBits(bytes(), globalGainBitOffset(granule, channel), kGlobalGainBits));
    }

    /// @return false if the granule/channel does not exist or value is not 0-255
    bool setGlobalGain(size_t granule, size_t channel, int value) noexcept
        requires(!std::is_const_v<Byte>)
    {
        if (granule >= granules() || channel >= channels() || value < 0 || value > 255) {
            return false;
        }
        return writeBits(bytes_, globalGainBitOffset(granule, channel), kGlobalGainBits,
                         static_cast<uint32_t>(value));
    }

    /// Total main data length of all granules, rounded up to bytes
    [[nodiscard]] size_t part23Bytes() const noexcept {
        size_t totalBits = 0;
        for (size_t gr = 0; gr < granules(); ++gr) {
            for (size_t ch = 0; ch < channels(); ++ch) {
                totalBits += part23Length(gr, ch);
            }
        }
        return (totalBits + 7) / 8;
    }

    /// Bit offset of global_gain for one granule of one channel
    [[nodiscard]] size_t globalGainBitOffset(size_t granule, size_t channel) const noexcept {
        return recordOffset(granule, channel) + kGlobalGainRecordOffset;
    }

private:
    // Out-of-range records map past the end, so reads return 0 and writes fail
    [[nodiscard]] size_t recordOffset(size_t granule, size_t channel) const noexcept {
        const auto offsets = granuleBitOffsets(header_.versionIndex(), header_.channelMode());
        const size_t index = granule * channels() + channel;
        return (index < offsets.size()) ? offsets[index] : bytes_.size() * 8;
    }

    FrameHeader header_;
    std::span<Byte> bytes_;
};

using SideInfo = BasicSideInfo<uint8_t>;
using ConstSideInfo = BasicSideInfo<const uint8_t>;

} // namespace Taper::Mp3
