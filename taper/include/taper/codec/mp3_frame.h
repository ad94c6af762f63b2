// ==============================================================================
// Layer 1: Frame Codec
// mp3_frame.h - One physical MPEG audio frame
// ==============================================================================
// The frame keeps its bytes exactly as read. Gain edits rewrite the eight
// global_gain bits of a granule in place and encode() refreshes the CRC, so a
// frame always serializes to its original bytes apart from those fields.
// ==============================================================================

#pragma once

#include <taper/codec/frame_header.h>
#include <taper/codec/side_info.h>
#include <taper/core/crc16.h>
#include <taper/core/gain_units.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace Taper::Mp3 {

/// Kind of VBR bookkeeping carried by a frame.
enum class VbrHeaderKind : uint8_t {
    None = 0,  ///< Ordinary audio frame
    Xing,      ///< "Xing" or "Info" tag (LAME, Xing encoders)
    Vbri       ///< "VBRI" tag (Fraunhofer encoder)
};

/// @brief Location of a VBR tag relative to the start of the frame body.
///
/// The offset is negative when the tag starts inside the last two side
/// info bytes, which some encoders do when a CRC is present.
struct VbrHeaderInfo {
    VbrHeaderKind kind = VbrHeaderKind::None;
    int bodyOffset = 0;
};

class Mp3Frame {
public:
    Mp3Frame() = default;

    /// @brief Take ownership of the bytes of one complete frame.
    /// @param bytes Header through end of body; size must be >= 4
    /// @param bytePosition Offset of the header within the input stream
    explicit Mp3Frame(std::vector<uint8_t> bytes, uint64_t bytePosition = 0) noexcept
        : header_(FrameHeader::fromBytes(bytes)),
          bytes_(std::move(bytes)),
          bytePosition_(bytePosition) {
        crcValidAtRead_ = header_.hasCrc() && hasCompleteSideInfo() && storedCrc() == computeCrc();
    }

    // =========================================================================
    // Layout
    // =========================================================================

    [[nodiscard]] const FrameHeader& header() const noexcept { return header_; }
    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return bytes_; }
    [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] uint64_t bytePosition() const noexcept { return bytePosition_; }

    /// True if sync was lost (garbage skipped) right before this frame
    [[nodiscard]] bool resynced() const noexcept { return resynced_; }
    void setResynced(bool resynced) noexcept { resynced_ = resynced; }

    [[nodiscard]] bool hasCompleteSideInfo() const noexcept {
        return header_.isLayer3() &&
               bytes_.size() >= header_.prefixSize() + header_.sideInfoSize();
    }

    [[nodiscard]] std::span<const uint8_t> sideInfoBytes() const noexcept {
        if (!hasCompleteSideInfo()) {
            return {};
        }
        return std::span<const uint8_t>(bytes_).subspan(header_.prefixSize(), header_.sideInfoSize());
    }

    [[nodiscard]] std::span<const uint8_t> body() const noexcept {
        const size_t start = header_.prefixSize() + header_.sideInfoSize();
        if (start > bytes_.size()) {
            return {};
        }
        return std::span<const uint8_t>(bytes_).subspan(start);
    }

    /// Read-only side info (empty view for non Layer III frames)
    [[nodiscard]] ConstSideInfo sideInfo() const noexcept {
        return ConstSideInfo(header_, sideInfoBytes());
    }

    // =========================================================================
    // Global Gain
    // =========================================================================

    [[nodiscard]] size_t channelCount() const noexcept {
        return hasCompleteSideInfo() ? header_.channels() : 0;
    }

    [[nodiscard]] size_t granuleCount() const noexcept {
        return hasCompleteSideInfo() ? header_.granules() : 0;
    }

    [[nodiscard]] int globalGain(size_t channel, size_t granule) const noexcept {
        return sideInfo().globalGain(granule, channel);
    }

    /// @brief Set one granule's global_gain.
    /// @return false if the field does not exist or @p value is outside 0-255
    bool setGlobalGain(size_t channel, size_t granule, int value) noexcept {
        if (!hasCompleteSideInfo()) {
            return false;
        }
        auto writable = std::span<uint8_t>(bytes_).subspan(header_.prefixSize(), header_.sideInfoSize());
        SideInfo info(header_, writable);
        if (granule >= info.granules() || channel >= info.channels() || !isValidGlobalGain(value)) {
            return false;
        }
        if (info.globalGain(granule, channel) == value) {
            return true;
        }
        if (!info.setGlobalGain(granule, channel, value)) {
            return false;
        }
        modified_ = true;
        return true;
    }

    /// True once any gain field differs from the bytes that were read
    [[nodiscard]] bool isModified() const noexcept { return modified_; }

    // =========================================================================
    // CRC
    // =========================================================================

    [[nodiscard]] uint16_t storedCrc() const noexcept {
        if (!header_.hasCrc() || bytes_.size() < 6) {
            return 0;
        }
        return static_cast<uint16_t>((bytes_[4] << 8) | bytes_[5]);
    }

    /// @brief CRC over header bytes 2-3 and the Layer III side info.
    [[nodiscard]] uint16_t computeCrc() const noexcept {
        if (bytes_.size() < 4) {
            return 0;
        }
        uint16_t crc = crc16(std::span<const uint8_t>(bytes_).subspan(2, 2));
        return crc16(sideInfoBytes(), crc);
    }

    /// True if the frame carried a CRC that matched its contents when read
    [[nodiscard]] bool crcValidAtRead() const noexcept { return crcValidAtRead_; }

    // =========================================================================
    // Serialization
    // =========================================================================

    /// @brief Bring derived fields up to date after gain edits.
    ///
    /// Recomputes the CRC of a protected frame whose CRC was valid when read.
    /// A CRC that was already wrong stays untouched so the output keeps the
    /// input's state.
    void encode() noexcept {
        if (modified_ && crcValidAtRead_) {
            const uint16_t crc = computeCrc();
            bytes_[4] = static_cast<uint8_t>(crc >> 8);
            bytes_[5] = static_cast<uint8_t>(crc & 0xFFu);
        }
    }

    // =========================================================================
    // VBR Header
    // =========================================================================

    /// @brief Identify a Xing/Info or VBRI tag.
    ///
    /// The side info must be clear (apart from its last two bytes, which may
    /// hold the start of a Xing tag when a CRC is present).
    [[nodiscard]] VbrHeaderInfo identifyVbrHeader() const noexcept {
        if (!hasCompleteSideInfo()) {
            return {};
        }

        const auto si = sideInfoBytes();
        for (size_t i = 0; i + 2 < si.size(); ++i) {
            if (si[i] != 0) {
                return {};
            }
        }

        const auto data = body();
        const bool crc = header_.hasCrc();
        const int bodyPos = (crc ? 2 : 0) + static_cast<int>(si.size());
        // a VBRI tag always starts 32 bytes after the header
        const int vbriOffset = 32 - bodyPos;

        if (matchesTag(data, 0, kXingTag) || matchesTag(data, 0, kInfoTag)) {
            return {VbrHeaderKind::Xing, 0};
        }
        if (vbriOffset == 0 && matchesTag(data, 0, kVbriTag)) {
            return {VbrHeaderKind::Vbri, 0};
        }
        if (vbriOffset > 0 && matchesTag(data, static_cast<size_t>(vbriOffset), kVbriTag)) {
            return {VbrHeaderKind::Vbri, vbriOffset};
        }

        if (crc && si.size() >= 2 && data.size() >= 2) {
            const std::array<uint8_t, 4> straddle = {si[si.size() - 2], si[si.size() - 1], data[0], data[1]};
            if (straddle == kXingTag || straddle == kInfoTag) {
                return {VbrHeaderKind::Xing, -2};
            }
            if (vbriOffset == -2 && straddle == kVbriTag) {
                return {VbrHeaderKind::Vbri, -2};
            }
        }

        return {};
    }

    [[nodiscard]] bool isVbrHeader() const noexcept {
        return identifyVbrHeader().kind != VbrHeaderKind::None;
    }

private:
    using Tag = std::array<uint8_t, 4>;
    static constexpr Tag kXingTag = {'X', 'i', 'n', 'g'};
    static constexpr Tag kInfoTag = {'I', 'n', 'f', 'o'};
    static constexpr Tag kVbriTag = {'V', 'B', 'R', 'I'};

    [[nodiscard]] static bool matchesTag(std::span<const uint8_t> data, size_t offset,
                                         const Tag& tag) noexcept {
        if (offset + tag.size() > data.size()) {
            return false;
        }
        for (size_t i = 0; i < tag.size(); ++i) {
            if (data[offset + i] != tag[i]) {
                return false;
            }
        }
        return true;
    }

    FrameHeader header_;
    std::vector<uint8_t> bytes_;
    uint64_t bytePosition_ = 0;
    bool resynced_ = false;
    bool crcValidAtRead_ = false;
    bool modified_ = false;
};

} // namespace Taper::Mp3
