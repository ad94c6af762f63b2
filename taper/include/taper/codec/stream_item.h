// ==============================================================================
// Layer 1: Frame Codec
// stream_item.h - Typed unit produced by the frame scanner
// ==============================================================================

#pragma once

#include <taper/codec/comment_tag.h>
#include <taper/codec/mp3_frame.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Taper::Mp3 {

/// @brief Anything in the stream that is not an audio frame.
///
/// Metadata tags and unidentifiable bytes. Always written back verbatim.
struct OtherData {
    enum class Kind : uint8_t {
        Tag = 0,   ///< Comment tag (see tagType)
        Garbage    ///< Bytes that could not be identified
    };

    Kind kind = Kind::Garbage;
    TagType tagType = TagType::None;
    std::vector<uint8_t> bytes;
    uint64_t bytePosition = 0;
};

/// @brief One item of an MP3 stream: a Frame or Other data.
///
/// The sequence number is assigned by the source in arrival order and never
/// changes, so sinks and tests can check ordering.
class StreamItem {
public:
    StreamItem() = default;

    StreamItem(Mp3Frame frame, uint64_t sequence) noexcept
        : content_(std::move(frame)), sequence_(sequence) {}

    StreamItem(OtherData other, uint64_t sequence) noexcept
        : content_(std::move(other)), sequence_(sequence) {}

    [[nodiscard]] bool isFrame() const noexcept {
        return std::holds_alternative<Mp3Frame>(content_);
    }

    /// Precondition: isFrame()
    [[nodiscard]] Mp3Frame& frame() noexcept { return *std::get_if<Mp3Frame>(&content_); }
    [[nodiscard]] const Mp3Frame& frame() const noexcept { return *std::get_if<Mp3Frame>(&content_); }

    /// Precondition: !isFrame()
    [[nodiscard]] const OtherData& other() const noexcept { return *std::get_if<OtherData>(&content_); }

    [[nodiscard]] uint64_t sequence() const noexcept { return sequence_; }

    /// Serialized bytes of the item (a frame's current bytes, incl. gain edits)
    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        if (const auto* f = std::get_if<Mp3Frame>(&content_)) {
            return f->bytes();
        }
        return std::get_if<OtherData>(&content_)->bytes;
    }

    [[nodiscard]] uint64_t bytePosition() const noexcept {
        if (const auto* f = std::get_if<Mp3Frame>(&content_)) {
            return f->bytePosition();
        }
        return std::get_if<OtherData>(&content_)->bytePosition;
    }

private:
    std::variant<OtherData, Mp3Frame> content_;
    uint64_t sequence_ = 0;
};

// =============================================================================
// Source / Sink Interfaces
// =============================================================================

/// Result of pulling one item from a source
enum class ReadStatus : uint8_t {
    Item = 0,       ///< An item was produced
    EndOfStream,    ///< The source is exhausted
    Error           ///< Reading failed; see getLastError()
};

/// @brief Pull-based producer of stream items, in stream order.
class StreamItemSource {
public:
    virtual ~StreamItemSource() = default;

    /// @brief Produce the next item.
    /// @param item Receives the item when Item is returned
    [[nodiscard]] virtual ReadStatus next(StreamItem& item) = 0;

    /// Description of the last Error
    [[nodiscard]] virtual std::string_view getLastError() const noexcept { return {}; }
};

/// @brief Consumer of stream items, writing each one's serialized bytes.
class StreamItemSink {
public:
    virtual ~StreamItemSink() = default;

    /// @return false on a write failure; see getLastError()
    [[nodiscard]] virtual bool write(const StreamItem& item) = 0;

    [[nodiscard]] virtual std::string_view getLastError() const noexcept { return {}; }
};

} // namespace Taper::Mp3
