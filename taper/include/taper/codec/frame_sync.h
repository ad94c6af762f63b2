// ==============================================================================
// Layer 1: Frame Codec
// frame_sync.h - Splits a raw MP3 byte stream into stream items
// ==============================================================================
// Push bytes in with append(), pull items out with readItem(). The scanner
// recognizes, at the head of its buffer:
//   - a syncword followed by a valid header  -> Frame
//   - a comment tag (ID3v2/ID3v1/APEv2/Lyrics3) -> Other (Tag)
//   - anything else, up to the next syncword -> Other (Garbage)
// Concatenating the bytes of every returned item reproduces the input.
// ==============================================================================

#pragma once

#include <taper/codec/comment_tag.h>
#include <taper/codec/frame_header.h>
#include <taper/codec/mp3_frame.h>
#include <taper/codec/stream_item.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace Taper::Mp3 {

/// Outcome of FrameSync::readItem()
enum class ScanStatus : uint8_t {
    Item = 0,      ///< An item was removed from the buffer
    NeedMoreData,  ///< append() more bytes (or markEndOfInput()) and retry
    Done           ///< End of input reached and buffer empty
};

class FrameSync {
public:
    /// Without a second syncword this far into a free format frame, give up on it
    static constexpr size_t kFreeFormatSearchLimit = 8192;

    // =========================================================================
    // Input
    // =========================================================================

    /// Add bytes to the end of the internal buffer.
    /// @return false if input was already marked as ended (nothing added)
    bool append(std::span<const uint8_t> data) {
        if (endOfInput_) {
            return false;
        }
        compact();
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return true;
    }

    /// No more bytes will follow; remaining data is flushed as items
    void markEndOfInput() noexcept { endOfInput_ = true; }

    [[nodiscard]] bool endOfInput() const noexcept { return endOfInput_; }
    [[nodiscard]] bool done() const noexcept { return endOfInput_ && pending().empty(); }
    [[nodiscard]] size_t bufferedBytes() const noexcept { return buffer_.size() - start_; }

    // =========================================================================
    // Output
    // =========================================================================

    /// @brief Remove the next item from the buffer.
    /// @param item Receives the item when ScanStatus::Item is returned
    [[nodiscard]] ScanStatus readItem(StreamItem& item) {
        const auto data = pending();
        if (data.empty()) {
            return endOfInput_ ? ScanStatus::Done : ScanStatus::NeedMoreData;
        }
        if (data.size() < 4) {
            if (!endOfInput_) {
                return ScanStatus::NeedMoreData;
            }
            return emitGarbage(data.size(), item);
        }

        if (isSync(data, 0)) {
            return readFrame(item);
        }

        const TagMatch tag = identifyTag(data, endOfInput_);
        if (tag.size > 0) {
            const auto size = static_cast<size_t>(tag.size);
            if (data.size() < size) {
                // a truncated tag at the end of the file is kept as plain bytes
                return endOfInput_ ? emitGarbage(data.size(), item) : ScanStatus::NeedMoreData;
            }
            return emitTag(tag.type, size, item);
        }
        if (tag.size == kTagNeedMoreData) {
            return ScanStatus::NeedMoreData;
        }

        // garbage: skip to the next syncword
        if (const auto next = findSync(data, 1)) {
            return emitGarbage(*next, item);
        }
        if (endOfInput_) {
            return emitGarbage(data.size(), item);
        }
        // the last three bytes could still start a syncword
        if (data.size() > 3) {
            return emitGarbage(data.size() - 3, item);
        }
        return ScanStatus::NeedMoreData;
    }

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] uint64_t itemsReturned() const noexcept { return itemsReturned_; }
    [[nodiscard]] uint64_t framesReturned() const noexcept { return framesReturned_; }
    [[nodiscard]] uint64_t bytesReturned() const noexcept { return bytesReturned_; }

    /// False after garbage was skipped, until the next frame
    [[nodiscard]] bool synced() const noexcept { return synced_; }

    /// Size of an unpadded free format frame once detected, else 0
    [[nodiscard]] size_t freeFormatFrameSize() const noexcept { return baseFreeFormatSize_; }

private:
    [[nodiscard]] std::span<const uint8_t> pending() const noexcept {
        return std::span<const uint8_t>(buffer_).subspan(start_);
    }

    /// A syncword at @p pos followed by a header with no reserved fields
    [[nodiscard]] static bool isSync(std::span<const uint8_t> data, size_t pos) noexcept {
        if (pos + 4 > data.size() || data[pos] != 0xFF) {
            return false;
        }
        return FrameHeader::fromBytes(data.subspan(pos)).isValid();
    }

    /// First syncword at or after @p from, optionally restricted to one stream
    [[nodiscard]] static std::optional<size_t> findSync(std::span<const uint8_t> data, size_t from,
                                                        const FrameHeader* sameStreamAs = nullptr) noexcept {
        for (size_t pos = from; pos + 4 <= data.size(); ++pos) {
            if (!isSync(data, pos)) {
                continue;
            }
            if (sameStreamAs && !sameStreamAs->matchesStream(FrameHeader::fromBytes(data.subspan(pos)))) {
                continue;
            }
            return pos;
        }
        return std::nullopt;
    }

    [[nodiscard]] ScanStatus readFrame(StreamItem& item) {
        const auto data = pending();
        const auto header = FrameHeader::fromBytes(data);
        const size_t prefix = header.prefixSize() + header.sideInfoSize();

        size_t size = header.frameSize();
        if (size == 0) {
            const auto freeSize = freeFormatSize(data, header, prefix);
            if (!freeSize) {
                return ScanStatus::NeedMoreData;
            }
            if (*freeSize == 0) {
                // not a real frame after all
                return emitGarbage(1, item);
            }
            size = *freeSize;
        }

        if (size < prefix) {
            return emitGarbage(1, item);
        }
        if (data.size() < size) {
            return endOfInput_ ? emitGarbage(data.size(), item) : ScanStatus::NeedMoreData;
        }

        Mp3Frame frame(std::vector<uint8_t>(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(size)),
                       bytesReturned_);
        frame.setResynced(!synced_);
        synced_ = true;
        ++framesReturned_;
        item = StreamItem(std::move(frame), itemsReturned_++);
        advance(size);
        return ScanStatus::Item;
    }

    /// @return frame size; 0 if this is not a frame; nullopt if more data is needed
    [[nodiscard]] std::optional<size_t> freeFormatSize(std::span<const uint8_t> data,
                                                       const FrameHeader& header,
                                                       size_t prefix) {
        const size_t padding = header.padded() ? slotSize(header.layerIndex()) : 0;
        if (baseFreeFormatSize_ > 0) {
            return baseFreeFormatSize_ + padding;
        }
        if (data.size() < prefix) {
            if (!endOfInput_) {
                return std::nullopt;
            }
            return size_t{0};
        }

        // the frame cannot end before its main data does
        size_t searchFrom = prefix;
        if (header.isLayer3()) {
            const ConstSideInfo info(header, data.subspan(header.prefixSize(), header.sideInfoSize()));
            const auto part23 = static_cast<int64_t>(info.part23Bytes());
            const auto begin = static_cast<int64_t>(info.mainDataBegin());
            searchFrom += static_cast<size_t>(std::max<int64_t>(0, part23 - begin));
        }

        size_t size = 0;
        if (const auto next = findSync(data, searchFrom, &header)) {
            size = *next;
        } else if (data.size() >= kFreeFormatSearchLimit) {
            return size_t{0};
        } else if (!endOfInput_) {
            return std::nullopt;
        } else {
            // last frame: runs to the end, minus a trailing ID3v1 tag
            size = data.size();
            if (size > static_cast<size_t>(kId3v1Size) &&
                id3v1Size(data, true, size - static_cast<size_t>(kId3v1Size)) == kId3v1Size) {
                size -= static_cast<size_t>(kId3v1Size);
            }
            return size;
        }

        if (size > padding) {
            baseFreeFormatSize_ = size - padding;
        }
        return size;
    }

    [[nodiscard]] ScanStatus emitTag(TagType type, size_t size, StreamItem& item) {
        OtherData other;
        other.kind = OtherData::Kind::Tag;
        other.tagType = type;
        other.bytes.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(start_),
                           buffer_.begin() + static_cast<std::ptrdiff_t>(start_ + size));
        other.bytePosition = bytesReturned_;
        item = StreamItem(std::move(other), itemsReturned_++);
        advance(size);
        return ScanStatus::Item;
    }

    [[nodiscard]] ScanStatus emitGarbage(size_t size, StreamItem& item) {
        OtherData other;
        other.kind = OtherData::Kind::Garbage;
        other.bytes.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(start_),
                           buffer_.begin() + static_cast<std::ptrdiff_t>(start_ + size));
        other.bytePosition = bytesReturned_;
        item = StreamItem(std::move(other), itemsReturned_++);
        synced_ = false;
        advance(size);
        return ScanStatus::Item;
    }

    void advance(size_t bytes) noexcept {
        start_ += bytes;
        bytesReturned_ += bytes;
    }

    // Drop consumed bytes once they dominate the buffer
    void compact() {
        if (start_ > 0 && start_ >= buffer_.size() / 2) {
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(start_));
            start_ = 0;
        }
    }

    std::vector<uint8_t> buffer_;
    size_t start_ = 0;
    bool endOfInput_ = false;
    bool synced_ = true;
    size_t baseFreeFormatSize_ = 0;
    uint64_t itemsReturned_ = 0;
    uint64_t framesReturned_ = 0;
    uint64_t bytesReturned_ = 0;
};

} // namespace Taper::Mp3
