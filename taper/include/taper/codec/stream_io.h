// ==============================================================================
// Layer 1: Frame Codec
// stream_io.h - Item source and sink backed by standard streams
// ==============================================================================
// The only I/O in the library. Streams are borrowed, never owned; opening and
// closing files is the application's job.
// ==============================================================================

#pragma once

#include <taper/codec/frame_sync.h>
#include <taper/codec/stream_item.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace Taper::Mp3 {

// =============================================================================
// StreamReader
// =============================================================================

/// @brief Reads an MP3 byte stream and produces stream items.
class StreamReader final : public StreamItemSource {
public:
    /// Bytes requested from the stream per read
    static constexpr size_t kReadChunkSize = 4096;

    /// Largest amount of unconsumed data the scanner may hold
    static constexpr size_t kMaxBufferBytes = 4 * 1024 * 1024;

    explicit StreamReader(std::istream& input) noexcept : input_(input) {}

    [[nodiscard]] ReadStatus next(StreamItem& item) override {
        while (true) {
            switch (sync_.readItem(item)) {
                case ScanStatus::Item:
                    return ReadStatus::Item;
                case ScanStatus::Done:
                    return ReadStatus::EndOfStream;
                case ScanStatus::NeedMoreData:
                    break;
            }

            if (sync_.bufferedBytes() >= kMaxBufferBytes) {
                lastError_ = "Scanner buffer reached its limit of " +
                             std::to_string(kMaxBufferBytes) + " bytes";
                return ReadStatus::Error;
            }
            if (!fill()) {
                return ReadStatus::Error;
            }
        }
    }

    [[nodiscard]] std::string_view getLastError() const noexcept override { return lastError_; }

    [[nodiscard]] const FrameSync& scanner() const noexcept { return sync_; }

private:
    bool fill() {
        std::array<char, kReadChunkSize> chunk{};
        input_.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto count = static_cast<size_t>(input_.gcount());

        // a short read at EOF sets failbit too; anything else is an error
        if (input_.bad() || (input_.fail() && !input_.eof())) {
            lastError_ = "Read failed at byte " + std::to_string(sync_.bytesReturned() + sync_.bufferedBytes());
            return false;
        }

        if (count > 0) {
            sync_.append(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(chunk.data()), count));
        }
        if (input_.eof()) {
            sync_.markEndOfInput();
        }
        return true;
    }

    std::istream& input_;
    FrameSync sync_;
    std::string lastError_;
};

// =============================================================================
// StreamWriter
// =============================================================================

/// @brief Writes the serialized bytes of each item to an output stream.
class StreamWriter final : public StreamItemSink {
public:
    explicit StreamWriter(std::ostream& output) noexcept : output_(output) {}

    [[nodiscard]] bool write(const StreamItem& item) override {
        const auto bytes = item.bytes();
        output_.write(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
        if (!output_) {
            lastError_ = "Write failed for item " + std::to_string(item.sequence());
            return false;
        }
        bytesWritten_ += bytes.size();
        ++itemsWritten_;
        return true;
    }

    [[nodiscard]] std::string_view getLastError() const noexcept override { return lastError_; }

    [[nodiscard]] uint64_t bytesWritten() const noexcept { return bytesWritten_; }
    [[nodiscard]] uint64_t itemsWritten() const noexcept { return itemsWritten_; }

private:
    std::ostream& output_;
    std::string lastError_;
    uint64_t bytesWritten_ = 0;
    uint64_t itemsWritten_ = 0;
};

} // namespace Taper::Mp3
