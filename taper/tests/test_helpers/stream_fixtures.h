#pragma once
// ==============================================================================
// Stream Fixtures
// ==============================================================================
// In-memory item sources and sinks for driving strategies and the pipeline
// without files.
// ==============================================================================

#include <taper/codec/stream_item.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TestHelpers {

/// Source that hands out a fixed list of items, optionally failing part way
class VectorItemSource final : public Taper::Mp3::StreamItemSource {
public:
    explicit VectorItemSource(std::vector<Taper::Mp3::StreamItem> items,
                              size_t failAt = std::numeric_limits<size_t>::max())
        : items_(std::move(items)), failAt_(failAt) {}

    [[nodiscard]] Taper::Mp3::ReadStatus next(Taper::Mp3::StreamItem& item) override {
        if (position_ == failAt_) {
            return Taper::Mp3::ReadStatus::Error;
        }
        if (position_ >= items_.size()) {
            return Taper::Mp3::ReadStatus::EndOfStream;
        }
        item = items_[position_++];
        return Taper::Mp3::ReadStatus::Item;
    }

    [[nodiscard]] std::string_view getLastError() const noexcept override {
        return position_ == failAt_ ? std::string_view("simulated read failure") : std::string_view();
    }

    [[nodiscard]] size_t itemsDelivered() const noexcept { return position_; }

private:
    std::vector<Taper::Mp3::StreamItem> items_;
    size_t failAt_;
    size_t position_ = 0;
};

/// Sink that keeps a copy of every item, optionally rejecting writes after a limit
class CollectingSink final : public Taper::Mp3::StreamItemSink {
public:
    explicit CollectingSink(size_t acceptLimit = std::numeric_limits<size_t>::max())
        : acceptLimit_(acceptLimit) {}

    [[nodiscard]] bool write(const Taper::Mp3::StreamItem& item) override {
        if (items.size() >= acceptLimit_) {
            return false;
        }
        items.push_back(item);
        return true;
    }

    [[nodiscard]] std::string_view getLastError() const noexcept override {
        return items.size() >= acceptLimit_ ? std::string_view("simulated write failure")
                                             : std::string_view();
    }

    /// Concatenated bytes of everything written
    [[nodiscard]] std::vector<uint8_t> bytes() const {
        std::vector<uint8_t> out;
        for (const auto& item : items) {
            const auto data = item.bytes();
            out.insert(out.end(), data.begin(), data.end());
        }
        return out;
    }

    [[nodiscard]] std::vector<uint64_t> sequences() const {
        std::vector<uint64_t> out;
        out.reserve(items.size());
        for (const auto& item : items) {
            out.push_back(item.sequence());
        }
        return out;
    }

    std::vector<Taper::Mp3::StreamItem> items;

private:
    size_t acceptLimit_;
};

/// Collects diagnostic messages
struct WarningLog {
    std::vector<std::string> messages;

    [[nodiscard]] auto callback() {
        return [this](std::string_view message) { messages.emplace_back(message); };
    }
};

} // namespace TestHelpers
