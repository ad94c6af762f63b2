// ==============================================================================
// Layer 2: Fade Components
// fade_window_buffer.h - Fade-out over the last N frames of a stream
// ==============================================================================
// The end of the stream is only known once the source is exhausted, so the
// buffer holds back the most recent N frames (plus the other items between
// them) and releases older items unmodified. When the stream ends, the held
// frames are exactly the last N, and the plan is applied to them in order:
// the oldest held frame gets plan[0], the newest gets plan[N-1].
//
// Invariant: frameCount_ equals the number of frames in queue_ and never
// exceeds the window length after push() returns.
// ==============================================================================

#pragma once

#include <taper/fade/fade_strategy.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <utility>

namespace Taper::Mp3 {

class FadeWindowBuffer final : public FadeStrategy {
public:
    enum class State : uint8_t {
        Buffering = 0,  ///< Accepting items, releasing those older than the window
        Draining,       ///< Stream ended; held items have been adjusted and written
        Aborted         ///< Held items were discarded
    };

    FadeWindowBuffer(RampPlan plan, GainStrategy gainStrategy, DiagnosticCallback diagnostics = {})
        : FadeStrategy(std::move(plan), RampCursor::Order::LeastAttenuatedFirst, gainStrategy,
                       std::move(diagnostics)),
          windowLength_(this->plan().size()) {}

    [[nodiscard]] FadeError push(StreamItem item, StreamItemSink& sink) override {
        if (state_ != State::Buffering) {
            setLastError("Item pushed after the end of the stream");
            return FadeError::InvalidState;
        }

        countIncoming(item);
        if (item.isFrame()) {
            ++frameCount_;
        }
        queue_.push_back(std::move(item));

        // release from the front until at most N frames are held
        while (frameCount_ > windowLength_) {
            StreamItem head = std::move(queue_.front());
            queue_.pop_front();
            if (head.isFrame()) {
                --frameCount_;
            }
            const FadeError error = emit(head, sink);
            if (error != FadeError::Success) {
                return error;
            }
        }

        statistics_.peakBufferedFrames = std::max(statistics_.peakBufferedFrames, frameCount_);
        return FadeError::Success;
    }

    [[nodiscard]] FadeError finish(StreamItemSink& sink) override {
        if (state_ != State::Buffering) {
            setLastError("Stream finished twice");
            return FadeError::InvalidState;
        }
        state_ = State::Draining;

        while (!queue_.empty()) {
            StreamItem head = std::move(queue_.front());
            queue_.pop_front();
            if (head.isFrame()) {
                --frameCount_;
                const FadeError error = processWindowFrame(head.frame());
                if (error != FadeError::Success) {
                    return error;
                }
            }
            const FadeError error = emit(head, sink);
            if (error != FadeError::Success) {
                return error;
            }
        }

        reportPlanExhausted();
        if (statistics_.framesIn > 0 && statistics_.framesIn < windowLength_) {
            warn("Stream has " + std::to_string(statistics_.framesIn) +
                 " frames, fewer than the fade window of " + std::to_string(windowLength_));
        }
        return FadeError::Success;
    }

    void abort() noexcept override {
        queue_.clear();
        frameCount_ = 0;
        state_ = State::Aborted;
    }

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] size_t windowLength() const noexcept { return windowLength_; }
    [[nodiscard]] size_t bufferedFrameCount() const noexcept { return frameCount_; }
    [[nodiscard]] size_t bufferedItemCount() const noexcept { return queue_.size(); }

    /// Recount the frames held in the queue and compare with the running count
    [[nodiscard]] bool isConsistent() const noexcept {
        const auto frames = static_cast<size_t>(
            std::count_if(queue_.begin(), queue_.end(),
                          [](const StreamItem& item) { return item.isFrame(); }));
        return frames == frameCount_ && (state_ != State::Buffering || frameCount_ <= windowLength_);
    }

private:
    size_t windowLength_;
    std::deque<StreamItem> queue_;
    size_t frameCount_ = 0;
    State state_ = State::Buffering;
};

} // namespace Taper::Mp3
