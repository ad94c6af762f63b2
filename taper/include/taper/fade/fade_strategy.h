// ==============================================================================
// Layer 2: Fade Components
// fade_strategy.h - Common interface of the fade-in and fade-out strategies
// ==============================================================================
// A strategy receives every stream item in order and forwards each one to the
// sink exactly once. Frames inside the fade window get one plan argument each,
// applied to every granule of every channel. VBR header frames keep their
// place in the window but consume no argument.
// ==============================================================================

#pragma once

#include <taper/codec/stream_item.h>
#include <taper/fade/fade_types.h>
#include <taper/fade/gain_adjuster.h>
#include <taper/fade/ramp_planner.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace Taper::Mp3 {

class FadeStrategy {
public:
    FadeStrategy(RampPlan plan, RampCursor::Order order, GainStrategy gainStrategy,
                 DiagnosticCallback diagnostics = {})
        : plan_(std::move(plan)),
          cursor_(plan_, order),
          adjuster_(gainStrategy),
          diagnostics_(std::move(diagnostics)) {}

    virtual ~FadeStrategy() = default;

    // cursor_ points into plan_
    FadeStrategy(const FadeStrategy&) = delete;
    FadeStrategy& operator=(const FadeStrategy&) = delete;
    FadeStrategy(FadeStrategy&&) = delete;
    FadeStrategy& operator=(FadeStrategy&&) = delete;

    /// @brief Accept the next item of the stream.
    /// Items leaving the strategy are written to @p sink in arrival order.
    [[nodiscard]] virtual FadeError push(StreamItem item, StreamItemSink& sink) = 0;

    /// @brief End of stream: write everything still held.
    [[nodiscard]] virtual FadeError finish(StreamItemSink& sink) = 0;

    /// @brief Drop everything still held without writing it.
    virtual void abort() noexcept = 0;

    [[nodiscard]] const RampPlan& plan() const noexcept { return plan_; }
    [[nodiscard]] const GainAdjuster& adjuster() const noexcept { return adjuster_; }
    [[nodiscard]] const FadeStatistics& statistics() const noexcept { return statistics_; }
    [[nodiscard]] std::string_view getLastError() const noexcept { return lastError_; }

protected:
    /// @brief Apply one plan argument to every granule of @p frame.
    ///
    /// The frame's CRC is refreshed afterwards when it was valid on input.
    [[nodiscard]] FadeError adjustFrame(Mp3Frame& frame, int argument) {
        for (size_t ch = 0; ch < frame.channelCount(); ++ch) {
            for (size_t gr = 0; gr < frame.granuleCount(); ++gr) {
                const GainAdjustment result = adjuster_.adjust(frame.globalGain(ch, gr), argument);
                if (!result) {
                    lastError_ = "Gain value " + std::to_string(argument) +
                                 " is outside 0-255 (frame at byte " +
                                 std::to_string(frame.bytePosition()) + ")";
                    return FadeError::InvalidGainValue;
                }
                if (!frame.setGlobalGain(ch, gr, result.gain)) {
                    lastError_ = "Cannot write global gain of frame at byte " +
                                 std::to_string(frame.bytePosition());
                    return FadeError::InvalidGainValue;
                }
            }
        }
        frame.encode();
        ++statistics_.framesAdjusted;
        return FadeError::Success;
    }

    /// @brief Handle a frame that lies inside the fade window.
    ///
    /// Takes the next argument from the cursor. VBR header frames and frames
    /// after the plan has run out pass through untouched.
    [[nodiscard]] FadeError processWindowFrame(Mp3Frame& frame) {
        if (frame.isVbrHeader()) {
            ++statistics_.vbrFramesSkipped;
            return FadeError::Success;
        }
        if (!cursor_.hasNext()) {
            ++statistics_.framesPastPlan;
            return FadeError::Success;
        }
        return adjustFrame(frame, cursor_.next());
    }

    [[nodiscard]] FadeError emit(const StreamItem& item, StreamItemSink& sink) {
        if (!sink.write(item)) {
            lastError_ = "Cannot write item " + std::to_string(item.sequence());
            const auto detail = sink.getLastError();
            if (!detail.empty()) {
                lastError_ += ": ";
                lastError_ += detail;
            }
            return FadeError::WriteError;
        }
        ++statistics_.itemsOut;
        return FadeError::Success;
    }

    void countIncoming(const StreamItem& item) noexcept {
        ++statistics_.itemsIn;
        if (item.isFrame()) {
            ++statistics_.framesIn;
        }
    }

    /// @brief Warn once if window frames arrived after the plan ran out.
    ///
    /// Neither built-in strategy lets this happen; the count stays visible in
    /// statistics() for strategies that do.
    void reportPlanExhausted() const {
        if (statistics_.framesPastPlan > 0) {
            warn("Gain plan exhausted; " + std::to_string(statistics_.framesPastPlan) +
                 " frames in the fade window were left unmodified");
        }
    }

    void warn(std::string_view message) const {
        if (diagnostics_) {
            diagnostics_(message);
        }
    }

    void setLastError(std::string message) { lastError_ = std::move(message); }

    [[nodiscard]] const RampCursor& cursor() const noexcept { return cursor_; }

    FadeStatistics statistics_;

private:
    RampPlan plan_;
    RampCursor cursor_;
    GainAdjuster adjuster_;
    DiagnosticCallback diagnostics_;
    std::string lastError_;
};

} // namespace Taper::Mp3
