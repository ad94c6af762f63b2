// ==============================================================================
// Layer 2: Fade Components
// fade_in_strategy.h - Fade-in over the first N frames of a stream
// ==============================================================================

#pragma once

#include <taper/fade/fade_strategy.h>

#include <cstdint>
#include <string>
#include <utility>

namespace Taper::Mp3 {

/// @brief Adjusts frames as they arrive; nothing is held back.
///
/// The first frame gets the most attenuated argument (plan[N-1]) and the N-th
/// frame gets plan[0]. Later frames pass through unmodified.
class FadeInStrategy final : public FadeStrategy {
public:
    FadeInStrategy(RampPlan plan, GainStrategy gainStrategy, DiagnosticCallback diagnostics = {})
        : FadeStrategy(std::move(plan), RampCursor::Order::MostAttenuatedFirst, gainStrategy,
                       std::move(diagnostics)) {}

    [[nodiscard]] FadeError push(StreamItem item, StreamItemSink& sink) override {
        if (finished_) {
            setLastError("Item pushed after the end of the stream");
            return FadeError::InvalidState;
        }

        countIncoming(item);
        if (item.isFrame() && cursor().hasNext()) {
            const FadeError error = processWindowFrame(item.frame());
            if (error != FadeError::Success) {
                return error;
            }
        }
        return emit(item, sink);
    }

    [[nodiscard]] FadeError finish(StreamItemSink& /*sink*/) override {
        if (finished_) {
            setLastError("Stream finished twice");
            return FadeError::InvalidState;
        }
        finished_ = true;

        reportPlanExhausted();
        if (cursor().remaining() > 0 && statistics_.framesIn > 0) {
            warn("Stream has fewer frames than the fade window; " +
                 std::to_string(cursor().remaining()) + " of " + std::to_string(plan().size()) +
                 " gain steps were not used");
        }
        return FadeError::Success;
    }

    void abort() noexcept override { finished_ = true; }

    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    bool finished_ = false;
};

} // namespace Taper::Mp3
