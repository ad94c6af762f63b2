// ==============================================================================
// Layer 3: Fade Pipeline
// fade_pipeline.h - Drives items from a source through a fade strategy to a sink
// ==============================================================================
// Single-threaded pull loop:
//
//   source.next() -> layer check -> strategy.push() -> sink.write()
//
// Every frame is checked before it reaches the strategy. A frame that is not
// MPEG Layer III stops the run; items the strategy still holds are dropped,
// so nothing after the offending frame reaches the sink.
// ==============================================================================

#pragma once

#include <taper/codec/stream_item.h>
#include <taper/fade/fade_in_strategy.h>
#include <taper/fade/fade_strategy.h>
#include <taper/fade/fade_types.h>
#include <taper/fade/fade_window_buffer.h>
#include <taper/fade/gain_adjuster.h>
#include <taper/fade/ramp_planner.h>

#include <memory>
#include <span>
#include <string>
#include <utility>

namespace Taper::Mp3 {

/// @brief Everything a run needs besides its source and sink.
struct FadeConfig {
    FadeDirection direction = FadeDirection::Out;
    GainStrategy gainStrategy = GainStrategy::AddDelta;
    RampPlan plan;

    /// @brief The window fits kMaxFadeFrames and explicit gains lie in 0-255.
    [[nodiscard]] bool isValid() const noexcept {
        if (plan.size() > kMaxFadeFrames) {
            return false;
        }
        if (gainStrategy != GainStrategy::SetExplicit) {
            return true;
        }
        for (const int value : plan.values()) {
            if (!isValidGlobalGain(value)) {
                return false;
            }
        }
        return true;
    }
};

/// @brief Create the strategy for @p config's direction.
[[nodiscard]] inline std::unique_ptr<FadeStrategy> makeFadeStrategy(const FadeConfig& config,
                                                                    DiagnosticCallback diagnostics = {}) {
    if (config.direction == FadeDirection::In) {
        return std::make_unique<FadeInStrategy>(config.plan, config.gainStrategy, std::move(diagnostics));
    }
    return std::make_unique<FadeWindowBuffer>(config.plan, config.gainStrategy, std::move(diagnostics));
}

class FadePipeline {
public:
    explicit FadePipeline(FadeConfig config) : config_(std::move(config)) {}

    void setDiagnosticCallback(DiagnosticCallback callback) { diagnostics_ = std::move(callback); }

    [[nodiscard]] const FadeConfig& config() const noexcept { return config_; }

    /// @brief Process the whole stream.
    ///
    /// Can be called again; each call starts with a fresh strategy.
    [[nodiscard]] FadeResult run(StreamItemSource& source, StreamItemSink& sink) {
        strategy_ = makeFadeStrategy(config_, diagnostics_);
        FadeResult result;

        while (true) {
            StreamItem item;
            const ReadStatus status = source.next(item);
            if (status == ReadStatus::EndOfStream) {
                break;
            }
            if (status == ReadStatus::Error) {
                result.errorMessage = "Cannot read input";
                const auto detail = source.getLastError();
                if (!detail.empty()) {
                    result.errorMessage += ": ";
                    result.errorMessage += detail;
                }
                return fail(result, FadeError::ReadError);
            }

            if (item.isFrame() && !item.frame().header().isLayer3()) {
                const auto& frame = item.frame();
                result.errorMessage = "Frame " + std::to_string(item.sequence()) + " at byte " +
                                      std::to_string(frame.bytePosition()) + " is MPEG layer " +
                                      std::to_string(frame.header().layer()) +
                                      "; only layer III is supported";
                return fail(result, FadeError::UnsupportedFormat);
            }

            const FadeError error = strategy_->push(std::move(item), sink);
            if (error != FadeError::Success) {
                result.errorMessage = std::string(strategy_->getLastError());
                return fail(result, error);
            }
        }

        const FadeError error = strategy_->finish(sink);
        if (error != FadeError::Success) {
            result.errorMessage = std::string(strategy_->getLastError());
            return fail(result, error);
        }

        result.statistics = strategy_->statistics();
        return result;
    }

    /// Gains observed by the Collect strategy during the last run
    [[nodiscard]] std::span<const int> collectedGains() const noexcept {
        if (!strategy_) {
            return {};
        }
        return strategy_->adjuster().collected();
    }

    /// Strategy of the last run (nullptr before the first run)
    [[nodiscard]] const FadeStrategy* strategy() const noexcept { return strategy_.get(); }

private:
    [[nodiscard]] FadeResult& fail(FadeResult& result, FadeError error) {
        strategy_->abort();
        result.error = error;
        result.statistics = strategy_->statistics();
        return result;
    }

    FadeConfig config_;
    DiagnosticCallback diagnostics_;
    std::unique_ptr<FadeStrategy> strategy_;
};

} // namespace Taper::Mp3
