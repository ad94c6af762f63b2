// ==============================================================================
// Layer 2: Fade Components
// ramp_planner.h - Per-frame gain arguments for a fade window
// ==============================================================================

#pragma once

#include <taper/core/gain_units.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace Taper::Mp3 {

/// Longest fade window, in frames (about 43 minutes of 44.1 kHz MPEG-1 audio)
inline constexpr size_t kMaxFadeFrames = 100000;

/// @brief Immutable sequence of per-frame gain arguments.
///
/// Plans from planRamp() are ordered from the least attenuated end of the
/// window (index 0) to the most attenuated end (index size()-1). Strategies
/// read a plan through their own cursor and never modify it.
class RampPlan {
public:
    RampPlan() = default;
    explicit RampPlan(std::vector<int> values) noexcept : values_(std::move(values)) {}

    [[nodiscard]] size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] int operator[](size_t index) const noexcept { return values_[index]; }
    [[nodiscard]] std::span<const int> values() const noexcept { return values_; }

    /// Same arguments in the opposite order
    [[nodiscard]] RampPlan reversed() const {
        std::vector<int> values(values_.rbegin(), values_.rend());
        return RampPlan(std::move(values));
    }

    friend bool operator==(const RampPlan&, const RampPlan&) = default;

private:
    std::vector<int> values_;
};

/// @brief Plan a linear fade in global_gain steps.
///
///   delta[i] = -round(i * ratePerFrameDb / 2.5)
///
/// Rounding is half-to-even, so plan(4, 1.25) is {0, 0, -1, -2}.
///
/// @param frameCount Window length; 0 gives an empty plan. Limited to kMaxFadeFrames
/// @param ratePerFrameDb Attenuation added per frame step; 0 gives all zeros
/// @example planRamp(5, 2.5) -> {0, -1, -2, -3, -4}
[[nodiscard]] inline RampPlan planRamp(size_t frameCount, double ratePerFrameDb) {
    frameCount = std::min(frameCount, kMaxFadeFrames);
    std::vector<int> deltas;
    deltas.reserve(frameCount);
    for (size_t i = 0; i < frameCount; ++i) {
        deltas.push_back(-decibelsToGainSteps(static_cast<double>(i) * ratePerFrameDb));
    }
    return RampPlan(std::move(deltas));
}

// =============================================================================
// RampCursor
// =============================================================================

/// @brief Advancing read position over a plan, one argument per frame.
///
/// A fade-out window ends at the stream end, so its cursor starts at plan[0].
/// A fade-in window starts at the stream start and reads from plan[N-1] down.
class RampCursor {
public:
    enum class Order : uint8_t {
        LeastAttenuatedFirst = 0,
        MostAttenuatedFirst
    };

    explicit RampCursor(const RampPlan& plan, Order order = Order::LeastAttenuatedFirst) noexcept
        : plan_(&plan), order_(order) {}

    [[nodiscard]] bool hasNext() const noexcept { return position_ < plan_->size(); }

    /// Precondition: hasNext()
    [[nodiscard]] int next() noexcept {
        const size_t index = (order_ == Order::LeastAttenuatedFirst)
                                 ? position_
                                 : plan_->size() - 1 - position_;
        ++position_;
        return (*plan_)[index];
    }

    [[nodiscard]] Order order() const noexcept { return order_; }

    /// Number of arguments taken so far
    [[nodiscard]] size_t position() const noexcept { return position_; }
    [[nodiscard]] size_t remaining() const noexcept { return plan_->size() - position_; }

private:
    const RampPlan* plan_;
    Order order_;
    size_t position_ = 0;
};

} // namespace Taper::Mp3
