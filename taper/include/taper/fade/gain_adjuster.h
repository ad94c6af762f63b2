// ==============================================================================
// Layer 2: Fade Components
// gain_adjuster.h - Global gain rewrite rules
// ==============================================================================

#pragma once

#include <taper/core/gain_units.h>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace Taper::Mp3 {

/// How a plan argument changes a granule's global_gain
enum class GainStrategy : uint8_t {
    AddDelta = 0,  ///< current + argument, saturating at 0 and 255
    SetExplicit,   ///< argument, which must already lie in 0-255
    Collect        ///< unchanged; the current value is recorded
};

[[nodiscard]] constexpr std::string_view gainStrategyName(GainStrategy strategy) noexcept {
    switch (strategy) {
        case GainStrategy::AddDelta: return "add-delta";
        case GainStrategy::SetExplicit: return "set-explicit";
        case GainStrategy::Collect: return "collect";
    }
    return "unknown";
}

/// Result of one adjustment
struct GainAdjustment {
    int gain = 0;
    bool valid = true;  ///< false: SetExplicit argument outside 0-255

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// @brief Applies one GainStrategy, fixed at construction.
///
/// AddDelta clamps (a saturating volume change); SetExplicit never clamps and
/// rejects out-of-range arguments instead.
class GainAdjuster {
public:
    explicit GainAdjuster(GainStrategy strategy) noexcept : strategy_(strategy) {}

    [[nodiscard]] GainStrategy strategy() const noexcept { return strategy_; }

    /// @brief Compute the new global_gain of one granule.
    /// @param currentGain Value read from the granule (0-255)
    /// @param argument Plan argument for the frame
    [[nodiscard]] GainAdjustment adjust(int currentGain, int argument) {
        switch (strategy_) {
            case GainStrategy::AddDelta:
                return {clampGlobalGain(int64_t{currentGain} + argument), true};
            case GainStrategy::SetExplicit:
                if (!isValidGlobalGain(argument)) {
                    return {currentGain, false};
                }
                return {argument, true};
            case GainStrategy::Collect:
                collected_.push_back(currentGain);
                return {currentGain, true};
        }
        return {currentGain, true};
    }

    /// Values observed by the Collect strategy, in adjustment order
    [[nodiscard]] std::span<const int> collected() const noexcept { return collected_; }

private:
    GainStrategy strategy_;
    std::vector<int> collected_;
};

} // namespace Taper::Mp3
