// ==============================================================================
// Layer 0: Core Utilities
// gain_units.h - Layer III global_gain domain and dB conversion
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Taper::Mp3 {

/// Smallest value of the 8-bit global_gain field
inline constexpr int kMinGlobalGain = 0;

/// Largest value of the 8-bit global_gain field
inline constexpr int kMaxGlobalGain = 255;

/// Loudness change treated as one global_gain step when planning ramps
inline constexpr double kDecibelsPerGainStep = 2.5;

[[nodiscard]] constexpr bool isValidGlobalGain(int value) noexcept {
    return value >= kMinGlobalGain && value <= kMaxGlobalGain;
}

/// Takes a 64-bit value so the sum of any two ints can be clamped
[[nodiscard]] constexpr int clampGlobalGain(int64_t value) noexcept {
    return static_cast<int>(std::clamp<int64_t>(value, kMinGlobalGain, kMaxGlobalGain));
}

/// @brief Round to the nearest integer, ties to even.
///
/// Independent of the floating-point rounding mode, so ramps are
/// reproducible on every platform.
[[nodiscard]] inline double roundHalfToEven(double value) noexcept {
    const double floorValue = std::floor(value);
    const double fraction = value - floorValue;
    if (fraction < 0.5) {
        return floorValue;
    }
    if (fraction > 0.5) {
        return floorValue + 1.0;
    }
    return (std::fmod(floorValue, 2.0) == 0.0) ? floorValue : floorValue + 1.0;
}

/// Largest step count a single adjustment can use; anything beyond saturates
inline constexpr int kMaxGainSteps = kMaxGlobalGain - kMinGlobalGain;

/// @brief Convert an attenuation in dB to whole global_gain steps.
///
/// The result is limited to +/-kMaxGainSteps. NaN gives 0.
/// @example decibelsToGainSteps(5.0)  -> 2
/// @example decibelsToGainSteps(1.25) -> 0 (0.5 rounds to even)
/// @example decibelsToGainSteps(1e10) -> 255
[[nodiscard]] inline int decibelsToGainSteps(double decibels) noexcept {
    if (std::isnan(decibels)) {
        return 0;
    }
    const double steps = roundHalfToEven(decibels / kDecibelsPerGainStep);
    constexpr auto limit = static_cast<double>(kMaxGainSteps);
    return static_cast<int>(std::clamp(steps, -limit, limit));
}

} // namespace Taper::Mp3
