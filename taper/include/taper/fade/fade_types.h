// ==============================================================================
// Layer 2: Fade Components
// fade_types.h - Error codes, results and diagnostics shared by the fade layer
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace Taper::Mp3 {

/// Fade pipeline error codes
enum class FadeError : uint8_t {
    Success = 0,
    UnsupportedFormat,  ///< A frame is not MPEG Layer III
    InvalidGainValue,   ///< An explicit gain is outside 0-255
    ReadError,          ///< The item source failed
    WriteError,         ///< The item sink failed
    InvalidState        ///< Strategy used after finish() or abort()
};

[[nodiscard]] constexpr std::string_view fadeErrorName(FadeError error) noexcept {
    switch (error) {
        case FadeError::Success: return "success";
        case FadeError::UnsupportedFormat: return "unsupported format";
        case FadeError::InvalidGainValue: return "invalid gain value";
        case FadeError::ReadError: return "read error";
        case FadeError::WriteError: return "write error";
        case FadeError::InvalidState: return "invalid state";
    }
    return "unknown";
}

/// Fade direction; selects the FadeStrategy implementation
enum class FadeDirection : uint8_t {
    In = 0,  ///< Window anchored at the start of the stream
    Out      ///< Window anchored at the end of the stream
};

/// Counters collected while a strategy runs
struct FadeStatistics {
    uint64_t itemsIn = 0;
    uint64_t itemsOut = 0;
    uint64_t framesIn = 0;
    uint64_t framesAdjusted = 0;      ///< Frames that consumed a plan argument
    uint64_t vbrFramesSkipped = 0;    ///< VBR header frames left untouched in the window
    uint64_t framesPastPlan = 0;      ///< Window frames left untouched because the plan ran out
    size_t peakBufferedFrames = 0;    ///< Largest number of frames held at once
};

/// @brief Outcome of a pipeline run.
struct FadeResult {
    FadeError error = FadeError::Success;
    std::string errorMessage;  ///< Human-readable error description
    FadeStatistics statistics;

    [[nodiscard]] explicit operator bool() const noexcept { return error == FadeError::Success; }
};

/// Receives non-fatal warnings; the library itself never prints
using DiagnosticCallback = std::function<void(std::string_view message)>;

} // namespace Taper::Mp3
