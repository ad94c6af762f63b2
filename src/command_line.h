#pragma once

// ==============================================================================
// Command Line
// ==============================================================================
// Parsing is pure: no file is touched until the whole command line has been
// accepted, so a usage error never creates or truncates the output file.
// ==============================================================================

#include <taper/fade/fade_pipeline.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Taper {

struct CommandLineOptions {
    std::string inputPath;
    std::string outputPath;
    Mp3::FadeDirection direction = Mp3::FadeDirection::Out;

    size_t frameCount = 0;
    bool hasFrameCount = false;

    double ratePerFrameDb = 0.0;
    bool hasRate = false;

    bool printRawGain = false;   // Collect
    std::vector<int> rawGains;   // SetExplicit when non-empty
    bool verbose = false;
};

enum class ParseStatus : uint8_t {
    Ok = 0,
    Help,        ///< -h/--help; print usage and exit 0
    UsageError   ///< print errorMessage and usage, exit 2
};

struct ParseResult {
    ParseStatus status = ParseStatus::Ok;
    CommandLineOptions options;
    std::string errorMessage;

    [[nodiscard]] explicit operator bool() const noexcept { return status == ParseStatus::Ok; }
};

/// @brief Parse the arguments that follow the program name.
[[nodiscard]] ParseResult parseCommandLine(std::span<const std::string_view> args);

/// Convenience overload for main()
[[nodiscard]] ParseResult parseCommandLine(int argc, const char* const* argv);

[[nodiscard]] std::string usageText(std::string_view programName);

/// @brief Translate accepted options into a pipeline configuration.
///
/// Explicit gains are given in stream order. For a fade-in they are stored
/// reversed, since the fade-in strategy reads its plan from the end.
[[nodiscard]] Mp3::FadeConfig buildFadeConfig(const CommandLineOptions& options);

} // namespace Taper
