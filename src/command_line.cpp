// ==============================================================================
// Command Line Implementation
// ==============================================================================

#include "command_line.h"

#include <charconv>
#include <cmath>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace Taper {

namespace {

template <typename T>
std::optional<T> parseNumber(std::string_view text) {
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::vector<int>> parseGainList(std::string_view text) {
    std::vector<int> values;
    while (true) {
        const size_t comma = text.find(',');
        const auto value = parseNumber<int>(text.substr(0, comma));
        if (!value) {
            return std::nullopt;
        }
        values.push_back(*value);
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return values;
}

ParseResult usageError(std::string message) {
    ParseResult result;
    result.status = ParseStatus::UsageError;
    result.errorMessage = std::move(message);
    return result;
}

} // anonymous namespace

ParseResult parseCommandLine(std::span<const std::string_view> args) {
    ParseResult result;
    CommandLineOptions& options = result.options;

    bool fadeIn = false;
    bool fadeOut = false;
    bool hasRawGains = false;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];

        // "--name=value" and "--name value" are equivalent
        std::string_view inlineValue;
        bool hasInlineValue = false;
        if (arg.starts_with("--")) {
            const size_t equals = arg.find('=');
            if (equals != std::string_view::npos) {
                inlineValue = arg.substr(equals + 1);
                hasInlineValue = true;
                arg = arg.substr(0, equals);
            }
        }

        auto takeValue = [&](std::string_view& value) -> bool {
            if (hasInlineValue) {
                value = inlineValue;
                return true;
            }
            if (i + 1 >= args.size()) {
                return false;
            }
            value = args[++i];
            return true;
        };

        std::string_view value;
        if (arg == "-h" || arg == "--help") {
            result.status = ParseStatus::Help;
            return result;
        } else if (arg == "-o" || arg == "--output") {
            if (!takeValue(value) || value.empty()) {
                return usageError("Option " + std::string(arg) + " requires a path");
            }
            options.outputPath = std::string(value);
        } else if (arg == "--in") {
            fadeIn = true;
        } else if (arg == "--out") {
            fadeOut = true;
        } else if (arg == "-n" || arg == "--frames") {
            if (!takeValue(value)) {
                return usageError("Option " + std::string(arg) + " requires a frame count");
            }
            const auto count = parseNumber<size_t>(value);
            if (!count) {
                return usageError("Invalid frame count: " + std::string(value));
            }
            if (*count > Mp3::kMaxFadeFrames) {
                return usageError("Frame count " + std::string(value) + " exceeds the limit of " +
                                  std::to_string(Mp3::kMaxFadeFrames));
            }
            options.frameCount = *count;
            options.hasFrameCount = true;
        } else if (arg == "-r" || arg == "--rate") {
            if (!takeValue(value)) {
                return usageError("Option " + std::string(arg) + " requires a rate in dB");
            }
            const auto rate = parseNumber<double>(value);
            if (!rate || !std::isfinite(*rate)) {
                return usageError("Invalid rate: " + std::string(value));
            }
            options.ratePerFrameDb = *rate;
            options.hasRate = true;
        } else if (arg == "--print-raw-gain") {
            options.printRawGain = true;
        } else if (arg == "--set-raw-gain") {
            if (!takeValue(value)) {
                return usageError("Option --set-raw-gain requires a list of gain values");
            }
            auto gains = parseGainList(value);
            if (!gains) {
                return usageError("Invalid gain list: " + std::string(value));
            }
            if (gains->size() > Mp3::kMaxFadeFrames) {
                return usageError("--set-raw-gain lists more than " +
                                  std::to_string(Mp3::kMaxFadeFrames) + " values");
            }
            options.rawGains = std::move(*gains);
            hasRawGains = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg.size() > 1 && arg.front() == '-') {
            return usageError("Unknown option: " + std::string(arg));
        } else {
            if (!options.inputPath.empty()) {
                return usageError("Only one input file may be given");
            }
            options.inputPath = std::string(arg);
        }
    }

    if (options.inputPath.empty()) {
        return usageError("No input file given");
    }
    if (options.outputPath.empty()) {
        return usageError("No output file given (use -o)");
    }
    if (fadeIn == fadeOut) {
        return usageError("Exactly one of --in or --out is required");
    }
    options.direction = fadeIn ? Mp3::FadeDirection::In : Mp3::FadeDirection::Out;

    if (options.printRawGain && hasRawGains) {
        return usageError("--print-raw-gain and --set-raw-gain cannot be combined");
    }

    if (hasRawGains) {
        if (options.hasRate) {
            return usageError("--rate cannot be combined with --set-raw-gain");
        }
        if (options.hasFrameCount && options.frameCount != options.rawGains.size()) {
            return usageError("--frames does not match the number of --set-raw-gain values");
        }
        options.frameCount = options.rawGains.size();
        options.hasFrameCount = true;
        return result;
    }

    if (!options.hasFrameCount) {
        return usageError("A window length is required (use -n)");
    }
    if (!options.printRawGain && !options.hasRate) {
        return usageError("A fade rate is required (use -r)");
    }
    return result;
}

ParseResult parseCommandLine(int argc, const char* const* argv) {
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(args);
}

std::string usageText(std::string_view programName) {
    std::string text = "Usage: ";
    text += programName;
    text += " [options] <input.mp3>\n"
            "\n"
            "Fade an MP3 in or out by rewriting Layer III global gain values.\n"
            "\n"
            "Options:\n"
            "  -o, --output <path>     Output file (required)\n"
            "  --in | --out            Fade direction (one is required)\n"
            "  -n, --frames N          Fade window length in frames (at most 100000)\n"
            "  -r, --rate R            Attenuation per frame in dB (2.5 dB per gain step)\n"
            "  --print-raw-gain        Print the global gain values of the window\n"
            "  --set-raw-gain N,N,...  Set explicit global gain values, one per frame\n"
            "  -v, --verbose           Print a summary of the run\n"
            "  -h, --help              Show this help\n";
    return text;
}

Mp3::FadeConfig buildFadeConfig(const CommandLineOptions& options) {
    Mp3::FadeConfig config;
    config.direction = options.direction;

    if (!options.rawGains.empty()) {
        config.gainStrategy = Mp3::GainStrategy::SetExplicit;
        Mp3::RampPlan plan(options.rawGains);
        config.plan = (options.direction == Mp3::FadeDirection::In) ? plan.reversed() : std::move(plan);
    } else if (options.printRawGain) {
        config.gainStrategy = Mp3::GainStrategy::Collect;
        config.plan = Mp3::planRamp(options.frameCount, 0.0);
    } else {
        config.gainStrategy = Mp3::GainStrategy::AddDelta;
        config.plan = Mp3::planRamp(options.frameCount, options.ratePerFrameDb);
    }
    return config;
}

} // namespace Taper
