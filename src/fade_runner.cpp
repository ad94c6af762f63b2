// ==============================================================================
// Fade Runner Implementation
// ==============================================================================

#include "fade_runner.h"

#include <taper/codec/stream_io.h>

#include <fstream>
#include <string_view>

namespace Taper {

namespace {

bool checkConfig(const Mp3::FadeConfig& config, std::ostream& log) {
    if (config.isValid()) {
        return true;
    }
    if (config.plan.size() > Mp3::kMaxFadeFrames) {
        log << "error: fade window is longer than " << Mp3::kMaxFadeFrames << " frames" << std::endl;
        return false;
    }
    log << "error: explicit gain values must lie between "
        << Mp3::kMinGlobalGain << " and " << Mp3::kMaxGlobalGain << std::endl;
    return false;
}

} // anonymous namespace

void printRawGains(std::span<const int> gains, std::ostream& out) {
    for (size_t i = 0; i < gains.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << gains[i];
    }
    out << '\n';
}

int runFade(const CommandLineOptions& options, std::istream& input, std::ostream& output,
            std::ostream& out, std::ostream& log) {
    const Mp3::FadeConfig config = buildFadeConfig(options);
    if (!checkConfig(config, log)) {
        return kExitFatalError;
    }

    Mp3::FadePipeline pipeline(config);
    pipeline.setDiagnosticCallback([&log](std::string_view message) {
        log << "warning: " << message << std::endl;
    });

    Mp3::StreamReader reader(input);
    Mp3::StreamWriter writer(output);
    const Mp3::FadeResult result = pipeline.run(reader, writer);

    if (!result) {
        log << "error: " << Mp3::fadeErrorName(result.error) << ": " << result.errorMessage << std::endl;
        return kExitFatalError;
    }

    output.flush();
    if (!output) {
        log << "error: cannot write output" << std::endl;
        return kExitFatalError;
    }

    if (options.printRawGain) {
        printRawGains(pipeline.collectedGains(), out);
    }

    if (options.verbose) {
        const auto& stats = result.statistics;
        log << "Items:              " << stats.itemsIn << "\n"
            << "Frames:             " << stats.framesIn << "\n"
            << "Frames adjusted:    " << stats.framesAdjusted << "\n"
            << "VBR frames skipped: " << stats.vbrFramesSkipped << "\n"
            << "Bytes written:      " << writer.bytesWritten() << std::endl;
    }
    return kExitSuccess;
}

int runFadeOnFiles(const CommandLineOptions& options, std::ostream& out, std::ostream& log) {
    // nothing is opened for a run that cannot succeed
    if (!checkConfig(buildFadeConfig(options), log)) {
        return kExitFatalError;
    }

    // input first: a missing input must not truncate an existing output
    std::ifstream input(options.inputPath, std::ios::binary);
    if (!input) {
        log << "error: cannot open input file: " << options.inputPath << std::endl;
        return kExitFatalError;
    }

    std::ofstream output(options.outputPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        log << "error: cannot open output file: " << options.outputPath << std::endl;
        return kExitFatalError;
    }

    return runFade(options, input, output, out, log);
}

} // namespace Taper
