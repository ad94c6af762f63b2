#pragma once

// ==============================================================================
// Fade Runner
// ==============================================================================
// Opens the files named on the command line, runs the fade pipeline and
// reports the outcome. Returns the process exit code.
// ==============================================================================

#include "command_line.h"

#include <istream>
#include <ostream>
#include <span>

namespace Taper {

/// Process exit codes
enum ExitCode : int {
    kExitSuccess = 0,
    kExitFatalError = 1,
    kExitUsageError = 2
};

/// @brief Run a fade between two already opened streams.
/// @param out Receives --print-raw-gain output
/// @param log Receives warnings, errors and the --verbose summary
[[nodiscard]] int runFade(const CommandLineOptions& options, std::istream& input,
                          std::ostream& output, std::ostream& out, std::ostream& log);

/// @brief Open the input and output files, then run the fade.
[[nodiscard]] int runFadeOnFiles(const CommandLineOptions& options, std::ostream& out,
                                 std::ostream& log);

/// Format collected gains as one comma-separated line
void printRawGains(std::span<const int> gains, std::ostream& out);

} // namespace Taper
