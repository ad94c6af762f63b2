// ==============================================================================
// taper - fade MP3 files in or out without re-encoding
// ==============================================================================

#include "command_line.h"
#include "fade_runner.h"
#include "version.h"

#include <iostream>
#include <string_view>

int main(int argc, char* argv[]) {
    const std::string_view programName = (argc > 0) ? argv[0] : stringProgramName;
    const Taper::ParseResult parsed = Taper::parseCommandLine(argc, argv);

    switch (parsed.status) {
        case Taper::ParseStatus::Help:
            std::cout << stringProgramName << " " << VERSION_STR << "\n\n"
                      << Taper::usageText(programName);
            return Taper::kExitSuccess;
        case Taper::ParseStatus::UsageError:
            std::cerr << "error: " << parsed.errorMessage << "\n\n"
                      << Taper::usageText(programName);
            return Taper::kExitUsageError;
        case Taper::ParseStatus::Ok:
            break;
    }

    return Taper::runFadeOnFiles(parsed.options, std::cout, std::cerr);
}
