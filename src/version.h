#pragma once

// ==============================================================================
// Version Information
// ==============================================================================
// Keep in sync with CMakeLists.txt project version.
// ==============================================================================

#define MAJOR_VERSION_STR "1"
#define SUB_VERSION_STR "0"
#define RELEASE_NUMBER_STR "0"

#define VERSION_STR MAJOR_VERSION_STR "." SUB_VERSION_STR "." RELEASE_NUMBER_STR

#define stringProgramName "taper"
