#pragma once

namespace decomment::cli {

// Standard exit codes for CLI commands
// Named with DECOMMENT_ prefix to avoid conflict with system macros
constexpr int DECOMMENT_EXIT_SUCCESS = 0;
constexpr int DECOMMENT_EXIT_USER_ERROR = 1;   // Invalid arguments, empty input
constexpr int DECOMMENT_EXIT_NOT_FOUND = 2;    // Input file does not exist
constexpr int DECOMMENT_EXIT_IO_ERROR = 3;     // Read/write failures
constexpr int DECOMMENT_EXIT_INTERNAL = 4;     // Internal/unexpected errors

}  // namespace decomment::cli
