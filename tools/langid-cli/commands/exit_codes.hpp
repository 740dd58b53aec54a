#pragma once

namespace langid::cli {

// Standard exit codes for CLI commands
// Named with LANGID_ prefix to avoid conflict with system macros
constexpr int LANGID_EXIT_SUCCESS = 0;
constexpr int LANGID_EXIT_USER_ERROR = 1;     // Invalid arguments, bad configuration
constexpr int LANGID_EXIT_IO_ERROR = 3;       // Unreadable input or config file
constexpr int LANGID_EXIT_INTERNAL = 4;       // Internal/unexpected errors

}  // namespace langid::cli
