#pragma once

namespace spiral::cli {

// Standard exit codes for CLI commands
// Named with SPIRAL_ prefix to avoid conflict with system macros
constexpr int SPIRAL_EXIT_SUCCESS = 0;
constexpr int SPIRAL_EXIT_USER_ERROR = 1;     // Invalid arguments, oversized input
constexpr int SPIRAL_EXIT_IO_ERROR = 3;       // Unreadable or malformed data files
constexpr int SPIRAL_EXIT_INTERNAL = 4;       // Internal/unexpected errors

}  // namespace spiral::cli
