#pragma once

namespace relay::cli {

// Standard exit codes for CLI commands
// Named with RELAY_ prefix to avoid conflict with system macros
constexpr int RELAY_EXIT_SUCCESS = 0;
constexpr int RELAY_EXIT_USER_ERROR = 1;     // Invalid arguments, usage errors
constexpr int RELAY_EXIT_REQUEST_FAILED = 2; // Load balancer returned an error
constexpr int RELAY_EXIT_IO_ERROR = 3;       // Config file errors
constexpr int RELAY_EXIT_UNHEALTHY = 4;      // At least one provider failed its probe

}  // namespace relay::cli
