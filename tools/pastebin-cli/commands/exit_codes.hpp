#pragma once

#include <pastebin/result.hpp>

namespace pastebin::cli {

// Standard exit codes for CLI commands
// Named with PASTEBIN_ prefix to avoid conflict with system macros
constexpr int PASTEBIN_EXIT_SUCCESS = 0;
constexpr int PASTEBIN_EXIT_USER_ERROR = 1;     // Invalid arguments, empty content
constexpr int PASTEBIN_EXIT_NOT_FOUND = 2;      // No paste with that id
constexpr int PASTEBIN_EXIT_IO_ERROR = 3;       // File or storage errors
constexpr int PASTEBIN_EXIT_INTERNAL = 4;       // Internal/unexpected errors
constexpr int PASTEBIN_EXIT_CONFLICT = 5;       // Id still taken after every attempt

/**
 * Map a store error onto the CLI's exit codes.
 */
inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::OK:
            return PASTEBIN_EXIT_SUCCESS;
        case ErrorCode::VALIDATION_ERROR:
        case ErrorCode::INVALID_ARGUMENT:
            return PASTEBIN_EXIT_USER_ERROR;
        case ErrorCode::NOT_FOUND:
            return PASTEBIN_EXIT_NOT_FOUND;
        case ErrorCode::CONFLICT:
            return PASTEBIN_EXIT_CONFLICT;
        case ErrorCode::IO_ERROR:
        case ErrorCode::CORRUPTION:
        case ErrorCode::BUFFER_POOL_FULL:
        case ErrorCode::STORE_NOT_OPEN:
            return PASTEBIN_EXIT_IO_ERROR;
        default:
            return PASTEBIN_EXIT_INTERNAL;
    }
}

}  // namespace pastebin::cli
