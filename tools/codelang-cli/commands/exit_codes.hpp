#pragma once

#include <codelang/result.hpp>

namespace codelang::cli {

// Standard exit codes for CLI commands
// Named with CODELANG_ prefix to avoid conflict with system macros
constexpr int CODELANG_EXIT_SUCCESS = 0;
constexpr int CODELANG_EXIT_USER_ERROR = 1;     // Invalid arguments, empty input
constexpr int CODELANG_EXIT_NOT_FOUND = 2;      // Input or model file not found
constexpr int CODELANG_EXIT_IO_ERROR = 3;       // Read failures
constexpr int CODELANG_EXIT_MODEL_ERROR = 4;    // Model rejected or internal defect

inline int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return CODELANG_EXIT_SUCCESS;
        case ErrorCode::EMPTY_INPUT:
        case ErrorCode::INVALID_ARGUMENT: return CODELANG_EXIT_USER_ERROR;
        case ErrorCode::NOT_FOUND: return CODELANG_EXIT_NOT_FOUND;
        case ErrorCode::IO_ERROR: return CODELANG_EXIT_IO_ERROR;
        default: return CODELANG_EXIT_MODEL_ERROR;
    }
}

}  // namespace codelang::cli
