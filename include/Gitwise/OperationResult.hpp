// =================================================================
// include/Gitwise/OperationResult.hpp
// =================================================================
// Result type returned by every externally visible operation.

#pragma once

#include <string>

namespace Gitwise {

/**
 * @brief Classification of a failed operation
 */
enum class ErrorKind {
    NONE,                   ///< Operation succeeded
    NOT_A_VERSION,          ///< A tag does not parse as major.minor.patch
    EMPTY_DESCRIPTION,      ///< Commit description is blank
    INVALID_ARGUMENT,       ///< Caller supplied an unusable argument
    TOOL_FAILURE,           ///< External command exited with nonzero status
    WORKFLOW_STEP_FAILURE   ///< A step of a compound workflow failed
};

/**
 * @brief Outcome of an operation: success flag plus a human-readable message.
 *
 * On failure the message always carries the underlying reason (for tool
 * failures, the captured standard error).
 */
struct OperationResult {
    bool succeeded = false;
    std::string message;
    ErrorKind error = ErrorKind::NONE;

    static OperationResult success(const std::string& msg) {
        return {true, msg, ErrorKind::NONE};
    }

    static OperationResult failure(ErrorKind kind, const std::string& msg) {
        return {false, msg, kind};
    }
};

/**
 * @brief Get the lowercase name of an error kind ("none", "tool_failure", ...)
 */
std::string errorKindToString(ErrorKind kind);

} // namespace Gitwise
