// =================================================================
// src/Gitwise/OperationResult.cpp
// =================================================================

#include "Gitwise/OperationResult.hpp"

namespace Gitwise {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::NOT_A_VERSION: return "not_a_version";
        case ErrorKind::EMPTY_DESCRIPTION: return "empty_description";
        case ErrorKind::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorKind::TOOL_FAILURE: return "tool_failure";
        case ErrorKind::WORKFLOW_STEP_FAILURE: return "workflow_step_failure";
        default: return "unknown";
    }
}

} // namespace Gitwise
