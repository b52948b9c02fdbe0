// =================================================================
// include/Gitwise/CommitMessageBuilder.hpp
// =================================================================
// Renders structured commit specifications into conventional commit
// messages.

#pragma once

#include <string>

namespace Gitwise {

/**
 * @brief Conventional commit types
 */
enum class CommitType {
    FEAT,       ///< New feature
    FIX,        ///< Bug fix
    DOCS,       ///< Documentation changes
    STYLE,      ///< Formatting, whitespace
    REFACTOR,   ///< Code restructuring
    PERF,       ///< Performance improvements
    TEST,       ///< Adding or updating tests
    BUILD,      ///< Build system or dependencies
    CI,         ///< CI/CD changes
    CHORE       ///< Other changes
};

/**
 * @brief Structured commit description. Empty optional fields are omitted.
 */
struct CommitSpec {
    CommitType type = CommitType::FEAT;
    std::string description;
    std::string scope;
    std::string body;
    bool breaking = false;
    std::string footer;
};

class CommitMessageBuilder {
public:
    /**
     * @brief Build the full commit message.
     *
     * Header "{type}{(scope)}{!}: {description}", then a blank line and the
     * body (or a BREAKING CHANGE notice when breaking without a body), then
     * a blank line and the footer.
     */
    static std::string build(const CommitSpec& spec);

    /**
     * @brief Build only the header line, used as the short confirmation.
     */
    static std::string buildHeader(const CommitSpec& spec);

    /**
     * @brief Check that the description is not blank.
     */
    static bool isValid(const CommitSpec& spec);

    static const char* const BREAKING_CHANGE_NOTICE;
};

std::string commitTypeToString(CommitType type);

/**
 * @brief Convert a lowercase type name ("feat", "fix", ...) to a CommitType.
 * Throws std::invalid_argument for anything outside the closed set.
 */
CommitType commitTypeFromString(const std::string& str);

} // namespace Gitwise
