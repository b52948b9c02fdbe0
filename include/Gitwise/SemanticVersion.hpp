// =================================================================
// include/Gitwise/SemanticVersion.hpp
// =================================================================
// Semantic version parsing, ordering and bumping.

#pragma once

#include <string>

namespace Gitwise {

/**
 * @brief Version bump kinds
 */
enum class BumpKind {
    MAJOR,      ///< Breaking changes (X.0.0)
    MINOR,      ///< New features (0.X.0)
    PATCH       ///< Bug fixes (0.0.X)
};

/**
 * @brief Immutable major.minor.patch triple, ordered lexicographically
 */
struct SemanticVersion {
    unsigned long major = 0;
    unsigned long minor = 0;
    unsigned long patch = 0;

    bool operator==(const SemanticVersion& other) const;
    bool operator!=(const SemanticVersion& other) const;
    bool operator<(const SemanticVersion& other) const;
};

/**
 * @brief Parse a version out of a tag name.
 *
 * A single leading 'v' is stripped, then major.minor.patch must appear at
 * the start of the remaining text. Anything after the third number is
 * ignored, so "1.2.3-rc1" parses as 1.2.3.
 *
 * @param tag Tag name (e.g. "v1.2.3" or "1.2.3")
 * @param version Receives the parsed version on success
 * @return False if the tag does not start with three dot-separated integers,
 *         or if a component is too large to be bumped
 */
bool parseVersion(const std::string& tag, SemanticVersion& version);

/**
 * @brief Parse a tag created with a custom prefix.
 *
 * The prefix is removed when the tag starts with it, then the rest goes
 * through parseVersion (which still accepts a leading 'v').
 */
bool parseTagVersion(const std::string& tag, const std::string& prefix, SemanticVersion& version);

/**
 * @brief Produce the next version for a bump kind.
 *
 * MAJOR resets minor and patch, MINOR resets patch, PATCH only increments patch.
 */
SemanticVersion bumpVersion(const SemanticVersion& version, BumpKind kind);

/**
 * @brief Render a version as "{prefix}{major}.{minor}.{patch}"
 */
std::string formatTag(const SemanticVersion& version, const std::string& prefix = "v");

std::string bumpKindToString(BumpKind kind);

/**
 * @brief Convert "major", "minor" or "patch" to a BumpKind.
 * Throws std::invalid_argument for anything else.
 */
BumpKind bumpKindFromString(const std::string& str);

} // namespace Gitwise
