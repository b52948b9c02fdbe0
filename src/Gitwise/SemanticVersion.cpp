// =================================================================
// src/Gitwise/SemanticVersion.cpp
// =================================================================
// Implementation of semantic version utilities.

#include "Gitwise/SemanticVersion.hpp"
#include <limits>
#include <regex>
#include <stdexcept>
#include <unordered_map>

namespace Gitwise {

bool SemanticVersion::operator==(const SemanticVersion& other) const {
    return major == other.major && minor == other.minor && patch == other.patch;
}

bool SemanticVersion::operator!=(const SemanticVersion& other) const {
    return !(*this == other);
}

bool SemanticVersion::operator<(const SemanticVersion& other) const {
    if (major != other.major) return major < other.major;
    if (minor != other.minor) return minor < other.minor;
    return patch < other.patch;
}

bool parseVersion(const std::string& tag, SemanticVersion& version) {
    static const std::regex version_re(R"(^(\d+)\.(\d+)\.(\d+))");

    std::string version_str = tag;
    if (!version_str.empty() && version_str[0] == 'v') {
        version_str.erase(0, 1);
    }

    std::smatch match;
    if (!std::regex_search(version_str, match, version_re)) {
        return false;
    }

    SemanticVersion parsed;
    try {
        parsed.major = std::stoul(match[1].str());
        parsed.minor = std::stoul(match[2].str());
        parsed.patch = std::stoul(match[3].str());
    } catch (const std::out_of_range&) {
        return false;
    }

    // Every accepted component must leave room for a bump
    const unsigned long limit = std::numeric_limits<unsigned long>::max();
    if (parsed.major == limit || parsed.minor == limit || parsed.patch == limit) {
        return false;
    }

    version = parsed;
    return true;
}

bool parseTagVersion(const std::string& tag, const std::string& prefix, SemanticVersion& version) {
    if (!prefix.empty() && tag.compare(0, prefix.size(), prefix) == 0) {
        return parseVersion(tag.substr(prefix.size()), version);
    }
    return parseVersion(tag, version);
}

SemanticVersion bumpVersion(const SemanticVersion& version, BumpKind kind) {
    SemanticVersion next = version;
    switch (kind) {
        case BumpKind::MAJOR:
            next.major++;
            next.minor = 0;
            next.patch = 0;
            break;
        case BumpKind::MINOR:
            next.minor++;
            next.patch = 0;
            break;
        case BumpKind::PATCH:
            next.patch++;
            break;
    }
    return next;
}

std::string formatTag(const SemanticVersion& version, const std::string& prefix) {
    return prefix + std::to_string(version.major) + "." +
           std::to_string(version.minor) + "." + std::to_string(version.patch);
}

std::string bumpKindToString(BumpKind kind) {
    switch (kind) {
        case BumpKind::MAJOR:
            return "major";
        case BumpKind::MINOR:
            return "minor";
        case BumpKind::PATCH:
            return "patch";
        default:
            throw std::invalid_argument("Unknown BumpKind value");
    }
}

BumpKind bumpKindFromString(const std::string& str) {
    static const std::unordered_map<std::string, BumpKind> bump_map = {
        {"major", BumpKind::MAJOR},
        {"minor", BumpKind::MINOR},
        {"patch", BumpKind::PATCH}
    };

    auto it = bump_map.find(str);
    if (it != bump_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown bump kind: " + str);
}

} // namespace Gitwise
