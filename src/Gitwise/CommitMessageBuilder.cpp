// =================================================================
// src/Gitwise/CommitMessageBuilder.cpp
// =================================================================
// Implementation of conventional commit message rendering.

#include "Gitwise/CommitMessageBuilder.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace Gitwise {

const char* const CommitMessageBuilder::BREAKING_CHANGE_NOTICE =
    "BREAKING CHANGE: This commit contains breaking changes";

std::string CommitMessageBuilder::buildHeader(const CommitSpec& spec) {
    std::string header = commitTypeToString(spec.type);
    if (!spec.scope.empty()) {
        header += "(" + spec.scope + ")";
    }
    if (spec.breaking) {
        header += "!";
    }
    header += ": " + spec.description;
    return header;
}

std::string CommitMessageBuilder::build(const CommitSpec& spec) {
    std::string message = buildHeader(spec);

    if (!spec.body.empty()) {
        message += "\n\n" + spec.body;
    } else if (spec.breaking) {
        message += "\n\n";
        message += BREAKING_CHANGE_NOTICE;
    }

    if (!spec.footer.empty()) {
        message += "\n\n" + spec.footer;
    }

    return message;
}

bool CommitMessageBuilder::isValid(const CommitSpec& spec) {
    return std::any_of(spec.description.begin(), spec.description.end(),
                       [](unsigned char ch) { return !std::isspace(ch); });
}

std::string commitTypeToString(CommitType type) {
    switch (type) {
        case CommitType::FEAT: return "feat";
        case CommitType::FIX: return "fix";
        case CommitType::DOCS: return "docs";
        case CommitType::STYLE: return "style";
        case CommitType::REFACTOR: return "refactor";
        case CommitType::PERF: return "perf";
        case CommitType::TEST: return "test";
        case CommitType::BUILD: return "build";
        case CommitType::CI: return "ci";
        case CommitType::CHORE: return "chore";
        default:
            throw std::invalid_argument("Unknown CommitType value");
    }
}

CommitType commitTypeFromString(const std::string& str) {
    static const std::unordered_map<std::string, CommitType> type_map = {
        {"feat", CommitType::FEAT},
        {"fix", CommitType::FIX},
        {"docs", CommitType::DOCS},
        {"style", CommitType::STYLE},
        {"refactor", CommitType::REFACTOR},
        {"perf", CommitType::PERF},
        {"test", CommitType::TEST},
        {"build", CommitType::BUILD},
        {"ci", CommitType::CI},
        {"chore", CommitType::CHORE}
    };

    auto it = type_map.find(str);
    if (it != type_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown commit type: " + str);
}

} // namespace Gitwise
