// =================================================================
// src/Gitwise/GitRepository.cpp
// =================================================================
// Implementation of repository operations on top of the git CLI.

#include "Gitwise/GitRepository.hpp"
#include "Gitwise/CommandRunner.hpp"
#include "Gitwise/Logger.hpp"
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace Gitwise {

static std::string trimTrailing(const std::string& text) {
    size_t last = text.find_last_not_of(" \t\n\r");
    if (last == std::string::npos) {
        return "";
    }
    return text.substr(0, last + 1);
}

// git reports some failures (e.g. "nothing to commit") on stdout only.
static std::string failureReason(const CommandOutput& output) {
    std::string reason = trimTrailing(output.stderr_text);
    if (reason.empty()) {
        reason = trimTrailing(output.stdout_text);
    }
    if (reason.empty()) {
        reason = "git exited with code " + std::to_string(output.exit_code);
    }
    return reason;
}

static OperationResult toolFailure(const std::string& action, const CommandOutput& output) {
    return OperationResult::failure(ErrorKind::TOOL_FAILURE,
                                    "Failed to " + action + ": " + failureReason(output));
}

GitRepository::GitRepository(CommandRunner& runner, const std::string& repo_path)
    : m_runner(runner), m_repo_path(repo_path) {}

CommandOutput GitRepository::runGit(const std::vector<std::string>& args) {
    std::vector<std::string> command_line;
    command_line.reserve(args.size() + 1);
    command_line.push_back("git");
    command_line.insert(command_line.end(), args.begin(), args.end());

    auto start = std::chrono::steady_clock::now();
    CommandOutput output;
    try {
        output = m_runner.run(command_line, m_repo_path);
    } catch (const std::runtime_error& e) {
        output.exit_code = 127;
        output.stderr_text = e.what();
    }
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    Logger::getInstance().logToolInvocation(command_line, output.exit_code,
                                            static_cast<long>(duration.count()));
    return output;
}

OperationResult GitRepository::stageAll() {
    CommandOutput output = runGit({"add", "."});
    if (!output.succeeded()) {
        return toolFailure("add files", output);
    }
    return OperationResult::success("Successfully added files to staging area");
}

OperationResult GitRepository::stage(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return OperationResult::success("No files given, nothing was staged");
    }

    std::vector<std::string> args = {"add", "--"};
    args.insert(args.end(), paths.begin(), paths.end());

    CommandOutput output = runGit(args);
    if (!output.succeeded()) {
        return toolFailure("add files", output);
    }
    return OperationResult::success("Successfully added files to staging area");
}

OperationResult GitRepository::commit(const std::string& message) {
    if (message.empty()) {
        return OperationResult::failure(ErrorKind::EMPTY_DESCRIPTION,
                                        "Failed to create commit: commit message is empty");
    }

    CommandOutput output = runGit({"commit", "-m", message});
    if (!output.succeeded()) {
        return toolFailure("create commit", output);
    }

    std::string header = message.substr(0, message.find('\n'));
    return OperationResult::success("Successfully created commit: " + header);
}

OperationResult GitRepository::commitConventional(const CommitSpec& spec) {
    if (!CommitMessageBuilder::isValid(spec)) {
        return OperationResult::failure(ErrorKind::EMPTY_DESCRIPTION,
                                        "Failed to create commit: description must not be empty");
    }
    return commit(CommitMessageBuilder::build(spec));
}

OperationResult GitRepository::createTag(const SemanticVersion& version,
                                         const std::string& message,
                                         const std::string& prefix) {
    std::string tag_name = formatTag(version, prefix);

    std::vector<std::string> args;
    if (!message.empty()) {
        args = {"tag", "-a", tag_name, "-m", message};
    } else {
        args = {"tag", tag_name};
    }

    CommandOutput output = runGit(args);
    if (!output.succeeded()) {
        return toolFailure("create tag", output);
    }
    return OperationResult::success("Successfully created tag: " + tag_name);
}

OperationResult GitRepository::push(const std::string& remote, const std::string& branch,
                                    bool include_tags) {
    std::vector<std::string> args = {"push", remote};
    if (!branch.empty()) {
        args.push_back(branch);
    }

    CommandOutput output = runGit(args);
    if (!output.succeeded()) {
        return toolFailure("push changes", output);
    }

    std::string message = "Successfully pushed changes to " + remote;

    if (include_tags) {
        CommandOutput tags_output = runGit({"push", remote, "--tags"});
        if (!tags_output.succeeded()) {
            return toolFailure("push tags", tags_output);
        }
        message += " (including tags)";
    }

    return OperationResult::success(message);
}

TagLookup GitRepository::latestTag() {
    TagLookup lookup;
    CommandOutput output = runGit({"describe", "--tags", "--abbrev=0"});

    std::string tag = trimTrailing(output.stdout_text);
    size_t first = tag.find_first_not_of(" \t\n\r");
    if (first != std::string::npos) {
        tag = tag.substr(first);
    }

    if (output.succeeded() && !tag.empty()) {
        lookup.found = true;
        lookup.tag = tag;
    } else {
        LOG_DEBUG("GitRepository", "No reachable tag: " + failureReason(output));
    }
    return lookup;
}

OperationResult GitRepository::status() {
    return sectionReport("=== Repository Status ===", "read repository status", {
        {{"status", "--short"}, "Short status"},
        {{"branch", "--show-current"}, "Current branch"},
        {{"remote", "-v"}, "Remote repositories"},
    });
}

OperationResult GitRepository::sectionReport(const std::string& heading, const std::string& action,
                                             const std::vector<ReportSection>& sections) {
    std::ostringstream report;
    report << heading;
    for (const auto& section : sections) {
        CommandOutput output = runGit(section.args);
        if (!output.succeeded()) {
            return toolFailure(action, output);
        }
        std::string text = trimTrailing(output.stdout_text);
        report << "\n\n" << section.title << ":\n" << (text.empty() ? "(no output)" : text);
    }
    return OperationResult::success(report.str());
}

OperationResult GitRepository::log(int limit) {
    if (limit <= 0) {
        return OperationResult::failure(ErrorKind::INVALID_ARGUMENT,
                                        "Failed to read history: limit must be positive, got " +
                                        std::to_string(limit));
    }

    CommandOutput output = runGit({"log", "--oneline", "-" + std::to_string(limit), "--decorate"});
    if (!output.succeeded()) {
        return toolFailure("read history", output);
    }

    return OperationResult::success("=== Recent Commits (last " + std::to_string(limit) + ") ===\n" +
                                    trimTrailing(output.stdout_text));
}

OperationResult GitRepository::sync(const std::string& remote, const std::string& branch) {
    std::vector<std::string> args = {"pull", remote};
    if (!branch.empty()) {
        args.push_back(branch);
    }

    CommandOutput output = runGit(args);
    if (!output.succeeded()) {
        return toolFailure("pull changes", output);
    }

    OperationResult pushed = push(remote, branch, false);
    if (!pushed.succeeded) {
        pushed.message = "Pulled from " + remote + " but push failed: " + pushed.message;
        return pushed;
    }
    return OperationResult::success("Successfully pulled from " + remote + "\n" + pushed.message);
}

OperationResult GitRepository::branchInfo() {
    return sectionReport("=== Branch Information ===", "read branches", {
        {{"branch", "-v"}, "Local branches"},
        {{"branch", "-r"}, "Remote branches"},
    });
}

OperationResult GitRepository::createBranch(const std::string& name, bool checkout) {
    if (name.empty()) {
        return OperationResult::failure(ErrorKind::INVALID_ARGUMENT,
                                        "Failed to create branch: branch name is empty");
    }

    CommandOutput output = checkout ? runGit({"checkout", "-b", name})
                                    : runGit({"branch", name});
    if (!output.succeeded()) {
        return toolFailure("create branch", output);
    }

    std::string message = "Branch '" + name + "' created successfully";
    if (checkout) {
        message += " and checked out";
    }
    return OperationResult::success(message);
}

OperationResult GitRepository::switchBranch(const std::string& name) {
    if (name.empty()) {
        return OperationResult::failure(ErrorKind::INVALID_ARGUMENT,
                                        "Failed to switch branch: branch name is empty");
    }

    CommandOutput output = runGit({"checkout", name});
    if (!output.succeeded()) {
        return toolFailure("switch branch", output);
    }
    return OperationResult::success("Switched to branch '" + name + "'");
}

OperationResult GitRepository::undoLastCommit(bool keep_changes) {
    CommandOutput output = runGit({"reset", keep_changes ? "--soft" : "--hard", "HEAD~1"});
    if (!output.succeeded()) {
        return toolFailure("undo last commit", output);
    }

    if (keep_changes) {
        return OperationResult::success("Last commit undone, changes kept in staging area");
    }
    return OperationResult::success("Last commit undone, changes discarded");
}

OperationResult GitRepository::discardChanges(const std::vector<std::string>& paths) {
    std::vector<std::string> args = {"checkout", "--"};
    if (paths.empty()) {
        args.push_back(".");
    } else {
        args.insert(args.end(), paths.begin(), paths.end());
    }

    CommandOutput output = runGit(args);
    if (!output.succeeded()) {
        return toolFailure("discard changes", output);
    }
    return OperationResult::success("Changes discarded successfully");
}

OperationResult GitRepository::stashSave(const std::string& message) {
    CommandOutput output = message.empty() ? runGit({"stash"})
                                           : runGit({"stash", "push", "-m", message});
    if (!output.succeeded()) {
        return toolFailure("stash changes", output);
    }

    std::string text = trimTrailing(output.stdout_text);
    return OperationResult::success(text.empty() ? "Changes stashed successfully" : text);
}

OperationResult GitRepository::stashPop() {
    CommandOutput output = runGit({"stash", "pop"});
    if (!output.succeeded()) {
        return toolFailure("apply stash", output);
    }

    std::string text = trimTrailing(output.stdout_text);
    return OperationResult::success(text.empty() ? "Stash applied successfully" : text);
}

OperationResult GitRepository::stashList() {
    CommandOutput output = runGit({"stash", "list"});
    if (!output.succeeded()) {
        return toolFailure("list stashes", output);
    }

    std::string text = trimTrailing(output.stdout_text);
    return OperationResult::success("=== Stash List ===\n" + (text.empty() ? std::string("No stashes found") : text));
}

} // namespace Gitwise
