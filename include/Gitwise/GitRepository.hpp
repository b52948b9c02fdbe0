// =================================================================
// include/Gitwise/GitRepository.hpp
// =================================================================
// Single-command git operations, each normalized into an
// OperationResult.

#pragma once

#include "Gitwise/CommitMessageBuilder.hpp"
#include "Gitwise/OperationResult.hpp"
#include "Gitwise/SemanticVersion.hpp"
#include <string>
#include <vector>

namespace Gitwise {

class CommandRunner;
struct CommandOutput;

/**
 * @brief Result of looking up the most recent reachable tag
 */
struct TagLookup {
    bool found = false;
    std::string tag;
};

/**
 * @brief Wraps git invocations for one repository.
 *
 * Every operation runs at most the commands it names, never retries, and
 * reports tool failures with the captured standard error.
 */
class GitRepository {
public:
    /**
     * @brief Construct over a command runner
     * @param runner Executes git; must outlive this object
     * @param repo_path Working directory of the repository
     */
    GitRepository(CommandRunner& runner, const std::string& repo_path = ".");

    /**
     * @brief Stage every change in the working tree ("git add .")
     */
    OperationResult stageAll();

    /**
     * @brief Stage the given paths. An empty list stages nothing and succeeds.
     */
    OperationResult stage(const std::vector<std::string>& paths);

    /**
     * @brief Commit staged changes with a prepared message.
     * Fails without running git if the message is empty.
     */
    OperationResult commit(const std::string& message);

    /**
     * @brief Validate, render and commit a conventional commit.
     *
     * A blank description fails with EMPTY_DESCRIPTION before git runs.
     * On success the message echoes only the header line.
     */
    OperationResult commitConventional(const CommitSpec& spec);

    /**
     * @brief Create a version tag
     * @param version Version to tag
     * @param message Annotation; an empty message creates a lightweight tag
     * @param prefix Tag prefix
     */
    OperationResult createTag(const SemanticVersion& version,
                              const std::string& message = "",
                              const std::string& prefix = "v");

    /**
     * @brief Push commits, then optionally tags.
     *
     * The tag push only runs after the commit push succeeded.
     *
     * @param remote Remote name
     * @param branch Branch to push; empty pushes the current branch
     * @param include_tags Also run "git push <remote> --tags"
     */
    OperationResult push(const std::string& remote = "origin",
                         const std::string& branch = "",
                         bool include_tags = false);

    /**
     * @brief Find the latest reachable tag ("git describe --tags --abbrev=0").
     * Any failure or empty output means no tag.
     */
    TagLookup latestTag();

    /**
     * @brief Short status, current branch and remotes in one report.
     */
    OperationResult status();

    /**
     * @brief Recent history, one line per commit.
     * @param limit Number of commits; must be positive
     */
    OperationResult log(int limit = 10);

    /**
     * @brief Pull, then push. A failed pull blocks the push.
     */
    OperationResult sync(const std::string& remote = "origin", const std::string& branch = "");

    /**
     * @brief Local branches with their last commit, then remote-tracking branches.
     */
    OperationResult branchInfo();

    /**
     * @brief Create a branch
     * @param name Branch name; must not be empty
     * @param checkout Switch to the new branch ("checkout -b") instead of only creating it
     */
    OperationResult createBranch(const std::string& name, bool checkout = true);

    OperationResult switchBranch(const std::string& name);

    /**
     * @brief Remove the last commit.
     * @param keep_changes Soft reset keeping the changes staged; otherwise a hard reset
     */
    OperationResult undoLastCommit(bool keep_changes = true);

    /**
     * @brief Restore paths from the index. An empty list discards every change.
     */
    OperationResult discardChanges(const std::vector<std::string>& paths);

    /**
     * @brief Stash working tree changes, optionally with a message.
     */
    OperationResult stashSave(const std::string& message = "");

    OperationResult stashPop();

    OperationResult stashList();

    const std::string& repoPath() const { return m_repo_path; }

private:
    struct ReportSection {
        std::vector<std::string> args;
        std::string title;
    };

    CommandOutput runGit(const std::vector<std::string>& args);
    OperationResult sectionReport(const std::string& heading, const std::string& action,
                                  const std::vector<ReportSection>& sections);

    CommandRunner& m_runner;
    std::string m_repo_path;
};

} // namespace Gitwise
