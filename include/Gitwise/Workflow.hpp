// =================================================================
// include/Gitwise/Workflow.hpp
// =================================================================
// Compound workflows that chain repository operations and report
// partial failures precisely.

#pragma once

#include "Gitwise/CommitMessageBuilder.hpp"
#include "Gitwise/OperationResult.hpp"
#include "Gitwise/SemanticVersion.hpp"
#include <string>
#include <vector>

namespace Gitwise {

class GitRepository;

/**
 * @brief Steps that can appear in a compound workflow
 */
enum class WorkflowStep {
    NONE,
    STAGE,
    COMMIT,
    RESOLVE_BASELINE,
    BUMP,
    CREATE_TAG,
    PUSH
};

std::string workflowStepToString(WorkflowStep step);

/**
 * @brief Outcome of a workflow run
 *
 * On failure, failed_step names the step that stopped the run and
 * durable_effects lists what had already been written to the repository.
 */
struct WorkflowReport {
    bool succeeded = false;
    std::string message;
    ErrorKind cause = ErrorKind::NONE;        ///< Error of the failing step
    WorkflowStep failed_step = WorkflowStep::NONE;
    std::string tag_name;                     ///< Tag created or targeted, if any
    std::vector<std::string> step_messages;   ///< Messages of completed steps, in order
    std::vector<std::string> durable_effects;

    /**
     * @brief Collapse into the caller-facing result.
     * Failures are reported as WORKFLOW_STEP_FAILURE.
     */
    OperationResult toResult() const;
};

/**
 * @brief Options for the tag (and push) workflow
 */
struct TagOptions {
    BumpKind bump = BumpKind::PATCH;
    std::string message;            ///< Tag annotation; empty creates a lightweight tag
    std::string prefix = "v";
    bool push = true;
    std::string remote = "origin";
    std::string branch;             ///< Empty pushes the current branch
};

/**
 * @brief Resolve baseline, bump, create tag, push, as a resumable state machine.
 *
 * A push failure leaves the tag in place and the workflow positioned at
 * PUSH, so calling run() again retries only the push.
 */
class TagAndPushWorkflow {
public:
    enum class State {
        RESOLVE_BASELINE,
        BUMP,
        CREATE_TAG,
        PUSH,
        SUCCESS,
        FAILED
    };

    TagAndPushWorkflow(GitRepository& repo, const TagOptions& options);

    /**
     * @brief Build a workflow for a tag that already exists locally.
     * Running it only pushes; no tag is created.
     */
    static TagAndPushWorkflow resumePush(GitRepository& repo, const TagOptions& options,
                                         const std::string& tag_name);

    /**
     * @brief Advance until SUCCESS or FAILED.
     *
     * After a failure at PUSH only the push is retried. After a failure
     * before the tag exists the run starts over from RESOLVE_BASELINE.
     * After SUCCESS the previous report is returned without running commands.
     */
    WorkflowReport run();

    State state() const { return m_state; }
    const SemanticVersion& baseline() const { return m_baseline; }
    const SemanticVersion& target() const { return m_target; }
    const std::string& tagName() const { return m_tag_name; }

private:
    State resolveBaseline();
    State bump();
    State createTag();
    State pushTag();
    State fail(WorkflowStep step, ErrorKind cause, const std::string& message);

    GitRepository& m_repo;
    TagOptions m_options;
    State m_state = State::RESOLVE_BASELINE;
    SemanticVersion m_baseline;
    SemanticVersion m_target;
    std::string m_tag_name;
    bool m_tag_created = false;
    WorkflowReport m_report;
};

/**
 * @brief Options for the commit workflow
 */
struct CommitOptions {
    CommitSpec spec;
    bool stage = false;                 ///< Stage before committing
    bool stage_all = true;              ///< With stage: everything, otherwise only paths
    std::vector<std::string> paths;
    bool tag = false;                   ///< Run the tag-and-push workflow after committing
    BumpKind bump = BumpKind::PATCH;
    std::string tag_prefix = "v";
    bool push = false;                  ///< Push without tags (ignored when tag is set)
    std::string remote = "origin";
    std::string branch;
};

/**
 * @brief Stage? -> commit -> (tag and push | push)?, stopping at the first failure.
 *
 * The commit description is validated before any command runs.
 */
class CommitWorkflow {
public:
    CommitWorkflow(GitRepository& repo, const CommitOptions& options);

    WorkflowReport run();

private:
    WorkflowReport fail(WorkflowReport& report, WorkflowStep step, ErrorKind cause,
                        const std::string& message);

    GitRepository& m_repo;
    CommitOptions m_options;
};

} // namespace Gitwise
