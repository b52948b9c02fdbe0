// =================================================================
// src/Gitwise/Workflow.cpp
// =================================================================
// Implementation of the tag-and-push and commit workflows.

#include "Gitwise/Workflow.hpp"
#include "Gitwise/GitRepository.hpp"
#include "Gitwise/Logger.hpp"
#include <sstream>

namespace Gitwise {

static std::string joinLines(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream joined;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) joined << separator;
        joined << items[i];
    }
    return joined.str();
}

static std::string withDurableEffects(const std::string& message,
                                      const std::vector<std::string>& effects) {
    if (effects.empty()) {
        return message;
    }
    return message + " (already done: " + joinLines(effects, ", ") + ")";
}

std::string workflowStepToString(WorkflowStep step) {
    switch (step) {
        case WorkflowStep::NONE: return "none";
        case WorkflowStep::STAGE: return "stage";
        case WorkflowStep::COMMIT: return "commit";
        case WorkflowStep::RESOLVE_BASELINE: return "resolve-baseline";
        case WorkflowStep::BUMP: return "bump";
        case WorkflowStep::CREATE_TAG: return "create-tag";
        case WorkflowStep::PUSH: return "push";
        default: return "unknown";
    }
}

OperationResult WorkflowReport::toResult() const {
    if (succeeded) {
        return OperationResult::success(message);
    }
    return OperationResult::failure(ErrorKind::WORKFLOW_STEP_FAILURE, message);
}

// -----------------------------------------------------------------
// TagAndPushWorkflow
// -----------------------------------------------------------------

TagAndPushWorkflow::TagAndPushWorkflow(GitRepository& repo, const TagOptions& options)
    : m_repo(repo), m_options(options) {}

TagAndPushWorkflow TagAndPushWorkflow::resumePush(GitRepository& repo, const TagOptions& options,
                                                  const std::string& tag_name) {
    TagOptions push_options = options;
    push_options.push = true;

    TagAndPushWorkflow workflow(repo, push_options);
    workflow.m_tag_name = tag_name;
    workflow.m_tag_created = true;
    workflow.m_state = State::PUSH;
    workflow.m_report.tag_name = tag_name;

    SemanticVersion parsed;
    if (parseTagVersion(tag_name, push_options.prefix, parsed)) {
        workflow.m_target = parsed;
    }
    return workflow;
}

WorkflowReport TagAndPushWorkflow::run() {
    if (m_state == State::SUCCESS) {
        return m_report;
    }

    if (m_state == State::FAILED) {
        m_report.succeeded = false;
        m_report.message.clear();
        m_report.cause = ErrorKind::NONE;
        m_report.failed_step = WorkflowStep::NONE;
        if (m_tag_created) {
            LOG_INFO("TagAndPush", "Resuming at push for existing tag " + m_tag_name);
            m_state = State::PUSH;
        } else {
            m_report.step_messages.clear();
            m_report.tag_name.clear();
            m_state = State::RESOLVE_BASELINE;
        }
    }

    while (m_state != State::SUCCESS && m_state != State::FAILED) {
        switch (m_state) {
            case State::RESOLVE_BASELINE:
                m_state = resolveBaseline();
                break;
            case State::BUMP:
                m_state = bump();
                break;
            case State::CREATE_TAG:
                m_state = createTag();
                break;
            case State::PUSH:
                m_state = pushTag();
                break;
            default:
                m_state = State::FAILED;
                break;
        }
    }

    return m_report;
}

TagAndPushWorkflow::State TagAndPushWorkflow::resolveBaseline() {
    TagLookup latest = m_repo.latestTag();
    if (!latest.found) {
        m_baseline = SemanticVersion();
        Logger::getInstance().logWorkflowStep("TagAndPush", "resolve-baseline", true,
                                              "No version tag found, baseline 0.0.0");
        return State::BUMP;
    }

    SemanticVersion parsed;
    if (!parseTagVersion(latest.tag, m_options.prefix, parsed)) {
        return fail(WorkflowStep::RESOLVE_BASELINE, ErrorKind::NOT_A_VERSION,
                    "Failed to parse version from tag: " + latest.tag);
    }

    m_baseline = parsed;
    Logger::getInstance().logWorkflowStep("TagAndPush", "resolve-baseline", true,
                                          "Latest tag " + latest.tag);
    return State::BUMP;
}

TagAndPushWorkflow::State TagAndPushWorkflow::bump() {
    m_target = bumpVersion(m_baseline, m_options.bump);
    m_tag_name = formatTag(m_target, m_options.prefix);
    m_report.tag_name = m_tag_name;

    Logger::getInstance().logWorkflowStep("TagAndPush", "bump", true,
        bumpKindToString(m_options.bump) + ": " + formatTag(m_baseline, "") + " -> " +
        formatTag(m_target, ""));
    return State::CREATE_TAG;
}

TagAndPushWorkflow::State TagAndPushWorkflow::createTag() {
    OperationResult created = m_repo.createTag(m_target, m_options.message, m_options.prefix);
    if (!created.succeeded) {
        return fail(WorkflowStep::CREATE_TAG, created.error, created.message);
    }

    m_tag_created = true;
    m_report.step_messages.push_back(created.message);
    m_report.durable_effects.push_back("tag " + m_tag_name + " created locally");
    Logger::getInstance().logWorkflowStep("TagAndPush", "create-tag", true, m_tag_name);

    if (!m_options.push) {
        m_report.succeeded = true;
        m_report.message = created.message;
        return State::SUCCESS;
    }
    return State::PUSH;
}

TagAndPushWorkflow::State TagAndPushWorkflow::pushTag() {
    OperationResult pushed = m_repo.push(m_options.remote, m_options.branch, true);
    if (!pushed.succeeded) {
        return fail(WorkflowStep::PUSH, pushed.error,
                    "tag " + m_tag_name + " created locally but push failed: " + pushed.message +
                    " (retry the push only; the tag already exists)");
    }

    m_report.step_messages.push_back(pushed.message);
    m_report.succeeded = true;
    m_report.message = "Successfully created tag " + m_tag_name + " and pushed to " + m_options.remote;
    Logger::getInstance().logWorkflowStep("TagAndPush", "push", true, pushed.message);
    return State::SUCCESS;
}

TagAndPushWorkflow::State TagAndPushWorkflow::fail(WorkflowStep step, ErrorKind cause,
                                                   const std::string& message) {
    m_report.succeeded = false;
    m_report.cause = cause;
    m_report.failed_step = step;
    m_report.message = workflowStepToString(step) + " step failed: " + message;

    Logger::getInstance().logWorkflowStep("TagAndPush", workflowStepToString(step), false, message);
    return State::FAILED;
}

// -----------------------------------------------------------------
// CommitWorkflow
// -----------------------------------------------------------------

CommitWorkflow::CommitWorkflow(GitRepository& repo, const CommitOptions& options)
    : m_repo(repo), m_options(options) {}

WorkflowReport CommitWorkflow::run() {
    WorkflowReport report;

    // Validation happens before any command touches the repository
    if (!CommitMessageBuilder::isValid(m_options.spec)) {
        return fail(report, WorkflowStep::COMMIT, ErrorKind::EMPTY_DESCRIPTION,
                    "description must not be empty");
    }

    if (m_options.stage) {
        OperationResult staged = m_options.stage_all ? m_repo.stageAll()
                                                     : m_repo.stage(m_options.paths);
        if (!staged.succeeded) {
            return fail(report, WorkflowStep::STAGE, staged.error, staged.message);
        }
        report.step_messages.push_back(staged.message);
        Logger::getInstance().logWorkflowStep("Commit", "stage", true, staged.message);
    }

    OperationResult committed = m_repo.commitConventional(m_options.spec);
    if (!committed.succeeded) {
        return fail(report, WorkflowStep::COMMIT, committed.error, committed.message);
    }
    report.step_messages.push_back(committed.message);
    report.durable_effects.push_back("commit created");
    Logger::getInstance().logWorkflowStep("Commit", "commit", true, committed.message);

    if (m_options.tag) {
        TagOptions tag_options;
        tag_options.bump = m_options.bump;
        tag_options.message = m_options.spec.description;
        tag_options.prefix = m_options.tag_prefix;
        tag_options.push = true;
        tag_options.remote = m_options.remote;
        tag_options.branch = m_options.branch;

        TagAndPushWorkflow tag_workflow(m_repo, tag_options);
        WorkflowReport tagged = tag_workflow.run();
        report.tag_name = tagged.tag_name;

        if (!tagged.succeeded) {
            report.succeeded = false;
            report.cause = tagged.cause;
            report.failed_step = tagged.failed_step;
            report.message = withDurableEffects(tagged.message, report.durable_effects);
            report.durable_effects.insert(report.durable_effects.end(),
                                          tagged.durable_effects.begin(),
                                          tagged.durable_effects.end());
            return report;
        }

        report.durable_effects.insert(report.durable_effects.end(),
                                      tagged.durable_effects.begin(),
                                      tagged.durable_effects.end());
        report.step_messages.push_back(tagged.message);
    } else if (m_options.push) {
        OperationResult pushed = m_repo.push(m_options.remote, m_options.branch, false);
        if (!pushed.succeeded) {
            return fail(report, WorkflowStep::PUSH, pushed.error, pushed.message);
        }
        report.step_messages.push_back(pushed.message);
        Logger::getInstance().logWorkflowStep("Commit", "push", true, pushed.message);
    }

    report.succeeded = true;
    report.message = joinLines(report.step_messages, "\n");
    return report;
}

WorkflowReport CommitWorkflow::fail(WorkflowReport& report, WorkflowStep step, ErrorKind cause,
                                    const std::string& message) {
    report.succeeded = false;
    report.cause = cause;
    report.failed_step = step;
    report.message = withDurableEffects(workflowStepToString(step) + " step failed: " + message,
                                        report.durable_effects);

    Logger::getInstance().logWorkflowStep("Commit", workflowStepToString(step), false, message);
    return report;
}

} // namespace Gitwise
