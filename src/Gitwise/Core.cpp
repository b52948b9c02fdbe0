// =================================================================
// src/Gitwise/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Gitwise/Core.hpp"
#include "Gitwise/ConfigParser.hpp"
#include "Gitwise/GitRepository.hpp"
#include "Gitwise/Logger.hpp"
#include "Gitwise/OperationResult.hpp"
#include "Gitwise/SysInteraction.hpp"
#include "Gitwise/Workflow.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <sstream>

namespace Gitwise {

Core::Core(const Commands& commands)
    : Core(commands, std::make_unique<SysInteraction>()) {}

Core::Core(const Commands& commands, std::unique_ptr<CommandRunner> runner,
           std::ostream& out, std::ostream& err)
    : m_commands(commands),
      m_runner(std::move(runner)),
      m_config(std::make_unique<ConfigParser>(ConfigParser::defaultPath(commands.repo_path))),
      m_repo(std::make_unique<GitRepository>(*m_runner, commands.repo_path)),
      m_out(out),
      m_err(err)
{
}

Core::~Core() = default;

int Core::run() {
    configureLogging();

    auto start = std::chrono::steady_clock::now();
    Logger::getInstance().logCommandStart(m_commands.active_command, m_commands.repo_path);

    int exit_code = 1;
    SysInteraction sys;
    if (!sys.directoryExists(m_commands.repo_path)) {
        exit_code = report(OperationResult::failure(ErrorKind::INVALID_ARGUMENT,
            "Repository path does not exist: " + m_commands.repo_path));
    } else if (m_commands.active_command == "add") {
        exit_code = handleAdd();
    } else if (m_commands.active_command == "commit") {
        exit_code = handleCommit();
    } else if (m_commands.active_command == "tag") {
        exit_code = handleTag();
    } else if (m_commands.active_command == "push") {
        exit_code = handlePush();
    } else if (m_commands.active_command == "version") {
        exit_code = handleVersion();
    } else if (m_commands.active_command == "status") {
        exit_code = handleStatus();
    } else if (m_commands.active_command == "log") {
        exit_code = handleLog();
    } else if (m_commands.active_command == "sync") {
        exit_code = handleSync();
    } else if (m_commands.active_command == "branch") {
        exit_code = handleBranch();
    } else if (m_commands.active_command == "create-branch") {
        exit_code = handleCreateBranch();
    } else if (m_commands.active_command == "switch") {
        exit_code = handleSwitch();
    } else if (m_commands.active_command == "undo") {
        exit_code = handleUndo();
    } else if (m_commands.active_command == "discard") {
        exit_code = handleDiscard();
    } else if (m_commands.active_command == "stash-save") {
        exit_code = handleStashSave();
    } else if (m_commands.active_command == "stash-pop") {
        exit_code = handleStashPop();
    } else if (m_commands.active_command == "stash-list") {
        exit_code = handleStashList();
    } else {
        m_err << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Logger::getInstance().logCommandEnd(m_commands.active_command, exit_code,
                                        static_cast<long>(duration.count()));
    Logger::getInstance().flush();
    return exit_code;
}

void Core::configureLogging() {
    const GitwiseConfig& config = m_config->getConfig();
    Logger& logger = Logger::getInstance();

    if (m_commands.quiet) {
        logger.setConsoleLogging(false);
    } else {
        logger.setConsoleLogging(true);
        logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : config.log_level);
    }

    if (config.file_logging) {
        std::string log_dir = config.log_dir;
        if (!log_dir.empty() && log_dir[0] != '/') {
            log_dir = m_commands.repo_path + "/" + log_dir;
        }
        logger.enableFileLogging(log_dir, config.log_max_size, config.log_max_files);
    }
}

std::string Core::remote() const {
    return m_commands.remote.empty() ? m_config->getConfig().remote : m_commands.remote;
}

std::string Core::branch() const {
    return m_commands.branch.empty() ? m_config->getConfig().branch : m_commands.branch;
}

std::string Core::tagPrefix() const {
    return m_commands.tag_prefix.empty() ? m_config->getConfig().tag_prefix : m_commands.tag_prefix;
}

int Core::report(const OperationResult& result) {
    if (m_commands.json_output) {
        nlohmann::json output = {
            {"succeeded", result.succeeded},
            {"message", result.message},
            {"error", errorKindToString(result.error)}
        };
        (result.succeeded ? m_out : m_err) << output.dump(2) << std::endl;
    } else if (result.succeeded) {
        m_out << result.message << std::endl;
    } else {
        m_err << "Error: " << result.message << std::endl;
    }
    return result.succeeded ? 0 : 1;
}

int Core::report(const WorkflowReport& workflow_report) {
    OperationResult result = workflow_report.toResult();
    if (!m_commands.json_output) {
        return report(result);
    }

    nlohmann::json output = {
        {"succeeded", result.succeeded},
        {"message", result.message},
        {"error", errorKindToString(result.error)},
        {"cause", errorKindToString(workflow_report.cause)},
        {"failed_step", workflowStepToString(workflow_report.failed_step)},
        {"tag", workflow_report.tag_name},
        {"steps", workflow_report.step_messages},
        {"durable_effects", workflow_report.durable_effects}
    };
    (result.succeeded ? m_out : m_err) << output.dump(2) << std::endl;
    return result.succeeded ? 0 : 1;
}

int Core::handleAdd() {
    if (m_commands.files.empty()) {
        return report(m_repo->stageAll());
    }
    return report(m_repo->stage(m_commands.files));
}

int Core::handleCommit() {
    CommitOptions options;
    options.spec.type = commitTypeFromString(m_commands.commit_type);
    options.spec.description = m_commands.description;
    options.spec.scope = m_commands.scope;
    options.spec.body = m_commands.body;
    options.spec.breaking = m_commands.breaking;
    options.spec.footer = m_commands.footer;

    options.stage = m_commands.stage_all || !m_commands.files.empty();
    options.stage_all = m_commands.stage_all;
    options.paths = m_commands.files;

    options.tag = !m_commands.tag_bump.empty();
    if (options.tag) {
        options.bump = bumpKindFromString(m_commands.tag_bump);
    }
    options.tag_prefix = tagPrefix();
    options.push = m_commands.push;
    options.remote = remote();
    options.branch = branch();

    CommitWorkflow workflow(*m_repo, options);
    return report(workflow.run());
}

int Core::handleTag() {
    TagOptions options;
    options.message = m_commands.tag_message;
    options.prefix = tagPrefix();
    options.push = m_commands.push;
    options.remote = remote();
    options.branch = branch();

    if (m_commands.resume) {
        TagLookup latest = m_repo->latestTag();
        if (!latest.found) {
            return report(OperationResult::failure(ErrorKind::INVALID_ARGUMENT,
                "No existing tag to resume; create one with 'tag --bump'"));
        }
        TagAndPushWorkflow workflow = TagAndPushWorkflow::resumePush(*m_repo, options, latest.tag);
        return report(workflow.run());
    }

    options.bump = bumpKindFromString(m_commands.bump);
    TagAndPushWorkflow workflow(*m_repo, options);
    return report(workflow.run());
}

int Core::handlePush() {
    return report(m_repo->push(remote(), branch(), m_commands.push_tags));
}

int Core::handleVersion() {
    TagLookup latest = m_repo->latestTag();
    const std::string prefix = tagPrefix();

    SemanticVersion current;
    std::ostringstream text;
    if (latest.found) {
        if (!parseTagVersion(latest.tag, prefix, current)) {
            return report(OperationResult::failure(ErrorKind::NOT_A_VERSION,
                "Failed to parse version from tag: " + latest.tag));
        }
        text << "Latest tag: " << latest.tag << " (" << formatTag(current, "") << ")";
    } else {
        text << "Latest tag: (none, baseline " << formatTag(current, "") << ")";
    }

    for (BumpKind kind : {BumpKind::PATCH, BumpKind::MINOR, BumpKind::MAJOR}) {
        text << "\nNext " << bumpKindToString(kind) << ": "
             << formatTag(bumpVersion(current, kind), prefix);
    }
    return report(OperationResult::success(text.str()));
}

int Core::handleStatus() {
    return report(m_repo->status());
}

int Core::handleLog() {
    return report(m_repo->log(m_commands.log_limit));
}

int Core::handleSync() {
    return report(m_repo->sync(remote(), branch()));
}

int Core::handleBranch() {
    return report(m_repo->branchInfo());
}

int Core::handleCreateBranch() {
    return report(m_repo->createBranch(m_commands.branch_name, !m_commands.no_checkout));
}

int Core::handleSwitch() {
    return report(m_repo->switchBranch(m_commands.branch_name));
}

int Core::handleUndo() {
    return report(m_repo->undoLastCommit(!m_commands.hard));
}

int Core::handleDiscard() {
    return report(m_repo->discardChanges(m_commands.files));
}

int Core::handleStashSave() {
    return report(m_repo->stashSave(m_commands.stash_message));
}

int Core::handleStashPop() {
    return report(m_repo->stashPop());
}

int Core::handleStashList() {
    return report(m_repo->stashList());
}

} // namespace Gitwise
