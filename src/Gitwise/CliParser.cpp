// =================================================================
// src/Gitwise/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Gitwise/CliParser.hpp"

namespace Gitwise {

static const std::vector<std::string> COMMIT_TYPES = {
    "feat", "fix", "docs", "style", "refactor", "perf", "test", "build", "ci", "chore"
};

static const std::vector<std::string> BUMP_KINDS = {"major", "minor", "patch"};

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Gitwise: conventional commits and semantic version tags for git.");
    m_app->require_subcommand(1);
    // Subcommands accept the global options after their own
    m_app->fallthrough();

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupGlobalOptions(*m_app);
    setupAddCommand(*m_app);
    setupCommitCommand(*m_app);
    setupTagCommand(*m_app);
    setupPushCommand(*m_app);
    setupVersionCommand(*m_app);
    setupStatusCommand(*m_app);
    setupLogCommand(*m_app);
    setupSyncCommand(*m_app);
    setupBranchCommands(*m_app);
    setupUndoCommand(*m_app);
    setupDiscardCommand(*m_app);
    setupStashCommands(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupGlobalOptions(CLI::App& app) {
    app.add_option("-C,--repo", m_commands.repo_path, "Path to the git repository (default: current directory)");
    auto* verbose = app.add_flag("-v,--verbose", m_commands.verbose, "Log every git invocation to stderr");
    app.add_flag("-q,--quiet", m_commands.quiet, "Disable console logging")->excludes(verbose);
    app.add_flag("--json", m_commands.json_output, "Print the result as a JSON object");
    app.add_option("--prefix", m_commands.tag_prefix, "Tag prefix (default: v)");
}

void CliParser::setupAddCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("add", "Add files to the staging area.");
    sub->add_option("files", m_commands.files, "Files to add (default: all files)");
}

void CliParser::setupCommitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("commit", "Create a conventional commit.");
    sub->add_option("-t,--type", m_commands.commit_type, "Commit type")
        ->required()->check(CLI::IsMember(COMMIT_TYPES));
    sub->add_option("-d,--description", m_commands.description, "Short description of changes")->required();
    sub->add_option("-s,--scope", m_commands.scope, "Scope of changes");
    sub->add_option("-b,--body", m_commands.body, "Detailed description");
    sub->add_flag("--breaking", m_commands.breaking, "Mark as breaking change");
    sub->add_option("--footer", m_commands.footer, "Footer (e.g., issue references)");

    auto* files = sub->add_option("-f,--files", m_commands.files, "Files to add before committing");
    sub->add_flag("-a,--all", m_commands.stage_all, "Add all files before committing")->excludes(files);

    sub->add_flag("--push", m_commands.push, "Push after committing");
    sub->add_option("--tag", m_commands.tag_bump, "Create and push a tag with this version bump")
        ->check(CLI::IsMember(BUMP_KINDS));
    sub->add_option("--remote", m_commands.remote, "Remote name (default: origin)");
    sub->add_option("--branch", m_commands.branch, "Branch name (default: current branch)");
}

void CliParser::setupTagCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("tag", "Create the next semantic version tag.");
    auto* bump = sub->add_option("-b,--bump", m_commands.bump, "Version bump type")
        ->check(CLI::IsMember(BUMP_KINDS));
    sub->add_option("-m,--message", m_commands.tag_message, "Tag message (creates an annotated tag)");
    sub->add_flag("--push", m_commands.push, "Push the tag after creating it");
    auto* resume = sub->add_flag("--resume", m_commands.resume,
                                 "Push the latest existing tag without creating a new one");
    resume->excludes(bump);
    sub->add_option("--remote", m_commands.remote, "Remote name (default: origin)");
    sub->add_option("--branch", m_commands.branch, "Branch name (default: current branch)");

    sub->callback([this, bump]() {
        if (!m_commands.resume && bump->count() == 0) {
            throw CLI::RequiredError("--bump");
        }
    });
}

void CliParser::setupPushCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("push", "Push changes to a remote.");
    sub->add_option("--remote", m_commands.remote, "Remote name (default: origin)");
    sub->add_option("--branch", m_commands.branch, "Branch name (default: current branch)");
    sub->add_flag("--tags", m_commands.push_tags, "Push tags as well");
}

void CliParser::setupVersionCommand(CLI::App& app) {
    app.add_subcommand("version", "Show the latest version tag and the next candidates.");
}

void CliParser::setupStatusCommand(CLI::App& app) {
    app.add_subcommand("status", "Show repository status, branch and remotes.");
}

void CliParser::setupLogCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("log", "Show recent commits.");
    sub->add_option("-n,--number", m_commands.log_limit, "Number of commits to show (default: 10)")
        ->check(CLI::PositiveNumber);
}

void CliParser::setupSyncCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("sync", "Pull latest changes, then push local changes.");
    sub->add_option("--remote", m_commands.remote, "Remote name (default: origin)");
    sub->add_option("--branch", m_commands.branch, "Branch name (default: current branch)");
}

void CliParser::setupBranchCommands(CLI::App& app) {
    app.add_subcommand("branch", "Show local and remote branches.");

    auto* create = app.add_subcommand("create-branch", "Create a new branch and switch to it.");
    create->add_option("name", m_commands.branch_name, "Branch name")->required();
    create->add_flag("--no-checkout", m_commands.no_checkout, "Create the branch without switching to it");

    auto* sw = app.add_subcommand("switch", "Switch to a different branch.");
    sw->add_option("name", m_commands.branch_name, "Branch name")->required();
}

void CliParser::setupUndoCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("undo", "Undo the last commit.");
    sub->add_flag("--hard", m_commands.hard, "Discard the changes (default: keep them staged)");
}

void CliParser::setupDiscardCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("discard", "Discard changes in the working directory.");
    sub->add_option("files", m_commands.files, "Files to restore (default: all files)");
}

void CliParser::setupStashCommands(CLI::App& app) {
    auto* save = app.add_subcommand("stash-save", "Save changes to the stash.");
    save->add_option("-m,--message", m_commands.stash_message, "Stash message");

    app.add_subcommand("stash-pop", "Apply and remove the most recent stash.");
    app.add_subcommand("stash-list", "List all stashes.");
}

} // namespace Gitwise
