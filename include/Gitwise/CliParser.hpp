// =================================================================
// include/Gitwise/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Gitwise {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string repo_path = ".";
    bool verbose = false;
    bool quiet = false;
    bool json_output = false;
    std::string tag_prefix;     // Empty means configured prefix

    // Shared by commit, tag, push and sync; empty means configured default
    std::string remote;
    std::string branch;
    bool push = false;

    // Options for 'add' and 'commit'
    std::vector<std::string> files;
    bool stage_all = false;

    // Options for 'commit'
    std::string commit_type;
    std::string description;
    std::string scope;
    std::string body;
    std::string footer;
    bool breaking = false;
    std::string tag_bump;       // Empty means no tag

    // Options for 'tag'
    std::string bump;
    std::string tag_message;
    bool resume = false;

    // Options for 'push'
    bool push_tags = false;

    // Options for 'log'
    int log_limit = 10;

    // Options for 'create-branch' and 'switch'
    std::string branch_name;
    bool no_checkout = false;

    // Options for 'undo'
    bool hard = false;

    // Options for 'stash-save'
    std::string stash_message;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupGlobalOptions(CLI::App& app);
    void setupAddCommand(CLI::App& app);
    void setupCommitCommand(CLI::App& app);
    void setupTagCommand(CLI::App& app);
    void setupPushCommand(CLI::App& app);
    void setupVersionCommand(CLI::App& app);
    void setupStatusCommand(CLI::App& app);
    void setupLogCommand(CLI::App& app);
    void setupSyncCommand(CLI::App& app);
    void setupBranchCommands(CLI::App& app);
    void setupUndoCommand(CLI::App& app);
    void setupDiscardCommand(CLI::App& app);
    void setupStashCommands(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Gitwise
