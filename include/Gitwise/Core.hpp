// =================================================================
// include/Gitwise/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Gitwise/CliParser.hpp"
#include <iostream>
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Gitwise {
    class CommandRunner;
    class ConfigParser;
    class GitRepository;
    struct OperationResult;
    struct WorkflowReport;
}

namespace Gitwise {

class Core {
public:
    /**
     * @brief Constructs the Core application object running real git.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Constructs the Core over a given command runner and output streams.
     * @param commands The parsed command-line arguments.
     * @param runner Executes git commands.
     * @param out Receives results of successful operations.
     * @param err Receives failure messages.
     */
    Core(const Commands& commands, std::unique_ptr<CommandRunner> runner,
         std::ostream& out = std::cout, std::ostream& err = std::cerr);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the command selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleAdd();
    int handleCommit();
    int handleTag();
    int handlePush();
    int handleVersion();
    int handleStatus();
    int handleLog();
    int handleSync();
    int handleBranch();
    int handleCreateBranch();
    int handleSwitch();
    int handleUndo();
    int handleDiscard();
    int handleStashSave();
    int handleStashPop();
    int handleStashList();

    int report(const OperationResult& result);
    int report(const WorkflowReport& workflow_report);

    void configureLogging();
    std::string remote() const;
    std::string branch() const;
    std::string tagPrefix() const;

    const Commands& m_commands;
    std::unique_ptr<CommandRunner> m_runner;
    std::unique_ptr<ConfigParser> m_config;
    std::unique_ptr<GitRepository> m_repo;
    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace Gitwise
