// =================================================================
// include/Gitwise/CommandRunner.hpp
// =================================================================
// Abstract interface for executing external commands.

#pragma once

#include <string>
#include <vector>

namespace Gitwise {

/**
 * @brief Captured result of one external command
 */
struct CommandOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;

    bool succeeded() const { return exit_code == 0; }
};

/**
 * @brief Executes a command line and reports its output and exit status.
 *
 * Callers decide success solely from the exit code; the captured streams
 * are only used for reporting.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command and wait for it to finish.
     * @param command_line Program followed by its arguments
     * @param working_dir Directory the command runs in
     * @return Captured stdout, stderr and exit code
     */
    virtual CommandOutput run(const std::vector<std::string>& command_line,
                              const std::string& working_dir) = 0;
};

} // namespace Gitwise
