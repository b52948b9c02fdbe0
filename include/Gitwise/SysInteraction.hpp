// =================================================================
// include/Gitwise/SysInteraction.hpp
// =================================================================
// Defines system-level operations: file checks and running external
// processes.

#pragma once

#include "Gitwise/CommandRunner.hpp"
#include <string>
#include <vector>

namespace Gitwise {

class SysInteraction : public CommandRunner {
public:
    /**
     * @brief Checks if a regular file exists.
     */
    bool fileExists(const std::string& file_path);

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path);

    /**
     * @brief Executes an external command without a shell and captures its output.
     *
     * stdout and stderr are read from separate pipes. A program that cannot
     * be started reports exit code 127 with the reason on stderr.
     * Throws std::runtime_error only if pipes or the child process cannot be created.
     *
     * @param command_line Program followed by its arguments.
     * @param working_dir Directory to run in (empty means the current one).
     * @return The captured stdout, stderr and exit code.
     */
    CommandOutput run(const std::vector<std::string>& command_line,
                      const std::string& working_dir) override;
};

} // namespace Gitwise
