// =================================================================
// tests/MockCommandRunner.hpp
// =================================================================
// Scripted command runner shared by the repository and workflow tests.

#pragma once

#include "Gitwise/CommandRunner.hpp"
#include <deque>
#include <string>
#include <vector>

/**
 * @brief Records every command line and replays queued outputs in order.
 *
 * When the queue is empty, commands succeed with no output.
 */
class MockCommandRunner : public Gitwise::CommandRunner {
public:
    struct Call {
        std::vector<std::string> command_line;
        std::string working_dir;
    };

    Gitwise::CommandOutput run(const std::vector<std::string>& command_line,
                               const std::string& working_dir) override {
        m_calls.push_back({command_line, working_dir});
        if (m_responses.empty()) {
            return Gitwise::CommandOutput();
        }
        Gitwise::CommandOutput output = m_responses.front();
        m_responses.pop_front();
        return output;
    }

    void queueSuccess(const std::string& stdout_text = "") {
        Gitwise::CommandOutput output;
        output.stdout_text = stdout_text;
        output.exit_code = 0;
        m_responses.push_back(output);
    }

    void queueFailure(const std::string& stderr_text, int exit_code = 1,
                      const std::string& stdout_text = "") {
        Gitwise::CommandOutput output;
        output.stdout_text = stdout_text;
        output.stderr_text = stderr_text;
        output.exit_code = exit_code;
        m_responses.push_back(output);
    }

    const std::vector<Call>& calls() const { return m_calls; }

    size_t callCount() const { return m_calls.size(); }

    // Arguments after the leading "git"
    std::vector<std::string> gitArgs(size_t index) const {
        const auto& line = m_calls.at(index).command_line;
        return std::vector<std::string>(line.begin() + 1, line.end());
    }

    bool pending() const { return !m_responses.empty(); }

private:
    std::vector<Call> m_calls;
    std::deque<Gitwise::CommandOutput> m_responses;
};
