// =================================================================
// src/Gitwise/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Gitwise/SysInteraction.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Gitwise {

static constexpr int EXIT_CANNOT_EXECUTE = 127;

static void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Only async-signal-safe calls are allowed between fork and exec.
static void reportChildFailure(const char* what, int error_number) {
    const char* reason = std::strerror(error_number);
    ssize_t written = ::write(STDERR_FILENO, what, std::strlen(what));
    written = ::write(STDERR_FILENO, reason, std::strlen(reason));
    written = ::write(STDERR_FILENO, "\n", 1);
    (void)written;
}

// Drains both pipes until the child closes them.
static void readStreams(int out_fd, int err_fd, CommandOutput& output) {
    std::array<char, 4096> buffer;
    struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* targets[2] = {&output.stdout_text, &output.stderr_text};
    int open_count = 2;

    while (open_count > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            output.stderr_text += std::string("poll failed: ") + std::strerror(errno) + "\n";
            return;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t count = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (count > 0) {
                targets[i]->append(buffer.data(), static_cast<size_t>(count));
            } else if (count == 0 || errno != EINTR) {
                fds[i].fd = -1;
                open_count--;
            }
        }
    }
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

CommandOutput SysInteraction::run(const std::vector<std::string>& command_line,
                                  const std::string& working_dir) {
    CommandOutput output;
    if (command_line.empty()) {
        output.exit_code = EXIT_CANNOT_EXECUTE;
        output.stderr_text = "No command given";
        return output;
    }

    // Build argv before forking; the child must not allocate.
    std::vector<char*> argv;
    argv.reserve(command_line.size() + 1);
    for (const auto& arg : command_line) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) != 0) {
        throw std::runtime_error(std::string("Failed to create stdout pipe: ") + std::strerror(errno));
    }
    if (::pipe(err_pipe) != 0) {
        int saved = errno;
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        throw std::runtime_error(std::string("Failed to create stderr pipe: ") + std::strerror(saved));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        closeFd(err_pipe[0]);
        closeFd(err_pipe[1]);
        throw std::runtime_error(std::string("Failed to start process: ") + std::strerror(saved));
    }

    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);

        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            reportChildFailure("Cannot enter working directory: ", errno);
            ::_exit(EXIT_CANNOT_EXECUTE);
        }

        ::execvp(argv[0], argv.data());
        reportChildFailure("Cannot execute command: ", errno);
        ::_exit(EXIT_CANNOT_EXECUTE);
    }

    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);
    readStreams(out_pipe[0], err_pipe[0], output);
    closeFd(out_pipe[0]);
    closeFd(err_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("Failed to wait for process: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // Process terminated abnormally
        output.exit_code = 128 + WTERMSIG(status);
        output.stderr_text += "Process terminated by signal " + std::to_string(WTERMSIG(status)) + "\n";
    } else {
        output.exit_code = -1;
    }

    return output;
}

} // namespace Gitwise
