// =================================================================
// include/Gitwise/Logger.hpp
// =================================================================
// Header for diagnostic logging of commands and workflow steps.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace Gitwise {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger with a console sink and an optional file sink
 *
 * The console sink writes to stderr so that stdout carries only operation
 * results. Until enableFileLogging() is called nothing is written to disk.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Start writing log files
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     * @return False if the directory or file could not be created
     */
    bool enableFileLogging(const std::string& log_dir = ".gitwise/logs",
                           size_t max_log_size = 1024 * 1024,  // 1MB
                           size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log one external tool invocation
     * @param command_line Program and arguments
     * @param exit_code Exit code reported by the runner
     * @param duration_ms Wall time in milliseconds
     */
    void logToolInvocation(const std::vector<std::string>& command_line,
                           int exit_code, long duration_ms);

    /**
     * @brief Log the outcome of a workflow step
     * @param workflow Workflow name
     * @param step Step name
     * @param success Whether the step succeeded
     * @param detail Step message
     */
    void logWorkflowStep(const std::string& workflow, const std::string& step,
                         bool success, const std::string& detail);

    /**
     * @brief Log command start
     */
    void logCommandStart(const std::string& command, const std::string& repo_path);

    /**
     * @brief Log command end
     * @param command Command that was executed
     * @param exit_code Process exit code
     * @param duration_ms Command duration in milliseconds
     */
    void logCommandEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse "debug", "info", "warning", "error" or "critical"
     * @param name Level name (case-insensitive)
     * @param level Receives the parsed level
     * @return False for unknown names
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 0;
    size_t m_max_log_files = 0;
    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Gitwise::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Gitwise::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Gitwise::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Gitwise::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Gitwise::Logger::getInstance().critical(component, message)

} // namespace Gitwise
