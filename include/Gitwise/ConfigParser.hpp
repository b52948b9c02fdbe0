// =================================================================
// include/Gitwise/ConfigParser.hpp
// =================================================================
// Loads optional defaults from .gitwise/config.yml.

#pragma once

#include "Gitwise/Logger.hpp"
#include <string>

namespace Gitwise {

/**
 * @brief Defaults read from the configuration file
 */
struct GitwiseConfig {
    std::string remote = "origin";
    std::string branch;                 ///< Empty means the current branch
    std::string tag_prefix = "v";

    bool file_logging = false;
    std::string log_dir = ".gitwise/logs";
    LogLevel log_level = LogLevel::WARNING;
    size_t log_max_size = 1024 * 1024;
    size_t log_max_files = 5;
};

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     *
     * A missing file leaves the defaults in place. A malformed file is
     * logged as a warning and also leaves the defaults in place.
     *
     * @param config_path The path to the config.yml file.
     */
    explicit ConfigParser(const std::string& config_path);

    const GitwiseConfig& getConfig() const { return m_config; }

    /**
     * @brief Whether a configuration file was found and parsed.
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * @brief Default location relative to a repository
     */
    static std::string defaultPath(const std::string& repo_path);

private:
    GitwiseConfig m_config;
    bool m_loaded = false;
};

} // namespace Gitwise
