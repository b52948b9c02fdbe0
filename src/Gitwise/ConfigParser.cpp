// =================================================================
// src/Gitwise/ConfigParser.cpp
// =================================================================
// YAML configuration loading.

#include "Gitwise/ConfigParser.hpp"
#include "Gitwise/SysInteraction.hpp"
#include <yaml-cpp/yaml.h>

namespace Gitwise {

ConfigParser::ConfigParser(const std::string& config_path) {
    SysInteraction sys;
    if (!sys.fileExists(config_path)) {
        LOG_DEBUG("ConfigParser", "No configuration file at " + config_path);
        return;
    }

    GitwiseConfig parsed;
    try {
        YAML::Node root = YAML::LoadFile(config_path);

        if (root["remote"]) {
            parsed.remote = root["remote"].as<std::string>();
        }
        if (root["branch"]) {
            parsed.branch = root["branch"].as<std::string>();
        }
        if (root["tag_prefix"]) {
            parsed.tag_prefix = root["tag_prefix"].as<std::string>();
        }

        YAML::Node logging = root["logging"];
        if (logging) {
            if (logging["file"]) {
                parsed.file_logging = logging["file"].as<bool>();
            }
            if (logging["dir"]) {
                parsed.log_dir = logging["dir"].as<std::string>();
            }
            if (logging["level"]) {
                std::string level_name = logging["level"].as<std::string>();
                if (!Logger::parseLevel(level_name, parsed.log_level)) {
                    Logger::getInstance().warning("ConfigParser",
                        "Unknown log level '" + level_name + "', keeping default", config_path);
                }
            }
            if (logging["max_size"]) {
                parsed.log_max_size = logging["max_size"].as<size_t>();
            }
            if (logging["max_files"]) {
                parsed.log_max_files = logging["max_files"].as<size_t>();
            }
        }
    } catch (const YAML::Exception& e) {
        Logger::getInstance().warning("ConfigParser",
            "Failed to parse configuration file, using defaults: " + std::string(e.what()),
            config_path);
        return;
    }

    if (parsed.remote.empty()) {
        Logger::getInstance().warning("ConfigParser", "Empty 'remote' ignored", config_path);
        parsed.remote = "origin";
    }

    m_config = parsed;
    m_loaded = true;
    LOG_DEBUG("ConfigParser", "Loaded configuration from " + config_path);
}

std::string ConfigParser::defaultPath(const std::string& repo_path) {
    if (repo_path.empty()) {
        return ".gitwise/config.yml";
    }
    std::string path = repo_path;
    if (path.back() != '/') {
        path += '/';
    }
    return path + ".gitwise/config.yml";
}

} // namespace Gitwise
