#pragma once

#include <mutex>
#include <string>
#include <yaml-cpp/yaml.h>
#include "core/analysis_config.hpp"

/**
 * @brief Server configuration manager backed by config.yaml
 *
 * On first use the manager loads config.yaml from the working directory and
 * writes the built-in defaults there when the file does not exist yet.
 */
class ServerConfigManager
{
public:
    // Singleton pattern
    static ServerConfigManager &getInstance();

    // Configuration getters
    std::string getLogLevel() const;
    YAML::Node getConfig() const;
    AnalysisConfig getAnalysisConfig() const;

    void setLogLevel(const std::string &level);

    // Configuration persistence
    bool loadConfig(const std::string &file_path);
    bool saveConfig(const std::string &file_path) const;

    // Configuration validation
    bool validateConfig(const YAML::Node &config) const;

    /**
     * @brief Convert a YAML document into a typed analysis configuration
     *
     * Missing keys keep their built-in defaults.
     * @param config Root YAML node (the same layout as config.yaml)
     * @return Parsed configuration
     * @throws std::invalid_argument when a value is out of range or malformed
     */
    static AnalysisConfig parseAnalysisConfig(const YAML::Node &config);

    /**
     * @brief The built-in default configuration document
     */
    static YAML::Node defaultConfig();

private:
    ServerConfigManager();
    ~ServerConfigManager() = default;
    ServerConfigManager(const ServerConfigManager &) = delete;
    ServerConfigManager &operator=(const ServerConfigManager &) = delete;

    void initializeDefaultConfig();
    bool saveConfigInternal(const std::string &file_path, const YAML::Node &config) const;

    mutable std::mutex config_mutex_;
    YAML::Node config_;
};
