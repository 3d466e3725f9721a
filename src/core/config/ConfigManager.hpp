/**
 * klog - Configuration Manager
 *
 * Loads and saves the program configuration file.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

namespace klog {

/**
 * Program-wide settings
 */
struct ProgramConfig {
    std::filesystem::path repository;         // empty: Platform default
    std::string defaultTopic = "New entry";   // topic of blank entries
    std::string logVerbosity = "info";        // debug, info, warning, error
};

/**
 * Central configuration manager
 *
 * Settings live in <config dir>/config.json. A missing file means first
 * run: defaults are used and written out.
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory);
    bool save();

    // State queries
    bool isFirstRun() const { return m_isFirstRun; }
    const std::filesystem::path& configDirectory() const { return m_configDirectory; }

    // Program config
    const ProgramConfig& programConfig() const { return m_programConfig; }
    void setProgramConfig(const ProgramConfig& config);

    /**
     * Store root from the config, or the platform default
     */
    std::filesystem::path repositoryPath() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadProgramConfig();
    bool saveProgramConfig();

    std::filesystem::path m_configDirectory;
    bool m_isFirstRun = true;

    ProgramConfig m_programConfig;
};

} // namespace klog
