/**
 * klog - Configuration Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"
#include "core/platform/Platform.hpp"

#include <fstream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace klog {

namespace {
    constexpr const char* PROGRAM_CONFIG_FILE = "config.json";
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory) {
    m_configDirectory = configDirectory;
    m_programConfig = ProgramConfig{};

    // Create directories if they don't exist
    try {
        std::filesystem::create_directories(m_configDirectory);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create config directory: {}", e.what());
        return false;
    }

    // Check if this is first run
    m_isFirstRun = !std::filesystem::exists(m_configDirectory / PROGRAM_CONFIG_FILE);

    if (m_isFirstRun) {
        if (!saveProgramConfig()) {
            spdlog::warn("Failed to write default program config");
        }
    } else if (!loadProgramConfig()) {
        spdlog::warn("Failed to load program config, using defaults");
    }

    spdlog::debug("ConfigManager initialized at: {}", m_configDirectory.string());
    return true;
}

bool ConfigManager::save() {
    return saveProgramConfig();
}

void ConfigManager::setProgramConfig(const ProgramConfig& config) {
    m_programConfig = config;
    saveProgramConfig();
}

std::filesystem::path ConfigManager::repositoryPath() const {
    if (m_programConfig.repository.empty()) {
        return Platform::getDefaultRepositoryPath();
    }
    return m_programConfig.repository;
}

bool ConfigManager::loadProgramConfig() {
    auto configPath = m_configDirectory / PROGRAM_CONFIG_FILE;

    try {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            return false;
        }

        nlohmann::json j = nlohmann::json::parse(file);

        ProgramConfig config;
        if (j.contains("repository")) {
            config.repository = j["repository"].get<std::string>();
        }
        if (j.contains("defaultTopic")) {
            config.defaultTopic = j["defaultTopic"].get<std::string>();
        }
        if (j.contains("logVerbosity")) {
            config.logVerbosity = j["logVerbosity"].get<std::string>();
        }

        m_programConfig = config;
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load program config: {}", e.what());
        return false;
    }
}

bool ConfigManager::saveProgramConfig() {
    auto configPath = m_configDirectory / PROGRAM_CONFIG_FILE;

    try {
        nlohmann::json j;
        j["repository"] = m_programConfig.repository.string();
        j["defaultTopic"] = m_programConfig.defaultTopic;
        j["logVerbosity"] = m_programConfig.logVerbosity;

        std::ofstream file(configPath);
        if (!file.is_open()) {
            spdlog::error("Cannot write program config: {}", configPath.string());
            return false;
        }
        file << j.dump(2);

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save program config: {}", e.what());
        return false;
    }
}

} // namespace klog
