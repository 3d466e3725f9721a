/**
 * klog - Platform Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Platform.hpp"

#include <cstdlib>

namespace klog {

namespace {
    constexpr const char* APP_DIR = "klog";
}

std::filesystem::path Platform::getConfigPath() {
    // Use XDG_CONFIG_HOME if set, otherwise ~/.config
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        return std::filesystem::path(xdgConfig) / APP_DIR;
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / APP_DIR;
    }

    return std::filesystem::path(".config") / APP_DIR;
}

std::filesystem::path Platform::getDataPath() {
    // Use XDG_DATA_HOME if set, otherwise ~/.local/share
    const char* xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && xdgData[0] != '\0') {
        return std::filesystem::path(xdgData) / APP_DIR;
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".local" / "share" / APP_DIR;
    }

    return std::filesystem::path(".local/share") / APP_DIR;
}

std::filesystem::path Platform::getDefaultRepositoryPath() {
    return getDataPath() / "log";
}

} // namespace klog
