/**
 * klog - Platform Abstraction
 *
 * Per-user directories for configuration and data.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

namespace klog {

/**
 * Platform abstraction layer
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     *
     * $XDG_CONFIG_HOME/klog/, or ~/.config/klog/
     */
    static std::filesystem::path getConfigPath();

    /**
     * Get the data directory path
     *
     * $XDG_DATA_HOME/klog/, or ~/.local/share/klog/
     */
    static std::filesystem::path getDataPath();

    /**
     * Default location of the entry store
     */
    static std::filesystem::path getDefaultRepositoryPath();
};

} // namespace klog
