/**
 * klog - Filesystem Factory
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Filesystem.hpp"

namespace klog {

std::unique_ptr<Filesystem> Filesystem::createLocal(const std::filesystem::path& root) {
    // Implemented in LocalFilesystem.cpp
    extern std::unique_ptr<Filesystem> createLocalFilesystem(const std::filesystem::path& root);
    return createLocalFilesystem(root);
}

} // namespace klog
