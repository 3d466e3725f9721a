/**
 * klog - Filesystem
 *
 * Storage capability used by the entry store.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace klog {

/**
 * Abstract storage interface rooted at the store directory
 *
 * All paths are relative to the root. Failures are reported as
 * IOFailure carrying the relative path.
 *
 * Implementations:
 * - LocalFilesystem: the real directory tree
 * - MemoryFilesystem (tests): in-memory double
 */
class Filesystem {
public:
    virtual ~Filesystem() = default;

    /**
     * List candidate record files
     *
     * Returns every regular file exactly three levels below the root
     * (year/month/file), skipping the media tree and hidden directories.
     * Callers filter the result with PathScheme::isRecordPath().
     */
    virtual std::vector<std::filesystem::path> scan() const = 0;

    virtual bool exists(const std::filesystem::path& path) const = 0;

    virtual std::string readFile(const std::filesystem::path& path) const = 0;

    /**
     * Write a file, replacing existing content and creating parent
     * directories as needed
     */
    virtual void writeFile(const std::filesystem::path& path, const std::string& data) = 0;

    /**
     * Delete a file. A missing file is not an error.
     */
    virtual void removeFile(const std::filesystem::path& path) = 0;

    /**
     * Remove the directory if it is empty, then each empty ancestor,
     * stopping at the root
     */
    virtual void pruneEmptyDirectories(const std::filesystem::path& directory) = 0;

    /**
     * Filesystem backed by the directory tree at root
     */
    static std::unique_ptr<Filesystem> createLocal(const std::filesystem::path& root);

protected:
    Filesystem() = default;
};

} // namespace klog
