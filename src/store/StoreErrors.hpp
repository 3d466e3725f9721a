/**
 * klog - Store Errors
 *
 * Exceptions raised by the entry codec and the entry store.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace klog {

/**
 * Malformed or incomplete entry text
 *
 * The message names the violated rule and is meant to be shown to the
 * user as-is.
 */
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * A filesystem operation failed
 */
class IOFailure : public std::runtime_error {
public:
    IOFailure(const std::filesystem::path& path, const std::string& message)
        : std::runtime_error(message + ": " + path.generic_string())
        , m_path(path) {}

    /**
     * The path the failed operation was working on
     */
    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace klog
