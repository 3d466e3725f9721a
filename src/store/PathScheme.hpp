/**
 * klog - Path Scheme
 *
 * Mapping between entry identities and their location in the store.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

#include "Date.hpp"

namespace klog {

/**
 * Identity of a record file: its date and sequence index
 */
struct RecordLocation {
    Date date;
    int index = 0;
};

bool operator==(const RecordLocation& a, const RecordLocation& b);

/**
 * Store layout
 *
 *   <root>/YYYY/MM/DD-<index>.txt
 *   <root>/media/YYYY/MM/DD/<index>/<filename>
 *
 * All paths are relative to the store root.
 */
class PathScheme {
public:
    /**
     * Relative path of the record file, e.g. "2024/01/05-0.txt"
     */
    static std::filesystem::path recordPath(const Date& date, int index);

    /**
     * Relative media directory, e.g. "media/2024/01/05/0"
     */
    static std::filesystem::path mediaDirectory(const Date& date, int index);

    /**
     * Check whether a relative path has the shape of a record file
     */
    static bool isRecordPath(const std::filesystem::path& path);

    /**
     * Extract date and index from a record path
     *
     * @throws std::invalid_argument if the path is not a record path;
     *         callers only pass paths from recordPath() or a filtered scan
     */
    static RecordLocation parseRecordPath(const std::filesystem::path& path);

    static constexpr const char* MEDIA_DIR = "media";
};

} // namespace klog
