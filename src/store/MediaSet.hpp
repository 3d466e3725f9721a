/**
 * klog - Media Set
 *
 * Attachment list of a log entry and the bookkeeping of attachment
 * changes that still have to reach the disk.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace klog {

/**
 * One attachment reference: a filename plus free-form options
 *
 * Serialized in a MEDIA header as "filename" or "filename, options".
 */
struct MediaItem {
    std::string filename;
    std::optional<std::string> options;

    /**
     * Parse the value of a MEDIA header
     *
     * @throws FormatError("unknown media format") for more than two
     *         components, an empty filename, or a filename that is
     *         absolute or climbs out with ".."
     */
    static MediaItem parse(const std::string& value);

    std::string toString() const;
};

bool operator==(const MediaItem& a, const MediaItem& b);
bool operator!=(const MediaItem& a, const MediaItem& b);

/**
 * Filename-level difference between two attachment lists
 */
struct MediaDiff {
    std::vector<std::string> added;
    std::vector<std::string> removed;

    bool empty() const { return added.empty() && removed.empty(); }
};

/**
 * Ordered attachment list with unique filenames
 */
class MediaSet {
public:
    MediaSet() = default;

    const std::vector<MediaItem>& items() const { return m_items; }
    size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }

    bool contains(const std::string& filename) const;
    std::vector<std::string> filenames() const;

    /**
     * Append an attachment
     *
     * @return false if an attachment with the same filename exists
     */
    bool add(const MediaItem& item);

    /**
     * Remove the attachment at the given position
     *
     * @return The removed item, or nullopt if the index is out of range
     */
    std::optional<MediaItem> removeAt(size_t index);

    /**
     * Compute added/removed filenames going from before to after
     *
     * Options do not take part in the comparison. Both lists keep the
     * order in which the filenames appear in their source set.
     */
    static MediaDiff diff(const MediaSet& before, const MediaSet& after);

private:
    std::vector<MediaItem> m_items;
};

bool operator==(const MediaSet& a, const MediaSet& b);
bool operator!=(const MediaSet& a, const MediaSet& b);

/**
 * Attachment changes waiting for the next save
 *
 * A queued write carries the full payload. Queuing a delete cancels a
 * pending write for the same filename and the other way round.
 */
class PendingMedia {
public:
    void queueWrite(const std::string& filename, std::string bytes);
    void queueDelete(const std::string& filename);

    bool hasWrite(const std::string& filename) const;
    std::optional<std::string> pendingBytes(const std::string& filename) const;

    const std::map<std::string, std::string>& writes() const { return m_writes; }
    const std::set<std::string>& deletes() const { return m_deletes; }

    bool empty() const { return m_writes.empty() && m_deletes.empty(); }
    void clear();
    void clearDeletes() { m_deletes.clear(); }

private:
    std::map<std::string, std::string> m_writes;
    std::set<std::string> m_deletes;
};

} // namespace klog
