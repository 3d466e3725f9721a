/**
 * klog - Entry Store
 *
 * Directory-backed collection of log entries.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Date.hpp"
#include "Filesystem.hpp"
#include "LogEntry.hpp"

namespace klog {

/**
 * An entry that could not be saved during a commit
 */
struct CommitFailure {
    std::string summary;          // summary line of the entry
    std::filesystem::path path;   // path the failing operation worked on
    std::string message;
};

/**
 * Outcome of EntryStore::commit()
 */
struct CommitResult {
    size_t saved = 0;
    size_t removed = 0;
    std::vector<CommitFailure> failures;

    bool succeeded() const { return failures.empty(); }
};

/**
 * Entry store
 *
 * Scans the store root once on construction and keeps every entry in
 * memory. Entries are ordered by begin date, newest first. The store
 * assumes it is the only writer of its directory tree.
 *
 * Removed entries stay in the collection, flagged as removed, until the
 * next rescan().
 */
class EntryStore {
public:
    /**
     * Open the store at a directory on disk
     *
     * @throws IOFailure if the root cannot be listed
     */
    explicit EntryStore(const std::filesystem::path& root,
                        std::string placeholderTopic = DEFAULT_TOPIC);

    /**
     * Open a store on an arbitrary storage backend
     *
     * @throws IOFailure if the backend cannot be listed
     */
    explicit EntryStore(std::unique_ptr<Filesystem> filesystem,
                        std::string placeholderTopic = DEFAULT_TOPIC);

    EntryStore(const EntryStore&) = delete;
    EntryStore& operator=(const EntryStore&) = delete;

    /**
     * All entries in presentation order
     */
    std::vector<LogEntry*> listEntries() const;

    size_t size() const { return m_entries.size(); }

    /**
     * Entries whose begin date equals date
     */
    std::vector<LogEntry*> entryByDate(const Date& date) const;

    /**
     * Entry at an ordinal position of listEntries()
     *
     * @return nullptr if out of range
     */
    LogEntry* entryByOrdinal(size_t ordinal) const;

    /**
     * Ordinal position of an entry, or nullopt if it is not in the store
     */
    std::optional<size_t> ordinalOf(const LogEntry* entry) const;

    /**
     * Add a blank entry for a date
     *
     * Nothing is written until the entry has been changed and committed.
     */
    LogEntry& createEntry(const Date& date);

    /**
     * Save every dirty entry
     *
     * A failing entry does not stop the others; it stays dirty and is
     * reported in the result.
     */
    CommitResult commit();

    /**
     * Entries grouped by begin year, newest year first
     */
    std::map<int, std::vector<LogEntry*>, std::greater<int>> entriesByYear() const;

    /**
     * Drop the in-memory collection and scan the directory again
     *
     * Unsaved changes are lost.
     */
    void rescan();

    const std::string& placeholderTopic() const { return m_placeholderTopic; }

    static constexpr const char* DEFAULT_TOPIC = "New entry";

private:
    void scan();
    void sortEntries();

    std::unique_ptr<Filesystem> m_filesystem;
    std::string m_placeholderTopic;
    std::vector<std::unique_ptr<LogEntry>> m_entries;
};

} // namespace klog
