/**
 * klog - Log Entry
 *
 * One dated record of the store together with its save state machine.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "EntryCodec.hpp"
#include "MediaSet.hpp"

namespace klog {

class Filesystem;

/**
 * Where an entry stands relative to its file on disk
 *
 *   New ──save──> Persisted ──date edit──> Relocating ──save──> Persisted
 *                     │
 *                     └──markForRemoval + save──> Removed
 */
enum class EntryState {
    New,         // never written, no record path yet
    Persisted,   // record path matches (begin, sequence index)
    Relocating,  // begin was edited, the record still lives under the old date
    Removed      // record and attachments deleted, terminal
};

/**
 * A log entry
 *
 * Identity on disk is (begin, sequence index). The sequence index is
 * assigned on the first save and again after each relocation.
 */
class LogEntry {
public:
    /**
     * Load an existing record
     *
     * The sequence index is taken from the path, not from the content.
     *
     * @param filesystem Storage the record lives in
     * @param recordPath Relative record path accepted by PathScheme
     * @throws FormatError if the content does not parse
     * @throws IOFailure if the file cannot be read
     */
    LogEntry(Filesystem& filesystem, const std::filesystem::path& recordPath);

    /**
     * Create a blank, unsaved entry for a date
     */
    LogEntry(Filesystem& filesystem, const Date& date, const std::string& topic);

    LogEntry(const LogEntry&) = delete;
    LogEntry& operator=(const LogEntry&) = delete;

    // Field access
    const EntryFields& fields() const { return m_fields; }
    const Date& begin() const { return m_fields.begin; }
    const std::optional<Date>& end() const { return m_fields.end; }
    const std::string& topic() const { return m_fields.topic; }
    const std::optional<std::string>& appendix() const { return m_fields.appendix; }
    const std::string& body() const { return m_fields.body; }
    const MediaSet& media() const { return m_fields.media; }

    // Identity and persistence state
    int sequenceIndex() const { return m_index; }
    const std::optional<std::filesystem::path>& sourcePath() const { return m_sourcePath; }
    const std::optional<Date>& sourceDate() const { return m_sourceDate; }
    EntryState state() const;

    /**
     * Serialized form of the current fields
     */
    std::string currentText() const;

    /**
     * Replace all fields by parsing new text
     *
     * Identity is kept. MEDIA lines may be removed (their files are
     * deleted on the next save) but not added.
     *
     * @throws FormatError on malformed text or an added MEDIA line;
     *         the entry is left unchanged
     */
    void reload(const std::string& text);

    /**
     * Add an attachment with its content
     *
     * The file is written on the next save.
     *
     * @throws FormatError("media already exists") or
     *         FormatError("invalid media filename")
     */
    void attach(const std::string& filename, std::string bytes);

    /**
     * Remove the attachment at the given position
     *
     * @return false if there is no attachment at that position
     */
    bool detachByOrdinal(size_t index);

    /**
     * Delete the entry on the next save
     */
    void markForRemoval();

    bool isPendingRemoval() const { return m_pendingRemoval; }
    bool isRemoved() const { return m_removed; }

    /**
     * Unsaved changes exist
     *
     * True after any mutation, and also whenever begin no longer matches
     * the date the record is filed under.
     */
    bool isDirty() const;

    /**
     * One line summary: "2024-01-05: Topic" or "2024-01-05 - 2024-01-07: Topic"
     */
    std::string summaryLine() const;

    /**
     * Content of an attachment, from the pending queue or from disk
     *
     * @return nullopt if the entry has no attachment with that name or it
     *         was never written
     * @throws IOFailure if the file exists in the listing but cannot be read
     */
    std::optional<std::string> readAttachment(const std::string& filename) const;

    /**
     * Media directory the attachments are stored in, once persisted
     */
    std::optional<std::filesystem::path> mediaDirectory() const;

    /**
     * Bring the disk in line with the entry
     *
     * Removal, relocation, index allocation, record write and attachment
     * changes run in this order. On IOFailure the entry stays dirty and
     * a later save retries; completed steps are not rolled back.
     *
     * @throws IOFailure carrying the failing path
     */
    void save();

private:
    void saveRemoval();
    void relocate();
    void allocateIndex();
    void writeRecord();
    void applyMediaChanges();

    Filesystem& m_filesystem;
    EntryFields m_fields;
    int m_index = 0;

    std::optional<std::filesystem::path> m_sourcePath;
    std::optional<Date> m_sourceDate;

    bool m_dirty = false;
    bool m_pendingRemoval = false;
    bool m_removed = false;

    PendingMedia m_pendingMedia;
};

} // namespace klog
