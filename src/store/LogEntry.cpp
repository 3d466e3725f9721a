/**
 * klog - Log Entry Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "LogEntry.hpp"
#include "Filesystem.hpp"
#include "PathScheme.hpp"
#include "StoreErrors.hpp"

#include <vector>

#include <spdlog/spdlog.h>

namespace klog {

namespace {

bool isValidMediaFilename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    if (filename.find_first_of("/\\\n\r") != std::string::npos) {
        return false;
    }
    return filename.find(", ") == std::string::npos;
}

} // anonymous namespace

LogEntry::LogEntry(Filesystem& filesystem, const std::filesystem::path& recordPath)
    : m_filesystem(filesystem) {
    auto location = PathScheme::parseRecordPath(recordPath);

    m_fields = EntryCodec::parse(m_filesystem.readFile(recordPath));
    m_index = location.index;
    m_sourcePath = recordPath;
    m_sourceDate = location.date;
}

LogEntry::LogEntry(Filesystem& filesystem, const Date& date, const std::string& topic)
    : m_filesystem(filesystem) {
    m_fields.begin = date;
    m_fields.topic = topic;
}

EntryState LogEntry::state() const {
    if (m_removed) {
        return EntryState::Removed;
    }
    if (!m_sourcePath || !m_sourceDate) {
        return EntryState::New;
    }
    if (*m_sourceDate != m_fields.begin) {
        return EntryState::Relocating;
    }
    return EntryState::Persisted;
}

std::string LogEntry::currentText() const {
    return EntryCodec::serialize(m_fields);
}

void LogEntry::reload(const std::string& text) {
    EntryFields parsed = EntryCodec::parse(text);

    MediaDiff diff = MediaSet::diff(m_fields.media, parsed.media);
    if (!diff.added.empty()) {
        throw FormatError("direct adding of media is not supported");
    }

    for (const auto& filename : diff.removed) {
        m_pendingMedia.queueDelete(filename);
    }

    m_fields = std::move(parsed);
    m_dirty = true;
}

void LogEntry::attach(const std::string& filename, std::string bytes) {
    if (!isValidMediaFilename(filename)) {
        throw FormatError("invalid media filename");
    }
    if (!m_fields.media.add(MediaItem{filename, std::nullopt})) {
        throw FormatError("media already exists");
    }

    m_pendingMedia.queueWrite(filename, std::move(bytes));
    m_dirty = true;
}

bool LogEntry::detachByOrdinal(size_t index) {
    auto removed = m_fields.media.removeAt(index);
    if (!removed) {
        return false;
    }

    m_pendingMedia.queueDelete(removed->filename);
    m_dirty = true;
    return true;
}

void LogEntry::markForRemoval() {
    m_pendingRemoval = true;
    m_dirty = true;
}

bool LogEntry::isDirty() const {
    if (m_removed) {
        return false;
    }
    return m_dirty || (m_sourceDate && *m_sourceDate != m_fields.begin);
}

std::string LogEntry::summaryLine() const {
    std::string line = m_fields.begin.toString();
    if (m_fields.end) {
        line += " - " + m_fields.end->toString();
    }
    return line + ": " + m_fields.topic;
}

std::optional<std::string> LogEntry::readAttachment(const std::string& filename) const {
    if (auto bytes = m_pendingMedia.pendingBytes(filename)) {
        return bytes;
    }
    if (!m_fields.media.contains(filename)) {
        return std::nullopt;
    }

    auto directory = mediaDirectory();
    if (!directory) {
        return std::nullopt;
    }

    auto path = *directory / filename;
    if (!m_filesystem.exists(path)) {
        return std::nullopt;
    }
    return m_filesystem.readFile(path);
}

std::optional<std::filesystem::path> LogEntry::mediaDirectory() const {
    if (!m_sourceDate || !m_sourcePath) {
        return std::nullopt;
    }
    return PathScheme::mediaDirectory(*m_sourceDate, m_index);
}

void LogEntry::save() {
    switch (state()) {
        case EntryState::Removed:
            return;
        case EntryState::Relocating:
            if (!m_pendingRemoval) {
                relocate();
            }
            break;
        case EntryState::New:
        case EntryState::Persisted:
            break;
    }

    if (m_pendingRemoval) {
        saveRemoval();
        return;
    }

    bool allocated = false;
    if (state() == EntryState::New) {
        allocateIndex();
        allocated = true;
    }

    try {
        writeRecord();
    } catch (const IOFailure&) {
        if (allocated) {
            // The index is only claimed once the record exists on disk
            m_sourcePath.reset();
            m_sourceDate.reset();
        }
        throw;
    }

    applyMediaChanges();

    m_dirty = false;
    m_sourceDate = m_fields.begin;
    spdlog::info("Saved entry {} as {}", summaryLine(), m_sourcePath->generic_string());
}

void LogEntry::saveRemoval() {
    if (!m_sourcePath || !m_sourceDate) {
        m_removed = true;
        m_dirty = false;
        m_pendingMedia.clear();
        spdlog::debug("Discarded unsaved entry {}", summaryLine());
        return;
    }

    // Files live under the date the record is filed under, not the edited one
    auto mediaDir = PathScheme::mediaDirectory(*m_sourceDate, m_index);

    for (const auto& filename : m_fields.media.filenames()) {
        m_filesystem.removeFile(mediaDir / filename);
    }
    for (const auto& filename : m_pendingMedia.deletes()) {
        m_filesystem.removeFile(mediaDir / filename);
    }
    m_filesystem.removeFile(*m_sourcePath);

    m_filesystem.pruneEmptyDirectories(mediaDir);
    m_filesystem.pruneEmptyDirectories(m_sourcePath->parent_path());

    spdlog::info("Removed entry {} ({})", summaryLine(), m_sourcePath->generic_string());

    m_sourcePath.reset();
    m_sourceDate.reset();
    m_pendingMedia.clear();
    m_removed = true;
    m_dirty = false;
}

void LogEntry::relocate() {
    auto oldRecord = *m_sourcePath;
    auto oldMediaDir = PathScheme::mediaDirectory(*m_sourceDate, m_index);

    spdlog::info("Relocating entry {} from {}", summaryLine(), oldRecord.generic_string());

    // Carry the attachment content over; it is rewritten under the new index
    std::vector<std::string> carried;
    for (const auto& filename : m_fields.media.filenames()) {
        if (m_pendingMedia.hasWrite(filename)) {
            continue;
        }
        auto path = oldMediaDir / filename;
        if (!m_filesystem.exists(path)) {
            spdlog::warn("Attachment {} of entry {} is missing", path.generic_string(), summaryLine());
            continue;
        }
        m_pendingMedia.queueWrite(filename, m_filesystem.readFile(path));
        carried.push_back(filename);
    }

    for (const auto& filename : carried) {
        m_filesystem.removeFile(oldMediaDir / filename);
    }
    for (const auto& filename : m_pendingMedia.deletes()) {
        m_filesystem.removeFile(oldMediaDir / filename);
    }
    m_pendingMedia.clearDeletes();

    m_filesystem.removeFile(oldRecord);
    m_filesystem.pruneEmptyDirectories(oldMediaDir);
    m_filesystem.pruneEmptyDirectories(oldRecord.parent_path());

    m_sourcePath.reset();
    m_sourceDate.reset();
    m_dirty = true;
}

void LogEntry::allocateIndex() {
    int index = 0;
    while (m_filesystem.exists(PathScheme::recordPath(m_fields.begin, index))) {
        ++index;
    }

    m_index = index;
    m_sourcePath = PathScheme::recordPath(m_fields.begin, index);
    m_sourceDate = m_fields.begin;
    spdlog::debug("Allocated index {} for {}", index, m_fields.begin.toString());
}

void LogEntry::writeRecord() {
    m_filesystem.writeFile(*m_sourcePath, currentText());
}

void LogEntry::applyMediaChanges() {
    if (m_pendingMedia.empty()) {
        return;
    }

    auto mediaDir = PathScheme::mediaDirectory(m_fields.begin, m_index);

    for (const auto& filename : m_pendingMedia.deletes()) {
        m_filesystem.removeFile(mediaDir / filename);
    }
    for (const auto& [filename, bytes] : m_pendingMedia.writes()) {
        m_filesystem.writeFile(mediaDir / filename, bytes);
    }

    if (!m_pendingMedia.deletes().empty()) {
        m_filesystem.pruneEmptyDirectories(mediaDir);
    }

    m_pendingMedia.clear();
}

} // namespace klog
