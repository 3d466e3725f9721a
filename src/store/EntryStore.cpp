/**
 * klog - Entry Store Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "EntryStore.hpp"
#include "PathScheme.hpp"
#include "StoreErrors.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace klog {

EntryStore::EntryStore(const std::filesystem::path& root, std::string placeholderTopic)
    : EntryStore(Filesystem::createLocal(root), std::move(placeholderTopic)) {
}

EntryStore::EntryStore(std::unique_ptr<Filesystem> filesystem, std::string placeholderTopic)
    : m_filesystem(std::move(filesystem))
    , m_placeholderTopic(std::move(placeholderTopic)) {
    scan();
}

std::vector<LogEntry*> EntryStore::listEntries() const {
    std::vector<LogEntry*> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.get());
    }
    return result;
}

std::vector<LogEntry*> EntryStore::entryByDate(const Date& date) const {
    std::vector<LogEntry*> result;
    for (const auto& entry : m_entries) {
        if (entry->begin() == date) {
            result.push_back(entry.get());
        }
    }
    return result;
}

LogEntry* EntryStore::entryByOrdinal(size_t ordinal) const {
    if (ordinal >= m_entries.size()) {
        return nullptr;
    }
    return m_entries[ordinal].get();
}

std::optional<size_t> EntryStore::ordinalOf(const LogEntry* entry) const {
    for (size_t i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].get() == entry) {
            return i;
        }
    }
    return std::nullopt;
}

LogEntry& EntryStore::createEntry(const Date& date) {
    m_entries.push_back(std::make_unique<LogEntry>(*m_filesystem, date, m_placeholderTopic));
    LogEntry& entry = *m_entries.back();
    sortEntries();

    spdlog::debug("Created blank entry for {}", date.toString());
    return entry;
}

CommitResult EntryStore::commit() {
    CommitResult result;

    for (const auto& entry : m_entries) {
        if (!entry->isDirty()) {
            continue;
        }

        bool removing = entry->isPendingRemoval();
        try {
            entry->save();
            if (removing) {
                ++result.removed;
            } else {
                ++result.saved;
            }
        } catch (const IOFailure& e) {
            spdlog::error("Failed to save entry {}: {}", entry->summaryLine(), e.what());
            result.failures.push_back({entry->summaryLine(), e.path(), e.what()});
        }
    }

    sortEntries();

    spdlog::info("Commit finished: {} saved, {} removed, {} failed",
                 result.saved, result.removed, result.failures.size());
    return result;
}

std::map<int, std::vector<LogEntry*>, std::greater<int>> EntryStore::entriesByYear() const {
    std::map<int, std::vector<LogEntry*>, std::greater<int>> years;
    for (const auto& entry : m_entries) {
        if (entry->isRemoved()) {
            continue;
        }
        years[entry->begin().year].push_back(entry.get());
    }
    return years;
}

void EntryStore::rescan() {
    m_entries.clear();
    scan();
}

void EntryStore::scan() {
    size_t skipped = 0;

    for (const auto& path : m_filesystem->scan()) {
        if (!PathScheme::isRecordPath(path)) {
            spdlog::debug("Ignoring non-record file: {}", path.generic_string());
            continue;
        }

        try {
            auto entry = std::make_unique<LogEntry>(*m_filesystem, path);
            if (entry->state() == EntryState::Relocating) {
                spdlog::info("Entry {} is filed under {}, it moves on the next commit",
                             entry->summaryLine(), path.generic_string());
            }
            m_entries.push_back(std::move(entry));
        } catch (const FormatError& e) {
            spdlog::warn("Skipping {}: {}", path.generic_string(), e.what());
            ++skipped;
        } catch (const IOFailure& e) {
            spdlog::warn("Skipping unreadable entry: {}", e.what());
            ++skipped;
        }
    }

    sortEntries();
    spdlog::info("Loaded {} entries ({} skipped)", m_entries.size(), skipped);
}

void EntryStore::sortEntries() {
    std::stable_sort(m_entries.begin(), m_entries.end(),
        [](const std::unique_ptr<LogEntry>& a, const std::unique_ptr<LogEntry>& b) {
            if (a->begin() != b->begin()) {
                return a->begin() > b->begin();
            }
            return a->sequenceIndex() < b->sequenceIndex();
        });
}

} // namespace klog
