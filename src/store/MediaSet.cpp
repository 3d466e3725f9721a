/**
 * klog - Media Set Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "MediaSet.hpp"
#include "StoreErrors.hpp"

#include <algorithm>
#include <filesystem>

namespace klog {

namespace {

constexpr const char* MEDIA_SEPARATOR = ", ";

// Attachment names resolve inside the media directory of their entry
bool staysInMediaDirectory(const std::string& filename) {
    std::filesystem::path path(filename);
    if (path.has_root_path() || filename.front() == '/' || filename.front() == '\\') {
        return false;
    }
    for (const auto& component : path) {
        if (component == "..") {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

MediaItem MediaItem::parse(const std::string& value) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = value.find(MEDIA_SEPARATOR, start);
        if (pos == std::string::npos) {
            parts.push_back(value.substr(start));
            break;
        }
        parts.push_back(value.substr(start, pos - start));
        start = pos + 2;
    }

    if (parts.size() > 2 || parts[0].empty() || !staysInMediaDirectory(parts[0])) {
        throw FormatError("unknown media format");
    }

    MediaItem item;
    item.filename = parts[0];
    if (parts.size() == 2) {
        item.options = parts[1];
    }
    return item;
}

std::string MediaItem::toString() const {
    if (options) {
        return filename + MEDIA_SEPARATOR + *options;
    }
    return filename;
}

bool operator==(const MediaItem& a, const MediaItem& b) {
    return a.filename == b.filename && a.options == b.options;
}

bool operator!=(const MediaItem& a, const MediaItem& b) {
    return !(a == b);
}

bool MediaSet::contains(const std::string& filename) const {
    return std::any_of(m_items.begin(), m_items.end(),
        [&filename](const MediaItem& item) {
            return item.filename == filename;
        });
}

std::vector<std::string> MediaSet::filenames() const {
    std::vector<std::string> names;
    names.reserve(m_items.size());
    for (const auto& item : m_items) {
        names.push_back(item.filename);
    }
    return names;
}

bool MediaSet::add(const MediaItem& item) {
    if (contains(item.filename)) {
        return false;
    }
    m_items.push_back(item);
    return true;
}

std::optional<MediaItem> MediaSet::removeAt(size_t index) {
    if (index >= m_items.size()) {
        return std::nullopt;
    }
    MediaItem removed = m_items[index];
    m_items.erase(m_items.begin() + static_cast<std::ptrdiff_t>(index));
    return removed;
}

MediaDiff MediaSet::diff(const MediaSet& before, const MediaSet& after) {
    MediaDiff result;
    for (const auto& item : after.items()) {
        if (!before.contains(item.filename)) {
            result.added.push_back(item.filename);
        }
    }
    for (const auto& item : before.items()) {
        if (!after.contains(item.filename)) {
            result.removed.push_back(item.filename);
        }
    }
    return result;
}

bool operator==(const MediaSet& a, const MediaSet& b) {
    return a.items() == b.items();
}

bool operator!=(const MediaSet& a, const MediaSet& b) {
    return !(a == b);
}

void PendingMedia::queueWrite(const std::string& filename, std::string bytes) {
    m_deletes.erase(filename);
    m_writes[filename] = std::move(bytes);
}

void PendingMedia::queueDelete(const std::string& filename) {
    m_writes.erase(filename);
    m_deletes.insert(filename);
}

bool PendingMedia::hasWrite(const std::string& filename) const {
    return m_writes.find(filename) != m_writes.end();
}

std::optional<std::string> PendingMedia::pendingBytes(const std::string& filename) const {
    auto it = m_writes.find(filename);
    if (it != m_writes.end()) {
        return it->second;
    }
    return std::nullopt;
}

void PendingMedia::clear() {
    m_writes.clear();
    m_deletes.clear();
}

} // namespace klog
