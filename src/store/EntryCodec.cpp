/**
 * klog - Entry Codec Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "EntryCodec.hpp"
#include "StoreErrors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace klog {

namespace {

constexpr const char* KEY_BEGIN = "BEGIN";
constexpr const char* KEY_END = "END";
constexpr const char* KEY_TOPIC = "TOPIC";
constexpr const char* KEY_APPENDIX = "APPENDIX";
constexpr const char* KEY_MEDIA = "MEDIA";
constexpr const char* HEADER_SEPARATOR = ": ";

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string rtrim(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
}

/**
 * Right-trimmed lines with carriage returns removed
 *
 * A trailing newline yields a final empty element.
 */
std::vector<std::string> cleanLines(const std::string& text) {
    std::string stripped;
    stripped.reserve(text.size());
    for (char c : text) {
        if (c != '\r') {
            stripped += c;
        }
    }

    auto lines = splitLines(stripped);
    for (auto& line : lines) {
        line = rtrim(line);
    }
    return lines;
}

// Index of the last non-empty line, or -1
long lastContentLine(const std::vector<std::string>& lines) {
    for (long i = static_cast<long>(lines.size()) - 1; i >= 0; --i) {
        if (!lines[static_cast<size_t>(i)].empty()) {
            return i;
        }
    }
    return -1;
}

bool isNoneValue(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "none";
}

std::optional<Date> parseDateValue(const std::string& value) {
    if (isNoneValue(value)) {
        return std::nullopt;
    }
    auto date = Date::parse(value);
    if (!date) {
        throw FormatError("invalid date");
    }
    return date;
}

std::optional<std::string> parseOptionalValue(const std::string& value) {
    if (isNoneValue(value)) {
        return std::nullopt;
    }
    return value;
}

bool isCommentLine(const std::string& line) {
    return line == "#" || line.rfind("# ", 0) == 0;
}

} // anonymous namespace

bool operator==(const EntryFields& a, const EntryFields& b) {
    return a.begin == b.begin &&
           a.end == b.end &&
           a.topic == b.topic &&
           a.appendix == b.appendix &&
           a.body == b.body &&
           a.media == b.media &&
           a.extraHeaders == b.extraHeaders;
}

bool operator!=(const EntryFields& a, const EntryFields& b) {
    return !(a == b);
}

std::string EntryCodec::normalize(const std::string& text) {
    auto lines = cleanLines(text);
    long last = lastContentLine(lines);
    if (last < 0) {
        return std::string();
    }

    std::string result;
    for (long i = 0; i <= last; ++i) {
        result += lines[static_cast<size_t>(i)];
        result += '\n';
    }
    return result;
}

EntryFields EntryCodec::parse(const std::string& text) {
    auto lines = cleanLines(text);
    long last = lastContentLine(lines);
    if (last < 0) {
        throw FormatError("empty entry");
    }

    std::string normalized = normalize(text);
    std::string header;
    std::string body;

    size_t separator = normalized.find("\n\n");
    if (separator != std::string::npos) {
        header = normalized.substr(0, separator);
        body = normalized.substr(separator + 2);
    } else if (lines.size() - 1 - static_cast<size_t>(last) >= 2) {
        // Header block followed by blank lines only
        header = normalized.substr(0, normalized.size() - 1);
    } else {
        throw FormatError("missing header/body separator");
    }

    EntryFields fields;
    std::optional<Date> begin;
    std::optional<std::string> topic;

    if (!header.empty()) {
        for (const auto& line : splitLines(header)) {
            if (isCommentLine(line)) {
                continue;
            }

            size_t pos = line.find(HEADER_SEPARATOR);
            if (pos == std::string::npos) {
                throw FormatError("malformed header line");
            }

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 2);

            if (key == KEY_BEGIN) {
                begin = parseDateValue(value);
            } else if (key == KEY_END) {
                fields.end = parseDateValue(value);
            } else if (key == KEY_TOPIC) {
                topic = parseOptionalValue(value);
            } else if (key == KEY_APPENDIX) {
                fields.appendix = parseOptionalValue(value);
            } else if (key == KEY_MEDIA) {
                if (!fields.media.add(MediaItem::parse(value))) {
                    throw FormatError("duplicate media file");
                }
            } else {
                fields.extraHeaders.emplace_back(key, value);
            }
        }
    }

    if (!begin) {
        throw FormatError("missing BEGIN");
    }
    if (!topic) {
        throw FormatError("missing TOPIC");
    }

    fields.begin = *begin;
    fields.topic = *topic;

    if (fields.end) {
        if (*fields.end == fields.begin) {
            fields.end.reset();
        } else if (*fields.end < fields.begin) {
            throw FormatError("END before BEGIN");
        }
    }

    while (!body.empty() && body.back() == '\n') {
        body.pop_back();
    }
    if (isBlank(body)) {
        throw FormatError("empty content");
    }
    fields.body = body;

    return fields;
}

std::string EntryCodec::serialize(const EntryFields& fields) {
    std::ostringstream out;
    out << KEY_BEGIN << HEADER_SEPARATOR << fields.begin.toString() << "\n";
    out << KEY_END << HEADER_SEPARATOR
        << (fields.end ? fields.end->toString() : NONE_VALUE) << "\n";
    out << KEY_TOPIC << HEADER_SEPARATOR << fields.topic << "\n";
    out << KEY_APPENDIX << HEADER_SEPARATOR
        << (fields.appendix ? *fields.appendix : NONE_VALUE) << "\n";

    for (const auto& item : fields.media.items()) {
        out << KEY_MEDIA << HEADER_SEPARATOR << item.toString() << "\n";
    }
    for (const auto& [key, value] : fields.extraHeaders) {
        out << key << HEADER_SEPARATOR << value << "\n";
    }

    out << "\n" << fields.body << "\n";
    return out.str();
}

std::string EntryCodec::templateText(const Date& date, const std::string& topic) {
    EntryFields fields;
    fields.begin = date;
    fields.topic = topic;

    std::string text;
    text += "# BEGIN and END: YYYY-MM-DD, END may be None\n";
    text += "# TOPIC: one line summary\n";
    text += "# APPENDIX: optional note, None if unused\n";
    text += "# Write the entry text below the empty line.\n";

    // Without the empty body line, text appended at the end is the body
    std::string entry = serialize(fields);
    entry.pop_back();
    text += entry;
    return text;
}

} // namespace klog
