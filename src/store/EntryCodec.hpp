/**
 * klog - Entry Codec
 *
 * Parser and serializer for the plain-text log entry format.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Date.hpp"
#include "MediaSet.hpp"

namespace klog {

/**
 * The persisted fields of a log entry
 */
struct EntryFields {
    Date begin;
    std::optional<Date> end;
    std::string topic;
    std::optional<std::string> appendix;
    std::string body;
    MediaSet media;

    // Headers the codec does not know about, in file order
    std::vector<std::pair<std::string, std::string>> extraHeaders;
};

bool operator==(const EntryFields& a, const EntryFields& b);
bool operator!=(const EntryFields& a, const EntryFields& b);

/**
 * Entry text codec
 *
 * Format:
 *   BEGIN: 2024-01-05
 *   END: None
 *   TOPIC: Dishwasher repaired
 *   APPENDIX: None
 *   MEDIA: photo.jpg, 300
 *
 *   Free text body...
 *
 * Header lines starting with "# " are comments. Absent optional values
 * are written as "None".
 */
class EntryCodec {
public:
    /**
     * Normalize whitespace before parsing
     *
     * Strips carriage returns, right-trims every line and leaves exactly
     * one trailing newline. Whitespace-only text becomes empty.
     * Idempotent.
     */
    static std::string normalize(const std::string& text);

    /**
     * Parse entry text
     *
     * The text is normalized first.
     *
     * @throws FormatError naming the violated rule
     */
    static EntryFields parse(const std::string& text);

    /**
     * Serialize fields to entry text
     */
    static std::string serialize(const EntryFields& fields);

    /**
     * Editable template for a new entry on the given date
     *
     * Serialized blank fields preceded by comment lines explaining the
     * headers. The body is left empty, so the template only parses once
     * the user has written something.
     */
    static std::string templateText(const Date& date, const std::string& topic);

    static constexpr const char* NONE_VALUE = "None";
};

} // namespace klog
