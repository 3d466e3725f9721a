/**
 * klog - Path Scheme Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PathScheme.hpp"

#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace klog {

namespace {

const std::regex& recordPattern() {
    static const std::regex pattern(R"(^(\d{4})/(\d{2})/(\d{2})-(0|[1-9]\d{0,8})\.txt$)");
    return pattern;
}

std::string twoDigits(int value) {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << value;
    return oss.str();
}

std::string fourDigits(int value) {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << value;
    return oss.str();
}

} // anonymous namespace

bool operator==(const RecordLocation& a, const RecordLocation& b) {
    return a.date == b.date && a.index == b.index;
}

std::filesystem::path PathScheme::recordPath(const Date& date, int index) {
    return std::filesystem::path(fourDigits(date.year)) / twoDigits(date.month) /
           (twoDigits(date.day) + "-" + std::to_string(index) + ".txt");
}

std::filesystem::path PathScheme::mediaDirectory(const Date& date, int index) {
    return std::filesystem::path(MEDIA_DIR) / fourDigits(date.year) /
           twoDigits(date.month) / twoDigits(date.day) / std::to_string(index);
}

bool PathScheme::isRecordPath(const std::filesystem::path& path) {
    std::smatch match;
    const std::string generic = path.generic_string();
    if (!std::regex_match(generic, match, recordPattern())) {
        return false;
    }

    // Reject impossible dates like 2024/02/30-0.txt
    return Date::parse(match[1].str() + "-" + match[2].str() + "-" + match[3].str())
        .has_value();
}

RecordLocation PathScheme::parseRecordPath(const std::filesystem::path& path) {
    std::smatch match;
    const std::string generic = path.generic_string();
    if (!std::regex_match(generic, match, recordPattern())) {
        throw std::invalid_argument("not a record path: " + generic);
    }

    auto date = Date::parse(match[1].str() + "-" + match[2].str() + "-" + match[3].str());
    if (!date) {
        throw std::invalid_argument("invalid date in record path: " + generic);
    }

    RecordLocation location;
    location.date = *date;
    location.index = std::stoi(match[4].str());
    return location;
}

} // namespace klog
