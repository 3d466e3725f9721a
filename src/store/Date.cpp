/**
 * klog - Calendar Date Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Date.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace klog {

namespace {

bool parseDigits(const std::string& value, size_t pos, size_t count, int& out) {
    int result = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        unsigned char c = static_cast<unsigned char>(value[i]);
        if (!std::isdigit(c)) {
            return false;
        }
        result = result * 10 + (c - '0');
    }
    out = result;
    return true;
}

} // anonymous namespace

std::optional<Date> Date::parse(const std::string& value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return std::nullopt;
    }

    Date date;
    if (!parseDigits(value, 0, 4, date.year) ||
        !parseDigits(value, 5, 2, date.month) ||
        !parseDigits(value, 8, 2, date.day)) {
        return std::nullopt;
    }

    if (date.month < 1 || date.month > 12) {
        return std::nullopt;
    }
    if (date.day < 1 || date.day > daysInMonth(date.year, date.month)) {
        return std::nullopt;
    }

    return date;
}

Date Date::today() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    Date date;
    date.year = local.tm_year + 1900;
    date.month = local.tm_mon + 1;
    date.day = local.tm_mday;
    return date;
}

std::string Date::toString() const {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << year << "-"
        << std::setw(2) << std::setfill('0') << month << "-"
        << std::setw(2) << std::setfill('0') << day;
    return oss.str();
}

bool Date::isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int Date::daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) {
    return !(a == b);
}

bool operator<(const Date& a, const Date& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}

bool operator>(const Date& a, const Date& b) {
    return b < a;
}

} // namespace klog
