/**
 * klog - Calendar Date
 *
 * Day-precision date in the machine format used by record files.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>

namespace klog {

/**
 * A Gregorian calendar date (no time of day, no time zone)
 */
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    /**
     * Parse a strict YYYY-MM-DD string
     *
     * Rejects impossible dates such as 2023-02-29.
     *
     * @return The date, or nullopt if the string is not a valid date
     */
    static std::optional<Date> parse(const std::string& value);

    /**
     * Today's date in local time
     */
    static Date today();

    /**
     * Format as YYYY-MM-DD
     */
    std::string toString() const;

    static bool isLeapYear(int year);
    static int daysInMonth(int year, int month);
};

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);
bool operator>(const Date& a, const Date& b);

} // namespace klog
