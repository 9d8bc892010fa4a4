#pragma once

#include <chrono>
#include <string>

namespace aera::core {

/// @brief Calendar date type used for snapshot dates
using Date = std::chrono::year_month_day;

/// @brief Wall clock time point type used for audit timestamps
using TimePoint = std::chrono::system_clock::time_point;

/// @brief Gets the current calendar date in UTC
/// @return Today's date
Date today_utc();

/// @brief Shifts a calendar date by a whole number of days
/// @param date The reference date
/// @param days Number of days to add, negative to go back in time
/// @return The shifted date
Date add_days(const Date &date, int days);

/// @brief Parses an ISO 8601 calendar date, <tt>YYYY-MM-DD</tt>
/// @param text The date string representation
/// @return The parsed date
/// @throws std::invalid_argument for malformed or invalid dates.
Date parse_iso_date(const std::string &text);

/// @brief Creates the ISO 8601 representation of a calendar date, <tt>YYYY-MM-DD</tt>
/// @param date The date to format
/// @return The date string representation
std::string to_iso_string(const Date &date);

/// @brief Creates the ISO 8601 UTC representation of a time point with millisecond resolution
/// @param time The time point to format
/// @return The timestamp string representation, e.g. <tt>2026-02-18T01:30:00.125Z</tt>
std::string to_iso_timestamp(const TimePoint &time);

} // namespace aera::core
