#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace seacast::core {

using TimePoint = std::chrono::system_clock::time_point;

struct CivilDate {
	int year = 1970;
	unsigned month = 1;
	unsigned day = 1;
};

/// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(int year, unsigned month, unsigned day);

/// Inverse of daysFromCivil.
CivilDate civilFromDays(std::int64_t days);

unsigned daysInMonth(int year, unsigned month);

/// Floor division of the time point into whole days since the epoch.
std::int64_t dayIndex(const TimePoint &tp);

CivilDate civilDate(const TimePoint &tp);

bool isMidnight(const TimePoint &tp);

/**
 * @brief Checked conversion from seconds (plus a sub-second part) since the epoch.
 * @return std::nullopt when the instant lies outside the range TimePoint can hold.
 */
std::optional<TimePoint> fromEpochSeconds(std::int64_t seconds, std::int64_t nanos = 0);

/// Midnight of @p date. Throws std::out_of_range when TimePoint cannot hold it.
TimePoint fromCivil(const CivilDate &date);

/**
 * @brief Parses a timestamp cell. All results are UTC.
 *
 * Accepted: YYYY-MM-DD, YYYY/MM/DD, YYYY.MM.DD, YYYY-MM, MM/DD/YYYY, DD-MM-YYYY, DD.MM.YYYY,
 * each optionally followed by [ T]HH:MM[:SS[.fraction]] and a Z or +-HH[:MM] offset.
 * Plain numbers are rejected.
 *
 * @return std::nullopt when the text is not a valid timestamp, or names an instant outside
 *         the range TimePoint can hold.
 */
std::optional<TimePoint> parseTimestamp(std::string_view text);

/// Renders "YYYY-MM-DD" when @p date_only, else "YYYY-MM-DD HH:MM:SS".
std::string formatTimestamp(const TimePoint &tp, bool date_only = false);

/// Like formatTimestamp but picks the date-only form for midnight values.
std::string formatTimestampAuto(const TimePoint &tp);

} // namespace seacast::core
