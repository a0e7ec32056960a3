#include "seacast/core/timestamp.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace seacast::core {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400LL;
constexpr std::int64_t kNanosecondsPerDay = 86400LL * 1000000000LL;

// Whole seconds TimePoint can hold, one second inside each end so a sub-second part still fits.
const std::int64_t kMaxEpochSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(TimePoint::duration::max()).count() - 1;
const std::int64_t kMinEpochSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(TimePoint::duration::min()).count() + 1;

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// Minimal forward-only cursor over the cell text.
struct Cursor {
	std::string_view text;
	std::size_t pos = 0;

	bool done() const {
		return pos >= text.size();
	}

	char peek() const {
		return done() ? '\0' : text[pos];
	}

	bool consume(char c) {
		if (peek() == c) {
			++pos;
			return true;
		}
		return false;
	}

	// Reads between min_digits and max_digits decimal digits.
	bool digits(std::size_t min_digits, std::size_t max_digits, int &out, std::size_t *count = nullptr) {
		std::size_t n = 0;
		int value = 0;
		while (n < max_digits && !done() && std::isdigit(static_cast<unsigned char>(peek()))) {
			value = value * 10 + (peek() - '0');
			++pos;
			++n;
		}
		if (count) {
			*count = n;
		}
		if (n < min_digits) {
			return false;
		}
		out = value;
		return true;
	}
};

bool validDate(int year, int month, int day) {
	if (month < 1 || month > 12 || day < 1) {
		return false;
	}
	return static_cast<unsigned>(day) <= daysInMonth(year, static_cast<unsigned>(month));
}

bool parseDatePart(Cursor &cur, int &year, int &month, int &day) {
	const std::size_t start = cur.pos;

	// Year-first layouts.
	std::size_t lead_digits = 0;
	int lead = 0;
	if (!cur.digits(1, 4, lead, &lead_digits)) {
		return false;
	}
	if (lead_digits == 4) {
		const char sep = cur.peek();
		if (sep != '-' && sep != '/' && sep != '.') {
			return false;
		}
		++cur.pos;
		year = lead;
		if (!cur.digits(1, 2, month)) {
			return false;
		}
		if (!cur.consume(sep)) {
			// "YYYY-MM" month stamp.
			if (sep != '-' || !cur.done()) {
				return false;
			}
			day = 1;
			return validDate(year, month, day);
		}
		if (!cur.digits(1, 2, day)) {
			return false;
		}
		return validDate(year, month, day);
	}

	// Year-last layouts: MM/DD/YYYY or DD-MM-YYYY / DD.MM.YYYY.
	if (lead_digits > 2) {
		return false;
	}
	const char sep = cur.peek();
	if (sep != '/' && sep != '-' && sep != '.') {
		cur.pos = start;
		return false;
	}
	++cur.pos;
	int second = 0;
	if (!cur.digits(1, 2, second) || !cur.consume(sep)) {
		return false;
	}
	std::size_t year_digits = 0;
	if (!cur.digits(4, 4, year, &year_digits)) {
		return false;
	}
	if (sep == '/') {
		month = lead;
		day = second;
	} else {
		day = lead;
		month = second;
	}
	return validDate(year, month, day);
}

bool parseTimePart(Cursor &cur, std::int64_t &seconds_of_day, std::int64_t &nanos, std::int64_t &offset_seconds) {
	int hour = 0;
	int minute = 0;
	int second = 0;
	if (!cur.digits(1, 2, hour) || !cur.consume(':') || !cur.digits(2, 2, minute)) {
		return false;
	}
	if (cur.consume(':')) {
		if (!cur.digits(2, 2, second)) {
			return false;
		}
		if (cur.consume('.') || cur.consume(',')) {
			std::int64_t scale = 100000000;
			std::size_t n = 0;
			while (!cur.done() && std::isdigit(static_cast<unsigned char>(cur.peek()))) {
				if (n < 9) {
					nanos += (cur.peek() - '0') * scale;
					scale /= 10;
				}
				++cur.pos;
				++n;
			}
			if (n == 0) {
				return false;
			}
		}
	}
	if (hour > 23 || minute > 59 || second > 59) {
		return false;
	}
	seconds_of_day = hour * 3600LL + minute * 60LL + second;

	if (cur.consume('Z')) {
		return true;
	}
	const char sign = cur.peek();
	if (sign == '+' || sign == '-') {
		++cur.pos;
		int off_hour = 0;
		int off_minute = 0;
		if (!cur.digits(2, 2, off_hour)) {
			return false;
		}
		cur.consume(':');
		if (!cur.done() && !cur.digits(2, 2, off_minute)) {
			return false;
		}
		if (off_hour > 23 || off_minute > 59) {
			return false;
		}
		const std::int64_t offset = off_hour * 3600LL + off_minute * 60LL;
		offset_seconds = sign == '+' ? offset : -offset;
	}
	return true;
}

std::string_view trim(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1);
	}
	return text;
}

} // namespace

std::int64_t daysFromCivil(int year, unsigned month, unsigned day) {
	const int y = year - (month <= 2 ? 1 : 0);
	const int era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilDate civilFromDays(std::int64_t days) {
	days += 719468;
	const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(days - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

unsigned daysInMonth(int year, unsigned month) {
	static const unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return lengths[(month - 1) % 12];
}

std::int64_t dayIndex(const TimePoint &tp) {
	const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
	std::int64_t quotient = ns / kNanosecondsPerDay;
	if (ns % kNanosecondsPerDay < 0) {
		--quotient;
	}
	return quotient;
}

CivilDate civilDate(const TimePoint &tp) {
	return civilFromDays(dayIndex(tp));
}

bool isMidnight(const TimePoint &tp) {
	const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
	return ns % kNanosecondsPerDay == 0;
}

std::optional<TimePoint> fromEpochSeconds(std::int64_t seconds, std::int64_t nanos) {
	if (seconds < kMinEpochSeconds || seconds > kMaxEpochSeconds || nanos <= -1000000000LL || nanos >= 1000000000LL) {
		return std::nullopt;
	}
	const auto total = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::seconds(seconds)) +
	                   std::chrono::nanoseconds(nanos);
	return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(total);
}

TimePoint fromCivil(const CivilDate &date) {
	const auto days = daysFromCivil(date.year, date.month, date.day);
	const auto tp = fromEpochSeconds(days * kSecondsPerDay);
	if (!tp) {
		throw std::out_of_range("Date " + std::to_string(date.year) + "-" + std::to_string(date.month) + "-" +
		                        std::to_string(date.day) + " is outside the representable timestamp range.");
	}
	return *tp;
}

std::optional<TimePoint> parseTimestamp(std::string_view text) {
	text = trim(text);
	if (text.empty()) {
		return std::nullopt;
	}

	Cursor cur{text};
	int year = 0;
	int month = 0;
	int day = 0;
	if (!parseDatePart(cur, year, month, day)) {
		return std::nullopt;
	}

	std::int64_t seconds_of_day = 0;
	std::int64_t nanos = 0;
	std::int64_t offset_seconds = 0;
	if (!cur.done()) {
		if (!(cur.consume('T') || cur.consume(' '))) {
			return std::nullopt;
		}
		while (cur.consume(' ')) {
		}
		if (!parseTimePart(cur, seconds_of_day, nanos, offset_seconds)) {
			return std::nullopt;
		}
	}
	if (!cur.done()) {
		return std::nullopt;
	}

	const auto days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
	return fromEpochSeconds(days * kSecondsPerDay + seconds_of_day - offset_seconds, nanos);
}

std::string formatTimestamp(const TimePoint &tp, bool date_only) {
	const auto day = dayIndex(tp);
	const auto date = civilFromDays(day);
	char buffer[32];
	if (date_only) {
		std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year, date.month, date.day);
		return buffer;
	}
	const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
	const std::int64_t seconds_of_day = (ns - day * kNanosecondsPerDay) / 1000000000LL;
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u %02d:%02d:%02d", date.year, date.month, date.day,
	              static_cast<int>(seconds_of_day / 3600), static_cast<int>((seconds_of_day / 60) % 60),
	              static_cast<int>(seconds_of_day % 60));
	return buffer;
}

std::string formatTimestampAuto(const TimePoint &tp) {
	return formatTimestamp(tp, isMidnight(tp));
}

} // namespace seacast::core
