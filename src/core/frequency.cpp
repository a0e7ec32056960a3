#include "seacast/core/frequency.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace seacast::core {

namespace {

std::string withMultiple(long long multiple, const std::string &alias) {
	return multiple == 1 ? alias : std::to_string(multiple) + alias;
}

[[noreturn]] void throwPastRange(const TimePoint &tp, std::int64_t steps) {
	throw std::out_of_range("Advancing " + formatTimestampAuto(tp) + " by " + std::to_string(steps) +
	                        " periods leaves the representable timestamp range.");
}

std::int64_t monthIndex(const CivilDate &date) {
	return static_cast<std::int64_t>(date.year) * 12 + static_cast<std::int64_t>(date.month) - 1;
}

} // namespace

Frequency Frequency::fixed(std::chrono::seconds step) {
	if (step <= std::chrono::seconds::zero()) {
		throw std::invalid_argument("Frequency step must be positive.");
	}
	Frequency freq;
	freq.kind_ = Kind::Fixed;
	freq.fixed_step_ = step;
	return freq;
}

Frequency Frequency::months(int step, bool month_end) {
	if (step <= 0) {
		throw std::invalid_argument("Frequency month step must be positive.");
	}
	Frequency freq;
	freq.kind_ = Kind::Monthly;
	freq.month_step_ = step;
	freq.month_end_ = month_end;
	return freq;
}

std::optional<Frequency> Frequency::infer(const std::vector<TimePoint> &timestamps) {
	if (timestamps.size() < 3) {
		return std::nullopt;
	}

	const auto base_diff = timestamps[1] - timestamps[0];
	bool constant = base_diff > TimePoint::duration::zero();
	for (std::size_t i = 1; constant && i + 1 < timestamps.size(); ++i) {
		constant = (timestamps[i + 1] - timestamps[i]) == base_diff;
	}
	if (constant) {
		const auto whole = std::chrono::duration_cast<std::chrono::seconds>(base_diff);
		if (whole > std::chrono::seconds::zero() && whole == base_diff) {
			return fixed(whole);
		}
		return std::nullopt;
	}

	bool month_start = true;
	bool month_end = true;
	for (const auto &tp : timestamps) {
		if (!isMidnight(tp)) {
			return std::nullopt;
		}
		const auto date = civilDate(tp);
		month_start = month_start && date.day == 1;
		month_end = month_end && date.day == daysInMonth(date.year, date.month);
	}
	if (!month_start && !month_end) {
		return std::nullopt;
	}

	const auto step = monthIndex(civilDate(timestamps[1])) - monthIndex(civilDate(timestamps[0]));
	if (step <= 0) {
		return std::nullopt;
	}
	for (std::size_t i = 1; i + 1 < timestamps.size(); ++i) {
		if (monthIndex(civilDate(timestamps[i + 1])) - monthIndex(civilDate(timestamps[i])) != step) {
			return std::nullopt;
		}
	}
	return months(static_cast<int>(step), !month_start);
}

std::string Frequency::code() const {
	if (kind_ == Kind::Monthly) {
		const std::string suffix = month_end_ ? "" : "S";
		if (month_step_ % 12 == 0) {
			return withMultiple(month_step_ / 12, "A" + suffix);
		}
		if (month_step_ == 3) {
			return "Q" + suffix;
		}
		return withMultiple(month_step_, "M" + suffix);
	}

	const long long seconds = fixed_step_.count();
	if (seconds % 86400 == 0) {
		const long long days = seconds / 86400;
		return days == 7 ? "W" : withMultiple(days, "D");
	}
	if (seconds % 3600 == 0) {
		return withMultiple(seconds / 3600, "H");
	}
	if (seconds % 60 == 0) {
		return withMultiple(seconds / 60, "min");
	}
	return withMultiple(seconds, "S");
}

TimePoint Frequency::advance(const TimePoint &tp, std::int64_t steps) const {
	const auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
	const auto whole = std::chrono::floor<std::chrono::seconds>(since_epoch);
	const std::int64_t nanos = (since_epoch - whole).count();

	if (kind_ == Kind::Fixed) {
		const std::int64_t step = fixed_step_.count();
		const std::int64_t limit = std::numeric_limits<std::int64_t>::max() / 4;
		if (steps > limit / step || steps < -limit / step) {
			throwPastRange(tp, steps);
		}
		const auto result = fromEpochSeconds(whole.count() + step * steps, nanos);
		if (!result) {
			throwPastRange(tp, steps);
		}
		return *result;
	}

	const auto date = civilDate(tp);
	const std::int64_t seconds_of_day = whole.count() - dayIndex(tp) * 86400LL;
	const std::int64_t month_limit = 12LL * 100000;
	if (steps > month_limit / month_step_ || steps < -month_limit / month_step_) {
		throwPastRange(tp, steps);
	}
	const std::int64_t target = monthIndex(date) + steps * month_step_;
	std::int64_t year = target / 12;
	std::int64_t month0 = target % 12;
	if (month0 < 0) {
		month0 += 12;
		--year;
	}
	CivilDate next{static_cast<int>(year), static_cast<unsigned>(month0 + 1), 1};
	const unsigned last_day = daysInMonth(next.year, next.month);
	next.day = month_end_ ? last_day : std::min(date.day, last_day);
	const auto result =
	    fromEpochSeconds(daysFromCivil(next.year, next.month, next.day) * 86400LL + seconds_of_day, nanos);
	if (!result) {
		throwPastRange(tp, steps);
	}
	return *result;
}

std::vector<TimePoint> Frequency::following(const TimePoint &last, std::size_t periods) const {
	if (periods > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
		throwPastRange(last, static_cast<std::int64_t>(periods));
	}
	std::vector<TimePoint> result;
	result.reserve(periods);
	for (std::size_t i = 1; i <= periods; ++i) {
		result.push_back(advance(last, static_cast<std::int64_t>(i)));
	}
	return result;
}

} // namespace seacast::core
