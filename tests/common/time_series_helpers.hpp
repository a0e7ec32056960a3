#pragma once

#include "seacast/core/raw_table.hpp"
#include "seacast/core/time_series.hpp"
#include "seacast/core/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace tests::helpers {

using seacast::core::TimePoint;

inline TimePoint date(int year, unsigned month, unsigned day) {
	return seacast::core::fromCivil(seacast::core::CivilDate{year, month, day});
}

inline std::vector<TimePoint> makeTimestamps(std::size_t count, TimePoint start = date(2020, 1, 1),
                                             std::chrono::seconds step = std::chrono::hours(24)) {
	std::vector<TimePoint> timestamps;
	timestamps.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		timestamps.push_back(start + step * static_cast<long long>(i));
	}
	return timestamps;
}

inline seacast::core::TimeSeries makeDailySeries(std::vector<double> values, TimePoint start = date(2020, 1, 1)) {
	auto timestamps = makeTimestamps(values.size(), start);
	seacast::core::TimeSeries series(std::move(timestamps), std::move(values), "y");
	series.setFrequencyFromTimestamps();
	return series;
}

/// 10 + 3 sin(2 pi i / 365.25) over @p count days.
inline std::vector<double> sinusoid(std::size_t count, double level = 10.0, double amplitude = 3.0) {
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		values.push_back(level + amplitude * std::sin(2.0 * 3.14159265358979323846 * static_cast<double>(i) / 365.25));
	}
	return values;
}

/// Linear ramp start, start + slope, ...
inline std::vector<double> ramp(std::size_t count, double start = 5.0, double slope = 0.5) {
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		values.push_back(start + slope * static_cast<double>(i));
	}
	return values;
}

inline seacast::core::RawTable makeTable(const std::vector<std::pair<std::string, std::vector<std::string>>> &columns) {
	seacast::core::RawTable table;
	for (const auto &column : columns) {
		table.addColumn(column.first, column.second);
	}
	return table;
}

/// Two-column table ("timestamp", @p value_column) of daily dates and the given values.
inline seacast::core::RawTable makeDailyTable(const std::vector<double> &values, const std::string &value_column = "sst",
                                              TimePoint start = date(2020, 1, 1)) {
	std::vector<std::string> dates;
	std::vector<std::string> cells;
	const auto timestamps = makeTimestamps(values.size(), start);
	for (std::size_t i = 0; i < values.size(); ++i) {
		dates.push_back(seacast::core::formatTimestamp(timestamps[i], true));
		cells.push_back(std::to_string(values[i]));
	}
	return makeTable({{"timestamp", dates}, {value_column, cells}});
}

} // namespace tests::helpers
