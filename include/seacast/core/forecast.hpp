#pragma once

#include "seacast/core/timestamp.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace seacast::core {

/**
 * @struct Forecast
 * @brief Holds the results of a forecasting operation.
 *
 * One row per timestamp: the point prediction (yhat) and the lower/upper bounds of
 * its prediction interval. Rows are ordered by timestamp.
 */
struct Forecast {
	using Value = double;
	using Series = std::vector<Value>;

	std::vector<TimePoint> timestamps;

	/// Point forecasts (yhat).
	Series point;

	/// Lower bounds of the prediction intervals (yhat_lower).
	Series lower;

	/// Upper bounds of the prediction intervals (yhat_upper).
	Series upper;

	/// Returns the number of rows.
	std::size_t size() const {
		return timestamps.size();
	}

	/// Returns whether the forecast contains any rows.
	bool empty() const {
		return timestamps.empty();
	}

	/// Appends one row.
	void push_back(const TimePoint &ts, Value yhat, Value yhat_lower, Value yhat_upper) {
		timestamps.push_back(ts);
		point.push_back(yhat);
		lower.push_back(yhat_lower);
		upper.push_back(yhat_upper);
	}

	void reserve(std::size_t n) {
		timestamps.reserve(n);
		point.reserve(n);
		lower.reserve(n);
		upper.reserve(n);
	}

	/// Throws when the four columns disagree in length.
	void validate() const {
		const auto n = timestamps.size();
		if (point.size() != n || lower.size() != n || upper.size() != n) {
			throw std::logic_error("Forecast columns must have the same length.");
		}
	}

	/// Rows [start, end).
	Forecast slice(std::size_t start, std::size_t end) const {
		validate();
		if (start > end || end > size()) {
			throw std::out_of_range("Forecast slice is out of range.");
		}
		const auto b = static_cast<std::ptrdiff_t>(start);
		const auto e = static_cast<std::ptrdiff_t>(end);
		Forecast result;
		result.timestamps.assign(timestamps.begin() + b, timestamps.begin() + e);
		result.point.assign(point.begin() + b, point.begin() + e);
		result.lower.assign(lower.begin() + b, lower.begin() + e);
		result.upper.assign(upper.begin() + b, upper.begin() + e);
		return result;
	}

	/// The last @p n rows (all rows when fewer exist).
	Forecast tail(std::size_t n) const {
		const auto count = std::min(n, size());
		return slice(size() - count, size());
	}

	/// Index of the first row strictly after @p tp (size() when none).
	std::size_t firstIndexAfter(const TimePoint &tp) const {
		return static_cast<std::size_t>(std::upper_bound(timestamps.begin(), timestamps.end(), tp) -
		                                timestamps.begin());
	}
};

} // namespace seacast::core
