#pragma once

#include "seacast/core/regressors.hpp"
#include "seacast/core/time_series.hpp"

#include <cstdint>

namespace seacast::pipeline {

/**
 * @class SeasonalityPolicy
 * @brief Chooses the seasonal components from the span of the history.
 *
 * Yearly seasonality needs at least the threshold number of whole days; shorter
 * histories get weekly seasonality instead. Daily seasonality is never enabled.
 */
class SeasonalityPolicy {
public:
	static constexpr int kDefaultYearlyThresholdDays = 270;

	explicit SeasonalityPolicy(int yearly_threshold_days = kDefaultYearlyThresholdDays);

	core::SeasonalityConfig choose(const core::TimeSeries &series) const;

	/// Whole days between the first and last timestamp (floor).
	static std::int64_t spanDays(const core::TimeSeries &series);

	int yearlyThresholdDays() const {
		return yearly_threshold_days_;
	}

private:
	int yearly_threshold_days_;
};

} // namespace seacast::pipeline
