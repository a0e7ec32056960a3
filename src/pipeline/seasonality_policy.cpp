#include "seacast/pipeline/seasonality_policy.hpp"

#include "seacast/utils/logging.hpp"

#include <chrono>
#include <stdexcept>

namespace seacast::pipeline {

SeasonalityPolicy::SeasonalityPolicy(int yearly_threshold_days) : yearly_threshold_days_(yearly_threshold_days) {
	if (yearly_threshold_days_ < 0) {
		throw std::invalid_argument("Yearly seasonality threshold must be non-negative.");
	}
}

std::int64_t SeasonalityPolicy::spanDays(const core::TimeSeries &series) {
	using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;
	return std::chrono::duration_cast<Days>(series.span()).count();
}

core::SeasonalityConfig SeasonalityPolicy::choose(const core::TimeSeries &series) const {
	const auto span = spanDays(series);
	core::SeasonalityConfig config;
	config.yearly = span >= yearly_threshold_days_;
	config.weekly = !config.yearly;
	config.daily = false;
	SEACAST_INFO("History spans {} days: yearly={}, weekly={}.", span, config.yearly, config.weekly);
	return config;
}

} // namespace seacast::pipeline
