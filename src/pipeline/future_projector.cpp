#include "seacast/pipeline/future_projector.hpp"

#include "seacast/errors.hpp"
#include "seacast/utils/logging.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace seacast::pipeline {

FutureProjector::FutureProjector(models::ForecasterFactory factory) : factory_(std::move(factory)) {
	if (!factory_) {
		throw std::invalid_argument("FutureProjector requires a forecaster factory.");
	}
}

Projection FutureProjector::project(const core::TimeSeries &series, const core::SeasonalityConfig &seasonality,
                                    const core::RegressorSet &regressors, int periods,
                                    const RegistryBinding &binding) const {
	if (periods < 0) {
		throw std::invalid_argument("Forecast periods must be non-negative.");
	}
	if (series.isEmpty()) {
		throw std::invalid_argument("Cannot project an empty series.");
	}

	const auto step = series.effectiveFrequency();
	std::vector<core::TimePoint> timestamps = series.getTimestamps();
	std::vector<core::TimePoint> future;
	try {
		future = step.following(series.back(), static_cast<std::size_t>(periods));
	} catch (const std::out_of_range &e) {
		throw DataPreparationError(e.what(), {{"last_observation", core::formatTimestampAuto(series.back())},
		                                      {"periods", std::to_string(periods)},
		                                      {"step_freq", step.code()}});
	}
	timestamps.insert(timestamps.end(), future.begin(), future.end());

	Projection projection;
	try {
		const auto model = fitModel(factory_, seasonality, series, regressors, binding, ModelRegistry::kFullRole);
		projection.full = model->predict(timestamps, regressors);
	} catch (const std::exception &) {
		throw ModelFitFailure("projection", std::current_exception(),
		                      {{"observations", std::to_string(series.size())},
		                       {"periods", std::to_string(periods)},
		                       {"step_freq", step.code()}});
	}
	projection.full.validate();

	const auto boundary = projection.full.firstIndexAfter(series.back());
	projection.fit = projection.full.slice(0, boundary);
	projection.future = projection.full.slice(boundary, projection.full.size());
	if (projection.future.size() != static_cast<std::size_t>(periods)) {
		throw std::logic_error("Projection produced " + std::to_string(projection.future.size()) +
		                       " future rows, expected " + std::to_string(periods) + ".");
	}

	SEACAST_INFO("Projected {} steps past {} at frequency {}.", periods, core::formatTimestampAuto(series.back()),
	             step.code());
	return projection;
}

} // namespace seacast::pipeline
