#include "seacast/pipeline/evaluator.hpp"

#include "seacast/errors.hpp"
#include "seacast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace seacast::pipeline {

Evaluator::Evaluator(models::ForecasterFactory factory, double test_fraction)
    : factory_(std::move(factory)), test_fraction_(test_fraction) {
	if (!factory_) {
		throw std::invalid_argument("Evaluator requires a forecaster factory.");
	}
	if (!(test_fraction_ > 0.0 && test_fraction_ < 1.0)) {
		throw std::invalid_argument("Test fraction must be between 0 and 1 (exclusive).");
	}
}

std::size_t Evaluator::testSize(std::size_t n, double fraction) {
	if (n <= 5) {
		return std::max<std::size_t>(1, n / 5);
	}
	const auto rounded = std::lround(fraction * static_cast<double>(n));
	return std::max<std::size_t>(1, static_cast<std::size_t>(std::max(0L, rounded)));
}

TrainTestSplit Evaluator::split(const core::TimeSeries &series, double fraction) {
	const auto n = series.size();
	if (n == 0) {
		throw std::invalid_argument("Cannot split an empty series.");
	}
	const auto n_test = testSize(n, fraction);
	if (n_test < n) {
		return TrainTestSplit{series.slice(0, n - n_test), series.slice(n - n_test, n), n_test};
	}
	// Too short to hold out n_test rows: train on all but the last row when possible.
	const auto train_end = std::max<std::size_t>(1, n - 1);
	return TrainTestSplit{series.slice(0, train_end), series.slice(n - 1, n), n_test};
}

std::vector<AlignedPoint> Evaluator::align(const core::Forecast &forecast, const core::TimeSeries &test,
                                           std::size_t horizon, bool &used_positional_fallback) {
	forecast.validate();
	const auto &test_ts = test.getTimestamps();
	const auto &test_y = test.getValues();

	std::vector<AlignedPoint> aligned;
	for (std::size_t i = 0; i < forecast.size(); ++i) {
		const auto it = std::lower_bound(test_ts.begin(), test_ts.end(), forecast.timestamps[i]);
		if (it == test_ts.end() || *it != forecast.timestamps[i]) {
			continue;
		}
		const auto j = static_cast<std::size_t>(it - test_ts.begin());
		aligned.push_back(
		    AlignedPoint{forecast.timestamps[i], test_y[j], forecast.point[i], forecast.lower[i], forecast.upper[i]});
	}
	used_positional_fallback = false;
	if (!aligned.empty()) {
		return aligned;
	}

	used_positional_fallback = true;
	const auto count = std::min({horizon, forecast.size(), test.size()});
	const auto tail = forecast.tail(count);
	const auto offset = test.size() - count;
	for (std::size_t k = 0; k < count; ++k) {
		aligned.push_back(AlignedPoint{tail.timestamps[k], test_y[offset + k], tail.point[k], tail.lower[k], tail.upper[k]});
	}
	return aligned;
}

EvaluationResult Evaluator::evaluate(const core::TimeSeries &series, const core::SeasonalityConfig &seasonality,
                                     const core::RegressorSet &regressors, const RegistryBinding &binding) const {
	const auto parts = split(series, test_fraction_);
	const auto step = series.effectiveFrequency();

	std::vector<core::TimePoint> timestamps = parts.train.getTimestamps();
	const auto future = step.following(parts.train.back(), parts.horizon);
	timestamps.insert(timestamps.end(), future.begin(), future.end());

	core::Forecast forecast;
	try {
		const auto model = fitModel(factory_, seasonality, parts.train, regressors, binding, ModelRegistry::kHoldoutRole);
		forecast = model->predict(timestamps, regressors);
	} catch (const std::exception &) {
		throw ModelFitFailure("evaluation", std::current_exception(),
		                      {{"train_size", std::to_string(parts.train.size())},
		                       {"test_size", std::to_string(parts.test.size())},
		                       {"step_freq", step.code()}});
	}

	EvaluationResult result;
	result.train_size = parts.train.size();
	result.test_size = parts.test.size();
	result.aligned = align(forecast, parts.test, parts.horizon, result.used_positional_fallback);
	if (result.used_positional_fallback) {
		SEACAST_WARN("No prediction timestamp matched the held-out window; aligned {} points by position.",
		             result.aligned.size());
	}

	std::vector<double> actual;
	std::vector<double> predicted;
	std::vector<double> lower;
	std::vector<double> upper;
	for (const auto &point : result.aligned) {
		actual.push_back(point.actual);
		predicted.push_back(point.predicted);
		lower.push_back(point.lower);
		upper.push_back(point.upper);
	}
	result.metrics = utils::Metrics::summarize(actual, predicted);
	result.metrics.coverage = utils::Metrics::coverage(actual, lower, upper);
	result.mae = result.metrics.mae;
	result.rmse = result.metrics.rmse;

	SEACAST_INFO("Holdout evaluation on {} points (train {}): MAE = {:.6g}, RMSE = {:.6g}.", result.aligned.size(),
	             result.train_size, result.mae, result.rmse);
	return result;
}

} // namespace seacast::pipeline
