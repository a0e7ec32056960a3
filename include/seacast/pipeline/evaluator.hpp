#pragma once

#include "seacast/core/forecast.hpp"
#include "seacast/core/regressors.hpp"
#include "seacast/core/time_series.hpp"
#include "seacast/models/iforecaster.hpp"
#include "seacast/pipeline/model_registry.hpp"
#include "seacast/utils/metrics.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace seacast::pipeline {

/// One held-out observation next to its prediction.
struct AlignedPoint {
	core::TimePoint ds;
	double actual = 0.0;
	double predicted = 0.0;
	double lower = 0.0;
	double upper = 0.0;
};

/**
 * @struct EvaluationResult
 * @brief Accuracy of a model fitted without the held-out window.
 */
struct EvaluationResult {
	double mae = 0.0;
	double rmse = 0.0;
	std::vector<AlignedPoint> aligned;
	std::size_t train_size = 0;
	std::size_t test_size = 0;
	/// True when no timestamp matched and predictions were paired with actuals by position.
	bool used_positional_fallback = false;
	/// Full metric set over the aligned pairs (MSE, MAPE, interval coverage).
	utils::AccuracyMetrics metrics;
};

/// The series cut into a training prefix and a held-out suffix.
struct TrainTestSplit {
	core::TimeSeries train;
	core::TimeSeries test;
	/// Number of steps predicted past the training data.
	std::size_t horizon = 0;
};

/**
 * @class Evaluator
 * @brief Holds out the tail of the series, fits on the rest and scores the predictions.
 */
class Evaluator {
public:
	explicit Evaluator(models::ForecasterFactory factory, double test_fraction = 0.2);

	/// max(1, n / 5) for n <= 5, else max(1, round(fraction * n)).
	static std::size_t testSize(std::size_t n, double fraction);

	static TrainTestSplit split(const core::TimeSeries &series, double fraction);

	/**
	 * @brief Fits on the training prefix and scores the held-out suffix.
	 * @param binding Optional registry for the fitted "holdout" model.
	 * @throws ModelFitFailure When the model fails to fit or predict.
	 */
	EvaluationResult evaluate(const core::TimeSeries &series, const core::SeasonalityConfig &seasonality,
	                          const core::RegressorSet &regressors, const RegistryBinding &binding = {}) const;

	/// Pairs predictions with held-out actuals by timestamp, or by position when none match.
	static std::vector<AlignedPoint> align(const core::Forecast &forecast, const core::TimeSeries &test,
	                                       std::size_t horizon, bool &used_positional_fallback);

	double testFraction() const {
		return test_fraction_;
	}

private:
	models::ForecasterFactory factory_;
	double test_fraction_;
};

} // namespace seacast::pipeline
