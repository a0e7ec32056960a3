#pragma once

#include "seacast/core/diagnostics.hpp"
#include "seacast/core/forecast.hpp"
#include "seacast/core/regressors.hpp"
#include "seacast/core/time_series.hpp"
#include "seacast/pipeline/evaluator.hpp"
#include "seacast/pipeline/future_projector.hpp"
#include "seacast/pipeline/regressor_synthesizer.hpp"
#include "seacast/pipeline/schema_detector.hpp"

#include <optional>
#include <string>

namespace seacast::pipeline {

/**
 * @class ForecastReport
 * @brief Immutable outcome of one forecasting run.
 */
class ForecastReport {
public:
	ForecastReport(EvaluationResult evaluation, core::Forecast forecast_tail, core::Diagnostics diagnostics,
	               core::TimeSeries history, core::RegressorSet regressors,
	               std::optional<core::DepthProfile> depth_profile, std::optional<std::string> forecast_csv_path);

	double mae() const {
		return evaluation_.mae;
	}

	double rmse() const {
		return evaluation_.rmse;
	}

	const EvaluationResult &evaluation() const {
		return evaluation_;
	}

	/// The projected future rows (length = future_periods).
	const core::Forecast &forecastTail() const {
		return forecast_tail_;
	}

	const core::Diagnostics &diagnostics() const {
		return diagnostics_;
	}

	/// The canonical series the models were fitted on.
	const core::TimeSeries &history() const {
		return history_;
	}

	const core::RegressorSet &regressors() const {
		return regressors_;
	}

	const std::optional<core::DepthProfile> &depthProfile() const {
		return depth_profile_;
	}

	/// Path of the forecast tail CSV, when one was written.
	const std::optional<std::string> &forecastCsvPath() const {
		return forecast_csv_path_;
	}

private:
	EvaluationResult evaluation_;
	core::Forecast forecast_tail_;
	core::Diagnostics diagnostics_;
	core::TimeSeries history_;
	core::RegressorSet regressors_;
	std::optional<core::DepthProfile> depth_profile_;
	std::optional<std::string> forecast_csv_path_;
};

/**
 * @class ResultAssembler
 * @brief Gathers the stage outputs into a ForecastReport and derives the diagnostics.
 */
class ResultAssembler {
public:
	static core::Diagnostics diagnose(const core::TimeSeries &history, const ResolvedSchema &schema,
	                                  const EvaluationResult &evaluation, const core::RegressorSet &regressors,
	                                  const core::SeasonalityConfig &seasonality, int periods);

	static ForecastReport assemble(const core::TimeSeries &history, const ResolvedSchema &schema,
	                               const EvaluationResult &evaluation, const Projection &projection,
	                               const SynthesisResult &synthesis, const core::SeasonalityConfig &seasonality,
	                               int periods, const std::optional<std::string> &forecast_csv_path = std::nullopt);
};

} // namespace seacast::pipeline
