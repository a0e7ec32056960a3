#include "seacast/pipeline/result_assembler.hpp"

#include <stdexcept>
#include <utility>

namespace seacast::pipeline {

ForecastReport::ForecastReport(EvaluationResult evaluation, core::Forecast forecast_tail, core::Diagnostics diagnostics,
                               core::TimeSeries history, core::RegressorSet regressors,
                               std::optional<core::DepthProfile> depth_profile,
                               std::optional<std::string> forecast_csv_path)
    : evaluation_(std::move(evaluation)), forecast_tail_(std::move(forecast_tail)),
      diagnostics_(std::move(diagnostics)), history_(std::move(history)), regressors_(std::move(regressors)),
      depth_profile_(std::move(depth_profile)), forecast_csv_path_(std::move(forecast_csv_path)) {
	forecast_tail_.validate();
}

core::Diagnostics ResultAssembler::diagnose(const core::TimeSeries &history, const ResolvedSchema &schema,
                                            const EvaluationResult &evaluation, const core::RegressorSet &regressors,
                                            const core::SeasonalityConfig &seasonality, int periods) {
	core::Diagnostics diagnostics;
	diagnostics.n_observations = history.size();
	diagnostics.test_points = evaluation.test_size;
	if (history.frequency()) {
		diagnostics.inferred_freq = history.frequency()->code();
	}
	diagnostics.step_freq = history.effectiveFrequency().code();
	diagnostics.date_column = schema.date_column;
	diagnostics.target_column = schema.target_column;
	diagnostics.has_regressors = !regressors.empty();
	diagnostics.regressor_names = regressors.names();
	diagnostics.future_periods = static_cast<std::size_t>(periods);
	diagnostics.seasonality = seasonality;
	return diagnostics;
}

ForecastReport ResultAssembler::assemble(const core::TimeSeries &history, const ResolvedSchema &schema,
                                         const EvaluationResult &evaluation, const Projection &projection,
                                         const SynthesisResult &synthesis, const core::SeasonalityConfig &seasonality,
                                         int periods, const std::optional<std::string> &forecast_csv_path) {
	if (periods < 0) {
		throw std::invalid_argument("Forecast periods must be non-negative.");
	}
	return ForecastReport(evaluation, projection.future.tail(static_cast<std::size_t>(periods)),
	                      diagnose(history, schema, evaluation, synthesis.regressors, seasonality, periods), history,
	                      synthesis.regressors, synthesis.profile, forecast_csv_path);
}

} // namespace seacast::pipeline
