#include "seacast/pipeline/forecast_runner.hpp"

#include "seacast/errors.hpp"
#include "seacast/io/delimited_reader.hpp"
#include "seacast/io/forecast_writer.hpp"
#include "seacast/io/report_writer.hpp"
#include "seacast/models/additive_regression.hpp"
#include "seacast/pipeline/evaluator.hpp"
#include "seacast/pipeline/frame_preparer.hpp"
#include "seacast/pipeline/future_projector.hpp"
#include "seacast/pipeline/regressor_synthesizer.hpp"
#include "seacast/pipeline/schema_detector.hpp"
#include "seacast/pipeline/seasonality_policy.hpp"
#include "seacast/utils/fingerprint.hpp"
#include "seacast/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace seacast::pipeline {

ForecastRunner::ForecastRunner(ForecastConfig config, models::ForecasterFactory factory, ModelRegistry *registry)
    : config_(std::move(config)), factory_(std::move(factory)), registry_(registry) {
	config_.validate();
	if (!factory_) {
		factory_ = models::makeAdditiveRegressionFactory(config_.interval_width);
	}
}

std::string ForecastRunner::fingerprint(const ForecastRequest &request, const ResolvedSchema &schema) const {
	utils::Fingerprint fp;
	try {
		fp.updateFromFile(request.input_path);
	} catch (const std::runtime_error &e) {
		throw InputReadError("Cannot fingerprint input table", {{"path", request.input_path}, {"reason", e.what()}});
	}
	if (request.regressor_path) {
		try {
			fp.updateFromFile(*request.regressor_path);
		} catch (const std::runtime_error &e) {
			// Synthesis will fall back to no regressors; key that outcome instead of the bytes.
			SEACAST_DEBUG("Regressor table not fingerprinted: {}", e.what());
			fp.update("unreadable-regressors");
		}
	}
	fp.update(schema.date_column).update(schema.target_column);
	const double parameters[] = {config_.test_fraction, config_.interval_width,
	                             static_cast<double>(config_.yearly_threshold_days)};
	fp.update(parameters, sizeof(parameters));
	return fp.hex();
}

ForecastReport ForecastRunner::run(const ForecastRequest &request) const {
	SEACAST_INFO("Forecast request for {}.", request.input_path);
	const auto table = io::readTable(request.input_path, config_.read_options);
	const auto schema = SchemaDetector::detect(table, request.date_column, request.target_column);

	SynthesisResult synthesis;
	if (request.regressor_path) {
		synthesis = RegressorSynthesizer::synthesizeFromFile(*request.regressor_path, config_.read_options);
	}

	RegistryBinding binding;
	if (registry_ != nullptr) {
		binding.registry = registry_;
		binding.fingerprint = fingerprint(request, schema);
		if (request.retrain) {
			const auto dropped = registry_->invalidate(binding.fingerprint);
			SEACAST_INFO("Retrain requested: dropped {} cached models for {}.", dropped, binding.fingerprint);
		}
	}
	return execute(table, schema, synthesis, binding);
}

ForecastReport ForecastRunner::run(const core::RawTable &table, const std::optional<core::RawTable> &regressor_table,
                                   const std::optional<std::string> &date_column,
                                   const std::optional<std::string> &target_column) const {
	const auto schema = SchemaDetector::detect(table, date_column, target_column);
	SynthesisResult synthesis;
	if (regressor_table) {
		synthesis = RegressorSynthesizer::synthesize(*regressor_table);
	}
	return execute(table, schema, synthesis, RegistryBinding{});
}

ForecastReport ForecastRunner::execute(const core::RawTable &table, const ResolvedSchema &schema,
                                       const SynthesisResult &synthesis, const RegistryBinding &binding) const {
	const auto series = FramePreparer::prepare(table, schema);
	const auto seasonality = SeasonalityPolicy(config_.yearly_threshold_days).choose(series);

	const auto evaluation =
	    Evaluator(factory_, config_.test_fraction).evaluate(series, seasonality, synthesis.regressors, binding);
	const auto projection =
	    FutureProjector(factory_).project(series, seasonality, synthesis.regressors, config_.periods, binding);

	if (config_.output_path) {
		io::writeForecastCsv(*config_.output_path, projection.future);
	}
	auto report = ResultAssembler::assemble(series, schema, evaluation, projection, synthesis, seasonality,
	                                        config_.periods, config_.output_path);
	if (config_.report_path) {
		io::writeReportJson(*config_.report_path, report);
	}
	SEACAST_INFO("Forecast complete: MAE = {:.6g}, RMSE = {:.6g}, {} future rows.", report.mae(), report.rmse(),
	             report.forecastTail().size());
	return report;
}

} // namespace seacast::pipeline
