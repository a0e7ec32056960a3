#pragma once

#include "seacast/core/raw_table.hpp"
#include "seacast/models/iforecaster.hpp"
#include "seacast/pipeline/forecast_config.hpp"
#include "seacast/pipeline/model_registry.hpp"
#include "seacast/pipeline/result_assembler.hpp"

#include <optional>
#include <string>

namespace seacast::pipeline {

/// One forecasting job.
struct ForecastRequest {
	std::string input_path;
	std::optional<std::string> regressor_path;
	std::optional<std::string> date_column;
	std::optional<std::string> target_column;
	/// Drops cached models for this input before running.
	bool retrain = false;
};

/**
 * @class ForecastRunner
 * @brief Runs the whole pipeline for one request.
 *
 * read -> detect schema -> prepare -> synthesize regressors -> choose seasonality ->
 * evaluate -> project -> write forecast CSV -> assemble -> write JSON report.
 */
class ForecastRunner {
public:
	/**
	 * @param config Run parameters, validated on construction.
	 * @param factory Forecasting backend; AdditiveRegression when empty.
	 * @param registry Optional model cache shared across runs; not owned.
	 */
	explicit ForecastRunner(ForecastConfig config, models::ForecasterFactory factory = {},
	                        ModelRegistry *registry = nullptr);

	/**
	 * @throws InputReadError, SchemaInferenceError, DataPreparationError, ModelFitFailure,
	 *         OutputWriteError
	 */
	ForecastReport run(const ForecastRequest &request) const;

	/// Runs on tables already in memory. The model registry is not consulted.
	ForecastReport run(const core::RawTable &table, const std::optional<core::RawTable> &regressor_table,
	                   const std::optional<std::string> &date_column = std::nullopt,
	                   const std::optional<std::string> &target_column = std::nullopt) const;

	/// Registry key prefix: input bytes, auxiliary bytes and every parameter that shapes a fitted model.
	std::string fingerprint(const ForecastRequest &request, const ResolvedSchema &schema) const;

	const ForecastConfig &config() const {
		return config_;
	}

private:
	ForecastReport execute(const core::RawTable &table, const ResolvedSchema &schema, const SynthesisResult &synthesis,
	                       const RegistryBinding &binding) const;

	ForecastConfig config_;
	models::ForecasterFactory factory_;
	ModelRegistry *registry_;
};

} // namespace seacast::pipeline
