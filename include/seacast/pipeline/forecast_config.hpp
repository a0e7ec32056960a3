#pragma once

#include "seacast/io/delimited_reader.hpp"

#include <optional>
#include <string>

namespace seacast::pipeline {

/**
 * @struct ForecastConfig
 * @brief Tunable parameters of one forecasting run.
 */
struct ForecastConfig {
	/// Number of future steps to project.
	int periods = 30;

	/// Share of the canonical series held out for evaluation.
	double test_fraction = 0.2;

	/// Probability mass of the prediction intervals.
	double interval_width = 0.8;

	/// Minimum span, in whole days, for yearly seasonality.
	int yearly_threshold_days = 270;

	/// Where the forecast tail CSV goes; nothing is written when unset.
	std::optional<std::string> output_path = std::string("forecast_output.csv");

	/// Where the JSON report goes; nothing is written when unset.
	std::optional<std::string> report_path;

	io::ReadOptions read_options;

	/// @throws std::invalid_argument When a parameter is out of range.
	void validate() const;
};

} // namespace seacast::pipeline
