#include "seacast/pipeline/forecast_config.hpp"

#include <stdexcept>

namespace seacast::pipeline {

void ForecastConfig::validate() const {
	if (periods < 0) {
		throw std::invalid_argument("Forecast periods must be non-negative.");
	}
	if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
		throw std::invalid_argument("Test fraction must be between 0 and 1 (exclusive).");
	}
	if (!(interval_width > 0.0 && interval_width < 1.0)) {
		throw std::invalid_argument("Interval width must be between 0 and 1 (exclusive).");
	}
	if (yearly_threshold_days < 0) {
		throw std::invalid_argument("Yearly seasonality threshold must be non-negative.");
	}
	if (output_path && output_path->empty()) {
		throw std::invalid_argument("Output path must not be empty.");
	}
	if (report_path && report_path->empty()) {
		throw std::invalid_argument("Report path must not be empty.");
	}
}

} // namespace seacast::pipeline
