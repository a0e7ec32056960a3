#pragma once

#include "seacast/core/regressors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace seacast::core {

/**
 * @struct Diagnostics
 * @brief Read-only summary attached to every forecast result.
 */
struct Diagnostics {
	std::size_t n_observations = 0;
	std::size_t test_points = 0;
	/// Inferred frequency code; empty when inference failed (stepping then falls back to "D").
	std::optional<std::string> inferred_freq;
	/// Frequency code actually used to step predictions.
	std::string step_freq = "D";
	std::string date_column;
	std::string target_column;
	bool has_regressors = false;
	std::vector<std::string> regressor_names;
	std::size_t future_periods = 0;
	SeasonalityConfig seasonality;
};

} // namespace seacast::core
