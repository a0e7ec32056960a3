#pragma once

#include "seacast/core/forecast.hpp"
#include "seacast/core/regressors.hpp"
#include "seacast/core/time_series.hpp"
#include "seacast/models/iforecaster.hpp"
#include "seacast/pipeline/model_registry.hpp"

#include <cstddef>

namespace seacast::pipeline {

/**
 * @struct Projection
 * @brief Predictions over the history and beyond it.
 */
struct Projection {
	/// Every predicted row: history first, then the future steps.
	core::Forecast full;
	/// Rows at or before the last historical timestamp.
	core::Forecast fit;
	/// Exactly the requested number of rows, all after the last historical timestamp.
	core::Forecast future;
};

/**
 * @class FutureProjector
 * @brief Refits on the whole series and projects a fixed number of steps ahead.
 *
 * Steps use the inferred frequency (daily when unknown). Regressors are held at their
 * constant values over the future.
 */
class FutureProjector {
public:
	explicit FutureProjector(models::ForecasterFactory factory);

	/**
	 * @param periods Number of future steps; must be non-negative.
	 * @param binding Optional registry for the fitted "full" model.
	 * @throws std::invalid_argument When @p periods is negative.
	 * @throws ModelFitFailure When the model fails to fit or predict.
	 */
	Projection project(const core::TimeSeries &series, const core::SeasonalityConfig &seasonality,
	                   const core::RegressorSet &regressors, int periods, const RegistryBinding &binding = {}) const;

private:
	models::ForecasterFactory factory_;
};

} // namespace seacast::pipeline
