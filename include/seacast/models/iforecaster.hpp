#pragma once

#include "seacast/core/forecast.hpp"
#include "seacast/core/regressors.hpp"
#include "seacast/core/time_series.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace seacast::models {

/**
 * @class IForecaster
 * @brief An interface for every forecasting backend the pipeline can drive.
 *
 * A model learns from a canonical series plus scalar regressors and can then be
 * evaluated at arbitrary timestamps, historical or future. Seasonality is fixed when
 * the model is constructed.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided history.
	 * @param history The canonical series to train on.
	 * @param regressors Scalar regressors, broadcast over every row.
	 */
	virtual void fit(const core::TimeSeries &history, const core::RegressorSet &regressors) = 0;

	/**
	 * @brief Predicts at the given timestamps.
	 * @param timestamps Ascending timestamps, may extend past the history.
	 * @param regressors Regressor values held constant over @p timestamps.
	 * @return Point forecast with interval bounds, one row per timestamp.
	 */
	virtual core::Forecast predict(const std::vector<core::TimePoint> &timestamps,
	                               const core::RegressorSet &regressors) const = 0;

	virtual bool isFitted() const = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 * @return A string representing the model's name (e.g., "AdditiveRegression").
	 */
	virtual std::string getName() const = 0;
};

/// Creates an unfitted model for the chosen seasonality.
using ForecasterFactory = std::function<std::unique_ptr<IForecaster>(const core::SeasonalityConfig &)>;

} // namespace seacast::models
