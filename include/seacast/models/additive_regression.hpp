#pragma once

#include "seacast/models/iforecaster.hpp"
#include "seacast/utils/logging.hpp"

#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>

namespace seacast::models {

class AdditiveRegressionBuilder; // Forward declaration

/**
 * @class AdditiveRegression
 * @brief Decomposable regression: piecewise-linear trend + Fourier seasonality + regressors.
 *
 * y(t) = trend(t) + sum of enabled seasonal terms + sum of standardised regressors.
 * The coefficients are a ridge (Gaussian prior) least-squares fit on scaled data. Interval
 * bounds combine the residual noise with the variance of future trend changes.
 */
class AdditiveRegression final : public IForecaster {
public:
	friend class AdditiveRegressionBuilder;

	void fit(const core::TimeSeries &history, const core::RegressorSet &regressors) override;
	core::Forecast predict(const std::vector<core::TimePoint> &timestamps,
	                       const core::RegressorSet &regressors) const override;

	bool isFitted() const override {
		return is_fitted_;
	}

	std::string getName() const override {
		return "AdditiveRegression";
	}

	const core::SeasonalityConfig &seasonality() const {
		return seasonality_;
	}

	double intervalWidth() const {
		return interval_width_;
	}

	/// Changepoint locations chosen during fit.
	std::vector<core::TimePoint> changepoints() const;

	/// Residual standard deviation in the units of the target.
	double noiseScale() const {
		return sigma_ * y_scale_;
	}

	/// Coefficients in scaled space: offset, rate, changepoint deltas, seasonal terms, regressors.
	const Eigen::VectorXd &coefficients() const {
		return theta_;
	}

	std::vector<std::string> regressorNames() const;

private:
	struct Settings {
		core::SeasonalityConfig seasonality;
		double interval_width = 0.8;
		int n_changepoints = 25;
		double changepoint_range = 0.8;
		double changepoint_prior_scale = 0.05;
		double seasonality_prior_scale = 10.0;
		double regressor_prior_scale = 10.0;
		double trend_prior_scale = 1.0e4;
	};

	struct RegressorScaling {
		std::string name;
		double mean = 0.0;
		double scale = 1.0;
		bool standardize = true;
	};

	struct FourierBlock {
		double period_days;
		int order;
	};

	explicit AdditiveRegression(const Settings &settings);

	std::vector<FourierBlock> fourierBlocks() const;
	std::size_t featureCount() const;
	double scaledTime(const core::TimePoint &tp) const;
	void fillRow(Eigen::RowVectorXd &row, const core::TimePoint &tp,
	             const std::vector<double> &regressor_values) const;
	std::vector<double> regressorValues(const core::RegressorSet &regressors) const;
	Eigen::VectorXd solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, double noise_var) const;

	core::SeasonalityConfig seasonality_;
	double interval_width_;
	int n_changepoints_;
	double changepoint_range_;
	double changepoint_prior_scale_;
	double seasonality_prior_scale_;
	double regressor_prior_scale_;
	double trend_prior_scale_;

	double t0_seconds_ = 0.0;
	double t_scale_seconds_ = 1.0;
	double y_scale_ = 1.0;
	std::vector<double> changepoints_t_;
	std::vector<RegressorScaling> regressor_scaling_;
	Eigen::VectorXd theta_;
	double sigma_ = 0.0;
	double mean_abs_delta_ = 0.0;
	double z_ = 0.0;
	bool is_fitted_ = false;
};

/**
 * @class AdditiveRegressionBuilder
 * @brief A builder for fluently configuring and creating AdditiveRegression models.
 */
class AdditiveRegressionBuilder {
public:
	AdditiveRegressionBuilder &withSeasonality(const core::SeasonalityConfig &seasonality);
	AdditiveRegressionBuilder &withYearly(bool enabled);
	AdditiveRegressionBuilder &withWeekly(bool enabled);
	AdditiveRegressionBuilder &withDaily(bool enabled);

	/**
	 * @brief Sets the probability mass of the prediction interval.
	 * @param width Strictly between 0 and 1 (default 0.8).
	 * @return A reference to the builder for chaining.
	 */
	AdditiveRegressionBuilder &withIntervalWidth(double width);

	/**
	 * @brief Sets the maximum number of potential trend changepoints.
	 * @param count Non-negative; fewer are used on short histories.
	 * @return A reference to the builder for chaining.
	 */
	AdditiveRegressionBuilder &withChangepoints(int count);

	/// Share of the history, from the start, in which changepoints may be placed.
	AdditiveRegressionBuilder &withChangepointRange(double range);

	AdditiveRegressionBuilder &withChangepointPriorScale(double scale);
	AdditiveRegressionBuilder &withSeasonalityPriorScale(double scale);
	AdditiveRegressionBuilder &withRegressorPriorScale(double scale);

	/**
	 * @brief Creates a new AdditiveRegression model instance.
	 * @return A unique pointer to the configured model.
	 * @throws std::invalid_argument If a setting is out of range.
	 */
	std::unique_ptr<AdditiveRegression> build();

private:
	AdditiveRegression::Settings settings_;
};

/// Factory producing AdditiveRegression models with the given interval width.
ForecasterFactory makeAdditiveRegressionFactory(double interval_width = 0.8);

} // namespace seacast::models
