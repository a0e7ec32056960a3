#include "seacast/models/additive_regression.hpp"

#include "seacast/utils/statistics.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace seacast::models {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kSecondsPerDay = 86400.0;

double epochSeconds(const core::TimePoint &tp) {
	return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

bool isBinary(const std::vector<double> &column) {
	bool has_zero = false;
	bool has_one = false;
	for (double v : column) {
		if (v == 0.0) {
			has_zero = true;
		} else if (v == 1.0) {
			has_one = true;
		} else {
			return false;
		}
	}
	return has_zero && has_one;
}

} // namespace

// --- Model Implementation ---

AdditiveRegression::AdditiveRegression(const Settings &settings)
    : seasonality_(settings.seasonality), interval_width_(settings.interval_width),
      n_changepoints_(settings.n_changepoints), changepoint_range_(settings.changepoint_range),
      changepoint_prior_scale_(settings.changepoint_prior_scale),
      seasonality_prior_scale_(settings.seasonality_prior_scale),
      regressor_prior_scale_(settings.regressor_prior_scale), trend_prior_scale_(settings.trend_prior_scale) {
	if (!(interval_width_ > 0.0 && interval_width_ < 1.0)) {
		throw std::invalid_argument("Interval width must be between 0 and 1 (exclusive).");
	}
	if (n_changepoints_ < 0) {
		throw std::invalid_argument("Number of changepoints must be non-negative.");
	}
	if (!(changepoint_range_ > 0.0 && changepoint_range_ <= 1.0)) {
		throw std::invalid_argument("Changepoint range must be in (0, 1].");
	}
	if (!(changepoint_prior_scale_ > 0.0) || !(seasonality_prior_scale_ > 0.0) || !(regressor_prior_scale_ > 0.0) ||
	    !(trend_prior_scale_ > 0.0)) {
		throw std::invalid_argument("Prior scales must be positive.");
	}
	z_ = utils::Statistics::normalQuantile((1.0 + interval_width_) / 2.0);
}

std::vector<AdditiveRegression::FourierBlock> AdditiveRegression::fourierBlocks() const {
	std::vector<FourierBlock> blocks;
	if (seasonality_.yearly) {
		blocks.push_back({365.25, 10});
	}
	if (seasonality_.weekly) {
		blocks.push_back({7.0, 3});
	}
	if (seasonality_.daily) {
		blocks.push_back({1.0, 4});
	}
	return blocks;
}

std::size_t AdditiveRegression::featureCount() const {
	std::size_t count = 2 + changepoints_t_.size();
	for (const auto &block : fourierBlocks()) {
		count += 2 * static_cast<std::size_t>(block.order);
	}
	return count + regressor_scaling_.size();
}

double AdditiveRegression::scaledTime(const core::TimePoint &tp) const {
	return (epochSeconds(tp) - t0_seconds_) / t_scale_seconds_;
}

void AdditiveRegression::fillRow(Eigen::RowVectorXd &row, const core::TimePoint &tp,
                                 const std::vector<double> &regressor_values) const {
	const double t = scaledTime(tp);
	Eigen::Index col = 0;
	row(col++) = 1.0;
	row(col++) = t;
	for (double s : changepoints_t_) {
		row(col++) = std::max(0.0, t - s);
	}

	const double days = epochSeconds(tp) / kSecondsPerDay;
	for (const auto &block : fourierBlocks()) {
		for (int k = 1; k <= block.order; ++k) {
			const double angle = 2.0 * kPi * static_cast<double>(k) * days / block.period_days;
			row(col++) = std::sin(angle);
			row(col++) = std::cos(angle);
		}
	}

	for (std::size_t i = 0; i < regressor_scaling_.size(); ++i) {
		const auto &scaling = regressor_scaling_[i];
		const double value = regressor_values[i];
		row(col++) = scaling.standardize ? (value - scaling.mean) / scaling.scale : value;
	}
}

std::vector<double> AdditiveRegression::regressorValues(const core::RegressorSet &regressors) const {
	if (regressors.size() != regressor_scaling_.size()) {
		throw std::invalid_argument("Regressors do not match the ones the model was fitted with.");
	}
	std::vector<double> values;
	values.reserve(regressor_scaling_.size());
	for (const auto &scaling : regressor_scaling_) {
		const auto value = regressors.find(scaling.name);
		if (!value) {
			throw std::invalid_argument("Missing regressor '" + scaling.name + "'.");
		}
		if (!std::isfinite(*value)) {
			throw std::invalid_argument("Regressor '" + scaling.name + "' must be finite.");
		}
		values.push_back(*value);
	}
	return values;
}

Eigen::VectorXd AdditiveRegression::solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                          double noise_var) const {
	Eigen::VectorXd penalty = Eigen::VectorXd::Zero(X.cols());
	Eigen::Index col = 0;
	// Offset and slope carry a vanishing penalty; it only pins them when the history has a single timestamp.
	const double trend_penalty = noise_var / (trend_prior_scale_ * trend_prior_scale_);
	penalty(col++) = trend_penalty;
	penalty(col++) = trend_penalty;
	for (std::size_t i = 0; i < changepoints_t_.size(); ++i) {
		penalty(col++) = noise_var / (changepoint_prior_scale_ * changepoint_prior_scale_);
	}
	const auto blocks = fourierBlocks();
	for (const auto &block : blocks) {
		for (int k = 0; k < 2 * block.order; ++k) {
			penalty(col++) = noise_var / (seasonality_prior_scale_ * seasonality_prior_scale_);
		}
	}
	while (col < X.cols()) {
		penalty(col++) = noise_var / (regressor_prior_scale_ * regressor_prior_scale_);
	}

	Eigen::MatrixXd normal = X.transpose() * X;
	normal.diagonal() += penalty;
	const Eigen::LDLT<Eigen::MatrixXd> ldlt(normal);
	if (ldlt.info() != Eigen::Success) {
		throw std::runtime_error("AdditiveRegression: normal equations could not be factorised.");
	}
	Eigen::VectorXd theta = ldlt.solve(X.transpose() * y);
	if (!theta.allFinite()) {
		throw std::runtime_error("AdditiveRegression: fit produced non-finite coefficients.");
	}
	return theta;
}

void AdditiveRegression::fit(const core::TimeSeries &history, const core::RegressorSet &regressors) {
	if (history.isEmpty()) {
		throw std::invalid_argument("Time series cannot be empty for fitting.");
	}
	const auto &timestamps = history.getTimestamps();
	const auto &values = history.getValues();
	const std::size_t n = values.size();

	is_fitted_ = false;
	t0_seconds_ = epochSeconds(timestamps.front());
	const double span = epochSeconds(timestamps.back()) - t0_seconds_;
	t_scale_seconds_ = span > 0.0 ? span : kSecondsPerDay;

	double max_abs = 0.0;
	for (double v : values) {
		if (!std::isfinite(v)) {
			throw std::invalid_argument("Time series values must be finite.");
		}
		max_abs = std::max(max_abs, std::abs(v));
	}
	y_scale_ = max_abs > 0.0 ? max_abs : 1.0;

	// Changepoints sit on observed timestamps inside the first part of the history.
	changepoints_t_.clear();
	const auto hist_size = static_cast<long>(std::floor(static_cast<double>(n) * changepoint_range_));
	const long usable = std::min<long>(n_changepoints_, hist_size - 1);
	if (usable > 0) {
		for (long i = 1; i <= usable; ++i) {
			const auto idx = static_cast<std::size_t>(
			    std::lround(static_cast<double>(i) * static_cast<double>(hist_size - 1) / static_cast<double>(usable)));
			changepoints_t_.push_back(scaledTime(timestamps[idx]));
		}
	}

	regressor_scaling_.clear();
	for (const auto &entry : regressors.entries()) {
		if (!std::isfinite(entry.second)) {
			throw std::invalid_argument("Regressor '" + entry.first + "' must be finite.");
		}
		const auto column = regressors.broadcast(entry.first, n);
		RegressorScaling scaling;
		scaling.name = entry.first;
		scaling.standardize = !isBinary(column);
		scaling.mean = utils::Statistics::mean(column);
		double sd = utils::Statistics::stddev(column);
		if (sd == 0.0) {
			sd = scaling.mean;
		}
		if (sd == 0.0) {
			sd = 1.0;
		}
		scaling.scale = sd;
		regressor_scaling_.push_back(scaling);
	}
	const auto regressor_values = regressorValues(regressors);

	Eigen::MatrixXd X(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(featureCount()));
	Eigen::VectorXd y(static_cast<Eigen::Index>(n));
	Eigen::RowVectorXd row(X.cols());
	for (std::size_t i = 0; i < n; ++i) {
		fillRow(row, timestamps[i], regressor_values);
		X.row(static_cast<Eigen::Index>(i)) = row;
		y(static_cast<Eigen::Index>(i)) = values[i] / y_scale_;
	}

	// First pass with a nominal noise level, second with the estimate floored at that level.
	constexpr double kInitialNoiseVar = 1e-2;
	Eigen::VectorXd theta = solve(X, y, kInitialNoiseVar);
	const double noise_var = std::max(kInitialNoiseVar, (y - X * theta).squaredNorm() / static_cast<double>(n));
	theta_ = solve(X, y, noise_var);
	sigma_ = std::sqrt((y - X * theta_).squaredNorm() / static_cast<double>(n));

	mean_abs_delta_ = 0.0;
	if (!changepoints_t_.empty()) {
		mean_abs_delta_ = theta_.segment(2, static_cast<Eigen::Index>(changepoints_t_.size())).cwiseAbs().mean();
	}

	is_fitted_ = true;
	SEACAST_INFO("AdditiveRegression fitted with {} data points, {} changepoints, {} regressors. Sigma = {}.", n,
	             changepoints_t_.size(), regressor_scaling_.size(), noiseScale());
}

core::Forecast AdditiveRegression::predict(const std::vector<core::TimePoint> &timestamps,
                                           const core::RegressorSet &regressors) const {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	const auto regressor_values = regressorValues(regressors);

	core::Forecast forecast;
	if (timestamps.empty()) {
		return forecast;
	}
	forecast.reserve(timestamps.size());

	// Future slope changes arrive at the historical changepoint rate (per unit of scaled time).
	const double rate = static_cast<double>(changepoints_t_.size());
	const double delta_var = 2.0 * mean_abs_delta_ * mean_abs_delta_;

	Eigen::RowVectorXd row(static_cast<Eigen::Index>(featureCount()));
	for (const auto &tp : timestamps) {
		fillRow(row, tp, regressor_values);
		const double yhat = row.dot(theta_);
		double variance = sigma_ * sigma_;
		const double ahead = scaledTime(tp) - 1.0;
		if (ahead > 0.0) {
			variance += rate * delta_var * ahead * ahead * ahead / 3.0;
		}
		const double half_width = z_ * std::sqrt(variance);
		forecast.push_back(tp, yhat * y_scale_, (yhat - half_width) * y_scale_, (yhat + half_width) * y_scale_);
	}

	SEACAST_DEBUG("AdditiveRegression predicted {} points.", forecast.size());
	return forecast;
}

std::vector<core::TimePoint> AdditiveRegression::changepoints() const {
	std::vector<core::TimePoint> result;
	result.reserve(changepoints_t_.size());
	for (double s : changepoints_t_) {
		const auto seconds = std::chrono::duration<double>(t0_seconds_ + s * t_scale_seconds_);
		result.push_back(core::TimePoint(std::chrono::duration_cast<core::TimePoint::duration>(seconds)));
	}
	return result;
}

std::vector<std::string> AdditiveRegression::regressorNames() const {
	std::vector<std::string> names;
	names.reserve(regressor_scaling_.size());
	for (const auto &scaling : regressor_scaling_) {
		names.push_back(scaling.name);
	}
	return names;
}

// --- Builder Implementation ---

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withSeasonality(const core::SeasonalityConfig &seasonality) {
	settings_.seasonality = seasonality;
	return *this;
}

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withYearly(bool enabled) {
	settings_.seasonality.yearly = enabled;
	return *this;
}

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withWeekly(bool enabled) {
	settings_.seasonality.weekly = enabled;
	return *this;
}

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withDaily(bool enabled) {
	settings_.seasonality.daily = enabled;
	return *this;
}

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withIntervalWidth(double width) {
	settings_.interval_width = width;
	return *this;
}

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withChangepoints(int count) {
	settings_.n_changepoints = count;
	return *this;
}

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withChangepointRange(double range) {
	settings_.changepoint_range = range;
	return *this;
}

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withChangepointPriorScale(double scale) {
	settings_.changepoint_prior_scale = scale;
	return *this;
}

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withSeasonalityPriorScale(double scale) {
	settings_.seasonality_prior_scale = scale;
	return *this;
}

AdditiveRegressionBuilder &AdditiveRegressionBuilder::withRegressorPriorScale(double scale) {
	settings_.regressor_prior_scale = scale;
	return *this;
}

std::unique_ptr<AdditiveRegression> AdditiveRegressionBuilder::build() {
	SEACAST_DEBUG("Building AdditiveRegression model (yearly={}, weekly={}, daily={}, width={}).",
	              settings_.seasonality.yearly, settings_.seasonality.weekly, settings_.seasonality.daily,
	              settings_.interval_width);
	return std::unique_ptr<AdditiveRegression>(new AdditiveRegression(settings_));
}

ForecasterFactory makeAdditiveRegressionFactory(double interval_width) {
	return [interval_width](const core::SeasonalityConfig &seasonality) -> std::unique_ptr<IForecaster> {
		return AdditiveRegressionBuilder().withSeasonality(seasonality).withIntervalWidth(interval_width).build();
	};
}

} // namespace seacast::models
