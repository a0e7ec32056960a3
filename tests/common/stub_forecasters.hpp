#pragma once

#include "seacast/models/iforecaster.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace tests::helpers {

/// Predicts the mean of its training values (plus an offset) with a +/-1 interval.
class MeanForecaster final : public seacast::models::IForecaster {
public:
	explicit MeanForecaster(double offset = 0.0, std::atomic<int> *fit_count = nullptr)
	    : offset_(offset), fit_count_(fit_count) {
	}

	void fit(const seacast::core::TimeSeries &history, const seacast::core::RegressorSet &) override {
		if (history.isEmpty()) {
			throw std::invalid_argument("empty history");
		}
		double sum = 0.0;
		for (double v : history.getValues()) {
			sum += v;
		}
		mean_ = sum / static_cast<double>(history.size());
		train_size_ = history.size();
		fitted_ = true;
		if (fit_count_ != nullptr) {
			++*fit_count_;
		}
	}

	seacast::core::Forecast predict(const std::vector<seacast::core::TimePoint> &timestamps,
	                                const seacast::core::RegressorSet &) const override {
		if (!fitted_) {
			throw std::runtime_error("not fitted");
		}
		seacast::core::Forecast forecast;
		for (const auto &tp : timestamps) {
			const double value = mean_ + offset_;
			forecast.push_back(tp, value, value - 1.0, value + 1.0);
		}
		return forecast;
	}

	bool isFitted() const override {
		return fitted_;
	}

	std::string getName() const override {
		return "Mean";
	}

	std::size_t trainSize() const {
		return train_size_;
	}

private:
	double offset_;
	std::atomic<int> *fit_count_;
	double mean_ = 0.0;
	std::size_t train_size_ = 0;
	bool fitted_ = false;
};

/// Fails on every fit.
class FailingForecaster final : public seacast::models::IForecaster {
public:
	void fit(const seacast::core::TimeSeries &, const seacast::core::RegressorSet &) override {
		throw std::runtime_error("singular design matrix");
	}

	seacast::core::Forecast predict(const std::vector<seacast::core::TimePoint> &,
	                                const seacast::core::RegressorSet &) const override {
		throw std::runtime_error("not fitted");
	}

	bool isFitted() const override {
		return false;
	}

	std::string getName() const override {
		return "Failing";
	}
};

inline seacast::models::ForecasterFactory meanFactory(double offset = 0.0, std::atomic<int> *fit_count = nullptr) {
	return [offset, fit_count](const seacast::core::SeasonalityConfig &) -> std::unique_ptr<seacast::models::IForecaster> {
		return std::make_unique<MeanForecaster>(offset, fit_count);
	};
}

inline seacast::models::ForecasterFactory failingFactory() {
	return [](const seacast::core::SeasonalityConfig &) -> std::unique_ptr<seacast::models::IForecaster> {
		return std::make_unique<FailingForecaster>();
	};
}

} // namespace tests::helpers
