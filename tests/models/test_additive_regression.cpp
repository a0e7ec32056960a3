#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "seacast/core/frequency.hpp"
#include "seacast/models/additive_regression.hpp"
#include "seacast/utils/metrics.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using seacast::core::RegressorSet;
using seacast::models::AdditiveRegressionBuilder;

TEST_CASE("AdditiveRegression builder validates settings", "[models][additive][builder]") {
	REQUIRE_THROWS_AS(AdditiveRegressionBuilder().withIntervalWidth(0.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(AdditiveRegressionBuilder().withIntervalWidth(1.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(AdditiveRegressionBuilder().withChangepoints(-1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(AdditiveRegressionBuilder().withChangepointRange(1.5).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(AdditiveRegressionBuilder().withSeasonalityPriorScale(0.0).build(), std::invalid_argument);

	auto model = AdditiveRegressionBuilder().withYearly(true).withWeekly(true).withIntervalWidth(0.9).build();
	REQUIRE(model->getName() == "AdditiveRegression");
	REQUIRE_FALSE(model->isFitted());
	REQUIRE(model->seasonality().yearly);
	REQUIRE(model->seasonality().weekly);
	REQUIRE_FALSE(model->seasonality().daily);
	REQUIRE(model->intervalWidth() == Catch::Approx(0.9));
}

TEST_CASE("AdditiveRegression predict requires a fitted model", "[models][additive]") {
	auto model = AdditiveRegressionBuilder().build();
	REQUIRE_THROWS_AS(model->predict(tests::helpers::makeTimestamps(3), {}), std::runtime_error);

	auto empty = tests::helpers::makeDailySeries({});
	REQUIRE_THROWS_AS(model->fit(empty, {}), std::invalid_argument);
}

TEST_CASE("AdditiveRegression follows a linear trend", "[models][additive][trend]") {
	const auto series = tests::helpers::makeDailySeries(tests::helpers::ramp(120));
	auto model = AdditiveRegressionBuilder().build();
	model->fit(series, {});
	REQUIRE(model->isFitted());

	const auto in_sample = model->predict(series.getTimestamps(), {});
	REQUIRE(in_sample.size() == series.size());
	const double mae = seacast::utils::Metrics::mae(series.getValues(), in_sample.point);
	REQUIRE(mae < 0.5);

	const auto future = seacast::core::Frequency::daily().following(series.getTimestamps().back(), 10);
	const auto forecast = model->predict(future, {});
	REQUIRE(forecast.size() == 10);
	// Slope 0.5 per day continues past the history.
	REQUIRE(forecast.point.back() == Catch::Approx(series.getValues().back() + 5.0).margin(1.5));
}

TEST_CASE("AdditiveRegression intervals bracket the point forecast", "[models][additive][intervals]") {
	const auto series = tests::helpers::makeDailySeries(tests::helpers::sinusoid(400));
	auto model = AdditiveRegressionBuilder().withYearly(true).withWeekly(true).build();
	model->fit(series, {});

	const auto future = seacast::core::Frequency::daily().following(series.getTimestamps().back(), 60);
	const auto forecast = model->predict(future, {});
	REQUIRE(forecast.size() == 60);
	for (std::size_t i = 0; i < forecast.size(); ++i) {
		REQUIRE(std::isfinite(forecast.point[i]));
		REQUIRE(forecast.lower[i] <= forecast.point[i]);
		REQUIRE(forecast.point[i] <= forecast.upper[i]);
	}

	// Trend uncertainty grows with the distance from the history.
	const double first_width = forecast.upper.front() - forecast.lower.front();
	const double last_width = forecast.upper.back() - forecast.lower.back();
	REQUIRE(last_width >= first_width);

	const auto fitted = model->predict(series.getTimestamps(), {});
	REQUIRE(seacast::utils::Metrics::mae(series.getValues(), fitted.point) < 0.5);
}

TEST_CASE("AdditiveRegression places changepoints in the early history", "[models][additive][changepoints]") {
	const auto series = tests::helpers::makeDailySeries(tests::helpers::ramp(100));
	auto model = AdditiveRegressionBuilder().withChangepoints(10).build();
	model->fit(series, {});

	const auto changepoints = model->changepoints();
	REQUIRE(changepoints.size() == 10);
	const auto limit = series.getTimestamps()[79];
	for (const auto &tp : changepoints) {
		REQUIRE(tp > series.getTimestamps().front());
		REQUIRE(tp <= limit);
	}

	SECTION("No changepoints on very short histories") {
		auto short_model = AdditiveRegressionBuilder().build();
		short_model->fit(tests::helpers::makeDailySeries({1.0, 2.0}), {});
		REQUIRE(short_model->changepoints().empty());
	}
}

TEST_CASE("AdditiveRegression keeps the level of very short histories", "[models][additive][edge]") {
	for (std::size_t n = 1; n <= 5; ++n) {
		CAPTURE(n);
		const auto series = tests::helpers::makeDailySeries(std::vector<double>(n, 10.0));
		auto model = AdditiveRegressionBuilder().withWeekly(true).build();
		model->fit(series, {});

		const auto future = seacast::core::Frequency::daily().following(series.back(), 3);
		const auto forecast = model->predict(future, {});
		REQUIRE(forecast.size() == 3);
		for (std::size_t i = 0; i < forecast.size(); ++i) {
			REQUIRE(forecast.point[i] == Catch::Approx(10.0).margin(0.01));
			REQUIRE(forecast.lower[i] <= forecast.point[i]);
			REQUIRE(forecast.point[i] <= forecast.upper[i]);
		}
	}

	SECTION("A short ramp continues its slope") {
		const auto series = tests::helpers::makeDailySeries({10.0, 11.0, 12.0});
		auto model = AdditiveRegressionBuilder().withWeekly(true).build();
		model->fit(series, {});
		const auto forecast = model->predict(seacast::core::Frequency::daily().following(series.back(), 2), {});
		REQUIRE(forecast.point[0] == Catch::Approx(13.0).margin(0.05));
		REQUIRE(forecast.point[1] == Catch::Approx(14.0).margin(0.05));
	}
}

TEST_CASE("AdditiveRegression carries constant regressors", "[models][additive][regressors]") {
	const auto series = tests::helpers::makeDailySeries(tests::helpers::sinusoid(60));
	RegressorSet regressors;
	regressors.set("mean_salinity", 32.0);
	regressors.set("mean_ph", 8.1);

	auto model = AdditiveRegressionBuilder().withWeekly(true).build();
	model->fit(series, regressors);
	REQUIRE(model->regressorNames() == std::vector<std::string>{"mean_salinity", "mean_ph"});

	const auto future = tests::helpers::makeTimestamps(5, tests::helpers::date(2020, 3, 1));
	const auto forecast = model->predict(future, regressors);
	REQUIRE(forecast.size() == 5);

	SECTION("Predicting without the fitted regressors fails") {
		REQUIRE_THROWS_AS(model->predict(future, {}), std::invalid_argument);

		RegressorSet renamed;
		renamed.set("mean_salinity", 32.0);
		renamed.set("mean_chlorophyl", 0.3);
		REQUIRE_THROWS_AS(model->predict(future, renamed), std::invalid_argument);
	}
}

TEST_CASE("Factory builds models with the requested seasonality", "[models][additive][factory]") {
	const auto factory = seacast::models::makeAdditiveRegressionFactory(0.95);
	seacast::core::SeasonalityConfig seasonality;
	seasonality.yearly = true;
	auto model = factory(seasonality);
	REQUIRE(model);
	auto *typed = dynamic_cast<seacast::models::AdditiveRegression *>(model.get());
	REQUIRE(typed != nullptr);
	REQUIRE(typed->seasonality() == seasonality);
	REQUIRE(typed->intervalWidth() == Catch::Approx(0.95));
}
