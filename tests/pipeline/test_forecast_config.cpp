#include <catch2/catch_test_macros.hpp>

#include "seacast/pipeline/forecast_config.hpp"

#include <stdexcept>

using seacast::pipeline::ForecastConfig;

TEST_CASE("Forecast config defaults are valid", "[pipeline][config]") {
	const ForecastConfig config;
	REQUIRE(config.periods == 30);
	REQUIRE(config.test_fraction == 0.2);
	REQUIRE(config.interval_width == 0.8);
	REQUIRE(config.yearly_threshold_days == 270);
	REQUIRE(config.output_path == std::optional<std::string>("forecast_output.csv"));
	REQUIRE_FALSE(config.report_path.has_value());
	REQUIRE_FALSE(config.read_options.delimiter.has_value());
	REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Forecast config rejects out-of-range values", "[pipeline][config]") {
	ForecastConfig config;

	SECTION("negative periods") {
		config.periods = -1;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("test fraction") {
		config.test_fraction = 0.0;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
		config.test_fraction = 1.0;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("interval width") {
		config.interval_width = 1.5;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("yearly threshold") {
		config.yearly_threshold_days = -5;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("empty paths") {
		config.output_path = std::string();
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
		config.output_path.reset();
		REQUIRE_NOTHROW(config.validate());
		config.report_path = std::string();
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
}
