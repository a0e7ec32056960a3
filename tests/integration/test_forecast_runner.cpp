#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/file_helpers.hpp"
#include "common/stub_forecasters.hpp"
#include "common/time_series_helpers.hpp"
#include "seacast/errors.hpp"
#include "seacast/pipeline/forecast_runner.hpp"

#include <json/json.h>

#include <atomic>
#include <cmath>
#include <sstream>
#include <string>

using namespace seacast;

namespace {

std::string dailyCsv(const std::vector<double> &values, const std::string &value_column = "sst") {
	std::ostringstream out;
	out << "timestamp," << value_column << "\n";
	const auto timestamps = tests::helpers::makeTimestamps(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		out << core::formatTimestamp(timestamps[i], true) << "," << values[i] << "\n";
	}
	return out.str();
}

std::size_t countLines(const std::string &text) {
	std::size_t lines = 0;
	for (char c : text) {
		if (c == '\n') {
			++lines;
		}
	}
	return lines;
}

} // namespace

TEST_CASE("Runner forecasts a year of daily data end to end", "[integration][runner]") {
	tests::helpers::TempDir dir;
	pipeline::ForecastRequest request;
	request.input_path = dir.write("sst.csv", dailyCsv(tests::helpers::sinusoid(400)));

	pipeline::ForecastConfig config;
	config.periods = 30;
	config.output_path = dir.file("forecast.csv");
	config.report_path = dir.file("report.json");

	const pipeline::ForecastRunner runner(config);
	const auto report = runner.run(request);

	REQUIRE(report.forecastTail().size() == 30);
	REQUIRE(report.diagnostics().inferred_freq == std::optional<std::string>("D"));
	REQUIRE(report.diagnostics().future_periods == 30);
	REQUIRE(report.diagnostics().n_observations == 400);
	REQUIRE(report.diagnostics().test_points == 80);
	REQUIRE(report.diagnostics().date_column == "timestamp");
	REQUIRE(report.diagnostics().target_column == "sst");
	REQUIRE(report.diagnostics().seasonality.yearly);
	REQUIRE_FALSE(report.diagnostics().has_regressors);
	REQUIRE(std::isfinite(report.mae()));
	REQUIRE(std::isfinite(report.rmse()));
	REQUIRE(report.rmse() >= report.mae());
	REQUIRE(report.forecastTail().timestamps.front() == tests::helpers::date(2021, 2, 4));

	const auto csv = tests::helpers::readFile(*config.output_path);
	REQUIRE(countLines(csv) == 31);
	REQUIRE(csv.rfind("ds,yhat,yhat_lower,yhat_upper\n2021-02-04,", 0) == 0);

	Json::Value json;
	Json::CharReaderBuilder builder;
	std::string errors;
	std::istringstream in(tests::helpers::readFile(*config.report_path));
	REQUIRE(Json::parseFromStream(builder, in, &json, &errors));
	REQUIRE(json["forecast_tail"].size() == 30);
	REQUIRE(json["historical_series"].size() == 400);
	REQUIRE(json["forecast_csv"].asString() == *config.output_path);
}

TEST_CASE("Runner forecasts a three point series", "[integration][runner][edge]") {
	pipeline::ForecastConfig config;
	config.periods = 4;
	config.output_path.reset();

	const auto table = tests::helpers::makeDailyTable({10.0, 11.0, 12.0}, "sst");
	const auto report = pipeline::ForecastRunner(config).run(table, std::nullopt);

	REQUIRE(report.diagnostics().n_observations == 3);
	REQUIRE(report.mae() == Catch::Approx(0.0).margin(0.05));
	REQUIRE(report.forecastTail().size() == 4);
	for (std::size_t i = 0; i < report.forecastTail().size(); ++i) {
		const auto &tail = report.forecastTail();
		const auto day = core::dayIndex(tail.timestamps[i]) - core::dayIndex(tests::helpers::date(2020, 1, 1));
		REQUIRE(tail.point[i] == Catch::Approx(10.0 + static_cast<double>(day)).margin(0.05));
		REQUIRE(tail.lower[i] <= tail.point[i]);
		REQUIRE(tail.point[i] <= tail.upper[i]);
	}
	REQUIRE(report.forecastTail().timestamps.front() == tests::helpers::date(2020, 1, 4));
}

TEST_CASE("Runner derives regressors from the depth profile", "[integration][runner][regressors]") {
	tests::helpers::TempDir dir;
	pipeline::ForecastRequest request;
	request.input_path = dir.write("sst.csv", dailyCsv(tests::helpers::sinusoid(60)));
	request.regressor_path = dir.write("profile.csv", "Depth,Salinity,pH,Chlorophyl\n0,30,8.0,0.1\n10,34,8.2,0.3\n");

	pipeline::ForecastConfig config;
	config.periods = 7;
	config.output_path.reset();

	const auto report = pipeline::ForecastRunner(config).run(request);
	REQUIRE(report.diagnostics().has_regressors);
	REQUIRE(report.diagnostics().regressor_names ==
	        std::vector<std::string>{"mean_salinity", "mean_ph", "mean_chlorophyl"});
	REQUIRE(report.regressors().at("mean_salinity") == Catch::Approx(32.0));
	REQUIRE(report.depthProfile()->samples.size() == 2);
	REQUIRE_FALSE(report.diagnostics().seasonality.yearly);
	REQUIRE(report.diagnostics().seasonality.weekly);
	REQUIRE(report.forecastTail().size() == 7);
	REQUIRE_FALSE(report.forecastCsvPath().has_value());

	SECTION("An unusable profile is ignored") {
		request.regressor_path = dir.write("broken.csv", "Salinity\n30\n");
		const auto plain = pipeline::ForecastRunner(config).run(request);
		REQUIRE_FALSE(plain.diagnostics().has_regressors);
		REQUIRE(plain.forecastTail().size() == 7);
	}
}

TEST_CASE("Runner works on tables in memory", "[integration][runner]") {
	pipeline::ForecastConfig config;
	config.periods = 5;
	config.output_path.reset();

	const auto table = tests::helpers::makeDailyTable(tests::helpers::ramp(30), "value");
	const auto profile = tests::helpers::makeTable({{"Depth", {"0", "5"}}, {"Salinity", {"31", "33"}}});
	const pipeline::ForecastRunner runner(config, tests::helpers::meanFactory());
	const auto report = runner.run(table, profile);

	REQUIRE(report.diagnostics().target_column == "value");
	REQUIRE(report.regressors().at("mean_salinity") == Catch::Approx(32.0));
	REQUIRE(report.forecastTail().size() == 5);
	REQUIRE(report.history().size() == 30);
}

TEST_CASE("Runner reuses fitted models across requests", "[integration][runner][registry]") {
	tests::helpers::TempDir dir;
	pipeline::ModelRegistry registry;
	std::atomic<int> fits{0};

	pipeline::ForecastConfig config;
	config.periods = 3;
	config.output_path.reset();
	const pipeline::ForecastRunner runner(config, tests::helpers::meanFactory(0.0, &fits), &registry);

	pipeline::ForecastRequest request;
	request.input_path = dir.write("a.csv", dailyCsv(tests::helpers::ramp(20)));

	runner.run(request);
	REQUIRE(fits == 2);
	REQUIRE(registry.size() == 2);

	runner.run(request);
	REQUIRE(fits == 2);

	request.retrain = true;
	runner.run(request);
	REQUIRE(fits == 4);
	REQUIRE(registry.size() == 2);

	request.retrain = false;
	request.input_path = dir.write("b.csv", dailyCsv(tests::helpers::ramp(21)));
	runner.run(request);
	REQUIRE(fits == 6);
	REQUIRE(registry.size() == 4);
}

TEST_CASE("Runner fingerprints content and model parameters", "[integration][runner][registry]") {
	tests::helpers::TempDir dir;
	pipeline::ForecastRequest request;
	request.input_path = dir.write("a.csv", dailyCsv(tests::helpers::ramp(20)));
	const pipeline::ResolvedSchema schema{"timestamp", "sst"};

	pipeline::ForecastConfig config;
	const pipeline::ForecastRunner runner(config);
	const auto base = runner.fingerprint(request, schema);
	REQUIRE(base.size() == 16);

	pipeline::ForecastRequest copy = request;
	copy.input_path = dir.write("copy.csv", dailyCsv(tests::helpers::ramp(20)));
	REQUIRE(runner.fingerprint(copy, schema) == base);

	config.periods = 90;
	REQUIRE(pipeline::ForecastRunner(config).fingerprint(request, schema) == base);

	config.interval_width = 0.95;
	REQUIRE(pipeline::ForecastRunner(config).fingerprint(request, schema) != base);

	request.regressor_path = dir.file("missing.csv");
	REQUIRE(runner.fingerprint(request, schema) != base);

	request.input_path = dir.file("missing.csv");
	REQUIRE_THROWS_AS(runner.fingerprint(request, schema), InputReadError);
}

TEST_CASE("Runner surfaces fatal input problems", "[integration][runner][errors]") {
	tests::helpers::TempDir dir;
	pipeline::ForecastConfig config;
	config.output_path.reset();
	const pipeline::ForecastRunner runner(config, tests::helpers::meanFactory());

	pipeline::ForecastRequest request;
	request.input_path = dir.file("missing.csv");
	REQUIRE_THROWS_AS(runner.run(request), InputReadError);

	request.input_path = dir.write("words.csv", "alpha,beta\nx,y\n");
	REQUIRE_THROWS_AS(runner.run(request), SchemaInferenceError);

	request.input_path = dir.write("empty.csv", "timestamp,sst\nnot a date,1\n");
	REQUIRE_THROWS_AS(runner.run(request), DataPreparationError);

	request.input_path = dir.write("ok.csv", dailyCsv({1.0, 2.0, 3.0}));
	request.target_column = std::string("missing");
	REQUIRE_THROWS_AS(runner.run(request), DataPreparationError);

	config.output_path = dir.file("no/such/dir/out.csv");
	request.target_column.reset();
	REQUIRE_THROWS_AS(pipeline::ForecastRunner(config, tests::helpers::meanFactory()).run(request), OutputWriteError);

	config.periods = -1;
	REQUIRE_THROWS_AS(pipeline::ForecastRunner(config), std::invalid_argument);

	pipeline::ForecastConfig quiet;
	quiet.output_path.reset();
	REQUIRE_THROWS_AS(pipeline::ForecastRunner(quiet, tests::helpers::failingFactory()).run(request), ModelFitFailure);
}
