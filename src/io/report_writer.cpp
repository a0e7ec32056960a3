#include "seacast/io/report_writer.hpp"

#include "seacast/errors.hpp"
#include "seacast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>

namespace seacast::io {

namespace {

bool allMidnight(const std::vector<core::TimePoint> &timestamps) {
	return std::all_of(timestamps.begin(), timestamps.end(),
	                   [](const core::TimePoint &tp) { return core::isMidnight(tp); });
}

// JSON has no NaN or infinity; such values are written as null.
Json::Value number(double value) {
	return std::isfinite(value) ? Json::Value(value) : Json::Value(Json::nullValue);
}

Json::Value optionalNumber(const std::optional<double> &value) {
	return value ? number(*value) : Json::Value(Json::nullValue);
}

Json::Value stringArray(const std::vector<std::string> &items) {
	Json::Value array(Json::arrayValue);
	for (const auto &item : items) {
		array.append(item);
	}
	return array;
}

Json::Value forecastRows(const core::Forecast &forecast) {
	const bool date_only = allMidnight(forecast.timestamps);
	Json::Value rows(Json::arrayValue);
	for (std::size_t i = 0; i < forecast.size(); ++i) {
		Json::Value row(Json::objectValue);
		row["ds"] = core::formatTimestamp(forecast.timestamps[i], date_only);
		row["yhat"] = number(forecast.point[i]);
		row["yhat_lower"] = number(forecast.lower[i]);
		row["yhat_upper"] = number(forecast.upper[i]);
		rows.append(row);
	}
	return rows;
}

Json::Value seriesRows(const core::TimeSeries &series) {
	const bool date_only = allMidnight(series.getTimestamps());
	Json::Value rows(Json::arrayValue);
	for (std::size_t i = 0; i < series.size(); ++i) {
		Json::Value row(Json::objectValue);
		row["ds"] = core::formatTimestamp(series.getTimestamps()[i], date_only);
		row["y"] = number(series.getValues()[i]);
		rows.append(row);
	}
	return rows;
}

Json::Value diagnosticsObject(const core::Diagnostics &diagnostics, bool used_positional_fallback) {
	Json::Value node(Json::objectValue);
	node["n_observations"] = static_cast<Json::UInt64>(diagnostics.n_observations);
	node["test_points"] = static_cast<Json::UInt64>(diagnostics.test_points);
	node["inferred_freq"] =
	    diagnostics.inferred_freq ? Json::Value(*diagnostics.inferred_freq) : Json::Value(Json::nullValue);
	node["step_freq"] = diagnostics.step_freq;
	node["date_col"] = diagnostics.date_column;
	node["target_col"] = diagnostics.target_column;
	node["has_regressors"] = diagnostics.has_regressors;
	node["regressor_names"] = stringArray(diagnostics.regressor_names);
	node["future_periods"] = static_cast<Json::UInt64>(diagnostics.future_periods);
	Json::Value seasonality(Json::objectValue);
	seasonality["yearly"] = diagnostics.seasonality.yearly;
	seasonality["weekly"] = diagnostics.seasonality.weekly;
	seasonality["daily"] = diagnostics.seasonality.daily;
	node["seasonality"] = seasonality;
	node["used_positional_fallback"] = used_positional_fallback;
	return node;
}

} // namespace

Json::Value toJson(const pipeline::ForecastReport &report) {
	Json::Value root(Json::objectValue);
	root["mae"] = number(report.mae());
	root["rmse"] = number(report.rmse());
	root["forecast_csv"] =
	    report.forecastCsvPath() ? Json::Value(*report.forecastCsvPath()) : Json::Value(Json::nullValue);
	root["forecast_tail"] = forecastRows(report.forecastTail());
	root["historical_series"] = seriesRows(report.history());
	root["diagnostics"] = diagnosticsObject(report.diagnostics(), report.evaluation().used_positional_fallback);

	const auto &evaluation = report.evaluation();
	Json::Value eval(Json::objectValue);
	eval["train_size"] = static_cast<Json::UInt64>(evaluation.train_size);
	eval["test_size"] = static_cast<Json::UInt64>(evaluation.test_size);
	eval["aligned_points"] = static_cast<Json::UInt64>(evaluation.aligned.size());
	eval["mse"] = number(evaluation.metrics.mse);
	eval["mape"] = optionalNumber(evaluation.metrics.mape);
	eval["coverage"] = optionalNumber(evaluation.metrics.coverage);
	root["evaluation"] = eval;

	Json::Value regressors(Json::objectValue);
	for (const auto &entry : report.regressors().entries()) {
		regressors[entry.first] = number(entry.second);
	}
	root["regressors"] = regressors;

	Json::Value profile(Json::arrayValue);
	if (report.depthProfile()) {
		for (const auto &sample : report.depthProfile()->samples) {
			Json::Value row(Json::objectValue);
			row["depth"] = optionalNumber(sample.depth);
			row["salinity"] = optionalNumber(sample.salinity);
			row["ph"] = optionalNumber(sample.ph);
			row["chlorophyl"] = optionalNumber(sample.chlorophyl);
			profile.append(row);
		}
	}
	root["depth_profile"] = profile;
	return root;
}

std::string toJsonString(const pipeline::ForecastReport &report) {
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "  ";
	return Json::writeString(builder, toJson(report));
}

void writeReportJson(const std::string &path, const pipeline::ForecastReport &report) {
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out) {
		throw OutputWriteError("Cannot open report output", {{"path", path}});
	}
	out << toJsonString(report) << '\n';
	out.flush();
	if (!out) {
		throw OutputWriteError("Failed writing report output", {{"path", path}});
	}
	SEACAST_INFO("Wrote JSON report to {}.", path);
}

} // namespace seacast::io
