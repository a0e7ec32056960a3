#include "seacast/pipeline/frame_preparer.hpp"

#include "seacast/core/timestamp.hpp"
#include "seacast/errors.hpp"
#include "seacast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace seacast::pipeline {

namespace {

struct Row {
	core::TimePoint ds;
	double y;
};

// Sorts, averages duplicates and infers the cadence.
core::TimeSeries canonicalize(std::vector<Row> rows, std::string label, std::size_t rows_read) {
	std::stable_sort(rows.begin(), rows.end(), [](const Row &a, const Row &b) { return a.ds < b.ds; });

	std::vector<core::TimePoint> timestamps;
	std::vector<double> values;
	timestamps.reserve(rows.size());
	values.reserve(rows.size());
	std::size_t collapsed = 0;
	for (std::size_t i = 0; i < rows.size();) {
		std::size_t j = i;
		double sum = 0.0;
		while (j < rows.size() && rows[j].ds == rows[i].ds) {
			sum += rows[j].y;
			++j;
		}
		const auto count = j - i;
		timestamps.push_back(rows[i].ds);
		values.push_back(count == 1 ? rows[i].y : sum / static_cast<double>(count));
		collapsed += count - 1;
		i = j;
	}

	core::TimeSeries series(std::move(timestamps), std::move(values), std::move(label));
	series.setFrequencyFromTimestamps();
	series.setMetadata({{"rows_read", std::to_string(rows_read)},
	                    {"rows_kept", std::to_string(series.size())},
	                    {"duplicates_collapsed", std::to_string(collapsed)}});
	return series;
}

} // namespace

core::TimeSeries FramePreparer::prepare(const core::RawTable &table, const ResolvedSchema &schema) {
	const ForecastError::Context context = {{"date_column", schema.date_column},
	                                        {"target_column", schema.target_column},
	                                        {"rows_read", std::to_string(table.rowCount())}};
	if (!table.hasColumn(schema.date_column)) {
		throw DataPreparationError("Date column not found in input table", context);
	}
	if (!table.hasColumn(schema.target_column)) {
		throw DataPreparationError("Target column not found in input table", context);
	}

	const auto &ds_cells = table.column(schema.date_column).cells;
	const auto &y_cells = table.column(schema.target_column).cells;

	std::vector<Row> rows;
	rows.reserve(table.rowCount());
	for (std::size_t i = 0; i < table.rowCount(); ++i) {
		const auto ds = core::RawTable::isNullCell(ds_cells[i]) ? std::nullopt : core::parseTimestamp(ds_cells[i]);
		const auto y = core::RawTable::parseNumber(y_cells[i]);
		if (!ds || !y || !std::isfinite(*y)) {
			continue;
		}
		rows.push_back(Row{*ds, *y});
	}

	if (rows.empty()) {
		auto failure = context;
		failure["rows_kept"] = "0";
		throw DataPreparationError("No usable rows after cleaning", failure);
	}

	const auto dropped = table.rowCount() - rows.size();
	auto series = canonicalize(std::move(rows), schema.target_column, table.rowCount());
	SEACAST_INFO("Prepared {} observations from {} rows ({} dropped, frequency {}).", series.size(), table.rowCount(),
	             dropped, series.frequency() ? series.frequency()->code() : std::string("unknown"));
	return series;
}

core::TimeSeries FramePreparer::prepare(const core::TimeSeries &series) {
	std::vector<Row> rows;
	rows.reserve(series.size());
	for (std::size_t i = 0; i < series.size(); ++i) {
		rows.push_back(Row{series.getTimestamps()[i], series.getValues()[i]});
	}
	if (rows.empty()) {
		throw DataPreparationError("No usable rows after cleaning", {{"target_column", series.label()}});
	}
	auto metadata = series.metadata();
	auto result = canonicalize(std::move(rows), series.label(), series.size());
	if (!metadata.empty()) {
		result.setMetadata(std::move(metadata));
	}
	return result;
}

} // namespace seacast::pipeline
