#include "seacast/pipeline/regressor_synthesizer.hpp"

#include "seacast/errors.hpp"
#include "seacast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace seacast::pipeline {

namespace {

struct Parameter {
	const char *column;
	const char *regressor;
	std::optional<double> core::DepthProfile::Sample::*field;
};

const Parameter kParameters[] = {
    {"Salinity", "mean_salinity", &core::DepthProfile::Sample::salinity},
    {"pH", "mean_ph", &core::DepthProfile::Sample::ph},
    {"Chlorophyl", "mean_chlorophyl", &core::DepthProfile::Sample::chlorophyl},
};

std::optional<double> columnMean(const core::RawTable::Column &column) {
	double sum = 0.0;
	std::size_t count = 0;
	for (const auto &cell : column.cells) {
		const auto value = core::RawTable::parseNumber(cell);
		if (value && std::isfinite(*value)) {
			sum += *value;
			++count;
		}
	}
	if (count == 0) {
		return std::nullopt;
	}
	return sum / static_cast<double>(count);
}

} // namespace

std::string RegressorSynthesizer::normalizeColumnName(const std::string &name) {
	std::string result = name;
	std::replace(result.begin(), result.end(), '.', '_');
	std::replace(result.begin(), result.end(), ' ', '_');
	return result;
}

std::vector<std::size_t> RegressorSynthesizer::sampleIndices(std::size_t rows, std::size_t max_samples) {
	const auto k = std::min(max_samples, rows);
	std::vector<std::size_t> indices;
	indices.reserve(k);
	if (k == 1) {
		indices.push_back(0);
		return indices;
	}
	for (std::size_t i = 0; i < k; ++i) {
		indices.push_back(i * (rows - 1) / (k - 1));
	}
	return indices;
}

SynthesisResult RegressorSynthesizer::synthesizeStrict(const core::RawTable &input) {
	core::RawTable table = input;
	std::vector<std::string> names;
	for (const auto &name : table.columnNames()) {
		names.push_back(normalizeColumnName(name));
	}
	try {
		table.renameColumns(names);
	} catch (const std::invalid_argument &e) {
		throw RegressorSynthesisFailure("Regressor table headers collide after normalisation", {{"reason", e.what()}});
	}

	if (!table.hasColumn("Depth")) {
		throw RegressorSynthesisFailure("Regressor table has no Depth column", {{"columns", std::to_string(names.size())}});
	}
	const auto rows = table.rowCount();
	if (rows == 0) {
		throw RegressorSynthesisFailure("Regressor table is empty");
	}

	SynthesisResult result;
	for (const auto &parameter : kParameters) {
		if (!table.hasColumn(parameter.column)) {
			SEACAST_WARN("Regressor table has no '{}' column; skipping {}.", parameter.column, parameter.regressor);
			continue;
		}
		const auto mean = columnMean(table.column(parameter.column));
		if (!mean) {
			SEACAST_WARN("Column '{}' holds no numeric value; skipping {}.", parameter.column, parameter.regressor);
			continue;
		}
		result.regressors.set(parameter.regressor, *mean);
		SEACAST_INFO("Regressor {} = {:.6f}.", parameter.regressor, *mean);
	}
	if (result.regressors.empty()) {
		throw RegressorSynthesisFailure("Regressor table has no usable parameter column",
		                                {{"rows", std::to_string(rows)}});
	}

	// Depth order, unparseable depths last.
	const auto &depth_cells = table.column("Depth").cells;
	std::vector<std::optional<double>> depths(rows);
	for (std::size_t i = 0; i < rows; ++i) {
		depths[i] = core::RawTable::parseNumber(depth_cells[i]);
	}
	std::vector<std::size_t> order(rows);
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
		if (!depths[a] || !depths[b]) {
			return depths[a].has_value() && !depths[b].has_value();
		}
		return *depths[a] < *depths[b];
	});

	core::DepthProfile profile;
	profile.source_rows = rows;
	for (const auto index : sampleIndices(rows)) {
		const auto row = order[index];
		core::DepthProfile::Sample sample;
		sample.depth = depths[row];
		for (const auto &parameter : kParameters) {
			if (table.hasColumn(parameter.column)) {
				sample.*(parameter.field) = core::RawTable::parseNumber(table.column(parameter.column).cells[row]);
			}
		}
		profile.samples.push_back(sample);
	}
	SEACAST_INFO("Selected {} representative samples from {} regressor rows.", profile.samples.size(), rows);
	result.profile = std::move(profile);
	return result;
}

SynthesisResult RegressorSynthesizer::synthesize(const core::RawTable &table) {
	try {
		return synthesizeStrict(table);
	} catch (const RegressorSynthesisFailure &e) {
		SEACAST_WARN("Continuing without regressors: {}", e.what());
	} catch (const std::exception &e) {
		SEACAST_ERROR("Error processing regressor table, continuing without regressors: {}", e.what());
	}
	return {};
}

SynthesisResult RegressorSynthesizer::synthesizeFromFile(const std::string &path, const io::ReadOptions &options) {
	SEACAST_INFO("Loading regressor data from: {}", path);
	try {
		return synthesize(io::readTable(path, options));
	} catch (const InputReadError &e) {
		SEACAST_WARN("Continuing without regressors: {}", e.what());
	} catch (const std::exception &e) {
		SEACAST_ERROR("Error reading regressor table, continuing without regressors: {}", e.what());
	}
	return {};
}

} // namespace seacast::pipeline
