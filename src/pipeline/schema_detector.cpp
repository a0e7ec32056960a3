#include "seacast/pipeline/schema_detector.hpp"

#include "seacast/core/timestamp.hpp"
#include "seacast/errors.hpp"
#include "seacast/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace seacast::pipeline {

namespace {

std::string toLower(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

std::string joinNames(const std::vector<std::string> &names) {
	std::ostringstream out;
	for (std::size_t i = 0; i < names.size(); ++i) {
		if (i > 0) {
			out << ",";
		}
		out << names[i];
	}
	return out.str();
}

std::size_t countTimestamps(const core::RawTable::Column &column) {
	return static_cast<std::size_t>(std::count_if(column.cells.begin(), column.cells.end(), [](const std::string &cell) {
		return !core::RawTable::isNullCell(cell) && core::parseTimestamp(cell).has_value();
	}));
}

} // namespace

const std::vector<std::string> &SchemaDetector::targetPreferences() {
	static const std::vector<std::string> preferences = {"stock_value", "value",       "sea_surface_temp", "sst",
	                                                     "salinity",    "chlorophyll", "catch",            "biomass"};
	return preferences;
}

std::size_t SchemaDetector::minParsedRows(std::size_t rows) {
	return std::max<std::size_t>(10, static_cast<std::size_t>(0.2 * static_cast<double>(rows)));
}

std::optional<std::string> SchemaDetector::detectDateColumn(const core::RawTable &table) {
	static const std::vector<std::string> keywords = {"date", "time", "timestamp"};
	for (const auto &column : table.columns()) {
		const auto lowered = toLower(column.name);
		for (const auto &keyword : keywords) {
			if (lowered.find(keyword) != std::string::npos) {
				return column.name;
			}
		}
	}

	const auto required = minParsedRows(table.rowCount());
	for (const auto &column : table.columns()) {
		const auto parsed = countTimestamps(column);
		if (parsed >= required) {
			SEACAST_DEBUG("Column '{}' parses as timestamps in {} rows.", column.name, parsed);
			return column.name;
		}
	}
	return std::nullopt;
}

std::optional<std::string> SchemaDetector::detectTargetColumn(const core::RawTable &table,
                                                              const std::optional<std::string> &exclude) {
	for (const auto &preference : targetPreferences()) {
		for (const auto &column : table.columns()) {
			if (toLower(column.name).find(preference) != std::string::npos) {
				return column.name;
			}
		}
	}

	std::optional<std::string> best;
	std::size_t best_count = 0;
	for (const auto &column : table.columns()) {
		if (exclude && column.name == *exclude) {
			continue;
		}
		if (!core::RawTable::isNumeric(column)) {
			continue;
		}
		const auto count = core::RawTable::nonNullCount(column);
		if (!best || count > best_count) {
			best = column.name;
			best_count = count;
		}
	}
	return best;
}

ResolvedSchema SchemaDetector::detect(const core::RawTable &table, const std::optional<std::string> &date_column,
                                      const std::optional<std::string> &target_column) {
	if (date_column && target_column) {
		return ResolvedSchema{*date_column, *target_column};
	}

	const auto date = date_column ? date_column : detectDateColumn(table);
	const auto target = target_column ? target_column : detectTargetColumn(table, date);

	if (!date || !target) {
		std::string missing;
		if (!date && !target) {
			missing = "date,target";
		} else {
			missing = date ? "target" : "date";
		}
		throw SchemaInferenceError("Could not auto-detect date or target column. Provide them explicitly.",
		                           {{"columns", joinNames(table.columnNames())}, {"unresolved", missing}});
	}

	SEACAST_INFO("Resolved schema: date column '{}', target column '{}'.", *date, *target);
	return ResolvedSchema{*date, *target};
}

} // namespace seacast::pipeline
