#pragma once

#include "seacast/core/raw_table.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace seacast::pipeline {

/// The two columns a forecast is built from.
struct ResolvedSchema {
	std::string date_column;
	std::string target_column;
};

/**
 * @class SchemaDetector
 * @brief Decides which column holds the timestamps and which holds the measured value.
 *
 * Column names are matched first, cell contents second. A column supplied by the
 * caller is always kept as is.
 */
class SchemaDetector {
public:
	/// Target name fragments, in order of preference.
	static const std::vector<std::string> &targetPreferences();

	/**
	 * @brief Resolves the date and target columns.
	 * @param table The raw input table.
	 * @param date_column Caller-supplied date column, used verbatim.
	 * @param target_column Caller-supplied target column, used verbatim.
	 * @throws SchemaInferenceError When either column stays undetermined.
	 */
	static ResolvedSchema detect(const core::RawTable &table,
	                             const std::optional<std::string> &date_column = std::nullopt,
	                             const std::optional<std::string> &target_column = std::nullopt);

	/**
	 * @brief First column whose name mentions a date or time, else the first column whose
	 *        cells parse as timestamps in at least minParsedRows() rows.
	 */
	static std::optional<std::string> detectDateColumn(const core::RawTable &table);

	/**
	 * @brief First name match against targetPreferences(), else the numeric column with the
	 *        most non-null cells.
	 * @param exclude Column skipped by the numeric fallback (the resolved date column).
	 */
	static std::optional<std::string> detectTargetColumn(const core::RawTable &table,
	                                                     const std::optional<std::string> &exclude = std::nullopt);

	/// max(10, floor(0.2 * rows)).
	static std::size_t minParsedRows(std::size_t rows);
};

} // namespace seacast::pipeline
