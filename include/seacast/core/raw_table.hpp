#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seacast::core {

/**
 * @class RawTable
 * @brief Named columns of raw text cells, exactly as read from a delimited file.
 *
 * No invariants beyond "every column has rowCount() cells". Typing is decided
 * on demand by the helpers below, never stored.
 */
class RawTable {
public:
	struct Column {
		std::string name;
		std::vector<std::string> cells;
	};

	RawTable() = default;

	/// @throws std::invalid_argument When the name is already taken or the length disagrees.
	void addColumn(std::string name, std::vector<std::string> cells);

	/// Replaces every column name; used for header normalisation.
	void renameColumns(const std::vector<std::string> &names);

	const std::vector<Column> &columns() const {
		return columns_;
	}

	std::vector<std::string> columnNames() const;

	std::size_t columnCount() const {
		return columns_.size();
	}

	std::size_t rowCount() const {
		return columns_.empty() ? 0 : columns_.front().cells.size();
	}

	bool hasColumn(const std::string &name) const;

	/// @throws std::out_of_range When no column has that name.
	const Column &column(const std::string &name) const;

	/// True for blank cells and the usual missing-value tokens (NA, NaN, null, None, ...).
	static bool isNullCell(std::string_view cell);

	/// Parses the whole (trimmed) cell as a floating point number.
	static std::optional<double> parseNumber(std::string_view cell);

	/// Non-null cells of a column.
	static std::size_t nonNullCount(const Column &column);

	/// At least one non-null cell and every non-null cell is a number.
	static bool isNumeric(const Column &column);

private:
	std::vector<Column> columns_;
};

} // namespace seacast::core
