#include "seacast/core/raw_table.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <system_error>
#include <stdexcept>

namespace seacast::core {

namespace {

std::string_view trim(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1);
	}
	return text;
}

// pandas' default na_values.
const std::array<std::string_view, 18> kNullTokens = {"#N/A",    "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN",
                                                      "-nan",    "1.#IND",   "1.#QNAN", "<NA>", "N/A",      "NA",
                                                      "NULL",    "NaN",      "None", "n/a",     "nan",      "null"};

} // namespace

void RawTable::addColumn(std::string name, std::vector<std::string> cells) {
	if (hasColumn(name)) {
		throw std::invalid_argument("Duplicate column name '" + name + "'.");
	}
	if (!columns_.empty() && cells.size() != rowCount()) {
		throw std::invalid_argument("Column '" + name + "' length does not match the table.");
	}
	columns_.push_back(Column{std::move(name), std::move(cells)});
}

void RawTable::renameColumns(const std::vector<std::string> &names) {
	if (names.size() != columns_.size()) {
		throw std::invalid_argument("Rename requires one name per column.");
	}
	for (std::size_t i = 0; i < names.size(); ++i) {
		for (std::size_t j = 0; j < i; ++j) {
			if (names[j] == names[i]) {
				throw std::invalid_argument("Duplicate column name '" + names[i] + "'.");
			}
		}
	}
	for (std::size_t i = 0; i < names.size(); ++i) {
		columns_[i].name = names[i];
	}
}

std::vector<std::string> RawTable::columnNames() const {
	std::vector<std::string> names;
	names.reserve(columns_.size());
	for (const auto &column : columns_) {
		names.push_back(column.name);
	}
	return names;
}

bool RawTable::hasColumn(const std::string &name) const {
	return std::any_of(columns_.begin(), columns_.end(), [&](const Column &c) { return c.name == name; });
}

const RawTable::Column &RawTable::column(const std::string &name) const {
	for (const auto &column : columns_) {
		if (column.name == name) {
			return column;
		}
	}
	throw std::out_of_range("Column '" + name + "' not found.");
}

bool RawTable::isNullCell(std::string_view cell) {
	cell = trim(cell);
	if (cell.empty()) {
		return true;
	}
	return std::find(kNullTokens.begin(), kNullTokens.end(), cell) != kNullTokens.end();
}

std::optional<double> RawTable::parseNumber(std::string_view cell) {
	cell = trim(cell);
	if (cell.empty() || isNullCell(cell)) {
		return std::nullopt;
	}
	// Decimal and scientific notation only, independent of the locale. Hex stays text.
	if (cell.size() > 1 && cell.front() == '+' && cell[1] != '-') {
		cell.remove_prefix(1);
	}
	double value = 0.0;
	const auto result = std::from_chars(cell.data(), cell.data() + cell.size(), value, std::chars_format::general);
	if (result.ec != std::errc() || result.ptr != cell.data() + cell.size()) {
		return std::nullopt;
	}
	return value;
}

std::size_t RawTable::nonNullCount(const Column &column) {
	return static_cast<std::size_t>(
	    std::count_if(column.cells.begin(), column.cells.end(), [](const std::string &c) { return !isNullCell(c); }));
}

bool RawTable::isNumeric(const Column &column) {
	bool any = false;
	for (const auto &cell : column.cells) {
		if (isNullCell(cell)) {
			continue;
		}
		if (!parseNumber(cell)) {
			return false;
		}
		any = true;
	}
	return any;
}

} // namespace seacast::core
