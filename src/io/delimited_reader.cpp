#include "seacast/io/delimited_reader.hpp"

#include "seacast/errors.hpp"
#include "seacast/utils/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace seacast::io {

namespace {

using Record = std::vector<std::string>;

std::string trimCopy(const std::string &text) {
	std::size_t begin = 0;
	std::size_t end = text.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
		++begin;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
		--end;
	}
	return text.substr(begin, end - begin);
}

bool isBlank(const Record &record) {
	return record.size() == 1 && trimCopy(record.front()).empty();
}

// Splits the whole text into records, honouring quoted fields.
std::vector<std::pair<std::size_t, Record>> tokenize(const std::string &text, char delimiter,
                                                     const std::string &source) {
	std::vector<std::pair<std::size_t, Record>> records;
	Record current;
	std::string field;
	bool in_quotes = false;
	bool field_was_quoted = false;
	std::size_t line = 1;
	std::size_t record_line = 1;

	const auto finishField = [&]() {
		current.push_back(field_was_quoted ? field : trimCopy(field));
		field.clear();
		field_was_quoted = false;
	};
	const auto finishRecord = [&]() {
		finishField();
		records.emplace_back(record_line, std::move(current));
		current.clear();
	};

	for (std::size_t i = 0; i < text.size(); ++i) {
		const char c = text[i];
		if (in_quotes) {
			if (c == '"') {
				if (i + 1 < text.size() && text[i + 1] == '"') {
					field.push_back('"');
					++i;
				} else {
					in_quotes = false;
				}
			} else {
				if (c == '\n') {
					++line;
				}
				field.push_back(c);
			}
			continue;
		}

		if (c == '"' && trimCopy(field).empty()) {
			field.clear();
			in_quotes = true;
			field_was_quoted = true;
		} else if (c == delimiter) {
			finishField();
		} else if (c == '\r') {
			if (i + 1 < text.size() && text[i + 1] == '\n') {
				continue;
			}
			finishRecord();
			record_line = ++line;
		} else if (c == '\n') {
			finishRecord();
			record_line = ++line;
		} else {
			field.push_back(c);
		}
	}

	if (in_quotes) {
		throw InputReadError("Unterminated quoted field", {{"source", source}, {"line", std::to_string(record_line)}});
	}
	if (!field.empty() || !current.empty() || field_was_quoted) {
		finishRecord();
	}
	return records;
}

std::vector<std::string> normalizeHeader(const Record &header) {
	std::vector<std::string> names;
	names.reserve(header.size());
	std::unordered_set<std::string> used;
	std::unordered_map<std::string, int> next_suffix;
	for (std::size_t i = 0; i < header.size(); ++i) {
		std::string name = trimCopy(header[i]);
		if (name.empty()) {
			name = "Unnamed: " + std::to_string(i);
		}
		if (used.count(name) > 0) {
			const std::string base = name;
			int suffix = std::max(1, next_suffix[base]);
			while (used.count(base + "." + std::to_string(suffix)) > 0) {
				++suffix;
			}
			name = base + "." + std::to_string(suffix);
			next_suffix[base] = suffix + 1;
		}
		used.insert(name);
		names.push_back(std::move(name));
	}
	return names;
}

} // namespace

char detectDelimiter(const std::string &text) {
	static const std::array<char, 4> candidates = {',', ';', '\t', '|'};
	std::array<std::size_t, 4> counts{};
	bool in_quotes = false;
	for (char c : text) {
		if (c == '"') {
			in_quotes = !in_quotes;
			continue;
		}
		if (!in_quotes && (c == '\n' || c == '\r')) {
			break;
		}
		if (in_quotes) {
			continue;
		}
		for (std::size_t k = 0; k < candidates.size(); ++k) {
			if (c == candidates[k]) {
				++counts[k];
			}
		}
	}
	std::size_t best = 0;
	for (std::size_t k = 1; k < candidates.size(); ++k) {
		if (counts[k] > counts[best]) {
			best = k;
		}
	}
	return candidates[best];
}

core::RawTable parseTable(const std::string &raw_text, const ReadOptions &options, const std::string &source) {
	std::string text = raw_text;
	if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
	    static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
		text.erase(0, 3);
	}

	const char delimiter = options.delimiter ? *options.delimiter : detectDelimiter(text);
	auto records = tokenize(text, delimiter, source);

	std::size_t first = 0;
	while (first < records.size() && isBlank(records[first].second)) {
		++first;
	}
	if (first == records.size()) {
		throw InputReadError("Table has no header row", {{"source", source}});
	}

	const auto names = normalizeHeader(records[first].second);
	std::vector<std::vector<std::string>> columns(names.size());
	for (std::size_t r = first + 1; r < records.size(); ++r) {
		auto &record = records[r].second;
		if (isBlank(record)) {
			continue;
		}
		if (record.size() > names.size()) {
			throw InputReadError("Row has more fields than the header",
			                     {{"source", source},
			                      {"line", std::to_string(records[r].first)},
			                      {"expected", std::to_string(names.size())},
			                      {"found", std::to_string(record.size())}});
		}
		record.resize(names.size());
		for (std::size_t c = 0; c < names.size(); ++c) {
			columns[c].push_back(std::move(record[c]));
		}
	}

	core::RawTable table;
	for (std::size_t c = 0; c < names.size(); ++c) {
		table.addColumn(names[c], std::move(columns[c]));
	}
	SEACAST_DEBUG("Parsed {} with delimiter '{}': {} columns, {} rows.", source, delimiter == '\t' ? "\\t" : std::string(1, delimiter),
	              table.columnCount(), table.rowCount());
	return table;
}

core::RawTable readTable(const std::string &path, const ReadOptions &options) {
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		throw InputReadError("Cannot open input table", {{"path", path}});
	}
	std::ostringstream buffer;
	buffer << in.rdbuf();
	if (in.bad()) {
		throw InputReadError("I/O error while reading input table", {{"path", path}});
	}
	return parseTable(buffer.str(), options, path);
}

} // namespace seacast::io
