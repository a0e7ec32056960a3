#pragma once

#include "seacast/core/raw_table.hpp"

#include <optional>
#include <string>

namespace seacast::io {

struct ReadOptions {
	/// Field separator; auto-detected from the header line when unset.
	std::optional<char> delimiter;
};

/**
 * @brief Reads a delimited file with a header row into a RawTable.
 * @throws InputReadError If the file cannot be opened or is malformed.
 */
core::RawTable readTable(const std::string &path, const ReadOptions &options = {});

/**
 * @brief Parses delimited text with a header row.
 * @param source Name used in error messages.
 * @throws InputReadError If the text is malformed.
 */
core::RawTable parseTable(const std::string &text, const ReadOptions &options = {},
                          const std::string &source = "<memory>");

/// Picks the most frequent of ',', ';', '\t', '|' outside quotes on the first line (',' by default).
char detectDelimiter(const std::string &text);

} // namespace seacast::io
