#include <catch2/catch_test_macros.hpp>

#include "common/file_helpers.hpp"
#include "seacast/errors.hpp"
#include "seacast/io/delimited_reader.hpp"

using seacast::InputReadError;
using seacast::io::ReadOptions;
using seacast::io::detectDelimiter;
using seacast::io::parseTable;
using seacast::io::readTable;

TEST_CASE("Reader parses a plain comma separated table", "[io][reader]") {
	const auto table = parseTable("timestamp,sst\n2020-01-01,10.5\n2020-01-02,11\n");
	REQUIRE(table.columnNames() == std::vector<std::string>{"timestamp", "sst"});
	REQUIRE(table.rowCount() == 2);
	REQUIRE(table.column("sst").cells[0] == "10.5");
}

TEST_CASE("Reader honours quoting rules", "[io][reader][quotes]") {
	const auto table = parseTable("name,note\r\n\"Smith, J\",\"said \"\"hi\"\"\"\r\n\"multi\nline\",x\r\n");
	REQUIRE(table.rowCount() == 2);
	REQUIRE(table.column("name").cells[0] == "Smith, J");
	REQUIRE(table.column("note").cells[0] == "said \"hi\"");
	REQUIRE(table.column("name").cells[1] == "multi\nline");
}

TEST_CASE("Reader detects the delimiter from the header", "[io][reader][delimiter]") {
	REQUIRE(detectDelimiter("a;b;c\n1,5;2;3") == ';');
	REQUIRE(detectDelimiter("a\tb\n1\t2") == '\t');
	REQUIRE(detectDelimiter("a|b|c") == '|');
	REQUIRE(detectDelimiter("\"a;b\",c") == ',');
	REQUIRE(detectDelimiter("single") == ',');

	const auto table = parseTable("Depth;Salinity\n1;30\n2;32\n");
	REQUIRE(table.columnNames() == std::vector<std::string>{"Depth", "Salinity"});

	ReadOptions options;
	options.delimiter = ';';
	const auto forced = parseTable("a,b;c\n1,2;3\n", options);
	REQUIRE(forced.columnNames() == std::vector<std::string>{"a,b", "c"});
}

TEST_CASE("Reader normalises headers", "[io][reader][header]") {
	const auto table = parseTable("\xEF\xBB\xBF value ,,value,value\n1,2,3,4\n");
	REQUIRE(table.columnNames() == std::vector<std::string>{"value", "Unnamed: 1", "value.1", "value.2"});
}

TEST_CASE("Reader pads short rows and skips blank lines", "[io][reader]") {
	const auto table = parseTable("a,b,c\n1,2\n\n4,5,6\n");
	REQUIRE(table.rowCount() == 2);
	REQUIRE(table.column("c").cells[0].empty());
	REQUIRE(table.column("c").cells[1] == "6");
}

TEST_CASE("Reader reports malformed input", "[io][reader][errors]") {
	REQUIRE_THROWS_AS(parseTable(""), InputReadError);
	REQUIRE_THROWS_AS(parseTable("a,b\n1,2,3\n"), InputReadError);
	REQUIRE_THROWS_AS(parseTable("a,b\n\"open,2\n"), InputReadError);

	try {
		parseTable("a,b\n1,2\n3,4,5\n");
		FAIL("expected InputReadError");
	} catch (const InputReadError &e) {
		REQUIRE(e.context().at("line") == "3");
	}
}

TEST_CASE("Reader loads files from disk", "[io][reader][file]") {
	tests::helpers::TempDir dir;
	const auto path = dir.write("input.csv", "date,value\n2021-01-01,1\n2021-01-02,2\n");
	const auto table = readTable(path);
	REQUIRE(table.rowCount() == 2);

	REQUIRE_THROWS_AS(readTable(dir.file("missing.csv")), InputReadError);
}
