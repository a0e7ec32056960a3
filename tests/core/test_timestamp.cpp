#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "seacast/core/timestamp.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>

using namespace seacast::core;
using tests::helpers::date;

TEST_CASE("Civil date conversion round-trips", "[core][timestamp]") {
	REQUIRE(daysFromCivil(1970, 1, 1) == 0);
	REQUIRE(daysFromCivil(2000, 3, 1) == 11017);
	const auto back = civilFromDays(daysFromCivil(2024, 2, 29));
	REQUIRE(back.year == 2024);
	REQUIRE(back.month == 2u);
	REQUIRE(back.day == 29u);
	REQUIRE(daysInMonth(2023, 2) == 28u);
	REQUIRE(daysInMonth(2024, 2) == 29u);
	REQUIRE(daysInMonth(1900, 2) == 28u);
}

TEST_CASE("parseTimestamp accepts common date layouts", "[core][timestamp][parse]") {
	const auto expected = date(2021, 3, 7);
	REQUIRE(parseTimestamp("2021-03-07") == expected);
	REQUIRE(parseTimestamp("2021/03/07") == expected);
	REQUIRE(parseTimestamp("2021.3.7") == expected);
	REQUIRE(parseTimestamp("03/07/2021") == expected);
	REQUIRE(parseTimestamp("07-03-2021") == expected);
	REQUIRE(parseTimestamp("07.03.2021") == expected);
	REQUIRE(parseTimestamp("  2021-03-07  ") == expected);
	REQUIRE(parseTimestamp("2021-03") == date(2021, 3, 1));
}

TEST_CASE("parseTimestamp handles time of day and offsets", "[core][timestamp][parse]") {
	using namespace std::chrono;
	const auto midnight = date(2021, 3, 7);
	REQUIRE(parseTimestamp("2021-03-07 13:45") == midnight + hours(13) + minutes(45));
	REQUIRE(parseTimestamp("2021-03-07T13:45:30Z") == midnight + hours(13) + minutes(45) + seconds(30));
	REQUIRE(parseTimestamp("2021-03-07T13:45:30+02:00") == midnight + hours(11) + minutes(45) + seconds(30));
	REQUIRE(parseTimestamp("2021-03-07T00:30:00-0130") == midnight + hours(2));

	const auto fractional = parseTimestamp("2021-03-07 00:00:01.250");
	REQUIRE(fractional.has_value());
	REQUIRE(duration_cast<milliseconds>(*fractional - midnight).count() == 1250);
}

TEST_CASE("parseTimestamp rejects non-dates", "[core][timestamp][parse]") {
	REQUIRE_FALSE(parseTimestamp("").has_value());
	REQUIRE_FALSE(parseTimestamp("2021").has_value());
	REQUIRE_FALSE(parseTimestamp("12.5").has_value());
	REQUIRE_FALSE(parseTimestamp("hello").has_value());
	REQUIRE_FALSE(parseTimestamp("2021-02-30").has_value());
	REQUIRE_FALSE(parseTimestamp("2021-13-01").has_value());
	REQUIRE_FALSE(parseTimestamp("2021-03-07 25:00").has_value());
	REQUIRE_FALSE(parseTimestamp("2021-03-07x").has_value());
}

TEST_CASE("parseTimestamp rejects dates outside the clock range", "[core][timestamp][parse][range]") {
	REQUIRE_FALSE(parseTimestamp("2300-01-01").has_value());
	REQUIRE_FALSE(parseTimestamp("9999-12-31").has_value());
	REQUIRE_FALSE(parseTimestamp("0001-01-01").has_value());
	REQUIRE_FALSE(parseTimestamp("12/31/9999 23:59").has_value());

	const auto old = parseTimestamp("1700-06-15");
	REQUIRE(old.has_value());
	REQUIRE(formatTimestamp(*old, true) == "1700-06-15");
	REQUIRE(parseTimestamp("2262-01-01") == date(2262, 1, 1));
}

TEST_CASE("fromCivil and fromEpochSeconds check the clock range", "[core][timestamp][range]") {
	REQUIRE_THROWS_AS(fromCivil(CivilDate{2300, 1, 1}), std::out_of_range);
	REQUIRE_THROWS_AS(fromCivil(CivilDate{1, 1, 1}), std::out_of_range);
	REQUIRE_FALSE(fromEpochSeconds(std::int64_t{20000000000}).has_value());
	REQUIRE_FALSE(fromEpochSeconds(std::int64_t{-20000000000}).has_value());
	REQUIRE(fromEpochSeconds(86400) == date(1970, 1, 2));
}

TEST_CASE("formatTimestamp renders date and date-time forms", "[core][timestamp][format]") {
	using namespace std::chrono;
	const auto tp = date(2022, 11, 5) + hours(6) + minutes(7) + seconds(8);
	REQUIRE(formatTimestamp(tp) == "2022-11-05 06:07:08");
	REQUIRE(formatTimestamp(tp, true) == "2022-11-05");
	REQUIRE(formatTimestampAuto(date(2022, 11, 5)) == "2022-11-05");
	REQUIRE(formatTimestampAuto(tp) == "2022-11-05 06:07:08");
	REQUIRE(isMidnight(date(1969, 12, 31)));
	REQUIRE(formatTimestamp(date(1969, 12, 31), true) == "1969-12-31");
}
