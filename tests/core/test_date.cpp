#include <catch2/catch_test_macros.hpp>

#include "prepcast/core/date.hpp"

#include <stdexcept>

using prepcast::core::Date;
using prepcast::core::nextMonday;

TEST_CASE("Date parses ISO and separated formats", "[core][date]") {
	const auto iso = Date::parse("2024-06-03");
	REQUIRE(iso.has_value());
	REQUIRE(iso->toString() == "2024-06-03");
	REQUIRE(iso->weekday() == 0);

	const auto with_time = Date::parse("2024-06-03T10:15:00");
	REQUIRE(with_time.has_value());
	REQUIRE(*with_time == *iso);

	SECTION("day first") {
		const auto parsed = Date::parse("3/6/2024", true);
		REQUIRE(parsed.has_value());
		REQUIRE(*parsed == *iso);
	}

	SECTION("month first") {
		const auto parsed = Date::parse("6/3/2024", false);
		REQUIRE(parsed.has_value());
		REQUIRE(*parsed == *iso);
	}

	SECTION("two digit years map to this century") {
		const auto parsed = Date::parse("03-06-24", true);
		REQUIRE(parsed.has_value());
		REQUIRE(parsed->year() == 2024);
	}
}

TEST_CASE("Date rejects impossible or non-date text", "[core][date]") {
	REQUIRE_FALSE(Date::parse("2023-02-29").has_value());
	REQUIRE_FALSE(Date::parse("31/04/2024").has_value());
	REQUIRE_FALSE(Date::parse("Croissant").has_value());
	REQUIRE_FALSE(Date::parse("").has_value());
	REQUIRE(Date::parse("2024-02-29").has_value());

	REQUIRE_THROWS_AS(Date::fromYmd(2024, 13, 1), std::invalid_argument);
}

TEST_CASE("Date arithmetic and weekdays", "[core][date]") {
	const auto monday = Date::fromYmd(2024, 6, 3);
	REQUIRE(monday.addDays(6).isSunday());
	REQUIRE(monday.addDays(5).weekday() == 5);
	REQUIRE(monday.addDays(-1).isSunday());
	REQUIRE(monday.addDays(4).mondayOf() == monday);
	REQUIRE(monday.addDays(30).daysSince(monday) == 30);
	REQUIRE(Date::fromYmd(1970, 1, 1).weekday() == 3);
	REQUIRE(Date::fromYmd(1969, 12, 29).weekday() == 0);
}

TEST_CASE("nextMonday maps a week onto its forecast Monday", "[core][date]") {
	const auto monday = Date::fromYmd(2024, 6, 3);
	REQUIRE(nextMonday(monday) == monday);
	REQUIRE(nextMonday(Date::fromYmd(2024, 6, 1)) == monday);
	REQUIRE(nextMonday(Date::fromYmd(2024, 5, 28)) == monday);
	REQUIRE(nextMonday(Date::fromYmd(2024, 6, 4)) == Date::fromYmd(2024, 6, 10));
}

TEST_CASE("Date header detection", "[core][date]") {
	REQUIRE(Date::looksLikeDate("2024-06-03"));
	REQUIRE(Date::looksLikeDate("03/06/2024"));
	REQUIRE_FALSE(Date::looksLikeDate("Item Name"));
	REQUIRE_FALSE(Date::looksLikeDate("Qty"));
}
