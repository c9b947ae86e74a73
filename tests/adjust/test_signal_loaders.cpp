#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/sales_helpers.hpp"
#include "prepcast/adjust/signal_loaders.hpp"

#include <stdexcept>

using prepcast::core::Date;
using prepcast::core::SignalKind;
using tests::helpers::makeTable;

TEST_CASE("Event tables become multiplicative signals", "[adjust][loaders]") {
	const auto table = makeTable({"date", "event_name", "event_type", "uplift_pct"},
	                             {{"2024-06-10", "King's Birthday", "public_holiday", "15"},
	                              {"2024-06-08", "Street fair", "local_event", "30"},
	                              {"2024-06-09", "Roadworks", "disruption", "-20"},
	                              {"someday", "Broken", "local_event", "10"},
	                              {"2024-06-11", "No uplift", "local_event", ""}},
	                             "events.csv");
	const auto signals = prepcast::adjust::loadEventSignals(table);

	REQUIRE(signals.size() == 4);
	REQUIRE(signals[0].kind == SignalKind::Holiday);
	REQUIRE(signals[0].multiplier == Catch::Approx(1.15));
	REQUIRE(signals[0].label == "King's Birthday");
	REQUIRE(signals[1].kind == SignalKind::Event);
	REQUIRE(signals[1].multiplier == Catch::Approx(1.3));
	REQUIRE(signals[2].multiplier == Catch::Approx(0.8));
	REQUIRE(signals[3].multiplier == Catch::Approx(1.0));
}

TEST_CASE("Event tables need date and uplift columns", "[adjust][loaders][error]") {
	const auto table = makeTable({"date", "event_name"}, {{"2024-06-10", "Fair"}});
	REQUIRE_THROWS_AS(prepcast::adjust::loadEventSignals(table), std::invalid_argument);
}

TEST_CASE("Holiday calendar registers holidays with the feed", "[adjust][loaders]") {
	prepcast::store::InMemoryHolidayFeed feed;
	prepcast::adjust::HolidayCalendar calendar(feed);
	const auto holiday = Date::fromYmd(2024, 6, 10);

	calendar.addHoliday(holiday, "King's Birthday");
	calendar.addHoliday(holiday.addDays(1), "Bakery anniversary", 40.0);

	const auto signals = feed.get(holiday);
	REQUIRE(signals.size() == 1);
	REQUIRE(signals.front().kind == SignalKind::Holiday);
	REQUIRE(signals.front().multiplier == Catch::Approx(1.0 + prepcast::adjust::kDefaultHolidayUpliftPct / 100.0));
	REQUIRE(feed.get(holiday.addDays(1)).front().multiplier == Catch::Approx(1.4));

	// A closure day keeps its own negative uplift.
	calendar.addHoliday(holiday.addDays(3), "Stocktake", -20.0);
	REQUIRE(feed.get(holiday.addDays(3)).front().multiplier == Catch::Approx(0.8));

	const auto events = makeTable({"date", "uplift_pct"}, {{"2024-06-12", "10"}, {"2024-06-12", "5"}});
	REQUIRE(calendar.addEvents(events) == 2);
	REQUIRE(feed.get(Date::fromYmd(2024, 6, 12)).size() == 2);
	REQUIRE(feed.size() == 5);
}

TEST_CASE("Weather tables load into the feed", "[adjust][loaders]") {
	prepcast::store::InMemoryWeatherFeed feed;
	const auto table = makeTable({"date", "max_temp", "rain_mm"},
	                             {{"2024-06-03", "18.5", "0"}, {"2024-06-04", "", "12"}, {"bad", "20", "1"}});

	REQUIRE(prepcast::adjust::loadWeather(table, feed, "sydney") == 2);

	const auto monday = feed.get(Date::fromYmd(2024, 6, 3), "sydney");
	REQUIRE(monday.has_value());
	REQUIRE(*monday->max_temp == Catch::Approx(18.5));
	REQUIRE(*monday->precipitation == Catch::Approx(0.0));

	const auto tuesday = feed.get(Date::fromYmd(2024, 6, 4), "sydney");
	REQUIRE(tuesday.has_value());
	REQUIRE_FALSE(tuesday->max_temp.has_value());
	REQUIRE_FALSE(feed.get(Date::fromYmd(2024, 6, 3), "melbourne").has_value());
}
