#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/sales_helpers.hpp"
#include "prepcast/core/errors.hpp"
#include "prepcast/forecast_engine.hpp"
#include "prepcast/store/memory_stores.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <thread>

using prepcast::ForecastEngine;
using prepcast::config::Settings;
using prepcast::core::Date;
using tests::helpers::fixedClock;
using tests::helpers::forecastMonday;
using tests::helpers::makeTable;

namespace {

using Row = std::vector<std::string>;

// Long-format export: one row per (date, item) for `weeks` weeks before the forecast week.
prepcast::ingest::RawTable longExport(const std::string &item, int weeks, const std::array<double, 6> &per_day,
                                      const Date &week_start = forecastMonday()) {
	std::vector<Row> rows;
	for (int week = weeks; week >= 1; --week) {
		const auto monday = week_start.addDays(-7 * week);
		for (int day = 0; day < 6; ++day) {
			rows.push_back({monday.addDays(day).toString(), item, std::to_string(static_cast<int>(per_day[day]))});
		}
	}
	return makeTable({"Date", "Item", "Qty"}, rows, "pos.csv");
}

struct EngineFixture {
	prepcast::store::InMemorySalesStore sales;
	prepcast::store::InMemoryModelStore models;
	prepcast::store::InMemoryForecastRunStore runs;

	ForecastEngine make(Settings settings = Settings{}) {
		return ForecastEngine(std::move(settings), sales, models, runs, nullptr, nullptr, fixedClock(1717372800000));
	}
};

const std::array<double, 6> kSourdough{40, 45, 42, 50, 60, 80};

} // namespace

TEST_CASE("Engine ingests long exports into canonical items", "[integration][ingest]") {
	EngineFixture fixture;
	auto engine = fixture.make();

	const auto result = engine.ingest(longExport("Sourdough Loaf", 8, kSourdough));
	REQUIRE(result.ok());
	REQUIRE(result.accepted == 48);
	REQUIRE(result.rejected_rows.empty());
	REQUIRE(fixture.sales.size() == 48);
	REQUIRE(fixture.sales.committedThrough() == forecastMonday().addDays(-2));

	const auto id = engine.findItem("sourdough loaf");
	REQUIRE(id.has_value());
	REQUIRE(engine.items().size() == 1);

	// Re-ingesting the same export replaces rather than doubles.
	REQUIRE(engine.ingest(longExport("Sourdough Loaf", 8, kSourdough)).accepted == 48);
	REQUIRE(fixture.sales.size() == 48);
}

TEST_CASE("Engine ingests wide exports", "[integration][ingest][wide]") {
	EngineFixture fixture;
	auto engine = fixture.make();

	const auto table = makeTable({"Item Name", "2024-05-27", "2024-05-28", "2024-05-29", "2024-05-30", "2024-05-31",
	                              "2024-06-01"},
	                             {{"Croissant", "30", "24", "24", "26", "32", "48"}, {"Rye Bread", "5", "", "6", "4", "5", "9"}},
	                             "wide.csv");
	const auto result = engine.ingest(table);
	REQUIRE(result.ok());
	REQUIRE(result.accepted == 11);
	REQUIRE(engine.items().size() == 2);
	REQUIRE(fixture.sales.committedThrough() == Date::fromYmd(2024, 6, 1));
}

TEST_CASE("Engine reports schema errors without ingesting", "[integration][ingest][error]") {
	EngineFixture fixture;
	auto engine = fixture.make();

	const auto result = engine.ingest(makeTable({"Date", "Item"}, {{"2024-06-01", "Rye"}}));
	REQUIRE_FALSE(result.ok());
	REQUIRE(result.errors.size() == 1);
	REQUIRE(result.accepted == 0);
	REQUIRE(engine.items().empty());
	REQUIRE(fixture.sales.size() == 0);
}

TEST_CASE("Engine rejects ambiguous names and keeps the rest", "[integration][ingest][ambiguity]") {
	EngineFixture fixture;
	Settings settings;
	settings.resolver.fuzzy_threshold = 0.6;
	auto engine = fixture.make(settings);

	REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-05-31", "Cheese Roll", "4"}})).accepted == 1);
	REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-05-31", "Ham Roll", "6"}})).accepted == 1);

	const auto result = engine.ingest(
	    makeTable({"Date", "Item", "Qty"}, {{"2024-06-01", "Ham Cheese Roll", "3"}, {"2024-06-01", "Ham Roll", "2"}},
	              "mixed.csv"));
	REQUIRE(result.ok());
	REQUIRE(result.accepted == 1);
	REQUIRE(result.rejected_rows.size() == 1);
	REQUIRE(result.rejected_rows.front().source_row_ref == "mixed.csv:2");
	REQUIRE(result.rejected_rows.front().reason == "ambiguous item name 'Ham Cheese Roll' (candidates: 1 2)");
	REQUIRE(engine.items().size() == 2);

	SECTION("an administrative alias settles the name") {
		engine.setAlias("Ham Cheese Roll", 2);
		const auto retry =
		    engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-06-01", "Ham Cheese Roll", "3"}}, "retry.csv"));
		REQUIRE(retry.rejected_rows.empty());
		REQUIRE(engine.findItem("ham cheese roll") == prepcast::core::ItemId{2});
		REQUIRE_THROWS_AS(engine.setAlias("Ham Roll", 1), std::invalid_argument);
	}
}

TEST_CASE("Engine resolves canonical rules onto administrative aliases", "[integration][ingest][rules]") {
	EngineFixture fixture;
	Settings settings;
	settings.resolver.canonical_rules.push_back({"^sd\\b", "Sourdough Loaf"});
	auto engine = fixture.make(settings);

	REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-05-31", "Sourdough", "12"}})).accepted == 1);
	const auto sourdough = *engine.findItem("Sourdough");
	engine.setAlias("Sourdough Loaf", sourdough);

	const auto result = engine.ingest(
	    makeTable({"Date", "Item", "Qty"}, {{"2024-06-01", "SD loaf", "9"}, {"2024-06-01", "Rye", "4"}}, "rules.csv"));
	REQUIRE(result.ok());
	REQUIRE(result.rejected_rows.empty());
	REQUIRE(result.accepted == 2);
	REQUIRE(engine.findItem("sd loaf") == sourdough);
	REQUIRE(engine.items().size() == 2);
	REQUIRE(fixture.sales.query(sourdough, {Date::fromYmd(2024, 6, 1), Date::fromYmd(2024, 6, 1)}).front().quantity ==
	        Catch::Approx(9.0));
}

TEST_CASE("Merged records keep the earliest export row", "[integration][ingest]") {
	EngineFixture fixture;
	auto engine = fixture.make();
	REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-05-31", "Bun", "1"}})).ok());
	const auto bun = *engine.findItem("Bun");
	engine.setAlias("Dinner Bun", bun);

	std::vector<Row> rows{{"2024-06-01", "Bun", "1"}};
	for (int filler = 0; filler < 8; ++filler) {
		rows.push_back({"2024-06-01", "Tart " + std::to_string(filler), "1"});
	}
	rows.push_back({"2024-06-01", "Dinner Bun", "2"});
	REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, rows, "c.csv")).ok());

	const auto records = fixture.sales.query(bun, {Date::fromYmd(2024, 6, 1), Date::fromYmd(2024, 6, 1)});
	REQUIRE(records.size() == 1);
	REQUIRE(records.front().quantity == Catch::Approx(3.0));
	REQUIRE(records.front().source_row_ref == "c.csv:2");
}

TEST_CASE("Aliases set during ingestion survive", "[integration][ingest][concurrency]") {
	EngineFixture fixture;
	auto engine = fixture.make();
	REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-05-31", "Croissant", "10"}})).ok());
	const auto croissant = *engine.findItem("Croissant");

	std::thread writer([&engine] {
		for (int batch = 0; batch < 50; ++batch) {
			engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-06-01", "Item " + std::to_string(batch), "1"}}));
		}
	});
	for (int alias = 0; alias < 50; ++alias) {
		engine.setAlias("Croissant " + std::to_string(alias), croissant);
	}
	writer.join();

	for (int alias = 0; alias < 50; ++alias) {
		REQUIRE(engine.findItem("Croissant " + std::to_string(alias)) == croissant);
	}
	REQUIRE(engine.items().size() == 51);
}

TEST_CASE("Engine forecasts the baseline when alpha is zero", "[integration][forecast]") {
	EngineFixture fixture;
	auto engine = fixture.make();
	REQUIRE(engine.ingest(longExport("Sourdough Loaf", 8, kSourdough)).ok());

	const auto run = engine.forecast(forecastMonday(), 0.0);
	REQUIRE(run->week_start == forecastMonday());
	REQUIRE(run->run_id >= 1717372800000);
	REQUIRE(run->lines.size() == 1);

	const auto &line = run->lines.front();
	REQUIRE(line.item_name == "Sourdough Loaf");
	for (std::size_t day = 0; day < kSourdough.size(); ++day) {
		REQUIRE(line.quantities[day] == Catch::Approx(kSourdough[day]));
		REQUIRE(line.multipliers[day] == Catch::Approx(1.0));
	}
	REQUIRE(line.weeklyTotal() == Catch::Approx(317.0));
	REQUIRE(run->alerts.empty());
	REQUIRE(engine.latestForWeek(forecastMonday())->run_id == run->run_id);
}

TEST_CASE("Engine blends trained models", "[integration][forecast][models]") {
	EngineFixture fixture;
	auto engine = fixture.make();
	REQUIRE(engine.ingest(longExport("Sourdough Loaf", 8, kSourdough)).ok());
	REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-05-31", "Fig Tart", "2"}})).ok());

	const auto trained = engine.trainAll();
	REQUIRE(trained.size() == 1);
	REQUIRE(trained.front().version == 1);
	REQUIRE_FALSE(engine.train(*engine.findItem("Fig Tart")).has_value());
	REQUIRE(engine.train(*engine.findItem("Sourdough Loaf"))->version == 2);
	REQUIRE_THROWS_AS(engine.train(99), std::invalid_argument);

	const auto run = engine.forecast(forecastMonday(), 1.0);
	const auto *sourdough = run->line(*engine.findItem("Sourdough Loaf"));
	REQUIRE(sourdough != nullptr);
	REQUIRE(sourdough->model_version == std::uint64_t{2});
	REQUIRE(sourdough->model_prediction.has_value());
	REQUIRE(sourdough->quantities[5] == Catch::Approx(80.0).margin(5.0));

	const auto baseline_only = engine.forecast(forecastMonday(), 1.0, false);
	REQUIRE_FALSE(baseline_only->line(*engine.findItem("Sourdough Loaf"))->model_version.has_value());
	REQUIRE(engine.runsForWeek(forecastMonday()).size() == 2);
	REQUIRE(engine.runsForWeek(forecastMonday()).front()->run_id == baseline_only->run_id);
}

TEST_CASE("Engine keeps cold-start items in the run", "[integration][forecast][cold_start]") {
	EngineFixture fixture;
	auto engine = fixture.make();
	REQUIRE(engine.ingest(longExport("Sourdough Loaf", 4, kSourdough)).ok());
	// Sold once, long before the baseline lookback.
	REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2023-01-07", "Hot Cross Bun", "120"}})).ok());

	const auto run = engine.forecast(forecastMonday(), 0.5);
	REQUIRE(run->lines.size() == 2);
	const auto *bun = run->line(*engine.findItem("Hot Cross Bun"));
	REQUIRE(bun != nullptr);
	REQUIRE(bun->cold_start);
	for (double quantity : bun->quantities) {
		REQUIRE(quantity == 0.0);
	}
	REQUIRE(run->lines.front().item_name == "Hot Cross Bun");
	REQUIRE_FALSE(run->alerts.empty());
	REQUIRE(run->alerts.front().reason == prepcast::forecast::reasons::kColdStart);
}

TEST_CASE("Engine refuses to forecast on stale history", "[integration][forecast][readiness]") {
	EngineFixture fixture;

	SECTION("no history at all") {
		auto engine = fixture.make();
		REQUIRE_THROWS_AS(engine.forecast(forecastMonday(), 0.5), prepcast::core::HistoryNotReady);
	}

	SECTION("history ends a week early") {
		auto engine = fixture.make();
		REQUIRE(engine.ingest(longExport("Sourdough Loaf", 4, kSourdough, forecastMonday().addDays(-7))).ok());
		REQUIRE_THROWS_AS(engine.forecast(forecastMonday(), 0.5), prepcast::core::HistoryNotReady);
		REQUIRE(engine.latestForWeek(forecastMonday()) == nullptr);
	}

	SECTION("the closed Sunday needs no sales") {
		auto engine = fixture.make();
		REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-05-31", "Sourdough Loaf", "60"}})).ok());
		REQUIRE_THROWS_AS(engine.checkReadiness(forecastMonday()), prepcast::core::HistoryNotReady);
		REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-06-01", "Sourdough Loaf", "80"}})).ok());
		REQUIRE_NOTHROW(engine.checkReadiness(forecastMonday()));
		REQUIRE_THROWS_AS(engine.checkReadiness(forecastMonday().addDays(7)), prepcast::core::HistoryNotReady);
	}

	SECTION("tolerance allows older history") {
		Settings settings;
		settings.readiness.tolerance_days = 2;
		auto engine = fixture.make(settings);
		REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-05-31", "Sourdough Loaf", "60"}})).ok());
		REQUIRE_NOTHROW(engine.checkReadiness(forecastMonday()));
		REQUIRE(engine.ingest(makeTable({"Date", "Item", "Qty"}, {{"2024-05-29", "Rye", "6"}})).ok());
		REQUIRE_THROWS_AS(engine.checkReadiness(forecastMonday().addDays(7)), prepcast::core::HistoryNotReady);
	}

	SECTION("readiness can be waived") {
		Settings settings;
		settings.readiness.enforce = false;
		auto engine = fixture.make(settings);
		REQUIRE(engine.forecast(forecastMonday(), 0.5)->lines.empty());
	}
}

TEST_CASE("Engine validates forecast arguments", "[integration][forecast][error]") {
	EngineFixture fixture;
	auto engine = fixture.make();
	REQUIRE(engine.ingest(longExport("Sourdough Loaf", 4, kSourdough)).ok());

	REQUIRE_THROWS_AS(engine.forecast(forecastMonday(), 1.2), std::invalid_argument);
	REQUIRE_THROWS_AS(engine.forecast(forecastMonday(), -0.5), std::invalid_argument);
	REQUIRE_THROWS_AS(engine.forecast(forecastMonday().addDays(1), 0.5), std::invalid_argument);
	REQUIRE(engine.runsForWeek(forecastMonday()).empty());
}
