#include "prepcast/adjust/signal_loaders.hpp"
#include "prepcast/config/settings.hpp"
#include "prepcast/core/errors.hpp"
#include "prepcast/forecast_engine.hpp"
#include "prepcast/ingest/raw_table.hpp"
#include "prepcast/report/order_sheet.hpp"
#include "prepcast/store/memory_stores.hpp"
#include "prepcast/utils/logging.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

using namespace prepcast;

namespace {

struct Options {
	std::string sales_path;
	std::string config_path;
	std::string events_path;
	std::string weather_path;
	std::string week;
	double alpha = 0.5;
	bool use_model = true;
	bool verbose = false;
};

void printUsage(const char *program) {
	std::cerr << "Usage: " << program
	          << " [sales.csv] [--config settings.yaml] [--events events.csv] [--weather weather.csv]\n"
	          << "       [--week YYYY-MM-DD] [--alpha 0..1] [--no-model] [--verbose]\n"
	          << "Without a sales file a ten-week demo history is generated.\n";
}

bool parseArgs(int argc, char **argv, Options &options) {
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		auto next = [&](std::string &target) {
			if (i + 1 >= argc) {
				return false;
			}
			target = argv[++i];
			return true;
		};
		std::string value;
		if (arg == "--config") {
			if (!next(options.config_path))
				return false;
		} else if (arg == "--events") {
			if (!next(options.events_path))
				return false;
		} else if (arg == "--weather") {
			if (!next(options.weather_path))
				return false;
		} else if (arg == "--week") {
			if (!next(options.week))
				return false;
		} else if (arg == "--alpha") {
			if (!next(value))
				return false;
			options.alpha = std::atof(value.c_str());
		} else if (arg == "--no-model") {
			options.use_model = false;
		} else if (arg == "--verbose") {
			options.verbose = true;
		} else if (!arg.empty() && arg[0] != '-' && options.sales_path.empty()) {
			options.sales_path = arg;
		} else {
			return false;
		}
	}
	return true;
}

// Wide export in the layout of a POS "item sales by day" report.
ingest::RawTable demoSales(const core::Date &week_start) {
	ingest::RawTable table;
	table.source_name = "demo";
	table.headers.push_back("Item Name");
	const int weeks = 10;
	std::vector<core::Date> days;
	for (int w = weeks; w >= 1; --w) {
		for (int d = 0; d < 6; ++d) {
			days.push_back(week_start.addDays(-7 * w + d));
		}
	}
	for (const auto &day : days) {
		table.headers.push_back(day.toString());
	}
	const std::vector<std::pair<std::string, double>> items{
	    {"Sourdough Loaf", 42.0}, {"Croissant", 60.0}, {"Pain au Chocolat", 35.0}, {"Rye Bread", 12.0}};
	for (const auto &item : items) {
		std::vector<std::string> row{item.first};
		for (std::size_t i = 0; i < days.size(); ++i) {
			const int weekday = days[i].weekday();
			const double weekend_lift = weekday == 5 ? 1.4 : (weekday == 4 ? 1.15 : 1.0);
			const double wobble = 1.0 + 0.08 * std::sin(static_cast<double>(i) * 1.7);
			row.push_back(std::to_string(static_cast<int>(std::round(item.second * weekend_lift * wobble))));
		}
		table.rows.push_back(std::move(row));
	}
	return table;
}

} // namespace

int main(int argc, char **argv) {
	Options options;
	if (!parseArgs(argc, argv, options)) {
		printUsage(argv[0]);
		return 2;
	}
	utils::Logging::init(options.verbose ? spdlog::level::debug : spdlog::level::warn);

	try {
		const auto settings = options.config_path.empty() ? config::Settings{}
		                                                  : config::loadSettingsFile(options.config_path);

		core::Date week_start;
		if (options.week.empty()) {
			week_start = core::nextMonday(core::Date::fromDaysSinceEpoch(
			    std::chrono::duration_cast<std::chrono::hours>(std::chrono::system_clock::now().time_since_epoch())
			        .count() /
			    24));
		} else {
			const auto parsed = core::Date::parse(options.week, settings.normalizer.day_first);
			if (!parsed) {
				std::cerr << "Invalid --week '" << options.week << "'.\n";
				return 2;
			}
			week_start = core::nextMonday(*parsed);
		}

		store::InMemorySalesStore sales;
		store::InMemoryModelStore models;
		store::InMemoryForecastRunStore runs;
		store::InMemoryWeatherFeed weather;
		store::InMemoryHolidayFeed holidays;

		if (!options.events_path.empty()) {
			adjust::HolidayCalendar calendar(holidays);
			calendar.addEvents(ingest::readCsvFile(options.events_path), settings.normalizer.day_first);
		}
		if (!options.weather_path.empty()) {
			adjust::loadWeather(ingest::readCsvFile(options.weather_path), weather, settings.adjustment.location,
			                    settings.normalizer.day_first);
		}

		ForecastEngine engine(settings, sales, models, runs, &weather, &holidays);
		const auto table = options.sales_path.empty() ? demoSales(week_start) : ingest::readCsvFile(options.sales_path);
		const auto ingested = engine.ingest(table);
		for (const auto &error : ingested.errors) {
			std::cerr << "error: " << error << '\n';
		}
		for (const auto &rejected : ingested.rejected_rows) {
			std::cerr << "rejected " << rejected.source_row_ref << ": " << rejected.reason << '\n';
		}
		if (!ingested.ok()) {
			return 1;
		}

		if (options.use_model) {
			const auto trained = engine.trainAll();
			std::cerr << "Trained " << trained.size() << " item models.\n";
		}

		const auto run = engine.forecast(week_start, options.alpha, options.use_model);
		std::cerr << "Forecast run " << run->run_id << " for week " << week_start.toString() << '\n';
		report::writeCsv(report::buildOrderSheet(*run), std::cout);
	} catch (const core::HistoryNotReady &e) {
		std::cerr << "History not ready: " << e.what() << '\n';
		return 1;
	} catch (const std::exception &e) {
		std::cerr << "Failed: " << e.what() << '\n';
		return 1;
	}
	return 0;
}
