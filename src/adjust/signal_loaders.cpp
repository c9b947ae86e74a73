#include "prepcast/adjust/signal_loaders.hpp"
#include "prepcast/ingest/normalizer.hpp"
#include "prepcast/utils/logging.hpp"

#include <cctype>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace prepcast::adjust {

namespace {

std::optional<std::size_t> column(const ingest::RawTable &table, const std::string &name) {
	for (std::size_t i = 0; i < table.headers.size(); ++i) {
		if (ingest::Normalizer::normalizeKey(table.headers[i]) == name) {
			return i;
		}
	}
	return std::nullopt;
}

std::size_t requireColumn(const ingest::RawTable &table, const std::string &name) {
	const auto index = column(table, name);
	if (!index) {
		throw std::invalid_argument("Table '" + table.source_name + "' has no '" + name + "' column.");
	}
	return *index;
}

std::optional<double> parseNumber(const std::string &text) {
	try {
		std::size_t consumed = 0;
		const double value = std::stod(text, &consumed);
		if (!std::isfinite(value)) {
			return std::nullopt;
		}
		while (consumed < text.size() && std::isspace(static_cast<unsigned char>(text[consumed]))) {
			++consumed;
		}
		if (consumed != text.size()) {
			return std::nullopt;
		}
		return value;
	} catch (const std::exception &) {
		return std::nullopt;
	}
}

} // namespace

std::vector<core::AdjustmentSignal> loadEventSignals(const ingest::RawTable &table, bool day_first) {
	const auto date_col = requireColumn(table, "date");
	const auto uplift_col = requireColumn(table, "uplift_pct");
	const auto name_col = column(table, "event_name");
	const auto type_col = column(table, "event_type");

	std::vector<core::AdjustmentSignal> signals;
	signals.reserve(table.rows.size());
	for (std::size_t row = 0; row < table.rows.size(); ++row) {
		const auto date = core::Date::parse(table.cell(row, date_col), day_first);
		if (!date) {
			PREPCAST_WARN("Skipping event row {} of '{}': unparseable date '{}'.", row + 2, table.source_name,
			              table.cell(row, date_col));
			continue;
		}
		const auto uplift = parseNumber(table.cell(row, uplift_col)).value_or(0.0);
		const auto type = type_col ? ingest::Normalizer::normalizeKey(table.cell(row, *type_col)) : std::string();

		core::AdjustmentSignal signal;
		signal.date = *date;
		signal.kind = type == "public_holiday" ? core::SignalKind::Holiday : core::SignalKind::Event;
		signal.multiplier = 1.0 + uplift / 100.0;
		signal.label = name_col ? table.cell(row, *name_col) : std::string();
		signals.push_back(std::move(signal));
	}
	PREPCAST_INFO("Loaded {} event signals from '{}'.", signals.size(), table.source_name);
	return signals;
}

std::size_t loadWeather(const ingest::RawTable &table, store::InMemoryWeatherFeed &feed, const std::string &location,
                        bool day_first) {
	const auto date_col = requireColumn(table, "date");
	const auto temp_col = column(table, "max_temp");
	const auto rain_col = column(table, "rain_mm");

	std::size_t stored = 0;
	for (std::size_t row = 0; row < table.rows.size(); ++row) {
		const auto date = core::Date::parse(table.cell(row, date_col), day_first);
		if (!date) {
			PREPCAST_WARN("Skipping weather row {} of '{}': unparseable date.", row + 2, table.source_name);
			continue;
		}
		core::WeatherObservation observation;
		if (temp_col) {
			observation.max_temp = parseNumber(table.cell(row, *temp_col));
		}
		if (rain_col) {
			observation.precipitation = parseNumber(table.cell(row, *rain_col));
		}
		feed.put(*date, location, observation);
		++stored;
	}
	PREPCAST_INFO("Loaded {} weather observations for '{}'.", stored, location);
	return stored;
}

HolidayCalendar::HolidayCalendar(store::InMemoryHolidayFeed &feed, double default_uplift_pct)
    : feed_(feed), default_uplift_pct_(default_uplift_pct) {
}

void HolidayCalendar::addHoliday(const core::Date &date, const std::string &name, std::optional<double> uplift_pct) {
	core::AdjustmentSignal signal;
	signal.date = date;
	signal.kind = core::SignalKind::Holiday;
	signal.multiplier = 1.0 + uplift_pct.value_or(default_uplift_pct_) / 100.0;
	signal.label = name;
	feed_.add(std::move(signal));
}

std::size_t HolidayCalendar::addEvents(const ingest::RawTable &table, bool day_first) {
	auto signals = loadEventSignals(table, day_first);
	for (auto &signal : signals) {
		feed_.add(std::move(signal));
	}
	return signals.size();
}

} // namespace prepcast::adjust
