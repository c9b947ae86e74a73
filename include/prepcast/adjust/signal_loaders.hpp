#pragma once

#include "prepcast/core/signals.hpp"
#include "prepcast/ingest/raw_table.hpp"
#include "prepcast/store/memory_stores.hpp"

#include <optional>
#include <string>
#include <vector>

namespace prepcast::adjust {

/// Uplift applied to public holidays unless a calendar entry names its own.
constexpr double kDefaultHolidayUpliftPct = 15.0;

/**
 * @brief Converts an events table into adjustment signals.
 *
 * Expected columns (case-insensitive): `date`, `event_name`, `event_type`,
 * `uplift_pct`. The multiplier is 1 + uplift_pct / 100; rows whose type is
 * `public_holiday` become holiday signals, all others event signals. Rows
 * with an unparseable date are skipped with a warning, a blank or
 * non-numeric uplift counts as 0 %.
 *
 * @throws std::invalid_argument If the `date` or `uplift_pct` column is missing.
 */
std::vector<core::AdjustmentSignal> loadEventSignals(const ingest::RawTable &table, bool day_first = true);

/**
 * @brief Loads a weather table into an in-memory feed.
 *
 * Expected columns: `date`, `max_temp`, `rain_mm`; blank or non-numeric
 * values are recorded as absent.
 *
 * @return Number of observations stored.
 * @throws std::invalid_argument If the `date` column is missing.
 */
std::size_t loadWeather(const ingest::RawTable &table, store::InMemoryWeatherFeed &feed, const std::string &location,
                        bool day_first = true);

/**
 * @class HolidayCalendar
 * @brief Registers public holidays with a holiday feed.
 */
class HolidayCalendar {
public:
	explicit HolidayCalendar(store::InMemoryHolidayFeed &feed, double default_uplift_pct = kDefaultHolidayUpliftPct);

	/// Adds a public holiday; without @p uplift_pct the calendar default applies.
	void addHoliday(const core::Date &date, const std::string &name, std::optional<double> uplift_pct = std::nullopt);

	/**
	 * @brief Adds all rows of an events table.
	 * @return Number of signals added.
	 */
	std::size_t addEvents(const ingest::RawTable &table, bool day_first = true);

private:
	store::InMemoryHolidayFeed &feed_;
	double default_uplift_pct_;
};

} // namespace prepcast::adjust
