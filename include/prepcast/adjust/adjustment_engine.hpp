#pragma once

#include "prepcast/config/settings.hpp"
#include "prepcast/core/date.hpp"
#include "prepcast/core/signals.hpp"
#include "prepcast/store/interfaces.hpp"

#include <optional>
#include <string>
#include <vector>

namespace prepcast::adjust {

/**
 * @struct AdjustmentBreakdown
 * @brief The bounded multiplier of one day and the factors it was built from.
 */
struct AdjustmentBreakdown {
	double weather = 1.0;
	double events = 1.0;
	/// weather x events before clamping.
	double raw = 1.0;
	double multiplier = 1.0;
	bool clamped = false;
	/// Human-readable notes, one per applied signal.
	std::vector<std::string> notes;
};

/**
 * @class AdjustmentEngine
 * @brief Combines weather and holiday/event signals into one clamped multiplier per day.
 *
 * Weather acts through per-item sensitivities relative to neutral anchors:
 * factor = (1 + s_t (T - T0) / 10) (1 + s_p (P - P0) / 10), each term floored at 0.
 * Holiday and event signals compose multiplicatively after blending each
 * toward neutral by its weight. Missing, stale or failing feeds are neutral.
 *
 * Both feeds are optional and are not owned by the engine.
 */
class AdjustmentEngine {
public:
	AdjustmentEngine(config::AdjustmentSettings settings, const store::IWeatherFeed *weather_feed,
	                 const store::IHolidayFeed *holiday_feed);

	/**
	 * @brief Computes the adjustment for one forecast day.
	 * @param date The day being forecast.
	 * @param week_start Monday of the forecast week, the reference for staleness.
	 * @param item_sensitivity Weather sensitivity of the item, or nullptr to use the configured default.
	 */
	AdjustmentBreakdown adjust(const core::Date &date, const core::Date &week_start,
	                           const config::WeatherSensitivity *item_sensitivity = nullptr) const;

	/// Shorthand for adjust(...).multiplier.
	double multiplier(const core::Date &date, const core::Date &week_start,
	                  const config::WeatherSensitivity *item_sensitivity = nullptr) const;

	/// Weather factor of one observation; absent values are neutral.
	double weatherFactor(const core::WeatherObservation &observation,
	                     const config::WeatherSensitivity &sensitivity) const;

	/// Multiplier of one signal blended toward 1.0 by its weight (clamped to [0, 1]).
	static double effectiveMultiplier(const core::AdjustmentSignal &signal);

	const config::AdjustmentSettings &settings() const {
		return settings_;
	}

private:
	std::optional<core::WeatherObservation> lookupWeather(const core::Date &date, const core::Date &week_start) const;
	std::vector<core::AdjustmentSignal> lookupSignals(const core::Date &date) const;

	config::AdjustmentSettings settings_;
	const store::IWeatherFeed *weather_feed_;
	const store::IHolidayFeed *holiday_feed_;
};

} // namespace prepcast::adjust
