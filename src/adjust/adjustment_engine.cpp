#include "prepcast/adjust/adjustment_engine.hpp"
#include "prepcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace prepcast::adjust {

namespace {

const char *kindName(core::SignalKind kind) {
	switch (kind) {
	case core::SignalKind::Weather:
		return "weather";
	case core::SignalKind::Holiday:
		return "holiday";
	case core::SignalKind::Event:
		return "event";
	}
	return "signal";
}

std::string formatNote(const core::AdjustmentSignal &signal, double effective) {
	std::ostringstream note;
	note.precision(3);
	note << signal.date.toString() << ' ' << kindName(signal.kind);
	if (!signal.label.empty()) {
		note << " '" << signal.label << "'";
	}
	note << " x" << effective;
	return note.str();
}

} // namespace

AdjustmentEngine::AdjustmentEngine(config::AdjustmentSettings settings, const store::IWeatherFeed *weather_feed,
                                   const store::IHolidayFeed *holiday_feed)
    : settings_(std::move(settings)), weather_feed_(weather_feed), holiday_feed_(holiday_feed) {
	if (!(settings_.min_multiplier > 0.0) || settings_.min_multiplier > settings_.max_multiplier) {
		throw std::invalid_argument("Adjustment clamp range must satisfy 0 < min <= max.");
	}
	if (settings_.max_weather_age_days < 0) {
		throw std::invalid_argument("max_weather_age_days must be non-negative.");
	}
}

double AdjustmentEngine::effectiveMultiplier(const core::AdjustmentSignal &signal) {
	const double weight = std::clamp(signal.weight, 0.0, 1.0);
	return 1.0 + weight * (signal.multiplier - 1.0);
}

double AdjustmentEngine::weatherFactor(const core::WeatherObservation &observation,
                                       const config::WeatherSensitivity &sensitivity) const {
	double factor = 1.0;
	if (observation.max_temp && std::isfinite(*observation.max_temp)) {
		const double delta = (*observation.max_temp - settings_.temperature_anchor) / 10.0;
		factor *= std::max(0.0, 1.0 + sensitivity.temperature * delta);
	}
	if (observation.precipitation && std::isfinite(*observation.precipitation)) {
		const double delta = (*observation.precipitation - settings_.precipitation_anchor) / 10.0;
		factor *= std::max(0.0, 1.0 + sensitivity.precipitation * delta);
	}
	return factor;
}

std::optional<core::WeatherObservation> AdjustmentEngine::lookupWeather(const core::Date &date,
                                                                       const core::Date &week_start) const {
	if (weather_feed_ == nullptr) {
		return std::nullopt;
	}
	std::optional<core::WeatherObservation> observation;
	try {
		observation = weather_feed_->get(date, settings_.location);
	} catch (const std::exception &e) {
		PREPCAST_WARN("Weather feed unavailable for {}: {}. Using neutral weather.", date.toString(), e.what());
		return std::nullopt;
	}
	if (!observation) {
		PREPCAST_DEBUG("No weather for {} at '{}'.", date.toString(), settings_.location);
		return std::nullopt;
	}
	if (observation->issued_on && week_start.daysSince(*observation->issued_on) > settings_.max_weather_age_days) {
		PREPCAST_WARN("Weather for {} was issued on {} and is stale. Using neutral weather.", date.toString(),
		              observation->issued_on->toString());
		return std::nullopt;
	}
	return observation;
}

std::vector<core::AdjustmentSignal> AdjustmentEngine::lookupSignals(const core::Date &date) const {
	if (holiday_feed_ == nullptr) {
		return {};
	}
	try {
		return holiday_feed_->get(date);
	} catch (const std::exception &e) {
		PREPCAST_WARN("Holiday feed unavailable for {}: {}. No event adjustment applied.", date.toString(), e.what());
		return {};
	}
}

AdjustmentBreakdown AdjustmentEngine::adjust(const core::Date &date, const core::Date &week_start,
                                             const config::WeatherSensitivity *item_sensitivity) const {
	AdjustmentBreakdown breakdown;

	const config::WeatherSensitivity *sensitivity = item_sensitivity;
	if (sensitivity == nullptr && settings_.default_weather_sensitivity) {
		sensitivity = &*settings_.default_weather_sensitivity;
	}
	if (sensitivity != nullptr) {
		if (const auto observation = lookupWeather(date, week_start)) {
			breakdown.weather = weatherFactor(*observation, *sensitivity);
			if (breakdown.weather != 1.0) {
				std::ostringstream note;
				note.precision(3);
				note << date.toString() << " weather x" << breakdown.weather;
				breakdown.notes.push_back(note.str());
			}
		}
	}

	for (const auto &signal : lookupSignals(date)) {
		if (!std::isfinite(signal.multiplier) || signal.multiplier < 0.0) {
			PREPCAST_WARN("Ignoring invalid {} signal '{}' on {} (multiplier {}).", kindName(signal.kind), signal.label,
			              date.toString(), signal.multiplier);
			continue;
		}
		const double effective = effectiveMultiplier(signal);
		breakdown.events *= effective;
		breakdown.notes.push_back(formatNote(signal, effective));
	}

	breakdown.raw = breakdown.weather * breakdown.events;
	breakdown.multiplier = std::clamp(breakdown.raw, settings_.min_multiplier, settings_.max_multiplier);
	breakdown.clamped = breakdown.multiplier != breakdown.raw;
	if (breakdown.clamped) {
		PREPCAST_INFO("Adjustment for {} clamped from {:.3f} to {:.3f}.", date.toString(), breakdown.raw,
		              breakdown.multiplier);
	}
	return breakdown;
}

double AdjustmentEngine::multiplier(const core::Date &date, const core::Date &week_start,
                                    const config::WeatherSensitivity *item_sensitivity) const {
	return adjust(date, week_start, item_sensitivity).multiplier;
}

} // namespace prepcast::adjust
