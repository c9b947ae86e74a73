#pragma once

#include "prepcast/core/date.hpp"

#include <optional>
#include <string>

namespace prepcast::core {

enum class SignalKind { Weather, Holiday, Event };

/**
 * @struct AdjustmentSignal
 * @brief A read-only multiplicative signal for one date.
 */
struct AdjustmentSignal {
	Date date;
	SignalKind kind = SignalKind::Event;
	double multiplier = 1.0;
	/// Confidence in [0, 1]; blends the multiplier toward neutral.
	double weight = 1.0;
	std::string label;
};

/**
 * @struct WeatherObservation
 * @brief Observed or forecast weather for one day at one location.
 */
struct WeatherObservation {
	std::optional<double> max_temp;
	std::optional<double> precipitation;
	/// Day the observation was issued, when the feed knows it.
	std::optional<Date> issued_on;
};

} // namespace prepcast::core
