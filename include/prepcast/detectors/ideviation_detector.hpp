#pragma once

#include "prepcast/baseline/baseline_estimator.hpp"

#include <optional>
#include <string>

namespace prepcast::detectors {

/**
 * @struct Deviation
 * @brief A forecast value that lies unusually far from its history.
 */
struct Deviation {
	double value = 0.0;
	double mean = 0.0;
	double stddev = 0.0;
	/// Distance from the mean in standard deviations (signed).
	double score = 0.0;
};

/**
 * @class IDeviationDetector
 * @brief An interface for checks of a forecast value against historical statistics.
 */
class IDeviationDetector {
public:
	virtual ~IDeviationDetector() = default;

	/**
	 * @brief Checks one value.
	 * @param value The forecast value, before rounding.
	 * @param history Statistics of the comparable historical observations.
	 * @return The deviation when the value is flagged, std::nullopt otherwise.
	 */
	virtual std::optional<Deviation> check(double value, const baseline::HistoryStats &history) const = 0;

	/**
	 * @brief Gets the name of the detector.
	 * @return A string representing the detector's name.
	 */
	virtual std::string getName() const = 0;
};

} // namespace prepcast::detectors
