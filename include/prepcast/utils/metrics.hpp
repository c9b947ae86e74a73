#pragma once

#include <vector>

namespace prepcast::utils {

/**
 * @class Metrics
 * @brief Accuracy measures over paired actual/predicted vectors.
 *
 * All functions throw std::invalid_argument when the vectors are empty or of
 * different length.
 */
class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief MAPE in percent where a zero actual is divided by 1 instead of skipped.
	 *
	 * Days without sales still count against the model, which matters for
	 * items that regularly sell nothing on some weekdays.
	 */
	static double mapeUnitFloor(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace prepcast::utils
