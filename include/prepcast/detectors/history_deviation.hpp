#pragma once

#include "prepcast/detectors/ideviation_detector.hpp"

#include <memory>

namespace prepcast::detectors {

class HistoryDeviationDetectorBuilder; // Forward declaration

/**
 * @class HistoryDeviationDetector
 * @brief Flags values more than `threshold` standard deviations from the historical mean.
 *
 * Needs at least `min_history` observations and a positive standard deviation;
 * otherwise nothing is flagged.
 */
class HistoryDeviationDetector final : public IDeviationDetector {
public:
	friend class HistoryDeviationDetectorBuilder;

	std::optional<Deviation> check(double value, const baseline::HistoryStats &history) const override;
	std::string getName() const override {
		return "HistoryDeviationDetector";
	}

	double threshold() const {
		return threshold_;
	}

private:
	/**
	 * @brief Private constructor for HistoryDeviationDetector.
	 * @param threshold The number of standard deviations from the mean.
	 * @param min_history Minimum number of historical observations.
	 */
	HistoryDeviationDetector(double threshold, std::size_t min_history);

	double threshold_;
	std::size_t min_history_;
};

/**
 * @class HistoryDeviationDetectorBuilder
 * @brief A builder for fluently configuring and creating HistoryDeviationDetector instances.
 */
class HistoryDeviationDetectorBuilder {
public:
	/**
	 * @brief Sets the threshold for flagging.
	 * @param threshold The number of standard deviations from the mean.
	 * @return A reference to the builder for chaining.
	 */
	HistoryDeviationDetectorBuilder &withThreshold(double threshold);

	HistoryDeviationDetectorBuilder &withMinimumHistory(std::size_t min_history);

	/**
	 * @brief Creates a new HistoryDeviationDetector instance.
	 * @return A unique pointer to the configured detector.
	 */
	std::unique_ptr<HistoryDeviationDetector> build();

private:
	double threshold_ = 1.5;
	std::size_t min_history_ = 2;
};

} // namespace prepcast::detectors
