#include "prepcast/detectors/history_deviation.hpp"
#include "prepcast/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace prepcast::detectors {

// --- Detector Implementation ---

HistoryDeviationDetector::HistoryDeviationDetector(double threshold, std::size_t min_history)
    : threshold_(threshold), min_history_(min_history) {
	if (threshold_ <= 0) {
		throw std::invalid_argument("Threshold must be positive.");
	}
	if (min_history_ < 2) {
		throw std::invalid_argument("A standard deviation needs at least 2 observations.");
	}
}

std::optional<Deviation> HistoryDeviationDetector::check(double value, const baseline::HistoryStats &history) const {
	// A zero spread means every observation was identical; nothing can be judged unusual.
	if (history.count < min_history_ || !(history.stddev > 0.0)) {
		return std::nullopt;
	}
	const double score = (value - history.mean) / history.stddev;
	if (std::abs(score) <= threshold_) {
		return std::nullopt;
	}
	return Deviation{value, history.mean, history.stddev, score};
}

// --- Builder Implementation ---

HistoryDeviationDetectorBuilder &HistoryDeviationDetectorBuilder::withThreshold(double threshold) {
	threshold_ = threshold;
	return *this;
}

HistoryDeviationDetectorBuilder &HistoryDeviationDetectorBuilder::withMinimumHistory(std::size_t min_history) {
	min_history_ = min_history;
	return *this;
}

std::unique_ptr<HistoryDeviationDetector> HistoryDeviationDetectorBuilder::build() {
	PREPCAST_DEBUG("Building HistoryDeviationDetector with threshold {}.", threshold_);
	return std::unique_ptr<HistoryDeviationDetector>(new HistoryDeviationDetector(threshold_, min_history_));
}

} // namespace prepcast::detectors
