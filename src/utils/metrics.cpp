#include "prepcast/utils/metrics.hpp"

#include <cmath>
#include <stdexcept>

namespace prepcast::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mapeUnitFloor(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double denom = actual[i] == 0.0 ? 1.0 : std::abs(actual[i]);
		sum += std::abs(actual[i] - predicted[i]) / denom;
	}
	return (sum / static_cast<double>(actual.size())) * 100.0;
}

} // namespace prepcast::utils
