#pragma once

#include "prepcast/models/iregressor.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <vector>

namespace prepcast::utils {

/**
 * @brief Results from a single CV fold
 */
struct CVFold {
	int fold_id = 0;
	int train_start = 0;
	int train_end = 0;  // exclusive
	int test_start = 0;
	int test_end = 0;   // exclusive

	std::vector<double> forecasts;
	std::vector<double> actuals;

	double mae = 0.0;
	/// MAPE in percent, zero actuals divided by 1.
	double mape = 0.0;
};

/**
 * @brief Results from cross-validation
 */
struct CVResults {
	std::vector<CVFold> folds;

	double mae = 0.0;
	/// Mean of the fold MAPEs; absent when no fold could be formed.
	std::optional<double> mape;

	int total_forecasts = 0;

	/**
	 * @brief Compute aggregated metrics from all folds
	 */
	void computeAggregatedMetrics();
};

/**
 * @brief Rolling-origin cross-validation for per-item regressors
 *
 * Each fold trains on the first k samples and tests on all remaining ones,
 * with k = floor(n * fraction) for each configured fraction.
 */
class CrossValidation {
public:
	/**
	 * @brief Generate fold indices
	 *
	 * Fractions whose split leaves fewer than @p min_train training samples or
	 * no test sample are skipped.
	 *
	 * @return Vector of (train_start, train_end, test_start, test_end) tuples
	 */
	static std::vector<std::tuple<int, int, int, int>> generateFolds(int n_samples, const std::vector<double> &fractions,
	                                                                 int min_train);

	/**
	 * @brief Fit a fresh model per fold and score it on the held-out tail
	 *
	 * @param features Samples in chronological order
	 * @param target Observed values aligned with @p features
	 * @param model_factory Creates an unfitted model for each fold
	 */
	static CVResults evaluate(const Eigen::MatrixXd &features, const Eigen::VectorXd &target,
	                          const std::function<std::unique_ptr<models::IRegressor>()> &model_factory,
	                          const std::vector<double> &fractions, int min_train);
};

} // namespace prepcast::utils
