#include "prepcast/utils/cross_validation.hpp"
#include "prepcast/utils/logging.hpp"
#include "prepcast/utils/metrics.hpp"

#include <stdexcept>

namespace prepcast::utils {

void CVResults::computeAggregatedMetrics() {
	total_forecasts = 0;
	mae = 0.0;
	mape.reset();
	if (folds.empty()) {
		return;
	}
	double mape_sum = 0.0;
	double abs_error_sum = 0.0;
	for (const auto &fold : folds) {
		mape_sum += fold.mape;
		abs_error_sum += fold.mae * static_cast<double>(fold.actuals.size());
		total_forecasts += static_cast<int>(fold.actuals.size());
	}
	mape = mape_sum / static_cast<double>(folds.size());
	mae = total_forecasts > 0 ? abs_error_sum / static_cast<double>(total_forecasts) : 0.0;
}

std::vector<std::tuple<int, int, int, int>>
CrossValidation::generateFolds(int n_samples, const std::vector<double> &fractions, int min_train) {
	if (n_samples < 0 || min_train < 1) {
		throw std::invalid_argument("Sample count must be non-negative and min_train positive.");
	}

	std::vector<std::tuple<int, int, int, int>> folds;
	for (double fraction : fractions) {
		if (fraction <= 0.0 || fraction >= 1.0) {
			throw std::invalid_argument("Cross-validation fractions must lie in (0, 1).");
		}
		const int split = static_cast<int>(static_cast<double>(n_samples) * fraction);
		if (split < min_train || split >= n_samples) {
			continue;
		}
		folds.emplace_back(0, split, split, n_samples);
	}
	return folds;
}

CVResults CrossValidation::evaluate(const Eigen::MatrixXd &features, const Eigen::VectorXd &target,
                                    const std::function<std::unique_ptr<models::IRegressor>()> &model_factory,
                                    const std::vector<double> &fractions, int min_train) {
	if (features.rows() != target.size()) {
		throw std::invalid_argument("Feature rows must match the target length.");
	}
	const auto fold_indices = generateFolds(static_cast<int>(target.size()), fractions, min_train);

	CVResults results;
	results.folds.reserve(fold_indices.size());
	int fold_id = 0;
	for (const auto &[train_start, train_end, test_start, test_end] : fold_indices) {
		CVFold fold;
		fold.fold_id = fold_id++;
		fold.train_start = train_start;
		fold.train_end = train_end;
		fold.test_start = test_start;
		fold.test_end = test_end;

		auto model = model_factory();
		model->fit(features.middleRows(train_start, train_end - train_start),
		           target.segment(train_start, train_end - train_start));
		const Eigen::VectorXd predicted = model->predict(features.middleRows(test_start, test_end - test_start));

		fold.forecasts.assign(predicted.data(), predicted.data() + predicted.size());
		fold.actuals.assign(target.data() + test_start, target.data() + test_end);
		fold.mae = Metrics::mae(fold.actuals, fold.forecasts);
		fold.mape = Metrics::mapeUnitFloor(fold.actuals, fold.forecasts);
		results.folds.push_back(std::move(fold));
	}

	results.computeAggregatedMetrics();
	PREPCAST_DEBUG("Cross-validation over {} folds, {} forecasts.", results.folds.size(), results.total_forecasts);
	return results;
}

} // namespace prepcast::utils
