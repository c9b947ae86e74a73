#include "prepcast/models/ridge_regression.hpp"
#include "prepcast/utils/logging.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

namespace prepcast::models {

namespace {

std::vector<double> toList(const Eigen::VectorXd &values) {
	return std::vector<double>(values.data(), values.data() + values.size());
}

Eigen::VectorXd fromList(const YAML::Node &node, const char *key) {
	if (!node[key] || !node[key].IsSequence()) {
		throw std::invalid_argument(std::string("Ridge parameters lack '") + key + "'.");
	}
	const auto values = node[key].as<std::vector<double>>();
	Eigen::VectorXd result(static_cast<Eigen::Index>(values.size()));
	for (std::size_t i = 0; i < values.size(); ++i) {
		result(static_cast<Eigen::Index>(i)) = values[i];
	}
	return result;
}

} // namespace

// --- Model Implementation ---

RidgeRegression::RidgeRegression(double alpha) : alpha_(alpha) {
	if (!(alpha_ >= 0.0) || !std::isfinite(alpha_)) {
		throw std::invalid_argument("Ridge alpha must be a finite non-negative number.");
	}
}

void RidgeRegression::fit(const Eigen::MatrixXd &features, const Eigen::VectorXd &target) {
	if (features.rows() == 0 || features.rows() != target.size()) {
		throw std::invalid_argument("Feature rows must be non-empty and match the target length.");
	}
	const auto n = static_cast<double>(features.rows());

	means_ = features.colwise().mean().transpose();
	const Eigen::MatrixXd centred = features.rowwise() - means_.transpose();
	scales_ = (centred.array().square().colwise().sum() / n).sqrt().transpose();
	for (Eigen::Index j = 0; j < scales_.size(); ++j) {
		if (scales_(j) < 1e-12) {
			scales_(j) = 1.0;
		}
	}
	const Eigen::MatrixXd standardized = centred.array().rowwise() / scales_.transpose().array();

	intercept_ = target.mean();
	const Eigen::VectorXd centred_target = target.array() - intercept_;

	Eigen::MatrixXd gram = standardized.transpose() * standardized;
	gram.diagonal().array() += alpha_;
	const Eigen::VectorXd rhs = standardized.transpose() * centred_target;
	if (alpha_ > 0.0) {
		coefficients_ = gram.ldlt().solve(rhs);
	} else {
		coefficients_ = gram.colPivHouseholderQr().solve(rhs);
	}
	is_fitted_ = true;

	PREPCAST_DEBUG("RidgeRegression fitted on {} samples with {} features (alpha {}).", features.rows(),
	               features.cols(), alpha_);
}

Eigen::VectorXd RidgeRegression::predict(const Eigen::MatrixXd &features) const {
	if (!is_fitted_) {
		throw std::runtime_error("RidgeRegression::predict called before fit.");
	}
	if (features.cols() != coefficients_.size()) {
		throw std::invalid_argument("Expected " + std::to_string(coefficients_.size()) + " features, got " +
		                            std::to_string(features.cols()) + ".");
	}
	const Eigen::MatrixXd standardized =
	    (features.rowwise() - means_.transpose()).array().rowwise() / scales_.transpose().array();
	return (standardized * coefficients_).array() + intercept_;
}

YAML::Node RidgeRegression::parameters() const {
	if (!is_fitted_) {
		throw std::runtime_error("RidgeRegression has no parameters before fit.");
	}
	YAML::Node node;
	node["alpha"] = alpha_;
	node["intercept"] = intercept_;
	node["coefficients"] = toList(coefficients_);
	node["means"] = toList(means_);
	node["scales"] = toList(scales_);
	return node;
}

std::unique_ptr<RidgeRegression> RidgeRegression::fromParameters(const YAML::Node &node) {
	if (!node || !node.IsMap()) {
		throw std::invalid_argument("Ridge parameters must be a mapping.");
	}
	try {
		std::unique_ptr<RidgeRegression> model(new RidgeRegression(node["alpha"].as<double>(1.0)));
		if (!node["intercept"]) {
			throw std::invalid_argument("Ridge parameters lack 'intercept'.");
		}
		model->intercept_ = node["intercept"].as<double>();
		model->coefficients_ = fromList(node, "coefficients");
		model->means_ = fromList(node, "means");
		model->scales_ = fromList(node, "scales");
		if (model->means_.size() != model->coefficients_.size() ||
		    model->scales_.size() != model->coefficients_.size()) {
			throw std::invalid_argument("Ridge parameter vectors differ in length.");
		}
		model->is_fitted_ = true;
		return model;
	} catch (const YAML::Exception &e) {
		throw std::invalid_argument(std::string("Malformed ridge parameters: ") + e.what());
	}
}

// --- Builder Implementation ---

RidgeRegressionBuilder &RidgeRegressionBuilder::withAlpha(double alpha) {
	alpha_ = alpha;
	return *this;
}

std::unique_ptr<RidgeRegression> RidgeRegressionBuilder::build() {
	PREPCAST_DEBUG("Building RidgeRegression with alpha {}.", alpha_);
	return std::unique_ptr<RidgeRegression>(new RidgeRegression(alpha_));
}

} // namespace prepcast::models
