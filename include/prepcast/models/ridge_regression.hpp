#pragma once

#include "prepcast/models/iregressor.hpp"

#include <memory>

namespace prepcast::models {

class RidgeRegressionBuilder; // Forward declaration

/**
 * @class RidgeRegression
 * @brief L2-regularized linear regression on standardized features.
 *
 * Each feature column is centred and scaled to unit variance before fitting
 * (a constant column keeps scale 1); the intercept is not penalized.
 * Coefficients minimize ||y - b0 - Zw||^2 + alpha ||w||^2.
 */
class RidgeRegression final : public IRegressor {
public:
	friend class RidgeRegressionBuilder;

	void fit(const Eigen::MatrixXd &features, const Eigen::VectorXd &target) override;
	Eigen::VectorXd predict(const Eigen::MatrixXd &features) const override;
	YAML::Node parameters() const override;
	std::string getName() const override {
		return "ridge";
	}

	/**
	 * @brief Rebuilds a fitted model from parameters() output.
	 * @throws std::invalid_argument If the parameters are incomplete or inconsistent.
	 */
	static std::unique_ptr<RidgeRegression> fromParameters(const YAML::Node &node);

	double alpha() const {
		return alpha_;
	}

	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}

	double intercept() const {
		return intercept_;
	}

private:
	/**
	 * @brief Private constructor for RidgeRegression.
	 * @param alpha Penalty strength; 0 gives ordinary least squares.
	 */
	explicit RidgeRegression(double alpha);

	double alpha_;
	Eigen::VectorXd means_;
	Eigen::VectorXd scales_;
	Eigen::VectorXd coefficients_;
	double intercept_ = 0.0;
	bool is_fitted_ = false;
};

/**
 * @class RidgeRegressionBuilder
 * @brief A builder for fluently configuring and creating RidgeRegression models.
 */
class RidgeRegressionBuilder {
public:
	/**
	 * @brief Sets the penalty strength.
	 * @param alpha Non-negative L2 penalty.
	 * @return A reference to the builder for chaining.
	 */
	RidgeRegressionBuilder &withAlpha(double alpha);

	/**
	 * @brief Creates a new RidgeRegression model instance.
	 * @return A unique pointer to the configured model.
	 */
	std::unique_ptr<RidgeRegression> build();

private:
	double alpha_ = 1.0;
};

} // namespace prepcast::models
