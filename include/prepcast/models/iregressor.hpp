#pragma once

#include <Eigen/Dense>
#include <yaml-cpp/yaml.h>

#include <string>

namespace prepcast::models {

/**
 * @class IRegressor
 * @brief An interface for per-item regression algorithms.
 */
class IRegressor {
public:
	virtual ~IRegressor() = default;

	/**
	 * @brief Fits the model to a feature matrix.
	 * @param features One row per training sample.
	 * @param target Observed quantity per sample.
	 */
	virtual void fit(const Eigen::MatrixXd &features, const Eigen::VectorXd &target) = 0;

	/**
	 * @brief Predicts one value per feature row.
	 * @throws std::runtime_error If the model has not been fitted.
	 */
	virtual Eigen::VectorXd predict(const Eigen::MatrixXd &features) const = 0;

	/// Fitted parameters, enough to restore the model without refitting.
	virtual YAML::Node parameters() const = 0;

	/// The algorithm tag stored with persisted models.
	virtual std::string getName() const = 0;
};

} // namespace prepcast::models
