#pragma once

#include "prepcast/config/settings.hpp"
#include "prepcast/models/iregressor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace prepcast::models {

/**
 * @class RegressorFactory
 * @brief Creates and restores regressors by algorithm tag.
 */
class RegressorFactory {
public:
	/// Tag of the algorithm used when none is configured.
	static const std::string &defaultAlgorithm();

	static std::vector<std::string> supportedAlgorithms();

	/**
	 * @brief Creates an unfitted regressor.
	 * @throws std::invalid_argument If the tag is unknown.
	 */
	static std::unique_ptr<IRegressor> create(const std::string &algorithm, const config::ModelSettings &settings);

	/**
	 * @brief Restores a fitted regressor from its stored parameters.
	 * @throws std::invalid_argument If the tag is unknown or the parameters are malformed.
	 */
	static std::unique_ptr<IRegressor> restore(const std::string &algorithm, const YAML::Node &parameters);
};

} // namespace prepcast::models
