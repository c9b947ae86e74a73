#include "prepcast/models/regressor_factory.hpp"
#include "prepcast/models/ridge_regression.hpp"

#include <stdexcept>

namespace prepcast::models {

const std::string &RegressorFactory::defaultAlgorithm() {
	static const std::string tag = "ridge";
	return tag;
}

std::vector<std::string> RegressorFactory::supportedAlgorithms() {
	return {"ridge"};
}

std::unique_ptr<IRegressor> RegressorFactory::create(const std::string &algorithm,
                                                     const config::ModelSettings &settings) {
	if (algorithm == "ridge") {
		return RidgeRegressionBuilder().withAlpha(settings.ridge_alpha).build();
	}
	throw std::invalid_argument("Unknown regression algorithm '" + algorithm + "'.");
}

std::unique_ptr<IRegressor> RegressorFactory::restore(const std::string &algorithm, const YAML::Node &parameters) {
	if (algorithm == "ridge") {
		return RidgeRegression::fromParameters(parameters);
	}
	throw std::invalid_argument("Unknown regression algorithm '" + algorithm + "'.");
}

} // namespace prepcast::models
