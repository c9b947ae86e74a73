#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "prepcast/models/regressor_factory.hpp"
#include "prepcast/models/ridge_regression.hpp"

#include <stdexcept>

using prepcast::models::RegressorFactory;
using prepcast::models::RidgeRegression;
using prepcast::models::RidgeRegressionBuilder;

namespace {

void linearProblem(Eigen::MatrixXd &features, Eigen::VectorXd &target) {
	const int n = 12;
	features.resize(n, 3);
	target.resize(n);
	for (int i = 0; i < n; ++i) {
		features(i, 0) = static_cast<double>(i);
		features(i, 1) = static_cast<double>((i * 7) % 5);
		features(i, 2) = 1.0;
		target(i) = 3.0 + 2.0 * features(i, 0) - features(i, 1);
	}
}

} // namespace

TEST_CASE("Ridge without penalty recovers an exact linear relation", "[models][ridge]") {
	Eigen::MatrixXd features;
	Eigen::VectorXd target;
	linearProblem(features, target);

	auto model = RidgeRegressionBuilder().withAlpha(0.0).build();
	model->fit(features, target);
	const Eigen::VectorXd predicted = model->predict(features);

	for (Eigen::Index i = 0; i < target.size(); ++i) {
		REQUIRE(predicted(i) == Catch::Approx(target(i)).margin(1e-8));
	}
	REQUIRE(model->intercept() == Catch::Approx(target.mean()));
	// The constant column keeps scale 1 and gets no weight.
	REQUIRE(model->coefficients()(2) == Catch::Approx(0.0).margin(1e-8));
	REQUIRE(model->getName() == "ridge");
}

TEST_CASE("Ridge penalty shrinks coefficients", "[models][ridge]") {
	Eigen::MatrixXd features;
	Eigen::VectorXd target;
	linearProblem(features, target);

	auto plain = RidgeRegressionBuilder().withAlpha(0.0).build();
	auto shrunk = RidgeRegressionBuilder().withAlpha(50.0).build();
	plain->fit(features, target);
	shrunk->fit(features, target);

	REQUIRE(shrunk->coefficients().norm() < plain->coefficients().norm());
	REQUIRE(shrunk->intercept() == Catch::Approx(plain->intercept()));
}

TEST_CASE("Ridge parameters restore an identical model", "[models][ridge]") {
	Eigen::MatrixXd features;
	Eigen::VectorXd target;
	linearProblem(features, target);

	auto model = RidgeRegressionBuilder().withAlpha(1.0).build();
	model->fit(features, target);

	const auto restored = RegressorFactory::restore("ridge", YAML::Load(YAML::Dump(model->parameters())));
	const Eigen::VectorXd expected = model->predict(features);
	const Eigen::VectorXd actual = restored->predict(features);
	for (Eigen::Index i = 0; i < expected.size(); ++i) {
		REQUIRE(actual(i) == Catch::Approx(expected(i)).margin(1e-9));
	}
}

TEST_CASE("Ridge reports misuse", "[models][ridge][error]") {
	REQUIRE_THROWS_AS(RidgeRegressionBuilder().withAlpha(-1.0).build(), std::invalid_argument);

	auto model = RidgeRegressionBuilder().build();
	REQUIRE_THROWS_AS(model->predict(Eigen::MatrixXd::Zero(1, 3)), std::runtime_error);
	REQUIRE_THROWS_AS(model->fit(Eigen::MatrixXd::Zero(3, 2), Eigen::VectorXd::Zero(2)), std::invalid_argument);

	REQUIRE_THROWS_AS(RidgeRegression::fromParameters(YAML::Load("{alpha: 1.0}")), std::invalid_argument);
	REQUIRE_THROWS_AS(
	    RidgeRegression::fromParameters(YAML::Load("{intercept: 1, coefficients: [1, 2], means: [0], scales: [1, 1]}")),
	    std::invalid_argument);
}

TEST_CASE("Regressor factory knows its algorithms", "[models][factory]") {
	REQUIRE(RegressorFactory::defaultAlgorithm() == "ridge");
	REQUIRE(RegressorFactory::supportedAlgorithms() == std::vector<std::string>{"ridge"});

	prepcast::config::ModelSettings settings;
	settings.ridge_alpha = 2.5;
	const auto created = RegressorFactory::create("ridge", settings);
	REQUIRE(created->getName() == "ridge");
	REQUIRE(dynamic_cast<RidgeRegression &>(*created).alpha() == Catch::Approx(2.5));

	REQUIRE_THROWS_AS(RegressorFactory::create("lstm", settings), std::invalid_argument);
	REQUIRE_THROWS_AS(RegressorFactory::restore("lstm", YAML::Node()), std::invalid_argument);
}
