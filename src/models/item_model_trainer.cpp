#include "prepcast/models/item_model_trainer.hpp"
#include "prepcast/models/regressor_factory.hpp"
#include "prepcast/utils/cross_validation.hpp"
#include "prepcast/utils/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace prepcast::models {

// --- Trainer Implementation ---

ItemModelTrainer::ItemModelTrainer(config::ModelSettings settings, FeatureBuilder features, Clock clock)
    : settings_(std::move(settings)), features_(std::move(features)), clock_(std::move(clock)),
      algorithm_(RegressorFactory::defaultAlgorithm()) {
	if (settings_.min_training_samples == 0) {
		throw std::invalid_argument("min_training_samples must be positive.");
	}
	if (!clock_) {
		clock_ = [] { return std::chrono::system_clock::now(); };
	}
}

std::optional<double> ItemModelTrainer::crossValidate(const TrainingSet &set) const {
	if (set.size() < settings_.cv_min_samples) {
		return std::nullopt;
	}
	const auto results = utils::CrossValidation::evaluate(
	    set.features, set.target, [this] { return RegressorFactory::create(algorithm_, settings_); },
	    settings_.cv_fractions, static_cast<int>(settings_.cv_min_train));
	return results.mape;
}

TrainOutcome ItemModelTrainer::train(core::ItemId item_id, const std::vector<core::CanonicalSaleRecord> &history,
                                     std::uint64_t previous_version) const {
	const auto set = features_.trainingSet(history);

	TrainOutcome outcome;
	outcome.item_id = item_id;
	outcome.n_samples = set.size();
	if (set.size() < settings_.min_training_samples) {
		outcome.status = TrainStatus::InsufficientHistory;
		PREPCAST_INFO("Item {} has {} training rows (< {}); no model trained.", item_id, set.size(),
		              settings_.min_training_samples);
		return outcome;
	}

	auto regressor = RegressorFactory::create(algorithm_, settings_);
	regressor->fit(set.features, set.target);

	YAML::Node parameters;
	parameters["medians"] = set.medians;
	parameters["regressor"] = regressor->parameters();
	YAML::Emitter emitter;
	emitter << parameters;

	ItemModel model;
	model.item_id = item_id;
	model.algorithm_tag = regressor->getName();
	model.serialized_parameters = emitter.c_str();
	model.feature_schema = featureSchema();
	model.n_training_samples = set.size();
	model.cross_val_error = crossValidate(set);
	model.low_confidence = model.cross_val_error && *model.cross_val_error > settings_.max_cv_mape;
	model.trained_at = clock_();
	model.version = previous_version + 1;

	if (model.cross_val_error) {
		PREPCAST_INFO("Trained {} model v{} for item {} on {} rows, CV MAPE {:.1f}%{}.", model.algorithm_tag,
		              model.version, item_id, set.size(), *model.cross_val_error,
		              model.low_confidence ? " (low confidence)" : "");
	} else {
		PREPCAST_INFO("Trained {} model v{} for item {} on {} rows without cross-validation.", model.algorithm_tag,
		              model.version, item_id, set.size());
	}

	outcome.status = TrainStatus::Trained;
	outcome.model = std::move(model);
	return outcome;
}

// --- Predictor Implementation ---

ModelPredictor::ModelPredictor(FeatureBuilder features) : features_(std::move(features)) {
}

std::array<double, core::kForecastDays>
ModelPredictor::predictWeek(const ItemModel &model, const std::vector<core::CanonicalSaleRecord> &history,
                            const core::Date &week_start) const {
	if (model.feature_schema != featureSchema()) {
		throw std::runtime_error("Model v" + std::to_string(model.version) + " of item " +
		                         std::to_string(model.item_id) + " uses an unknown feature schema.");
	}

	std::unique_ptr<IRegressor> regressor;
	std::vector<double> medians;
	try {
		const auto parameters = YAML::Load(model.serialized_parameters);
		medians = parameters["medians"].as<std::vector<double>>();
		regressor = RegressorFactory::restore(model.algorithm_tag, parameters["regressor"]);
	} catch (const YAML::Exception &e) {
		throw std::runtime_error("Cannot read parameters of item " + std::to_string(model.item_id) + ": " + e.what());
	} catch (const std::invalid_argument &e) {
		throw std::runtime_error("Cannot restore model of item " + std::to_string(model.item_id) + ": " + e.what());
	}

	Eigen::MatrixXd features;
	try {
		features = features_.weekFeatures(history, week_start, medians);
	} catch (const std::invalid_argument &e) {
		throw std::runtime_error("Cannot build features for item " + std::to_string(model.item_id) + ": " + e.what());
	}
	const Eigen::VectorXd predicted = regressor->predict(features);

	std::array<double, core::kForecastDays> week{};
	for (std::size_t day = 0; day < core::kForecastDays; ++day) {
		week[day] = predicted(static_cast<Eigen::Index>(day));
	}
	return week;
}

} // namespace prepcast::models
