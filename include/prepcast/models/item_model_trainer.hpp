#pragma once

#include "prepcast/config/settings.hpp"
#include "prepcast/models/feature_builder.hpp"
#include "prepcast/models/item_model.hpp"

#include <array>
#include <chrono>
#include <functional>
#include <optional>

namespace prepcast::models {

/**
 * @enum TrainStatus
 * @brief Outcome of one training attempt.
 */
enum class TrainStatus {
	Trained,
	InsufficientHistory // fewer labelled day rows than the configured minimum; no model exists
};

struct TrainOutcome {
	core::ItemId item_id = 0;
	TrainStatus status = TrainStatus::InsufficientHistory;
	std::size_t n_samples = 0;
	std::optional<ItemModel> model;
};

/**
 * @class ItemModelTrainer
 * @brief Fits, validates and packages one regression model per item.
 *
 * A model is produced only when the item has at least `min_training_samples`
 * Monday-to-Saturday rows. Rolling-origin cross-validation runs when at least
 * `cv_min_samples` rows exist; a cross-validated MAPE above `max_cv_mape`
 * marks the model low-confidence, a missing one does not.
 */
class ItemModelTrainer {
public:
	using Clock = std::function<std::chrono::system_clock::time_point()>;

	/**
	 * @param settings Training thresholds and ridge penalty.
	 * @param features Feature construction shared with prediction.
	 * @param clock Source of `trained_at`; the system clock when empty.
	 */
	ItemModelTrainer(config::ModelSettings settings, FeatureBuilder features, Clock clock = {});

	/**
	 * @brief Trains a model for one item.
	 * @param previous_version Version of the model being superseded, 0 if none.
	 */
	TrainOutcome train(core::ItemId item_id, const std::vector<core::CanonicalSaleRecord> &history,
	                   std::uint64_t previous_version = 0) const;

	const std::string &algorithm() const {
		return algorithm_;
	}

private:
	std::optional<double> crossValidate(const TrainingSet &set) const;

	config::ModelSettings settings_;
	FeatureBuilder features_;
	Clock clock_;
	std::string algorithm_;
};

/**
 * @class ModelPredictor
 * @brief Evaluates a stored ItemModel for the six days of a forecast week.
 */
class ModelPredictor {
public:
	explicit ModelPredictor(FeatureBuilder features);

	/**
	 * @brief Predicts Monday to Saturday of the week starting @p week_start.
	 *
	 * Predictions are returned unclipped.
	 *
	 * @throws std::runtime_error If the model's parameters or schema cannot be used.
	 */
	std::array<double, core::kForecastDays> predictWeek(const ItemModel &model,
	                                                    const std::vector<core::CanonicalSaleRecord> &history,
	                                                    const core::Date &week_start) const;

private:
	FeatureBuilder features_;
};

} // namespace prepcast::models
