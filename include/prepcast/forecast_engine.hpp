#pragma once

#include "prepcast/adjust/adjustment_engine.hpp"
#include "prepcast/baseline/baseline_estimator.hpp"
#include "prepcast/config/settings.hpp"
#include "prepcast/forecast/blender.hpp"
#include "prepcast/forecast/run_recorder.hpp"
#include "prepcast/ingest/item_resolver.hpp"
#include "prepcast/ingest/normalizer.hpp"
#include "prepcast/ingest/raw_table.hpp"
#include "prepcast/models/item_model_trainer.hpp"
#include "prepcast/store/interfaces.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace prepcast {

/**
 * @struct IngestResult
 * @brief Outcome of ingesting one export.
 */
struct IngestResult {
	/// Canonical (date, item) records written to the sales store.
	std::size_t accepted = 0;
	std::vector<ingest::RejectedRow> rejected_rows;
	/// File-level errors; when present nothing was ingested.
	std::vector<std::string> errors;

	bool ok() const {
		return errors.empty();
	}
};

/**
 * @class ForecastEngine
 * @brief Public entry points of the weekly production forecast.
 *
 * Wires normalization, item resolution and the collaborator stores to the
 * baseline, model, adjustment, blending and recording stages. Stores and
 * feeds are borrowed and must outlive the engine.
 */
class ForecastEngine {
public:
	using Clock = std::function<std::chrono::system_clock::time_point()>;

	ForecastEngine(config::Settings settings, store::ISalesStore &sales, store::IModelStore &models,
	               store::IForecastRunStore &runs, const store::IWeatherFeed *weather_feed = nullptr,
	               const store::IHolidayFeed *holiday_feed = nullptr, Clock clock = {});

	/**
	 * @brief Normalizes, resolves and persists one raw export.
	 *
	 * A schema failure is reported in IngestResult::errors and ingests nothing.
	 * Rows that cannot be read, or whose item name is ambiguous or cannot be
	 * resolved, are reported as rejected while the rest of the file is ingested. New items and aliases
	 * become visible only after the sales store accepted the batch.
	 *
	 * @throws core::PersistenceFailure If the sales store cannot commit the batch.
	 */
	IngestResult ingest(const ingest::RawTable &table);

	/**
	 * @brief Generates and records the forecast of one week for every known item.
	 * @param week_start Monday of the week.
	 * @param alpha Model emphasis in [0, 1].
	 * @param use_model False forces baseline-only forecasts.
	 * @throws std::invalid_argument If @p week_start is not a Monday or @p alpha is outside [0, 1].
	 * @throws core::HistoryNotReady If history is not committed up to the day before @p week_start.
	 * @throws core::PersistenceFailure If a store fails; no run is recorded.
	 */
	std::shared_ptr<const forecast::ForecastRun> forecast(const core::Date &week_start, double alpha,
	                                                      bool use_model = true);

	/**
	 * @brief Trains (or retrains) the model of one item.
	 * @return The new model, or std::nullopt when the item lacks enough history.
	 * @throws std::invalid_argument If the item is unknown.
	 */
	std::optional<models::ItemModel> train(core::ItemId item_id);

	/// Trains every known item; returns only the models that were created.
	std::vector<models::ItemModel> trainAll();

	/**
	 * @brief Links an alias to an existing item by administrative decision.
	 * @throws std::invalid_argument If the item is unknown or the alias belongs to another item.
	 */
	void setAlias(const std::string &alias, core::ItemId item_id);

	/**
	 * @brief Checks that history is committed through the day before @p week_start.
	 * @throws core::HistoryNotReady If it is not and readiness is enforced.
	 */
	void checkReadiness(const core::Date &week_start) const;

	/// Snapshot of the item catalog.
	std::vector<core::Item> items() const;

	std::optional<core::ItemId> findItem(const std::string &name) const;

	std::vector<std::shared_ptr<const forecast::ForecastRun>> runsForWeek(const core::Date &week_start) const {
		return recorder_.runsForWeek(week_start);
	}

	std::shared_ptr<const forecast::ForecastRun> latestForWeek(const core::Date &week_start) const {
		return recorder_.latestForWeek(week_start);
	}

	const config::Settings &settings() const {
		return settings_;
	}

private:
	forecast::ItemBlendInput prepareItem(const core::Item &item, const core::Date &week_start, bool use_model) const;
	std::vector<core::CanonicalSaleRecord> fullHistory(core::ItemId item_id) const;

	config::Settings settings_;
	store::ISalesStore &sales_;
	store::IModelStore &models_;

	ingest::Normalizer normalizer_;
	ingest::ItemResolver resolver_;
	std::unique_ptr<baseline::BaselineEstimator> baseline_;
	adjust::AdjustmentEngine adjustments_;
	models::ItemModelTrainer trainer_;
	models::ModelPredictor predictor_;
	forecast::Blender blender_;
	forecast::RunRecorder recorder_;

	mutable std::mutex catalog_mutex_;
	ingest::ItemCatalog catalog_;
	// Serializes ingestion and alias edits so a staged catalog never overwrites a newer one.
	std::mutex ingest_mutex_;
};

} // namespace prepcast
