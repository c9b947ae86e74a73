#include "prepcast/forecast_engine.hpp"
#include "prepcast/core/errors.hpp"
#include "prepcast/utils/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

namespace prepcast {

namespace {

config::Settings validated(config::Settings settings) {
	settings.validate();
	return settings;
}

std::string ambiguityReason(const core::ResolutionAmbiguity &error) {
	std::string reason = "ambiguous item name '" + error.rawName() + "' (candidates:";
	for (const auto candidate : error.candidates()) {
		reason += " " + std::to_string(candidate);
	}
	return reason + ")";
}

} // namespace

ForecastEngine::ForecastEngine(config::Settings settings, store::ISalesStore &sales, store::IModelStore &models,
                               store::IForecastRunStore &runs, const store::IWeatherFeed *weather_feed,
                               const store::IHolidayFeed *holiday_feed, Clock clock)
    : settings_(validated(std::move(settings))), sales_(sales), models_(models), normalizer_(settings_.normalizer),
      resolver_(settings_.resolver),
      baseline_(baseline::BaselineEstimatorBuilder().fromSettings(settings_.baseline).build()),
      adjustments_(settings_.adjustment, weather_feed, holiday_feed),
      trainer_(settings_.model, models::FeatureBuilder(weather_feed, holiday_feed, settings_.adjustment.location), clock),
      predictor_(models::FeatureBuilder(weather_feed, holiday_feed, settings_.adjustment.location)),
      blender_(settings_.post), recorder_(runs, clock) {
}

// --- Ingestion ---

IngestResult ForecastEngine::ingest(const ingest::RawTable &table) {
	std::lock_guard<std::mutex> ingest_lock(ingest_mutex_);
	IngestResult result;

	ingest::NormalizedBatch batch;
	try {
		batch = normalizer_.normalize(table);
	} catch (const core::SchemaError &e) {
		PREPCAST_ERROR("Rejected '{}': {}", table.source_name, e.what());
		result.errors.emplace_back(e.what());
		return result;
	}
	result.rejected_rows = std::move(batch.rejected);

	ingest::ItemCatalog staged;
	{
		std::lock_guard<std::mutex> lock(catalog_mutex_);
		staged = catalog_;
	}

	// Different raw names may resolve to one item; their daily totals are summed.
	// Each merged record remembers the export row its reference points to.
	std::map<std::pair<core::Date, core::ItemId>, std::pair<core::CanonicalSaleRecord, std::size_t>> merged;
	for (const auto &row : batch.rows) {
		ingest::Resolution resolution;
		try {
			resolution = resolver_.resolve(row.item_name_raw, staged);
		} catch (const core::ResolutionAmbiguity &e) {
			result.rejected_rows.push_back({row.source_row_ref, ambiguityReason(e)});
			continue;
		} catch (const std::invalid_argument &e) {
			PREPCAST_WARN("Could not resolve '{}' at {}: {}", row.item_name_raw, row.source_row_ref, e.what());
			result.rejected_rows.push_back(
			    {row.source_row_ref, "unresolvable item name '" + row.item_name_raw + "': " + e.what()});
			continue;
		}
		const auto key = std::make_pair(row.date, resolution.item_id);
		auto it = merged.find(key);
		if (it == merged.end()) {
			merged.emplace(key, std::make_pair(core::CanonicalSaleRecord{row.date, resolution.item_id, row.quantity,
			                                                             row.source_row_ref},
			                                   row.source_row));
			continue;
		}
		auto &record = it->second.first;
		record.quantity += row.quantity;
		if (row.source_row < it->second.second) {
			record.source_row_ref = row.source_row_ref;
			it->second.second = row.source_row;
		}
	}

	std::vector<core::CanonicalSaleRecord> records;
	records.reserve(merged.size());
	for (auto &entry : merged) {
		records.push_back(std::move(entry.second.first));
	}

	sales_.append(records);
	{
		std::lock_guard<std::mutex> lock(catalog_mutex_);
		catalog_ = std::move(staged);
	}

	result.accepted = records.size();
	PREPCAST_INFO("Ingested '{}': {} records accepted, {} rows rejected.", table.source_name, result.accepted,
	              result.rejected_rows.size());
	return result;
}

// --- Forecasting ---

void ForecastEngine::checkReadiness(const core::Date &week_start) const {
	if (!settings_.readiness.enforce) {
		return;
	}
	auto required = week_start.addDays(-1 - settings_.readiness.tolerance_days);
	if (required.isSunday()) {
		required = required.addDays(-1);
	}
	const auto committed = sales_.committedThrough();
	if (!committed || *committed < required) {
		throw core::HistoryNotReady("Forecast for week " + week_start.toString() + " needs sales through " +
		                            required.toString() + ", history ends " +
		                            (committed ? committed->toString() : std::string("nowhere")) + ".");
	}
}

forecast::ItemBlendInput ForecastEngine::prepareItem(const core::Item &item, const core::Date &week_start,
                                                     bool use_model) const {
	const core::DateRange window{week_start.addDays(-7 * settings_.baseline.lookback_weeks), week_start.addDays(-1)};
	const auto history = sales_.query(item.item_id, window);

	forecast::ItemBlendInput input;
	input.item_id = item.item_id;
	input.item_name = item.canonical_name;
	input.baseline = baseline_->estimate(item.item_id, history, week_start);

	if (use_model) {
		if (const auto model = models_.load(item.item_id)) {
			input.model.version = model->version;
			input.model.low_confidence = model->low_confidence;
			const auto model_history = fullHistory(item.item_id);
			try {
				input.model.prediction = predictor_.predictWeek(*model, model_history, week_start);
			} catch (const std::runtime_error &e) {
				PREPCAST_WARN("Model v{} of item {} '{}' failed: {}. Using the baseline.", model->version,
				              item.item_id, item.canonical_name, e.what());
				input.model.failure = e.what();
			}
		}
	}

	const auto *item_override = settings_.overrideFor(item.canonical_name);
	const config::WeatherSensitivity *sensitivity =
	    item_override && item_override->weather_sensitivity ? &*item_override->weather_sensitivity : nullptr;
	for (std::size_t day = 0; day < core::kForecastDays; ++day) {
		input.multipliers[day] =
		    adjustments_.multiplier(week_start.addDays(static_cast<std::int64_t>(day)), week_start, sensitivity);
	}
	return input;
}

std::shared_ptr<const forecast::ForecastRun> ForecastEngine::forecast(const core::Date &week_start, double alpha,
                                                                      bool use_model) {
	forecast::Blender::checkAlpha(alpha);
	if (week_start.weekday() != 0) {
		throw std::invalid_argument("Forecast week must start on a Monday, got " + week_start.toString() + ".");
	}
	checkReadiness(week_start);

	auto catalog_items = items();
	std::sort(catalog_items.begin(), catalog_items.end(),
	          [](const core::Item &lhs, const core::Item &rhs) { return lhs.canonical_name < rhs.canonical_name; });

	std::vector<forecast::ForecastLine> lines;
	std::vector<forecast::Alert> alerts;
	lines.reserve(catalog_items.size());
	for (const auto &item : catalog_items) {
		auto blended = blender_.blend(prepareItem(item, week_start, use_model), alpha, use_model);
		lines.push_back(std::move(blended.line));
		alerts.insert(alerts.end(), std::make_move_iterator(blended.alerts.begin()),
		              std::make_move_iterator(blended.alerts.end()));
	}

	return recorder_.record(week_start, alpha, use_model, std::move(lines), std::move(alerts));
}

// --- Training ---

std::vector<core::CanonicalSaleRecord> ForecastEngine::fullHistory(core::ItemId item_id) const {
	const core::DateRange everything{core::Date::fromDaysSinceEpoch(std::numeric_limits<std::int32_t>::min()),
	                                 core::Date::fromDaysSinceEpoch(std::numeric_limits<std::int32_t>::max())};
	return sales_.query(item_id, everything);
}

std::optional<models::ItemModel> ForecastEngine::train(core::ItemId item_id) {
	{
		std::lock_guard<std::mutex> lock(catalog_mutex_);
		if (catalog_.find(item_id) == nullptr) {
			throw std::invalid_argument("Unknown item id " + std::to_string(item_id) + ".");
		}
	}
	const auto previous = models_.load(item_id);
	auto outcome = trainer_.train(item_id, fullHistory(item_id), previous ? previous->version : 0);
	if (outcome.status != models::TrainStatus::Trained || !outcome.model) {
		return std::nullopt;
	}
	models_.save(*outcome.model);
	return outcome.model;
}

std::vector<models::ItemModel> ForecastEngine::trainAll() {
	std::vector<models::ItemModel> trained;
	for (const auto &item : items()) {
		if (auto model = train(item.item_id)) {
			trained.push_back(std::move(*model));
		}
	}
	PREPCAST_INFO("Trained {} models for {} items.", trained.size(), items().size());
	return trained;
}

// --- Catalog ---

void ForecastEngine::setAlias(const std::string &alias, core::ItemId item_id) {
	// Same order as ingest(): a batch staged before this alias would otherwise overwrite it.
	std::lock_guard<std::mutex> ingest_lock(ingest_mutex_);
	std::lock_guard<std::mutex> lock(catalog_mutex_);
	catalog_.addAlias(item_id, alias, core::AliasOrigin::Manual);
	PREPCAST_INFO("Linked alias '{}' to item {}.", alias, item_id);
}

std::vector<core::Item> ForecastEngine::items() const {
	std::lock_guard<std::mutex> lock(catalog_mutex_);
	return catalog_.items();
}

std::optional<core::ItemId> ForecastEngine::findItem(const std::string &name) const {
	std::lock_guard<std::mutex> lock(catalog_mutex_);
	return catalog_.findByName(name);
}

} // namespace prepcast
