#pragma once

#include "prepcast/forecast/forecast_run.hpp"
#include "prepcast/models/item_model.hpp"
#include "prepcast/store/interfaces.hpp"

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace prepcast::store {

/**
 * @class InMemorySalesStore
 * @brief Sales history held in process memory, keyed by (item, date).
 */
class InMemorySalesStore final : public ISalesStore {
public:
	void append(const std::vector<core::CanonicalSaleRecord> &records) override;
	std::vector<core::CanonicalSaleRecord> query(core::ItemId item_id, const core::DateRange &range) const override;
	std::optional<core::Date> committedThrough() const override;

	/// Number of stored (item, date) records.
	std::size_t size() const;

private:
	mutable std::mutex mutex_;
	std::unordered_map<core::ItemId, std::map<core::Date, core::CanonicalSaleRecord>> records_;
	std::optional<core::Date> committed_through_;
};

class InMemoryWeatherFeed final : public IWeatherFeed {
public:
	void put(const core::Date &date, const std::string &location, core::WeatherObservation observation);
	std::optional<core::WeatherObservation> get(const core::Date &date, const std::string &location) const override;

private:
	std::map<std::pair<std::string, core::Date>, core::WeatherObservation> observations_;
};

class InMemoryHolidayFeed final : public IHolidayFeed {
public:
	void add(core::AdjustmentSignal signal);
	std::vector<core::AdjustmentSignal> get(const core::Date &date) const override;

	std::size_t size() const {
		return signals_.size();
	}

private:
	std::multimap<core::Date, core::AdjustmentSignal> signals_;
};

/**
 * @class InMemoryModelStore
 * @brief Current model per item, swapped under a lock so readers always get a complete record.
 */
class InMemoryModelStore final : public IModelStore {
public:
	void save(const models::ItemModel &model) override;
	std::shared_ptr<const models::ItemModel> load(core::ItemId item_id) const override;

private:
	mutable std::mutex mutex_;
	std::unordered_map<core::ItemId, std::shared_ptr<const models::ItemModel>> models_;
};

class InMemoryForecastRunStore final : public IForecastRunStore {
public:
	void append(std::shared_ptr<const forecast::ForecastRun> run) override;
	std::vector<std::shared_ptr<const forecast::ForecastRun>> runsForWeek(const core::Date &week_start) const override;
	std::shared_ptr<const forecast::ForecastRun> latestForWeek(const core::Date &week_start) const override;
	std::shared_ptr<const forecast::ForecastRun> latest() const override;

private:
	mutable std::mutex mutex_;
	std::vector<std::shared_ptr<const forecast::ForecastRun>> runs_;
	std::map<core::Date, std::shared_ptr<const forecast::ForecastRun>> latest_by_week_;
};

} // namespace prepcast::store
