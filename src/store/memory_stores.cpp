#include "prepcast/store/memory_stores.hpp"
#include "prepcast/core/errors.hpp"

#include <algorithm>

namespace prepcast::store {

// --- Sales ---

void InMemorySalesStore::append(const std::vector<core::CanonicalSaleRecord> &records) {
	if (records.empty()) {
		return;
	}
	std::lock_guard<std::mutex> lock(mutex_);
	auto latest = committed_through_;
	for (const auto &record : records) {
		records_[record.item_id][record.date] = record;
		if (!latest || *latest < record.date) {
			latest = record.date;
		}
	}
	committed_through_ = latest;
}

std::vector<core::CanonicalSaleRecord> InMemorySalesStore::query(core::ItemId item_id,
                                                                 const core::DateRange &range) const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<core::CanonicalSaleRecord> result;
	const auto it = records_.find(item_id);
	if (it == records_.end() || range.empty()) {
		return result;
	}
	const auto &by_date = it->second;
	for (auto entry = by_date.lower_bound(range.first); entry != by_date.end() && entry->first <= range.last;
	     ++entry) {
		result.push_back(entry->second);
	}
	return result;
}

std::optional<core::Date> InMemorySalesStore::committedThrough() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return committed_through_;
}

std::size_t InMemorySalesStore::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::size_t total = 0;
	for (const auto &entry : records_) {
		total += entry.second.size();
	}
	return total;
}

// --- Feeds ---

void InMemoryWeatherFeed::put(const core::Date &date, const std::string &location,
                              core::WeatherObservation observation) {
	observations_[{location, date}] = observation;
}

std::optional<core::WeatherObservation> InMemoryWeatherFeed::get(const core::Date &date,
                                                                 const std::string &location) const {
	const auto it = observations_.find({location, date});
	if (it == observations_.end()) {
		return std::nullopt;
	}
	return it->second;
}

void InMemoryHolidayFeed::add(core::AdjustmentSignal signal) {
	const auto date = signal.date;
	signals_.emplace(date, std::move(signal));
}

std::vector<core::AdjustmentSignal> InMemoryHolidayFeed::get(const core::Date &date) const {
	std::vector<core::AdjustmentSignal> result;
	const auto range = signals_.equal_range(date);
	for (auto it = range.first; it != range.second; ++it) {
		result.push_back(it->second);
	}
	return result;
}

// --- Models ---

void InMemoryModelStore::save(const models::ItemModel &model) {
	// Build the replacement before taking the lock; the swap itself is the commit.
	auto replacement = std::make_shared<const models::ItemModel>(model);
	std::lock_guard<std::mutex> lock(mutex_);
	models_[model.item_id] = std::move(replacement);
}

std::shared_ptr<const models::ItemModel> InMemoryModelStore::load(core::ItemId item_id) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = models_.find(item_id);
	return it == models_.end() ? nullptr : it->second;
}

// --- Runs ---

void InMemoryForecastRunStore::append(std::shared_ptr<const forecast::ForecastRun> run) {
	if (!run) {
		throw core::PersistenceFailure("Cannot append an empty forecast run.");
	}
	std::lock_guard<std::mutex> lock(mutex_);
	for (const auto &existing : runs_) {
		if (existing->run_id == run->run_id) {
			throw core::PersistenceFailure("Forecast run " + std::to_string(run->run_id) + " already exists.");
		}
	}
	latest_by_week_[run->week_start] = run;
	runs_.push_back(std::move(run));
}

std::vector<std::shared_ptr<const forecast::ForecastRun>>
InMemoryForecastRunStore::runsForWeek(const core::Date &week_start) const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<std::shared_ptr<const forecast::ForecastRun>> result;
	for (const auto &run : runs_) {
		if (run->week_start == week_start) {
			result.push_back(run);
		}
	}
	std::sort(result.begin(), result.end(),
	          [](const auto &lhs, const auto &rhs) { return lhs->run_id > rhs->run_id; });
	return result;
}

std::shared_ptr<const forecast::ForecastRun> InMemoryForecastRunStore::latestForWeek(const core::Date &week_start) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = latest_by_week_.find(week_start);
	return it == latest_by_week_.end() ? nullptr : it->second;
}

std::shared_ptr<const forecast::ForecastRun> InMemoryForecastRunStore::latest() const {
	std::lock_guard<std::mutex> lock(mutex_);
	if (runs_.empty()) {
		return nullptr;
	}
	return *std::max_element(runs_.begin(), runs_.end(),
	                         [](const auto &lhs, const auto &rhs) { return lhs->run_id < rhs->run_id; });
}

} // namespace prepcast::store
