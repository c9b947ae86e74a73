#include "prepcast/forecast/run_recorder.hpp"
#include "prepcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace prepcast::forecast {

namespace {

void checkComplete(const core::Date &week_start, const std::vector<ForecastLine> &lines) {
	if (week_start.weekday() != 0) {
		throw std::invalid_argument("A forecast run must start on a Monday, got " + week_start.toString() + ".");
	}
	std::unordered_set<core::ItemId> seen;
	for (const auto &line : lines) {
		if (!seen.insert(line.item_id).second) {
			throw std::invalid_argument("Forecast matrix lists item " + std::to_string(line.item_id) + " twice.");
		}
		for (double quantity : line.quantities) {
			if (!std::isfinite(quantity) || quantity < 0.0) {
				throw std::invalid_argument("Forecast matrix has a missing or negative quantity for item " +
				                            std::to_string(line.item_id) + ".");
			}
		}
	}
}

} // namespace

RunRecorder::RunRecorder(store::IForecastRunStore &store, Clock clock) : store_(store), clock_(std::move(clock)) {
	if (!clock_) {
		clock_ = [] { return std::chrono::system_clock::now(); };
	}
	if (const auto newest = store_.latest()) {
		last_run_id_ = newest->run_id;
	}
}

std::shared_ptr<const ForecastRun> RunRecorder::record(const core::Date &week_start, double alpha, bool use_model,
                                                       std::vector<ForecastLine> lines, std::vector<Alert> alerts) {
	checkComplete(week_start, lines);

	std::lock_guard<std::mutex> lock(mutex_);
	const auto created_at = clock_();
	const auto now_ms =
	    std::chrono::duration_cast<std::chrono::milliseconds>(created_at.time_since_epoch()).count();

	auto run = std::make_shared<ForecastRun>();
	run->run_id = std::max<std::int64_t>(last_run_id_ + 1, now_ms);
	run->week_start = week_start;
	run->alpha = alpha;
	run->use_model = use_model;
	run->lines = std::move(lines);
	run->alerts = std::move(alerts);
	run->created_at = created_at;

	std::shared_ptr<const ForecastRun> snapshot = run;
	store_.append(snapshot);
	last_run_id_ = snapshot->run_id;

	PREPCAST_INFO("Recorded forecast run {} for week {} ({} items, {} alerts).", snapshot->run_id,
	              week_start.toString(), snapshot->lines.size(), snapshot->alerts.size());
	return snapshot;
}

std::vector<std::shared_ptr<const ForecastRun>> RunRecorder::runsForWeek(const core::Date &week_start) const {
	return store_.runsForWeek(week_start);
}

std::shared_ptr<const ForecastRun> RunRecorder::latestForWeek(const core::Date &week_start) const {
	return store_.latestForWeek(week_start);
}

std::shared_ptr<const ForecastRun> RunRecorder::latest() const {
	return store_.latest();
}

} // namespace prepcast::forecast
