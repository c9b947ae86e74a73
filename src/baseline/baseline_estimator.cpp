#include "prepcast/baseline/baseline_estimator.hpp"
#include "prepcast/utils/logging.hpp"

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>

namespace prepcast::baseline {

namespace {

// Daily totals strictly before the forecast week, keyed by date.
std::map<core::Date, double> dailyTotals(const std::vector<core::CanonicalSaleRecord> &history,
                                         const core::Date &week_start) {
	std::map<core::Date, double> totals;
	for (const auto &record : history) {
		if (record.date < week_start) {
			totals[record.date] += record.quantity;
		}
	}
	return totals;
}

} // namespace

HistoryStats summarize(const std::vector<double> &values) {
	HistoryStats stats;
	stats.count = values.size();
	if (values.empty()) {
		return stats;
	}
	double sum = 0.0;
	for (double value : values) {
		sum += value;
	}
	stats.mean = sum / static_cast<double>(values.size());
	if (values.size() > 1) {
		double squares = 0.0;
		for (double value : values) {
			squares += (value - stats.mean) * (value - stats.mean);
		}
		stats.stddev = std::sqrt(squares / static_cast<double>(values.size() - 1));
	}
	return stats;
}

bool BaselineEstimate::isColdStart() const {
	for (const auto &day : days) {
		if (day.sample_weight > 0.0) {
			return false;
		}
	}
	return true;
}

// --- Estimator Implementation ---

BaselineEstimator::BaselineEstimator(int window, double decay) : window_(window), decay_(decay) {
	if (window_ <= 0) {
		throw std::invalid_argument("Baseline window must be positive.");
	}
	if (!(decay_ > 0.0 && decay_ <= 1.0)) {
		throw std::invalid_argument("Baseline decay must be in (0, 1].");
	}
}

std::optional<double> BaselineEstimator::fallbackMean(const std::vector<core::CanonicalSaleRecord> &history,
                                                      const core::Date &week_start,
                                                      std::int64_t horizon_weeks) const {
	double weighted_sum = 0.0;
	double weight_total = 0.0;
	for (const auto &entry : dailyTotals(history, week_start)) {
		if (entry.first.isSunday()) {
			continue;
		}
		// 0 for the week just before the forecast week.
		const auto weeks_back = (week_start.daysSince(entry.first.mondayOf()) / 7) - 1;
		if (weeks_back >= horizon_weeks) {
			continue;
		}
		const double weight = std::pow(decay_, static_cast<double>(weeks_back));
		weighted_sum += weight * entry.second;
		weight_total += weight;
	}
	if (weight_total <= 0.0) {
		return std::nullopt;
	}
	return weighted_sum / weight_total;
}

BaselineEstimate BaselineEstimator::estimate(core::ItemId item_id, const std::vector<core::CanonicalSaleRecord> &history,
                                             const core::Date &week_start) const {
	if (week_start.weekday() != 0) {
		throw std::invalid_argument("Forecast week must start on a Monday, got " + week_start.toString() + ".");
	}

	const auto totals = dailyTotals(history, week_start);
	std::array<std::vector<double>, core::kForecastDays> instances;
	for (auto it = totals.rbegin(); it != totals.rend(); ++it) {
		const auto weekday = it->first.weekday();
		if (weekday >= static_cast<int>(core::kForecastDays)) {
			continue;
		}
		auto &bucket = instances[static_cast<std::size_t>(weekday)];
		if (static_cast<int>(bucket.size()) < window_) {
			bucket.push_back(it->second);
		}
	}

	BaselineEstimate result;
	result.item_id = item_id;
	const auto as_of = week_start.addDays(-1);
	for (std::size_t day = 0; day < core::kForecastDays; ++day) {
		const auto &values = instances[day];
		auto &baseline = result.days[day];
		baseline.item_id = item_id;
		baseline.weekday = static_cast<core::ForecastDay>(day);
		baseline.last_updated = as_of;
		result.history[day] = summarize(values);

		double weighted_sum = 0.0;
		double weight_total = 0.0;
		for (std::size_t i = 0; i < values.size(); ++i) {
			const double weight = std::pow(decay_, static_cast<double>(i));
			weighted_sum += weight * values[i];
			weight_total += weight;
		}
		baseline.sample_weight = weight_total;

		if (values.empty()) {
			baseline.estimated_mean = 0.0;
			baseline.source = BaselineSource::ColdStart;
		} else if (values.size() == 1) {
			// The lone instance may predate the window; widen to the whole supplied history then.
			auto fallback = fallbackMean(history, week_start, window_);
			if (!fallback) {
				fallback = fallbackMean(history, week_start, std::numeric_limits<std::int64_t>::max());
			}
			baseline.estimated_mean = fallback.value_or(values.front());
			baseline.source = BaselineSource::Fallback;
		} else {
			baseline.estimated_mean = weighted_sum / weight_total;
			baseline.source = BaselineSource::Weighted;
		}
	}

	std::map<core::Date, double> weekly;
	for (const auto &entry : totals) {
		weekly[entry.first.mondayOf()] += entry.second;
	}
	std::vector<double> weekly_values;
	weekly_values.reserve(weekly.size());
	for (const auto &entry : weekly) {
		weekly_values.push_back(entry.second);
	}
	result.weekly_totals = summarize(weekly_values);

	if (result.isColdStart()) {
		PREPCAST_DEBUG("Item {} has no weekday history before {}.", item_id, week_start.toString());
	}
	return result;
}

// --- Builder Implementation ---

BaselineEstimatorBuilder &BaselineEstimatorBuilder::withWindow(int window) {
	window_ = window;
	return *this;
}

BaselineEstimatorBuilder &BaselineEstimatorBuilder::withDecay(double decay) {
	decay_ = decay;
	return *this;
}

BaselineEstimatorBuilder &BaselineEstimatorBuilder::fromSettings(const config::BaselineSettings &settings) {
	window_ = settings.window_weeks;
	decay_ = settings.decay;
	return *this;
}

std::unique_ptr<BaselineEstimator> BaselineEstimatorBuilder::build() {
	PREPCAST_DEBUG("Building BaselineEstimator with window {} and decay {}.", window_, decay_);
	return std::unique_ptr<BaselineEstimator>(new BaselineEstimator(window_, decay_));
}

} // namespace prepcast::baseline
