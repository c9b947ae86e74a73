#pragma once

#include "prepcast/config/settings.hpp"
#include "prepcast/core/date.hpp"
#include "prepcast/core/sales.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace prepcast::baseline {

/**
 * @enum BaselineSource
 * @brief How a weekday baseline was obtained.
 */
enum class BaselineSource {
	Weighted, // recency-weighted mean of the weekday's own instances
	Fallback, // weekday-agnostic recency-weighted mean (a single weekday instance)
	ColdStart // no instance of the weekday at all
};

/**
 * @struct WeekdayBaseline
 * @brief Estimated mean quantity of one item on one operating weekday.
 *
 * Derived state: recomputed from the trailing window on every forecast run.
 */
struct WeekdayBaseline {
	core::ItemId item_id = 0;
	core::ForecastDay weekday = core::ForecastDay::Mon;
	double estimated_mean = 0.0;
	/// Sum of the recency weights of the weekday's instances; 0 marks a cold start.
	double sample_weight = 0.0;
	core::Date last_updated;
	BaselineSource source = BaselineSource::ColdStart;
};

/**
 * @struct HistoryStats
 * @brief Unweighted mean, sample standard deviation and count of a set of observations.
 */
struct HistoryStats {
	double mean = 0.0;
	double stddev = 0.0;
	std::size_t count = 0;
};

/**
 * @struct BaselineEstimate
 * @brief Baselines of one item for the six operating days of a forecast week.
 */
struct BaselineEstimate {
	core::ItemId item_id = 0;
	std::array<WeekdayBaseline, core::kForecastDays> days{};
	/// Per-weekday statistics over the same instances the baseline used.
	std::array<HistoryStats, core::kForecastDays> history{};
	/// Statistics of the weekly totals (Monday-based weeks) in the supplied history.
	HistoryStats weekly_totals;

	/// True when no weekday had any history.
	bool isColdStart() const;
};

class BaselineEstimatorBuilder; // Forward declaration

/**
 * @class BaselineEstimator
 * @brief Recency-weighted weekday averages over a trailing window.
 *
 * For each weekday the `window` most recent instances before the forecast
 * Monday are averaged with weights decay^i (i = 0 for the most recent). A
 * weekday with a single instance falls back to the weekday-agnostic mean of
 * the last `window` weeks; a weekday without instances yields 0 with
 * sample_weight 0.
 */
class BaselineEstimator {
public:
	friend class BaselineEstimatorBuilder;

	/**
	 * @brief Computes the baselines of one item for the week starting @p week_start.
	 * @param item_id The item the history belongs to.
	 * @param history Canonical records of the item; records on or after @p week_start are ignored.
	 * @param week_start Monday of the forecast week.
	 * @throws std::invalid_argument If @p week_start is not a Monday.
	 */
	BaselineEstimate estimate(core::ItemId item_id, const std::vector<core::CanonicalSaleRecord> &history,
	                          const core::Date &week_start) const;

	int window() const {
		return window_;
	}

	double decay() const {
		return decay_;
	}

private:
	BaselineEstimator(int window, double decay);

	/// Recency-weighted mean over every operating day less than @p horizon_weeks weeks back; nullopt if none.
	std::optional<double> fallbackMean(const std::vector<core::CanonicalSaleRecord> &history,
	                                   const core::Date &week_start, std::int64_t horizon_weeks) const;

	int window_;
	double decay_;
};

/**
 * @class BaselineEstimatorBuilder
 * @brief Fluent configuration of a BaselineEstimator.
 */
class BaselineEstimatorBuilder {
public:
	BaselineEstimatorBuilder &withWindow(int window);
	BaselineEstimatorBuilder &withDecay(double decay);
	BaselineEstimatorBuilder &fromSettings(const config::BaselineSettings &settings);

	/**
	 * @brief Creates the estimator.
	 * @throws std::invalid_argument If the window is not positive or decay is outside (0, 1].
	 */
	std::unique_ptr<BaselineEstimator> build();

private:
	int window_ = 8;
	double decay_ = 0.9;
};

/// Unweighted statistics of @p values (sample standard deviation, 0 for fewer than two values).
HistoryStats summarize(const std::vector<double> &values);

} // namespace prepcast::baseline
