#pragma once

#include "prepcast/core/date.hpp"
#include "prepcast/core/sales.hpp"
#include "prepcast/store/interfaces.hpp"

#include <Eigen/Dense>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prepcast::models {

/// Column positions of the per-item feature matrix.
enum FeatureIndex : Eigen::Index {
	kWdMon = 0,
	kWdTue,
	kWdWed,
	kWdThu,
	kWdFri,
	kWdSat,
	kMaxTemp,
	kRainMm,
	kIsHoliday,
	kLast4SameWeekday,
	kLast8SameWeekday,
	kMonthSin,
	kMonthCos,
	kFeatureCount
};

/// Ordered feature names, stored with every trained model.
const std::vector<std::string> &featureSchema();

/**
 * @struct TrainingSet
 * @brief Imputed features and targets of one item, in date order.
 */
struct TrainingSet {
	std::vector<core::Date> dates;
	Eigen::MatrixXd features;
	Eigen::VectorXd target;
	/// Per-column medians used to fill missing values; reused at prediction time.
	std::vector<double> medians;

	std::size_t size() const {
		return dates.size();
	}
};

/**
 * @class FeatureBuilder
 * @brief Turns an item's daily history and the signal feeds into model features.
 *
 * Weather, the holiday indicator and trailing same-weekday means
 * (last 4 with at least 2 instances, last 8 with at least 3) are looked up
 * per date. Values that cannot be determined are NaN until imputed with
 * the training medians. Sundays never produce rows.
 */
class FeatureBuilder {
public:
	FeatureBuilder(const store::IWeatherFeed *weather_feed, const store::IHolidayFeed *holiday_feed,
	               std::string location);

	/// Training rows for every Monday-to-Saturday date in @p history.
	TrainingSet trainingSet(const std::vector<core::CanonicalSaleRecord> &history) const;

	/**
	 * @brief Feature rows for the six operating days starting at @p week_start.
	 * @param history Item history; only records before @p week_start are used.
	 * @param medians Imputation medians of the trained model.
	 * @throws std::invalid_argument If @p medians does not match the feature schema.
	 */
	Eigen::MatrixXd weekFeatures(const std::vector<core::CanonicalSaleRecord> &history, const core::Date &week_start,
	                             const std::vector<double> &medians) const;

	/// Features for @p dates with NaN where a value is unknown.
	Eigen::MatrixXd rawFeatures(const std::vector<core::Date> &dates, const std::map<core::Date, double> &daily) const;

	/// Median of the finite values per column, 0 for a column without any.
	static std::vector<double> columnMedians(const Eigen::MatrixXd &features);

	static void impute(Eigen::MatrixXd &features, const std::vector<double> &medians);

private:
	bool isHoliday(const core::Date &date) const;
	std::optional<core::WeatherObservation> weather(const core::Date &date) const;

	const store::IWeatherFeed *weather_feed_;
	const store::IHolidayFeed *holiday_feed_;
	std::string location_;
};

} // namespace prepcast::models
