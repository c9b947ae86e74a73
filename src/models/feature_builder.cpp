#include "prepcast/models/feature_builder.hpp"
#include "prepcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace prepcast::models {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

// Sorts its argument.
double median(std::vector<double> &data) {
	if (data.empty()) {
		return 0.0;
	}
	const std::size_t mid = data.size() / 2;
	std::nth_element(data.begin(), data.begin() + mid, data.end());
	const double upper = data[mid];
	if (data.size() % 2 != 0) {
		return upper;
	}
	std::nth_element(data.begin(), data.begin() + mid - 1, data.end());
	return (upper + data[mid - 1]) / 2.0;
}

// Mean of up to `window` same-weekday values strictly before `date`; NaN below `min_periods`.
double trailingSameWeekday(const std::map<core::Date, double> &daily, const core::Date &date, int window,
                           int min_periods) {
	double sum = 0.0;
	int count = 0;
	for (auto it = std::make_reverse_iterator(daily.lower_bound(date)); it != daily.rend() && count < window; ++it) {
		if (it->first.weekday() == date.weekday()) {
			sum += it->second;
			++count;
		}
	}
	return count >= min_periods ? sum / count : kMissing;
}

std::map<core::Date, double> dailyTotals(const std::vector<core::CanonicalSaleRecord> &history) {
	std::map<core::Date, double> daily;
	for (const auto &record : history) {
		daily[record.date] += record.quantity;
	}
	return daily;
}

} // namespace

const std::vector<std::string> &featureSchema() {
	static const std::vector<std::string> schema{"wd_mon",        "wd_tue",        "wd_wed",    "wd_thu",   "wd_fri",
	                                             "wd_sat",        "max_temp",      "rain_mm",   "is_holiday",
	                                             "last4_same_wd", "last8_same_wd", "month_sin", "month_cos"};
	return schema;
}

FeatureBuilder::FeatureBuilder(const store::IWeatherFeed *weather_feed, const store::IHolidayFeed *holiday_feed,
                               std::string location)
    : weather_feed_(weather_feed), holiday_feed_(holiday_feed), location_(std::move(location)) {
}

std::optional<core::WeatherObservation> FeatureBuilder::weather(const core::Date &date) const {
	if (weather_feed_ == nullptr) {
		return std::nullopt;
	}
	try {
		return weather_feed_->get(date, location_);
	} catch (const std::exception &e) {
		PREPCAST_WARN("Weather feed unavailable for {}: {}.", date.toString(), e.what());
		return std::nullopt;
	}
}

bool FeatureBuilder::isHoliday(const core::Date &date) const {
	if (holiday_feed_ == nullptr) {
		return false;
	}
	try {
		for (const auto &signal : holiday_feed_->get(date)) {
			if (signal.kind == core::SignalKind::Holiday || signal.multiplier > 1.0) {
				return true;
			}
		}
	} catch (const std::exception &e) {
		PREPCAST_WARN("Holiday feed unavailable for {}: {}.", date.toString(), e.what());
	}
	return false;
}

Eigen::MatrixXd FeatureBuilder::rawFeatures(const std::vector<core::Date> &dates,
                                            const std::map<core::Date, double> &daily) const {
	Eigen::MatrixXd features = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(dates.size()), kFeatureCount);
	for (std::size_t i = 0; i < dates.size(); ++i) {
		const auto row = static_cast<Eigen::Index>(i);
		const auto &date = dates[i];
		const int weekday = date.weekday();
		if (weekday < static_cast<int>(core::kForecastDays)) {
			features(row, kWdMon + weekday) = 1.0;
		}

		const auto observation = weather(date);
		features(row, kMaxTemp) = observation && observation->max_temp ? *observation->max_temp : kMissing;
		features(row, kRainMm) = observation && observation->precipitation ? *observation->precipitation : kMissing;
		features(row, kIsHoliday) = isHoliday(date) ? 1.0 : 0.0;
		features(row, kLast4SameWeekday) = trailingSameWeekday(daily, date, 4, 2);
		features(row, kLast8SameWeekday) = trailingSameWeekday(daily, date, 8, 3);

		const double month = static_cast<double>(date.month());
		features(row, kMonthSin) = std::sin(2.0 * kPi * month / 12.0);
		features(row, kMonthCos) = std::cos(2.0 * kPi * month / 12.0);
	}
	return features;
}

std::vector<double> FeatureBuilder::columnMedians(const Eigen::MatrixXd &features) {
	std::vector<double> medians(static_cast<std::size_t>(features.cols()), 0.0);
	for (Eigen::Index col = 0; col < features.cols(); ++col) {
		std::vector<double> values;
		values.reserve(static_cast<std::size_t>(features.rows()));
		for (Eigen::Index row = 0; row < features.rows(); ++row) {
			if (std::isfinite(features(row, col))) {
				values.push_back(features(row, col));
			}
		}
		medians[static_cast<std::size_t>(col)] = median(values);
	}
	return medians;
}

void FeatureBuilder::impute(Eigen::MatrixXd &features, const std::vector<double> &medians) {
	if (static_cast<Eigen::Index>(medians.size()) != features.cols()) {
		throw std::invalid_argument("Expected " + std::to_string(features.cols()) + " imputation medians, got " +
		                            std::to_string(medians.size()) + ".");
	}
	for (Eigen::Index col = 0; col < features.cols(); ++col) {
		for (Eigen::Index row = 0; row < features.rows(); ++row) {
			if (!std::isfinite(features(row, col))) {
				features(row, col) = medians[static_cast<std::size_t>(col)];
			}
		}
	}
}

TrainingSet FeatureBuilder::trainingSet(const std::vector<core::CanonicalSaleRecord> &history) const {
	const auto daily = dailyTotals(history);

	TrainingSet set;
	for (const auto &entry : daily) {
		if (!entry.first.isSunday()) {
			set.dates.push_back(entry.first);
		}
	}
	set.features = rawFeatures(set.dates, daily);
	set.medians = columnMedians(set.features);
	impute(set.features, set.medians);

	set.target.resize(static_cast<Eigen::Index>(set.dates.size()));
	for (std::size_t i = 0; i < set.dates.size(); ++i) {
		set.target(static_cast<Eigen::Index>(i)) = daily.at(set.dates[i]);
	}
	return set;
}

Eigen::MatrixXd FeatureBuilder::weekFeatures(const std::vector<core::CanonicalSaleRecord> &history,
                                             const core::Date &week_start, const std::vector<double> &medians) const {
	std::map<core::Date, double> daily;
	for (const auto &entry : dailyTotals(history)) {
		if (entry.first < week_start) {
			daily.insert(entry);
		}
	}
	std::vector<core::Date> dates;
	for (std::size_t day = 0; day < core::kForecastDays; ++day) {
		dates.push_back(week_start.addDays(static_cast<std::int64_t>(day)));
	}
	auto features = rawFeatures(dates, daily);
	impute(features, medians);
	return features;
}

} // namespace prepcast::models
