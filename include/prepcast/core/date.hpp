#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace prepcast::core {

/// Number of operating days covered by one forecast week (Monday to Saturday).
constexpr std::size_t kForecastDays = 6;

/**
 * @enum ForecastDay
 * @brief Operating days of a forecast week, in calendar order.
 */
enum class ForecastDay { Mon = 0, Tue, Wed, Thu, Fri, Sat };

/// Upper-case labels used on order sheets, indexed by ForecastDay.
const std::array<const char *, kForecastDays> &forecastDayLabels();

/**
 * @class Date
 * @brief A calendar day without time-of-day or timezone.
 *
 * Stored as the number of days since 1970-01-01 so that ordering, hashing and
 * day arithmetic are trivial. Weekday numbering follows ISO: 0 = Monday ... 6 = Sunday.
 */
class Date {
public:
	using TimePoint = std::chrono::system_clock::time_point;

	Date() = default;

	/**
	 * @brief Builds a date from its civil components.
	 * @throws std::invalid_argument If the components do not form a valid date.
	 */
	static Date fromYmd(int year, unsigned month, unsigned day);

	static Date fromDaysSinceEpoch(std::int64_t days) {
		Date date;
		date.days_ = days;
		return date;
	}

	/**
	 * @brief Parses a date cell as found in sales exports.
	 *
	 * Accepts ISO `YYYY-MM-DD` (optionally followed by a time part) and
	 * `D/M/YYYY`, `D-M-YY` style dates. For the slash/dash forms @p day_first
	 * selects between day-month and month-day ordering. Two-digit years map to 2000-2099.
	 *
	 * @return The parsed date, or std::nullopt when the text is not a date.
	 */
	static std::optional<Date> parse(const std::string &text, bool day_first = true);

	/// Returns true when the text looks like a date header of a wide export.
	static bool looksLikeDate(const std::string &text);

	std::int64_t daysSinceEpoch() const {
		return days_;
	}

	int year() const;
	unsigned month() const;
	unsigned day() const;

	/// ISO weekday: 0 = Monday ... 6 = Sunday.
	int weekday() const;

	bool isSunday() const {
		return weekday() == 6;
	}

	/// Monday of the ISO week containing this date.
	Date mondayOf() const {
		return addDays(-weekday());
	}

	Date addDays(std::int64_t days) const {
		return fromDaysSinceEpoch(days_ + days);
	}

	/// Signed number of days from @p other to this date.
	std::int64_t daysSince(const Date &other) const {
		return days_ - other.days_;
	}

	/// Midnight UTC of this day as a system clock time point.
	TimePoint toTimePoint() const {
		return TimePoint{} + std::chrono::hours(24 * days_);
	}

	/// Formats as `YYYY-MM-DD`.
	std::string toString() const;

	bool operator==(const Date &other) const {
		return days_ == other.days_;
	}
	bool operator!=(const Date &other) const {
		return days_ != other.days_;
	}
	bool operator<(const Date &other) const {
		return days_ < other.days_;
	}
	bool operator<=(const Date &other) const {
		return days_ <= other.days_;
	}
	bool operator>(const Date &other) const {
		return days_ > other.days_;
	}
	bool operator>=(const Date &other) const {
		return days_ >= other.days_;
	}

private:
	std::int64_t days_ = 0;
};

/**
 * @brief Returns the Monday that starts the next forecast week.
 *
 * A Monday maps to itself, any other day to the following Monday.
 */
Date nextMonday(const Date &today);

/**
 * @struct DateRange
 * @brief Inclusive range of calendar days.
 */
struct DateRange {
	Date first;
	Date last;

	bool contains(const Date &date) const {
		return first <= date && date <= last;
	}

	bool empty() const {
		return last < first;
	}
};

struct DateHash {
	std::size_t operator()(const Date &date) const noexcept {
		return std::hash<std::int64_t>{}(date.daysSinceEpoch());
	}
};

} // namespace prepcast::core
