#include "prepcast/core/date.hpp"

#include <cstdio>
#include <regex>
#include <stdexcept>

namespace prepcast::core {

namespace {

// Civil calendar conversions (proleptic Gregorian), after H. Hinnant's days_from_civil.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Civil {
	std::int64_t year;
	unsigned month;
	unsigned day;
};

Civil civilFromDays(std::int64_t z) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return Civil{m <= 2 ? y + 1 : y, m, d};
}

bool isLeap(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
	static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2 && isLeap(year)) {
		return 29;
	}
	return kDays[month - 1];
}

bool validYmd(int year, unsigned month, unsigned day) {
	return month >= 1 && month <= 12 && day >= 1 && day <= daysInMonth(year, month);
}

const std::regex &isoPattern() {
	static const std::regex pattern(R"(^\s*(\d{4})-(\d{1,2})-(\d{1,2})(?:[T ].*)?\s*$)");
	return pattern;
}

const std::regex &separatedPattern() {
	static const std::regex pattern(R"(^\s*(\d{1,2})[/\-.](\d{1,2})[/\-.](\d{2}|\d{4})\s*$)");
	return pattern;
}

} // namespace

const std::array<const char *, kForecastDays> &forecastDayLabels() {
	static const std::array<const char *, kForecastDays> labels{"MON", "TUE", "WED", "THURS", "FRI", "SAT"};
	return labels;
}

Date Date::fromYmd(int year, unsigned month, unsigned day) {
	if (!validYmd(year, month, day)) {
		throw std::invalid_argument("Invalid calendar date " + std::to_string(year) + "-" + std::to_string(month) +
		                            "-" + std::to_string(day) + ".");
	}
	return fromDaysSinceEpoch(daysFromCivil(year, month, day));
}

std::optional<Date> Date::parse(const std::string &text, bool day_first) {
	std::smatch match;
	if (std::regex_match(text, match, isoPattern())) {
		const int year = std::stoi(match[1].str());
		const auto month = static_cast<unsigned>(std::stoul(match[2].str()));
		const auto day = static_cast<unsigned>(std::stoul(match[3].str()));
		if (!validYmd(year, month, day)) {
			return std::nullopt;
		}
		return fromYmd(year, month, day);
	}
	if (std::regex_match(text, match, separatedPattern())) {
		const auto first = static_cast<unsigned>(std::stoul(match[1].str()));
		const auto second = static_cast<unsigned>(std::stoul(match[2].str()));
		int year = std::stoi(match[3].str());
		if (match[3].length() == 2) {
			year += 2000;
		}
		const unsigned day = day_first ? first : second;
		const unsigned month = day_first ? second : first;
		if (!validYmd(year, month, day)) {
			return std::nullopt;
		}
		return fromYmd(year, month, day);
	}
	return std::nullopt;
}

bool Date::looksLikeDate(const std::string &text) {
	return std::regex_match(text, isoPattern()) || std::regex_match(text, separatedPattern());
}

int Date::year() const {
	return static_cast<int>(civilFromDays(days_).year);
}

unsigned Date::month() const {
	return civilFromDays(days_).month;
}

unsigned Date::day() const {
	return civilFromDays(days_).day;
}

int Date::weekday() const {
	// 1970-01-01 was a Thursday (ISO index 3).
	const std::int64_t shifted = (days_ + 3) % 7;
	return static_cast<int>(shifted < 0 ? shifted + 7 : shifted);
}

std::string Date::toString() const {
	const auto civil = civilFromDays(days_);
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(civil.year), civil.month,
	              civil.day);
	return buffer;
}

Date nextMonday(const Date &today) {
	return today.addDays((7 - today.weekday()) % 7);
}

} // namespace prepcast::core
