#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/sales_helpers.hpp"
#include "prepcast/adjust/adjustment_engine.hpp"
#include "prepcast/store/memory_stores.hpp"

#include <stdexcept>

using prepcast::adjust::AdjustmentEngine;
using prepcast::config::AdjustmentSettings;
using prepcast::config::WeatherSensitivity;
using prepcast::core::AdjustmentSignal;
using prepcast::core::SignalKind;
using prepcast::core::WeatherObservation;
using tests::helpers::forecastMonday;

namespace {

AdjustmentSignal signal(const prepcast::core::Date &date, SignalKind kind, double multiplier, double weight = 1.0) {
	AdjustmentSignal result;
	result.date = date;
	result.kind = kind;
	result.multiplier = multiplier;
	result.weight = weight;
	result.label = "test";
	return result;
}

class FailingWeatherFeed final : public prepcast::store::IWeatherFeed {
public:
	std::optional<WeatherObservation> get(const prepcast::core::Date &, const std::string &) const override {
		throw std::runtime_error("weather service timeout");
	}
};

class FailingHolidayFeed final : public prepcast::store::IHolidayFeed {
public:
	std::vector<AdjustmentSignal> get(const prepcast::core::Date &) const override {
		throw std::runtime_error("calendar offline");
	}
};

} // namespace

TEST_CASE("Adjustment is neutral without feeds", "[adjust]") {
	AdjustmentEngine engine(AdjustmentSettings{}, nullptr, nullptr);
	const auto breakdown = engine.adjust(forecastMonday(), forecastMonday());
	REQUIRE(breakdown.multiplier == 1.0);
	REQUIRE_FALSE(breakdown.clamped);
	REQUIRE(breakdown.notes.empty());
}

TEST_CASE("Holiday signals scale the forecast day", "[adjust][holiday]") {
	prepcast::store::InMemoryHolidayFeed holidays;
	const auto friday = forecastMonday().addDays(4);
	holidays.add(signal(friday, SignalKind::Holiday, 1.3));
	AdjustmentEngine engine(AdjustmentSettings{}, nullptr, &holidays);

	const double multiplier = engine.multiplier(friday, forecastMonday());
	REQUIRE(multiplier == Catch::Approx(1.3));
	REQUIRE(50.0 * multiplier == Catch::Approx(65.0));
	REQUIRE(engine.multiplier(friday.addDays(-1), forecastMonday()) == 1.0);
}

TEST_CASE("Adjustment composes signals and clamps the product", "[adjust][clamp]") {
	prepcast::store::InMemoryHolidayFeed holidays;
	const auto saturday = forecastMonday().addDays(5);
	holidays.add(signal(saturday, SignalKind::Holiday, 1.4));
	holidays.add(signal(saturday, SignalKind::Event, 1.3));
	AdjustmentEngine engine(AdjustmentSettings{}, nullptr, &holidays);

	const auto breakdown = engine.adjust(saturday, forecastMonday());
	REQUIRE(breakdown.raw == Catch::Approx(1.82));
	REQUIRE(breakdown.multiplier == Catch::Approx(1.5));
	REQUIRE(breakdown.clamped);
	REQUIRE(breakdown.notes.size() == 2);

	SECTION("lower bound") {
		prepcast::store::InMemoryHolidayFeed closures;
		closures.add(signal(saturday, SignalKind::Event, 0.1));
		AdjustmentEngine low(AdjustmentSettings{}, nullptr, &closures);
		REQUIRE(low.multiplier(saturday, forecastMonday()) == Catch::Approx(0.5));
	}
}

TEST_CASE("Signal weight blends the multiplier toward neutral", "[adjust]") {
	REQUIRE(AdjustmentEngine::effectiveMultiplier(signal(forecastMonday(), SignalKind::Event, 1.4, 0.5)) ==
	        Catch::Approx(1.2));
	REQUIRE(AdjustmentEngine::effectiveMultiplier(signal(forecastMonday(), SignalKind::Event, 1.4, 0.0)) ==
	        Catch::Approx(1.0));
	REQUIRE(AdjustmentEngine::effectiveMultiplier(signal(forecastMonday(), SignalKind::Event, 1.4, 3.0)) ==
	        Catch::Approx(1.4));
}

TEST_CASE("Invalid signals are ignored", "[adjust]") {
	prepcast::store::InMemoryHolidayFeed holidays;
	holidays.add(signal(forecastMonday(), SignalKind::Event, -2.0));
	AdjustmentEngine engine(AdjustmentSettings{}, nullptr, &holidays);
	REQUIRE(engine.multiplier(forecastMonday(), forecastMonday()) == 1.0);
}

TEST_CASE("Weather acts through item sensitivities", "[adjust][weather]") {
	prepcast::store::InMemoryWeatherFeed weather;
	const auto tuesday = forecastMonday().addDays(1);
	WeatherObservation observation;
	observation.max_temp = 30.0;
	observation.precipitation = 11.0;
	weather.put(tuesday, "default", observation);
	AdjustmentEngine engine(AdjustmentSettings{}, &weather, nullptr);

	const WeatherSensitivity sensitivity{0.1, -0.2};
	REQUIRE(engine.weatherFactor(observation, sensitivity) == Catch::Approx(1.1 * 0.8));
	REQUIRE(engine.multiplier(tuesday, forecastMonday(), &sensitivity) == Catch::Approx(0.88));

	SECTION("items without a sensitivity ignore weather") {
		REQUIRE(engine.multiplier(tuesday, forecastMonday()) == 1.0);
	}

	SECTION("the configured default sensitivity applies to other items") {
		AdjustmentSettings settings;
		settings.default_weather_sensitivity = WeatherSensitivity{0.1, 0.0};
		AdjustmentEngine with_default(settings, &weather, nullptr);
		REQUIRE(with_default.multiplier(tuesday, forecastMonday()) == Catch::Approx(1.1));
	}

	SECTION("missing values are neutral") {
		REQUIRE(engine.weatherFactor(WeatherObservation{}, sensitivity) == 1.0);
	}

	SECTION("each term is floored at zero") {
		WeatherObservation storm;
		storm.precipitation = 100.0;
		REQUIRE(engine.weatherFactor(storm, WeatherSensitivity{0.0, -1.0}) == 0.0);
	}
}

TEST_CASE("Stale weather is treated as missing", "[adjust][weather]") {
	prepcast::store::InMemoryWeatherFeed weather;
	WeatherObservation observation;
	observation.max_temp = 35.0;
	observation.issued_on = forecastMonday().addDays(-10);
	weather.put(forecastMonday(), "default", observation);
	AdjustmentEngine engine(AdjustmentSettings{}, &weather, nullptr);

	const WeatherSensitivity sensitivity{0.2, 0.0};
	REQUIRE(engine.multiplier(forecastMonday(), forecastMonday(), &sensitivity) == 1.0);

	observation.issued_on = forecastMonday().addDays(-3);
	weather.put(forecastMonday(), "default", observation);
	REQUIRE(engine.multiplier(forecastMonday(), forecastMonday(), &sensitivity) == Catch::Approx(1.3));
}

TEST_CASE("Failing feeds degrade to neutral", "[adjust][error]") {
	FailingWeatherFeed weather;
	FailingHolidayFeed holidays;
	AdjustmentSettings settings;
	settings.default_weather_sensitivity = WeatherSensitivity{0.5, 0.5};
	AdjustmentEngine engine(settings, &weather, &holidays);

	REQUIRE_NOTHROW(engine.adjust(forecastMonday(), forecastMonday()));
	REQUIRE(engine.multiplier(forecastMonday(), forecastMonday()) == 1.0);
}

TEST_CASE("Adjustment rejects an inverted clamp range", "[adjust][error]") {
	AdjustmentSettings settings;
	settings.min_multiplier = 2.0;
	REQUIRE_THROWS_AS(AdjustmentEngine(settings, nullptr, nullptr), std::invalid_argument);
}
