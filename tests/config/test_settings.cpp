#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "prepcast/config/settings.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

using prepcast::config::Settings;

TEST_CASE("Settings defaults are consistent", "[config][settings]") {
	Settings settings;
	REQUIRE_NOTHROW(settings.validate());
	REQUIRE(settings.baseline.window_weeks == 8);
	REQUIRE(settings.baseline.decay == Catch::Approx(0.9));
	REQUIRE(settings.model.min_training_samples == 20);
	REQUIRE(settings.adjustment.min_multiplier == Catch::Approx(0.5));
	REQUIRE(settings.adjustment.max_multiplier == Catch::Approx(1.5));
	REQUIRE(settings.post.alert_std_multiple == Catch::Approx(1.5));
	REQUIRE(settings.overrideFor("Croissant") == nullptr);
}

TEST_CASE("Settings read from YAML keep defaults for absent keys", "[config][settings]") {
	const auto root = YAML::Load(R"(
baseline:
  decay: 0.8
resolver:
  fuzzy_threshold: 0.7
  canonical_rules:
    - pattern: "^sour ?dough$"
      canonical: Sourdough Loaf
adjustment:
  location: sydney
  default_weather_sensitivity:
    temperature: -0.1
post:
  items:
    Croissant:
      min_batch: 12
      round_unit: 6
)");
	const auto settings = Settings::fromYaml(root);

	REQUIRE(settings.baseline.decay == Catch::Approx(0.8));
	REQUIRE(settings.baseline.window_weeks == 8);
	REQUIRE(settings.resolver.fuzzy_threshold == Catch::Approx(0.7));
	REQUIRE(settings.resolver.canonical_rules.size() == 1);
	REQUIRE(settings.resolver.canonical_rules.front().canonical == "Sourdough Loaf");
	REQUIRE(settings.adjustment.location == "sydney");
	REQUIRE(settings.adjustment.default_weather_sensitivity.has_value());
	REQUIRE(settings.adjustment.default_weather_sensitivity->temperature == Catch::Approx(-0.1));
	REQUIRE(settings.adjustment.default_weather_sensitivity->precipitation == Catch::Approx(0.0));

	const auto *croissant = settings.overrideFor("Croissant");
	REQUIRE(croissant != nullptr);
	REQUIRE(*croissant->min_batch == Catch::Approx(12.0));
	REQUIRE(*croissant->round_unit == Catch::Approx(6.0));
	REQUIRE_FALSE(croissant->weather_sensitivity.has_value());
	REQUIRE(settings.overrideFor("  CROISSANT") == croissant);
	REQUIRE(settings.post.overrideFor("croissant") == croissant);
}

TEST_CASE("Settings reject inconsistent values", "[config][settings][error]") {
	SECTION("decay outside (0, 1]") {
		REQUIRE_THROWS_AS(Settings::fromYaml(YAML::Load("baseline: {decay: 1.5}")), std::invalid_argument);
		REQUIRE_THROWS_AS(Settings::fromYaml(YAML::Load("baseline: {decay: 0}")), std::invalid_argument);
	}

	SECTION("clamp range that excludes neutral") {
		REQUIRE_THROWS_AS(Settings::fromYaml(YAML::Load("adjustment: {min_multiplier: 1.2}")), std::invalid_argument);
	}

	SECTION("wrong value type") {
		REQUIRE_THROWS_AS(Settings::fromYaml(YAML::Load("baseline: {window_weeks: many}")), std::invalid_argument);
	}

	SECTION("invalid canonical rule pattern") {
		REQUIRE_THROWS_AS(
		    Settings::fromYaml(YAML::Load("resolver: {canonical_rules: [{pattern: '(', canonical: Rye}]}")),
		    std::invalid_argument);
	}

	SECTION("non-positive rounding unit") {
		REQUIRE_THROWS_AS(Settings::fromYaml(YAML::Load("post: {items: {Rye: {round_unit: 0}}}")),
		                  std::invalid_argument);
	}

	SECTION("two overrides for one item") {
		REQUIRE_THROWS_AS(Settings::fromYaml(YAML::Load("post: {items: {Rye: {min_batch: 2}, ' rye': {min_batch: 4}}}")),
		                  std::invalid_argument);
	}
}

TEST_CASE("Settings file that cannot be read", "[config][settings][error]") {
	REQUIRE_THROWS_AS(prepcast::config::loadSettingsFile("/nonexistent/prepcast.yaml"), std::runtime_error);
}
