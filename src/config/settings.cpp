#include "prepcast/config/settings.hpp"
#include "prepcast/ingest/normalizer.hpp"
#include "prepcast/utils/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <regex>
#include <set>
#include <stdexcept>

namespace prepcast::config {

namespace {

template <typename T>
void readScalar(const YAML::Node &node, const char *key, T &target) {
	if (node && node[key]) {
		target = node[key].as<T>();
	}
}

void readList(const YAML::Node &node, const char *key, std::vector<std::string> &target) {
	if (node && node[key]) {
		target = node[key].as<std::vector<std::string>>();
	}
}

WeatherSensitivity decodeSensitivity(const YAML::Node &node) {
	WeatherSensitivity sensitivity;
	readScalar(node, "temperature", sensitivity.temperature);
	readScalar(node, "precipitation", sensitivity.precipitation);
	return sensitivity;
}

void decodeNormalizer(const YAML::Node &node, NormalizerSettings &out) {
	if (!node) {
		return;
	}
	const auto synonyms = node["synonyms"];
	readList(synonyms, "date", out.synonyms.date);
	readList(synonyms, "item_name", out.synonyms.item_name);
	readList(synonyms, "quantity", out.synonyms.quantity);
	readList(synonyms, "variation", out.synonyms.variation);
	readList(synonyms, "event_type", out.synonyms.event_type);
	readList(node, "refund_vocabulary", out.refund_vocabulary);
	readScalar(node, "min_wide_date_columns", out.min_wide_date_columns);
	readScalar(node, "day_first", out.day_first);
}

void decodeResolver(const YAML::Node &node, ResolverSettings &out) {
	if (!node) {
		return;
	}
	readScalar(node, "fuzzy_threshold", out.fuzzy_threshold);
	if (node["canonical_rules"]) {
		out.canonical_rules.clear();
		for (const auto &rule : node["canonical_rules"]) {
			out.canonical_rules.push_back(
			    CanonicalRule{rule["pattern"].as<std::string>(), rule["canonical"].as<std::string>()});
		}
	}
}

void decodeModel(const YAML::Node &node, ModelSettings &out) {
	if (!node) {
		return;
	}
	readScalar(node, "min_training_samples", out.min_training_samples);
	readScalar(node, "ridge_alpha", out.ridge_alpha);
	if (node["cv_fractions"]) {
		out.cv_fractions = node["cv_fractions"].as<std::vector<double>>();
	}
	readScalar(node, "cv_min_samples", out.cv_min_samples);
	readScalar(node, "cv_min_train", out.cv_min_train);
	readScalar(node, "max_cv_mape", out.max_cv_mape);
}

void decodeAdjustment(const YAML::Node &node, AdjustmentSettings &out) {
	if (!node) {
		return;
	}
	readScalar(node, "min_multiplier", out.min_multiplier);
	readScalar(node, "max_multiplier", out.max_multiplier);
	readScalar(node, "temperature_anchor", out.temperature_anchor);
	readScalar(node, "precipitation_anchor", out.precipitation_anchor);
	readScalar(node, "max_weather_age_days", out.max_weather_age_days);
	readScalar(node, "location", out.location);
	if (node["default_weather_sensitivity"]) {
		out.default_weather_sensitivity = decodeSensitivity(node["default_weather_sensitivity"]);
	}
}

void decodePost(const YAML::Node &node, PostProcessSettings &out) {
	if (!node) {
		return;
	}
	readScalar(node, "alert_std_multiple", out.alert_std_multiple);
	readScalar(node, "default_min_batch", out.default_min_batch);
	readScalar(node, "default_round_unit", out.default_round_unit);
	if (const auto items = node["items"]) {
		for (const auto &entry : items) {
			ItemOverride override_entry;
			const auto &body = entry.second;
			if (body["min_batch"]) {
				override_entry.min_batch = body["min_batch"].as<double>();
			}
			if (body["round_unit"]) {
				override_entry.round_unit = body["round_unit"].as<double>();
			}
			if (body["weather_sensitivity"]) {
				override_entry.weather_sensitivity = decodeSensitivity(body["weather_sensitivity"]);
			}
			out.item_overrides[entry.first.as<std::string>()] = override_entry;
		}
	}
}

void decodeReadiness(const YAML::Node &node, ReadinessSettings &out) {
	readScalar(node, "enforce", out.enforce);
	readScalar(node, "tolerance_days", out.tolerance_days);
}

} // namespace

Settings Settings::fromYaml(const YAML::Node &root) {
	Settings settings;
	try {
		decodeNormalizer(root["normalizer"], settings.normalizer);
		decodeResolver(root["resolver"], settings.resolver);
		const auto baseline = root["baseline"];
		readScalar(baseline, "window_weeks", settings.baseline.window_weeks);
		readScalar(baseline, "decay", settings.baseline.decay);
		readScalar(baseline, "lookback_weeks", settings.baseline.lookback_weeks);
		decodeModel(root["model"], settings.model);
		decodeAdjustment(root["adjustment"], settings.adjustment);
		decodePost(root["post"], settings.post);
		decodeReadiness(root["readiness"], settings.readiness);
	} catch (const YAML::Exception &e) {
		throw std::invalid_argument(std::string("Malformed settings: ") + e.what());
	}
	settings.validate();
	return settings;
}

void Settings::validate() const {
	if (normalizer.synonyms.date.empty() || normalizer.synonyms.item_name.empty() ||
	    normalizer.synonyms.quantity.empty()) {
		throw std::invalid_argument("Header synonyms for date, item_name and quantity must not be empty.");
	}
	if (normalizer.min_wide_date_columns == 0) {
		throw std::invalid_argument("min_wide_date_columns must be positive.");
	}
	if (resolver.fuzzy_threshold <= 0.0 || resolver.fuzzy_threshold > 1.0) {
		throw std::invalid_argument("fuzzy_threshold must be in (0, 1].");
	}
	for (const auto &rule : resolver.canonical_rules) {
		if (rule.canonical.empty()) {
			throw std::invalid_argument("Canonical rule '" + rule.pattern + "' has an empty canonical name.");
		}
		try {
			std::regex compiled(rule.pattern, std::regex::ECMAScript | std::regex::icase);
		} catch (const std::regex_error &e) {
			throw std::invalid_argument("Canonical rule pattern '" + rule.pattern + "' is invalid: " + e.what());
		}
	}
	if (baseline.window_weeks <= 0) {
		throw std::invalid_argument("Baseline window must be positive.");
	}
	if (baseline.decay <= 0.0 || baseline.decay > 1.0) {
		throw std::invalid_argument("Baseline decay must be in (0, 1].");
	}
	if (baseline.lookback_weeks < baseline.window_weeks) {
		throw std::invalid_argument("lookback_weeks must cover the baseline window.");
	}
	if (model.min_training_samples == 0 || model.ridge_alpha < 0.0) {
		throw std::invalid_argument("Model requires a positive sample threshold and a non-negative ridge alpha.");
	}
	for (double fraction : model.cv_fractions) {
		if (fraction <= 0.0 || fraction >= 1.0) {
			throw std::invalid_argument("Cross-validation fractions must lie in (0, 1).");
		}
	}
	if (model.max_cv_mape <= 0.0) {
		throw std::invalid_argument("max_cv_mape must be positive.");
	}
	if (adjustment.min_multiplier <= 0.0 || adjustment.min_multiplier > 1.0 || adjustment.max_multiplier < 1.0) {
		throw std::invalid_argument("Adjustment bounds must satisfy 0 < min <= 1 <= max.");
	}
	if (adjustment.max_weather_age_days < 0) {
		throw std::invalid_argument("max_weather_age_days must be non-negative.");
	}
	if (post.alert_std_multiple <= 0.0 || post.default_min_batch < 0.0 || post.default_round_unit <= 0.0) {
		throw std::invalid_argument("Post-processing parameters must be positive (floor non-negative).");
	}
	std::set<std::string> override_keys;
	for (const auto &entry : post.item_overrides) {
		if (!override_keys.insert(ingest::Normalizer::normalizeKey(entry.first)).second) {
			throw std::invalid_argument("Item '" + entry.first + "' has more than one override.");
		}
		if ((entry.second.min_batch && *entry.second.min_batch < 0.0) ||
		    (entry.second.round_unit && *entry.second.round_unit <= 0.0)) {
			throw std::invalid_argument("Invalid override for item '" + entry.first + "'.");
		}
	}
	if (readiness.tolerance_days < 0) {
		throw std::invalid_argument("Readiness tolerance must be non-negative.");
	}
}

const ItemOverride *PostProcessSettings::overrideFor(const std::string &item_name) const {
	const auto exact = item_overrides.find(item_name);
	if (exact != item_overrides.end()) {
		return &exact->second;
	}
	const auto key = ingest::Normalizer::normalizeKey(item_name);
	for (const auto &entry : item_overrides) {
		if (ingest::Normalizer::normalizeKey(entry.first) == key) {
			return &entry.second;
		}
	}
	return nullptr;
}

const ItemOverride *Settings::overrideFor(const std::string &canonical_name) const {
	return post.overrideFor(canonical_name);
}

Settings loadSettingsFile(const std::string &path) {
	YAML::Node root;
	try {
		root = YAML::LoadFile(path);
	} catch (const YAML::Exception &e) {
		throw std::runtime_error("Cannot load settings from '" + path + "': " + e.what());
	}
	auto settings = Settings::fromYaml(root);
	PREPCAST_INFO("Loaded settings from {} ({} canonical rules, {} item overrides).", path,
	              settings.resolver.canonical_rules.size(), settings.post.item_overrides.size());
	return settings;
}

} // namespace prepcast::config
