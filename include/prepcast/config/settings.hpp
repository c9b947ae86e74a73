#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace prepcast::config {

/**
 * @struct HeaderSynonyms
 * @brief Declarative table of header names recognized for each semantic column.
 *
 * Matching is case- and whitespace-insensitive. Supporting a new export vendor
 * means adding entries here.
 */
struct HeaderSynonyms {
	std::vector<std::string> date{"date", "Business Date", "Order Date", "Sales Date", "Transaction Date",
	                              "Payment Date"};
	std::vector<std::string> item_name{"item_name", "Item Name", "Item", "Product", "Product Name", "SKU Name",
	                                   "Item/Variation", "Item - Variation", "Name"};
	std::vector<std::string> quantity{"quantity_sold", "Qty", "Quantity", "Count", "Units", "Unit",
	                                  "Quantity Sold", "Net Quantity", "Qty Sold", "Sales Quantity", "Items Sold"};
	std::vector<std::string> variation{"Item Variation", "Variation", "Price Point Name"};
	std::vector<std::string> event_type{"Event Type", "Itemization Type", "Transaction Type", "Type"};
};

struct NormalizerSettings {
	HeaderSynonyms synonyms;
	/// Event/itemization type values that mark a row as a refund (case-insensitive).
	std::vector<std::string> refund_vocabulary{"refund", "refunds", "return", "returned"};
	/// Minimum number of date-like headers for an export to be treated as wide.
	std::size_t min_wide_date_columns = 5;
	/// Interpret `D/M/YYYY` style cells day-first.
	bool day_first = true;
};

/**
 * @struct CanonicalRule
 * @brief Explicit mapping of raw names matching @p pattern onto a canonical item.
 */
struct CanonicalRule {
	std::string pattern;
	std::string canonical;
};

struct ResolverSettings {
	/// Minimum token similarity for a fuzzy match to be accepted.
	double fuzzy_threshold = 0.8;
	/// Rules are tried in order; the first matching rule wins.
	std::vector<CanonicalRule> canonical_rules;
};

struct BaselineSettings {
	/// Number of most recent weekday instances considered.
	int window_weeks = 8;
	/// Recency decay in (0, 1]; instance i steps back is weighted decay^i.
	double decay = 0.9;
	/// Weeks of history fetched before the forecast Monday.
	int lookback_weeks = 26;
};

struct ModelSettings {
	std::size_t min_training_samples = 20;
	double ridge_alpha = 1.0;
	/// Rolling-origin split points as fractions of the training sample.
	std::vector<double> cv_fractions{0.6, 0.75, 0.9};
	std::size_t cv_min_samples = 30;
	std::size_t cv_min_train = 10;
	/// Cross-validated MAPE (percent) above which a model is low-confidence.
	double max_cv_mape = 35.0;
};

struct WeatherSensitivity {
	double temperature = 0.0;
	double precipitation = 0.0;
};

struct AdjustmentSettings {
	double min_multiplier = 0.5;
	double max_multiplier = 1.5;
	double temperature_anchor = 20.0;
	double precipitation_anchor = 1.0;
	int max_weather_age_days = 7;
	/// Applied to items without their own sensitivity; unset means weather-neutral.
	std::optional<WeatherSensitivity> default_weather_sensitivity;
	std::string location = "default";
};

/**
 * @struct ItemOverride
 * @brief Per-item post-processing parameters, keyed by canonical name.
 */
struct ItemOverride {
	std::optional<double> min_batch;
	std::optional<double> round_unit;
	std::optional<WeatherSensitivity> weather_sensitivity;
};

struct PostProcessSettings {
	/// Alert when a forecast deviates from the weekday mean by more than this many standard deviations.
	double alert_std_multiple = 1.5;
	double default_min_batch = 0.0;
	double default_round_unit = 1.0;
	/// Keyed by canonical item name; matched ignoring case and repeated whitespace.
	std::map<std::string, ItemOverride> item_overrides;

	const ItemOverride *overrideFor(const std::string &item_name) const;
};

struct ReadinessSettings {
	bool enforce = true;
	/**
	 * Days of slack allowed between the last committed sale and the day before
	 * the forecast week. A required Sunday falls back to Saturday: the bakery is
	 * closed, so no export can commit it.
	 */
	int tolerance_days = 0;
};

/**
 * @struct Settings
 * @brief All tunable parameters of the pipeline with their documented defaults.
 */
struct Settings {
	NormalizerSettings normalizer;
	ResolverSettings resolver;
	BaselineSettings baseline;
	ModelSettings model;
	AdjustmentSettings adjustment;
	PostProcessSettings post;
	ReadinessSettings readiness;

	/**
	 * @brief Reads settings from a YAML document; absent keys keep their defaults.
	 * @throws std::invalid_argument If a value has the wrong type or fails validation.
	 */
	static Settings fromYaml(const YAML::Node &root);

	/**
	 * @brief Checks that all values are consistent.
	 * @throws std::invalid_argument On the first inconsistent value.
	 */
	void validate() const;

	/// Override for an item, if one is configured under its canonical name.
	const ItemOverride *overrideFor(const std::string &canonical_name) const;
};

/**
 * @brief Loads and validates settings from a YAML file.
 * @throws std::runtime_error If the file cannot be read or parsed.
 */
Settings loadSettingsFile(const std::string &path);

} // namespace prepcast::config
