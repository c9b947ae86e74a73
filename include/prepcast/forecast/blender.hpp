#pragma once

#include "prepcast/baseline/baseline_estimator.hpp"
#include "prepcast/config/settings.hpp"
#include "prepcast/detectors/history_deviation.hpp"
#include "prepcast/forecast/forecast_run.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prepcast::forecast {

/// Alert reasons attached to forecast runs.
namespace reasons {
inline constexpr const char *kDeviatesFromHistory = "deviates from history";
inline constexpr const char *kColdStart = "cold start: no history";
inline constexpr const char *kModelUnavailable = "model unavailable";
inline constexpr const char *kModelLowConfidence = "model low confidence";
} // namespace reasons

/**
 * @struct ModelInput
 * @brief What the per-item model contributed to one item's forecast.
 */
struct ModelInput {
	/// Unclipped Monday-to-Saturday predictions; absent when no model exists or prediction failed.
	std::optional<DayValues> prediction;
	std::optional<std::uint64_t> version;
	bool low_confidence = false;
	/// Set when a model exists but could not be evaluated.
	std::optional<std::string> failure;
};

/**
 * @struct ItemBlendInput
 * @brief Everything the blender needs for one item.
 */
struct ItemBlendInput {
	core::ItemId item_id = 0;
	std::string item_name;
	baseline::BaselineEstimate baseline;
	ModelInput model;
	DayValues multipliers{1.0, 1.0, 1.0, 1.0, 1.0, 1.0};
};

/**
 * @struct BlendResult
 * @brief The finished line of one item and the alerts raised while producing it.
 */
struct BlendResult {
	ForecastLine line;
	std::vector<Alert> alerts;
};

/**
 * @class Blender
 * @brief Blends baseline and model, applies adjustments, floors, alerts and rounding.
 *
 * Per day: pre = max(0, (1 - a) baseline + a model), where a is 0 if no
 * confident model is available or the caller disabled the model; then
 * final = max(pre x multiplier, floor). Deviation alerts are evaluated on the
 * unrounded final value; rounding to the item's unit happens last and never
 * drops below the floor.
 */
class Blender {
public:
	explicit Blender(config::PostProcessSettings settings);

	/**
	 * @brief Produces the forecast line of one item.
	 * @param alpha Model emphasis in [0, 1].
	 * @param use_model False forces baseline-only forecasts.
	 * @throws std::invalid_argument If @p alpha lies outside [0, 1].
	 */
	BlendResult blend(const ItemBlendInput &input, double alpha, bool use_model) const;

	/// Minimum batch of an item, from its override or the default.
	double floorFor(const std::string &item_name) const;

	/// Rounding unit of an item, from its override or the default.
	double roundUnitFor(const std::string &item_name) const;

	/**
	 * @brief Rounds to the nearest multiple of @p unit, but not below @p floor rounded up to the unit.
	 * @throws std::invalid_argument If @p unit is not positive.
	 */
	static double roundToUnit(double value, double unit, double floor);

	/**
	 * @brief Describes a weekly total relative to the item's typical week.
	 * @param std_multiple Number of weekly standard deviations that count as unusual.
	 */
	static std::string weeklyNote(double weekly_total, const baseline::HistoryStats &weekly, double std_multiple);

	/// Validates a model emphasis value.
	static void checkAlpha(double alpha);

private:
	const config::ItemOverride *overrideFor(const std::string &item_name) const;

	config::PostProcessSettings settings_;
	std::unique_ptr<detectors::IDeviationDetector> detector_;
};

} // namespace prepcast::forecast
