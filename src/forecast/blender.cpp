#include "prepcast/forecast/blender.hpp"
#include "prepcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace prepcast::forecast {

namespace {

std::string formatDeviation(const detectors::Deviation &deviation) {
	char buffer[160];
	std::snprintf(buffer, sizeof(buffer), "forecast %.1f vs mean %.1f (sd %.1f, %+.1f sd)", deviation.value,
	              deviation.mean, deviation.stddev, deviation.score);
	return buffer;
}

Alert makeAlert(core::ItemId item_id, std::optional<core::ForecastDay> day, const char *reason, std::string detail) {
	Alert alert;
	alert.item_id = item_id;
	alert.day = day;
	alert.reason = reason;
	alert.detail = std::move(detail);
	return alert;
}

} // namespace

Blender::Blender(config::PostProcessSettings settings)
    : settings_(std::move(settings)),
      detector_(detectors::HistoryDeviationDetectorBuilder().withThreshold(settings_.alert_std_multiple).build()) {
	if (settings_.default_min_batch < 0.0 || !(settings_.default_round_unit > 0.0)) {
		throw std::invalid_argument("Default floor must be non-negative and the rounding unit positive.");
	}
}

void Blender::checkAlpha(double alpha) {
	if (!(alpha >= 0.0 && alpha <= 1.0)) {
		throw std::invalid_argument("Model emphasis alpha must lie in [0, 1], got " + std::to_string(alpha) + ".");
	}
}

const config::ItemOverride *Blender::overrideFor(const std::string &item_name) const {
	return settings_.overrideFor(item_name);
}

double Blender::floorFor(const std::string &item_name) const {
	const auto *entry = overrideFor(item_name);
	return entry && entry->min_batch ? *entry->min_batch : settings_.default_min_batch;
}

double Blender::roundUnitFor(const std::string &item_name) const {
	const auto *entry = overrideFor(item_name);
	return entry && entry->round_unit ? *entry->round_unit : settings_.default_round_unit;
}

double Blender::roundToUnit(double value, double unit, double floor) {
	if (!(unit > 0.0)) {
		throw std::invalid_argument("Rounding unit must be positive.");
	}
	const double rounded = std::round(value / unit) * unit;
	const double floor_in_units = std::ceil(floor / unit) * unit;
	return std::max(rounded, floor_in_units);
}

std::string Blender::weeklyNote(double weekly_total, const baseline::HistoryStats &weekly, double std_multiple) {
	if (weekly.count == 0 || weekly.mean <= 0.0) {
		return "No typical week yet";
	}
	const double diff_pct = (weekly_total - weekly.mean) / weekly.mean * 100.0;
	char buffer[64];
	if (weekly.stddev > 0.0 && weekly_total > weekly.mean + std_multiple * weekly.stddev) {
		std::snprintf(buffer, sizeof(buffer), "Higher than usual (+%.0f%%)", diff_pct);
		return buffer;
	}
	if (weekly.stddev > 0.0 && weekly_total < std::max(weekly.mean - std_multiple * weekly.stddev, 0.0)) {
		std::snprintf(buffer, sizeof(buffer), "Lower than usual (%.0f%%)", diff_pct);
		return buffer;
	}
	return "As expected";
}

BlendResult Blender::blend(const ItemBlendInput &input, double alpha, bool use_model) const {
	checkAlpha(alpha);

	const bool model_usable = use_model && input.model.prediction && !input.model.low_confidence;
	const double effective_alpha = model_usable ? alpha : 0.0;
	const double floor = floorFor(input.item_name);
	const double unit = roundUnitFor(input.item_name);

	BlendResult result;
	auto &line = result.line;
	line.item_id = input.item_id;
	line.item_name = input.item_name;
	line.multipliers = input.multipliers;
	line.model_prediction = input.model.prediction;
	line.cold_start = input.baseline.isColdStart();
	if (model_usable && effective_alpha > 0.0) {
		line.model_version = input.model.version;
	}

	if (use_model && input.model.failure) {
		result.alerts.push_back(makeAlert(input.item_id, std::nullopt, reasons::kModelUnavailable, *input.model.failure));
	} else if (use_model && input.model.prediction && input.model.low_confidence) {
		result.alerts.push_back(makeAlert(input.item_id, std::nullopt, reasons::kModelLowConfidence,
		                                  "model omitted; baseline only"));
	}
	if (line.cold_start) {
		result.alerts.push_back(makeAlert(input.item_id, std::nullopt, reasons::kColdStart, "no sales history"));
	}

	for (std::size_t day = 0; day < core::kForecastDays; ++day) {
		const auto forecast_day = static_cast<core::ForecastDay>(day);
		const auto &weekday_baseline = input.baseline.days[day];
		const double baseline_value = weekday_baseline.estimated_mean;
		line.baseline[day] = baseline_value;

		double pre = baseline_value;
		if (effective_alpha > 0.0) {
			pre = (1.0 - effective_alpha) * baseline_value + effective_alpha * (*input.model.prediction)[day];
		}
		pre = std::max(0.0, pre);

		const double final_value = std::max(pre * input.multipliers[day], floor);

		if (!line.cold_start && weekday_baseline.source == baseline::BaselineSource::ColdStart) {
			result.alerts.push_back(
			    makeAlert(input.item_id, forecast_day, reasons::kColdStart, "no history for this weekday"));
		}
		if (auto deviation = detector_->check(final_value, input.baseline.history[day])) {
			result.alerts.push_back(
			    makeAlert(input.item_id, forecast_day, reasons::kDeviatesFromHistory, formatDeviation(*deviation)));
		}

		line.quantities[day] = roundToUnit(final_value, unit, floor);
	}

	line.note = weeklyNote(line.weeklyTotal(), input.baseline.weekly_totals, settings_.alert_std_multiple);
	if (!result.alerts.empty()) {
		PREPCAST_DEBUG("Item {} '{}' raised {} alerts.", input.item_id, input.item_name, result.alerts.size());
	}
	return result;
}

} // namespace prepcast::forecast
