#pragma once

#include "prepcast/core/date.hpp"
#include "prepcast/core/sales.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace prepcast::forecast {

using DayValues = std::array<double, core::kForecastDays>;

/**
 * @struct Alert
 * @brief An advisory note attached to a run; never alters a forecast value.
 */
struct Alert {
	core::ItemId item_id = 0;
	std::optional<core::ForecastDay> day;
	std::string reason;
	std::string detail;
};

/**
 * @struct ForecastLine
 * @brief Final quantities of one item for the six operating days, with their inputs.
 */
struct ForecastLine {
	core::ItemId item_id = 0;
	std::string item_name;
	DayValues quantities{};
	DayValues baseline{};
	DayValues multipliers{};
	std::optional<DayValues> model_prediction;
	/// Version of the model blended into this line, if any.
	std::optional<std::uint64_t> model_version;
	bool cold_start = false;
	std::string note;

	double weeklyTotal() const {
		double total = 0.0;
		for (double quantity : quantities) {
			total += quantity;
		}
		return total;
	}
};

/**
 * @struct ForecastRun
 * @brief One immutable forecast generation event.
 */
struct ForecastRun {
	std::int64_t run_id = 0;
	core::Date week_start;
	double alpha = 0.0;
	bool use_model = false;
	std::vector<ForecastLine> lines;
	std::vector<Alert> alerts;
	std::chrono::system_clock::time_point created_at{};

	const ForecastLine *line(core::ItemId item_id) const {
		for (const auto &entry : lines) {
			if (entry.item_id == item_id) {
				return &entry;
			}
		}
		return nullptr;
	}
};

} // namespace prepcast::forecast
