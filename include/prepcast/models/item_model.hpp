#pragma once

#include "prepcast/core/sales.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace prepcast::models {

/**
 * @struct ItemModel
 * @brief A trained per-item regression model.
 *
 * A record exists only when the item had at least the minimum number of
 * training samples. Retraining produces a new record that supersedes the old
 * one wholesale.
 */
struct ItemModel {
	core::ItemId item_id = 0;
	std::string algorithm_tag;
	/// Algorithm-specific parameters as a YAML document.
	std::string serialized_parameters;
	std::vector<std::string> feature_schema;
	std::size_t n_training_samples = 0;
	/// Cross-validated MAPE in percent; absent when the sample was too small to validate.
	std::optional<double> cross_val_error;
	bool low_confidence = false;
	std::chrono::system_clock::time_point trained_at{};
	std::uint64_t version = 0;
};

} // namespace prepcast::models
