#pragma once

#include "prepcast/config/settings.hpp"
#include "prepcast/core/sales.hpp"
#include "prepcast/ingest/raw_table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace prepcast::ingest {

/**
 * @struct RejectedRow
 * @brief An export row (or wide cell) that could not be turned into a tidy row.
 */
struct RejectedRow {
	std::string source_row_ref;
	std::string reason;
};

/**
 * @struct ColumnMapping
 * @brief Column indices resolved from the header row.
 */
struct ColumnMapping {
	std::optional<std::size_t> date;
	std::optional<std::size_t> item_name;
	std::optional<std::size_t> quantity;
	std::optional<std::size_t> variation;
	std::optional<std::size_t> event_type;
	/// Wide exports: (column index, parsed date) of every date header.
	std::vector<std::pair<std::size_t, core::Date>> date_columns;

	bool isWide() const {
		return !date_columns.empty();
	}
};

/**
 * @struct NormalizedBatch
 * @brief Output of one normalization pass: tidy rows aggregated per (date, raw item name).
 */
struct NormalizedBatch {
	std::vector<core::TidySaleRow> rows;
	std::vector<RejectedRow> rejected;
	bool wide_format = false;
	std::size_t input_rows = 0;
};

/**
 * @class Normalizer
 * @brief Maps heterogeneous sales exports onto a tidy `{date, item, quantity, is_refund}` stream.
 *
 * The Normalizer is the only component that decides refund signs. Duplicate
 * (date, raw item name) rows within one batch are summed here, before item
 * resolution.
 */
class Normalizer {
public:
	explicit Normalizer(config::NormalizerSettings settings);

	/**
	 * @brief Resolves semantic columns from the header row using the synonym table.
	 * @throws core::SchemaError If a mandatory column cannot be resolved.
	 */
	ColumnMapping resolveColumns(const std::vector<std::string> &headers) const;

	/**
	 * @brief Normalizes one export.
	 * @throws core::SchemaError If mandatory columns are missing; nothing is produced in that case.
	 */
	NormalizedBatch normalize(const RawTable &table) const;

	/// Returns true when @p event_type belongs to the refund vocabulary or @p quantity is negative.
	bool isRefund(const std::string &event_type, double quantity) const;

	/**
	 * @brief Sums rows sharing (date, raw item name); the result does not depend on input order.
	 */
	static std::vector<core::TidySaleRow> aggregate(const std::vector<core::TidySaleRow> &rows);

	/// Lower-cases, trims and collapses inner whitespace.
	static std::string normalizeKey(const std::string &text);

private:
	std::vector<core::TidySaleRow> normalizeWide(const RawTable &table, const ColumnMapping &mapping,
	                                             std::vector<RejectedRow> &rejected) const;
	std::vector<core::TidySaleRow> normalizeLong(const RawTable &table, const ColumnMapping &mapping,
	                                             std::vector<RejectedRow> &rejected) const;
	std::string itemName(const RawTable &table, std::size_t row, const ColumnMapping &mapping) const;

	config::NormalizerSettings settings_;
};

} // namespace prepcast::ingest
