#pragma once

#include "prepcast/core/date.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace prepcast::core {

using ItemId = std::int64_t;

/**
 * @struct TidySaleRow
 * @brief One normalized observation before item resolution.
 *
 * Refund rows always carry a negative quantity.
 */
struct TidySaleRow {
	Date date;
	std::string item_name_raw;
	double quantity = 0.0;
	bool is_refund = false;
	std::string source_row_ref;
	/// Zero-based data row that source_row_ref points to; orders references by position.
	std::size_t source_row = 0;
	/// Number of export rows summed into this row.
	std::size_t contributing_rows = 1;
};

/**
 * @struct CanonicalSaleRecord
 * @brief A deduplicated, refund-normalized, item-resolved daily sales observation.
 */
struct CanonicalSaleRecord {
	Date date;
	ItemId item_id = 0;
	double quantity = 0.0;
	std::string source_row_ref;
};

enum class AliasOrigin {
	Canonical, ///< The item's own canonical name.
	Exact,     ///< Registered on an exact normalized hit.
	Rule,      ///< Linked by a configured canonical rule.
	Fuzzy,     ///< Linked by fuzzy token matching.
	Manual     ///< Registered by an administrator.
};

struct ItemAlias {
	std::string alias;
	AliasOrigin origin = AliasOrigin::Exact;
};

/**
 * @struct Item
 * @brief A canonical item identity with its known aliases.
 */
struct Item {
	ItemId item_id = 0;
	std::string canonical_name;
	std::vector<ItemAlias> aliases;
};

} // namespace prepcast::core
