#include "prepcast/ingest/normalizer.hpp"
#include "prepcast/core/errors.hpp"
#include "prepcast/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <utility>

namespace prepcast::ingest {

namespace {

std::string trim(const std::string &text) {
	const auto first = text.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) {
		return {};
	}
	const auto last = text.find_last_not_of(" \t\r\n");
	return text.substr(first, last - first + 1);
}

std::string collapseWhitespace(const std::string &text) {
	std::string out;
	out.reserve(text.size());
	bool pending_space = false;
	for (char ch : trim(text)) {
		if (std::isspace(static_cast<unsigned char>(ch))) {
			pending_space = true;
			continue;
		}
		if (pending_space) {
			out.push_back(' ');
			pending_space = false;
		}
		out.push_back(ch);
	}
	return out;
}

enum class CellStatus { Ok, Blank, Invalid };

// Parses a quantity cell; thousands separators are tolerated.
CellStatus parseQuantity(const std::string &cell, double &value) {
	std::string text = trim(cell);
	text.erase(std::remove(text.begin(), text.end(), ','), text.end());
	if (text.empty()) {
		return CellStatus::Blank;
	}
	try {
		std::size_t consumed = 0;
		value = std::stod(text, &consumed);
		if (consumed != text.size() || !std::isfinite(value)) {
			return CellStatus::Invalid;
		}
	} catch (const std::exception &) {
		return CellStatus::Invalid;
	}
	return CellStatus::Ok;
}

std::optional<std::size_t> findColumn(const std::vector<std::string> &normalized_headers,
                                      const std::vector<std::string> &synonyms,
                                      const std::vector<bool> &taken) {
	for (const auto &synonym : synonyms) {
		const auto key = Normalizer::normalizeKey(synonym);
		for (std::size_t column = 0; column < normalized_headers.size(); ++column) {
			if (!taken[column] && normalized_headers[column] == key) {
				return column;
			}
		}
	}
	return std::nullopt;
}

std::string rowRef(const RawTable &table, std::size_t row) {
	// Data rows start on line 2 of the export.
	return table.source_name + ":" + std::to_string(row + 2);
}

} // namespace

Normalizer::Normalizer(config::NormalizerSettings settings) : settings_(std::move(settings)) {
}

std::string Normalizer::normalizeKey(const std::string &text) {
	auto key = collapseWhitespace(text);
	std::transform(key.begin(), key.end(), key.begin(),
	               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
	return key;
}

ColumnMapping Normalizer::resolveColumns(const std::vector<std::string> &headers) const {
	ColumnMapping mapping;
	std::vector<std::string> normalized;
	normalized.reserve(headers.size());
	for (const auto &header : headers) {
		normalized.push_back(normalizeKey(header));
	}
	std::vector<bool> taken(headers.size(), false);

	for (std::size_t column = 0; column < headers.size(); ++column) {
		if (!core::Date::looksLikeDate(headers[column])) {
			continue;
		}
		if (auto date = core::Date::parse(headers[column], settings_.day_first)) {
			mapping.date_columns.emplace_back(column, *date);
		} else {
			PREPCAST_WARN("Ignoring date-like header '{}' that is not a valid calendar date.", headers[column]);
		}
	}
	if (mapping.date_columns.size() < settings_.min_wide_date_columns) {
		mapping.date_columns.clear();
	}
	for (const auto &entry : mapping.date_columns) {
		taken[entry.first] = true;
	}

	auto claim = [&](const std::vector<std::string> &synonyms) {
		auto column = findColumn(normalized, synonyms, taken);
		if (column) {
			taken[*column] = true;
		}
		return column;
	};
	mapping.item_name = claim(settings_.synonyms.item_name);
	mapping.variation = claim(settings_.synonyms.variation);
	mapping.event_type = claim(settings_.synonyms.event_type);
	if (!mapping.isWide()) {
		mapping.date = claim(settings_.synonyms.date);
		mapping.quantity = claim(settings_.synonyms.quantity);
	}

	std::vector<std::string> missing;
	if (!mapping.item_name) {
		missing.emplace_back("item_name");
	}
	if (!mapping.isWide()) {
		if (!mapping.date) {
			missing.emplace_back("date");
		}
		if (!mapping.quantity) {
			missing.emplace_back("quantity");
		}
	}
	if (!missing.empty()) {
		std::string joined;
		for (const auto &field : missing) {
			joined += (joined.empty() ? "" : ", ") + field;
		}
		throw core::SchemaError("Missing required columns after synonym matching: " + joined, missing);
	}
	return mapping;
}

bool Normalizer::isRefund(const std::string &event_type, double quantity) const {
	if (quantity < 0.0) {
		return true;
	}
	const auto key = normalizeKey(event_type);
	if (key.empty()) {
		return false;
	}
	for (const auto &word : settings_.refund_vocabulary) {
		if (normalizeKey(word) == key) {
			return true;
		}
	}
	return false;
}

std::string Normalizer::itemName(const RawTable &table, std::size_t row, const ColumnMapping &mapping) const {
	auto name = collapseWhitespace(table.cell(row, *mapping.item_name));
	if (mapping.variation && !name.empty()) {
		const auto variation = collapseWhitespace(table.cell(row, *mapping.variation));
		if (!variation.empty() && normalizeKey(variation) != "nan") {
			name += " - " + variation;
		}
	}
	return name;
}

std::vector<core::TidySaleRow> Normalizer::normalizeWide(const RawTable &table, const ColumnMapping &mapping,
                                                         std::vector<RejectedRow> &rejected) const {
	std::vector<core::TidySaleRow> rows;
	for (std::size_t row = 0; row < table.rows.size(); ++row) {
		const auto name = itemName(table, row, mapping);
		if (name.empty()) {
			rejected.push_back({rowRef(table, row), "blank item name"});
			continue;
		}
		for (const auto &entry : mapping.date_columns) {
			const auto &cell = table.cell(row, entry.first);
			const auto ref = rowRef(table, row) + ":" + table.headers[entry.first];
			double quantity = 0.0;
			const auto status = parseQuantity(cell, quantity);
			if (status == CellStatus::Invalid) {
				rejected.push_back({ref, "non-numeric quantity '" + cell + "'"});
				continue;
			}
			// Wide exports list only sales; blank and non-positive cells carry no observation.
			if (status == CellStatus::Blank || quantity <= 0.0) {
				continue;
			}
			core::TidySaleRow tidy;
			tidy.date = entry.second;
			tidy.item_name_raw = name;
			tidy.quantity = quantity;
			tidy.source_row_ref = ref;
			tidy.source_row = row;
			rows.push_back(std::move(tidy));
		}
	}
	return rows;
}

std::vector<core::TidySaleRow> Normalizer::normalizeLong(const RawTable &table, const ColumnMapping &mapping,
                                                         std::vector<RejectedRow> &rejected) const {
	std::vector<core::TidySaleRow> rows;
	rows.reserve(table.rows.size());
	for (std::size_t row = 0; row < table.rows.size(); ++row) {
		const auto ref = rowRef(table, row);
		const auto &date_cell = table.cell(row, *mapping.date);
		const auto date = core::Date::parse(date_cell, settings_.day_first);
		if (!date) {
			rejected.push_back({ref, "unparseable date '" + date_cell + "'"});
			continue;
		}
		const auto name = itemName(table, row, mapping);
		if (name.empty()) {
			rejected.push_back({ref, "blank item name"});
			continue;
		}
		double quantity = 0.0;
		const auto &quantity_cell = table.cell(row, *mapping.quantity);
		const auto status = parseQuantity(quantity_cell, quantity);
		if (status != CellStatus::Ok) {
			rejected.push_back({ref, status == CellStatus::Blank ? std::string("missing quantity")
			                                                     : "non-numeric quantity '" + quantity_cell + "'"});
			continue;
		}

		const std::string event_type = mapping.event_type ? table.cell(row, *mapping.event_type) : std::string();
		core::TidySaleRow tidy;
		tidy.date = *date;
		tidy.item_name_raw = name;
		tidy.is_refund = isRefund(event_type, quantity);
		tidy.quantity = tidy.is_refund ? -std::abs(quantity) : quantity;
		tidy.source_row_ref = ref;
		tidy.source_row = row;
		rows.push_back(std::move(tidy));
	}
	return rows;
}

NormalizedBatch Normalizer::normalize(const RawTable &table) const {
	const auto mapping = resolveColumns(table.headers);

	NormalizedBatch batch;
	batch.wide_format = mapping.isWide();
	batch.input_rows = table.rows.size();
	auto rows = batch.wide_format ? normalizeWide(table, mapping, batch.rejected)
	                              : normalizeLong(table, mapping, batch.rejected);
	batch.rows = aggregate(rows);

	PREPCAST_INFO("Normalized '{}' ({} export): {} input rows -> {} tidy rows, {} rejected.", table.source_name,
	              batch.wide_format ? "wide" : "tidy", batch.input_rows, batch.rows.size(), batch.rejected.size());
	return batch;
}

std::vector<core::TidySaleRow> Normalizer::aggregate(const std::vector<core::TidySaleRow> &rows) {
	std::map<std::pair<core::Date, std::string>, core::TidySaleRow> grouped;
	for (const auto &row : rows) {
		auto key = std::make_pair(row.date, collapseWhitespace(row.item_name_raw));
		auto it = grouped.find(key);
		if (it == grouped.end()) {
			auto entry = row;
			entry.item_name_raw = key.second;
			grouped.emplace(std::move(key), std::move(entry));
			continue;
		}
		auto &total = it->second;
		total.quantity += row.quantity;
		total.contributing_rows += row.contributing_rows;
		if (row.source_row < total.source_row) {
			total.source_row_ref = row.source_row_ref;
			total.source_row = row.source_row;
		}
	}

	std::vector<core::TidySaleRow> result;
	result.reserve(grouped.size());
	for (auto &entry : grouped) {
		entry.second.is_refund = entry.second.quantity < 0.0;
		result.push_back(std::move(entry.second));
	}
	return result;
}

} // namespace prepcast::ingest
