#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/sales_helpers.hpp"
#include "prepcast/core/errors.hpp"
#include "prepcast/ingest/normalizer.hpp"

#include <algorithm>

using prepcast::config::NormalizerSettings;
using prepcast::ingest::Normalizer;
using tests::helpers::makeTable;

namespace {

const prepcast::core::TidySaleRow *findRow(const prepcast::ingest::NormalizedBatch &batch, const std::string &date,
                                           const std::string &item) {
	for (const auto &row : batch.rows) {
		if (row.date.toString() == date && row.item_name_raw == item) {
			return &row;
		}
	}
	return nullptr;
}

} // namespace

TEST_CASE("Normalizer maps vendor headers through synonyms", "[ingest][normalizer]") {
	Normalizer normalizer{NormalizerSettings{}};
	const auto mapping = normalizer.resolveColumns({"Business Date", " item  name ", "Net Quantity", "Itemization Type"});

	REQUIRE(mapping.date == std::size_t{0});
	REQUIRE(mapping.item_name == std::size_t{1});
	REQUIRE(mapping.quantity == std::size_t{2});
	REQUIRE(mapping.event_type == std::size_t{3});
	REQUIRE_FALSE(mapping.isWide());
}

TEST_CASE("Normalizer reports missing mandatory columns", "[ingest][normalizer][error]") {
	Normalizer normalizer{NormalizerSettings{}};
	const auto table = makeTable({"Date", "Product"}, {{"2024-06-03", "Rye"}});

	try {
		normalizer.normalize(table);
		FAIL("Expected a SchemaError");
	} catch (const prepcast::core::SchemaError &e) {
		REQUIRE(e.missingFields() == std::vector<std::string>{"quantity"});
	}
}

TEST_CASE("Normalizer signs refunds the same whichever way they are exported", "[ingest][normalizer][refund]") {
	Normalizer normalizer{NormalizerSettings{}};

	const auto by_type = makeTable({"Date", "Item", "Qty", "Type"}, {{"2024-06-03", "Croissant", "10", "Sale"},
	                                                                {"2024-06-03", "Croissant", "3", "Refund"}});
	const auto by_sign = makeTable({"Date", "Item", "Qty", "Type"}, {{"2024-06-03", "Croissant", "10", "Sale"},
	                                                                {"2024-06-03", "Croissant", "-3", ""}});

	const auto first = normalizer.normalize(by_type);
	const auto second = normalizer.normalize(by_sign);

	REQUIRE(first.rows.size() == 1);
	REQUIRE(second.rows.size() == 1);
	REQUIRE(first.rows.front().quantity == Catch::Approx(7.0));
	REQUIRE(second.rows.front().quantity == Catch::Approx(7.0));
	REQUIRE(first.rows.front().contributing_rows == 2);

	REQUIRE(normalizer.isRefund("RETURNED", 1.0));
	REQUIRE(normalizer.isRefund("", -1.0));
	REQUIRE_FALSE(normalizer.isRefund("sale", 1.0));
}

TEST_CASE("Normalizer aggregation does not depend on row order", "[ingest][normalizer]") {
	std::vector<std::vector<std::string>> rows{{"2024-06-03", "Croissant", "4"},
	                                           {"2024-06-03", "Rye Bread", "2"},
	                                           {"2024-06-03", "Croissant ", "5"},
	                                           {"2024-06-04", "Croissant", "1"}};
	Normalizer normalizer{NormalizerSettings{}};
	const auto forward = normalizer.normalize(makeTable({"Date", "Item", "Qty"}, rows));
	std::reverse(rows.begin(), rows.end());
	const auto backward = normalizer.normalize(makeTable({"Date", "Item", "Qty"}, rows));

	REQUIRE(forward.rows.size() == 3);
	REQUIRE(backward.rows.size() == forward.rows.size());
	for (std::size_t i = 0; i < forward.rows.size(); ++i) {
		REQUIRE(forward.rows[i].date == backward.rows[i].date);
		REQUIRE(forward.rows[i].item_name_raw == backward.rows[i].item_name_raw);
		REQUIRE(forward.rows[i].quantity == Catch::Approx(backward.rows[i].quantity));
		REQUIRE(forward.rows[i].contributing_rows == backward.rows[i].contributing_rows);
	}
	const auto *croissant = findRow(forward, "2024-06-03", "Croissant");
	REQUIRE(croissant != nullptr);
	REQUIRE(croissant->quantity == Catch::Approx(9.0));
}

TEST_CASE("Normalizer unpivots wide exports", "[ingest][normalizer][wide]") {
	const auto table =
	    makeTable({"Item Name", "2024-06-03", "2024-06-04", "2024-06-05", "2024-06-06", "2024-06-07", "Total"},
	              {{"Croissant", "10", "", "12", "0", "8", "30"}, {"Rye Bread", "2", "3", "x", "1", "1", "7"}},
	              "wide.csv");
	Normalizer normalizer{NormalizerSettings{}};
	const auto batch = normalizer.normalize(table);

	REQUIRE(batch.wide_format);
	REQUIRE(batch.input_rows == 2);
	REQUIRE(batch.rows.size() == 3 + 4);
	REQUIRE(findRow(batch, "2024-06-04", "Croissant") == nullptr);
	REQUIRE(findRow(batch, "2024-06-06", "Croissant") == nullptr);
	REQUIRE(findRow(batch, "2024-06-05", "Croissant")->quantity == Catch::Approx(12.0));
	REQUIRE(batch.rejected.size() == 1);
	REQUIRE(batch.rejected.front().source_row_ref == "wide.csv:3:2024-06-05");
}

TEST_CASE("Normalizer rejects unreadable rows and keeps the rest", "[ingest][normalizer]") {
	const auto table = makeTable({"Date", "Item", "Item Variation", "Qty"},
	                             {{"not a date", "Croissant", "", "1"},
	                              {"2024-06-03", "", "", "1"},
	                              {"2024-06-03", "Croissant", "", "many"},
	                              {"2024-06-03", "Croissant", "", ""},
	                              {"2024-06-03", "Muffin", "Blueberry", "6"}},
	                             "pos.csv");
	Normalizer normalizer{NormalizerSettings{}};
	const auto batch = normalizer.normalize(table);

	REQUIRE(batch.rows.size() == 1);
	REQUIRE(batch.rows.front().item_name_raw == "Muffin - Blueberry");
	REQUIRE(batch.rejected.size() == 4);
	REQUIRE(batch.rejected[0].source_row_ref == "pos.csv:2");
	REQUIRE(batch.rejected[3].reason == "missing quantity");
}

TEST_CASE("Normalizer keys are case and whitespace insensitive", "[ingest][normalizer]") {
	REQUIRE(Normalizer::normalizeKey("  Pain   au\tChocolat ") == "pain au chocolat");
	REQUIRE(Normalizer::normalizeKey("") == "");
}

TEST_CASE("Aggregated rows point at the first contributing export row", "[ingest][normalizer]") {
	std::vector<std::vector<std::string>> rows;
	rows.push_back({"2024-06-03", "Bun", "1"});
	for (int filler = 0; filler < 7; ++filler) {
		rows.push_back({"2024-06-03", "Filler " + std::to_string(filler), "1"});
	}
	rows.push_back({"2024-06-03", "Bun", "2"});
	Normalizer normalizer{NormalizerSettings{}};
	const auto batch = normalizer.normalize(makeTable({"Date", "Item", "Qty"}, rows, "c.csv"));

	const auto *bun = findRow(batch, "2024-06-03", "Bun");
	REQUIRE(bun != nullptr);
	REQUIRE(bun->quantity == Catch::Approx(3.0));
	REQUIRE(bun->source_row_ref == "c.csv:2");
	REQUIRE(bun->source_row == 0);

	std::reverse(rows.begin(), rows.end());
	const auto reversed = normalizer.normalize(makeTable({"Date", "Item", "Qty"}, rows, "c.csv"));
	REQUIRE(findRow(reversed, "2024-06-03", "Bun")->source_row_ref == "c.csv:2");
}
