#include "prepcast/report/order_sheet.hpp"
#include "prepcast/utils/logging.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <map>
#include <stdexcept>

namespace prepcast::report {

namespace {

std::string quote(const std::string &cell) {
	if (cell.find_first_of(",\"\r\n") == std::string::npos) {
		return cell;
	}
	std::string quoted = "\"";
	for (char ch : cell) {
		if (ch == '"') {
			quoted.push_back('"');
		}
		quoted.push_back(ch);
	}
	quoted.push_back('"');
	return quoted;
}

} // namespace

std::string formatQuantity(double value) {
	char buffer[32];
	if (std::abs(value - std::round(value)) < 1e-9) {
		std::snprintf(buffer, sizeof(buffer), "%.0f", std::round(value));
	} else {
		std::snprintf(buffer, sizeof(buffer), "%.2f", value);
		std::string text(buffer);
		while (!text.empty() && text.back() == '0') {
			text.pop_back();
		}
		if (!text.empty() && text.back() == '.') {
			text.pop_back();
		}
		return text;
	}
	return buffer;
}

OrderSheet buildOrderSheet(const forecast::ForecastRun &run) {
	OrderSheet sheet;
	sheet.week_start = run.week_start;
	sheet.headers = {"Item Name", "Weekly Total"};
	for (const char *label : core::forecastDayLabels()) {
		sheet.headers.emplace_back(label);
	}
	sheet.headers.emplace_back("Notes");
	sheet.headers.emplace_back("Alerts");

	std::map<core::ItemId, std::string> alerts_by_item;
	for (const auto &alert : run.alerts) {
		auto &text = alerts_by_item[alert.item_id];
		std::string entry = alert.reason;
		if (alert.day) {
			entry += std::string(" (") + core::forecastDayLabels()[static_cast<std::size_t>(*alert.day)] + ")";
		}
		text += (text.empty() ? "" : "; ") + entry;
	}

	for (const auto &line : run.lines) {
		std::vector<std::string> row;
		row.reserve(sheet.headers.size());
		row.push_back(line.item_name);
		row.push_back(formatQuantity(line.weeklyTotal()));
		for (double quantity : line.quantities) {
			row.push_back(formatQuantity(quantity));
		}
		row.push_back(line.note);
		const auto it = alerts_by_item.find(line.item_id);
		row.push_back(it == alerts_by_item.end() ? std::string() : it->second);
		sheet.rows.push_back(std::move(row));
	}
	return sheet;
}

void writeCsv(const OrderSheet &sheet, std::ostream &out) {
	auto writeRow = [&out](const std::vector<std::string> &cells) {
		for (std::size_t i = 0; i < cells.size(); ++i) {
			if (i > 0) {
				out << ',';
			}
			out << quote(cells[i]);
		}
		out << '\n';
	};
	writeRow(sheet.headers);
	for (const auto &row : sheet.rows) {
		writeRow(row);
	}
}

void writeCsvFile(const OrderSheet &sheet, const std::string &path) {
	std::ofstream out(path, std::ios::binary);
	if (!out) {
		throw std::runtime_error("Cannot open '" + path + "' for writing.");
	}
	writeCsv(sheet, out);
	out.flush();
	if (!out) {
		throw std::runtime_error("Failed to write order sheet to '" + path + "'.");
	}
	PREPCAST_INFO("Wrote order sheet for week {} ({} items) to {}.", sheet.week_start.toString(), sheet.rows.size(),
	              path);
}

} // namespace prepcast::report
