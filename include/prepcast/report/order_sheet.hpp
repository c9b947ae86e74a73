#pragma once

#include "prepcast/forecast/forecast_run.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace prepcast::report {

/**
 * @struct OrderSheet
 * @brief Tabular view of a forecast run as handed to the kitchen.
 *
 * Columns: Item Name, Weekly Total, MON..SAT, Notes, Alerts.
 */
struct OrderSheet {
	core::Date week_start;
	std::vector<std::string> headers;
	std::vector<std::vector<std::string>> rows;
};

/// Builds the sheet from a run, one row per forecast line in run order.
OrderSheet buildOrderSheet(const forecast::ForecastRun &run);

/// Formats a quantity without trailing zeros ("12", "2.5").
std::string formatQuantity(double value);

/// Writes the sheet as comma-separated values, quoting cells where needed.
void writeCsv(const OrderSheet &sheet, std::ostream &out);

/**
 * @brief Writes the sheet to a CSV file.
 * @throws std::runtime_error If the file cannot be written.
 */
void writeCsvFile(const OrderSheet &sheet, const std::string &path);

} // namespace prepcast::report
