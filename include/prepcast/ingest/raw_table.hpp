#pragma once

#include <istream>
#include <string>
#include <vector>

namespace prepcast::ingest {

/**
 * @struct RawTable
 * @brief One tabular sales export as string cells, in its original column order.
 */
struct RawTable {
	std::string source_name;
	std::vector<std::string> headers;
	std::vector<std::vector<std::string>> rows;

	/// Cell at (@p row, @p column), or an empty string for short rows.
	const std::string &cell(std::size_t row, std::size_t column) const {
		static const std::string empty;
		const auto &values = rows.at(row);
		return column < values.size() ? values[column] : empty;
	}
};

/**
 * @brief Parses comma-separated text with a header row.
 *
 * Supports double-quoted fields with embedded separators, newlines and
 * doubled quotes, CRLF line endings and a leading UTF-8 byte order mark.
 * Blank lines are skipped.
 *
 * @throws std::invalid_argument If the input has no header row or a quote is left open.
 */
RawTable readCsv(std::istream &input, const std::string &source_name, char separator = ',');

/**
 * @brief Reads a CSV file from disk.
 * @throws std::runtime_error If the file cannot be opened.
 */
RawTable readCsvFile(const std::string &path, char separator = ',');

} // namespace prepcast::ingest
