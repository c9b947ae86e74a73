#include "prepcast/ingest/raw_table.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace prepcast::ingest {

namespace {

bool isBlank(const std::vector<std::string> &record) {
	for (const auto &field : record) {
		if (field.find_first_not_of(" \t") != std::string::npos) {
			return false;
		}
	}
	return true;
}

} // namespace

RawTable readCsv(std::istream &input, const std::string &source_name, char separator) {
	RawTable table;
	table.source_name = source_name;

	std::vector<std::vector<std::string>> records;
	std::vector<std::string> record;
	std::string field;
	bool in_quotes = false;
	bool field_started = false;
	bool first_char = true;

	char ch;
	while (input.get(ch)) {
		if (first_char) {
			first_char = false;
			// Skip a UTF-8 byte order mark.
			if (static_cast<unsigned char>(ch) == 0xEF) {
				char bom[2];
				if (input.read(bom, 2) && static_cast<unsigned char>(bom[0]) == 0xBB &&
				    static_cast<unsigned char>(bom[1]) == 0xBF) {
					continue;
				}
				throw std::invalid_argument("Input '" + source_name + "' starts with an invalid byte sequence.");
			}
		}
		if (in_quotes) {
			if (ch == '"') {
				if (input.peek() == '"') {
					input.get(ch);
					field.push_back('"');
				} else {
					in_quotes = false;
				}
			} else {
				field.push_back(ch);
			}
			continue;
		}
		if (ch == '"' && !field_started) {
			in_quotes = true;
			field_started = true;
		} else if (ch == separator) {
			record.push_back(std::move(field));
			field.clear();
			field_started = false;
		} else if (ch == '\n' || ch == '\r') {
			if (ch == '\r' && input.peek() == '\n') {
				input.get(ch);
			}
			record.push_back(std::move(field));
			field.clear();
			field_started = false;
			if (!isBlank(record)) {
				records.push_back(std::move(record));
			}
			record.clear();
		} else {
			field.push_back(ch);
			field_started = true;
		}
	}
	if (in_quotes) {
		throw std::invalid_argument("Unterminated quoted field in '" + source_name + "'.");
	}
	if (field_started || !record.empty()) {
		record.push_back(std::move(field));
		if (!isBlank(record)) {
			records.push_back(std::move(record));
		}
	}

	if (records.empty()) {
		throw std::invalid_argument("Input '" + source_name + "' has no header row.");
	}
	table.headers = std::move(records.front());
	table.rows.assign(std::make_move_iterator(records.begin() + 1), std::make_move_iterator(records.end()));
	return table;
}

RawTable readCsvFile(const std::string &path, char separator) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		throw std::runtime_error("Cannot open '" + path + "' for reading.");
	}
	return readCsv(file, path, separator);
}

} // namespace prepcast::ingest
