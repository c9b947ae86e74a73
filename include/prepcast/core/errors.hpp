#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace prepcast::core {

/**
 * @class PrepcastError
 * @brief Base class of all domain errors raised by the forecasting pipeline.
 */
class PrepcastError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @class SchemaError
 * @brief A sales export lacks a mandatory semantic column after synonym matching.
 *
 * Aborts ingestion of the whole file.
 */
class SchemaError : public PrepcastError {
public:
	SchemaError(const std::string &message, std::vector<std::string> missing_fields)
	    : PrepcastError(message), missing_fields_(std::move(missing_fields)) {
	}

	const std::vector<std::string> &missingFields() const {
		return missing_fields_;
	}

private:
	std::vector<std::string> missing_fields_;
};

/**
 * @class ResolutionAmbiguity
 * @brief A raw item name fuzzy-matches more than one existing item equally well.
 */
class ResolutionAmbiguity : public PrepcastError {
public:
	ResolutionAmbiguity(std::string raw_name, std::vector<std::int64_t> candidates)
	    : PrepcastError("Item name '" + raw_name + "' matches " + std::to_string(candidates.size()) +
	                    " items equally well."),
	      raw_name_(std::move(raw_name)), candidates_(std::move(candidates)) {
	}

	const std::string &rawName() const {
		return raw_name_;
	}

	const std::vector<std::int64_t> &candidates() const {
		return candidates_;
	}

private:
	std::string raw_name_;
	std::vector<std::int64_t> candidates_;
};

/**
 * @class PersistenceFailure
 * @brief A backing store could not commit or serve data.
 */
class PersistenceFailure : public PrepcastError {
public:
	using PrepcastError::PrepcastError;
};

/**
 * @class HistoryNotReady
 * @brief Canonical history has not been committed up to the day before the forecast week.
 */
class HistoryNotReady : public PrepcastError {
public:
	using PrepcastError::PrepcastError;
};

} // namespace prepcast::core
