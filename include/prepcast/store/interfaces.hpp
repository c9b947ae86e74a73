#pragma once

#include "prepcast/core/date.hpp"
#include "prepcast/core/sales.hpp"
#include "prepcast/core/signals.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prepcast::models {
struct ItemModel;
}

namespace prepcast::forecast {
struct ForecastRun;
}

namespace prepcast::store {

/**
 * @class ISalesStore
 * @brief Canonical sales history.
 *
 * `append` is idempotent per (date, item_id): a record replaces any stored
 * quantity for its key, so re-ingesting an export does not double count.
 * Implementations commit a batch completely or not at all and signal
 * failures with core::PersistenceFailure.
 */
class ISalesStore {
public:
	virtual ~ISalesStore() = default;

	virtual void append(const std::vector<core::CanonicalSaleRecord> &records) = 0;

	/// Records of one item within @p range, ordered by date.
	virtual std::vector<core::CanonicalSaleRecord> query(core::ItemId item_id, const core::DateRange &range) const = 0;

	/// Latest date covered by committed history, if any history exists.
	virtual std::optional<core::Date> committedThrough() const = 0;
};

/**
 * @class IWeatherFeed
 * @brief Supplies daily weather per location.
 */
class IWeatherFeed {
public:
	virtual ~IWeatherFeed() = default;

	virtual std::optional<core::WeatherObservation> get(const core::Date &date, const std::string &location) const = 0;
};

/**
 * @class IHolidayFeed
 * @brief Supplies holiday and event signals per date.
 */
class IHolidayFeed {
public:
	virtual ~IHolidayFeed() = default;

	virtual std::vector<core::AdjustmentSignal> get(const core::Date &date) const = 0;
};

/**
 * @class IModelStore
 * @brief Holds the current model per item.
 *
 * `save` supersedes the previous model of the item atomically: readers see
 * either the old record or the new one, never a mix.
 */
class IModelStore {
public:
	virtual ~IModelStore() = default;

	virtual void save(const models::ItemModel &model) = 0;
	virtual std::shared_ptr<const models::ItemModel> load(core::ItemId item_id) const = 0;
};

/**
 * @class IForecastRunStore
 * @brief Append-only storage of forecast runs.
 */
class IForecastRunStore {
public:
	virtual ~IForecastRunStore() = default;

	virtual void append(std::shared_ptr<const forecast::ForecastRun> run) = 0;

	/// All runs for a week, newest first.
	virtual std::vector<std::shared_ptr<const forecast::ForecastRun>> runsForWeek(const core::Date &week_start) const = 0;

	/// Most recent run for a week, used as the default view.
	virtual std::shared_ptr<const forecast::ForecastRun> latestForWeek(const core::Date &week_start) const = 0;

	/// Most recent run overall.
	virtual std::shared_ptr<const forecast::ForecastRun> latest() const = 0;
};

} // namespace prepcast::store
