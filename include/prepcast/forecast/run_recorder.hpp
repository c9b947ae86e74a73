#pragma once

#include "prepcast/forecast/forecast_run.hpp"
#include "prepcast/store/interfaces.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace prepcast::forecast {

/**
 * @class RunRecorder
 * @brief The only writer of forecast runs.
 *
 * Assigns run ids that are strictly increasing and at least the creation
 * time in milliseconds since the epoch, then appends the run as an immutable
 * snapshot. There is no update or delete: a correction is a new run.
 */
class RunRecorder {
public:
	using Clock = std::function<std::chrono::system_clock::time_point()>;

	/**
	 * @param store Destination of recorded runs; not owned.
	 * @param clock Source of creation times; the system clock when empty.
	 */
	explicit RunRecorder(store::IForecastRunStore &store, Clock clock = {});

	/**
	 * @brief Records a complete run.
	 * @param week_start Monday of the forecast week.
	 * @param lines One line per item, each with six day values.
	 * @return The stored snapshot.
	 * @throws std::invalid_argument If the matrix is incomplete.
	 * @throws core::PersistenceFailure If the store cannot append the run; no id is consumed.
	 */
	std::shared_ptr<const ForecastRun> record(const core::Date &week_start, double alpha, bool use_model,
	                                          std::vector<ForecastLine> lines, std::vector<Alert> alerts);

	/// All runs of a week, newest first.
	std::vector<std::shared_ptr<const ForecastRun>> runsForWeek(const core::Date &week_start) const;

	/// Most recent run of a week, or nullptr.
	std::shared_ptr<const ForecastRun> latestForWeek(const core::Date &week_start) const;

	/// Most recent run overall, or nullptr.
	std::shared_ptr<const ForecastRun> latest() const;

private:
	store::IForecastRunStore &store_;
	Clock clock_;
	std::mutex mutex_;
	std::int64_t last_run_id_ = 0;
};

} // namespace prepcast::forecast
