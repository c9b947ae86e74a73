#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace prepcast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every component of the forecasting pipeline logs through the same logger
 * instance, which can be configured once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace prepcast::utils

// --- Logger Macros for convenient access ---
#define PREPCAST_TRACE(...)    prepcast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define PREPCAST_DEBUG(...)    prepcast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define PREPCAST_INFO(...)     prepcast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define PREPCAST_WARN(...)     prepcast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define PREPCAST_ERROR(...)    prepcast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define PREPCAST_CRITICAL(...) prepcast::utils::Logging::getLogger()->critical(__VA_ARGS__)
