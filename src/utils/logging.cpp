#include "prepcast/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace prepcast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		// Reuse a logger registered by an earlier instance of the library.
		logger_ = spdlog::get("prepcast");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("prepcast");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace prepcast::utils
