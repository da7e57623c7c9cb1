#include "hydro-state/utils/logging.hpp"

#ifndef HYDRO_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace hydrostate::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {
std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}
} // namespace

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		logger_ = spdlog::get("hydro-state");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("hydro-state");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Initialize with default level if not already done.
		init();
	}
	return logger_;
}

} // namespace hydrostate::utils

#endif // HYDRO_NO_LOGGING
