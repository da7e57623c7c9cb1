#pragma once

#ifndef HYDRO_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace hydrostate::utils {

/**
 * @class Logging
 * @brief Process-wide access to the spdlog logger used by the engine.
 *
 * A single multi-threaded logger is shared by every component, including the
 * per-chain sampler threads.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it on first use.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Creates the logger if needed and sets its level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace hydrostate::utils

#define HYDRO_TRACE(...)    hydrostate::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define HYDRO_DEBUG(...)    hydrostate::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define HYDRO_INFO(...)     hydrostate::utils::Logging::getLogger()->info(__VA_ARGS__)
#define HYDRO_WARN(...)     hydrostate::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define HYDRO_ERROR(...)    hydrostate::utils::Logging::getLogger()->error(__VA_ARGS__)
#define HYDRO_CRITICAL(...) hydrostate::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace hydrostate::utils {

class Logging {
public:
	static void init() {}
};

} // namespace hydrostate::utils

#define HYDRO_TRACE(...)    do {} while(0)
#define HYDRO_DEBUG(...)    do {} while(0)
#define HYDRO_INFO(...)     do {} while(0)
#define HYDRO_WARN(...)     do {} while(0)
#define HYDRO_ERROR(...)    do {} while(0)
#define HYDRO_CRITICAL(...) do {} while(0)

#endif // HYDRO_NO_LOGGING
