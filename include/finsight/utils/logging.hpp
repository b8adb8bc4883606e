#pragma once

#ifndef FINSIGHT_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace finsight::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger named "finsight" is shared by every component of the
 * engine. Its level can be changed at startup with init().
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance, creating it on first use.
	 *
	 * Safe to call concurrently with other getLogger() and init() calls.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace finsight::utils

#define FINSIGHT_TRACE(...)    finsight::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define FINSIGHT_DEBUG(...)    finsight::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define FINSIGHT_INFO(...)     finsight::utils::Logging::getLogger()->info(__VA_ARGS__)
#define FINSIGHT_WARN(...)     finsight::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define FINSIGHT_ERROR(...)    finsight::utils::Logging::getLogger()->error(__VA_ARGS__)
#define FINSIGHT_CRITICAL(...) finsight::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when built without spdlog

namespace finsight::utils {

class Logging {
public:
	static void init() {}
};

} // namespace finsight::utils

#define FINSIGHT_TRACE(...)    do {} while(0)
#define FINSIGHT_DEBUG(...)    do {} while(0)
#define FINSIGHT_INFO(...)     do {} while(0)
#define FINSIGHT_WARN(...)     do {} while(0)
#define FINSIGHT_ERROR(...)    do {} while(0)
#define FINSIGHT_CRITICAL(...) do {} while(0)

#endif // FINSIGHT_NO_LOGGING
