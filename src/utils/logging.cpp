#include "finsight/utils/logging.hpp"

#ifndef FINSIGHT_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace finsight::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {
std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}

// Caller holds loggerMutex().
void createLogger(std::shared_ptr<spdlog::logger> &logger, spdlog::level::level_enum level) {
	logger = spdlog::get("finsight");
	if (!logger) {
		logger = spdlog::stdout_color_mt("finsight");
	}
	logger->set_level(level);
	logger->flush_on(level);
}
} // namespace

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		createLogger(logger_, level);
		return;
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> Logging::getLogger() {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		createLogger(logger_, spdlog::level::info);
	}
	return logger_;
}

} // namespace finsight::utils

#endif // FINSIGHT_NO_LOGGING
