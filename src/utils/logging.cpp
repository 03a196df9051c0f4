#include "tsregress/utils/logging.hpp"

#ifndef TSREGRESS_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace tsregress::utils {

namespace {

// Member builds log from worker threads; the first access may race.
std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}

} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		logger_ = spdlog::get("tsregress");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("tsregress");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	{
		std::lock_guard<std::mutex> lock(loggerMutex());
		if (logger_) {
			return logger_;
		}
	}
	// Warnings and above unless the application asks for more.
	init(spdlog::level::warn);
	return logger_;
}

} // namespace tsregress::utils

#endif // TSREGRESS_NO_LOGGING
