#pragma once

#ifndef TSREGRESS_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace tsregress::utils {

/**
 * @class Logging
 * @brief Process-wide spdlog logger shared by the forest and its workers.
 *
 * The logger is named "tsregress" and writes to a coloured stdout sink. spdlog
 * loggers are thread safe, so member builds on worker threads log through the
 * same instance.
 */
class Logging {
public:
	/// Creates the logger on first use.
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Sets the minimum level of the shared logger.
	 * @param level Messages below this level are discarded; the logger also flushes at this level.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tsregress::utils

// fmt-style logging macros
#define TSREGRESS_TRACE(...)    tsregress::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define TSREGRESS_DEBUG(...)    tsregress::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define TSREGRESS_INFO(...)     tsregress::utils::Logging::getLogger()->info(__VA_ARGS__)
#define TSREGRESS_WARN(...)     tsregress::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define TSREGRESS_ERROR(...)    tsregress::utils::Logging::getLogger()->error(__VA_ARGS__)
#define TSREGRESS_CRITICAL(...) tsregress::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// Logging compiled out

namespace tsregress::utils {

class Logging {
public:
	static void init() {}
};

} // namespace tsregress::utils

#define TSREGRESS_TRACE(...)    do {} while(0)
#define TSREGRESS_DEBUG(...)    do {} while(0)
#define TSREGRESS_INFO(...)     do {} while(0)
#define TSREGRESS_WARN(...)     do {} while(0)
#define TSREGRESS_ERROR(...)    do {} while(0)
#define TSREGRESS_CRITICAL(...) do {} while(0)

#endif // TSREGRESS_NO_LOGGING
