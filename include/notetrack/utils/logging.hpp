#pragma once

#ifndef NOTETRACK_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace notetrack::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every extraction run shares one logger instance, which can be configured
 * once at startup by the embedding application.
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

} // namespace notetrack::utils

// --- Logger Macros for convenient access ---
#define NOTETRACK_TRACE(...)    notetrack::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define NOTETRACK_DEBUG(...)    notetrack::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define NOTETRACK_INFO(...)     notetrack::utils::Logging::getLogger()->info(__VA_ARGS__)
#define NOTETRACK_WARN(...)     notetrack::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define NOTETRACK_ERROR(...)    notetrack::utils::Logging::getLogger()->error(__VA_ARGS__)
#define NOTETRACK_CRITICAL(...) notetrack::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging for embedders that do not ship spdlog

namespace notetrack::utils {

class Logging {
public:
	static void init() {}
};

} // namespace notetrack::utils

#define NOTETRACK_TRACE(...)    do {} while(0)
#define NOTETRACK_DEBUG(...)    do {} while(0)
#define NOTETRACK_INFO(...)     do {} while(0)
#define NOTETRACK_WARN(...)     do {} while(0)
#define NOTETRACK_ERROR(...)    do {} while(0)
#define NOTETRACK_CRITICAL(...) do {} while(0)

#endif // NOTETRACK_NO_LOGGING
