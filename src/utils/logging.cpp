#include "notetrack/utils/logging.hpp"

#ifndef NOTETRACK_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace notetrack::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("notetrack");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("notetrack");
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

} // namespace notetrack::utils

#endif // NOTETRACK_NO_LOGGING
