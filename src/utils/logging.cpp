#include "regime-ar/utils/logging.hpp"

#ifndef REGIMEAR_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace regimear::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("regime-ar");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("regime-ar");
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

} // namespace regimear::utils

#endif // REGIMEAR_NO_LOGGING
