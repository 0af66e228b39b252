#pragma once

#ifndef REGIMEAR_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace regimear::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the spdlog logger used by regime-ar.
 *
 * The logger is created lazily on first use. Call init() once at startup to
 * choose a level other than info.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger instance, creating it when needed.
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

} // namespace regimear::utils

#define REGIMEAR_TRACE(...)    regimear::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define REGIMEAR_DEBUG(...)    regimear::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define REGIMEAR_INFO(...)     regimear::utils::Logging::getLogger()->info(__VA_ARGS__)
#define REGIMEAR_WARN(...)     regimear::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define REGIMEAR_ERROR(...)    regimear::utils::Logging::getLogger()->error(__VA_ARGS__)
#define REGIMEAR_CRITICAL(...) regimear::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace regimear::utils {

class Logging {
public:
	static void init() {}
};

} // namespace regimear::utils

#define REGIMEAR_TRACE(...)    do {} while(0)
#define REGIMEAR_DEBUG(...)    do {} while(0)
#define REGIMEAR_INFO(...)     do {} while(0)
#define REGIMEAR_WARN(...)     do {} while(0)
#define REGIMEAR_ERROR(...)    do {} while(0)
#define REGIMEAR_CRITICAL(...) do {} while(0)

#endif // REGIMEAR_NO_LOGGING
