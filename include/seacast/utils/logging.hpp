#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace seacast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single "seacast" logger is shared by every pipeline stage. Call init() once at
 * startup to pick the level; the first log statement initializes it lazily otherwise.
 * Creation is thread-safe; the logger is never replaced once created.
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

	/**
	 * @brief Parses a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
	 * @throws std::invalid_argument For unknown names.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace seacast::utils

// --- Logger Macros for convenient access ---
#define SEACAST_TRACE(...)    seacast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define SEACAST_DEBUG(...)    seacast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define SEACAST_INFO(...)     seacast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define SEACAST_WARN(...)     seacast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define SEACAST_ERROR(...)    seacast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define SEACAST_CRITICAL(...) seacast::utils::Logging::getLogger()->critical(__VA_ARGS__)
