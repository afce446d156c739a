#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace salescast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every component of the engine logs through this single logger, which can be
 * configured once at startup (typically by the CLI from `--log-level`).
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
	 * @throws std::invalid_argument If the name is not a known level.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace salescast::utils

// --- Logger Macros for convenient access ---
#define SALESCAST_TRACE(...)    salescast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define SALESCAST_DEBUG(...)    salescast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define SALESCAST_INFO(...)     salescast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define SALESCAST_WARN(...)     salescast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define SALESCAST_ERROR(...)    salescast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define SALESCAST_CRITICAL(...) salescast::utils::Logging::getLogger()->critical(__VA_ARGS__)
