#include "salescast/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace salescast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("salescast");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("salescast");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Initialize with default level if not already done.
		init();
	}
	return logger_;
}

spdlog::level::level_enum Logging::parseLevel(const std::string &name) {
	std::string lowered = name;
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

	if (lowered == "trace") {
		return spdlog::level::trace;
	}
	if (lowered == "debug") {
		return spdlog::level::debug;
	}
	if (lowered == "info") {
		return spdlog::level::info;
	}
	if (lowered == "warn" || lowered == "warning") {
		return spdlog::level::warn;
	}
	if (lowered == "error") {
		return spdlog::level::err;
	}
	if (lowered == "critical") {
		return spdlog::level::critical;
	}
	if (lowered == "off") {
		return spdlog::level::off;
	}
	throw std::invalid_argument("Unknown log level '" + name + "'.");
}

} // namespace salescast::utils
