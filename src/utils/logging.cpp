#include "seacast/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <stdexcept>
#include <utility>

namespace seacast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {

std::once_flag logger_created;

} // namespace

void Logging::init(spdlog::level::level_enum level) {
	const auto &logger = getLogger();
	logger->set_level(level);
	logger->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	// Created exactly once; concurrent first log statements wait here.
	std::call_once(logger_created, [] {
		auto logger = spdlog::get("seacast");
		if (!logger) {
			logger = spdlog::stderr_color_mt("seacast");
			logger->set_level(spdlog::level::info);
			logger->flush_on(spdlog::level::info);
		}
		logger_ = std::move(logger);
	});
	return logger_;
}

spdlog::level::level_enum Logging::parseLevel(const std::string &name) {
	const auto level = spdlog::level::from_str(name);
	// from_str maps unknown names to "off"; only accept that for the literal name.
	if (level == spdlog::level::off && name != "off") {
		throw std::invalid_argument("Unknown log level '" + name + "'.");
	}
	return level;
}

} // namespace seacast::utils
