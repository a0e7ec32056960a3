#pragma once

#include "seacast/pipeline/forecast_config.hpp"
#include "seacast/pipeline/forecast_runner.hpp"

#include <spdlog/spdlog.h>

#include <ostream>

namespace seacast::tools {

struct CmdLineOptions {
	pipeline::ForecastConfig config;
	pipeline::ForecastRequest request;
	spdlog::level::level_enum log_level = spdlog::level::info;
};

/**
 * @class CmdLineParser
 * @brief Maps seacast-forecast command line options onto the pipeline configuration.
 *
 * Kept out of main() so it can be tested.
 */
class CmdLineParser {
public:
	enum class Outcome {
		Run,   ///< Options are complete; run the forecast.
		Exit,  ///< --help or --version was handled.
		Error, ///< The command line is invalid; the reason went to @p err.
	};

	static Outcome parse(int argc, const char *const *argv, CmdLineOptions &options, std::ostream &out,
	                     std::ostream &err);

	/// "tab" or "\t" map to a tab; anything else must be a single character.
	static char parseDelimiter(const std::string &text);
};

} // namespace seacast::tools
