#include "cmd_line_parser.hpp"

#include "seacast/errors.hpp"
#include "seacast/pipeline/forecast_runner.hpp"
#include "seacast/utils/logging.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char **argv) {
	seacast::tools::CmdLineOptions options;
	switch (seacast::tools::CmdLineParser::parse(argc, argv, options, std::cout, std::cerr)) {
	case seacast::tools::CmdLineParser::Outcome::Exit:
		return EXIT_SUCCESS;
	case seacast::tools::CmdLineParser::Outcome::Error:
		return 1;
	case seacast::tools::CmdLineParser::Outcome::Run:
		break;
	}

	seacast::utils::Logging::init(options.log_level);

	try {
		const seacast::pipeline::ForecastRunner runner(options.config);
		const auto report = runner.run(options.request);
		std::cout << "MAE " << report.mae() << "\nRMSE " << report.rmse() << "\n";
		if (report.forecastCsvPath()) {
			std::cout << "Forecast written to " << *report.forecastCsvPath() << "\n";
		}
	} catch (const seacast::ForecastError &e) {
		SEACAST_ERROR("Forecast failed: {}", e.what());
		return 2;
	} catch (const std::exception &e) {
		SEACAST_CRITICAL("Unexpected error: {}", e.what());
		return 2;
	}
	return EXIT_SUCCESS;
}
