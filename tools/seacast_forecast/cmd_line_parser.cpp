#include "cmd_line_parser.hpp"

#include "seacast/utils/logging.hpp"

#include <boost/program_options.hpp>

#include <stdexcept>
#include <string>

#ifndef SEACAST_VERSION
#define SEACAST_VERSION "unknown"
#endif

namespace seacast::tools {

namespace {

const char *const kDescription = "Usage: seacast-forecast --input <csv> [options]\n"
                                 "Options";

} // namespace

char CmdLineParser::parseDelimiter(const std::string &text) {
	if (text == "tab" || text == "\\t" || text == "\t") {
		return '\t';
	}
	if (text.size() != 1) {
		throw std::invalid_argument("the option '--delimiter' expects a single character, got '" + text + "'");
	}
	return text.front();
}

CmdLineParser::Outcome CmdLineParser::parse(int argc, const char *const *argv, CmdLineOptions &options,
                                            std::ostream &out, std::ostream &err) {
	namespace po = boost::program_options;
	try {
		po::options_description desc(kDescription);
		// clang-format off
		desc.add_options()
			("help", "Display this information and exit")
			("version", "Display version information and exit")
			("input", po::value<std::string>(),
					"Delimited table holding the time series (required)")
			("regressors", po::value<std::string>(),
					"Optional depth-profile table (Depth, Salinity, pH, Chlorophyl) to derive regressors from")
			("dateCol", po::value<std::string>(),
					"Name of the timestamp column - detected when absent")
			("targetCol", po::value<std::string>(),
					"Name of the value column - detected when absent")
			("periods", po::value<int>()->default_value(30),
					"Number of future steps to forecast")
			("testFraction", po::value<double>()->default_value(0.2),
					"Share of the series held out for evaluation")
			("intervalWidth", po::value<double>()->default_value(0.8),
					"Probability mass of the prediction intervals")
			("yearlyThresholdDays", po::value<int>()->default_value(270),
					"Minimum history span in days for yearly seasonality")
			("delimiter", po::value<std::string>(),
					"Field delimiter of the input tables - detected from the header when absent")
			("output", po::value<std::string>()->default_value("forecast_output.csv"),
					"File to write the forecast tail (ds,yhat,yhat_lower,yhat_upper) to")
			("report", po::value<std::string>(),
					"Optional file to write the JSON report to")
			("logLevel", po::value<std::string>()->default_value("info"),
					"One of trace, debug, info, warn, error, critical, off")
		;
		// clang-format on
		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, desc), vm);
		po::notify(vm);

		if (vm.count("help") > 0) {
			out << desc << std::endl;
			return Outcome::Exit;
		}
		if (vm.count("version") > 0) {
			out << "seacast-forecast " << SEACAST_VERSION << std::endl;
			return Outcome::Exit;
		}
		if (vm.count("input") == 0) {
			err << "Error processing command line: the option '--input' is required but missing" << std::endl;
			return Outcome::Error;
		}

		options.request.input_path = vm["input"].as<std::string>();
		if (vm.count("regressors") > 0) {
			options.request.regressor_path = vm["regressors"].as<std::string>();
		}
		if (vm.count("dateCol") > 0) {
			options.request.date_column = vm["dateCol"].as<std::string>();
		}
		if (vm.count("targetCol") > 0) {
			options.request.target_column = vm["targetCol"].as<std::string>();
		}
		options.config.periods = vm["periods"].as<int>();
		options.config.test_fraction = vm["testFraction"].as<double>();
		options.config.interval_width = vm["intervalWidth"].as<double>();
		options.config.yearly_threshold_days = vm["yearlyThresholdDays"].as<int>();
		if (vm.count("delimiter") > 0) {
			options.config.read_options.delimiter = parseDelimiter(vm["delimiter"].as<std::string>());
		}
		options.config.output_path = vm["output"].as<std::string>();
		if (vm.count("report") > 0) {
			options.config.report_path = vm["report"].as<std::string>();
		}
		options.log_level = utils::Logging::parseLevel(vm["logLevel"].as<std::string>());

		options.config.validate();
	} catch (std::exception &e) {
		err << "Error processing command line: " << e.what() << std::endl;
		return Outcome::Error;
	}

	return Outcome::Run;
}

} // namespace seacast::tools
