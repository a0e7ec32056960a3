#include "seacast/io/forecast_writer.hpp"

#include "seacast/errors.hpp"
#include "seacast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace seacast::io {

std::string formatValue(double value) {
	if (std::isnan(value)) {
		return "nan";
	}
	if (std::isinf(value)) {
		return value > 0 ? "inf" : "-inf";
	}
	char buffer[32];
	for (int precision = 15; precision <= 17; ++precision) {
		std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
		if (std::strtod(buffer, nullptr) == value) {
			break;
		}
	}
	return buffer;
}

void writeForecastCsv(std::ostream &out, const core::Forecast &forecast) {
	forecast.validate();
	const bool date_only =
	    std::all_of(forecast.timestamps.begin(), forecast.timestamps.end(), [](const core::TimePoint &tp) {
		    return core::isMidnight(tp);
	    });
	out << "ds,yhat,yhat_lower,yhat_upper\n";
	for (std::size_t i = 0; i < forecast.size(); ++i) {
		out << core::formatTimestamp(forecast.timestamps[i], date_only) << ',' << formatValue(forecast.point[i]) << ','
		    << formatValue(forecast.lower[i]) << ',' << formatValue(forecast.upper[i]) << '\n';
	}
}

void writeForecastCsv(const std::string &path, const core::Forecast &forecast) {
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out) {
		throw OutputWriteError("Cannot open forecast output", {{"path", path}});
	}
	writeForecastCsv(out, forecast);
	out.flush();
	if (!out) {
		throw OutputWriteError("Failed writing forecast output", {{"path", path}});
	}
	SEACAST_INFO("Wrote {} forecast rows to {}.", forecast.size(), path);
}

} // namespace seacast::io
