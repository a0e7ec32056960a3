#pragma once

#include "seacast/core/forecast.hpp"

#include <ostream>
#include <string>

namespace seacast::io {

/// Shortest round-trip form of a value (17 significant digits at most).
std::string formatValue(double value);

/**
 * @brief Writes "ds,yhat,yhat_lower,yhat_upper" rows.
 *
 * Timestamps are written as dates when every one of them is a midnight.
 */
void writeForecastCsv(std::ostream &out, const core::Forecast &forecast);

/// @throws OutputWriteError If the file cannot be written.
void writeForecastCsv(const std::string &path, const core::Forecast &forecast);

} // namespace seacast::io
