#pragma once

#include "seacast/pipeline/result_assembler.hpp"

#include <json/json.h>

#include <string>

namespace seacast::io {

/**
 * @brief Renders a report as JSON: mae, rmse, forecast_tail, historical_series,
 *        diagnostics, evaluation, regressors and depth_profile.
 */
Json::Value toJson(const pipeline::ForecastReport &report);

/// Serialises toJson(report) with two-space indentation.
std::string toJsonString(const pipeline::ForecastReport &report);

/// @throws OutputWriteError If the file cannot be written.
void writeReportJson(const std::string &path, const pipeline::ForecastReport &report);

} // namespace seacast::io
