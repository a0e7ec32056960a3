#pragma once

#include <vector>

namespace seacast::utils {

namespace Statistics {

/**
 * @brief Inverse of the standard normal CDF (Acklam's rational approximation).
 * @param p Probability in (0, 1); the bounds map to -/+ infinity.
 */
double normalQuantile(double p);

/// Arithmetic mean; NaN for an empty vector.
double mean(const std::vector<double> &data);

/// Population standard deviation (ddof = 0); NaN for an empty vector.
double stddev(const std::vector<double> &data);

} // namespace Statistics
} // namespace seacast::utils
