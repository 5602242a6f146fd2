#pragma once

#include <cstddef>
#include <vector>

namespace stockcast::utils {

class Statistics final {
public:
	static double mean(const std::vector<double> &values);

	/// Population (ddof = 0) or sample (ddof = 1) standard deviation; 0 when undefined.
	static double stddev(const std::vector<double> &values, std::size_t ddof = 0);

	static double sum(const std::vector<double> &values);

	/// Inverse of the standard normal CDF (Acklam's rational approximation).
	static double normalQuantile(double p);

	/// Two-sided critical value for a confidence level, e.g. 0.95 -> 1.96.
	static double twoSidedZ(double confidence);
};

} // namespace stockcast::utils
