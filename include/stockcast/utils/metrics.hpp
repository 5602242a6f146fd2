#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace stockcast::utils {

struct MetricsConfig {
	/// Actuals with |actual| <= threshold are excluded from MAPE. 0 masks exact zeros only.
	double mape_zero_threshold = 0.0;
};

struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	std::optional<double> mape;
	std::optional<double> wape;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Mean absolute percentage error in percent; empty when every actual is masked.
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted,
	                                  const MetricsConfig &config = MetricsConfig{});

	/// Sum |error| / sum |actual| in percent; empty when actual volume is zero.
	static std::optional<double> wape(const std::vector<double> &actual, const std::vector<double> &predicted);

	static double bias(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// baseline - model; empty when either side is undefined.
	static std::optional<double> improvement(const std::optional<double> &baseline,
	                                         const std::optional<double> &model);

	static AccuracyMetrics evaluate(const std::vector<double> &actual, const std::vector<double> &predicted,
	                                const MetricsConfig &config = MetricsConfig{});
};

} // namespace stockcast::utils
