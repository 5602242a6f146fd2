#include "stockcast/core/forecast.hpp"

#include <numeric>

namespace stockcast::core {

ForecastSummary summarize(const ForecastResult &result) {
	ForecastSummary summary;
	if (result.forecast.empty()) {
		return summary;
	}
	summary.total = std::accumulate(result.forecast.begin(), result.forecast.end(), 0.0);
	summary.average = summary.total / static_cast<double>(result.forecast.size());

	std::size_t peak = 0;
	for (std::size_t i = 1; i < result.forecast.size(); ++i) {
		if (result.forecast[i] > result.forecast[peak]) {
			peak = i;
		}
	}
	summary.peak_value = result.forecast[peak];
	if (peak < result.dates.size()) {
		summary.peak_date = result.dates[peak];
	}
	return summary;
}

} // namespace stockcast::core
