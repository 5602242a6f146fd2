#include "stockcast/data/insights.hpp"

#include "stockcast/utils/statistics.hpp"

#include <algorithm>
#include <array>

namespace stockcast::data {

DemandInsights describeDemand(const core::TimeSeries &series) {
	DemandInsights insights;
	const auto &values = series.getValues();
	if (values.empty()) {
		return insights;
	}

	insights.mean = utils::Statistics::mean(values);
	insights.stddev = utils::Statistics::stddev(values, 1);
	insights.total = utils::Statistics::sum(values);
	insights.max = *std::max_element(values.begin(), values.end());
	if (insights.mean != 0.0) {
		insights.volatility_pct = insights.stddev / insights.mean * 100.0;
	}
	const auto zeros = std::count(values.begin(), values.end(), 0.0);
	insights.zero_share = static_cast<double>(zeros) / static_cast<double>(values.size());

	std::array<double, 12> sums{};
	std::array<int, 12> counts{};
	const auto &dates = series.getTimestamps();
	for (std::size_t i = 0; i < values.size(); ++i) {
		const int month = core::Calendar::toCivil(dates[i]).month;
		sums[static_cast<std::size_t>(month - 1)] += values[i];
		++counts[static_cast<std::size_t>(month - 1)];
	}

	int observed = 0;
	for (int count : counts) {
		if (count > 0) {
			++observed;
		}
	}
	if (observed < 2) {
		return insights;
	}

	int peak = -1;
	int trough = -1;
	for (int m = 0; m < 12; ++m) {
		if (counts[static_cast<std::size_t>(m)] == 0) {
			continue;
		}
		const double avg = sums[static_cast<std::size_t>(m)] / counts[static_cast<std::size_t>(m)];
		if (peak < 0 || avg > sums[static_cast<std::size_t>(peak)] / counts[static_cast<std::size_t>(peak)]) {
			peak = m;
		}
		if (trough < 0 ||
		    avg < sums[static_cast<std::size_t>(trough)] / counts[static_cast<std::size_t>(trough)]) {
			trough = m;
		}
	}
	insights.peak_month = peak + 1;
	insights.trough_month = trough + 1;
	return insights;
}

} // namespace stockcast::data
