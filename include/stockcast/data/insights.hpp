#pragma once

#include "stockcast/core/time_series.hpp"

#include <optional>

namespace stockcast::data {

/// Descriptive figures of a prepared demand history.
struct DemandInsights {
	double mean = 0.0;
	double stddev = 0.0;
	double total = 0.0;
	double max = 0.0;
	/// Coefficient of variation in percent; empty when mean demand is zero.
	std::optional<double> volatility_pct;
	/// Share of periods with zero demand, in [0, 1].
	double zero_share = 0.0;
	/// Calendar month (1..12) with the highest / lowest mean demand.
	std::optional<int> peak_month;
	std::optional<int> trough_month;
};

DemandInsights describeDemand(const core::TimeSeries &series);

} // namespace stockcast::data
