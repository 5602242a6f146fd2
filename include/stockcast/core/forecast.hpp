#pragma once

#include "stockcast/core/calendar.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stockcast::core {

/// In-sample fitted values aligned to the observed dates they explain.
struct HistoricalFit {
	std::vector<TimePoint> dates;
	std::vector<double> values;
};

/// A symmetric prediction band around the point forecast.
struct IntervalBand {
	std::vector<double> lower;
	std::vector<double> upper;
};

/**
 * @struct ForecastResult
 * @brief Point forecast, prediction interval and optional in-sample fit.
 *
 * Every sequence has length horizon() and is aligned with @c dates.
 * Strategies fill @c forecast and, when they have one, their native interval;
 * the engine completes dates, named bands and the model tag.
 */
struct ForecastResult {
	std::string model;
	double confidence_level = 0.95;

	std::vector<TimePoint> dates;
	std::vector<double> forecast;
	std::vector<double> lower;
	std::vector<double> upper;

	std::optional<HistoricalFit> historical_fit;

	/// Named bands, keyed "95" and "80".
	std::map<std::string, IntervalBand> bands;

	/// Member strategies that contributed, for composite models.
	std::vector<std::string> components;

	std::size_t horizon() const {
		return forecast.size();
	}

	bool hasInterval() const {
		return !forecast.empty() && lower.size() == forecast.size() && upper.size() == forecast.size();
	}
};

struct ForecastSummary {
	double average = 0.0;
	double total = 0.0;
	double peak_value = 0.0;
	std::optional<TimePoint> peak_date;
};

/// Average, total and peak of a forecast path.
ForecastSummary summarize(const ForecastResult &result);

} // namespace stockcast::core
