#pragma once

#include "stockcast/core/calendar.hpp"
#include "stockcast/core/time_series.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace stockcast::data {

struct FeatureConfig {
	std::vector<int> lags = {1, 7, 14, 30};
	std::vector<int> rolling_windows = {7, 30};
	bool calendar = true;
};

struct FeatureMatrix {
	std::vector<std::string> names;
	/// One row per observation; NaN marks a feature without enough history.
	std::vector<std::vector<double>> rows;

	/// Indices of rows without NaN.
	std::vector<std::size_t> completeRows() const;
};

/**
 * @class FeatureBuilder
 * @brief Calendar, lag and rolling-window features for tabular regressors.
 *
 * The features of observation t only read values strictly before t, so the
 * same routine serves training rows and the next step of a recursive forecast.
 */
class FeatureBuilder {
public:
	explicit FeatureBuilder(FeatureConfig config = FeatureConfig{});

	std::vector<std::string> featureNames() const;

	/// Features for the observation at @p date that follows history[0, end).
	std::vector<double> featuresAt(core::TimePoint date, const std::vector<double> &history,
	                               std::size_t end) const;

	FeatureMatrix build(const core::TimeSeries &series) const;

	/// History needed before the first complete row.
	std::size_t lookback() const;

	const FeatureConfig &config() const {
		return config_;
	}

private:
	FeatureConfig config_;
};

} // namespace stockcast::data
