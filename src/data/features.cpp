#include "stockcast/data/features.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace stockcast::data {

namespace {

constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

} // namespace

std::vector<std::size_t> FeatureMatrix::completeRows() const {
	std::vector<std::size_t> indices;
	for (std::size_t i = 0; i < rows.size(); ++i) {
		const auto &row = rows[i];
		if (std::none_of(row.begin(), row.end(), [](double v) { return std::isnan(v); })) {
			indices.push_back(i);
		}
	}
	return indices;
}

FeatureBuilder::FeatureBuilder(FeatureConfig config) : config_(std::move(config)) {
	for (int lag : config_.lags) {
		if (lag <= 0) {
			throw std::invalid_argument("Lag features must look at least one period back.");
		}
	}
	for (int window : config_.rolling_windows) {
		if (window < 2) {
			throw std::invalid_argument("Rolling windows need at least two periods.");
		}
	}
}

std::vector<std::string> FeatureBuilder::featureNames() const {
	std::vector<std::string> names;
	if (config_.calendar) {
		names = {"year", "month", "week", "day_of_week", "quarter", "is_weekend"};
	}
	for (int lag : config_.lags) {
		names.push_back("lag_" + std::to_string(lag));
	}
	for (int window : config_.rolling_windows) {
		names.push_back("rolling_mean_" + std::to_string(window));
		names.push_back("rolling_std_" + std::to_string(window));
	}
	return names;
}

std::vector<double> FeatureBuilder::featuresAt(core::TimePoint date, const std::vector<double> &history,
                                               std::size_t end) const {
	if (end > history.size()) {
		throw std::out_of_range("Feature history end is past the available values.");
	}
	std::vector<double> row;
	row.reserve(featureNames().size());

	if (config_.calendar) {
		const auto civil = core::Calendar::toCivil(date);
		row.push_back(static_cast<double>(civil.year));
		row.push_back(static_cast<double>(civil.month));
		row.push_back(static_cast<double>(core::Calendar::isoWeek(date)));
		row.push_back(static_cast<double>(core::Calendar::dayOfWeek(date)));
		row.push_back(static_cast<double>(core::Calendar::quarter(date)));
		row.push_back(core::Calendar::isWeekend(date) ? 1.0 : 0.0);
	}

	for (int lag : config_.lags) {
		const auto offset = static_cast<std::size_t>(lag);
		row.push_back(end >= offset ? history[end - offset] : kMissing);
	}

	for (int window : config_.rolling_windows) {
		const auto size = static_cast<std::size_t>(window);
		if (end < size) {
			row.push_back(kMissing);
			row.push_back(kMissing);
			continue;
		}
		double sum = 0.0;
		for (std::size_t i = end - size; i < end; ++i) {
			sum += history[i];
		}
		const double mean = sum / static_cast<double>(size);
		double sq = 0.0;
		for (std::size_t i = end - size; i < end; ++i) {
			sq += (history[i] - mean) * (history[i] - mean);
		}
		row.push_back(mean);
		row.push_back(std::sqrt(sq / static_cast<double>(size - 1)));
	}
	return row;
}

FeatureMatrix FeatureBuilder::build(const core::TimeSeries &series) const {
	FeatureMatrix matrix;
	matrix.names = featureNames();
	const auto &dates = series.getTimestamps();
	const auto &values = series.getValues();
	matrix.rows.reserve(values.size());
	for (std::size_t t = 0; t < values.size(); ++t) {
		matrix.rows.push_back(featuresAt(dates[t], values, t));
	}
	return matrix;
}

std::size_t FeatureBuilder::lookback() const {
	int longest = 0;
	for (int lag : config_.lags) {
		longest = std::max(longest, lag);
	}
	for (int window : config_.rolling_windows) {
		longest = std::max(longest, window);
	}
	return static_cast<std::size_t>(longest);
}

} // namespace stockcast::data
