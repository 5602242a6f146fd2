#pragma once

#include "stockcast/core/outcome.hpp"
#include "stockcast/core/time_series.hpp"
#include "stockcast/engine/forecast_options.hpp"
#include "stockcast/utils/metrics.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stockcast::validation {

struct SeriesSplit {
	core::TimeSeries train;
	core::TimeSeries test;
};

struct BacktestOptions {
	engine::ForecastOptions forecast;
	utils::MetricsConfig metrics;
	double confidence = 0.95;
};

/**
 * @struct BacktestResult
 * @brief Held-out accuracy of one strategy against the last-value baseline.
 *
 * Percent metrics are empty when undefined (every actual masked, or zero
 * volume); improvements are baseline minus model and may be negative.
 */
struct BacktestResult {
	std::string model;
	std::size_t test_window = 0;
	std::size_t training_records = 0;

	std::optional<double> baseline_mape;
	std::optional<double> model_mape;
	std::optional<double> baseline_wape;
	std::optional<double> model_wape;
	std::optional<double> mape_improvement;
	std::optional<double> wape_improvement;
	double rmse = 0.0;
	double mae = 0.0;

	std::vector<core::TimePoint> held_out_dates;
	std::vector<double> actuals;
	std::vector<double> forecast;
	std::vector<double> baseline;
};

/**
 * @brief Length of the held-out tail for a series of @p n observations.
 *
 * Uses @p requested when given, otherwise max(14, 20% of n), then clamps to
 * [7, n - 7].
 * @throws core::InsufficientHistory when n < 20.
 */
std::size_t backtestWindow(std::size_t n, std::optional<int> requested = std::nullopt);

/// Splits off the last @p test_size observations.
SeriesSplit timeSplit(const core::TimeSeries &series, std::size_t test_size);

/// Last training value repeated over the test dates.
std::vector<double> naiveBaseline(const core::TimeSeries &train, std::size_t horizon);

/**
 * @brief Refits @p model_id on the training part and scores the held-out tail.
 *
 * Errors of the forecast engine propagate unchanged.
 */
BacktestResult backtest(const core::TimeSeries &series, const std::string &model_id,
                        std::optional<int> test_window = std::nullopt,
                        const BacktestOptions &options = BacktestOptions{});

/// Backtests several strategies in parallel; one failure does not affect the others.
std::map<std::string, core::Outcome<BacktestResult>>
compareBacktests(const core::TimeSeries &series, const std::vector<std::string> &model_ids,
                 std::optional<int> test_window = std::nullopt, const BacktestOptions &options = BacktestOptions{});

} // namespace stockcast::validation
