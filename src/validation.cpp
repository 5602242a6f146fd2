#include "stockcast/validation.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/engine/forecast_engine.hpp"
#include "stockcast/utils/logging.hpp"
#include "stockcast/utils/parallel.hpp"

#include <algorithm>
#include <set>

namespace stockcast::validation {

std::size_t backtestWindow(std::size_t n, std::optional<int> requested) {
	if (n < engine::ForecastEngine::kMinimumObservations) {
		throw core::InsufficientHistory("backtest", engine::ForecastEngine::kMinimumObservations, n);
	}
	const long size = static_cast<long>(n);
	long window = requested ? static_cast<long>(*requested) : std::max<long>(14, size / 5);
	window = std::min(std::max<long>(window, 7), size - 7);
	if (window <= 0) {
		window = std::max<long>(1, size / 3);
	}
	return static_cast<std::size_t>(window);
}

SeriesSplit timeSplit(const core::TimeSeries &series, std::size_t test_size) {
	if (test_size == 0 || test_size >= series.size()) {
		throw core::ValidationError("test_window", "Test window must leave a non-empty training part.");
	}
	const std::size_t cut = series.size() - test_size;
	return SeriesSplit{series.slice(0, cut), series.slice(cut, series.size())};
}

std::vector<double> naiveBaseline(const core::TimeSeries &train, std::size_t horizon) {
	if (train.isEmpty()) {
		throw core::ValidationError("train", "Baseline needs at least one training observation.");
	}
	return std::vector<double>(horizon, train.getValues().back());
}

BacktestResult backtest(const core::TimeSeries &series, const std::string &model_id, std::optional<int> test_window,
                        const BacktestOptions &options) {
	engine::parseModelKind(model_id);
	const std::size_t window = backtestWindow(series.size(), test_window);
	const SeriesSplit split = timeSplit(series, window);
	STOCKCAST_CLOG(Engine, debug, "Backtesting {} with {} training and {} held-out records", model_id,
	               split.train.size(), window);

	// The 20-observation floor applies to the full series; the training part only has to satisfy the strategy.
	const auto forecast = engine::ForecastEngine::refit(split.train, model_id, static_cast<int>(window),
	                                                    options.confidence, options.forecast);

	BacktestResult result;
	result.model = forecast.model;
	result.test_window = window;
	result.training_records = split.train.size();
	result.held_out_dates = split.test.getTimestamps();
	result.actuals = split.test.getValues();
	result.forecast = forecast.forecast;
	result.baseline = naiveBaseline(split.train, window);

	const auto model_metrics = utils::Metrics::evaluate(result.actuals, result.forecast, options.metrics);
	const auto baseline_metrics = utils::Metrics::evaluate(result.actuals, result.baseline, options.metrics);
	result.model_mape = model_metrics.mape;
	result.model_wape = model_metrics.wape;
	result.baseline_mape = baseline_metrics.mape;
	result.baseline_wape = baseline_metrics.wape;
	result.mape_improvement = utils::Metrics::improvement(result.baseline_mape, result.model_mape);
	result.wape_improvement = utils::Metrics::improvement(result.baseline_wape, result.model_wape);
	result.rmse = model_metrics.rmse;
	result.mae = model_metrics.mae;

	STOCKCAST_CLOG(Engine, info, "Backtest of {} over {} periods: WAPE {} (baseline {})", result.model, window,
	               result.model_wape ? std::to_string(*result.model_wape) : "n/a",
	               result.baseline_wape ? std::to_string(*result.baseline_wape) : "n/a");
	return result;
}

std::map<std::string, core::Outcome<BacktestResult>>
compareBacktests(const core::TimeSeries &series, const std::vector<std::string> &model_ids,
                 std::optional<int> test_window, const BacktestOptions &options) {
	std::vector<std::string> unique_ids;
	std::set<std::string> seen;
	for (const auto &id : model_ids) {
		if (seen.insert(id).second) {
			unique_ids.push_back(id);
		}
	}

	auto outcomes = utils::runIsolated<BacktestResult>(
	    unique_ids.size(), [&](std::size_t index) { return backtest(series, unique_ids[index], test_window, options); },
	    options.forecast.parallel);

	std::map<std::string, core::Outcome<BacktestResult>> results;
	for (std::size_t i = 0; i < unique_ids.size(); ++i) {
		results.emplace(unique_ids[i], std::move(outcomes[i]));
	}
	return results;
}

} // namespace stockcast::validation
