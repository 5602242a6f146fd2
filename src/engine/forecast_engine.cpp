#include "stockcast/engine/forecast_engine.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"
#include "stockcast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace stockcast::engine {

namespace {

core::IntervalBand band(const std::vector<double> &forecast, double half_width) {
	core::IntervalBand result;
	result.lower.reserve(forecast.size());
	result.upper.reserve(forecast.size());
	for (double value : forecast) {
		result.lower.push_back(value - half_width);
		result.upper.push_back(value + half_width);
	}
	return result;
}

} // namespace

int ForecastEngine::seasonalPeriod(const core::TimeSeries &series, const ForecastOptions &options) {
	const int period = options.seasonal_period.value_or(series.defaultSeasonalPeriod());
	if (period < 2) {
		throw core::ValidationError("seasonal_period", "Seasonal period must be at least 2, got " +
		                                                   std::to_string(period) + ".");
	}
	return period;
}

void ForecastEngine::validateRequest(int horizon, double confidence) {
	if (horizon <= 0) {
		throw core::ValidationError("horizon", "Forecast horizon must be positive, got " + std::to_string(horizon) +
		                                           ".");
	}
	if (!(confidence > 0.0 && confidence < 1.0)) {
		throw core::ValidationError("confidence_level", "Confidence level must lie in (0, 1).");
	}
}

core::ForecastResult ForecastEngine::forecast(const core::TimeSeries &series, const std::string &model_id,
                                              int horizon, double confidence, const ForecastOptions &options) {
	const ModelKind kind = parseModelKind(model_id);
	validateRequest(horizon, confidence);
	if (series.size() < kMinimumObservations) {
		throw core::InsufficientHistory(model_id, kMinimumObservations, series.size());
	}
	return run(series, kind, model_id, horizon, confidence, options);
}

core::ForecastResult ForecastEngine::refit(const core::TimeSeries &train, const std::string &model_id, int horizon,
                                           double confidence, const ForecastOptions &options) {
	const ModelKind kind = parseModelKind(model_id);
	validateRequest(horizon, confidence);
	return run(train, kind, model_id, horizon, confidence, options);
}

core::ForecastResult ForecastEngine::run(const core::TimeSeries &series, ModelKind kind, const std::string &model_id,
                                         int horizon, double confidence, const ForecastOptions &options) {
	const int period = seasonalPeriod(series, options);
	auto model = ModelRegistry::create(kind, options, period);
	if (series.size() < model->minimumHistory()) {
		throw core::InsufficientHistory(model_id, model->minimumHistory(), series.size());
	}

	core::ForecastResult result;
	try {
		model->fit(series);
		result = model->predict(horizon, confidence);
		result.historical_fit = model->historicalFit();
	} catch (const core::InsufficientHistory &) {
		throw;
	} catch (const core::ModelFitError &) {
		throw;
	} catch (const std::exception &e) {
		throw core::ModelFitError(model_id, e.what());
	}

	if (result.forecast.size() != static_cast<std::size_t>(horizon)) {
		throw core::ModelFitError(model_id, "expected " + std::to_string(horizon) + " forecast steps, got " +
		                                        std::to_string(result.forecast.size()));
	}
	for (double value : result.forecast) {
		if (!std::isfinite(value)) {
			throw core::ModelFitError(model_id, "non-finite forecast value");
		}
	}

	result.model = model->getName();
	completeResult(result, series, model->hasNativeInterval() && result.hasInterval(), confidence, options);
	STOCKCAST_CLOG(Engine, info, "{} forecast {} periods from {} observations", result.model, horizon, series.size());
	return result;
}

void ForecastEngine::completeResult(core::ForecastResult &result, const core::TimeSeries &series,
                                    bool native_interval, double confidence, const ForecastOptions &options) {
	result.confidence_level = confidence;
	result.dates = series.futureDates(static_cast<int>(result.forecast.size()));

	const double sigma = utils::Statistics::stddev(result.forecast) * options.interval_spread_scale;
	if (!native_interval) {
		const auto main = band(result.forecast, utils::Statistics::twoSidedZ(confidence) * sigma);
		result.lower = main.lower;
		result.upper = main.upper;
	}
	for (std::size_t h = 0; h < result.forecast.size(); ++h) {
		result.lower[h] = std::min(result.lower[h], result.forecast[h]);
		result.upper[h] = std::max(result.upper[h], result.forecast[h]);
	}

	result.bands["95"] = band(result.forecast, 1.96 * sigma);
	result.bands["80"] = band(result.forecast, 1.28 * sigma);
}

std::map<std::string, core::Outcome<core::ForecastResult>>
ForecastEngine::compareModels(const core::TimeSeries &series, const std::vector<std::string> &model_ids,
                              int horizon, double confidence, const ForecastOptions &options) {
	std::vector<std::string> unique_ids;
	std::set<std::string> seen;
	for (const auto &id : model_ids) {
		if (seen.insert(id).second) {
			unique_ids.push_back(id);
		}
	}

	auto outcomes = utils::runIsolated<core::ForecastResult>(
	    unique_ids.size(),
	    [&](std::size_t index) { return forecast(series, unique_ids[index], horizon, confidence, options); },
	    options.parallel);

	std::map<std::string, core::Outcome<core::ForecastResult>> results;
	std::size_t failures = 0;
	for (std::size_t i = 0; i < unique_ids.size(); ++i) {
		if (!outcomes[i].ok()) {
			++failures;
			STOCKCAST_CLOG(Engine, warn, "Model {} failed during comparison: {}", unique_ids[i], outcomes[i].error->message);
		}
		results.emplace(unique_ids[i], std::move(outcomes[i]));
	}
	STOCKCAST_CLOG(Engine, info, "Compared {} models, {} failed", unique_ids.size(), failures);
	return results;
}

} // namespace stockcast::engine
