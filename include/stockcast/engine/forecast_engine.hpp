#pragma once

#include "stockcast/core/forecast.hpp"
#include "stockcast/core/outcome.hpp"
#include "stockcast/core/time_series.hpp"
#include "stockcast/engine/forecast_options.hpp"
#include "stockcast/engine/model_registry.hpp"

#include <map>
#include <string>
#include <vector>

namespace stockcast::engine {

/**
 * @class ForecastEngine
 * @brief Dispatches forecast requests to the registered strategies.
 *
 * Every result leaves the engine with future dates, an interval that contains
 * the point forecast and the "95" and "80" named bands.
 */
class ForecastEngine final {
public:
	/// Observations required by every forecast request, on top of each strategy's own floor.
	static constexpr std::size_t kMinimumObservations = 20;

	/**
	 * @brief Fits @p model_id on @p series and forecasts @p horizon periods.
	 *
	 * @throws core::UnsupportedModel when the identifier is unknown (checked first).
	 * @throws core::ValidationError when horizon <= 0 or confidence is outside (0, 1).
	 * @throws core::InsufficientHistory when the series is too short for the strategy.
	 * @throws core::ModelFitError on any numerical failure inside the strategy.
	 */
	static core::ForecastResult forecast(const core::TimeSeries &series, const std::string &model_id, int horizon,
	                                     double confidence, const ForecastOptions &options = ForecastOptions{});

	/**
	 * @brief Refits @p model_id on a training part of an already validated series.
	 *
	 * Same contract as forecast() except that only the strategy's own
	 * minimumHistory() applies to @p train; callers check the request-level
	 * floor on the full series.
	 */
	static core::ForecastResult refit(const core::TimeSeries &train, const std::string &model_id, int horizon,
	                                  double confidence, const ForecastOptions &options = ForecastOptions{});

	/**
	 * @brief Runs several strategies on the same series, each isolated from the others' failures.
	 *
	 * Duplicate identifiers are evaluated once.
	 */
	static std::map<std::string, core::Outcome<core::ForecastResult>>
	compareModels(const core::TimeSeries &series, const std::vector<std::string> &model_ids, int horizon,
	              double confidence, const ForecastOptions &options = ForecastOptions{});

	/// Seasonal period the engine uses for @p series under @p options.
	static int seasonalPeriod(const core::TimeSeries &series, const ForecastOptions &options);

private:
	static void validateRequest(int horizon, double confidence);
	static core::ForecastResult run(const core::TimeSeries &series, ModelKind kind, const std::string &model_id,
	                                int horizon, double confidence, const ForecastOptions &options);
	static void completeResult(core::ForecastResult &result, const core::TimeSeries &series, bool native_interval,
	                           double confidence, const ForecastOptions &options);
};

} // namespace stockcast::engine
