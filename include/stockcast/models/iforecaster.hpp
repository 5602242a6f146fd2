#pragma once

#include "stockcast/core/forecast.hpp"
#include "stockcast/core/time_series.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace stockcast::models {

/**
 * @class IForecaster
 * @brief Common contract of every forecasting strategy.
 *
 * fit() throws core::InsufficientHistory when the series is shorter than
 * minimumHistory(); any other exception from fit() or predict() is a
 * numerical failure of the strategy.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided demand history.
	 * @param ts Canonical series; only read during the call.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Forecasts @p horizon steps past the fitted history.
	 *
	 * Fills @c forecast, and @c lower / @c upper when the strategy has a native
	 * interval at @p confidence. Dates and named bands are left to the caller.
	 */
	virtual core::ForecastResult predict(int horizon, double confidence) = 0;

	/// Whether predict() produces its own prediction interval.
	virtual bool hasNativeInterval() const {
		return true;
	}

	/// In-sample fitted values, when the strategy reports them.
	virtual std::optional<core::HistoricalFit> historicalFit() const {
		return std::nullopt;
	}

	/// Observations required by fit(). Forecast requests add their own floor on top.
	virtual std::size_t minimumHistory() const {
		return 2;
	}

	virtual std::string getName() const = 0;
};

} // namespace stockcast::models
