#pragma once

#include "stockcast/data/features.hpp"
#include "stockcast/ml/gradient_boosting.hpp"
#include "stockcast/models/additive.hpp"
#include "stockcast/models/arima.hpp"
#include "stockcast/models/recurrent.hpp"
#include "stockcast/utils/parallel.hpp"

#include <optional>

namespace stockcast::engine {

/// Settings shared by every forecast request; per-strategy hyper-parameters live in the nested configs.
struct ForecastOptions {
	bool include_seasonality = true;
	/// Seasonal period in observations; defaults to 7, 52 or 12 by series frequency.
	std::optional<int> seasonal_period;
	/// Spread of the default interval as a fraction of the forecast path's standard deviation.
	double interval_spread_scale = 0.1;

	models::ArimaConfig arima;
	models::AdditiveConfig additive;
	ml::BoostingConfig boosting;
	data::FeatureConfig features;
	models::LstmConfig lstm;

	utils::ParallelOptions parallel;
};

} // namespace stockcast::engine
