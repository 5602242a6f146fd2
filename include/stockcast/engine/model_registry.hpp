#pragma once

#include "stockcast/engine/forecast_options.hpp"
#include "stockcast/models/iforecaster.hpp"

#include <memory>
#include <string>
#include <vector>

namespace stockcast::engine {

enum class ModelKind { Arima, Sarima, Additive, BoostedTrees, Lstm, Ensemble };

/**
 * @brief Resolves a model identifier, case-insensitively.
 *
 * Accepts arima, sarima, additive (alias prophet), gbt (alias xgboost), lstm
 * and ensemble.
 * @throws core::UnsupportedModel for anything else.
 */
ModelKind parseModelKind(const std::string &model_id);

/// Canonical identifier of a kind.
std::string modelKindName(ModelKind kind);

class ModelRegistry final {
public:
	/// Creates an unfitted strategy configured from @p options.
	static std::unique_ptr<models::IForecaster> create(ModelKind kind, const ForecastOptions &options,
	                                                   int seasonal_period);

	/// Canonical identifiers of every strategy.
	static std::vector<std::string> supportedModels();
};

} // namespace stockcast::engine
