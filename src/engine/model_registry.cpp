#include "stockcast/engine/model_registry.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/models/boosted_trees.hpp"
#include "stockcast/models/ensemble.hpp"

#include <algorithm>
#include <cctype>

namespace stockcast::engine {

namespace {

std::string toLower(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

models::AdditiveConfig additiveConfig(const ForecastOptions &options) {
	models::AdditiveConfig config = options.additive;
	if (!options.include_seasonality) {
		config.weekly = false;
		config.monthly = false;
		config.yearly = false;
	}
	return config;
}

} // namespace

ModelKind parseModelKind(const std::string &model_id) {
	const std::string id = toLower(model_id);
	if (id == "arima") {
		return ModelKind::Arima;
	}
	if (id == "sarima") {
		return ModelKind::Sarima;
	}
	if (id == "additive" || id == "prophet") {
		return ModelKind::Additive;
	}
	if (id == "gbt" || id == "xgboost") {
		return ModelKind::BoostedTrees;
	}
	if (id == "lstm") {
		return ModelKind::Lstm;
	}
	if (id == "ensemble") {
		return ModelKind::Ensemble;
	}
	throw core::UnsupportedModel(model_id);
}

std::string modelKindName(ModelKind kind) {
	switch (kind) {
	case ModelKind::Arima:
		return "arima";
	case ModelKind::Sarima:
		return "sarima";
	case ModelKind::Additive:
		return "additive";
	case ModelKind::BoostedTrees:
		return "gbt";
	case ModelKind::Lstm:
		return "lstm";
	case ModelKind::Ensemble:
		return "ensemble";
	}
	return "unknown";
}

std::unique_ptr<models::IForecaster> ModelRegistry::create(ModelKind kind, const ForecastOptions &options,
                                                           int seasonal_period) {
	switch (kind) {
	case ModelKind::Arima:
		return std::make_unique<models::AdaptiveARIMA>(options.arima, options.include_seasonality, seasonal_period);
	case ModelKind::Sarima:
		return models::ARIMABuilder()
		    .withAR(options.arima.p)
		    .withDifferencing(options.arima.d)
		    .withMA(options.arima.q)
		    .withSeasonalAR(options.arima.seasonal_p)
		    .withSeasonalDifferencing(options.arima.seasonal_d)
		    .withSeasonalMA(options.arima.seasonal_q)
		    .withSeasonalPeriod(seasonal_period)
		    .withIntercept(options.arima.include_intercept)
		    .build();
	case ModelKind::Additive:
		return std::make_unique<models::AdditiveTrendSeasonality>(additiveConfig(options));
	case ModelKind::BoostedTrees:
		return std::make_unique<models::BoostedTreesForecaster>(options.boosting, options.features);
	case ModelKind::Lstm:
		return std::make_unique<models::LstmForecaster>(options.lstm);
	case ModelKind::Ensemble: {
		std::vector<models::Ensemble::MemberFactory> members;
		for (ModelKind member : {ModelKind::Arima, ModelKind::Additive, ModelKind::BoostedTrees}) {
			members.emplace_back([member, options, seasonal_period]() {
				return ModelRegistry::create(member, options, seasonal_period);
			});
		}
		return std::make_unique<models::Ensemble>(std::move(members));
	}
	}
	throw core::UnsupportedModel(modelKindName(kind));
}

std::vector<std::string> ModelRegistry::supportedModels() {
	return {"arima", "sarima", "additive", "gbt", "lstm", "ensemble"};
}

} // namespace stockcast::engine
