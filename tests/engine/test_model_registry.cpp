#include <catch2/catch_test_macros.hpp>

#include "stockcast/core/errors.hpp"
#include "stockcast/engine/model_registry.hpp"
#include "stockcast/models/arima.hpp"

#include <string>

using stockcast::engine::ForecastOptions;
using stockcast::engine::ModelKind;
using stockcast::engine::ModelRegistry;
using stockcast::engine::modelKindName;
using stockcast::engine::parseModelKind;

TEST_CASE("Model identifiers resolve case-insensitively", "[engine][registry]") {
	REQUIRE(parseModelKind("arima") == ModelKind::Arima);
	REQUIRE(parseModelKind("SARIMA") == ModelKind::Sarima);
	REQUIRE(parseModelKind("Prophet") == ModelKind::Additive);
	REQUIRE(parseModelKind("additive") == ModelKind::Additive);
	REQUIRE(parseModelKind("XGBoost") == ModelKind::BoostedTrees);
	REQUIRE(parseModelKind("gbt") == ModelKind::BoostedTrees);
	REQUIRE(parseModelKind("lstm") == ModelKind::Lstm);
	REQUIRE(parseModelKind("Ensemble") == ModelKind::Ensemble);
}

TEST_CASE("Unknown model identifiers are rejected", "[engine][registry]") {
	REQUIRE_THROWS_AS(parseModelKind("holt-winters"), stockcast::core::UnsupportedModel);
	REQUIRE_THROWS_AS(parseModelKind(""), stockcast::core::UnsupportedModel);
	try {
		parseModelKind("naive");
		FAIL("expected UnsupportedModel");
	} catch (const stockcast::core::UnsupportedModel &e) {
		REQUIRE(e.modelId() == "naive");
		REQUIRE(std::string(e.what()) == "Unsupported model 'naive'.");
	}
}

TEST_CASE("Every supported identifier round-trips through its kind", "[engine][registry]") {
	const auto ids = ModelRegistry::supportedModels();
	REQUIRE(ids.size() == 6);
	for (const auto &id : ids) {
		REQUIRE(modelKindName(parseModelKind(id)) == id);
	}
}

TEST_CASE("Registry builds configured strategies", "[engine][registry]") {
	ForecastOptions options;

	auto sarima = ModelRegistry::create(ModelKind::Sarima, options, 7);
	REQUIRE(sarima->getName() == "SARIMA(1,1,1)(1,0,1)[7]");

	auto additive = ModelRegistry::create(ModelKind::Additive, options, 7);
	REQUIRE(additive->getName() == "Additive");

	auto boosted = ModelRegistry::create(ModelKind::BoostedTrees, options, 7);
	REQUIRE(boosted->getName() == "GradientBoostedTrees");

	auto lstm = ModelRegistry::create(ModelKind::Lstm, options, 7);
	REQUIRE_FALSE(lstm->hasNativeInterval());

	auto ensemble = ModelRegistry::create(ModelKind::Ensemble, options, 7);
	REQUIRE(ensemble->getName() == "Ensemble");

	auto arima = ModelRegistry::create(ModelKind::Arima, options, 7);
	REQUIRE(dynamic_cast<stockcast::models::AdaptiveARIMA *>(arima.get()) != nullptr);
}
