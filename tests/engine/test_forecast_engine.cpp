#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/engine/forecast_engine.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using stockcast::core::ErrorKind;
using stockcast::engine::ForecastEngine;
using stockcast::engine::ForecastOptions;

namespace {

ForecastOptions quickOptions() {
	ForecastOptions options;
	options.boosting.n_estimators = 60;
	options.boosting.learning_rate = 0.1;
	options.lstm.hidden_units = 8;
	options.lstm.lookback = 14;
	options.lstm.epochs = 5;
	return options;
}

void requireWellFormed(const stockcast::core::ForecastResult &result, const stockcast::core::TimeSeries &series,
                       int horizon) {
	const auto steps = static_cast<std::size_t>(horizon);
	REQUIRE(result.forecast.size() == steps);
	REQUIRE(result.lower.size() == steps);
	REQUIRE(result.upper.size() == steps);
	REQUIRE(result.dates == series.futureDates(horizon));
	REQUIRE(result.bands.count("95") == 1);
	REQUIRE(result.bands.count("80") == 1);
	for (std::size_t h = 0; h < steps; ++h) {
		REQUIRE(std::isfinite(result.forecast[h]));
		REQUIRE(result.lower[h] <= result.forecast[h]);
		REQUIRE(result.forecast[h] <= result.upper[h]);
		REQUIRE(result.bands.at("95").lower[h] <= result.bands.at("80").lower[h]);
		REQUIRE(result.bands.at("80").upper[h] <= result.bands.at("95").upper[h]);
	}
}

} // namespace

TEST_CASE("Forecast requests are validated in order", "[engine][forecast]") {
	auto short_series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(10));
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(60));

	SECTION("unknown model wins over every other problem") {
		REQUIRE_THROWS_AS(ForecastEngine::forecast(short_series, "naive", -1, 2.0), stockcast::core::UnsupportedModel);
	}

	SECTION("horizon must be positive") {
		REQUIRE_THROWS_AS(ForecastEngine::forecast(series, "arima", 0, 0.95), stockcast::core::ValidationError);
	}

	SECTION("confidence must be inside (0, 1)") {
		REQUIRE_THROWS_AS(ForecastEngine::forecast(series, "arima", 7, 1.0), stockcast::core::ValidationError);
		REQUIRE_THROWS_AS(ForecastEngine::forecast(series, "arima", 7, 0.0), stockcast::core::ValidationError);
	}

	SECTION("fewer than twenty observations") {
		try {
			ForecastEngine::forecast(short_series, "additive", 7, 0.95);
			FAIL("expected InsufficientHistory");
		} catch (const stockcast::core::InsufficientHistory &e) {
			REQUIRE(e.required() == 20);
			REQUIRE(e.available() == 10);
		}
	}

	SECTION("strategy-specific history requirement") {
		REQUIRE_THROWS_AS(ForecastEngine::forecast(series.slice(0, 40), "gbt", 7, 0.95, quickOptions()),
		                  stockcast::core::InsufficientHistory);
	}

	SECTION("seasonal period override must be at least two") {
		ForecastOptions options;
		options.seasonal_period = 1;
		REQUIRE_THROWS_AS(ForecastEngine::forecast(series, "sarima", 7, 0.95, options),
		                  stockcast::core::ValidationError);
	}
}

TEST_CASE("Forecast results are complete for every strategy", "[engine][forecast]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(120));
	const auto options = quickOptions();

	for (const std::string model : {"arima", "sarima", "additive", "gbt", "lstm", "ensemble"}) {
		DYNAMIC_SECTION("model " << model) {
			auto result = ForecastEngine::forecast(series, model, 14, 0.95, options);
			requireWellFormed(result, series, 14);
			REQUIRE(result.confidence_level == Catch::Approx(0.95));
			REQUIRE_FALSE(result.model.empty());
		}
	}
}

TEST_CASE("Ensemble forecasts list their members", "[engine][forecast]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(120));
	auto result = ForecastEngine::forecast(series, "ensemble", 7, 0.9, quickOptions());
	REQUIRE(result.model == "Ensemble");
	REQUIRE(result.components.size() == 3);
}

TEST_CASE("Default options forecast with boosted trees and the full ensemble", "[engine][forecast]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(120));

	SECTION("gbt") {
		auto result = ForecastEngine::forecast(series, "gbt", 14, 0.95);
		requireWellFormed(result, series, 14);
		REQUIRE(result.model == "GradientBoostedTrees");
	}

	SECTION("ensemble keeps every member") {
		auto result = ForecastEngine::forecast(series, "ensemble", 14, 0.95);
		requireWellFormed(result, series, 14);
		REQUIRE(result.components.size() == 3);
		REQUIRE(std::find(result.components.begin(), result.components.end(), "GradientBoostedTrees") !=
		        result.components.end());
	}
}

TEST_CASE("Named bands scale with the forecast spread", "[engine][forecast]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(90));
	auto options = quickOptions();
	options.interval_spread_scale = 0.2;
	auto result = ForecastEngine::forecast(series, "additive", 14, 0.95, options);

	double mean = 0.0;
	for (double v : result.forecast) {
		mean += v / static_cast<double>(result.forecast.size());
	}
	double var = 0.0;
	for (double v : result.forecast) {
		var += (v - mean) * (v - mean) / static_cast<double>(result.forecast.size());
	}
	const double sigma = std::sqrt(var) * 0.2;
	const auto &band95 = result.bands.at("95");
	REQUIRE(band95.upper[0] - result.forecast[0] == Catch::Approx(1.96 * sigma));
	REQUIRE(result.forecast[0] - result.bands.at("80").lower[0] == Catch::Approx(1.28 * sigma));
}

TEST_CASE("Strategies without a native interval get a spread-based one", "[engine][forecast]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(60));
	auto result = ForecastEngine::forecast(series, "lstm", 10, 0.95, quickOptions());
	REQUIRE(result.hasInterval());
	REQUIRE_FALSE(result.historical_fit.has_value());
}

TEST_CASE("Model comparison isolates failures", "[engine][compare]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(90));
	const std::vector<std::string> ids {"arima", "additive", "bogus", "arima"};
	auto results = ForecastEngine::compareModels(series, ids, 7, 0.95, quickOptions());

	REQUIRE(results.size() == 3);
	REQUIRE(results.at("arima").ok());
	REQUIRE(results.at("additive").ok());
	REQUIRE_FALSE(results.at("bogus").ok());
	REQUIRE(results.at("bogus").error->kind == ErrorKind::UnsupportedModel);
	requireWellFormed(*results.at("arima").value, series, 7);

	SECTION("short history fails every model independently") {
		auto short_results = ForecastEngine::compareModels(series.slice(0, 15), {"arima", "gbt"}, 7, 0.95);
		REQUIRE(short_results.size() == 2);
		for (const auto &entry : short_results) {
			REQUIRE(entry.second.error->kind == ErrorKind::InsufficientHistory);
		}
	}
}
