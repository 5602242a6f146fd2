#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/models/boosted_trees.hpp"
#include "stockcast/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using stockcast::data::FeatureConfig;
using stockcast::ml::BoostingConfig;
using stockcast::models::BoostedTreesForecaster;

namespace {

BoostingConfig quickBoosting() {
	BoostingConfig config;
	config.n_estimators = 80;
	config.learning_rate = 0.1;
	return config;
}

} // namespace

TEST_CASE("Boosted trees history requirement follows the feature lookback", "[models][boosting]") {
	BoostedTreesForecaster defaults;
	REQUIRE(defaults.minimumHistory() == 60);

	FeatureConfig features;
	features.lags = {1, 7};
	features.rolling_windows = {7};
	BoostedTreesForecaster short_lookback(quickBoosting(), features);
	REQUIRE(short_lookback.minimumHistory() == 37);

	auto ts = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(50));
	REQUIRE_THROWS_AS(defaults.fit(ts), stockcast::core::InsufficientHistory);
	REQUIRE_NOTHROW(short_lookback.fit(ts));
}

TEST_CASE("Boosted trees forecast stays near recent demand", "[models][boosting]") {
	const auto values = tests::helpers::weeklyDemand(150);
	auto ts = tests::helpers::makeDailySeries(values);
	BoostedTreesForecaster model(quickBoosting());
	model.fit(ts);

	auto result = model.predict(14, 0.95);
	REQUIRE(result.forecast.size() == 14);
	REQUIRE(result.hasInterval());
	REQUIRE(model.residualStd() > 0.0);
	for (std::size_t i = 0; i < result.forecast.size(); ++i) {
		REQUIRE(std::isfinite(result.forecast[i]));
		REQUIRE(result.lower[i] <= result.forecast[i]);
		REQUIRE(result.forecast[i] <= result.upper[i]);
		REQUIRE(result.lower[i] >= 0.0);
	}

	const std::vector<double> recent(values.end() - 28, values.end());
	const double recent_mean = stockcast::utils::Statistics::mean(recent);
	const double forecast_mean = stockcast::utils::Statistics::mean(result.forecast);
	REQUIRE(forecast_mean == Catch::Approx(recent_mean).epsilon(0.2));
}

TEST_CASE("Boosted trees default configuration produces finite output", "[models][boosting]") {
	auto ts = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(120));
	BoostedTreesForecaster model;
	model.fit(ts);

	auto fit = model.historicalFit();
	REQUIRE(fit.has_value());
	REQUIRE(fit->values.size() == 90);
	for (double value : fit->values) {
		REQUIRE(std::isfinite(value));
	}
	auto result = model.predict(14, 0.95);
	for (std::size_t i = 0; i < result.forecast.size(); ++i) {
		REQUIRE(std::isfinite(result.forecast[i]));
		REQUIRE(std::isfinite(result.lower[i]));
		REQUIRE(std::isfinite(result.upper[i]));
	}
}

TEST_CASE("Boosted trees report the in-sample fit on complete rows", "[models][boosting]") {
	auto ts = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(90));
	BoostedTreesForecaster model(quickBoosting());
	REQUIRE_FALSE(model.historicalFit().has_value());
	REQUIRE_THROWS_AS(model.predict(3, 0.95), std::runtime_error);

	model.fit(ts);
	auto fit = model.historicalFit();
	REQUIRE(fit.has_value());
	REQUIRE(fit->values.size() == fit->dates.size());
	REQUIRE(fit->values.size() == 60);
	REQUIRE(fit->dates.back() == ts.getTimestamps().back());
	REQUIRE_THROWS_AS(model.predict(0, 0.95), std::invalid_argument);
}
