#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stockcast/utils/metrics.hpp"

#include <stdexcept>
#include <vector>

using stockcast::utils::Metrics;
using stockcast::utils::MetricsConfig;

TEST_CASE("Metrics compute absolute and squared errors", "[utils][metrics]") {
	const std::vector<double> actual{10.0, 20.0, 30.0};
	const std::vector<double> predicted{12.0, 18.0, 33.0};

	REQUIRE(Metrics::mae(actual, predicted) == Catch::Approx(7.0 / 3.0));
	REQUIRE(Metrics::mse(actual, predicted) == Catch::Approx(17.0 / 3.0));
	REQUIRE(Metrics::rmse(actual, predicted) == Catch::Approx(std::sqrt(17.0 / 3.0)));
	REQUIRE(Metrics::bias(actual, predicted) == Catch::Approx(1.0 / 3.0));
}

TEST_CASE("MAPE excludes zero actuals", "[utils][metrics][mape]") {
	const std::vector<double> actual{0.0, 10.0, 20.0};
	const std::vector<double> predicted{5.0, 11.0, 18.0};

	const auto mape = Metrics::mape(actual, predicted);
	REQUIRE(mape.has_value());
	REQUIRE(*mape == Catch::Approx((0.1 + 0.1) / 2.0 * 100.0));

	SECTION("every actual masked") {
		REQUIRE_FALSE(Metrics::mape({0.0, 0.0}, {1.0, 2.0}).has_value());
	}

	SECTION("threshold masks small actuals") {
		MetricsConfig config;
		config.mape_zero_threshold = 10.0;
		const auto masked = Metrics::mape(actual, predicted, config);
		REQUIRE(masked.has_value());
		REQUIRE(*masked == Catch::Approx(10.0));
	}
}

TEST_CASE("WAPE weights errors by volume", "[utils][metrics][wape]") {
	const auto wape = Metrics::wape({0.0, 10.0, 30.0}, {2.0, 8.0, 30.0});
	REQUIRE(wape.has_value());
	REQUIRE(*wape == Catch::Approx(10.0));
	REQUIRE(*wape >= 0.0);

	REQUIRE_FALSE(Metrics::wape({0.0, 0.0}, {1.0, 1.0}).has_value());
}

TEST_CASE("Improvement is baseline minus model", "[utils][metrics]") {
	REQUIRE(*Metrics::improvement(20.0, 15.0) == Catch::Approx(5.0));
	REQUIRE(*Metrics::improvement(10.0, 15.0) == Catch::Approx(-5.0));
	REQUIRE_FALSE(Metrics::improvement(std::nullopt, 15.0).has_value());
	REQUIRE_FALSE(Metrics::improvement(10.0, std::nullopt).has_value());
}

TEST_CASE("Metrics reject mismatched input", "[utils][metrics]") {
	REQUIRE_THROWS_AS(Metrics::mae({1.0, 2.0}, {1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::wape({}, {}), std::invalid_argument);
}

TEST_CASE("Metrics evaluate bundles every score", "[utils][metrics]") {
	const auto metrics = Metrics::evaluate({10.0, 20.0}, {11.0, 18.0});
	REQUIRE(metrics.n == 2);
	REQUIRE(metrics.mae == Catch::Approx(1.5));
	REQUIRE(metrics.mape.has_value());
	REQUIRE(metrics.wape.has_value());
	REQUIRE(*metrics.wape == Catch::Approx(10.0));
}
