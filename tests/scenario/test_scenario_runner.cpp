#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/scenario/scenario_runner.hpp"

#include <vector>

using stockcast::core::ErrorKind;
using stockcast::core::ValidationError;
using stockcast::scenario::Scenario;
using stockcast::scenario::ScenarioOptions;
using stockcast::scenario::ScenarioRunner;

namespace {

ScenarioOptions quickOptions() {
	ScenarioOptions options;
	options.horizon = 14;
	return options;
}

} // namespace

TEST_CASE("Scenario transform scales demand", "[scenario][apply]") {
	auto series = tests::helpers::makeDailySeries({10.0, 20.0, 30.0});

	auto lifted = ScenarioRunner::apply(series, Scenario {"promo", 0.5, std::nullopt});
	REQUIRE(lifted.getValues() == std::vector<double> {15.0, 30.0, 45.0});
	REQUIRE(lifted.getTimestamps() == series.getTimestamps());

	auto combined = ScenarioRunner::apply(series, Scenario {"both", 0.5, 2.0});
	REQUIRE(combined.getValues()[0] == Catch::Approx(30.0));

	auto unchanged = ScenarioRunner::apply(series, Scenario {"noop", std::nullopt, std::nullopt});
	REQUIRE(unchanged.getValues() == series.getValues());

	REQUIRE_THROWS_AS(ScenarioRunner::apply(series, Scenario {"bad", -1.5, std::nullopt}), ValidationError);
	REQUIRE_THROWS_AS(ScenarioRunner::apply(series, Scenario {"bad", std::nullopt, -0.1}), ValidationError);
}

TEST_CASE("Scenario lists are validated before any work", "[scenario][validation]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(60));

	REQUIRE_THROWS_AS(ScenarioRunner::run(series, {}, quickOptions()), ValidationError);
	REQUIRE_THROWS_AS(ScenarioRunner::run(series, {Scenario {"", 0.1, std::nullopt}}, quickOptions()),
	                  ValidationError);
	REQUIRE_THROWS_AS(ScenarioRunner::run(series,
	                                      {Scenario {"promo", 0.1, std::nullopt}, Scenario {"promo", 0.2, std::nullopt}},
	                                      quickOptions()),
	                  ValidationError);

	auto short_series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(10));
	REQUIRE_THROWS_AS(ScenarioRunner::run(short_series, {Scenario {"promo", 0.1, std::nullopt}}, quickOptions()),
	                  stockcast::core::InsufficientHistory);
}

TEST_CASE("Promotion lift raises demand, forecast and reorder point", "[scenario][run]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(90));
	const std::vector<Scenario> scenarios {
	    {"promotion", 0.2, std::nullopt},
	    {"off_season", std::nullopt, 0.5},
	};
	auto results = ScenarioRunner::run(series, scenarios, quickOptions());
	REQUIRE(results.size() == 2);

	const auto &promotion = results.at("promotion");
	REQUIRE(promotion.ok());
	REQUIRE(promotion.value->impact.sales_change.has_value());
	REQUIRE(*promotion.value->impact.sales_change == Catch::Approx(0.2));
	REQUIRE(*promotion.value->impact.forecast_change > 0.1);
	REQUIRE(promotion.value->impact.reorder_point_change > 0.0);
	REQUIRE(promotion.value->forecast.forecast.size() == 14);
	REQUIRE(promotion.value->policy.inventory_levels.size() == 14);

	const auto &off_season = results.at("off_season");
	REQUIRE(off_season.ok());
	REQUIRE(*off_season.value->impact.sales_change == Catch::Approx(-0.5));
	REQUIRE(*off_season.value->impact.forecast_change < 0.0);
	REQUIRE(off_season.value->impact.reorder_point_change < 0.0);
}

TEST_CASE("A failing scenario does not affect the others", "[scenario][run]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(60));
	const std::vector<Scenario> scenarios {
	    {"impossible", -3.0, std::nullopt},
	    {"promotion", 0.1, std::nullopt},
	};
	auto results = ScenarioRunner::run(series, scenarios, quickOptions());

	REQUIRE_FALSE(results.at("impossible").ok());
	REQUIRE(results.at("impossible").error->kind == ErrorKind::Validation);
	REQUIRE(results.at("promotion").ok());
}

TEST_CASE("Unknown scenario model fails the whole request", "[scenario][run]") {
	auto series = tests::helpers::makeDailySeries(tests::helpers::weeklyDemand(60));
	auto options = quickOptions();
	options.model = "oracle";
	REQUIRE_THROWS_AS(ScenarioRunner::run(series, {Scenario {"promo", 0.1, std::nullopt}}, options),
	                  stockcast::core::UnsupportedModel);
}
