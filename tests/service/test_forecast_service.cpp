#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/time_series_helpers.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/service/forecast_service.hpp"
#include "stockcast/service/session_store.hpp"

#include <string>
#include <thread>
#include <vector>

using stockcast::core::SessionNotFound;
using stockcast::service::ForecastService;
using stockcast::service::InMemorySessionStore;

namespace {

stockcast::data::Table inventoryTable(std::size_t days) {
	auto table = tests::helpers::makeDemandTable(tests::helpers::isoDates(days), tests::helpers::weeklyDemand(days));
	std::vector<stockcast::data::Cell> stock;
	for (std::size_t i = 0; i < days; ++i) {
		stock.emplace_back(500.0 - static_cast<double>(i));
	}
	table.addColumn("stock_on_hand", std::move(stock));
	return table;
}

} // namespace

TEST_CASE("Session store hands out unique keys", "[service][store]") {
	InMemorySessionStore store;
	REQUIRE(store.size() == 0);

	const auto first = store.create(stockcast::data::PreparedSeries {});
	const auto second = store.create(stockcast::data::PreparedSeries {});
	REQUIRE(first != second);
	REQUIRE(store.size() == 2);

	auto held = store.get(first);
	REQUIRE(store.expire(first));
	REQUIRE_FALSE(store.expire(first));
	REQUIRE(held != nullptr);
	REQUIRE_THROWS_AS(store.get(first), SessionNotFound);
	REQUIRE(store.size() == 1);
}

TEST_CASE("Session store tolerates concurrent writers", "[service][store]") {
	InMemorySessionStore store;
	std::vector<std::thread> threads;
	for (int t = 0; t < 4; ++t) {
		threads.emplace_back([&store]() {
			for (int i = 0; i < 25; ++i) {
				store.create(stockcast::data::PreparedSeries {});
			}
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}
	REQUIRE(store.size() == 100);
}

TEST_CASE("Upload prepares and stores the series", "[service][upload]") {
	InMemorySessionStore store;
	ForecastService service(store);

	auto upload = service.upload(inventoryTable(90));
	REQUIRE(upload.records == 90);
	REQUIRE(upload.mapping.date_column == "date");
	REQUIRE(upload.mapping.demand_column == "sales");
	REQUIRE(upload.mapping.inventory_column == std::string("stock_on_hand"));
	REQUIRE(upload.insights.mean > 0.0);
	REQUIRE(store.size() == 1);
	const auto stored = store.get(upload.key);
	REQUIRE(stored->latest_inventory.has_value());
	REQUIRE(*stored->latest_inventory == Catch::Approx(411.0));
}

TEST_CASE("Service operations run against a stored session", "[service][operations]") {
	InMemorySessionStore store;
	ForecastService service(store);
	const auto key = service.upload(inventoryTable(90)).key;

	auto forecast = service.forecast(key, "additive", 14);
	REQUIRE(forecast.forecast.size() == 14);

	SECTION("inventory defaults to the last on-hand level") {
		auto policy = service.optimizeInventory(key, forecast, 7, 0.95);
		REQUIRE(policy.current_inventory.has_value());
		REQUIRE(*policy.current_inventory == Catch::Approx(411.0));

		auto explicit_policy = service.optimizeInventory(key, forecast, 7, 0.95, {}, 20.0);
		REQUIRE(*explicit_policy.current_inventory == Catch::Approx(20.0));
		REQUIRE(explicit_policy.stockout_risk_pct > policy.stockout_risk_pct);
	}

	SECTION("backtest and comparison") {
		auto backtest = service.backtest(key, "arima");
		REQUIRE(backtest.test_window == 18);

		auto compared = service.compareModels(key, {"arima", "additive", "bogus"}, 7);
		REQUIRE(compared.size() == 3);
		REQUIRE_FALSE(compared.at("bogus").ok());
	}

	SECTION("scenarios") {
		stockcast::scenario::ScenarioOptions options;
		options.horizon = 14;
		auto results = service.runScenarios(key, {{"promotion", 0.25, std::nullopt}}, options);
		REQUIRE(results.at("promotion").ok());
		REQUIRE(*results.at("promotion").value->impact.sales_change == Catch::Approx(0.25));
	}
}

TEST_CASE("Expired sessions are gone for every operation", "[service][expire]") {
	InMemorySessionStore store;
	ForecastService service(store);
	const auto key = service.upload(inventoryTable(40)).key;

	REQUIRE(service.expire(key));
	REQUIRE_FALSE(service.expire(key));
	REQUIRE_THROWS_AS(service.forecast(key, "arima", 7), SessionNotFound);
	REQUIRE_THROWS_AS(service.backtest(key, "arima"), SessionNotFound);
	REQUIRE_THROWS_AS(service.compareModels(key, {"arima"}, 7), SessionNotFound);
	REQUIRE_THROWS_AS(service.runScenarios(key, {{"promo", 0.1, std::nullopt}}), SessionNotFound);
	REQUIRE_THROWS_AS(service.forecast("session-999", "arima", 7), SessionNotFound);
}
