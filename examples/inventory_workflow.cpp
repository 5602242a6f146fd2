/**
 * @file inventory_workflow.cpp
 * @brief End-to-end demand planning for a single product
 *
 * This example shows how to:
 * 1. Upload a raw sales table and inspect the detected columns
 * 2. Compare forecasting models on a held-out window
 * 3. Turn the best forecast into a replenishment policy
 * 4. Evaluate promotion and off-season scenarios
 */

#include "stockcast/core/calendar.hpp"
#include "stockcast/data/table.hpp"
#include "stockcast/service/forecast_service.hpp"
#include "stockcast/service/session_store.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace stockcast;

// Two years of daily sales with a weekly cycle, a summer peak and a stock count column
data::Table createSalesTable() {
	std::vector<data::Cell> dates;
	std::vector<data::Cell> units;
	std::vector<data::Cell> stock;

	const auto start = core::Calendar::makeDate(2023, 1, 1);
	const double pi = std::acos(-1.0);
	double on_hand = 900.0;
	for (int day = 0; day < 730; ++day) {
		const auto date = core::Calendar::addDays(start, day);
		const double weekly = 12.0 * std::sin(2.0 * pi * day / 7.0);
		const double yearly = 25.0 * std::sin(2.0 * pi * (day - 80) / 365.25);
		const double noise = ((day * 13) % 11) - 5.0;
		const double sold = std::max(0.0, 80.0 + 0.02 * day + weekly + yearly + noise);

		on_hand -= sold;
		if (on_hand < 300.0) {
			on_hand += 1500.0;
		}

		dates.emplace_back(core::Calendar::format(date));
		units.emplace_back(sold);
		stock.emplace_back(on_hand);
	}

	data::Table table;
	table.addColumn("Order Date", std::move(dates));
	table.addColumn("Units Sold", std::move(units));
	table.addColumn("Stock On Hand", std::move(stock));
	return table;
}

void printSeparator(const std::string &title = "") {
	std::cout << "\n";
	std::cout << std::string(80, '=') << "\n";
	if (!title.empty()) {
		std::cout << title << "\n";
		std::cout << std::string(80, '=') << "\n";
	}
}

std::string percent(const std::optional<double> &value) {
	if (!value) {
		return "n/a";
	}
	std::ostringstream out;
	out << std::fixed << std::setprecision(2) << *value << "%";
	return out.str();
}

int main() {
	utils::Logging::init(spdlog::level::warn);

	service::InMemorySessionStore store;
	service::ForecastService planner(store);

	printSeparator("1. Upload");
	const auto upload = planner.upload(createSalesTable());
	std::cout << "Session:    " << upload.key << "\n";
	std::cout << "Records:    " << upload.records << "\n";
	std::cout << "Date:       " << upload.mapping.date_column << "\n";
	std::cout << "Demand:     " << upload.mapping.demand_column << "\n";
	std::cout << "Inventory:  " << upload.mapping.inventory_column.value_or("-") << "\n";
	std::cout << "Mean/day:   " << std::fixed << std::setprecision(2) << upload.insights.mean << "\n";
	std::cout << "Volatility: " << percent(upload.insights.volatility_pct) << "\n";

	printSeparator("2. Backtest");
	std::string best_model = "additive";
	double best_wape = std::numeric_limits<double>::infinity();
	for (const std::string model : {"arima", "additive", "gbt"}) {
		try {
			const auto result = planner.backtest(upload.key, model, 28);
			std::cout << std::left << std::setw(24) << result.model << " WAPE " << percent(result.model_wape)
			          << "  (baseline " << percent(result.baseline_wape) << ")\n";
			if (result.model_wape && *result.model_wape < best_wape) {
				best_wape = *result.model_wape;
				best_model = model;
			}
		} catch (const std::exception &e) {
			std::cout << std::left << std::setw(24) << model << " failed: " << e.what() << "\n";
		}
	}
	std::cout << "Selected: " << best_model << "\n";

	printSeparator("3. Forecast and replenishment policy");
	const auto forecast = planner.forecast(upload.key, best_model, 30);
	const auto summary = core::summarize(forecast);
	std::cout << "Average forecast:  " << summary.average << "\n";
	std::cout << "Peak forecast:     " << summary.peak_value << "\n";

	const auto policy = planner.optimizeInventory(upload.key, forecast, 7, 0.95);
	std::cout << "Safety stock:      " << policy.safety_stock << "\n";
	std::cout << "Reorder point:     " << policy.reorder_point << "\n";
	std::cout << "Order quantity:    " << policy.eoq << "\n";
	std::cout << "Stockout risk:     " << policy.stockout_risk_pct << "%\n";
	std::cout << "Total cost:        " << policy.costs.total << "\n";
	for (const auto &recommendation : policy.recommendations) {
		std::cout << "  [" << inventory::severityName(recommendation.severity) << "] " << recommendation.title
		          << ": " << recommendation.action << "\n";
	}

	printSeparator("4. Scenarios");
	scenario::ScenarioOptions options;
	options.model = best_model;
	const auto scenarios = planner.runScenarios(
	    upload.key, {{"promotion", 0.25, std::nullopt}, {"off_season", std::nullopt, 0.7}}, options);
	for (const auto &entry : scenarios) {
		if (!entry.second.ok()) {
			std::cout << entry.first << " failed: " << entry.second.error->message << "\n";
			continue;
		}
		const auto &impact = entry.second.value->impact;
		std::cout << std::left << std::setw(12) << entry.first << " forecast change "
		          << (impact.forecast_change ? *impact.forecast_change * 100.0 : 0.0) << "%, reorder point change "
		          << impact.reorder_point_change << "\n";
	}

	planner.expire(upload.key);
	return 0;
}
