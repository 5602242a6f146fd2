#pragma once

#include "stockcast/core/forecast.hpp"
#include "stockcast/data/insights.hpp"
#include "stockcast/data/series_preparer.hpp"
#include "stockcast/engine/forecast_options.hpp"
#include "stockcast/inventory/inventory_optimizer.hpp"
#include "stockcast/scenario/scenario_runner.hpp"
#include "stockcast/service/session_store.hpp"
#include "stockcast/validation.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stockcast::service {

struct UploadResult {
	std::string key;
	data::ColumnMapping mapping;
	data::PreparationReport report;
	data::DemandInsights insights;
	std::size_t records = 0;
};

/**
 * @class ForecastService
 * @brief Runs every library operation against a series stored under a session key.
 *
 * The store is borrowed and must outlive the service. Unknown keys raise
 * core::SessionNotFound.
 */
class ForecastService {
public:
	explicit ForecastService(SessionStore &store, inventory::InventoryConfig inventory = inventory::InventoryConfig{});

	/// Prepares @p table and stores the result under a new key.
	UploadResult upload(const data::Table &table, const data::PrepareOptions &options = data::PrepareOptions{});

	core::ForecastResult forecast(const std::string &key, const std::string &model_id, int horizon,
	                              double confidence = 0.95,
	                              const engine::ForecastOptions &options = engine::ForecastOptions{}) const;

	validation::BacktestResult backtest(const std::string &key, const std::string &model_id,
	                                    std::optional<int> test_window = std::nullopt,
	                                    const validation::BacktestOptions &options = validation::BacktestOptions{}) const;

	std::map<std::string, core::Outcome<core::ForecastResult>>
	compareModels(const std::string &key, const std::vector<std::string> &model_ids, int horizon,
	              double confidence = 0.95, const engine::ForecastOptions &options = engine::ForecastOptions{}) const;

	/**
	 * @brief Inventory policy for a forecast of the stored series.
	 *
	 * @p current_inventory defaults to the last on-hand level of the upload,
	 * when it had an inventory column.
	 */
	inventory::InventoryPolicy optimizeInventory(const std::string &key, const core::ForecastResult &forecast,
	                                             int lead_time_days, double service_level,
	                                             const inventory::CostParameters &costs = inventory::CostParameters{},
	                                             std::optional<double> current_inventory = std::nullopt) const;

	std::map<std::string, core::Outcome<scenario::ScenarioResult>>
	runScenarios(const std::string &key, const std::vector<scenario::Scenario> &scenarios,
	             const scenario::ScenarioOptions &options = scenario::ScenarioOptions{}) const;

	/// Drops the session; false when it did not exist.
	bool expire(const std::string &key);

private:
	SessionStore &store_;
	inventory::InventoryOptimizer optimizer_;
};

} // namespace stockcast::service
