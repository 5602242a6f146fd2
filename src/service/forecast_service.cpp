#include "stockcast/service/forecast_service.hpp"

#include "stockcast/engine/forecast_engine.hpp"
#include "stockcast/utils/logging.hpp"

namespace stockcast::service {

ForecastService::ForecastService(SessionStore &store, inventory::InventoryConfig inventory)
    : store_(store), optimizer_(inventory) {
}

UploadResult ForecastService::upload(const data::Table &table, const data::PrepareOptions &options) {
	data::PreparedSeries prepared = data::SeriesPreparer(options).prepare(table);

	UploadResult result;
	result.mapping = prepared.mapping;
	result.report = prepared.report;
	result.insights = data::describeDemand(prepared.series);
	result.records = prepared.series.size();
	result.key = store_.create(std::move(prepared));
	STOCKCAST_CLOG(Service, info, "Stored {} records under {}", result.records, result.key);
	return result;
}

core::ForecastResult ForecastService::forecast(const std::string &key, const std::string &model_id, int horizon,
                                               double confidence, const engine::ForecastOptions &options) const {
	const auto prepared = store_.get(key);
	return engine::ForecastEngine::forecast(prepared->series, model_id, horizon, confidence, options);
}

validation::BacktestResult ForecastService::backtest(const std::string &key, const std::string &model_id,
                                                     std::optional<int> test_window,
                                                     const validation::BacktestOptions &options) const {
	const auto prepared = store_.get(key);
	return validation::backtest(prepared->series, model_id, test_window, options);
}

std::map<std::string, core::Outcome<core::ForecastResult>>
ForecastService::compareModels(const std::string &key, const std::vector<std::string> &model_ids, int horizon,
                               double confidence, const engine::ForecastOptions &options) const {
	const auto prepared = store_.get(key);
	return engine::ForecastEngine::compareModels(prepared->series, model_ids, horizon, confidence, options);
}

inventory::InventoryPolicy ForecastService::optimizeInventory(const std::string &key,
                                                              const core::ForecastResult &forecast,
                                                              int lead_time_days, double service_level,
                                                              const inventory::CostParameters &costs,
                                                              std::optional<double> current_inventory) const {
	const auto prepared = store_.get(key);
	if (!current_inventory) {
		current_inventory = prepared->latest_inventory;
	}
	return optimizer_.optimize(forecast, lead_time_days, service_level, costs, current_inventory);
}

std::map<std::string, core::Outcome<scenario::ScenarioResult>>
ForecastService::runScenarios(const std::string &key, const std::vector<scenario::Scenario> &scenarios,
                              const scenario::ScenarioOptions &options) const {
	const auto prepared = store_.get(key);
	return scenario::ScenarioRunner::run(prepared->series, scenarios, options);
}

bool ForecastService::expire(const std::string &key) {
	return store_.expire(key);
}

} // namespace stockcast::service
