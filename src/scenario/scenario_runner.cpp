#include "stockcast/scenario/scenario_runner.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/engine/forecast_engine.hpp"
#include "stockcast/utils/logging.hpp"
#include "stockcast/utils/parallel.hpp"
#include "stockcast/utils/statistics.hpp"

#include <set>

namespace stockcast::scenario {

namespace {

std::optional<double> relativeChange(double base, double value) {
	if (base == 0.0) {
		return std::nullopt;
	}
	return (value - base) / base;
}

void validateNames(const std::vector<Scenario> &scenarios) {
	if (scenarios.empty()) {
		throw core::ValidationError("scenarios", "At least one scenario is required.");
	}
	std::set<std::string> names;
	for (const auto &scenario : scenarios) {
		if (scenario.name.empty()) {
			throw core::ValidationError("name", "Scenario names must not be empty.");
		}
		if (!names.insert(scenario.name).second) {
			throw core::ValidationError("name", "Duplicate scenario name '" + scenario.name + "'.");
		}
	}
}

} // namespace

core::TimeSeries ScenarioRunner::apply(const core::TimeSeries &series, const Scenario &scenario) {
	const double lift = scenario.promotion_lift_pct.value_or(0.0);
	const double factor = scenario.seasonality_factor.value_or(1.0);
	if (!(lift >= -1.0)) {
		throw core::ValidationError("promotion_lift_pct", "Promotion lift must be at least -1.");
	}
	if (!(factor >= 0.0)) {
		throw core::ValidationError("seasonality_factor", "Seasonality factor must not be negative.");
	}
	const double scale = (1.0 + lift) * factor;
	std::vector<double> values = series.getValues();
	for (auto &value : values) {
		value *= scale;
	}
	return series.withValues(std::move(values));
}

std::map<std::string, core::Outcome<ScenarioResult>>
ScenarioRunner::run(const core::TimeSeries &series, const std::vector<Scenario> &scenarios,
                    const ScenarioOptions &options) {
	validateNames(scenarios);

	const inventory::InventoryOptimizer optimizer(options.inventory);
	const auto base_forecast = engine::ForecastEngine::forecast(series, options.model, options.horizon,
	                                                            options.confidence, options.forecast);
	const auto base_policy =
	    optimizer.optimize(base_forecast, options.lead_time_days, options.service_level, options.costs);
	const double base_mean = utils::Statistics::mean(series.getValues());
	const double base_forecast_mean = utils::Statistics::mean(base_forecast.forecast);

	auto outcomes = utils::runIsolated<ScenarioResult>(
	    scenarios.size(),
	    [&](std::size_t index) {
		    const auto modified = apply(series, scenarios[index]);
		    ScenarioResult result;
		    result.forecast = engine::ForecastEngine::forecast(modified, options.model, options.horizon,
		                                                       options.confidence, options.forecast);
		    result.policy =
		        optimizer.optimize(result.forecast, options.lead_time_days, options.service_level, options.costs);
		    result.impact.sales_change = relativeChange(base_mean, utils::Statistics::mean(modified.getValues()));
		    result.impact.forecast_change =
		        relativeChange(base_forecast_mean, utils::Statistics::mean(result.forecast.forecast));
		    result.impact.reorder_point_change = result.policy.reorder_point - base_policy.reorder_point;
		    return result;
	    },
	    options.forecast.parallel);

	std::map<std::string, core::Outcome<ScenarioResult>> results;
	for (std::size_t i = 0; i < scenarios.size(); ++i) {
		if (outcomes[i].ok()) {
			STOCKCAST_CLOG(Inventory, info, "Scenario '{}' completed", scenarios[i].name);
		} else {
			STOCKCAST_CLOG(Inventory, warn, "Scenario '{}' failed: {}", scenarios[i].name, outcomes[i].error->message);
		}
		results.emplace(scenarios[i].name, std::move(outcomes[i]));
	}
	return results;
}

} // namespace stockcast::scenario
