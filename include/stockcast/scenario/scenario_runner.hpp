#pragma once

#include "stockcast/core/forecast.hpp"
#include "stockcast/core/outcome.hpp"
#include "stockcast/core/time_series.hpp"
#include "stockcast/engine/forecast_options.hpp"
#include "stockcast/inventory/inventory_optimizer.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stockcast::scenario {

/// Demand transform: values are scaled by (1 + promotion_lift_pct) * seasonality_factor.
struct Scenario {
	std::string name;
	std::optional<double> promotion_lift_pct;
	std::optional<double> seasonality_factor;
};

struct ScenarioOptions {
	std::string model = "additive";
	int horizon = 30;
	double confidence = 0.95;
	int lead_time_days = 7;
	double service_level = 0.95;
	inventory::CostParameters costs;
	inventory::InventoryConfig inventory;
	engine::ForecastOptions forecast;
};

struct ScenarioImpact {
	/// Relative change of mean historical demand; empty when the base mean is zero.
	std::optional<double> sales_change;
	/// Relative change of the mean forecast; empty when the base forecast mean is zero.
	std::optional<double> forecast_change;
	double reorder_point_change = 0.0;
};

struct ScenarioResult {
	core::ForecastResult forecast;
	inventory::InventoryPolicy policy;
	ScenarioImpact impact;
};

/**
 * @class ScenarioRunner
 * @brief Evaluates what-if demand scenarios against the unmodified series.
 *
 * The base forecast and policy are computed once; scenarios then run in
 * parallel and each failure is reported under that scenario's name only.
 */
class ScenarioRunner final {
public:
	/**
	 * @throws core::ValidationError for an empty scenario list, empty or duplicate names.
	 * Errors of the base forecast propagate.
	 */
	static std::map<std::string, core::Outcome<ScenarioResult>>
	run(const core::TimeSeries &series, const std::vector<Scenario> &scenarios,
	    const ScenarioOptions &options = ScenarioOptions{});

	/**
	 * @brief Applies a scenario's demand transform to @p series.
	 * @throws core::ValidationError when the lift is below -1 or the factor is negative.
	 */
	static core::TimeSeries apply(const core::TimeSeries &series, const Scenario &scenario);
};

} // namespace stockcast::scenario
