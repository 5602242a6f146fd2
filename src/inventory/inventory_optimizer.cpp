#include "stockcast/inventory/inventory_optimizer.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"
#include "stockcast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace stockcast::inventory {

namespace {

void validateInputs(const std::vector<double> &demand, int lead_time_days, double service_level,
                    const CostParameters &costs, const std::optional<double> &current_inventory) {
	if (demand.empty()) {
		throw core::ValidationError("demand", "Inventory optimization needs a non-empty demand path.");
	}
	for (double value : demand) {
		if (!std::isfinite(value)) {
			throw core::ValidationError("demand", "Demand path contains non-finite values.");
		}
	}
	if (lead_time_days < 1) {
		throw core::ValidationError("lead_time_days", "Lead time must be at least one day.");
	}
	if (!(service_level > 0.0 && service_level < 1.0)) {
		throw core::ValidationError("service_level", "Service level must lie in (0, 1).");
	}
	if (!(costs.holding_rate > 0.0)) {
		throw core::ValidationError("holding_rate", "Holding cost rate must be positive.");
	}
	if (!(costs.ordering_cost >= 0.0)) {
		throw core::ValidationError("ordering_cost", "Ordering cost must not be negative.");
	}
	if (!(costs.stockout_rate >= 0.0)) {
		throw core::ValidationError("stockout_rate", "Stockout cost rate must not be negative.");
	}
	if (current_inventory && !(*current_inventory >= 0.0)) {
		throw core::ValidationError("current_inventory", "Current inventory must not be negative.");
	}
}

double countAbove(const std::vector<double> &severity, double level) {
	return static_cast<double>(std::count_if(severity.begin(), severity.end(),
	                                         [level](double s) { return s > level; }));
}

} // namespace

std::string severityName(Severity severity) {
	switch (severity) {
	case Severity::Critical:
		return "critical";
	case Severity::Warning:
		return "warning";
	case Severity::Info:
		return "info";
	}
	return "info";
}

InventoryOptimizer::InventoryOptimizer(InventoryConfig config) : config_(config) {
}

double InventoryOptimizer::serviceLevelZ(double service_level) {
	constexpr double tolerance = 1e-9;
	if (std::abs(service_level - 0.90) < tolerance) {
		return 1.28;
	}
	if (std::abs(service_level - 0.95) < tolerance) {
		return 1.65;
	}
	if (std::abs(service_level - 0.99) < tolerance) {
		return 2.33;
	}
	return utils::Statistics::normalQuantile(service_level);
}

double InventoryOptimizer::economicOrderQuantity(double average_daily_demand, const CostParameters &costs) {
	const double annual_demand = std::max(average_daily_demand, 0.0) * 365.0;
	return std::sqrt(2.0 * annual_demand * costs.ordering_cost / costs.holding_rate);
}

std::vector<double> InventoryOptimizer::simulate(const std::vector<double> &demand, double reorder_point, double eoq,
                                                 int lead_time) {
	std::vector<double> levels(demand.size(), 0.0);
	double on_hand = reorder_point;
	double pending = 0.0;
	bool order_open = false;
	std::size_t arrival = 0;

	for (std::size_t i = 0; i < demand.size(); ++i) {
		if (order_open && i == arrival) {
			on_hand += pending;
			pending = 0.0;
			order_open = false;
		}
		on_hand = std::max(on_hand - demand[i], 0.0);
		if (on_hand <= reorder_point && !order_open) {
			pending = eoq;
			order_open = true;
			arrival = i + static_cast<std::size_t>(lead_time);
		}
		levels[i] = on_hand;
	}
	return levels;
}

std::vector<double> InventoryOptimizer::stockoutSeverity(const std::vector<double> &inventory,
                                                         const std::vector<double> &demand) const {
	std::vector<double> risk(inventory.size(), 0.0);
	for (std::size_t i = 0; i < inventory.size(); ++i) {
		if (inventory[i] < demand[i] * config_.risk.stockout_critical) {
			risk[i] = 1.0;
		} else if (inventory[i] < demand[i] * config_.risk.stockout_warning) {
			risk[i] = 0.5;
		}
	}
	return risk;
}

std::vector<double> InventoryOptimizer::overstockSeverity(const std::vector<double> &inventory,
                                                          const std::vector<double> &demand) const {
	std::vector<double> risk(inventory.size(), 0.0);
	for (std::size_t i = 0; i < inventory.size(); ++i) {
		if (inventory[i] > demand[i] * config_.risk.overstock_critical) {
			risk[i] = 1.0;
		} else if (inventory[i] > demand[i] * config_.risk.overstock_warning) {
			risk[i] = 0.5;
		}
	}
	return risk;
}

CostBreakdown InventoryOptimizer::costs(const InventoryPolicy &policy, const CostParameters &params) const {
	const double mean_demand = policy.average_daily_demand;
	CostBreakdown costs;
	costs.holding = utils::Statistics::mean(policy.inventory_levels) * params.holding_rate;
	costs.stockout = countAbove(policy.stockout_risk, 0.5) * mean_demand * params.stockout_rate;
	costs.overstock = countAbove(policy.overstock_risk, 0.5) * mean_demand * config_.spoilage_rate;
	costs.total = costs.holding + costs.stockout + costs.overstock;

	const double total_demand = utils::Statistics::sum(policy.demand);
	if (total_demand > 0.0) {
		costs.cost_per_unit = costs.total / total_demand;
	}
	return costs;
}

InventoryPerformance InventoryOptimizer::performance(const InventoryPolicy &policy) const {
	InventoryPerformance result;
	const auto &inventory = policy.inventory_levels;
	const auto &demand = policy.demand;

	double served = 0.0;
	std::size_t covered = 0;
	for (std::size_t i = 0; i < demand.size(); ++i) {
		served += std::min(inventory[i], demand[i]);
		if (inventory[i] >= demand[i]) {
			++covered;
		}
		if (inventory[i] <= demand[i] * config_.risk.stockout_critical) {
			++result.stockout_days;
		}
		if (inventory[i] >= demand[i] * config_.risk.overstock_warning) {
			++result.overstock_days;
		}
	}

	const double total_demand = utils::Statistics::sum(demand);
	if (total_demand > 0.0) {
		result.achieved_service_level_pct = served / total_demand * 100.0;
	}
	if (!demand.empty()) {
		result.fill_rate_pct = static_cast<double>(covered) / static_cast<double>(demand.size()) * 100.0;
	}
	const double mean_inventory = utils::Statistics::mean(inventory);
	if (mean_inventory > 0.0) {
		result.turnover = total_demand / mean_inventory;
	}
	return result;
}

std::vector<Recommendation> InventoryOptimizer::recommend(const InventoryPolicy &policy) const {
	const auto &rules = config_.rules;
	std::vector<Recommendation> recommendations;

	const double stockout = utils::Statistics::mean(policy.stockout_risk);
	if (stockout > rules.stockout_trigger) {
		recommendations.push_back(
		    {Severity::Critical, "High Stockout Risk",
		     fmt::format("Average stockout risk is {:.1f}%. Consider increasing safety stock.", stockout * 100.0),
		     "Increase safety stock by 20%", policy.costs.stockout * rules.stockout_savings});
	}

	const double overstock = utils::Statistics::mean(policy.overstock_risk);
	if (overstock > rules.overstock_trigger) {
		recommendations.push_back(
		    {Severity::Warning, "High Overstock Risk",
		     fmt::format("Average overstock risk is {:.1f}%. Consider reducing order quantities.", overstock * 100.0),
		     "Reduce EOQ by 15%", policy.costs.holding * rules.holding_savings});
	}

	if (policy.costs.total > (policy.costs.holding + policy.costs.stockout) / 2.0 * rules.cost_multiple) {
		recommendations.push_back({Severity::Info, "Cost Optimization Opportunity",
		                           "Total inventory costs are high. Review ordering policies.",
		                           "Implement dynamic reorder points based on demand variability",
		                           policy.costs.total * rules.total_savings});
	}
	return recommendations;
}

InventoryPolicy InventoryOptimizer::optimize(const std::vector<double> &demand_path, int lead_time_days,
                                             double service_level, const CostParameters &params,
                                             std::optional<double> current_inventory) const {
	validateInputs(demand_path, lead_time_days, service_level, params, current_inventory);

	InventoryPolicy policy;
	policy.service_level = service_level;
	policy.lead_time_days = lead_time_days;
	policy.current_inventory = current_inventory;
	policy.demand.reserve(demand_path.size());
	for (double value : demand_path) {
		policy.demand.push_back(std::max(value, 0.0));
	}
	policy.average_daily_demand = utils::Statistics::mean(policy.demand);

	const auto lead = static_cast<std::size_t>(lead_time_days);
	const std::size_t covered = std::min(lead, policy.demand.size());
	const std::vector<double> window(policy.demand.begin(), policy.demand.begin() + static_cast<std::ptrdiff_t>(covered));
	const double z = serviceLevelZ(service_level);
	policy.safety_stock = std::max(0.0, z * utils::Statistics::stddev(window) * std::sqrt(static_cast<double>(lead)));

	double lead_time_demand = utils::Statistics::sum(window);
	if (lead > window.size()) {
		lead_time_demand += utils::Statistics::mean(window) * static_cast<double>(lead - window.size());
	}
	policy.reorder_point = lead_time_demand + policy.safety_stock;
	policy.recommended_max_inventory = policy.reorder_point + policy.safety_stock;

	policy.eoq = economicOrderQuantity(policy.average_daily_demand, params);
	if (!(policy.average_daily_demand > 0.0)) {
		STOCKCAST_CLOG(Inventory, warn, "Average demand is zero; order quantity set to 0");
	}
	STOCKCAST_CLOG(Inventory, debug, "Policy z={:.3f} safety_stock={:.2f} reorder_point={:.2f} eoq={:.2f}", z,
	               policy.safety_stock, policy.reorder_point, policy.eoq);

	policy.inventory_levels = simulate(policy.demand, policy.reorder_point, policy.eoq, lead_time_days);
	policy.stockout_risk = stockoutSeverity(policy.inventory_levels, policy.demand);
	policy.overstock_risk = overstockSeverity(policy.inventory_levels, policy.demand);
	policy.costs = costs(policy, params);
	policy.performance = performance(policy);

	if (current_inventory) {
		const double current = *current_inventory;
		if (policy.reorder_point > 0.0) {
			policy.stockout_risk_pct =
			    std::max((policy.reorder_point - current) / policy.reorder_point * 100.0, 0.0);
		}
		policy.overstock_gap = std::max(current - policy.recommended_max_inventory, 0.0);
		if (policy.average_daily_demand > 0.0) {
			policy.days_of_stock = current / policy.average_daily_demand;
		}
	} else {
		policy.stockout_risk_pct = utils::Statistics::mean(policy.stockout_risk) * 100.0;
	}

	policy.recommendations = recommend(policy);
	STOCKCAST_CLOG(Inventory, info,
	               "Inventory policy over {} periods: reorder point {:.2f}, EOQ {:.2f}, total cost {:.2f}",
	               policy.demand.size(), policy.reorder_point, policy.eoq, policy.costs.total);
	return policy;
}

InventoryPolicy InventoryOptimizer::optimize(const core::ForecastResult &forecast, int lead_time_days,
                                             double service_level, const CostParameters &params,
                                             std::optional<double> current_inventory) const {
	return optimize(forecast.forecast, lead_time_days, service_level, params, current_inventory);
}

InventoryPolicy InventoryOptimizer::optimize(const core::TimeSeries &series, int lead_time_days,
                                             double service_level, const CostParameters &params,
                                             std::optional<double> current_inventory) const {
	return optimize(series.getValues(), lead_time_days, service_level, params, current_inventory);
}

} // namespace stockcast::inventory
