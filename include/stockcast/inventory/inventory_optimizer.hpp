#pragma once

#include "stockcast/core/forecast.hpp"
#include "stockcast/core/time_series.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stockcast::inventory {

struct CostParameters {
	/// Holding cost per unit of average inventory; must be positive.
	double holding_rate = 0.2;
	double ordering_cost = 100.0;
	/// Cost per unit of mean demand for each stockout period.
	double stockout_rate = 0.5;
};

/// Inventory-to-demand ratios that grade each simulated period.
struct RiskThresholds {
	double stockout_critical = 0.1;
	double stockout_warning = 0.2;
	double overstock_critical = 3.0;
	double overstock_warning = 2.0;
};

struct RecommendationRules {
	double stockout_trigger = 0.3;
	double overstock_trigger = 0.3;
	/// Total cost above this multiple of mean(holding, stockout) flags a cost review.
	double cost_multiple = 3.0;
	double stockout_savings = 0.5;
	double holding_savings = 0.15;
	double total_savings = 0.2;
};

struct InventoryConfig {
	RiskThresholds risk;
	RecommendationRules rules;
	/// Cost per unit of mean demand for each overstocked period.
	double spoilage_rate = 0.1;
};

enum class Severity { Critical, Warning, Info };

std::string severityName(Severity severity);

struct Recommendation {
	Severity severity = Severity::Info;
	std::string title;
	std::string description;
	std::string action;
	double estimated_savings = 0.0;
};

struct CostBreakdown {
	double holding = 0.0;
	double stockout = 0.0;
	double overstock = 0.0;
	double total = 0.0;
	std::optional<double> cost_per_unit;
};

struct InventoryPerformance {
	/// Demand served from stock, in percent.
	std::optional<double> achieved_service_level_pct;
	/// Periods whose demand was fully covered, in percent.
	std::optional<double> fill_rate_pct;
	std::optional<double> turnover;
	std::size_t stockout_days = 0;
	std::size_t overstock_days = 0;
};

/**
 * @struct InventoryPolicy
 * @brief Replenishment policy for one demand path and its simulated outcome.
 *
 * Trajectory and severities are aligned with the demand path.
 */
struct InventoryPolicy {
	double average_daily_demand = 0.0;
	double safety_stock = 0.0;
	double reorder_point = 0.0;
	double eoq = 0.0;
	double service_level = 0.95;
	int lead_time_days = 7;

	std::optional<double> current_inventory;
	double recommended_max_inventory = 0.0;
	double stockout_risk_pct = 0.0;
	double overstock_gap = 0.0;
	std::optional<double> days_of_stock;

	std::vector<double> demand;
	std::vector<double> inventory_levels;
	std::vector<double> stockout_risk;
	std::vector<double> overstock_risk;

	CostBreakdown costs;
	InventoryPerformance performance;
	std::vector<Recommendation> recommendations;
};

/**
 * @class InventoryOptimizer
 * @brief Derives safety stock, reorder point and EOQ from a demand path and
 * simulates the resulting (s, Q) policy over it.
 *
 * Negative forecast values are treated as zero demand.
 */
class InventoryOptimizer {
public:
	explicit InventoryOptimizer(InventoryConfig config = InventoryConfig{});

	/**
	 * @brief Policy for a forecast demand path.
	 * @throws core::ValidationError for lead time < 1, service level outside (0, 1),
	 * invalid costs, negative current inventory or an empty forecast.
	 */
	InventoryPolicy optimize(const core::ForecastResult &forecast, int lead_time_days, double service_level,
	                         const CostParameters &costs = CostParameters{},
	                         std::optional<double> current_inventory = std::nullopt) const;

	/// Policy using an observed series as the demand proxy.
	InventoryPolicy optimize(const core::TimeSeries &series, int lead_time_days, double service_level,
	                         const CostParameters &costs = CostParameters{},
	                         std::optional<double> current_inventory = std::nullopt) const;

	/// Policy for a raw demand path.
	InventoryPolicy optimize(const std::vector<double> &demand, int lead_time_days, double service_level,
	                         const CostParameters &costs = CostParameters{},
	                         std::optional<double> current_inventory = std::nullopt) const;

	/// Table lookup for 90/95/99%, the one-sided normal quantile otherwise.
	static double serviceLevelZ(double service_level);

	static double economicOrderQuantity(double average_daily_demand, const CostParameters &costs);

	/// Simulates inventory starting at the reorder point; orders arrive @p lead_time periods after placement.
	static std::vector<double> simulate(const std::vector<double> &demand, double reorder_point, double eoq,
	                                    int lead_time);

	const InventoryConfig &config() const {
		return config_;
	}

private:
	std::vector<double> stockoutSeverity(const std::vector<double> &inventory,
	                                     const std::vector<double> &demand) const;
	std::vector<double> overstockSeverity(const std::vector<double> &inventory,
	                                      const std::vector<double> &demand) const;
	CostBreakdown costs(const InventoryPolicy &policy, const CostParameters &params) const;
	InventoryPerformance performance(const InventoryPolicy &policy) const;
	std::vector<Recommendation> recommend(const InventoryPolicy &policy) const;

	InventoryConfig config_;
};

} // namespace stockcast::inventory
