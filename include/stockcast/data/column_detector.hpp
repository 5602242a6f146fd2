#pragma once

#include "stockcast/data/table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stockcast::data {

struct ColumnMapping {
	std::string date_column;
	std::string demand_column;
	std::optional<std::string> inventory_column;
	bool date_detected = false;
	bool demand_detected = false;
	/// Demand is read from the inventory column because no demand column exists.
	bool demand_from_inventory = false;
};

struct DetectionConfig {
	/// Share of sampled values that must parse as dates for type-based detection.
	double date_sample_threshold = 0.8;
	/// Share of sampled values that must be numeric for type-based detection.
	double numeric_sample_threshold = 0.8;
	/// Non-empty cells sampled per column.
	std::size_t sample_size = 100;
};

/**
 * @class ColumnDetector
 * @brief Assigns date, demand and inventory roles to columns of a raw table.
 *
 * Name matching walks the keyword lists in order; a column matching a keyword
 * is preferred when its sampled values parse as the role's type. When no name
 * matches, columns are chosen by content, in original column order.
 */
class ColumnDetector {
public:
	explicit ColumnDetector(DetectionConfig config = DetectionConfig{});

	static const std::vector<std::string> &datePatterns();
	static const std::vector<std::string> &demandPatterns();
	static const std::vector<std::string> &inventoryPatterns();

	std::optional<std::string> detectDateColumn(const Table &table) const;
	std::optional<std::string> detectDemandColumn(const Table &table,
	                                              const std::vector<std::string> &exclude = {}) const;
	std::optional<std::string> detectInventoryColumn(const Table &table,
	                                                 const std::vector<std::string> &exclude = {}) const;

	/// Share of the sampled non-empty cells that are numeric.
	double numericShare(const Column &column) const;
	/// Share of the sampled non-empty cells that parse as dates.
	double dateShare(const Column &column) const;

private:
	std::vector<Cell> sample(const Column &column) const;

	DetectionConfig config_;
};

} // namespace stockcast::data
