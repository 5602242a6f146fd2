#include "stockcast/data/column_detector.hpp"

#include "stockcast/data/date_parser.hpp"

#include <algorithm>
#include <cctype>

namespace stockcast::data {

namespace {

std::string toLower(const std::string &text) {
	std::string lower;
	lower.reserve(text.size());
	for (char c : text) {
		lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
	}
	return lower;
}

bool isExcluded(const std::string &name, const std::vector<std::string> &exclude) {
	return std::find(exclude.begin(), exclude.end(), name) != exclude.end();
}

std::vector<const Column *> matchingColumns(const Table &table, const std::string &keyword,
                                            const std::vector<std::string> &exclude) {
	std::vector<const Column *> matches;
	for (const auto &column : table.columns()) {
		if (!isExcluded(column.name, exclude) && toLower(column.name).find(keyword) != std::string::npos) {
			matches.push_back(&column);
		}
	}
	return matches;
}

bool isNativeDateColumn(const std::vector<Cell> &sampled) {
	if (sampled.empty()) {
		return false;
	}
	return std::all_of(sampled.begin(), sampled.end(),
	                   [](const Cell &cell) { return std::holds_alternative<core::TimePoint>(cell); });
}

} // namespace

ColumnDetector::ColumnDetector(DetectionConfig config) : config_(config) {
}

const std::vector<std::string> &ColumnDetector::datePatterns() {
	static const std::vector<std::string> patterns = {
	    "date",     "time",       "timestamp",  "day",        "datetime",         "period",
	    "month",    "year",       "week",       "quarter",    "created_at",       "updated_at",
	    "transaction_date", "order_date", "ship_date", "delivery_date"};
	return patterns;
}

const std::vector<std::string> &ColumnDetector::demandPatterns() {
	static const std::vector<std::string> patterns = {
	    "sales",   "demand",  "quantity",    "qty",        "units",    "volume",    "orders",
	    "order_qty", "ordered", "sold",      "consumption", "usage",   "withdrawal", "issue",
	    "delivery", "shipped", "requested",  "required",   "needed"};
	return patterns;
}

const std::vector<std::string> &ColumnDetector::inventoryPatterns() {
	static const std::vector<std::string> patterns = {
	    "inventory", "stock",   "on_hand",     "onhand",          "available",
	    "quantity_on_hand", "qoh", "stock_level", "current_stock", "balance",
	    "ending_inventory", "beginning_inventory", "on_hand_qty"};
	return patterns;
}

std::vector<Cell> ColumnDetector::sample(const Column &column) const {
	std::vector<Cell> sampled;
	for (const auto &cell : column.cells) {
		if (sampled.size() >= config_.sample_size) {
			break;
		}
		if (!isEmptyCell(cell)) {
			sampled.push_back(cell);
		}
	}
	return sampled;
}

double ColumnDetector::numericShare(const Column &column) const {
	const auto sampled = sample(column);
	if (sampled.empty()) {
		return 0.0;
	}
	std::size_t numeric = 0;
	for (const auto &cell : sampled) {
		if (cellToNumber(cell)) {
			++numeric;
		}
	}
	return static_cast<double>(numeric) / static_cast<double>(sampled.size());
}

double ColumnDetector::dateShare(const Column &column) const {
	const auto sampled = sample(column);
	if (sampled.empty()) {
		return 0.0;
	}
	return DateParser::parseColumn(sampled).success_rate;
}

std::optional<std::string> ColumnDetector::detectDateColumn(const Table &table) const {
	for (const auto &keyword : datePatterns()) {
		for (const Column *column : matchingColumns(table, keyword, {})) {
			if (dateShare(*column) >= config_.date_sample_threshold) {
				return column->name;
			}
		}
	}

	for (const auto &column : table.columns()) {
		if (isNativeDateColumn(sample(column))) {
			return column.name;
		}
	}
	for (const auto &column : table.columns()) {
		// Plain numbers are only dates when they look like spreadsheet serials.
		if (numericShare(column) >= config_.numeric_sample_threshold &&
		    !DateParser::looksLikeSerialColumn(sample(column))) {
			continue;
		}
		if (dateShare(column) >= config_.date_sample_threshold) {
			return column.name;
		}
	}
	return std::nullopt;
}

std::optional<std::string> ColumnDetector::detectDemandColumn(const Table &table,
                                                              const std::vector<std::string> &exclude) const {
	for (const auto &keyword : demandPatterns()) {
		const auto matches = matchingColumns(table, keyword, exclude);
		if (matches.empty()) {
			continue;
		}
		for (const Column *column : matches) {
			if (numericShare(*column) >= config_.numeric_sample_threshold) {
				return column->name;
			}
		}
		return matches.front()->name;
	}

	std::optional<std::string> first_numeric;
	for (const auto &column : table.columns()) {
		if (isExcluded(column.name, exclude) || numericShare(column) < config_.numeric_sample_threshold) {
			continue;
		}
		if (!first_numeric) {
			first_numeric = column.name;
		}
		const bool non_negative = std::all_of(column.cells.begin(), column.cells.end(), [](const Cell &cell) {
			const auto number = cellToNumber(cell);
			return !number || *number >= 0.0;
		});
		if (non_negative) {
			return column.name;
		}
	}
	return first_numeric;
}

std::optional<std::string> ColumnDetector::detectInventoryColumn(const Table &table,
                                                                 const std::vector<std::string> &exclude) const {
	for (const auto &keyword : inventoryPatterns()) {
		const auto matches = matchingColumns(table, keyword, exclude);
		if (matches.empty()) {
			continue;
		}
		for (const Column *column : matches) {
			if (numericShare(*column) >= config_.numeric_sample_threshold) {
				return column->name;
			}
		}
		return matches.front()->name;
	}
	return std::nullopt;
}

} // namespace stockcast::data
