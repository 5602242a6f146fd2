#include "stockcast/data/series_preparer.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace stockcast::data {

namespace {

struct RawRow {
	long long day = 0;
	std::optional<double> demand;
	std::optional<double> inventory;
};

const Column &requireColumn(const Table &table, const std::string &name) {
	const Column *column = table.findColumn(name);
	if (column == nullptr) {
		throw core::ValidationError(name, "Column '" + name + "' not found in the data.");
	}
	return *column;
}

// Position of a day on the regular calendar starting at first_day (day >= first_day).
long long bucketOf(long long day, long long first_day, core::Frequency frequency) {
	switch (frequency) {
	case core::Frequency::Daily:
		return day - first_day;
	case core::Frequency::Weekly:
		return (day - first_day) / 7;
	case core::Frequency::Monthly: {
		const auto date = core::Calendar::civilFromDays(day);
		const auto first = core::Calendar::civilFromDays(first_day);
		return (static_cast<long long>(date.year) * 12 + date.month) -
		       (static_cast<long long>(first.year) * 12 + first.month);
	}
	}
	return day - first_day;
}

} // namespace

SeriesPreparer::SeriesPreparer(PrepareOptions options) : options_(std::move(options)) {
}

ColumnMapping SeriesPreparer::resolveColumns(const Table &table) const {
	const ColumnDetector detector(options_.detection);
	ColumnMapping mapping;

	if (options_.date_column) {
		mapping.date_column = requireColumn(table, *options_.date_column).name;
	} else if (auto detected = detector.detectDateColumn(table)) {
		mapping.date_column = *detected;
		mapping.date_detected = true;
	} else {
		throw core::ValidationError("date", "Could not detect a date column. Provide a date/time column or name it "
		                                    "explicitly.");
	}

	// Inventory is resolved first so that on-hand levels are never mistaken for demand.
	if (options_.inventory_column) {
		mapping.inventory_column = requireColumn(table, *options_.inventory_column).name;
	} else {
		std::vector<std::string> exclude = {mapping.date_column};
		if (options_.demand_column) {
			exclude.push_back(*options_.demand_column);
		}
		mapping.inventory_column = detector.detectInventoryColumn(table, exclude);
	}

	std::optional<std::string> demand;
	if (options_.demand_column) {
		demand = requireColumn(table, *options_.demand_column).name;
	} else {
		std::vector<std::string> exclude = {mapping.date_column};
		if (mapping.inventory_column) {
			exclude.push_back(*mapping.inventory_column);
		}
		demand = detector.detectDemandColumn(table, exclude);
		mapping.demand_detected = demand.has_value();
	}

	if (!demand && mapping.inventory_column) {
		demand = mapping.inventory_column;
		mapping.demand_from_inventory = true;
	}
	if (!demand) {
		throw core::ValidationError("demand", "Could not detect a numeric demand column. Provide a sales/demand "
		                                      "column or name it explicitly.");
	}
	if (*demand == mapping.date_column) {
		throw core::ValidationError(*demand, "Date and demand cannot be read from the same column '" + *demand +
		                                         "'.");
	}
	mapping.demand_column = *demand;
	return mapping;
}

PreparedSeries SeriesPreparer::prepare(const Table &table) const {
	if (table.isEmpty()) {
		throw core::ValidationError("table", "The input table is empty.");
	}

	PreparedSeries prepared;
	prepared.mapping = resolveColumns(table);
	auto &report = prepared.report;
	report.input_rows = table.rowCount();

	const Column &date_column = requireColumn(table, prepared.mapping.date_column);
	const Column &demand_column = requireColumn(table, prepared.mapping.demand_column);
	const Column *inventory_column = nullptr;
	if (prepared.mapping.inventory_column && !prepared.mapping.demand_from_inventory) {
		inventory_column = &requireColumn(table, *prepared.mapping.inventory_column);
	}

	const DateParseResult parsed = DateParser::parseColumnOrThrow(date_column);
	report.date_strategy = parsed.strategy;
	report.date_format = parsed.format;
	report.date_success_rate = parsed.success_rate;

	std::vector<RawRow> rows;
	rows.reserve(table.rowCount());
	for (std::size_t i = 0; i < table.rowCount(); ++i) {
		if (!parsed.dates[i]) {
			++report.unparsed_dates;
			continue;
		}
		RawRow row;
		row.day = core::Calendar::dayNumber(*parsed.dates[i]);
		row.demand = cellToNumber(demand_column.cells[i]);
		if (inventory_column != nullptr) {
			row.inventory = cellToNumber(inventory_column->cells[i]);
		}
		rows.push_back(row);
	}

	const bool any_numeric = std::any_of(rows.begin(), rows.end(), [](const RawRow &row) { return row.demand; });
	if (!any_numeric) {
		throw core::ValidationError(demand_column.name,
		                            "Demand column '" + demand_column.name + "' contains no numeric values.");
	}
	const bool any_non_negative = std::any_of(rows.begin(), rows.end(),
	                                          [](const RawRow &row) { return row.demand && *row.demand >= 0.0; });
	if (!any_non_negative) {
		throw core::ValidationError(demand_column.name,
		                            "Demand column '" + demand_column.name + "' contains only negative values.");
	}

	// Stable so that "first row per date" keeps input order.
	std::stable_sort(rows.begin(), rows.end(), [](const RawRow &a, const RawRow &b) { return a.day < b.day; });

	std::optional<double> carry;
	for (auto &row : rows) {
		if (row.demand) {
			carry = row.demand;
		} else if (carry) {
			row.demand = carry;
			++report.imputed_demand;
		}
	}
	carry.reset();
	for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
		if (it->demand) {
			carry = it->demand;
		} else {
			it->demand = carry;
			++report.imputed_demand;
		}
	}

	for (auto &row : rows) {
		if (*row.demand < 0.0) {
			row.demand = 0.0;
			++report.negatives_clipped;
		}
	}

	std::vector<core::TimePoint> unique_dates;
	for (std::size_t i = 0; i < rows.size(); ++i) {
		if (i == 0 || rows[i].day != rows[i - 1].day) {
			unique_dates.push_back(core::Calendar::fromDayNumber(rows[i].day));
		}
	}
	const core::Frequency frequency =
	    options_.frequency ? *options_.frequency : core::TimeSeries::inferFrequency(unique_dates);

	const long long first_day = rows.front().day;
	std::map<long long, double> buckets;
	for (const auto &row : rows) {
		const long long bucket = bucketOf(row.day, first_day, frequency);
		if (!buckets.emplace(bucket, *row.demand).second) {
			++report.duplicate_dates;
		}
		if (row.inventory) {
			prepared.latest_inventory = row.inventory;
		}
	}

	const long long last_bucket = buckets.rbegin()->first;
	const core::TimePoint first_date = core::Calendar::fromDayNumber(first_day);
	std::vector<core::TimePoint> dates;
	std::vector<double> values;
	dates.reserve(static_cast<std::size_t>(last_bucket + 1));
	values.reserve(static_cast<std::size_t>(last_bucket + 1));
	for (long long bucket = 0; bucket <= last_bucket; ++bucket) {
		dates.push_back(core::TimeSeries::advance(first_date, frequency, static_cast<int>(bucket)));
		const auto found = buckets.find(bucket);
		if (found == buckets.end()) {
			values.push_back(0.0);
			++report.gaps_filled;
		} else {
			values.push_back(found->second);
		}
	}

	prepared.series = core::TimeSeries(std::move(dates), std::move(values), frequency);

	STOCKCAST_INFO("Prepared {} {} observations from {} rows (date column '{}' via {}, demand column '{}'); "
	               "{} unparsed dates, {} duplicates, {} gaps filled",
	               prepared.series.size(), core::frequencyName(frequency), report.input_rows,
	               prepared.mapping.date_column, dateStrategyName(report.date_strategy),
	               prepared.mapping.demand_column, report.unparsed_dates, report.duplicate_dates,
	               report.gaps_filled);
	return prepared;
}

} // namespace stockcast::data
