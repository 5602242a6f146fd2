#pragma once

#include "stockcast/core/time_series.hpp"
#include "stockcast/data/column_detector.hpp"
#include "stockcast/data/date_parser.hpp"
#include "stockcast/data/table.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace stockcast::data {

struct PrepareOptions {
	/// Explicit column names override detection and must exist.
	std::optional<std::string> date_column;
	std::optional<std::string> demand_column;
	std::optional<std::string> inventory_column;
	/// Forces the calendar frequency instead of inferring it.
	std::optional<core::Frequency> frequency;
	DetectionConfig detection;
};

struct PreparationReport {
	DateStrategy date_strategy = DateStrategy::Default;
	std::string date_format;
	double date_success_rate = 0.0;
	std::size_t input_rows = 0;
	std::size_t unparsed_dates = 0;
	std::size_t imputed_demand = 0;
	std::size_t negatives_clipped = 0;
	std::size_t duplicate_dates = 0;
	std::size_t gaps_filled = 0;
};

struct PreparedSeries {
	core::TimeSeries series;
	ColumnMapping mapping;
	PreparationReport report;
	/// Most recent on-hand level when an inventory column is present.
	std::optional<double> latest_inventory;
};

/**
 * @class SeriesPreparer
 * @brief Turns a raw table into a canonical, gap-free demand series.
 *
 * Rows whose date does not parse are dropped. Non-numeric demand is filled
 * forward then backward, negatives are clipped to zero, the first row of each
 * date is kept, and the calendar is reindexed at the inferred frequency with
 * zeros in the gaps.
 */
class SeriesPreparer {
public:
	explicit SeriesPreparer(PrepareOptions options = PrepareOptions{});

	PreparedSeries prepare(const Table &table) const;

	ColumnMapping resolveColumns(const Table &table) const;

private:
	PrepareOptions options_;
};

} // namespace stockcast::data
