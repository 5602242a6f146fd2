#pragma once

#include "stockcast/core/calendar.hpp"
#include "stockcast/core/time_series.hpp"
#include "stockcast/data/table.hpp"

#include <cmath>
#include <random>
#include <string>
#include <vector>

namespace tests::helpers {

inline std::vector<stockcast::core::TimePoint>
makeDates(std::size_t count, stockcast::core::Frequency frequency = stockcast::core::Frequency::Daily,
          stockcast::core::TimePoint start = stockcast::core::Calendar::makeDate(2023, 1, 1)) {
	std::vector<stockcast::core::TimePoint> dates;
	dates.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		dates.push_back(stockcast::core::TimeSeries::advance(start, frequency, static_cast<int>(i)));
	}
	return dates;
}

inline stockcast::core::TimeSeries makeDailySeries(std::vector<double> values) {
	auto dates = makeDates(values.size());
	return stockcast::core::TimeSeries(std::move(dates), std::move(values), stockcast::core::Frequency::Daily);
}

inline stockcast::core::TimeSeries makeSeries(std::vector<double> values, stockcast::core::Frequency frequency) {
	auto dates = makeDates(values.size(), frequency);
	return stockcast::core::TimeSeries(std::move(dates), std::move(values), frequency);
}

inline std::vector<double> constantDemand(std::size_t count, double value) {
	return std::vector<double>(count, value);
}

/// Positive demand with a linear trend, a weekly cycle and seeded Gaussian noise.
inline std::vector<double> weeklyDemand(std::size_t count, double base = 100.0, double amplitude = 15.0,
                                        double trend = 0.1, double noise = 2.0, unsigned seed = 7) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> dist(0.0, noise);
	const double pi = std::acos(-1.0);
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		const double t = static_cast<double>(i);
		values.push_back(base + trend * t + amplitude * std::sin(2.0 * pi * t / 7.0) + dist(rng));
	}
	return values;
}

/// Table with string dates in ISO format under "date" and numbers under "sales".
inline stockcast::data::Table makeDemandTable(const std::vector<std::string> &dates,
                                              const std::vector<double> &sales) {
	std::vector<stockcast::data::Cell> date_cells(dates.begin(), dates.end());
	std::vector<stockcast::data::Cell> sales_cells(sales.begin(), sales.end());
	stockcast::data::Table table;
	table.addColumn("date", std::move(date_cells));
	table.addColumn("sales", std::move(sales_cells));
	return table;
}

inline std::vector<std::string> isoDates(std::size_t count,
                                         stockcast::core::TimePoint start = stockcast::core::Calendar::makeDate(2023, 1, 1)) {
	std::vector<std::string> dates;
	dates.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		dates.push_back(stockcast::core::Calendar::format(stockcast::core::Calendar::addDays(start, static_cast<long long>(i))));
	}
	return dates;
}

} // namespace tests::helpers
