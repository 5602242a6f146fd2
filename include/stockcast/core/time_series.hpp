#pragma once

#include "stockcast/core/calendar.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace stockcast::core {

enum class Frequency { Daily, Weekly, Monthly };

std::string frequencyName(Frequency frequency);

/**
 * @class TimeSeries
 * @brief Univariate demand history on a regular calendar.
 *
 * Dates and values are kept in separate vectors. The constructor enforces
 * equal lengths and strictly increasing dates; contiguity at the frequency is
 * established by the data preparation layer.
 */
class TimeSeries {
public:
	using TimePoint = core::TimePoint;
	using Value = double;

	TimeSeries() = default;
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values,
	           Frequency frequency = Frequency::Daily);

	std::size_t size() const {
		return values_.size();
	}

	bool isEmpty() const {
		return values_.empty();
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	Frequency frequency() const {
		return frequency_;
	}

	/// Returns the sub-series [start, end).
	TimeSeries slice(std::size_t start, std::size_t end) const;

	/// Returns a series on the same dates with replaced values.
	TimeSeries withValues(std::vector<Value> values) const;

	/// The @p horizon dates following the last observation, on the same calendar when contiguous.
	std::vector<TimePoint> futureDates(int horizon) const;

	/// Seasonal cycle length implied by the frequency (7, 52 or 12).
	int defaultSeasonalPeriod() const;

	/// True when the i-th date lies exactly i frequency steps after the first.
	bool isContiguous() const;

	/// Moves @p tp forward by @p steps periods of @p frequency.
	static TimePoint advance(TimePoint tp, Frequency frequency, int steps = 1);

	/// Infers the frequency from the median spacing of sorted dates (daily by default).
	static Frequency inferFrequency(const std::vector<TimePoint> &timestamps);

private:
	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	Frequency frequency_ = Frequency::Daily;
};

} // namespace stockcast::core
