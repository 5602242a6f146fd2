#include "stockcast/core/time_series.hpp"

#include <algorithm>
#include <stdexcept>

namespace stockcast::core {

std::string frequencyName(Frequency frequency) {
	switch (frequency) {
	case Frequency::Daily:
		return "daily";
	case Frequency::Weekly:
		return "weekly";
	case Frequency::Monthly:
		return "monthly";
	}
	return "daily";
}

TimeSeries::TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, Frequency frequency)
    : timestamps_(std::move(timestamps)), values_(std::move(values)), frequency_(frequency) {
	if (timestamps_.size() != values_.size()) {
		throw std::invalid_argument("TimeSeries timestamps and values must have the same length.");
	}
	for (std::size_t i = 1; i < timestamps_.size(); ++i) {
		if (timestamps_[i] <= timestamps_[i - 1]) {
			throw std::invalid_argument("TimeSeries timestamps must be strictly increasing.");
		}
	}
}

TimeSeries TimeSeries::slice(std::size_t start, std::size_t end) const {
	if (start > end || end > size()) {
		throw std::out_of_range("TimeSeries::slice range is out of bounds.");
	}
	std::vector<TimePoint> timestamps(timestamps_.begin() + static_cast<std::ptrdiff_t>(start),
	                                  timestamps_.begin() + static_cast<std::ptrdiff_t>(end));
	std::vector<Value> values(values_.begin() + static_cast<std::ptrdiff_t>(start),
	                          values_.begin() + static_cast<std::ptrdiff_t>(end));
	return TimeSeries(std::move(timestamps), std::move(values), frequency_);
}

TimeSeries TimeSeries::withValues(std::vector<Value> values) const {
	return TimeSeries(timestamps_, std::move(values), frequency_);
}

std::vector<TimeSeries::TimePoint> TimeSeries::futureDates(int horizon) const {
	if (isEmpty()) {
		throw std::logic_error("Cannot extend the calendar of an empty series.");
	}
	std::vector<TimePoint> dates;
	if (horizon <= 0) {
		return dates;
	}
	// A regular calendar keeps stepping from its first date so month ends do not drift.
	const bool anchored = isContiguous();
	const TimePoint base = anchored ? timestamps_.front() : timestamps_.back();
	const int offset = anchored ? static_cast<int>(size()) - 1 : 0;
	dates.reserve(static_cast<std::size_t>(horizon));
	for (int h = 1; h <= horizon; ++h) {
		dates.push_back(advance(base, frequency_, offset + h));
	}
	return dates;
}

int TimeSeries::defaultSeasonalPeriod() const {
	switch (frequency_) {
	case Frequency::Daily:
		return 7;
	case Frequency::Weekly:
		return 52;
	case Frequency::Monthly:
		return 12;
	}
	return 7;
}

bool TimeSeries::isContiguous() const {
	for (std::size_t i = 1; i < timestamps_.size(); ++i) {
		if (advance(timestamps_.front(), frequency_, static_cast<int>(i)) != timestamps_[i]) {
			return false;
		}
	}
	return true;
}

TimeSeries::TimePoint TimeSeries::advance(TimePoint tp, Frequency frequency, int steps) {
	switch (frequency) {
	case Frequency::Daily:
		return Calendar::addDays(tp, steps);
	case Frequency::Weekly:
		return Calendar::addDays(tp, 7LL * steps);
	case Frequency::Monthly:
		return Calendar::addMonths(tp, steps);
	}
	return Calendar::addDays(tp, steps);
}

Frequency TimeSeries::inferFrequency(const std::vector<TimePoint> &timestamps) {
	if (timestamps.size() < 2) {
		return Frequency::Daily;
	}
	std::vector<long long> gaps;
	gaps.reserve(timestamps.size() - 1);
	for (std::size_t i = 1; i < timestamps.size(); ++i) {
		gaps.push_back(Calendar::dayNumber(timestamps[i]) - Calendar::dayNumber(timestamps[i - 1]));
	}
	const auto mid = gaps.begin() + static_cast<std::ptrdiff_t>(gaps.size() / 2);
	std::nth_element(gaps.begin(), mid, gaps.end());
	const long long median_gap = *mid;

	if (median_gap == 7) {
		return Frequency::Weekly;
	}
	if (median_gap >= 28 && median_gap <= 31) {
		return Frequency::Monthly;
	}
	return Frequency::Daily;
}

} // namespace stockcast::core
