#include <catch2/catch_test_macros.hpp>

#include "stockcast/core/calendar.hpp"
#include "stockcast/core/time_series.hpp"
#include "common/time_series_helpers.hpp"

#include <stdexcept>

using stockcast::core::Calendar;
using stockcast::core::Frequency;
using stockcast::core::TimeSeries;

TEST_CASE("TimeSeries rejects malformed input", "[core][time_series]") {
	const auto dates = tests::helpers::makeDates(3);

	SECTION("length mismatch") {
		REQUIRE_THROWS_AS(TimeSeries(dates, {1.0, 2.0}), std::invalid_argument);
	}

	SECTION("non-increasing dates") {
		std::vector<stockcast::core::TimePoint> unordered = {dates[0], dates[2], dates[1]};
		REQUIRE_THROWS_AS(TimeSeries(unordered, {1.0, 2.0, 3.0}), std::invalid_argument);

		std::vector<stockcast::core::TimePoint> repeated = {dates[0], dates[0]};
		REQUIRE_THROWS_AS(TimeSeries(repeated, {1.0, 2.0}), std::invalid_argument);
	}
}

TEST_CASE("TimeSeries slices keep alignment", "[core][time_series]") {
	auto ts = tests::helpers::makeDailySeries({1.0, 2.0, 3.0, 4.0, 5.0});
	auto tail = ts.slice(3, 5);
	REQUIRE(tail.size() == 2);
	REQUIRE(tail.getValues() == std::vector<double>{4.0, 5.0});
	REQUIRE(tail.getTimestamps().front() == ts.getTimestamps()[3]);
	REQUIRE(tail.frequency() == Frequency::Daily);
	REQUIRE_THROWS_AS(ts.slice(4, 6), std::out_of_range);
}

TEST_CASE("TimeSeries extends its calendar at its frequency", "[core][time_series]") {
	SECTION("daily") {
		auto ts = tests::helpers::makeDailySeries({1.0, 2.0});
		const auto future = ts.futureDates(2);
		REQUIRE(future.size() == 2);
		REQUIRE(Calendar::format(future[0]) == "2023-01-03");
		REQUIRE(Calendar::format(future[1]) == "2023-01-04");
		REQUIRE(ts.defaultSeasonalPeriod() == 7);
	}

	SECTION("weekly") {
		auto ts = tests::helpers::makeSeries({1.0, 2.0}, Frequency::Weekly);
		REQUIRE(Calendar::format(ts.futureDates(1)[0]) == "2023-01-15");
		REQUIRE(ts.defaultSeasonalPeriod() == 52);
	}

	SECTION("monthly from a month end") {
		TimeSeries ts({Calendar::makeDate(2023, 1, 31)}, {5.0}, Frequency::Monthly);
		const auto future = ts.futureDates(2);
		REQUIRE(Calendar::format(future[0]) == "2023-02-28");
		REQUIRE(Calendar::format(future[1]) == "2023-03-31");
		REQUIRE(ts.defaultSeasonalPeriod() == 12);
	}
}

TEST_CASE("TimeSeries infers frequency from median spacing", "[core][time_series]") {
	REQUIRE(TimeSeries::inferFrequency(tests::helpers::makeDates(10)) == Frequency::Daily);
	REQUIRE(TimeSeries::inferFrequency(tests::helpers::makeDates(10, Frequency::Weekly)) == Frequency::Weekly);
	REQUIRE(TimeSeries::inferFrequency(tests::helpers::makeDates(10, Frequency::Monthly)) == Frequency::Monthly);

	auto irregular = tests::helpers::makeDates(2);
	irregular.push_back(Calendar::addDays(irregular.back(), 3));
	irregular.push_back(Calendar::addDays(irregular.back(), 3));
	REQUIRE(TimeSeries::inferFrequency(irregular) == Frequency::Daily);
}

TEST_CASE("TimeSeries reports contiguity", "[core][time_series]") {
	REQUIRE(tests::helpers::makeDailySeries({1.0, 2.0, 3.0}).isContiguous());

	auto dates = tests::helpers::makeDates(2);
	dates.push_back(Calendar::addDays(dates.back(), 2));
	TimeSeries gapped(dates, {1.0, 2.0, 3.0});
	REQUIRE_FALSE(gapped.isContiguous());
}
