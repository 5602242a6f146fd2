#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stockcast/core/calendar.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/data/series_preparer.hpp"
#include "common/time_series_helpers.hpp"

using stockcast::core::Calendar;
using stockcast::core::Frequency;
using stockcast::core::ValidationError;
using stockcast::data::Cell;
using stockcast::data::PrepareOptions;
using stockcast::data::SeriesPreparer;
using stockcast::data::Table;

namespace {

std::vector<Cell> texts(const std::vector<std::string> &values) {
	return std::vector<Cell>(values.begin(), values.end());
}

} // namespace

TEST_CASE("Preparation sorts, de-duplicates, clips and fills gaps", "[data][preparer]") {
	Table table;
	table.addColumn("date", texts({"2023-01-03", "2023-01-01", "2023-01-01", "2023-01-05"}));
	table.addColumn("sales", {5.0, 10.0, 99.0, -3.0});

	const auto prepared = SeriesPreparer().prepare(table);
	const auto &series = prepared.series;

	REQUIRE(series.frequency() == Frequency::Daily);
	REQUIRE(series.size() == 5);
	REQUIRE(series.getValues() == std::vector<double>{10.0, 0.0, 5.0, 0.0, 0.0});
	REQUIRE(Calendar::format(series.getTimestamps().front()) == "2023-01-01");
	REQUIRE(series.isContiguous());

	REQUIRE(prepared.report.duplicate_dates == 1);
	REQUIRE(prepared.report.negatives_clipped == 1);
	REQUIRE(prepared.report.gaps_filled == 2);
	REQUIRE(prepared.mapping.date_column == "date");
	REQUIRE(prepared.mapping.demand_column == "sales");
	REQUIRE(prepared.mapping.date_detected);
	REQUIRE(prepared.mapping.demand_detected);
}

TEST_CASE("Non-numeric demand is filled forward then backward", "[data][preparer]") {
	Table table;
	table.addColumn("date", texts(tests::helpers::isoDates(4)));
	table.addColumn("sales", {std::string("n/a"), 5.0, std::string("x"), 7.0});

	const auto prepared = SeriesPreparer().prepare(table);
	REQUIRE(prepared.series.getValues() == std::vector<double>{5.0, 5.0, 5.0, 7.0});
	REQUIRE(prepared.report.imputed_demand == 2);
}

TEST_CASE("Rows with unparseable dates are dropped", "[data][preparer]") {
	Table table;
	table.addColumn("date", texts({"2023-01-01", "bad", "2023-01-02", "2023-01-03"}));
	table.addColumn("sales", {1.0, 2.0, 3.0, 4.0});

	const auto prepared = SeriesPreparer().prepare(table);
	REQUIRE(prepared.series.getValues() == std::vector<double>{1.0, 3.0, 4.0});
	REQUIRE(prepared.report.unparsed_dates == 1);
	REQUIRE(prepared.report.date_success_rate == Catch::Approx(0.75));
}

TEST_CASE("Weekly and monthly calendars are inferred", "[data][preparer]") {
	SECTION("weekly with a missing week") {
		Table table;
		table.addColumn("week", texts({"2023-01-02", "2023-01-09", "2023-01-23", "2023-01-30"}));
		table.addColumn("demand", {1.0, 2.0, 3.0, 4.0});

		const auto prepared = SeriesPreparer().prepare(table);
		REQUIRE(prepared.series.frequency() == Frequency::Weekly);
		REQUIRE(prepared.series.getValues() == std::vector<double>{1.0, 2.0, 0.0, 3.0, 4.0});
		REQUIRE(prepared.series.isContiguous());
	}

	SECTION("monthly month ends") {
		Table table;
		table.addColumn("month", texts({"2023-01-31", "2023-02-28", "2023-03-31"}));
		table.addColumn("sales", {10.0, 20.0, 30.0});

		const auto prepared = SeriesPreparer().prepare(table);
		REQUIRE(prepared.series.frequency() == Frequency::Monthly);
		REQUIRE(prepared.series.size() == 3);
		REQUIRE(prepared.series.isContiguous());
	}
}

TEST_CASE("Preparation rejects unusable demand", "[data][preparer]") {
	SECTION("no numeric values") {
		Table table;
		table.addColumn("date", texts(tests::helpers::isoDates(3)));
		table.addColumn("sales", texts({"a", "b", "c"}));
		REQUIRE_THROWS_AS(SeriesPreparer().prepare(table), ValidationError);
	}

	SECTION("only negative values") {
		Table table;
		table.addColumn("date", texts(tests::helpers::isoDates(3)));
		table.addColumn("sales", {-1.0, -2.0, -3.0});
		REQUIRE_THROWS_AS(SeriesPreparer().prepare(table), ValidationError);
	}

	SECTION("empty table") {
		REQUIRE_THROWS_AS(SeriesPreparer().prepare(Table{}), ValidationError);
	}

	SECTION("unknown explicit column") {
		Table table;
		table.addColumn("date", texts(tests::helpers::isoDates(3)));
		table.addColumn("sales", {1.0, 2.0, 3.0});
		PrepareOptions options;
		options.demand_column = "revenue";
		try {
			SeriesPreparer(options).prepare(table);
			FAIL("expected a validation error");
		} catch (const ValidationError &e) {
			REQUIRE(e.field() == "revenue");
		}
	}
}

TEST_CASE("Inventory columns are tracked and can stand in for demand", "[data][preparer]") {
	SECTION("latest on-hand level") {
		Table table;
		table.addColumn("date", texts(tests::helpers::isoDates(3)));
		table.addColumn("sales", {1.0, 2.0, 3.0});
		table.addColumn("inventory", {50.0, 48.0, 45.0});

		const auto prepared = SeriesPreparer().prepare(table);
		REQUIRE(prepared.mapping.inventory_column == std::optional<std::string>("inventory"));
		REQUIRE(prepared.latest_inventory.has_value());
		REQUIRE(*prepared.latest_inventory == Catch::Approx(45.0));
	}

	SECTION("inventory as demand proxy") {
		Table table;
		table.addColumn("date", texts(tests::helpers::isoDates(3)));
		table.addColumn("stock_level", {50.0, 48.0, 45.0});

		const auto prepared = SeriesPreparer().prepare(table);
		REQUIRE(prepared.mapping.demand_from_inventory);
		REQUIRE(prepared.mapping.demand_column == "stock_level");
		REQUIRE(prepared.series.getValues() == std::vector<double>{50.0, 48.0, 45.0});
	}
}

TEST_CASE("Explicit frequency overrides inference", "[data][preparer]") {
	Table table;
	table.addColumn("date", texts(tests::helpers::isoDates(14)));
	table.addColumn("sales", std::vector<Cell>(14, Cell{1.0}));

	PrepareOptions options;
	options.frequency = Frequency::Weekly;
	const auto prepared = SeriesPreparer(options).prepare(table);
	REQUIRE(prepared.series.frequency() == Frequency::Weekly);
	REQUIRE(prepared.series.size() == 2);
	REQUIRE(prepared.report.duplicate_dates == 12);
}
