#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stockcast/data/column_detector.hpp"
#include "common/time_series_helpers.hpp"

using stockcast::data::Cell;
using stockcast::data::ColumnDetector;
using stockcast::data::Table;

namespace {

std::vector<Cell> numbers(std::initializer_list<double> values) {
	return std::vector<Cell>(values.begin(), values.end());
}

std::vector<Cell> texts(const std::vector<std::string> &values) {
	return std::vector<Cell>(values.begin(), values.end());
}

} // namespace

TEST_CASE("Columns are matched by name keywords", "[data][column_detector]") {
	Table table;
	table.addColumn("Order Date", texts(tests::helpers::isoDates(4)));
	table.addColumn("Units Sold", numbers({1.0, 2.0, 3.0, 4.0}));
	table.addColumn("Stock On Hand", numbers({40.0, 38.0, 35.0, 31.0}));

	const ColumnDetector detector;
	REQUIRE(detector.detectDateColumn(table) == std::optional<std::string>("Order Date"));
	REQUIRE(detector.detectDemandColumn(table, {"Order Date"}) == std::optional<std::string>("Units Sold"));
	REQUIRE(detector.detectInventoryColumn(table, {"Order Date", "Units Sold"}) ==
	        std::optional<std::string>("Stock On Hand"));
}

TEST_CASE("Keyword order decides between matching columns", "[data][column_detector]") {
	Table table;
	table.addColumn("date", texts(tests::helpers::isoDates(3)));
	table.addColumn("quantity", numbers({5.0, 6.0, 7.0}));
	table.addColumn("sales", numbers({1.0, 2.0, 3.0}));

	const ColumnDetector detector;
	REQUIRE(detector.detectDemandColumn(table, {"date"}) == std::optional<std::string>("sales"));
}

TEST_CASE("A keyword column with non-date content is skipped", "[data][column_detector]") {
	Table table;
	table.addColumn("update_time", texts({"fast", "slow", "fast"}));
	table.addColumn("when", texts(tests::helpers::isoDates(3)));
	table.addColumn("amount", numbers({1.0, 2.0, 3.0}));

	const ColumnDetector detector;
	REQUIRE(detector.detectDateColumn(table) == std::optional<std::string>("when"));
}

TEST_CASE("Columns fall back to content detection", "[data][column_detector]") {
	Table table;
	table.addColumn("id", numbers({1.0, 2.0, 3.0, 4.0}));
	table.addColumn("when", texts(tests::helpers::isoDates(4)));
	table.addColumn("delta", numbers({-1.0, 2.0, -3.0, 4.0}));
	table.addColumn("amount", numbers({10.0, 12.0, 9.0, 11.0}));

	const ColumnDetector detector;
	REQUIRE(detector.detectDateColumn(table) == std::optional<std::string>("when"));

	SECTION("non-negative numeric columns are preferred") {
		REQUIRE(detector.detectDemandColumn(table, {"when", "id"}) == std::optional<std::string>("amount"));
	}

	SECTION("the first numeric column is used when every candidate has negatives") {
		Table signed_table;
		signed_table.addColumn("when", texts(tests::helpers::isoDates(2)));
		signed_table.addColumn("delta", numbers({-1.0, 2.0}));
		signed_table.addColumn("change", numbers({3.0, -4.0}));
		REQUIRE(detector.detectDemandColumn(signed_table, {"when"}) == std::optional<std::string>("delta"));
	}

	SECTION("no inventory keyword, no inventory column") {
		REQUIRE_FALSE(detector.detectInventoryColumn(table, {"when", "amount"}).has_value());
	}
}

TEST_CASE("Spreadsheet serial columns are detected as dates", "[data][column_detector]") {
	Table table;
	table.addColumn("posting", numbers({44927.0, 44928.0, 44929.0}));
	table.addColumn("qty", numbers({3.0, 4.0, 5.0}));

	const ColumnDetector detector;
	REQUIRE(detector.detectDateColumn(table) == std::optional<std::string>("posting"));
	REQUIRE(detector.detectDemandColumn(table, {"posting"}) == std::optional<std::string>("qty"));
}

TEST_CASE("Sample shares ignore empty cells", "[data][column_detector]") {
	const ColumnDetector detector;
	stockcast::data::Column column{"mixed", {1.0, std::string("x"), std::monostate{}, std::string("3")}};
	REQUIRE(detector.numericShare(column) == Catch::Approx(2.0 / 3.0));
	REQUIRE(detector.dateShare(stockcast::data::Column{"empty", {}}) == 0.0);
}
