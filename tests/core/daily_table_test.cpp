#include <catch2/catch.hpp>

#include "finsight/core/daily_table.hpp"
#include "common/transaction_helpers.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using finsight::core::DailyTable;
using tests::helpers::day;

namespace {

DailyTable fiveDays() {
	DailyTable table({day(0), day(1), day(2), day(3), day(4)});
	table.setColumn("a", {1, 2, 3, 4, 5});
	table.setColumn("b", {5, 4, 3, 2, 1});
	return table;
}

} // namespace

TEST_CASE("DailyTable keeps columns aligned with its date axis", "[core][table]") {
	auto table = fiveDays();
	REQUIRE(table.rows() == 5);
	REQUIRE(table.hasColumn("a"));
	REQUIRE_FALSE(table.hasColumn("c"));
	REQUIRE(table.at(2, "b") == 3.0);
	REQUIRE(table.columnNames() == std::vector<std::string>{"a", "b"});
	REQUIRE(table.isContiguous());
	REQUIRE(table.rowOf(day(3)) == 3);
	REQUIRE(table.rowOf(day(10)) == table.rows());

	table.setColumn("a", {0, 0, 0, 0, 0});
	REQUIRE(table.columnNames().size() == 2);
	REQUIRE(table.at(4, "a") == 0.0);
}

TEST_CASE("DailyTable validates shape", "[core][table][validation]") {
	auto table = fiveDays();
	REQUIRE_THROWS_AS(table.setColumn("c", {1, 2}), std::invalid_argument);
	REQUIRE_THROWS_AS(table.column("missing"), std::out_of_range);
	REQUIRE_THROWS_AS(table.at(9, "a"), std::out_of_range);
	REQUIRE_THROWS_AS(DailyTable({day(1), day(0)}), std::invalid_argument);
	REQUIRE_THROWS_AS(DailyTable().lastDate(), std::out_of_range);
}

TEST_CASE("DailyTable slicing keeps every column", "[core][table]") {
	const auto table = fiveDays();
	const auto head = table.head(2);
	const auto tail = table.tail(2);
	REQUIRE(head.rows() == 2);
	REQUIRE(head.lastDate() == day(1));
	REQUIRE(tail.firstDate() == day(3));
	REQUIRE(tail.column("b") == std::vector<double>{2, 1});
	REQUIRE(table.tail(99).rows() == 5);
	REQUIRE(table.slice(4, 2).empty());
}

TEST_CASE("DailyTable detects gaps and non-finite cells", "[core][table]") {
	DailyTable gappy({day(0), day(2)});
	REQUIRE_FALSE(gappy.isContiguous());

	auto table = fiveDays();
	REQUIRE(table.allFinite());
	table.column("a")[1] = std::numeric_limits<double>::infinity();
	REQUIRE_FALSE(table.allFinite());
}
