#include <catch2/catch.hpp>

#include "finsight/models/rolling_state.hpp"

#include <cmath>
#include <stdexcept>

using finsight::models::RollingState;

TEST_CASE("RollingState keeps a bounded history", "[models][rolling_state]") {
	RollingState state({"total", "Food"}, 3);
	for (double v : {1.0, 2.0, 3.0, 4.0}) {
		state.pushRow({v, 10.0 * v});
	}

	REQUIRE(state.size(0) == 3);
	REQUIRE(state.last(0) == 4.0);
	REQUIRE(state.lag(0, 3) == 2.0);
	REQUIRE(state.lag(0, 4) == 0.0);
	REQUIRE(state.lag(1, 1) == 40.0);
	REQUIRE(state.mean(0) == Catch::Detail::Approx(3.0));
	REQUIRE(state.trailingMean(0, 2) == Catch::Detail::Approx(3.5));
	REQUIRE(state.trailingStd(0, 3) == Catch::Detail::Approx(1.0));
	REQUIRE(state.trailingMax(1, 10) == Catch::Detail::Approx(40.0));
	REQUIRE(state.trailingSum(1, 2) == Catch::Detail::Approx(70.0));
	REQUIRE(state.columnIndex("Food") == 1);
}

TEST_CASE("RollingState on an empty history", "[models][rolling_state]") {
	RollingState state({"total"});
	REQUIRE(state.capacity() == 30);
	REQUIRE(state.last(0) == 0.0);
	REQUIRE(state.trailingMean(0, 7) == 0.0);
	REQUIRE(state.trailingStd(0, 7) == 0.0);
	REQUIRE(state.trailingMax(0, 7) == 0.0);

	state.push(0, 5.0);
	REQUIRE(state.trailingStd(0, 7) == 0.0);
	REQUIRE(state.last(0) == 5.0);
}

TEST_CASE("RollingState validates its inputs", "[models][rolling_state][validation]") {
	REQUIRE_THROWS_AS(RollingState({}, 3), std::invalid_argument);
	REQUIRE_THROWS_AS(RollingState({"a", "a"}, 3), std::invalid_argument);
	REQUIRE_THROWS_AS(RollingState({"a"}, 0), std::invalid_argument);

	RollingState state({"a", "b"}, 3);
	REQUIRE_THROWS_AS(state.pushRow({1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(state.columnIndex("c"), std::out_of_range);
}
