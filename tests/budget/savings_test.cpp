#include <catch2/catch.hpp>

#include "finsight/budget/savings.hpp"

#include <numeric>
#include <stdexcept>
#include <vector>

using finsight::budget::redistributeSavings;

TEST_CASE("Savings are shared by elasticity-weighted headroom", "[budget][savings]") {
	const std::vector<double> amounts{1000.0, 500.0, 300.0};
	const std::vector<double> floors{800.0, 0.0, 300.0};
	const std::vector<double> elasticities{0.6, 1.5, 1.0};

	const auto allocation = redistributeSavings(amounts, floors, elasticities, 100.0);
	REQUIRE(allocation.successful);
	REQUIRE(allocation.achieved == Catch::Detail::Approx(100.0));
	REQUIRE(allocation.amounts[0] == Catch::Detail::Approx(1000.0 - 100.0 * 120.0 / 870.0));
	REQUIRE(allocation.amounts[1] == Catch::Detail::Approx(500.0 - 100.0 * 750.0 / 870.0));
	REQUIRE(allocation.amounts[2] == Catch::Detail::Approx(300.0));
}

TEST_CASE("Savings never cut below a floor", "[budget][savings]") {
	const std::vector<double> amounts{1000.0, 500.0, 300.0, 250.0};
	const std::vector<double> floors{800.0, 0.0, 300.0, 100.0};
	const std::vector<double> elasticities{0.6, 1.5, 1.0, 0.2};

	for (double goal : {10.0, 200.0, 600.0, 850.0, 5000.0}) {
		const auto allocation = redistributeSavings(amounts, floors, elasticities, goal);
		for (std::size_t i = 0; i < amounts.size(); ++i) {
			REQUIRE(allocation.amounts[i] >= floors[i]);
			REQUIRE(allocation.amounts[i] <= amounts[i]);
		}
		const double cut = std::accumulate(amounts.begin(), amounts.end(), 0.0) -
		                   std::accumulate(allocation.amounts.begin(), allocation.amounts.end(), 0.0);
		REQUIRE(cut == Catch::Detail::Approx(std::min(goal, 850.0)));
		REQUIRE(allocation.achieved == Catch::Detail::Approx(cut));
	}

	const auto exhausted = redistributeSavings(amounts, floors, elasticities, 5000.0);
	REQUIRE_FALSE(exhausted.successful);
	REQUIRE(exhausted.amounts == floors);
}

TEST_CASE("Savings skip inelastic categories", "[budget][savings]") {
	const auto allocation = redistributeSavings({2000.0, 400.0}, {0.0, 0.0}, {0.0, 1.0}, 1000.0);
	REQUIRE(allocation.amounts[0] == Catch::Detail::Approx(2000.0));
	REQUIRE(allocation.amounts[1] == Catch::Detail::Approx(0.0));
	REQUIRE(allocation.achieved == Catch::Detail::Approx(400.0));
	REQUIRE_FALSE(allocation.successful);
}

TEST_CASE("Savings edge cases", "[budget][savings]") {
	const auto none = redistributeSavings({100.0}, {0.0}, {1.0}, 0.0);
	REQUIRE(none.successful);
	REQUIRE(none.amounts[0] == 100.0);

	REQUIRE_THROWS_AS(redistributeSavings({1.0, 2.0}, {0.0}, {1.0, 1.0}, 5.0), std::invalid_argument);
}
