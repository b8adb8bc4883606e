#include <catch2/catch.hpp>

#include "finsight/core/transaction.hpp"

#include <stdexcept>

using namespace finsight::core;

TEST_CASE("Category set is fixed and ordered", "[core][transaction]") {
	REQUIRE(categories().size() == 13);
	REQUIRE(categories().front() == "Food");
	REQUIRE(categories().back() == "Travel");
	REQUIRE(categoryIndex("Bills") == 11);
	REQUIRE(isKnownCategory("Transport"));
	REQUIRE_FALSE(isKnownCategory("food"));
	REQUIRE_THROWS_AS(categoryIndex("Groceries"), std::out_of_range);
}

TEST_CASE("Unknown categories map to Other", "[core][transaction]") {
	REQUIRE(normalizeCategory("Shopping") == "Shopping");
	REQUIRE(normalizeCategory("Groceries") == "Other");
	REQUIRE(normalizeCategory("") == "Other");
}

TEST_CASE("Transaction types parse case-insensitively", "[core][transaction]") {
	REQUIRE(parseTransactionType("EXPENSE") == TransactionType::Expense);
	REQUIRE(parseTransactionType("income") == TransactionType::Income);
	REQUIRE(toString(TransactionType::Income) == "income");
	REQUIRE_THROWS_AS(parseTransactionType("refund"), std::invalid_argument);
}
