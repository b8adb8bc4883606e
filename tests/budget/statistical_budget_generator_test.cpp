#include <catch2/catch.hpp>

#include "common/transaction_helpers.hpp"
#include "finsight/budget/statistical_budget_generator.hpp"

#include <string>
#include <variant>

using namespace finsight;
using namespace tests::helpers;

namespace {

// 60 days from 2024-01-01: Food every day, Entertainment every other day.
core::DailyTable householdTable() {
	std::vector<double> entertainment(60, 0.0);
	for (std::size_t i = 0; i < entertainment.size(); i += 2) {
		entertainment[i] = 200.0;
	}
	return categoryTable({{"Food", repeated(60, 100.0)}, {"Entertainment", entertainment}});
}

} // namespace

TEST_CASE("StatisticalBudgetGenerator per-category statistics", "[budget][statistical]") {
	const auto s = budget::StatisticalBudgetGenerator::categoryStats({0.0, 10.0, 20.0, 30.0});
	REQUIRE(s.mean == Catch::Detail::Approx(15.0));
	REQUIRE(s.active_days == 3);
	REQUIRE(s.activity_rate == Catch::Detail::Approx(0.75));
	REQUIRE(s.min_active == Catch::Detail::Approx(10.0));
	REQUIRE(s.p75 == Catch::Detail::Approx(22.5));
	REQUIRE(s.total == Catch::Detail::Approx(60.0));

	std::vector<double> series = repeated(14, 10.0);
	const auto higher = repeated(14, 20.0);
	series.insert(series.end(), higher.begin(), higher.end());
	REQUIRE(budget::StatisticalBudgetGenerator::recentTrend(series) == Catch::Detail::Approx(1.0));
	REQUIRE(budget::StatisticalBudgetGenerator::recentTrend(repeated(10, 5.0)) == 0.0);
	REQUIRE(budget::StatisticalBudgetGenerator::recentTrend(repeated(30, 0.0)) == 0.0);

	REQUIRE(budget::StatisticalBudgetGenerator::activityLevel(0.05) == "inactive");
	REQUIRE(budget::StatisticalBudgetGenerator::activityLevel(0.2) == "occasional");
	REQUIRE(budget::StatisticalBudgetGenerator::activityLevel(0.3) == "regular");
}

TEST_CASE("StatisticalBudgetGenerator builds a monthly budget", "[budget][statistical]") {
	budget::StatisticalBudgetGenerator generator;
	const auto table = householdTable();
	const auto result = generator.generate({table});

	REQUIRE(result.status == core::Status::Ok);
	REQUIRE(result.period == budget::BudgetPeriod::Monthly);
	REQUIRE(result.month == "2024-02");
	REQUIRE(result.confidence == Catch::Detail::Approx(0.85));
	REQUIRE(result.entries.size() == core::kCategoryCount);
	REQUIRE(std::get<std::string>(result.methodology.at("approach")) == "Adaptive statistical budgeting");

	const auto *food = result.find("Food");
	REQUIRE(food != nullptr);
	REQUIRE(food->amount == Catch::Detail::Approx(3000.0));
	REQUIRE(food->activity_level == "regular");
	REQUIRE(food->confidence == Catch::Detail::Approx(0.95));

	const auto *travel = result.find("Travel");
	REQUIRE(travel->amount == 0.0);
	REQUIRE(travel->activity_level == "inactive");
	REQUIRE(travel->confidence == Catch::Detail::Approx(0.9));

	double total = 0.0;
	for (std::size_t i = 0; i < result.entries.size(); ++i) {
		const auto &entry = result.entries[i];
		REQUIRE(entry.amount >= entry.floor);
		if (i > 0) {
			REQUIRE(result.entries[i - 1].amount >= entry.amount);
		}
		total += entry.amount;
	}
	REQUIRE(result.total == Catch::Detail::Approx(total));

	const auto targeted = generator.generate({table, nullptr, core::Date::fromYmd(2024, 4, 15)});
	REQUIRE(targeted.month == "2024-04");
}

TEST_CASE("StatisticalBudgetGenerator keeps idle categories at their floor", "[budget][statistical]") {
	budget::StatisticalBudgetGenerator generator;
	const auto result = generator.generate({householdTable()});
	for (const std::string category : {"Home", "Transport", "Bills", "Beauty"}) {
		const auto *entry = result.find(category);
		REQUIRE(entry->activity_level == "inactive");
		REQUIRE(entry->amount <= entry->floor);
		REQUIRE(entry->amount == Catch::Detail::Approx(generator.policy().floor(category)));
	}
}

TEST_CASE("StatisticalBudgetGenerator raises amounts with their floors", "[budget][statistical]") {
	const auto table = householdTable();
	double previous = 0.0;
	for (double floor : {0.0, 1000.0, 3000.0, 5000.0}) {
		auto policy = budget::CategoryPolicy::defaults();
		policy.floors["Food"] = floor;
		const auto result = budget::StatisticalBudgetGenerator(policy).generate({table});
		const double amount = result.find("Food")->amount;
		REQUIRE(amount >= floor);
		REQUIRE(amount >= previous);
		previous = amount;
	}
	REQUIRE(previous == Catch::Detail::Approx(5000.0));
}

TEST_CASE("StatisticalBudgetGenerator pattern adjustments", "[budget][statistical][patterns]") {
	patterns::PatternResult found;
	found.recurrences.push_back({"Food", "weekly", 7, 0.8, 1.0, day(70)});
	found.recurrences.push_back({"Shopping", "weekly", 7, 0.65, 1.0, day(70)});
	found.volatility["Food"] = 0.6;
	found.volatility["total"] = 0.2;
	patterns::Spike recent;
	recent.recent = true;
	found.spikes.push_back(recent);
	patterns::Spike old;
	old.categories = {"Travel"};
	found.spikes.push_back(old);

	const auto adjustments = budget::StatisticalBudgetGenerator::patternAdjustments(found);
	REQUIRE(adjustments.at("Food") == Catch::Detail::Approx(1.1 * 1.15));
	REQUIRE(adjustments.at("Total") == Catch::Detail::Approx(1.2));
	REQUIRE(adjustments.count("Shopping") == 0);
	REQUIRE(adjustments.count("Travel") == 0);

	patterns::PatternResult recurring;
	recurring.recurrences.push_back({"Food", "weekly", 7, 0.9, 1.0, day(70)});
	budget::StatisticalBudgetGenerator generator;
	const auto result = generator.generate({householdTable(), &recurring});
	REQUIRE(result.find("Food")->amount == Catch::Detail::Approx(3300.0));
	REQUIRE(result.find("Food")->adjustment_factor == Catch::Detail::Approx(1.1));
}

TEST_CASE("StatisticalBudgetGenerator savings goal", "[budget][statistical][savings]") {
	budget::StatisticalBudgetGenerator generator;
	const auto table = householdTable();
	const auto plain = generator.generate({table});
	const auto result = generator.generate({table, nullptr, std::nullopt, 500.0});

	REQUIRE(result.savings.has_value());
	REQUIRE(result.savings->goal == Catch::Detail::Approx(500.0));
	// Entertainment gives up 500 x 1.4 / 2, then Food 150 x 0.6 / 2.
	REQUIRE(result.savings->achieved == Catch::Detail::Approx(395.0));
	REQUIRE_FALSE(result.savings->successful);
	REQUIRE(result.find("Entertainment")->adjusted);
	REQUIRE(result.find("Entertainment")->amount == Catch::Detail::Approx(plain.find("Entertainment")->amount - 350.0));
	REQUIRE(result.find("Food")->amount == Catch::Detail::Approx(2955.0));
	REQUIRE_FALSE(result.find("Bills")->adjusted);
	REQUIRE(std::get<double>(result.methodology.at("savings_goal")) == Catch::Detail::Approx(500.0));
	REQUIRE(result.total == Catch::Detail::Approx(plain.total - 395.0));
}

TEST_CASE("StatisticalBudgetGenerator default template", "[budget][statistical]") {
	budget::StatisticalBudgetGenerator generator;
	const core::DailyTable empty{};
	const auto result = generator.generate({empty, nullptr, core::Date::fromYmd(2024, 5, 1)});
	REQUIRE(result.status == core::Status::Default);
	REQUIRE(result.month == "2024-05");
	REQUIRE(result.total == Catch::Detail::Approx(15100.0));
	REQUIRE(result.find("Food")->amount == Catch::Detail::Approx(5000.0));
	REQUIRE(result.find("Food")->activity_level == "default");
}
