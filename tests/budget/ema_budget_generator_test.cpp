#include <catch2/catch.hpp>

#include "common/transaction_helpers.hpp"
#include "finsight/budget/ema_budget_generator.hpp"

#include <stdexcept>
#include <string>
#include <variant>

using namespace finsight;
using namespace tests::helpers;

TEST_CASE("EmaBudgetGenerator weekly plan for a steady spender", "[budget][ema][weekly]") {
	budget::EmaBudgetGenerator generator;
	// Eight full Monday-Sunday weeks.
	const auto result = generator.weekly(categoryTable({{"Food", repeated(56, 150.0)}}));

	REQUIRE(result.period == budget::BudgetPeriod::Weekly);
	REQUIRE(result.status == core::Status::Ok);
	REQUIRE(result.confidence == Catch::Detail::Approx(0.7));
	REQUIRE(std::get<double>(result.methodology.at("weeks_analyzed")) == Catch::Detail::Approx(8.0));

	const auto *food = result.find("Food");
	REQUIRE(food->amount == Catch::Detail::Approx(1050.0));
	REQUIRE(food->activity_level == "regular");
	REQUIRE(food->details->ema == Catch::Detail::Approx(1050.0));
	REQUIRE(food->details->median_active == Catch::Detail::Approx(1050.0));
	REQUIRE(food->details->days_since_last == 0);
	REQUIRE_FALSE(food->details->hazard);

	const auto *transport = result.find("Transport");
	REQUIRE(transport->amount == Catch::Detail::Approx(200.0));
	REQUIRE(transport->activity_level == "inactive");
	REQUIRE_FALSE(transport->details->days_since_last.has_value());
	REQUIRE(result.find("Home")->amount == Catch::Detail::Approx(100.0));
	REQUIRE(result.total == Catch::Detail::Approx(1350.0));
}

TEST_CASE("EmaBudgetGenerator boosts categories due to recur", "[budget][ema][weekly]") {
	budget::EmaBudgetGenerator generator;
	// Shopping every Monday; the table ends six days after the last purchase.
	const auto result = generator.weekly(
	    categoryTable({{"Food", repeated(56, 150.0)}, {"Shopping", everyNth(56, 7, 300.0)}}));

	const auto *shopping = result.find("Shopping");
	REQUIRE(shopping->details->days_since_last == 6);
	REQUIRE(shopping->details->hazard);
	REQUIRE(shopping->activity_level == "inactive");
	REQUIRE(shopping->adjustment_factor == Catch::Detail::Approx(0.25 * 1.2));
	REQUIRE(shopping->amount == Catch::Detail::Approx(90.0));
}

TEST_CASE("EmaBudgetGenerator remembers a recent spike", "[budget][ema][weekly]") {
	auto entertainment = everyNth(56, 7, 100.0);
	entertainment[55] = 400.0;
	budget::EmaBudgetGenerator generator;
	const auto result =
	    generator.weekly(categoryTable({{"Food", repeated(56, 150.0)}, {"Entertainment", entertainment}}));

	const auto *entry = result.find("Entertainment");
	REQUIRE(entry->details->spike_memory);
	REQUIRE(entry->details->median_active == Catch::Detail::Approx(100.0));
	REQUIRE_FALSE(result.find("Food")->details->spike_memory);
	// The IQR fence caps the boosted blend.
	REQUIRE(entry->amount <= entry->details->median_active + 1.75 * entry->details->iqr + 1e-9);
}

TEST_CASE("EmaBudgetGenerator blend weight is separate from the smoothing factor", "[budget][ema][weekly]") {
	// Weekly Shopping sums 0, 0, 0, 0, 0, 0, 400, 400: EMA(0.6) = 336, median of active weeks = 400.
	std::vector<double> shopping(56, 0.0);
	shopping[42] = 400.0;
	shopping[49] = 400.0;
	const auto table = categoryTable({{"Food", repeated(56, 150.0)}, {"Shopping", shopping}});

	budget::EmaBudgetConfig median_only;
	median_only.blend_weight = 0.0;
	budget::EmaBudgetConfig ema_only;
	ema_only.blend_weight = 1.0;
	const auto by_median = budget::EmaBudgetGenerator(median_only, budget::CategoryPolicy::defaults()).weekly(table);
	const auto by_ema = budget::EmaBudgetGenerator(ema_only, budget::CategoryPolicy::defaults()).weekly(table);

	const auto *median_entry = by_median.find("Shopping");
	const auto *ema_entry = by_ema.find("Shopping");
	REQUIRE(median_entry->details->ema == Catch::Detail::Approx(336.0));
	REQUIRE(ema_entry->details->ema == Catch::Detail::Approx(336.0));
	REQUIRE(median_entry->details->median_active == Catch::Detail::Approx(400.0));
	REQUIRE(median_entry->adjustment_factor == Catch::Detail::Approx(ema_entry->adjustment_factor));
	REQUIRE(median_entry->amount == Catch::Detail::Approx(400.0 * median_entry->adjustment_factor));
	REQUIRE(ema_entry->amount == Catch::Detail::Approx(336.0 * ema_entry->adjustment_factor));
	REQUIRE(std::get<double>(by_ema.methodology.at("ema_weight")) == Catch::Detail::Approx(1.0));
	REQUIRE(std::get<double>(by_ema.methodology.at("ema_alpha")) == Catch::Detail::Approx(0.6));
}

TEST_CASE("EmaBudgetGenerator weekly savings respect essentials", "[budget][ema][savings]") {
	budget::EmaBudgetGenerator generator;
	const auto table = categoryTable({{"Food", repeated(56, 150.0)}});

	const auto met = generator.weekly(table, 100.0);
	REQUIRE(met.savings->successful);
	REQUIRE(met.savings->achieved == Catch::Detail::Approx(100.0));
	REQUIRE(met.find("Food")->amount == Catch::Detail::Approx(950.0));
	REQUIRE(met.find("Food")->adjusted);
	REQUIRE(std::get<double>(met.methodology.at("savings_goal")) == Catch::Detail::Approx(100.0));

	const auto missed = generator.weekly(table, 1000.0);
	REQUIRE_FALSE(missed.savings->successful);
	REQUIRE(missed.savings->achieved == Catch::Detail::Approx(250.0));
	for (const auto &entry : missed.entries) {
		REQUIRE(entry.amount >= entry.floor);
	}
	REQUIRE(missed.find("Food")->amount == Catch::Detail::Approx(800.0));
}

TEST_CASE("EmaBudgetGenerator monthly plan", "[budget][ema][monthly]") {
	// 2024-01-01 .. 2024-03-31.
	std::vector<double> shopping(91, 0.0);
	shopping[9] = 1000.0;
	shopping[40] = 1000.0;
	shopping[69] = 3000.0;
	const auto table = categoryTable({{"Food", repeated(91, 100.0)}, {"Shopping", shopping}});

	budget::EmaBudgetGenerator generator;
	const auto result = generator.monthly(table);
	REQUIRE(result.period == budget::BudgetPeriod::Monthly);
	REQUIRE(result.month == "2024-03");
	REQUIRE(std::get<std::string>(result.methodology.at("approach")) == "EMA-Median blend with activity adjustment");
	REQUIRE(std::get<double>(result.methodology.at("months_analyzed")) == Catch::Detail::Approx(3.0));

	// Food blends to 3526, is lifted to the 800 x 4.3 essential and then capped at 1.08 x 3100.
	const auto *food = result.find("Food");
	REQUIRE(food->activity_level == "active");
	REQUIRE(food->floor == Catch::Detail::Approx(3440.0));
	REQUIRE(food->amount == Catch::Detail::Approx(3348.0));
	REQUIRE(food->amount < food->floor);

	const auto *entry = result.find("Shopping");
	REQUIRE(entry->activity_level == "inactive");
	REQUIRE(entry->details->ema == Catch::Detail::Approx(1800.0));
	REQUIRE(entry->details->median_active == Catch::Detail::Approx(1000.0));
	REQUIRE(entry->amount == Catch::Detail::Approx(546.0));

	// No Transport spending in the window caps its essential at zero.
	REQUIRE(result.find("Transport")->floor == Catch::Detail::Approx(860.0));
	REQUIRE(result.find("Transport")->amount == Catch::Detail::Approx(0.0));
	REQUIRE(generator.monthly(table, std::nullopt, core::Date::fromYmd(2024, 4, 1)).month == "2024-04");

	const auto saved = generator.monthly(table, 300.0);
	REQUIRE(saved.savings->successful);
	REQUIRE(saved.total == Catch::Detail::Approx(result.total - 300.0).margin(0.02));
	REQUIRE(saved.find("Food")->amount == Catch::Detail::Approx(3348.0));
	REQUIRE_FALSE(saved.find("Food")->adjusted);
}

TEST_CASE("EmaBudgetGenerator scales the weekly plan for one month of history", "[budget][ema][monthly]") {
	budget::EmaBudgetGenerator generator;
	const auto table = categoryTable({{"Food", repeated(21, 150.0)}});
	const auto weekly = generator.weekly(table);
	const auto monthly = generator.monthly(table);

	REQUIRE(monthly.period == budget::BudgetPeriod::Monthly);
	REQUIRE(monthly.month == "2024-01");
	REQUIRE(std::get<double>(monthly.methodology.at("weeks_per_month")) == Catch::Detail::Approx(4.3));
	REQUIRE(monthly.find("Food")->amount == Catch::Detail::Approx(weekly.find("Food")->amount * 4.3));
	REQUIRE(monthly.find("Food")->floor == Catch::Detail::Approx(800.0 * 4.3));
}

TEST_CASE("EmaBudgetGenerator templates and dispatch", "[budget][ema]") {
	budget::EmaBudgetGenerator generator;
	const core::DailyTable empty{};

	const auto weekly = generator.generate({empty, nullptr, std::nullopt, std::nullopt, budget::BudgetPeriod::Weekly});
	REQUIRE(weekly.status == core::Status::Default);
	REQUIRE(weekly.period == budget::BudgetPeriod::Weekly);
	REQUIRE(weekly.total == Catch::Detail::Approx(2600.0));
	REQUIRE(weekly.confidence == Catch::Detail::Approx(0.3));

	const auto monthly = generator.generate({empty, nullptr, core::Date::fromYmd(2024, 6, 1)});
	REQUIRE(monthly.status == core::Status::Default);
	REQUIRE(monthly.month == "2024-06");
	REQUIRE(monthly.total == Catch::Detail::Approx(2600.0 * 4.3));

	budget::EmaBudgetConfig config;
	config.alpha = 0.0;
	REQUIRE_THROWS_AS(budget::EmaBudgetGenerator(config, budget::CategoryPolicy::defaults()), std::invalid_argument);
	config = {};
	config.blend_weight = 1.5;
	REQUIRE_THROWS_AS(budget::EmaBudgetGenerator(config, budget::CategoryPolicy::defaults()), std::invalid_argument);
	config = {};
	config.lookback_weeks = 0;
	REQUIRE_THROWS_AS(budget::EmaBudgetGenerator(config, budget::CategoryPolicy::defaults()), std::invalid_argument);
}
