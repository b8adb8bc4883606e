#include "finsight/core/transaction.hpp"
#include "finsight/service/analytics_service.hpp"
#include "finsight/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace finsight;

namespace {

// Four months of a household ledger: daily meals, weekday commuting, weekly
// groceries, a monthly utility bill and occasional shopping.
core::Transactions sampleLedger(std::size_t days) {
	std::mt19937 rng(11);
	std::normal_distribution<double> meal(180.0, 40.0);
	std::uniform_real_distribution<double> chance(0.0, 1.0);

	core::Transactions ledger;
	const auto start = core::Date::fromYmd(2024, 1, 1);
	for (std::size_t i = 0; i < days; ++i) {
		const auto date = start.addDays(static_cast<std::int64_t>(i));
		ledger.push_back({date, std::max(40.0, meal(rng)), "Food", "lunch", core::TransactionType::Expense});
		if (date.dayOfWeek() < 5) {
			ledger.push_back({date, 60.0, "Transport", "metro", core::TransactionType::Expense});
		}
		if (date.dayOfWeek() == 5) {
			ledger.push_back({date, 900.0, "Food", "groceries", core::TransactionType::Expense});
		}
		if (date.day() == 5) {
			ledger.push_back({date, 1800.0, "Bills", "electricity", core::TransactionType::Expense});
			ledger.push_back({date, 42000.0, "Salary", "payroll", core::TransactionType::Income});
		}
		if (chance(rng) < 0.12) {
			ledger.push_back({date, 400.0 + 800.0 * chance(rng), "Shopping", "store", core::TransactionType::Expense});
		}
	}
	return ledger;
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printForecast(const core::ForecastResult &result) {
	std::cout << "Model: " << result.model << "  status: " << core::toString(result.status)
	          << "  confidence: " << std::setprecision(2) << result.confidence << "\n";
	for (const auto &point : result.points) {
		const auto label = point.timeframe == core::Timeframe::Weekly
		                       ? point.week_start.toString() + " .. " + point.week_end.toString()
		                       : point.date.toString();
		std::cout << "  " << std::setw(24) << std::left << label << std::right << std::fixed << std::setprecision(0)
		          << std::setw(8) << point.predicted << "  [" << point.lower << ", " << point.upper << "]\n";
	}
	for (const auto &driver : result.drivers) {
		std::cout << "  driver: " << driver << "\n";
	}
	if (result.backtest) {
		std::cout << "  backtest MAE: " << result.backtest->mae << ", bias " << result.backtest->bias << " ("
		          << result.backtest->over_days << " over, " << result.backtest->under_days << " under)\n";
	}
}

void printBudget(const budget::BudgetResult &result) {
	std::cout << budget::toString(result.period) << " budget " << result.month << "  status: "
	          << core::toString(result.status) << "  total: " << std::fixed << std::setprecision(0) << result.total
	          << "\n";
	for (const auto &entry : result.entries) {
		if (entry.amount <= 0.0) {
			continue;
		}
		std::cout << "  " << std::setw(14) << std::left << entry.category << std::right << std::setw(8)
		          << entry.amount << "  (" << entry.activity_level << (entry.adjusted ? ", cut" : "") << ")\n";
	}
	if (result.savings) {
		std::cout << "  savings: " << result.savings->achieved << " of " << result.savings->goal
		          << (result.savings->successful ? " (met)" : " (not met)") << "\n";
	}
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	service::ServiceConfig config;
	config.predictor.forest.n_trees = 60;
	service::AnalyticsService analytics(config);

	const auto ledger = sampleLedger(120);
	const std::string user = "demo";

	printHeader("Patterns");
	const auto found = analytics.detectPatterns(user, ledger);
	for (const auto &insight : found.insights) {
		std::cout << "  * " << insight << "\n";
	}
	for (const auto &recurrence : found.recurrences) {
		std::cout << "  " << recurrence.category << " repeats " << recurrence.pattern << " (period "
		          << recurrence.period << ", next " << recurrence.next_expected.toString() << ")\n";
	}

	printHeader("Daily forecast");
	printForecast(analytics.forecast(user, ledger, core::ForecastRequest{7, core::Timeframe::Daily}));

	printHeader("Weekly forecast");
	printForecast(analytics.forecast(user, ledger, core::ForecastRequest{2, core::Timeframe::Weekly}));

	printHeader("Monthly budget");
	printBudget(analytics.recommendBudget(user, ledger));

	printHeader("Weekly budget with a 500 savings goal");
	service::BudgetOptions weekly;
	weekly.period = budget::BudgetPeriod::Weekly;
	weekly.savings_goal = 500.0;
	printBudget(analytics.recommendBudget(user, ledger, weekly));

	printHeader("Overspending");
	const auto check = analytics.overspending(user, ledger, 30000.0);
	std::cout << "  " << (check.overspending ? "OVER: " : "ok: ") << check.message << "\n";

	const auto stats = analytics.stats();
	std::cout << "\ncache hits " << stats.cache_hits << ", misses " << stats.cache_misses << ", trainings "
	          << stats.trainings << ", fallbacks " << stats.fallbacks << "\n";
	return 0;
}
