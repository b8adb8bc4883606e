#include "finsight/budget/ibudget_generator.hpp"

#include <algorithm>
#include <cmath>

namespace finsight::budget {

std::string toString(BudgetPeriod period) {
	return period == BudgetPeriod::Weekly ? "weekly" : "monthly";
}

double historyConfidence(std::size_t days) {
	if (days < 30) {
		return 0.5;
	}
	if (days < 60) {
		return 0.7;
	}
	if (days < 90) {
		return 0.85;
	}
	return 0.95;
}

void finalizeEntries(BudgetResult &result) {
	std::stable_sort(result.entries.begin(), result.entries.end(),
	                 [](const BudgetEntry &a, const BudgetEntry &b) { return a.amount > b.amount; });
	result.total = 0.0;
	for (const auto &entry : result.entries) {
		result.total += entry.amount;
	}
}

std::vector<double> categorySeries(const core::DailyTable &table, const std::string &category) {
	if (!table.hasColumn(category)) {
		return std::vector<double>(table.rows(), 0.0);
	}
	return table.column(category);
}

double roundCents(double value) {
	return std::round(value * 100.0) / 100.0;
}

} // namespace finsight::budget
