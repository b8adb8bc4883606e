#include "finsight/budget/statistical_budget_generator.hpp"

#include "finsight/core/transaction.hpp"
#include "finsight/utils/logging.hpp"
#include "finsight/utils/stats.hpp"

#include <algorithm>
#include <cmath>

namespace finsight::budget {

namespace stats = utils::stats;

namespace {

constexpr double kDaysPerMonth = 30.0;

double roundToTen(double value) {
	return std::round(value / 10.0) * 10.0;
}

} // namespace

StatisticalBudgetGenerator::StatisticalBudgetGenerator(CategoryPolicy policy) : policy_(std::move(policy)) {
}

StatisticalBudgetGenerator::CategoryStats StatisticalBudgetGenerator::categoryStats(const std::vector<double> &series) {
	CategoryStats result;
	result.total_days = series.size();
	if (series.empty()) {
		return result;
	}
	const auto active = stats::positiveValues(series);
	result.mean = stats::mean(series);
	result.median = stats::median(series);
	result.std_dev = stats::sampleStdDev(series);
	result.max = *std::max_element(series.begin(), series.end());
	result.min_active = active.empty() ? 0.0 : *std::min_element(active.begin(), active.end());
	result.p75 = stats::quantile(series, 0.75);
	result.p90 = stats::quantile(series, 0.90);
	result.active_days = active.size();
	result.activity_rate = stats::activeRate(series);
	for (double v : series) {
		result.total += v;
	}
	result.recent_trend = recentTrend(series);
	return result;
}

double StatisticalBudgetGenerator::recentTrend(const std::vector<double> &series, std::size_t window) {
	const std::size_t n = series.size();
	if (window == 0 || n < window) {
		return 0.0;
	}
	const std::vector<double> recent(series.end() - static_cast<std::ptrdiff_t>(window), series.end());
	// The previous window is the head of the trailing 2 * window days, so it overlaps the recent one on short series.
	const std::size_t start = n > 2 * window ? n - 2 * window : 0;
	const std::vector<double> previous(series.begin() + static_cast<std::ptrdiff_t>(start),
	                                   series.begin() + static_cast<std::ptrdiff_t>(start + window));
	const double base = stats::mean(previous);
	if (base == 0.0) {
		return 0.0;
	}
	return (stats::mean(recent) - base) / base;
}

std::string StatisticalBudgetGenerator::activityLevel(double activity_rate) {
	if (activity_rate < 0.1) {
		return "inactive";
	}
	if (activity_rate < 0.3) {
		return "occasional";
	}
	return "regular";
}

std::map<std::string, double> StatisticalBudgetGenerator::patternAdjustments(const patterns::PatternResult &patterns) {
	std::map<std::string, double> adjustments;
	for (const auto &recurrence : patterns.recurrences) {
		if (recurrence.confidence > 0.7) {
			adjustments[recurrence.category] = 1.1;
		}
	}
	for (const auto &entry : patterns.volatility) {
		if (entry.second > 0.5) {
			const auto it = adjustments.find(entry.first);
			adjustments[entry.first] = (it == adjustments.end() ? 1.0 : it->second) * 1.15;
		}
	}
	for (const auto &spike : patterns.spikes) {
		if (!spike.recent) {
			continue;
		}
		std::vector<std::string> targets = spike.categories;
		if (targets.empty()) {
			targets.emplace_back("Total");
		}
		for (const auto &category : targets) {
			const auto it = adjustments.find(category);
			adjustments[category] = (it == adjustments.end() ? 1.0 : it->second) * 1.2;
		}
	}
	return adjustments;
}

BudgetEntry StatisticalBudgetGenerator::categoryBudget(const std::string &category, const CategoryStats &s,
                                                       double adjustment) const {
	const std::string level = activityLevel(s.activity_rate);
	const double floor = policy_.floor(category);
	const double elasticity = policy_.elasticity(category);

	double amount = 0.0;
	if (level == "occasional") {
		amount = s.median * kDaysPerMonth;
	} else if (level == "regular") {
		amount = (0.7 * s.mean + 0.3 * s.p75) * kDaysPerMonth;
	}

	if (amount > s.mean * kDaysPerMonth && elasticity > 1.0) {
		amount *= 1.0 - 0.1 * (elasticity - 1.0);
	}
	amount *= adjustment;
	if (s.recent_trend > 0.0) {
		amount *= 1.0 + std::min(s.recent_trend, 0.1);
	}
	if (s.std_dev > s.mean * 0.5) {
		amount += 0.1 * 2.0 * s.std_dev;
	}

	BudgetEntry entry;
	entry.category = category;
	entry.amount = std::max(roundToTen(amount), floor);
	entry.floor = floor;
	entry.elasticity = elasticity;
	entry.activity_level = level;
	entry.adjustment_factor = adjustment;
	if (level == "inactive") {
		entry.confidence = 0.9;
	} else if (level == "occasional") {
		entry.confidence = 0.6;
	} else if (s.mean > 0.0) {
		entry.confidence = std::min(0.95, std::max(0.5, 1.0 - 0.3 * s.std_dev / s.mean));
	} else {
		entry.confidence = 0.7;
	}
	return entry;
}

BudgetResult StatisticalBudgetGenerator::generate(const BudgetRequest &request) const {
	const auto &table = request.table;
	if (table.empty()) {
		FINSIGHT_WARN("No spending history; returning the default budget template.");
		auto result = defaultBudget();
		if (request.target_month) {
			result.month = request.target_month->monthKey();
		}
		return result;
	}

	const auto adjustments =
	    request.patterns ? patternAdjustments(*request.patterns) : std::map<std::string, double>{};

	BudgetResult result;
	result.period = BudgetPeriod::Monthly;
	result.month = (request.target_month ? *request.target_month : table.lastDate()).monthKey();
	result.confidence = historyConfidence(table.rows());

	int regular = 0;
	std::size_t data_points = 0;
	for (const auto &category : core::categories()) {
		if (!table.hasColumn(category)) {
			continue;
		}
		const auto s = categoryStats(table.column(category));
		const auto it = adjustments.find(category);
		auto entry = categoryBudget(category, s, it == adjustments.end() ? 1.0 : it->second);
		regular += entry.activity_level == "regular" ? 1 : 0;
		data_points += s.total_days;
		result.entries.push_back(std::move(entry));
	}
	finalizeEntries(result);

	result.methodology = {
	    {"approach", std::string("Adaptive statistical budgeting")},
	    {"active_categories", static_cast<double>(regular)},
	    {"total_categories", static_cast<double>(result.entries.size())},
	    {"pattern_adjustments", static_cast<double>(adjustments.size())},
	    {"data_points", static_cast<double>(data_points)},
	    {"elasticity_applied", std::string("true")},
	};

	FINSIGHT_DEBUG("Statistical budget for {}: {} categories, total {:.0f}.", result.month, result.entries.size(),
	               result.total);

	if (request.savings_goal && *request.savings_goal > 0.0) {
		return adjustForGoal(result, *request.savings_goal);
	}
	return result;
}

BudgetResult StatisticalBudgetGenerator::defaultBudget() const {
	BudgetResult result;
	result.period = BudgetPeriod::Monthly;
	result.confidence = 0.5;
	result.status = core::Status::Default;
	for (const auto &category : core::categories()) {
		const auto it = policy_.default_monthly.find(category);
		if (it == policy_.default_monthly.end()) {
			continue;
		}
		BudgetEntry entry;
		entry.category = category;
		entry.amount = it->second;
		entry.floor = policy_.floor(category);
		entry.elasticity = policy_.elasticity(category);
		entry.activity_level = "default";
		entry.confidence = 0.5;
		result.entries.push_back(std::move(entry));
	}
	finalizeEntries(result);
	result.methodology = {{"approach", std::string("Default template")}};
	return result;
}

BudgetResult StatisticalBudgetGenerator::adjustForGoal(const BudgetResult &budget, double savings_goal) const {
	if (savings_goal <= 0.0) {
		return budget;
	}

	BudgetResult result = budget;
	std::vector<std::size_t> order(result.entries.size());
	for (std::size_t i = 0; i < order.size(); ++i) {
		order[i] = i;
	}
	std::stable_sort(order.begin(), order.end(), [&result](std::size_t a, std::size_t b) {
		return result.entries[a].elasticity > result.entries[b].elasticity;
	});

	double remaining = savings_goal;
	double reduced = 0.0;
	for (auto idx : order) {
		if (remaining <= 0.0) {
			break;
		}
		auto &entry = result.entries[idx];
		if (entry.elasticity <= 0.0 || entry.amount <= entry.floor) {
			continue;
		}
		const double reduction = std::min(entry.amount - entry.floor, remaining * entry.elasticity / 2.0);
		entry.amount -= reduction;
		entry.adjusted = true;
		reduced += reduction;
		remaining -= reduction;
	}
	finalizeEntries(result);

	result.savings = SavingsSummary{savings_goal, reduced, reduced >= savings_goal - 0.01};
	result.methodology["savings_goal"] = savings_goal;
	return result;
}

} // namespace finsight::budget
