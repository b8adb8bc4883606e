#pragma once

#include "finsight/budget/category_policy.hpp"
#include "finsight/budget/ibudget_generator.hpp"

#include <map>
#include <string>
#include <vector>

namespace finsight::budget {

/**
 * @class StatisticalBudgetGenerator
 * @brief Monthly budgets from per-category daily statistics.
 *
 * A category's base is 30 days of typical spend chosen by its activity tier,
 * then trimmed for discretionary categories, scaled by pattern and trend
 * factors, cushioned for volatility and rounded to 10. The floor is applied
 * last, so an amount never ends below its floor.
 */
class StatisticalBudgetGenerator final : public IBudgetGenerator {
public:
	struct CategoryStats {
		double mean = 0.0;
		double median = 0.0;
		double std_dev = 0.0;
		double max = 0.0;
		double min_active = 0.0;
		double p75 = 0.0;
		double p90 = 0.0;
		std::size_t active_days = 0;
		std::size_t total_days = 0;
		double activity_rate = 0.0;
		double total = 0.0;
		double recent_trend = 0.0;
	};

	StatisticalBudgetGenerator() : StatisticalBudgetGenerator(CategoryPolicy::defaults()) {
	}

	explicit StatisticalBudgetGenerator(CategoryPolicy policy);

	/**
	 * @brief Monthly budget for every category column in the table.
	 *
	 * An empty table yields defaultBudget(). A savings goal is applied with
	 * adjustForGoal().
	 */
	BudgetResult generate(const BudgetRequest &request) const override;

	std::string getName() const override {
		return "StatisticalBudgetGenerator";
	}

	static CategoryStats categoryStats(const std::vector<double> &series);

	/// (mean of the last 14 days - mean of the 14 before) / the latter; 0 with fewer than 14 days or a zero base.
	static double recentTrend(const std::vector<double> &series, std::size_t window = 14);

	/// "inactive" below 10% active days, "occasional" below 30%, else "regular".
	static std::string activityLevel(double activity_rate);

	/**
	 * @brief Multipliers keyed by category ("Total" for the daily total).
	 *
	 * Recurrences with confidence > 0.7 set 1.1, volatility > 0.5 multiplies
	 * by 1.15 and each recent spike multiplies its contributing categories
	 * (or Total when it has none) by 1.2.
	 */
	static std::map<std::string, double> patternAdjustments(const patterns::PatternResult &patterns);

	/// Template budget for users without history.
	BudgetResult defaultBudget() const;

	/**
	 * @brief Cuts an existing budget toward a savings goal.
	 *
	 * Categories are visited from most to least elastic; each gives up
	 * min(amount - floor, remaining goal x elasticity / 2). Categories with
	 * zero elasticity are never cut. The result carries a savings summary.
	 */
	BudgetResult adjustForGoal(const BudgetResult &budget, double savings_goal) const;

	const CategoryPolicy &policy() const {
		return policy_;
	}

private:
	BudgetEntry categoryBudget(const std::string &category, const CategoryStats &stats, double adjustment) const;

	CategoryPolicy policy_;
};

} // namespace finsight::budget
