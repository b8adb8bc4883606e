#pragma once

#include "finsight/budget/category_policy.hpp"
#include "finsight/budget/ibudget_generator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace finsight::budget {

struct EmaBudgetConfig {
	std::size_t lookback_weeks = 8;
	double alpha = 0.6;               // EMA smoothing of weekly sums
	double blend_weight = 0.6;        // EMA share of the EMA/median blend
	double volatility_cushion = 0.2;  // x (1 + cushion * CV)
	double iqr_cap = 1.75;            // cap = median + iqr_cap * IQR
	double inactive_days_per_month = 5.0;
	double occasional_days_per_month = 12.0;
	double inactive_multiplier = 0.25;
	std::size_t spike_memory_days = 3;
	double spike_memory_default = 200.0;
	double spike_buffer = 0.15;
	std::vector<int> hazard_days{6, 7, 13, 14};
	double hazard_boost = 0.2;

	double monthly_span = 4.0;
	std::size_t monthly_window = 6;
	double monthly_ema_weight = 0.7;
	double monthly_inactive_days = 3.0;  // over the last two months
	double monthly_regular_days = 15.0;
	double monthly_inactive_multiplier = 0.35;
	double monthly_active_multiplier = 1.15;
	double monthly_cap = 1.08;  // x the highest month in the window
	double weeks_per_month = 4.3;
};

/**
 * @class EmaBudgetGenerator
 * @brief Weekly and monthly budgets from smoothed weekly or monthly sums.
 *
 * The weekly plan blends an EMA of the trailing weeks with the median of the
 * weeks that had spending, then boosts categories that are due to recur
 * (hazard days) or spiked in the last few days, adds a volatility cushion and
 * caps the result with an IQR fence. The monthly plan blends an EMA of
 * calendar-month sums with their rolling median. Both plans lift amounts to the
 * weekly essential minimums (x 4.3 for months), although the monthly cap on
 * the recent high applies after that floor. Both can be cut toward a savings goal
 * with redistributeSavings().
 */
class EmaBudgetGenerator final : public IBudgetGenerator {
public:
	EmaBudgetGenerator() : EmaBudgetGenerator(EmaBudgetConfig{}, CategoryPolicy::defaults()) {
	}

	/// @throws std::invalid_argument If the configuration is inconsistent.
	EmaBudgetGenerator(EmaBudgetConfig config, CategoryPolicy policy);

	/// Dispatches on request.period.
	BudgetResult generate(const BudgetRequest &request) const override;

	std::string getName() const override {
		return "EmaBudgetGenerator";
	}

	/// Budget for the week following the table. An empty table yields defaultWeekly().
	BudgetResult weekly(const core::DailyTable &table, std::optional<double> savings_goal = std::nullopt) const;

	/**
	 * @brief Budget for a calendar month.
	 *
	 * With fewer than two months of history the weekly plan is scaled by 4.3.
	 */
	BudgetResult monthly(const core::DailyTable &table, std::optional<double> savings_goal = std::nullopt,
	                     std::optional<core::Date> target_month = std::nullopt) const;

	BudgetResult defaultWeekly() const;
	BudgetResult defaultMonthly() const;

	const EmaBudgetConfig &config() const {
		return config_;
	}

private:
	BudgetResult toMonthly(const BudgetResult &weekly) const;
	void applySavings(BudgetResult &result, double goal) const;

	EmaBudgetConfig config_;
	CategoryPolicy policy_;
};

} // namespace finsight::budget
