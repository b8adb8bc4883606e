#pragma once

#include "finsight/budget/budget_types.hpp"
#include "finsight/core/daily_table.hpp"
#include "finsight/core/date.hpp"
#include "finsight/patterns/pattern_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace finsight::budget {

/**
 * @struct BudgetRequest
 * @brief Inputs of a budget generation.
 *
 * The table and the optional pattern result are borrowed for the duration of
 * the call.
 */
struct BudgetRequest {
	const core::DailyTable &table;
	const patterns::PatternResult *patterns = nullptr;
	std::optional<core::Date> target_month;
	std::optional<double> savings_goal;
	BudgetPeriod period = BudgetPeriod::Monthly;
};

/**
 * @class IBudgetGenerator
 * @brief An interface for all budget strategies.
 */
class IBudgetGenerator {
public:
	virtual ~IBudgetGenerator() = default;

	/**
	 * @brief Recommends per-category amounts for the requested period.
	 * @throws std::invalid_argument If the table lacks the columns the strategy reads.
	 */
	virtual BudgetResult generate(const BudgetRequest &request) const = 0;

	virtual std::string getName() const = 0;
};

/// Confidence by days of history: < 30 -> 0.5, < 60 -> 0.7, < 90 -> 0.85, else 0.95.
double historyConfidence(std::size_t days);

/// Stable sort by amount, largest first, then recomputes the total.
void finalizeEntries(BudgetResult &result);

/// A category's daily series, or zeros when the table has no such column.
std::vector<double> categorySeries(const core::DailyTable &table, const std::string &category);

/// Rounds to two decimals.
double roundCents(double value);

} // namespace finsight::budget
