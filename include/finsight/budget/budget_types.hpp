#pragma once

#include "finsight/core/status.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace finsight::budget {

enum class BudgetPeriod { Weekly, Monthly };

std::string toString(BudgetPeriod period);

/// Statistics behind an EMA-strategy entry.
struct EmaDetails {
	double raw_amount = 0.0;  // before any savings cut
	double ema = 0.0;
	double median_active = 0.0;  // median of active weeks, or the rolling monthly median
	double volatility = 0.0;     // CV of active weeks
	double iqr = 0.0;
	bool hazard = false;
	bool spike_memory = false;
	std::optional<int> days_since_last;  // nullopt = never within the window
};

struct BudgetEntry {
	std::string category;
	double amount = 0.0;
	double floor = 0.0;
	double elasticity = 1.0;
	std::string activity_level;
	double adjustment_factor = 1.0;
	double confidence = 0.5;
	bool adjusted = false;  // cut to meet a savings goal
	std::optional<EmaDetails> details;
};

struct SavingsSummary {
	double goal = 0.0;
	double achieved = 0.0;
	bool successful = false;
};

using MethodologyValue = std::variant<double, std::string>;
using Methodology = std::map<std::string, MethodologyValue>;

/**
 * @struct BudgetResult
 * @brief Output of every budget generator.
 *
 * Entries are ordered by amount, largest first; equal amounts keep category
 * order. @c total is the sum of the entry amounts.
 */
struct BudgetResult {
	std::vector<BudgetEntry> entries;
	double total = 0.0;
	BudgetPeriod period = BudgetPeriod::Monthly;
	std::string month;  // "YYYY-MM" of the budgeted month, when known
	double confidence = 0.5;
	Methodology methodology;
	std::optional<SavingsSummary> savings;
	core::Status status = core::Status::Ok;

	/// nullptr when the category has no entry.
	const BudgetEntry *find(const std::string &category) const {
		for (const auto &entry : entries) {
			if (entry.category == category) {
				return &entry;
			}
		}
		return nullptr;
	}
};

} // namespace finsight::budget
