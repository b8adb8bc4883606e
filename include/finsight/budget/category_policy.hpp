#pragma once

#include <map>
#include <string>

namespace finsight::budget {

/**
 * @struct CategoryPolicy
 * @brief Per-category constants the budget generators are parameterized by.
 *
 * Statistical floors and elasticities apply to monthly budgets. Weekly
 * essentials are the EMA strategy's weekly floors (monthly floors are
 * 4.3 times larger). Categories missing from a table read as floor 0 and
 * elasticity default_elasticity.
 */
struct CategoryPolicy {
	std::map<std::string, double> floors;
	std::map<std::string, double> elasticities;
	std::map<std::string, double> weekly_essentials;
	std::map<std::string, double> ema_elasticities;
	/// Monthly template for users without history.
	std::map<std::string, double> default_monthly;
	/// Weekly template for users without history.
	std::map<std::string, double> default_weekly;
	double default_elasticity = 1.0;

	double floor(const std::string &category) const;
	double elasticity(const std::string &category) const;
	double weeklyEssential(const std::string &category) const;
	double emaElasticity(const std::string &category) const;

	/// The calibrated production tables.
	static CategoryPolicy defaults();
};

} // namespace finsight::budget
