#pragma once

#include <vector>

namespace finsight::budget {

struct SavingsAllocation {
	std::vector<double> amounts;  // per category, same order as the input
	double goal = 0.0;
	double achieved = 0.0;
	bool successful = false;  // achieved >= goal - 0.01
};

/**
 * @brief Cuts amounts toward a savings goal without crossing any floor.
 *
 * Headroom is amount - floor (never negative). Cuts are shared in proportion
 * to elasticity x headroom; when a category runs out of headroom the unmet
 * part is shared again over the categories that still have some. The total
 * cut is min(goal, headroom of categories with positive elasticity).
 *
 * @throws std::invalid_argument If the three vectors differ in length.
 */
SavingsAllocation redistributeSavings(const std::vector<double> &amounts, const std::vector<double> &floors,
                                      const std::vector<double> &elasticities, double goal);

} // namespace finsight::budget
