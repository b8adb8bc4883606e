#include "finsight/budget/savings.hpp"

#include "finsight/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace finsight::budget {

namespace {

constexpr double kTolerance = 1e-9;

} // namespace

SavingsAllocation redistributeSavings(const std::vector<double> &amounts, const std::vector<double> &floors,
                                      const std::vector<double> &elasticities, double goal) {
	if (amounts.size() != floors.size() || amounts.size() != elasticities.size()) {
		throw std::invalid_argument("Amounts, floors and elasticities must have the same length.");
	}

	SavingsAllocation allocation;
	allocation.amounts = amounts;
	allocation.goal = goal;
	if (goal <= 0.0) {
		allocation.successful = true;
		return allocation;
	}

	const std::size_t n = amounts.size();
	std::vector<double> headroom(n, 0.0);
	double available = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		if (elasticities[i] > 0.0) {
			headroom[i] = std::max(amounts[i] - floors[i], 0.0);
			available += headroom[i];
		}
	}

	const double need = std::min(goal, available);
	double remaining = need;
	// Each pass either meets the need or exhausts at least one category.
	for (std::size_t pass = 0; pass <= n && remaining > kTolerance; ++pass) {
		double weight_sum = 0.0;
		for (std::size_t i = 0; i < n; ++i) {
			weight_sum += elasticities[i] > 0.0 ? elasticities[i] * headroom[i] : 0.0;
		}
		if (weight_sum <= 0.0) {
			break;
		}
		const double target = remaining;
		for (std::size_t i = 0; i < n; ++i) {
			if (elasticities[i] <= 0.0 || headroom[i] <= 0.0) {
				continue;
			}
			const double cut = std::min(headroom[i], target * elasticities[i] * headroom[i] / weight_sum);
			allocation.amounts[i] = std::max(floors[i], allocation.amounts[i] - cut);
			headroom[i] -= cut;
			remaining -= cut;
		}
	}

	allocation.achieved = need - std::max(remaining, 0.0);
	allocation.successful = allocation.achieved >= goal - 0.01;
	FINSIGHT_DEBUG("Savings goal {:.2f}: cut {:.2f} of {:.2f} available.", goal, allocation.achieved, available);
	return allocation;
}

} // namespace finsight::budget
