#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

namespace finsight::utils {

struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	std::optional<double> r_squared;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	/// Coefficient of determination; nullopt when the actual series is constant.
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);
	/// Mean of actual - predicted (positive when the forecast undershoots).
	static double bias(const std::vector<double> &actual, const std::vector<double> &predicted);

	static AccuracyMetrics evaluate(const std::vector<double> &actual, const std::vector<double> &predicted);

private:
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace finsight::utils
