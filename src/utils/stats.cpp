#include "finsight/utils/stats.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace finsight::utils::stats {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Below this much residual energy a detrended series is treated as flat.
constexpr double kEnergyEpsilon = 1e-9;

std::size_t windowStart(std::size_t i, std::size_t window) {
	return i + 1 >= window ? i + 1 - window : 0;
}

} // namespace

double mean(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double sampleStdDev(const std::vector<double> &values) {
	if (values.size() < 2) {
		return 0.0;
	}
	const double m = mean(values);
	double ss = 0.0;
	for (double v : values) {
		ss += (v - m) * (v - m);
	}
	return std::sqrt(ss / static_cast<double>(values.size() - 1));
}

double populationStdDev(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	const double m = mean(values);
	double ss = 0.0;
	for (double v : values) {
		ss += (v - m) * (v - m);
	}
	return std::sqrt(ss / static_cast<double>(values.size()));
}

double median(std::vector<double> values) {
	if (values.empty()) {
		return 0.0;
	}
	std::sort(values.begin(), values.end());
	const std::size_t n = values.size();
	if (n % 2 == 1) {
		return values[n / 2];
	}
	return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

double quantile(std::vector<double> values, double q) {
	if (q < 0.0 || q > 1.0) {
		throw std::invalid_argument("Quantile probability must be in [0, 1].");
	}
	if (values.empty()) {
		return 0.0;
	}
	std::sort(values.begin(), values.end());
	const double pos = q * static_cast<double>(values.size() - 1);
	const auto idx = static_cast<std::size_t>(pos);
	const double frac = pos - static_cast<double>(idx);
	if (idx + 1 < values.size()) {
		return values[idx] * (1.0 - frac) + values[idx + 1] * frac;
	}
	return values.back();
}

double coefficientOfVariation(const std::vector<double> &values) {
	const double m = mean(values);
	if (m <= 0.0) {
		return 0.0;
	}
	return sampleStdDev(values) / m;
}

double activeRate(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	const auto active = std::count_if(values.begin(), values.end(), [](double v) { return v > 0.0; });
	return static_cast<double>(active) / static_cast<double>(values.size());
}

std::vector<double> positiveValues(const std::vector<double> &values) {
	std::vector<double> result;
	std::copy_if(values.begin(), values.end(), std::back_inserter(result), [](double v) { return v > 0.0; });
	return result;
}

LinearFit linearFit(const std::vector<double> &values) {
	LinearFit fit;
	const std::size_t n = values.size();
	if (n == 0) {
		return fit;
	}
	const double x_mean = static_cast<double>(n - 1) / 2.0;
	const double y_mean = mean(values);
	double sxx = 0.0;
	double sxy = 0.0;
	double syy = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const double dx = static_cast<double>(i) - x_mean;
		const double dy = values[i] - y_mean;
		sxx += dx * dx;
		sxy += dx * dy;
		syy += dy * dy;
	}
	if (sxx > 0.0) {
		fit.slope = sxy / sxx;
	}
	fit.intercept = y_mean - fit.slope * x_mean;
	if (sxx > 0.0 && syy > 0.0) {
		fit.r = std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
	}
	return fit;
}

std::vector<double> detrend(const std::vector<double> &values) {
	const LinearFit fit = linearFit(values);
	std::vector<double> residuals(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		residuals[i] = values[i] - (fit.intercept + fit.slope * static_cast<double>(i));
	}
	return residuals;
}

std::vector<double> autocorrelation(const std::vector<double> &centred, std::size_t max_lag) {
	const std::size_t n = centred.size();
	double energy = 0.0;
	for (double v : centred) {
		energy += v * v;
	}
	if (n == 0 || energy <= kEnergyEpsilon) {
		return {};
	}
	const std::size_t last = std::min(max_lag, n - 1);
	std::vector<double> acf(last + 1, 0.0);
	for (std::size_t k = 0; k <= last; ++k) {
		double sum = 0.0;
		for (std::size_t i = 0; i + k < n; ++i) {
			sum += centred[i] * centred[i + k];
		}
		acf[k] = sum / energy;
	}
	return acf;
}

std::vector<double> rollingMean(const std::vector<double> &values, std::size_t window, std::size_t min_periods) {
	std::vector<double> result(values.size(), kNaN);
	for (std::size_t i = 0; i < values.size(); ++i) {
		const std::size_t start = windowStart(i, window);
		const std::size_t count = i - start + 1;
		if (count < min_periods) {
			continue;
		}
		double sum = 0.0;
		for (std::size_t j = start; j <= i; ++j) {
			sum += values[j];
		}
		result[i] = sum / static_cast<double>(count);
	}
	return result;
}

std::vector<double> rollingStd(const std::vector<double> &values, std::size_t window, std::size_t min_periods) {
	std::vector<double> result(values.size(), kNaN);
	const std::size_t required = std::max<std::size_t>(min_periods, 2);
	for (std::size_t i = 0; i < values.size(); ++i) {
		const std::size_t start = windowStart(i, window);
		const std::size_t count = i - start + 1;
		if (count < required) {
			continue;
		}
		const std::vector<double> slice(values.begin() + static_cast<std::ptrdiff_t>(start),
		                                values.begin() + static_cast<std::ptrdiff_t>(i + 1));
		result[i] = sampleStdDev(slice);
	}
	return result;
}

std::vector<double> rollingMax(const std::vector<double> &values, std::size_t window, std::size_t min_periods) {
	std::vector<double> result(values.size(), kNaN);
	for (std::size_t i = 0; i < values.size(); ++i) {
		const std::size_t start = windowStart(i, window);
		if (i - start + 1 < min_periods) {
			continue;
		}
		result[i] = *std::max_element(values.begin() + static_cast<std::ptrdiff_t>(start),
		                              values.begin() + static_cast<std::ptrdiff_t>(i + 1));
	}
	return result;
}

std::vector<double> rollingSum(const std::vector<double> &values, std::size_t window, std::size_t min_periods) {
	std::vector<double> result(values.size(), kNaN);
	for (std::size_t i = 0; i < values.size(); ++i) {
		const std::size_t start = windowStart(i, window);
		if (i - start + 1 < min_periods) {
			continue;
		}
		result[i] = std::accumulate(values.begin() + static_cast<std::ptrdiff_t>(start),
		                            values.begin() + static_cast<std::ptrdiff_t>(i + 1), 0.0);
	}
	return result;
}

std::vector<double> expandingMean(const std::vector<double> &values) {
	std::vector<double> result(values.size());
	double sum = 0.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		sum += values[i];
		result[i] = sum / static_cast<double>(i + 1);
	}
	return result;
}

std::vector<double> shift(const std::vector<double> &values, std::size_t lag) {
	std::vector<double> result(values.size(), kNaN);
	for (std::size_t i = lag; i < values.size(); ++i) {
		result[i] = values[i - lag];
	}
	return result;
}

std::vector<double> ewm(const std::vector<double> &values, double alpha) {
	if (!(alpha > 0.0) || alpha > 1.0) {
		throw std::invalid_argument("EWM smoothing factor must be in (0, 1].");
	}
	std::vector<double> result(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		result[i] = i == 0 ? values[0] : alpha * values[i] + (1.0 - alpha) * result[i - 1];
	}
	return result;
}

double alphaFromSpan(double span) {
	if (span < 1.0) {
		throw std::invalid_argument("EWM span must be at least 1.");
	}
	return 2.0 / (span + 1.0);
}

} // namespace finsight::utils::stats
