#pragma once

#include <cstddef>
#include <vector>

namespace finsight::utils {

/**
 * @brief Descriptive statistics and trailing-window operators over daily series.
 *
 * Windowed operators follow the usual time-series convention: the value at
 * index i is computed from indices [i - window + 1, i] only, and is NaN when
 * fewer than @c min_periods observations are available. Nothing looks ahead.
 */
namespace stats {

/// Arithmetic mean; 0 for an empty series.
double mean(const std::vector<double> &values);

/// Standard deviation with n - 1 in the denominator; 0 with fewer than two values.
double sampleStdDev(const std::vector<double> &values);

/// Standard deviation with n in the denominator; 0 for an empty series.
double populationStdDev(const std::vector<double> &values);

/// 0 for an empty series.
double median(std::vector<double> values);

/**
 * @brief Quantile with linear interpolation between closest ranks.
 * @param q Probability in [0, 1].
 * @return 0 for an empty series.
 * @throws std::invalid_argument If q is outside [0, 1].
 */
double quantile(std::vector<double> values, double q);

/// Coefficient of variation (sample std / mean), 0 when the mean is not positive.
double coefficientOfVariation(const std::vector<double> &values);

/// Fraction of strictly positive entries; 0 for an empty series.
double activeRate(const std::vector<double> &values);

/// Values strictly greater than zero, in order.
std::vector<double> positiveValues(const std::vector<double> &values);

struct LinearFit {
	double slope = 0.0;
	double intercept = 0.0;
	/// Pearson correlation between index and value; 0 when either is constant.
	double r = 0.0;
};

/// Ordinary least squares of values against x = 0, 1, ..., n - 1.
LinearFit linearFit(const std::vector<double> &values);

/// Residuals of values around their least-squares line.
std::vector<double> detrend(const std::vector<double> &values);

/**
 * @brief Normalized autocorrelation of an already centred series.
 *
 * acf[k] = sum(d[i] * d[i + k]) / sum(d[i]^2) for k in [0, max_lag].
 * Returns an empty vector when the series carries no energy.
 */
std::vector<double> autocorrelation(const std::vector<double> &centred, std::size_t max_lag);

std::vector<double> rollingMean(const std::vector<double> &values, std::size_t window, std::size_t min_periods = 1);
std::vector<double> rollingStd(const std::vector<double> &values, std::size_t window, std::size_t min_periods = 2);
std::vector<double> rollingMax(const std::vector<double> &values, std::size_t window, std::size_t min_periods = 1);
std::vector<double> rollingSum(const std::vector<double> &values, std::size_t window, std::size_t min_periods = 1);

/// Mean of values[0..i] at each i.
std::vector<double> expandingMean(const std::vector<double> &values);

/// values shifted forward by @p lag places, leading entries NaN.
std::vector<double> shift(const std::vector<double> &values, std::size_t lag);

/**
 * @brief Recursive exponentially weighted mean, y[0] = x[0], y[i] = a * x[i] + (1 - a) * y[i - 1].
 * @throws std::invalid_argument If alpha is outside (0, 1].
 */
std::vector<double> ewm(const std::vector<double> &values, double alpha);

/// Smoothing factor for a span: 2 / (span + 1).
double alphaFromSpan(double span);

} // namespace stats
} // namespace finsight::utils
