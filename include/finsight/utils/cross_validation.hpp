#pragma once

#include <functional>
#include <tuple>
#include <vector>

namespace finsight::utils {

/**
 * @brief Time series cross-validation strategy
 */
enum class CVStrategy {
	ROLLING,   // Training window capped at max_train_size
	EXPANDING  // Training window always starts at the first sample
};

/**
 * @brief Configuration for time-ordered cross-validation.
 *
 * Fold sizes follow the scikit-learn TimeSeriesSplit layout: the test size
 * defaults to n_samples / (n_splits + 1) and the last fold ends at the last
 * sample. Samples are never shuffled.
 */
struct CVConfig {
	int n_splits = 5;
	int test_size = 0;       // 0 = n_samples / (n_splits + 1)
	int gap = 0;             // Samples skipped between train and test
	int max_train_size = 0;  // Only used by ROLLING; 0 = unbounded
	CVStrategy strategy = CVStrategy::EXPANDING;
};

/**
 * @brief Results from a single CV fold
 */
struct CVFold {
	int fold_id = 0;
	int train_start = 0;  // inclusive
	int train_end = 0;    // exclusive
	int test_start = 0;
	int test_end = 0;

	std::vector<double> forecasts;
	std::vector<double> actuals;

	double mae = 0.0;
	double rmse = 0.0;
};

/**
 * @brief Results from cross-validation
 */
struct CVResults {
	std::vector<CVFold> folds;

	/// Mean of the per-fold MAE values.
	double mae = 0.0;
	/// Population standard deviation of the per-fold MAE values.
	double mae_std = 0.0;
	double rmse = 0.0;

	int total_forecasts = 0;

	void computeAggregatedMetrics();
};

/**
 * @brief Time-ordered cross-validation utility
 */
class CrossValidation {
public:
	/// Fits on [train_start, train_end) and returns predictions for [test_start, test_end).
	using FoldRunner = std::function<std::vector<double>(int train_start, int train_end, int test_start, int test_end)>;

	/**
	 * @brief Runs every fold through @p runner and scores it against @p target.
	 * @throws std::runtime_error If the runner returns the wrong number of predictions.
	 */
	static CVResults evaluate(const std::vector<double> &target, const FoldRunner &runner,
	                          const CVConfig &config = CVConfig{});

	/**
	 * @brief Generate CV fold indices
	 *
	 * @param n_samples Total number of samples
	 * @param config CV configuration
	 * @return Vector of (train_start, train_end, test_start, test_end) tuples
	 * @throws std::invalid_argument If the series is too short for the requested folds.
	 */
	static std::vector<std::tuple<int, int, int, int>> generateFolds(int n_samples, const CVConfig &config);
};

} // namespace finsight::utils
