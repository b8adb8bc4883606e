#include "finsight/utils/cross_validation.hpp"

#include "finsight/utils/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace finsight::utils {

std::vector<std::tuple<int, int, int, int>> CrossValidation::generateFolds(int n_samples, const CVConfig &config) {
	if (config.n_splits < 2) {
		throw std::invalid_argument("Cross-validation requires at least two splits.");
	}
	const int n_folds = config.n_splits + 1;
	if (n_folds > n_samples) {
		throw std::invalid_argument("Cannot have more folds than samples.");
	}
	const int test_size = config.test_size > 0 ? config.test_size : n_samples / n_folds;
	if (n_samples - config.gap - test_size * config.n_splits <= 0) {
		throw std::invalid_argument("Time series too short for the requested number of splits.");
	}

	std::vector<std::tuple<int, int, int, int>> folds;
	folds.reserve(static_cast<std::size_t>(config.n_splits));

	for (int test_start = n_samples - config.n_splits * test_size; test_start < n_samples; test_start += test_size) {
		const int train_end = test_start - config.gap;
		int train_start = 0;
		if (config.strategy == CVStrategy::ROLLING && config.max_train_size > 0 && config.max_train_size < train_end) {
			train_start = train_end - config.max_train_size;
		}
		folds.emplace_back(train_start, train_end, test_start, test_start + test_size);
	}

	return folds;
}

CVResults CrossValidation::evaluate(const std::vector<double> &target, const FoldRunner &runner,
                                    const CVConfig &config) {
	const auto fold_indices = generateFolds(static_cast<int>(target.size()), config);

	CVResults results;
	results.folds.reserve(fold_indices.size());

	int fold_id = 0;
	for (const auto &[train_start, train_end, test_start, test_end] : fold_indices) {
		CVFold fold;
		fold.fold_id = fold_id++;
		fold.train_start = train_start;
		fold.train_end = train_end;
		fold.test_start = test_start;
		fold.test_end = test_end;

		fold.forecasts = runner(train_start, train_end, test_start, test_end);
		fold.actuals.assign(target.begin() + test_start, target.begin() + test_end);
		if (fold.forecasts.size() != fold.actuals.size()) {
			throw std::runtime_error("Fold runner returned a prediction count different from the test size.");
		}

		const auto accuracy = Metrics::evaluate(fold.actuals, fold.forecasts);
		fold.mae = accuracy.mae;
		fold.rmse = accuracy.rmse;
		results.folds.push_back(std::move(fold));
	}

	results.computeAggregatedMetrics();
	return results;
}

void CVResults::computeAggregatedMetrics() {
	if (folds.empty()) {
		mae = 0.0;
		mae_std = 0.0;
		rmse = 0.0;
		total_forecasts = 0;
		return;
	}

	const double n = static_cast<double>(folds.size());
	mae = std::accumulate(folds.begin(), folds.end(), 0.0, [](double acc, const CVFold &f) { return acc + f.mae; }) / n;
	rmse =
	    std::accumulate(folds.begin(), folds.end(), 0.0, [](double acc, const CVFold &f) { return acc + f.rmse; }) / n;

	double ss = 0.0;
	for (const auto &fold : folds) {
		ss += (fold.mae - mae) * (fold.mae - mae);
	}
	mae_std = std::sqrt(ss / n);

	total_forecasts = 0;
	for (const auto &fold : folds) {
		total_forecasts += static_cast<int>(fold.forecasts.size());
	}
}

} // namespace finsight::utils
