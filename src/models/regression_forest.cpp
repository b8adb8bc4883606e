#include "finsight/models/regression_forest.hpp"

#include "finsight/utils/logging.hpp"

#include <istream>
#include <numeric>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>

namespace finsight::models {

// --- Model Implementation ---

RegressionForest::RegressionForest(ForestConfig config) : config_(config) {
	if (config_.n_trees == 0) {
		throw std::invalid_argument("A forest needs at least one tree.");
	}
	if (config_.max_depth < 0 || config_.min_samples_split < 2 || config_.min_samples_leaf < 1) {
		throw std::invalid_argument("Invalid tree settings: max_depth >= 0, min_samples_split >= 2 and "
		                            "min_samples_leaf >= 1 are required.");
	}
}

void RegressionForest::fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y) {
	if (x.rows() == 0 || x.cols() == 0) {
		throw std::invalid_argument("Cannot fit a forest on an empty design matrix.");
	}
	if (x.rows() != y.size()) {
		throw std::invalid_argument("Design matrix and target must have the same number of rows.");
	}

	const auto n = static_cast<std::size_t>(x.rows());
	const TreeConfig tree_config{config_.max_depth, config_.min_samples_split, config_.min_samples_leaf};

	std::vector<RegressionTree> trees;
	trees.reserve(config_.n_trees);
	std::vector<std::size_t> samples(n);
	for (std::size_t t = 0; t < config_.n_trees; ++t) {
		if (config_.bootstrap) {
			std::mt19937 rng(config_.seed + static_cast<std::uint32_t>(t));
			std::uniform_int_distribution<std::size_t> pick(0, n - 1);
			for (auto &idx : samples) {
				idx = pick(rng);
			}
		} else {
			std::iota(samples.begin(), samples.end(), std::size_t{0});
		}
		RegressionTree tree(tree_config);
		tree.fit(x, y, samples);
		trees.push_back(std::move(tree));
	}

	trees_ = std::move(trees);
	feature_count_ = static_cast<std::size_t>(x.cols());
	FINSIGHT_DEBUG("Regression forest fitted: {} trees on {} rows x {} features.", trees_.size(), n, feature_count_);
}

double RegressionForest::predict(const Eigen::RowVectorXd &row) const {
	const auto per_tree = predictPerTree(row);
	return std::accumulate(per_tree.begin(), per_tree.end(), 0.0) / static_cast<double>(per_tree.size());
}

Eigen::VectorXd RegressionForest::predict(const Eigen::MatrixXd &x) const {
	Eigen::VectorXd out(x.rows());
	for (Eigen::Index i = 0; i < x.rows(); ++i) {
		out(i) = predict(Eigen::RowVectorXd(x.row(i)));
	}
	return out;
}

std::vector<double> RegressionForest::predictPerTree(const Eigen::RowVectorXd &row) const {
	if (!isFitted()) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (static_cast<std::size_t>(row.size()) != feature_count_) {
		throw std::invalid_argument("Feature row has " + std::to_string(row.size()) + " values, expected " +
		                            std::to_string(feature_count_) + ".");
	}
	std::vector<double> predictions;
	predictions.reserve(trees_.size());
	for (const auto &tree : trees_) {
		predictions.push_back(tree.predict(row));
	}
	return predictions;
}

std::vector<double> RegressionForest::featureImportances() const {
	std::vector<double> importances(feature_count_, 0.0);
	if (trees_.empty()) {
		return importances;
	}
	for (const auto &tree : trees_) {
		const auto &decrease = tree.impurityDecrease();
		const double total = std::accumulate(decrease.begin(), decrease.end(), 0.0);
		if (total <= 0.0) {
			continue;
		}
		for (std::size_t f = 0; f < importances.size() && f < decrease.size(); ++f) {
			importances[f] += decrease[f] / total;
		}
	}
	const double sum = std::accumulate(importances.begin(), importances.end(), 0.0);
	if (sum > 0.0) {
		for (auto &value : importances) {
			value /= sum;
		}
	}
	return importances;
}

void RegressionForest::save(std::ostream &out) const {
	out << "forest " << trees_.size() << ' ' << feature_count_ << ' ' << config_.max_depth << ' '
	    << config_.min_samples_split << ' ' << config_.min_samples_leaf << ' ' << (config_.bootstrap ? 1 : 0) << ' '
	    << config_.seed << '\n';
	for (const auto &tree : trees_) {
		tree.save(out);
	}
}

std::unique_ptr<RegressionForest> RegressionForest::load(std::istream &in) {
	std::string tag;
	ForestConfig config;
	std::size_t feature_count = 0;
	int bootstrap = 1;
	if (!(in >> tag >> config.n_trees >> feature_count >> config.max_depth >> config.min_samples_split >>
	      config.min_samples_leaf >> bootstrap >> config.seed) ||
	    tag != "forest") {
		throw std::runtime_error("Malformed regression forest record.");
	}
	config.bootstrap = bootstrap != 0;

	std::unique_ptr<RegressionForest> forest(new RegressionForest(config));
	forest->feature_count_ = feature_count;
	forest->trees_.reserve(config.n_trees);
	for (std::size_t t = 0; t < config.n_trees; ++t) {
		forest->trees_.push_back(RegressionTree::load(in));
	}
	return forest;
}

// --- Builder Implementation ---

RegressionForestBuilder &RegressionForestBuilder::withTrees(std::size_t n_trees) {
	config_.n_trees = n_trees;
	return *this;
}

RegressionForestBuilder &RegressionForestBuilder::withMaxDepth(int depth) {
	config_.max_depth = depth;
	return *this;
}

RegressionForestBuilder &RegressionForestBuilder::withMinSamplesSplit(std::size_t n) {
	config_.min_samples_split = n;
	return *this;
}

RegressionForestBuilder &RegressionForestBuilder::withMinSamplesLeaf(std::size_t n) {
	config_.min_samples_leaf = n;
	return *this;
}

RegressionForestBuilder &RegressionForestBuilder::withBootstrap(bool enabled) {
	config_.bootstrap = enabled;
	return *this;
}

RegressionForestBuilder &RegressionForestBuilder::withSeed(std::uint32_t seed) {
	config_.seed = seed;
	return *this;
}

RegressionForestBuilder &RegressionForestBuilder::withConfig(const ForestConfig &config) {
	config_ = config;
	return *this;
}

std::unique_ptr<RegressionForest> RegressionForestBuilder::build() {
	FINSIGHT_DEBUG("Building regression forest with {} trees (max_depth={}, min_split={}, min_leaf={}, seed={}).",
	               config_.n_trees, config_.max_depth, config_.min_samples_split, config_.min_samples_leaf,
	               config_.seed);
	return std::unique_ptr<RegressionForest>(new RegressionForest(config_));
}

} // namespace finsight::models
