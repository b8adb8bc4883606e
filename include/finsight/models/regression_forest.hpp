#pragma once

#include "finsight/models/regression_tree.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <vector>

namespace finsight::models {

struct ForestConfig {
	std::size_t n_trees = 100;
	int max_depth = 0;
	std::size_t min_samples_split = 2;
	std::size_t min_samples_leaf = 1;
	bool bootstrap = true;
	std::uint32_t seed = 42;
};

class RegressionForestBuilder; // Forward declaration

/**
 * @class RegressionForest
 * @brief Bagged ensemble of CART regression trees.
 *
 * Tree t draws its bootstrap sample from a Mersenne Twister seeded with
 * seed + t, so a fit is reproducible for a given configuration and input.
 * Every tree considers every feature at every split.
 */
class RegressionForest {
public:
	friend class RegressionForestBuilder;

	/**
	 * @brief Fits the ensemble.
	 * @throws std::invalid_argument If @p x and @p y are empty or disagree in length.
	 */
	void fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y);

	/// Mean of the per-tree predictions.
	double predict(const Eigen::RowVectorXd &row) const;
	Eigen::VectorXd predict(const Eigen::MatrixXd &x) const;

	/// One prediction per tree, in tree order.
	std::vector<double> predictPerTree(const Eigen::RowVectorXd &row) const;

	/**
	 * @brief Mean decrease in impurity per feature.
	 *
	 * Each tree's decreases are normalized to sum to one before averaging, so
	 * the result sums to one unless no tree ever split.
	 */
	std::vector<double> featureImportances() const;

	bool isFitted() const {
		return !trees_.empty();
	}

	std::size_t featureCount() const {
		return feature_count_;
	}

	std::size_t treeCount() const {
		return trees_.size();
	}

	const ForestConfig &config() const {
		return config_;
	}

	void save(std::ostream &out) const;

	/// @throws std::runtime_error On a malformed or truncated record.
	static std::unique_ptr<RegressionForest> load(std::istream &in);

private:
	explicit RegressionForest(ForestConfig config);

	ForestConfig config_;
	std::vector<RegressionTree> trees_;
	std::size_t feature_count_ = 0;
};

/**
 * @class RegressionForestBuilder
 * @brief A builder for fluently configuring RegressionForest instances.
 */
class RegressionForestBuilder {
public:
	RegressionForestBuilder &withTrees(std::size_t n_trees);
	RegressionForestBuilder &withMaxDepth(int depth);
	RegressionForestBuilder &withMinSamplesSplit(std::size_t n);
	RegressionForestBuilder &withMinSamplesLeaf(std::size_t n);
	RegressionForestBuilder &withBootstrap(bool enabled);
	RegressionForestBuilder &withSeed(std::uint32_t seed);
	RegressionForestBuilder &withConfig(const ForestConfig &config);

	/// @throws std::invalid_argument If the configuration is invalid.
	std::unique_ptr<RegressionForest> build();

private:
	ForestConfig config_;
};

} // namespace finsight::models
