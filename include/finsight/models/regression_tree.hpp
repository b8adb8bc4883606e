#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <iosfwd>
#include <vector>

namespace finsight::models {

struct TreeConfig {
	int max_depth = 0;  // 0 = grow until the leaf constraints stop it
	std::size_t min_samples_split = 2;
	std::size_t min_samples_leaf = 1;
};

/**
 * @class RegressionTree
 * @brief A CART regression tree grown on squared error.
 *
 * Nodes live in one flat vector and refer to their children by index. A row
 * goes left when its split feature is strictly below the threshold.
 */
class RegressionTree {
public:
	RegressionTree() = default;
	explicit RegressionTree(TreeConfig config);

	/**
	 * @brief Grows the tree on the given rows of @p x.
	 *
	 * @p samples may repeat indices; a repeated index counts as a repeated
	 * observation, which is how bootstrap samples are represented.
	 * @throws std::invalid_argument If the inputs are empty or inconsistent.
	 */
	void fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, const std::vector<std::size_t> &samples);

	/// @throws std::runtime_error If the tree has not been fitted.
	double predict(const Eigen::RowVectorXd &row) const;

	/// Total weighted squared-error decrease attributed to each feature.
	const std::vector<double> &impurityDecrease() const {
		return impurity_decrease_;
	}

	bool isFitted() const {
		return !nodes_.empty();
	}

	std::size_t nodeCount() const {
		return nodes_.size();
	}

	int depth() const;

	void save(std::ostream &out) const;
	static RegressionTree load(std::istream &in);

private:
	struct Node {
		int feature = -1;  // -1 marks a leaf
		double threshold = 0.0;
		int left = -1;
		int right = -1;
		double value = 0.0;
	};

	struct Split {
		int feature = -1;
		double threshold = 0.0;
		double gain = 0.0;
	};

	int grow(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, std::vector<std::size_t> &samples, int depth);
	Split bestSplit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, const std::vector<std::size_t> &samples,
	                double parent_sse) const;
	int subtreeDepth(int node) const;

	TreeConfig config_;
	std::vector<Node> nodes_;
	std::vector<double> impurity_decrease_;
};

} // namespace finsight::models
