#include "finsight/models/regression_tree.hpp"

#include <algorithm>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace finsight::models {

namespace {

constexpr double kMinGain = 1e-12;

double sumSquaredError(const Eigen::VectorXd &y, const std::vector<std::size_t> &samples) {
	double sum = 0.0;
	double sum_sq = 0.0;
	for (auto idx : samples) {
		const double v = y(static_cast<Eigen::Index>(idx));
		sum += v;
		sum_sq += v * v;
	}
	const double n = static_cast<double>(samples.size());
	return std::max(0.0, sum_sq - sum * sum / n);
}

} // namespace

RegressionTree::RegressionTree(TreeConfig config) : config_(config) {
	if (config_.min_samples_leaf < 1) {
		throw std::invalid_argument("min_samples_leaf must be at least 1.");
	}
	if (config_.min_samples_split < 2) {
		throw std::invalid_argument("min_samples_split must be at least 2.");
	}
	if (config_.max_depth < 0) {
		throw std::invalid_argument("max_depth must be non-negative.");
	}
}

void RegressionTree::fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, const std::vector<std::size_t> &samples) {
	if (x.rows() == 0 || x.cols() == 0) {
		throw std::invalid_argument("Cannot fit a regression tree on an empty design matrix.");
	}
	if (x.rows() != y.size()) {
		throw std::invalid_argument("Design matrix and target must have the same number of rows.");
	}
	if (samples.empty()) {
		throw std::invalid_argument("Cannot fit a regression tree on an empty sample.");
	}
	for (auto idx : samples) {
		if (idx >= static_cast<std::size_t>(x.rows())) {
			throw std::invalid_argument("Sample index out of range.");
		}
	}

	nodes_.clear();
	impurity_decrease_.assign(static_cast<std::size_t>(x.cols()), 0.0);
	std::vector<std::size_t> working(samples);
	grow(x, y, working, 0);
}

int RegressionTree::grow(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, std::vector<std::size_t> &samples,
                         int depth) {
	const int index = static_cast<int>(nodes_.size());
	nodes_.emplace_back();

	double sum = 0.0;
	for (auto idx : samples) {
		sum += y(static_cast<Eigen::Index>(idx));
	}
	nodes_[static_cast<std::size_t>(index)].value = sum / static_cast<double>(samples.size());

	const double sse = sumSquaredError(y, samples);
	const bool depth_reached = config_.max_depth > 0 && depth >= config_.max_depth;
	if (depth_reached || samples.size() < config_.min_samples_split ||
	    samples.size() < 2 * config_.min_samples_leaf || sse <= kMinGain) {
		return index;
	}

	const Split split = bestSplit(x, y, samples, sse);
	if (split.feature < 0) {
		return index;
	}

	std::vector<std::size_t> left;
	std::vector<std::size_t> right;
	left.reserve(samples.size());
	right.reserve(samples.size());
	for (auto idx : samples) {
		if (x(static_cast<Eigen::Index>(idx), split.feature) < split.threshold) {
			left.push_back(idx);
		} else {
			right.push_back(idx);
		}
	}
	samples.clear();
	samples.shrink_to_fit();

	impurity_decrease_[static_cast<std::size_t>(split.feature)] += split.gain;

	const int left_index = grow(x, y, left, depth + 1);
	const int right_index = grow(x, y, right, depth + 1);

	auto &node = nodes_[static_cast<std::size_t>(index)];
	node.feature = split.feature;
	node.threshold = split.threshold;
	node.left = left_index;
	node.right = right_index;
	return index;
}

RegressionTree::Split RegressionTree::bestSplit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
                                                const std::vector<std::size_t> &samples, double parent_sse) const {
	Split best;
	const std::size_t n = samples.size();
	const std::size_t min_leaf = config_.min_samples_leaf;
	std::vector<std::pair<double, double>> ordered(n);

	for (Eigen::Index feature = 0; feature < x.cols(); ++feature) {
		for (std::size_t i = 0; i < n; ++i) {
			const auto row = static_cast<Eigen::Index>(samples[i]);
			ordered[i] = {x(row, feature), y(row)};
		}
		std::sort(ordered.begin(), ordered.end(),
		          [](const auto &a, const auto &b) { return a.first < b.first; });
		if (ordered.front().first == ordered.back().first) {
			continue;
		}

		double total_sum = 0.0;
		double total_sq = 0.0;
		for (const auto &entry : ordered) {
			total_sum += entry.second;
			total_sq += entry.second * entry.second;
		}

		double left_sum = 0.0;
		double left_sq = 0.0;
		for (std::size_t i = 0; i + 1 < n; ++i) {
			left_sum += ordered[i].second;
			left_sq += ordered[i].second * ordered[i].second;
			const std::size_t n_left = i + 1;
			const std::size_t n_right = n - n_left;
			if (n_left < min_leaf) {
				continue;
			}
			if (n_right < min_leaf) {
				break;
			}
			if (!(ordered[i].first < ordered[i + 1].first)) {
				continue;
			}
			const double right_sum = total_sum - left_sum;
			const double right_sq = total_sq - left_sq;
			const double sse_left = left_sq - left_sum * left_sum / static_cast<double>(n_left);
			const double sse_right = right_sq - right_sum * right_sum / static_cast<double>(n_right);
			const double gain = parent_sse - sse_left - sse_right;
			if (gain > best.gain + kMinGain) {
				const double lo = ordered[i].first;
				const double hi = ordered[i + 1].first;
				double threshold = lo + (hi - lo) / 2.0;
				if (threshold <= lo) {
					threshold = hi;
				}
				best.feature = static_cast<int>(feature);
				best.threshold = threshold;
				best.gain = gain;
			}
		}
	}
	return best;
}

double RegressionTree::predict(const Eigen::RowVectorXd &row) const {
	if (nodes_.empty()) {
		throw std::runtime_error("Predict called before fit.");
	}
	std::size_t current = 0;
	while (nodes_[current].feature >= 0) {
		const auto &node = nodes_[current];
		if (node.feature >= row.size()) {
			throw std::invalid_argument("Feature row is shorter than the tree's feature count.");
		}
		current = static_cast<std::size_t>(row(node.feature) < node.threshold ? node.left : node.right);
	}
	return nodes_[current].value;
}

int RegressionTree::depth() const {
	return nodes_.empty() ? 0 : subtreeDepth(0);
}

int RegressionTree::subtreeDepth(int node) const {
	const auto &current = nodes_[static_cast<std::size_t>(node)];
	if (current.feature < 0) {
		return 0;
	}
	return 1 + std::max(subtreeDepth(current.left), subtreeDepth(current.right));
}

void RegressionTree::save(std::ostream &out) const {
	out.precision(std::numeric_limits<double>::max_digits10);
	out << "tree " << nodes_.size() << ' ' << impurity_decrease_.size() << '\n';
	for (const auto &node : nodes_) {
		out << node.feature << ' ' << node.threshold << ' ' << node.left << ' ' << node.right << ' ' << node.value
		    << '\n';
	}
	for (std::size_t i = 0; i < impurity_decrease_.size(); ++i) {
		out << (i == 0 ? "" : " ") << impurity_decrease_[i];
	}
	out << '\n';
}

RegressionTree RegressionTree::load(std::istream &in) {
	std::string tag;
	std::size_t node_count = 0;
	std::size_t feature_count = 0;
	if (!(in >> tag >> node_count >> feature_count) || tag != "tree") {
		throw std::runtime_error("Malformed regression tree record.");
	}

	RegressionTree tree;
	tree.nodes_.resize(node_count);
	for (auto &node : tree.nodes_) {
		if (!(in >> node.feature >> node.threshold >> node.left >> node.right >> node.value)) {
			throw std::runtime_error("Truncated regression tree record.");
		}
		const auto limit = static_cast<int>(node_count);
		if (node.feature >= 0 && (node.left <= 0 || node.right <= 0 || node.left >= limit || node.right >= limit)) {
			throw std::runtime_error("Regression tree record has an invalid child index.");
		}
	}
	tree.impurity_decrease_.resize(feature_count);
	for (auto &value : tree.impurity_decrease_) {
		if (!(in >> value)) {
			throw std::runtime_error("Truncated regression tree importances.");
		}
	}
	return tree;
}

} // namespace finsight::models
