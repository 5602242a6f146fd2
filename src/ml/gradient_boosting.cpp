#include "stockcast/ml/gradient_boosting.hpp"

#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>

namespace stockcast::ml {

namespace {

struct Split {
	bool found = false;
	std::size_t feature = 0;
	double threshold = 0.0;
	double gain = 0.0;
};

Split bestSplit(const std::vector<std::vector<double>> &X, const std::vector<double> &y,
                const std::vector<std::size_t> &rows, const std::vector<std::size_t> &features,
                std::size_t min_samples_leaf) {
	Split best;
	const double n = static_cast<double>(rows.size());
	double total = 0.0;
	for (std::size_t r : rows) {
		total += y[r];
	}
	const double parent_score = total * total / n;

	std::vector<std::size_t> order(rows);
	for (std::size_t feature : features) {
		std::sort(order.begin(), order.end(),
		          [&](std::size_t a, std::size_t b) { return X[a][feature] < X[b][feature]; });
		double left_sum = 0.0;
		for (std::size_t i = 0; i + 1 < order.size(); ++i) {
			left_sum += y[order[i]];
			const std::size_t left_count = i + 1;
			const std::size_t right_count = order.size() - left_count;
			const double current = X[order[i]][feature];
			const double next = X[order[i + 1]][feature];
			if (current == next || left_count < min_samples_leaf || right_count < min_samples_leaf) {
				continue;
			}
			const double right_sum = total - left_sum;
			// SSE reduction up to a constant: sum^2 / count per child minus the parent's.
			const double gain = left_sum * left_sum / static_cast<double>(left_count) +
			                    right_sum * right_sum / static_cast<double>(right_count) - parent_score;
			if (gain > best.gain + 1e-12) {
				best.found = true;
				best.feature = feature;
				best.threshold = 0.5 * (current + next);
				// Neighbours one ulp apart round the midpoint up to next.
				if (!(best.threshold < next)) {
					best.threshold = current;
				}
				best.gain = gain;
			}
		}
	}
	return best;
}

std::vector<std::size_t> sampleIndices(std::size_t count, double share, std::mt19937 &rng) {
	std::vector<std::size_t> indices(count);
	std::iota(indices.begin(), indices.end(), 0);
	const auto take = std::max<std::size_t>(1, static_cast<std::size_t>(std::round(share * static_cast<double>(count))));
	if (take >= count) {
		return indices;
	}
	std::shuffle(indices.begin(), indices.end(), rng);
	indices.resize(take);
	std::sort(indices.begin(), indices.end());
	return indices;
}

} // namespace

void RegressionTree::fit(const std::vector<std::vector<double>> &X, const std::vector<double> &y,
                         const std::vector<std::size_t> &rows, const std::vector<std::size_t> &features,
                         int max_depth, std::size_t min_samples_leaf) {
	if (rows.empty()) {
		throw std::invalid_argument("RegressionTree requires at least one training row.");
	}
	nodes_.clear();
	max_depth_ = max_depth;
	min_samples_leaf_ = std::max<std::size_t>(1, min_samples_leaf);
	build(X, y, rows, features, 0);
}

int RegressionTree::build(const std::vector<std::vector<double>> &X, const std::vector<double> &y,
                          std::vector<std::size_t> rows, const std::vector<std::size_t> &features, int depth) {
	const int index = static_cast<int>(nodes_.size());
	nodes_.emplace_back();

	double sum = 0.0;
	for (std::size_t r : rows) {
		sum += y[r];
	}
	nodes_[static_cast<std::size_t>(index)].value = sum / static_cast<double>(rows.size());

	if (depth >= max_depth_ || rows.size() < 2 * min_samples_leaf_) {
		return index;
	}
	const Split split = bestSplit(X, y, rows, features, min_samples_leaf_);
	if (!split.found) {
		return index;
	}

	std::vector<std::size_t> left_rows;
	std::vector<std::size_t> right_rows;
	for (std::size_t r : rows) {
		(X[r][split.feature] <= split.threshold ? left_rows : right_rows).push_back(r);
	}
	if (left_rows.empty() || right_rows.empty()) {
		return index;
	}
	rows.clear();
	rows.shrink_to_fit();

	const int left = build(X, y, std::move(left_rows), features, depth + 1);
	const int right = build(X, y, std::move(right_rows), features, depth + 1);

	Node &node = nodes_[static_cast<std::size_t>(index)];
	node.leaf = false;
	node.feature = split.feature;
	node.threshold = split.threshold;
	node.left = left;
	node.right = right;
	return index;
}

double RegressionTree::predict(const std::vector<double> &x) const {
	if (nodes_.empty()) {
		throw std::runtime_error("RegressionTree::predict called before fit.");
	}
	std::size_t current = 0;
	while (!nodes_[current].leaf) {
		const Node &node = nodes_[current];
		current = static_cast<std::size_t>(x[node.feature] <= node.threshold ? node.left : node.right);
	}
	return nodes_[current].value;
}

GradientBoostingRegressor::GradientBoostingRegressor(BoostingConfig config) : config_(config) {
	if (config_.n_estimators <= 0 || config_.max_depth <= 0) {
		throw std::invalid_argument("Boosting needs a positive number of trees and depth.");
	}
	if (config_.learning_rate <= 0.0 || config_.learning_rate > 1.0) {
		throw std::invalid_argument("Learning rate must be in (0, 1].");
	}
	if (config_.subsample <= 0.0 || config_.subsample > 1.0 || config_.colsample <= 0.0 ||
	    config_.colsample > 1.0) {
		throw std::invalid_argument("Subsample ratios must be in (0, 1].");
	}
}

void GradientBoostingRegressor::fit(const std::vector<std::vector<double>> &X, const std::vector<double> &y) {
	if (X.empty() || X.size() != y.size()) {
		throw std::invalid_argument("Boosting requires matching, non-empty features and targets.");
	}
	const std::size_t n_features = X.front().size();
	if (n_features == 0) {
		throw std::invalid_argument("Boosting requires at least one feature.");
	}

	std::mt19937 rng(config_.seed);
	base_score_ = std::accumulate(y.begin(), y.end(), 0.0) / static_cast<double>(y.size());
	std::vector<double> prediction(y.size(), base_score_);
	std::vector<double> residual(y.size());

	trees_.clear();
	trees_.reserve(static_cast<std::size_t>(config_.n_estimators));
	for (int m = 0; m < config_.n_estimators; ++m) {
		for (std::size_t i = 0; i < y.size(); ++i) {
			residual[i] = y[i] - prediction[i];
		}
		const auto rows = sampleIndices(y.size(), config_.subsample, rng);
		const auto features = sampleIndices(n_features, config_.colsample, rng);

		RegressionTree tree;
		tree.fit(X, residual, rows, features, config_.max_depth, config_.min_samples_leaf);
		for (std::size_t i = 0; i < y.size(); ++i) {
			prediction[i] += config_.learning_rate * tree.predict(X[i]);
		}
		trees_.push_back(std::move(tree));
	}
	is_fitted_ = true;
	STOCKCAST_DEBUG("Gradient boosting trained {} trees on {} rows x {} features", trees_.size(), y.size(),
	                n_features);
}

double GradientBoostingRegressor::predict(const std::vector<double> &x) const {
	if (!is_fitted_) {
		throw std::runtime_error("GradientBoostingRegressor::predict called before fit.");
	}
	double value = base_score_;
	for (const auto &tree : trees_) {
		value += config_.learning_rate * tree.predict(x);
	}
	return value;
}

} // namespace stockcast::ml
