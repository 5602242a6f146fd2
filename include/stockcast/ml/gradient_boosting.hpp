#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stockcast::ml {

struct BoostingConfig {
	int n_estimators = 400;
	int max_depth = 4;
	double learning_rate = 0.05;
	/// Share of rows drawn (without replacement) for each tree.
	double subsample = 0.8;
	/// Share of features drawn for each tree.
	double colsample = 0.8;
	std::size_t min_samples_leaf = 1;
	std::uint32_t seed = 42;
};

/**
 * @class RegressionTree
 * @brief Depth-limited least-squares regression tree with exhaustive split search.
 */
class RegressionTree {
public:
	void fit(const std::vector<std::vector<double>> &X, const std::vector<double> &y,
	         const std::vector<std::size_t> &rows, const std::vector<std::size_t> &features, int max_depth,
	         std::size_t min_samples_leaf);

	double predict(const std::vector<double> &x) const;

	std::size_t nodeCount() const {
		return nodes_.size();
	}

private:
	struct Node {
		bool leaf = true;
		std::size_t feature = 0;
		double threshold = 0.0;
		int left = -1;
		int right = -1;
		double value = 0.0;
	};

	int build(const std::vector<std::vector<double>> &X, const std::vector<double> &y,
	          std::vector<std::size_t> rows, const std::vector<std::size_t> &features, int depth);

	std::vector<Node> nodes_;
	int max_depth_ = 0;
	std::size_t min_samples_leaf_ = 1;
};

/**
 * @class GradientBoostingRegressor
 * @brief Squared-loss gradient boosting with row and column subsampling.
 *
 * Each tree fits the residuals of the current ensemble on a random subset
 * of rows and features; its output is shrunk by the learning rate.
 * Training is deterministic for a given seed.
 */
class GradientBoostingRegressor {
public:
	explicit GradientBoostingRegressor(BoostingConfig config = BoostingConfig{});

	void fit(const std::vector<std::vector<double>> &X, const std::vector<double> &y);

	double predict(const std::vector<double> &x) const;

	std::size_t treeCount() const {
		return trees_.size();
	}

	const BoostingConfig &config() const {
		return config_;
	}

private:
	BoostingConfig config_;
	double base_score_ = 0.0;
	std::vector<RegressionTree> trees_;
	bool is_fitted_ = false;
};

} // namespace stockcast::ml
