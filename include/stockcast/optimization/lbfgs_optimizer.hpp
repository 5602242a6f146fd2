#pragma once

#include <functional>
#include <string>
#include <vector>

namespace stockcast::optimization {

/**
 * @brief Box-constrained L-BFGS-B minimizer.
 *
 * Thin wrapper around LBFGS++ taking std::vector parameters so callers do not
 * depend on Eigen. Used for MAP estimation of the additive trend model.
 */
class LBFGSOptimizer {
public:
	using Objective = std::function<double(const std::vector<double> &, std::vector<double> &)>;

	struct Result {
		std::vector<double> x;
		double fx = 0.0;
		int iterations = 0;
		bool converged = false;
		std::string message;
	};

	struct Options {
		Options() {}

		int max_iterations = 200;
		double epsilon = 1e-6;   // gradient norm tolerance
		int m = 10;              // L-BFGS memory
		double ftol = 1e-4;      // Armijo line-search tolerance
		int max_linesearch = 30;
	};

	/**
	 * @brief Minimize @p objective within [lower, upper].
	 *
	 * @p objective returns f(x) and writes the gradient into its second argument.
	 * When the solver stops abnormally the best feasible point is still
	 * returned with converged = false.
	 */
	static Result minimize(const Objective &objective, const std::vector<double> &x0,
	                       const std::vector<double> &lower, const std::vector<double> &upper,
	                       const Options &options = Options());

private:
	static void projectBounds(std::vector<double> &x, const std::vector<double> &lower,
	                          const std::vector<double> &upper);
};

} // namespace stockcast::optimization
