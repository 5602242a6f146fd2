#include "stockcast/optimization/lbfgs_optimizer.hpp"

#include "stockcast/utils/logging.hpp"

#include <Eigen/Core>
#include <LBFGSB.h>

#include <algorithm>
#include <stdexcept>

namespace stockcast::optimization {

void LBFGSOptimizer::projectBounds(std::vector<double> &x, const std::vector<double> &lower,
                                   const std::vector<double> &upper) {
	for (std::size_t i = 0; i < x.size(); ++i) {
		x[i] = std::max(lower[i], std::min(x[i], upper[i]));
	}
}

LBFGSOptimizer::Result LBFGSOptimizer::minimize(const Objective &objective, const std::vector<double> &x0,
                                                const std::vector<double> &lower,
                                                const std::vector<double> &upper, const Options &options) {
	if (x0.empty()) {
		throw std::invalid_argument("LBFGSOptimizer requires at least one parameter.");
	}
	if (lower.size() != x0.size() || upper.size() != x0.size()) {
		throw std::invalid_argument("LBFGSOptimizer bounds must match the parameter count.");
	}

	const int n = static_cast<int>(x0.size());
	Eigen::VectorXd x = Eigen::VectorXd::Map(x0.data(), n);
	const Eigen::VectorXd lb = Eigen::VectorXd::Map(lower.data(), n);
	const Eigen::VectorXd ub = Eigen::VectorXd::Map(upper.data(), n);
	x = x.cwiseMax(lb).cwiseMin(ub);

	LBFGSpp::LBFGSBParam<double> param;
	param.max_iterations = options.max_iterations;
	param.epsilon = options.epsilon;
	param.epsilon_rel = options.epsilon;
	param.m = options.m;
	param.ftol = options.ftol;
	param.wolfe = 0.9;
	param.max_linesearch = options.max_linesearch;

	LBFGSpp::LBFGSBSolver<double> solver(param);

	std::vector<double> x_vec(static_cast<std::size_t>(n));
	std::vector<double> grad_vec(static_cast<std::size_t>(n));
	auto eigen_objective = [&](const Eigen::VectorXd &x_eigen, Eigen::VectorXd &grad_eigen) {
		for (int i = 0; i < n; ++i) {
			x_vec[static_cast<std::size_t>(i)] = x_eigen[i];
		}
		const double fx = objective(x_vec, grad_vec);
		for (int i = 0; i < n; ++i) {
			grad_eigen[i] = grad_vec[static_cast<std::size_t>(i)];
		}
		return fx;
	};

	Result result;
	double fx = 0.0;
	try {
		result.iterations = solver.minimize(eigen_objective, x, fx, lb, ub);
		result.fx = fx;
		result.converged = true;
		result.message = "Converged";
		STOCKCAST_DEBUG("L-BFGS-B converged in {} iterations, f = {}", result.iterations, fx);
	} catch (const std::exception &e) {
		// LBFGS++ throws when the line search cannot make progress; x holds the last accepted point.
		result.fx = fx;
		result.converged = false;
		result.message = std::string("Stopped: ") + e.what();
		STOCKCAST_DEBUG("L-BFGS-B stopped early: {}", e.what());
	}

	result.x.assign(x.data(), x.data() + n);
	projectBounds(result.x, lower, upper);
	return result;
}

} // namespace stockcast::optimization
