#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stockcast/optimization/lbfgs_optimizer.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using stockcast::optimization::LBFGSOptimizer;

namespace {

// f(x) = (x0 - 1)^2 + 4 (x1 + 2)^2
double shiftedBowl(const std::vector<double> &x, std::vector<double> &grad) {
	grad[0] = 2.0 * (x[0] - 1.0);
	grad[1] = 8.0 * (x[1] + 2.0);
	return (x[0] - 1.0) * (x[0] - 1.0) + 4.0 * (x[1] + 2.0) * (x[1] + 2.0);
}

} // namespace

TEST_CASE("L-BFGS-B finds an interior minimum", "[optimization][lbfgs]") {
	const auto result = LBFGSOptimizer::minimize(shiftedBowl, {5.0, 5.0}, {-10.0, -10.0}, {10.0, 10.0});
	REQUIRE(result.converged);
	REQUIRE(result.x[0] == Catch::Approx(1.0).margin(1e-4));
	REQUIRE(result.x[1] == Catch::Approx(-2.0).margin(1e-4));
	REQUIRE(result.fx == Catch::Approx(0.0).margin(1e-5));
}

TEST_CASE("L-BFGS-B respects active bounds", "[optimization][lbfgs]") {
	const auto result = LBFGSOptimizer::minimize(shiftedBowl, {0.5, 0.5}, {-10.0, 0.0}, {0.5, 10.0});
	REQUIRE(result.x[0] == Catch::Approx(0.5).margin(1e-5));
	REQUIRE(result.x[1] == Catch::Approx(0.0).margin(1e-5));
}

TEST_CASE("L-BFGS-B projects an infeasible start", "[optimization][lbfgs]") {
	const auto result = LBFGSOptimizer::minimize(shiftedBowl, {50.0, -50.0}, {-3.0, -3.0}, {3.0, 3.0});
	for (std::size_t i = 0; i < result.x.size(); ++i) {
		REQUIRE(result.x[i] >= -3.0);
		REQUIRE(result.x[i] <= 3.0);
	}
	REQUIRE(result.x[0] == Catch::Approx(1.0).margin(1e-4));
}

TEST_CASE("L-BFGS-B validates dimensions", "[optimization][lbfgs]") {
	REQUIRE_THROWS_AS(LBFGSOptimizer::minimize(shiftedBowl, {}, {}, {}), std::invalid_argument);
	REQUIRE_THROWS_AS(LBFGSOptimizer::minimize(shiftedBowl, {1.0, 1.0}, {0.0}, {2.0, 2.0}), std::invalid_argument);
}
