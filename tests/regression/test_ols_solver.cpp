#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "regime-ar/regression/ols_solver.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

using regimear::regression::OLSSolver;

TEST_CASE("OLS recovers exact coefficients on noiseless data", "[regression][ols]") {
	const Eigen::Index n = 20;
	Eigen::MatrixXd X(n, 2);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		const double x = static_cast<double>(i) * 0.5;
		X(i, 0) = 1.0;
		X(i, 1) = x;
		y[i] = 2.0 + 3.0 * x;
	}

	const auto result = OLSSolver::fit(y, X);

	REQUIRE(result.rank == 2);
	REQUIRE(result.isFullRank());
	REQUIRE(result.coefficients[0] == Catch::Approx(2.0).margin(1e-10));
	REQUIRE(result.coefficients[1] == Catch::Approx(3.0).margin(1e-10));
	REQUIRE(result.residuals.cwiseAbs().maxCoeff() < 1e-9);
	REQUIRE(result.fitted_values[5] == Catch::Approx(y[5]));
	REQUIRE(result.r_squared == Catch::Approx(1.0));
	REQUIRE(result.df_residual() == 18);
}

TEST_CASE("OLS marks linearly dependent columns as aliased", "[regression][ols][rank]") {
	const Eigen::Index n = 15;
	Eigen::MatrixXd X(n, 3);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		const double x = static_cast<double>(i);
		X(i, 0) = 1.0;
		X(i, 1) = x;
		X(i, 2) = 2.0 * x;
		y[i] = 1.0 + 0.5 * x + 0.01 * std::sin(x);
	}

	const auto result = OLSSolver::fit(y, X);

	REQUIRE(result.rank == 2);
	REQUIRE_FALSE(result.isFullRank());
	REQUIRE(std::count(result.is_aliased.begin(), result.is_aliased.end(), true) == 1);
	REQUIRE(result.is_aliased[0] == false);
	REQUIRE(OLSSolver::isFullRank(X) == false);
}

TEST_CASE("OLS handles structural zero blocks", "[regression][ols][regimes]") {
	// Two regimes with separate intercept and slope, masked by row.
	const Eigen::Index n = 30;
	Eigen::MatrixXd X = Eigen::MatrixXd::Zero(n, 4);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		const double x = static_cast<double>(i % 7);
		if (i % 2 == 0) {
			X(i, 0) = 1.0;
			X(i, 1) = x;
			y[i] = 1.0 + 0.5 * x;
		} else {
			X(i, 2) = 1.0;
			X(i, 3) = x;
			y[i] = -1.0 - 2.0 * x;
		}
	}

	const auto result = OLSSolver::fit(y, X);

	REQUIRE(result.isFullRank());
	REQUIRE(result.coefficients[0] == Catch::Approx(1.0).margin(1e-9));
	REQUIRE(result.coefficients[1] == Catch::Approx(0.5).margin(1e-9));
	REQUIRE(result.coefficients[2] == Catch::Approx(-1.0).margin(1e-9));
	REQUIRE(result.coefficients[3] == Catch::Approx(-2.0).margin(1e-9));
}

TEST_CASE("OLS reports fit statistics on noisy data", "[regression][ols][statistics]") {
	std::mt19937 rng(11);
	std::normal_distribution<double> noise(0.0, 0.5);

	const Eigen::Index n = 100;
	Eigen::MatrixXd X(n, 2);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		const double x = static_cast<double>(i) / 10.0;
		X(i, 0) = 1.0;
		X(i, 1) = x;
		y[i] = 1.0 - 0.7 * x + noise(rng);
	}

	const auto result = OLSSolver::fit(y, X);

	REQUIRE(result.coefficients[1] == Catch::Approx(-0.7).margin(0.1));
	REQUIRE(result.rss == Catch::Approx(result.residuals.squaredNorm()));
	REQUIRE(result.mse == Catch::Approx(result.rss / 98.0));
	REQUIRE(std::isfinite(result.log_likelihood));
	REQUIRE(result.aic == Catch::Approx(-2.0 * result.log_likelihood + 4.0));
	REQUIRE(result.bic > result.aic);
	REQUIRE(result.std_errors[0] > 0.0);
	REQUIRE(result.std_errors[1] > 0.0);

	// Residuals are orthogonal to the design.
	const Eigen::VectorXd score = X.transpose() * result.residuals;
	REQUIRE(score.cwiseAbs().maxCoeff() < 1e-8);
}

TEST_CASE("OLS validates dimensions", "[regression][ols][validation]") {
	Eigen::MatrixXd X = Eigen::MatrixXd::Ones(5, 2);
	Eigen::VectorXd y = Eigen::VectorXd::Ones(4);
	REQUIRE_THROWS_AS(OLSSolver::fit(y, X), std::invalid_argument);
	REQUIRE_THROWS_AS(OLSSolver::fit(Eigen::VectorXd(), Eigen::MatrixXd()), std::invalid_argument);
}
