#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace regimear::regression {

/**
 * @struct RegressionResult
 * @brief Output of a least-squares fit.
 *
 * Coefficients follow the column order of the design matrix. Columns found to
 * be linearly dependent on earlier pivots are aliased: their coefficient and
 * standard error are NaN and is_aliased is set.
 */
struct RegressionResult {
	/// Estimated coefficients (length = n_params), NaN for aliased columns.
	Eigen::VectorXd coefficients;

	/// Standard errors (length = n_params), NaN for aliased columns.
	Eigen::VectorXd std_errors;

	/// y - X * beta (length = n_obs).
	Eigen::VectorXd residuals;

	/// X * beta (length = n_obs).
	Eigen::VectorXd fitted_values;

	/// Numerical rank of the design matrix.
	std::size_t rank = 0;
	std::size_t n_params = 0;
	std::size_t n_obs = 0;

	std::vector<bool> is_aliased;

	/// Threshold used by the QR decomposition to decide rank.
	double tolerance_used = -1.0;

	/// Residual sum of squares.
	double rss = std::numeric_limits<double>::quiet_NaN();

	/// RSS / df_residual, NaN for saturated fits.
	double mse = std::numeric_limits<double>::quiet_NaN();

	/// Centered R², 1 - RSS / TSS.
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Gaussian log-likelihood at the ML variance RSS / n.
	double log_likelihood = std::numeric_limits<double>::quiet_NaN();

	/// AIC = -2 log L + 2 k with k = rank
	double aic = std::numeric_limits<double>::quiet_NaN();

	/// BIC = -2 log L + k log(n)
	double bic = std::numeric_limits<double>::quiet_NaN();

	RegressionResult() = default;

	RegressionResult(std::size_t n_obs_, std::size_t n_params_)
	    : n_params(n_params_), n_obs(n_obs_) {
		coefficients = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n_params_),
		                                         std::numeric_limits<double>::quiet_NaN());
		std_errors = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n_params_),
		                                       std::numeric_limits<double>::quiet_NaN());
		residuals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		fitted_values = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		is_aliased.assign(n_params_, true);
	}

	std::size_t df_model() const {
		return rank;
	}

	std::size_t df_residual() const {
		return n_obs > rank ? n_obs - rank : 0;
	}

	/// True when every column was estimated.
	bool isFullRank() const {
		return n_params > 0 && rank == n_params;
	}
};

} // namespace regimear::regression
