#include "regime-ar/regression/ols_solver.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace regimear::regression {

RegressionResult OLSSolver::fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, double tolerance) {
	if (X.rows() == 0 || X.cols() == 0) {
		throw std::invalid_argument("Design matrix must not be empty.");
	}
	if (y.size() != X.rows()) {
		throw std::invalid_argument("Response length must match the number of design rows.");
	}

	const auto n = static_cast<std::size_t>(X.rows());
	const auto p = static_cast<std::size_t>(X.cols());
	RegressionResult result(n, p);

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (tolerance > 0.0) {
		qr.setThreshold(tolerance);
	}
	result.tolerance_used = qr.threshold();
	result.rank = static_cast<std::size_t>(qr.rank());

	const auto rank = static_cast<Eigen::Index>(result.rank);
	const auto &P = qr.colsPermutation();

	// Solve only the leading rank x rank triangle; trailing pivots stay aliased.
	if (rank > 0) {
		const Eigen::VectorXd qty = qr.matrixQ().transpose() * y;
		const Eigen::MatrixXd R = qr.matrixQR().topLeftCorner(rank, rank);
		const Eigen::VectorXd beta = R.triangularView<Eigen::Upper>().solve(qty.head(rank));

		for (Eigen::Index i = 0; i < rank; ++i) {
			const Eigen::Index original = P.indices()[i];
			result.coefficients[original] = beta[i];
			result.is_aliased[static_cast<std::size_t>(original)] = false;
		}
	}

	result.fitted_values.setZero();
	for (std::size_t j = 0; j < p; ++j) {
		if (!result.is_aliased[j]) {
			const auto col = static_cast<Eigen::Index>(j);
			result.fitted_values += result.coefficients[col] * X.col(col);
		}
	}
	result.residuals = y - result.fitted_values;

	computeStatistics(y, result);
	computeStandardErrors(qr, result);
	return result;
}

bool OLSSolver::isFullRank(const Eigen::MatrixXd &X, double tolerance) {
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (tolerance > 0.0) {
		qr.setThreshold(tolerance);
	}
	return qr.rank() == X.cols();
}

void OLSSolver::computeStatistics(const Eigen::VectorXd &y, RegressionResult &result) {
	const auto n = static_cast<double>(result.n_obs);
	const auto k = static_cast<double>(result.rank);

	result.rss = result.residuals.squaredNorm();

	const double ss_tot = (y.array() - y.mean()).square().sum();
	result.r_squared = ss_tot > 1e-10 ? 1.0 - result.rss / ss_tot : 0.0;

	if (result.df_residual() > 0) {
		result.mse = result.rss / static_cast<double>(result.df_residual());
	}

	if (result.rss > 0.0) {
		result.log_likelihood = -0.5 * n * (std::log(2.0 * M_PI * result.rss / n) + 1.0);
		result.aic = -2.0 * result.log_likelihood + 2.0 * k;
		result.bic = -2.0 * result.log_likelihood + k * std::log(n);
	}
}

void OLSSolver::computeStandardErrors(const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> &qr,
                                      RegressionResult &result) {
	const auto rank = static_cast<Eigen::Index>(result.rank);
	if (rank == 0 || !std::isfinite(result.mse)) {
		return;
	}

	// (X_r' X_r)^{-1} = R^{-1} R^{-T} on the non-aliased pivoted columns.
	const Eigen::MatrixXd R = qr.matrixQR().topLeftCorner(rank, rank).triangularView<Eigen::Upper>();
	const Eigen::MatrixXd R_inv =
	    R.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(rank, rank));

	const auto &P = qr.colsPermutation();
	for (Eigen::Index i = 0; i < rank; ++i) {
		const double variance = result.mse * R_inv.row(i).squaredNorm();
		result.std_errors[P.indices()[i]] = std::sqrt(variance);
	}
}

} // namespace regimear::regression
