#pragma once

#include "regime-ar/regression/regression_result.hpp"
#include <Eigen/Dense>

namespace regimear::regression {

/**
 * @class OLSSolver
 * @brief Ordinary least squares through a column-pivoting Householder QR.
 *
 * The design matrix is used as given: no intercept column is added, so the
 * caller includes constant columns where it wants them. Rank-deficient
 * designs are solved on the leading pivoted columns and the remaining ones
 * are reported as aliased.
 */
class OLSSolver {
public:
	/**
	 * @brief Fits y = X * beta + e.
	 * @param y Response vector (length n).
	 * @param X Design matrix (n x p).
	 * @param tolerance QR rank threshold, or a non-positive value for Eigen's default.
	 * @return Coefficients, residuals, fitted values and fit statistics.
	 * @throws std::invalid_argument on empty input or mismatched dimensions.
	 */
	static RegressionResult fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, double tolerance = -1.0);

	/// True when rank(X) == cols(X).
	static bool isFullRank(const Eigen::MatrixXd &X, double tolerance = -1.0);

private:
	static void computeStatistics(const Eigen::VectorXd &y, RegressionResult &result);
	static void computeStandardErrors(const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> &qr,
	                                  RegressionResult &result);
};

} // namespace regimear::regression
