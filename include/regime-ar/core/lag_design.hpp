#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace regimear::core {

/**
 * @struct LaggedDesign
 * @brief Autoregressive regression data aligned after the initial lag history.
 *
 * Row r corresponds to time t = r + ar_order. The response holds y[t] and the
 * regressors hold [1, y[t-1], ..., y[t-ar_order]].
 */
struct LaggedDesign {
	Eigen::VectorXd response;
	Eigen::MatrixXd regressors;
	int ar_order = 0;

	std::size_t rows() const {
		return static_cast<std::size_t>(regressors.rows());
	}

	/// Number of regressors per regime block (constant plus lags).
	int blockWidth() const {
		return ar_order + 1;
	}
};

/**
 * @class LaggedDesignBuilder
 * @brief Builds the constant-plus-lags design used by every autoregression.
 */
class LaggedDesignBuilder {
public:
	/**
	 * @brief Builds the lagged design for an AR(ar_order) regression.
	 * @param series Observations in time order.
	 * @param ar_order Number of lags, at least 1.
	 * @return Design with series.size() - ar_order rows.
	 * @throws ConfigurationError when ar_order < 1 or the series is too short.
	 */
	static LaggedDesign build(const std::vector<double> &series, int ar_order);

	/**
	 * @brief Lag matrix without the constant column, trimmed to aligned rows.
	 */
	static Eigen::MatrixXd lagMatrix(const std::vector<double> &series, int ar_order);
};

} // namespace regimear::core
