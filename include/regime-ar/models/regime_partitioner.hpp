#pragma once

#include "regime-ar/core/lag_design.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <variant>
#include <vector>

namespace regimear::models {

/**
 * @brief Regime-masked regression data for one (delay, thresholds) pair.
 *
 * design has order blocks of ar_order + 1 columns. Block i equals the lagged
 * regressors on rows assigned to regime i and zero elsewhere.
 */
struct PartitionedDesign {
	Eigen::VectorXd response;
	Eigen::MatrixXd design;
	std::vector<int> regimes;              // Regime index per row
	std::vector<std::size_t> regime_counts; // Rows per regime
	int order = 0;
};

/**
 * @brief First regime found below the minimum row count.
 */
struct RegimeTooSmall {
	int regime = 0;
	std::size_t count = 0;
	std::size_t required = 0;
};

using PartitionOutcome = std::variant<PartitionedDesign, RegimeTooSmall>;

/**
 * @class RegimePartitioner
 * @brief Splits the lagged design into regimes by thresholding a delayed copy of the series.
 *
 * The partitioner keeps references to the series and design it was built
 * with; both must outlive it.
 */
class RegimePartitioner {
public:
	RegimePartitioner(const std::vector<double> &series, const core::LaggedDesign &lagged,
	                  std::size_t min_regime_num);
	RegimePartitioner(std::vector<double> &&, const core::LaggedDesign &, std::size_t) = delete;
	RegimePartitioner(const std::vector<double> &, core::LaggedDesign &&, std::size_t) = delete;

	/**
	 * @brief Threshold variable y[t - delay] aligned with the design rows.
	 * @throws ConfigurationError when delay is outside [1, ar_order].
	 */
	std::vector<double> thresholdVariable(int delay) const;

	/**
	 * @brief Regime index of every row: the number of thresholds strictly below
	 *        the row's threshold-variable value.
	 */
	std::vector<int> assignRegimes(int delay, const std::vector<double> &thresholds) const;

	/**
	 * @brief Builds the partitioned design or reports the first undersized regime.
	 * @param delay Delay in [1, ar_order].
	 * @param thresholds Sorted thresholds, order - 1 of them.
	 * @param order Number of regimes to build.
	 * @throws ConfigurationError on a malformed delay/thresholds/order combination.
	 */
	PartitionOutcome tryPartition(int delay, const std::vector<double> &thresholds, int order) const;

	/**
	 * @brief Same as tryPartition() but throws InvalidRegimeError for an undersized regime.
	 */
	PartitionedDesign partition(int delay, const std::vector<double> &thresholds, int order) const;

	std::size_t minRegimeNum() const {
		return min_regime_num_;
	}
	const core::LaggedDesign &lagged() const {
		return lagged_;
	}

private:
	void validate(int delay, const std::vector<double> &thresholds, int order) const;

	const std::vector<double> &series_;
	const core::LaggedDesign &lagged_;
	std::size_t min_regime_num_;
};

} // namespace regimear::models
