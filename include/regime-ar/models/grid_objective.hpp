#pragma once

#include "regime-ar/core/lag_design.hpp"
#include "regime-ar/models/regime_partitioner.hpp"
#include <Eigen/Dense>
#include <vector>

namespace regimear::models {

/**
 * @class BaselineFit
 * @brief Single-regime AR fit shared by every candidate of a search.
 *
 * Holds a rank-revealing decomposition of X'X for the full lagged design
 * together with the residuals of the single-regime regression. Built once
 * and only read afterwards.
 */
class BaselineFit {
public:
	/**
	 * @brief Fits the single-regime regression.
	 * @throws NumericDegeneracyError when X'X is singular.
	 */
	explicit BaselineFit(const core::LaggedDesign &lagged);
	BaselineFit(core::LaggedDesign &&) = delete;

	/// Solves (X'X) Z = B against the cached decomposition.
	Eigen::MatrixXd solveGram(const Eigen::MatrixXd &rhs) const;

	const Eigen::MatrixXd &regressors() const {
		return lagged_.regressors;
	}
	const Eigen::VectorXd &residuals() const {
		return residuals_;
	}
	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}

private:
	const core::LaggedDesign &lagged_;
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> gram_;
	Eigen::VectorXd coefficients_;
	Eigen::VectorXd residuals_;
};

enum class CandidateStatus {
	Accepted,
	RegimeTooSmall,
	Degenerate
};

/**
 * @brief Score of one (delay, thresholds) candidate.
 *
 * objective is only meaningful when status is Accepted; the rejection field
 * describes the undersized regime when status is RegimeTooSmall.
 */
struct CandidateScore {
	CandidateStatus status = CandidateStatus::Accepted;
	double objective = 0.0;
	RegimeTooSmall rejection;

	bool accepted() const {
		return status == CandidateStatus::Accepted;
	}
};

/**
 * @class GridObjective
 * @brief Threshold search criterion measuring the gain over the baseline fit.
 *
 * With X1 the candidate's partitioned design minus its last regime block,
 * the score is r'X1 M^{-1} X1'r where M = X1'X1 - X1'X (X'X)^{-1} X'X1 and r
 * the baseline residuals (Hansen 1999, extended to several thresholds).
 */
class GridObjective {
public:
	explicit GridObjective(const RegimePartitioner &partitioner);
	GridObjective(RegimePartitioner &&) = delete;

	/**
	 * @brief Scores a candidate without throwing for undersized or singular partitions.
	 * @param delay Delay in [1, ar_order].
	 * @param thresholds Sorted candidate thresholds; the partition has thresholds.size() + 1 regimes.
	 * @param baseline Single-regime fit of the same lagged design.
	 */
	CandidateScore score(int delay, const std::vector<double> &thresholds, const BaselineFit &baseline) const;

	/**
	 * @brief Objective value of a candidate.
	 * @throws InvalidRegimeError when a regime is below the minimum size.
	 * @throws NumericDegeneracyError when M is singular.
	 */
	double objective(int delay, const std::vector<double> &thresholds, const BaselineFit &baseline) const;

private:
	const RegimePartitioner &partitioner_;
};

} // namespace regimear::models
