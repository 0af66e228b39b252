#include "regime-ar/models/grid_objective.hpp"
#include "regime-ar/core/errors.hpp"
#include "regime-ar/utils/logging.hpp"

#include <cmath>
#include <string>
#include <variant>

namespace regimear::models {

namespace {

// Relative pivot threshold for the Gram and projected Gram solves. Collinear
// columns leave cross-product pivots near sqrt(eps), not at zero.
constexpr double kRankThreshold = 1e-10;

} // namespace

BaselineFit::BaselineFit(const core::LaggedDesign &lagged) : lagged_(lagged) {
	const Eigen::MatrixXd &X = lagged_.regressors;
	const Eigen::MatrixXd gram = X.transpose() * X;

	gram_.setThreshold(kRankThreshold);
	gram_.compute(gram);
	if (gram_.rank() < gram.cols()) {
		throw core::NumericDegeneracyError("Single-regime Gram matrix is singular (rank " +
		                                   std::to_string(gram_.rank()) + " of " + std::to_string(gram.cols()) +
		                                   "); the series may be constant or too short.");
	}

	coefficients_ = gram_.solve(X.transpose() * lagged_.response);
	residuals_ = lagged_.response - X * coefficients_;
}

Eigen::MatrixXd BaselineFit::solveGram(const Eigen::MatrixXd &rhs) const {
	return gram_.solve(rhs);
}

GridObjective::GridObjective(const RegimePartitioner &partitioner) : partitioner_(partitioner) {
}

CandidateScore GridObjective::score(int delay, const std::vector<double> &thresholds,
                                    const BaselineFit &baseline) const {
	CandidateScore result;

	const int order = static_cast<int>(thresholds.size()) + 1;
	const auto outcome = partitioner_.tryPartition(delay, thresholds, order);
	if (const auto *too_small = std::get_if<RegimeTooSmall>(&outcome)) {
		result.status = CandidateStatus::RegimeTooSmall;
		result.rejection = *too_small;
		return result;
	}
	const auto &partitioned = std::get<PartitionedDesign>(outcome);

	// Drop the last regime block: the baseline already spans it.
	const Eigen::Index k = partitioner_.lagged().blockWidth();
	const Eigen::MatrixXd X1 = partitioned.design.leftCols(partitioned.design.cols() - k);
	const Eigen::MatrixXd &X = baseline.regressors();

	const Eigen::MatrixXd X1X1 = X1.transpose() * X1;
	const Eigen::MatrixXd XX1 = X.transpose() * X1;
	const Eigen::MatrixXd M = X1X1 - XX1.transpose() * baseline.solveGram(XX1);

	const Eigen::VectorXd g = X1.transpose() * baseline.residuals();
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(M);
	qr.setThreshold(kRankThreshold);
	if (qr.rank() < M.cols()) {
		REGIMEAR_TRACE("Candidate delay={} is degenerate: rank {} of {}", delay, qr.rank(), M.cols());
		result.status = CandidateStatus::Degenerate;
		return result;
	}

	const double value = g.dot(qr.solve(g));
	if (!std::isfinite(value)) {
		result.status = CandidateStatus::Degenerate;
		return result;
	}

	result.objective = value;
	return result;
}

double GridObjective::objective(int delay, const std::vector<double> &thresholds, const BaselineFit &baseline) const {
	const auto result = score(delay, thresholds, baseline);
	switch (result.status) {
	case CandidateStatus::RegimeTooSmall:
		throw core::InvalidRegimeError(result.rejection.regime, result.rejection.count, result.rejection.required);
	case CandidateStatus::Degenerate:
		throw core::NumericDegeneracyError("Candidate partition with delay " + std::to_string(delay) +
		                                   " has a singular projected Gram matrix.");
	case CandidateStatus::Accepted:
		break;
	}
	return result.objective;
}

} // namespace regimear::models
