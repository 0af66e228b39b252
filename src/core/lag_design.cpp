#include "regime-ar/core/lag_design.hpp"
#include "regime-ar/core/errors.hpp"

#include <string>

namespace regimear::core {

namespace {

void validateLagInput(const std::vector<double> &series, int ar_order) {
	if (ar_order < 1) {
		throw ConfigurationError("Autoregressive order must be at least 1.");
	}
	if (series.size() <= static_cast<std::size_t>(ar_order)) {
		throw ConfigurationError("Series of length " + std::to_string(series.size()) +
		                         " is too short for autoregressive order " + std::to_string(ar_order) + ".");
	}
}

} // namespace

Eigen::MatrixXd LaggedDesignBuilder::lagMatrix(const std::vector<double> &series, int ar_order) {
	validateLagInput(series, ar_order);

	const auto p = static_cast<std::size_t>(ar_order);
	const std::size_t rows = series.size() - p;
	Eigen::MatrixXd lags(static_cast<Eigen::Index>(rows), ar_order);

	for (std::size_t r = 0; r < rows; ++r) {
		const std::size_t t = r + p;
		for (std::size_t lag = 1; lag <= p; ++lag) {
			lags(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(lag - 1)) = series[t - lag];
		}
	}
	return lags;
}

LaggedDesign LaggedDesignBuilder::build(const std::vector<double> &series, int ar_order) {
	const Eigen::MatrixXd lags = lagMatrix(series, ar_order);
	const Eigen::Index rows = lags.rows();

	LaggedDesign design;
	design.ar_order = ar_order;
	design.regressors.resize(rows, ar_order + 1);
	design.regressors.col(0).setOnes();
	design.regressors.rightCols(ar_order) = lags;

	design.response.resize(rows);
	for (Eigen::Index r = 0; r < rows; ++r) {
		design.response[r] = series[static_cast<std::size_t>(r + ar_order)];
	}
	return design;
}

} // namespace regimear::core
