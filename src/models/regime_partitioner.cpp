#include "regime-ar/models/regime_partitioner.hpp"
#include "regime-ar/core/errors.hpp"

#include <algorithm>
#include <string>

namespace regimear::models {

RegimePartitioner::RegimePartitioner(const std::vector<double> &series, const core::LaggedDesign &lagged,
                                     std::size_t min_regime_num)
    : series_(series), lagged_(lagged), min_regime_num_(min_regime_num) {
	if (series_.size() != lagged_.rows() + static_cast<std::size_t>(lagged_.ar_order)) {
		throw core::ConfigurationError("Lagged design does not match the series length.");
	}
}

std::vector<double> RegimePartitioner::thresholdVariable(int delay) const {
	if (delay < 1 || delay > lagged_.ar_order) {
		throw core::ConfigurationError("Delay must lie in [1, " + std::to_string(lagged_.ar_order) + "], got " +
		                               std::to_string(delay) + ".");
	}

	const auto offset = static_cast<std::size_t>(lagged_.ar_order - delay);
	const std::size_t rows = lagged_.rows();
	return std::vector<double>(series_.begin() + static_cast<std::ptrdiff_t>(offset),
	                           series_.begin() + static_cast<std::ptrdiff_t>(offset + rows));
}

std::vector<int> RegimePartitioner::assignRegimes(int delay, const std::vector<double> &thresholds) const {
	if (!std::is_sorted(thresholds.begin(), thresholds.end())) {
		throw core::ConfigurationError("Thresholds must be sorted in ascending order.");
	}

	const auto threshold_var = thresholdVariable(delay);
	std::vector<int> regimes;
	regimes.reserve(threshold_var.size());
	for (double value : threshold_var) {
		const auto it = std::lower_bound(thresholds.begin(), thresholds.end(), value);
		regimes.push_back(static_cast<int>(it - thresholds.begin()));
	}
	return regimes;
}

void RegimePartitioner::validate(int delay, const std::vector<double> &thresholds, int order) const {
	if (order < 1) {
		throw core::ConfigurationError("Number of regimes must be positive.");
	}
	if (thresholds.size() + 1 != static_cast<std::size_t>(order)) {
		throw core::ConfigurationError("Number of thresholds (" + std::to_string(thresholds.size()) +
		                               ") must be one less than the number of regimes (" + std::to_string(order) +
		                               ").");
	}
	if (delay < 1 || delay > lagged_.ar_order) {
		throw core::ConfigurationError("Delay must lie in [1, " + std::to_string(lagged_.ar_order) + "], got " +
		                               std::to_string(delay) + ".");
	}
}

PartitionOutcome RegimePartitioner::tryPartition(int delay, const std::vector<double> &thresholds, int order) const {
	validate(delay, thresholds, order);

	PartitionedDesign result;
	result.order = order;
	result.regimes = assignRegimes(delay, thresholds);
	result.regime_counts.assign(static_cast<std::size_t>(order), 0);
	for (int regime : result.regimes) {
		++result.regime_counts[static_cast<std::size_t>(regime)];
	}

	for (int i = 0; i < order; ++i) {
		const std::size_t count = result.regime_counts[static_cast<std::size_t>(i)];
		if (count < min_regime_num_) {
			return RegimeTooSmall {i, count, min_regime_num_};
		}
	}

	const Eigen::Index rows = lagged_.regressors.rows();
	const Eigen::Index k = lagged_.blockWidth();
	result.design = Eigen::MatrixXd::Zero(rows, k * order);
	for (Eigen::Index r = 0; r < rows; ++r) {
		const Eigen::Index block = result.regimes[static_cast<std::size_t>(r)];
		result.design.block(r, block * k, 1, k) = lagged_.regressors.row(r);
	}
	result.response = lagged_.response;

	return result;
}

PartitionedDesign RegimePartitioner::partition(int delay, const std::vector<double> &thresholds, int order) const {
	auto outcome = tryPartition(delay, thresholds, order);
	if (const auto *too_small = std::get_if<RegimeTooSmall>(&outcome)) {
		throw core::InvalidRegimeError(too_small->regime, too_small->count, too_small->required);
	}
	return std::get<PartitionedDesign>(std::move(outcome));
}

} // namespace regimear::models
