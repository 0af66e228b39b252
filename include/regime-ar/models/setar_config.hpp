#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace regimear::models {

/**
 * @brief Fixed SETAR configuration, validated when the model is built.
 */
struct SETARConfig {
	int order = 2;                      // Number of regimes
	int ar_order = 1;                   // Lags per regime
	double min_regime_frac = 0.1;       // Minimum share of observations in each regime
	std::optional<int> max_delay;       // Largest delay scanned by the search (defaults to ar_order)
	int threshold_grid_size = 100;      // Approximate number of threshold candidates per delay
	int max_iterations = 100;           // Cap on coordinate refinement sweeps

	int effectiveMaxDelay() const {
		return max_delay.value_or(ar_order);
	}
};

/**
 * @brief Delay and thresholds that define the regime partition.
 *
 * thresholds is sorted ascending and holds order - 1 values.
 */
struct SETARHyperparameters {
	int delay = 1;
	std::vector<double> thresholds;

	bool operator==(const SETARHyperparameters &other) const {
		return delay == other.delay && thresholds == other.thresholds;
	}
	bool operator!=(const SETARHyperparameters &other) const {
		return !(*this == other);
	}
};

} // namespace regimear::models
