#pragma once

#include "regime-ar/models/grid_objective.hpp"
#include "regime-ar/models/regime_partitioner.hpp"
#include "regime-ar/models/setar_config.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace regimear::models {

/**
 * @brief Search bounds derived from the model configuration.
 */
struct SearchSettings {
	int max_delay = 1;
	int threshold_grid_size = 100;
	int max_iterations = 100;
};

/**
 * @brief Best candidate of one grid pass.
 */
struct GridOptimum {
	int delay = 0;
	double threshold = 0.0;
	double objective = 0.0;
};

/**
 * @brief Counters collected while selecting hyperparameters.
 */
struct SearchDiagnostics {
	int candidates_evaluated = 0;
	int candidates_rejected = 0;   // At least one regime below the minimum size
	int candidates_degenerate = 0; // Singular projected Gram matrix
	int refinement_sweeps = 0;
	bool converged = true;
	double objective = 0.0;        // Objective of the last accepted optimum
};

/**
 * @class HyperparameterSearch
 * @brief Grid search for the SETAR delay and thresholds.
 *
 * The first threshold and the delay come from a joint grid over delays
 * 2..max_delay and threshold candidates. Further thresholds are seeded one at
 * a time at that delay, then all thresholds are refined coordinate-wise until
 * a full sweep leaves them unchanged or max_iterations sweeps have run.
 */
class HyperparameterSearch {
public:
	HyperparameterSearch(const std::vector<double> &series, const RegimePartitioner &partitioner,
	                     SearchSettings settings);
	HyperparameterSearch(std::vector<double> &&, const RegimePartitioner &, SearchSettings) = delete;
	HyperparameterSearch(const std::vector<double> &, RegimePartitioner &&, SearchSettings) = delete;

	/**
	 * @brief Selects delay and order - 1 thresholds.
	 * @param order Number of regimes, at least 2.
	 * @param fixed_delay Restricts every phase to this delay when set.
	 * @return Hyperparameters with sorted thresholds.
	 * @throws HyperparameterSearchError when a seed phase finds no admissible candidate.
	 * @throws NumericDegeneracyError when the single-regime fit is singular.
	 */
	SETARHyperparameters select(int order, std::optional<int> fixed_delay = std::nullopt);

	/**
	 * @brief Threshold candidates for a delay.
	 *
	 * Unique sorted values of y[0 .. N - delay), sampled with step
	 * max(floor(n / threshold_grid_size), 1) and trimmed so the first and last
	 * min_regime_num unique values are never proposed.
	 */
	std::vector<double> thresholdGrid(int delay) const;

	/**
	 * @brief Best (delay, threshold) when one threshold is added to fixed_thresholds.
	 *
	 * Candidates are visited by ascending delay then ascending threshold and
	 * replace the incumbent only on a strictly larger objective, starting
	 * from zero. Undersized or singular candidates are skipped.
	 */
	std::optional<GridOptimum> gridSearch(const std::vector<int> &delays, const std::vector<double> &fixed_thresholds,
	                                      const BaselineFit &baseline);

	const SearchDiagnostics &diagnostics() const {
		return diagnostics_;
	}

	const SearchSettings &settings() const {
		return settings_;
	}

private:
	std::vector<int> seedDelays() const;
	void refine(int delay, std::vector<double> &thresholds, const BaselineFit &baseline);

	const std::vector<double> &series_;
	const RegimePartitioner &partitioner_;
	GridObjective objective_;
	SearchSettings settings_;
	SearchDiagnostics diagnostics_;
};

} // namespace regimear::models
