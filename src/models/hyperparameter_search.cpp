#include "regime-ar/models/hyperparameter_search.hpp"
#include "regime-ar/core/errors.hpp"
#include "regime-ar/utils/logging.hpp"

#include <algorithm>
#include <string>

namespace regimear::models {

HyperparameterSearch::HyperparameterSearch(const std::vector<double> &series, const RegimePartitioner &partitioner,
                                           SearchSettings settings)
    : series_(series), partitioner_(partitioner), objective_(partitioner), settings_(settings) {
	if (settings_.threshold_grid_size < 1) {
		throw core::ConfigurationError("Threshold grid size must be at least 1.");
	}
	if (settings_.max_iterations < 1) {
		throw core::ConfigurationError("Maximum number of refinement iterations must be at least 1.");
	}
	if (settings_.max_delay < 1 || settings_.max_delay > partitioner_.lagged().ar_order) {
		throw core::ConfigurationError("Maximum delay for the grid search must lie in [1, " +
		                               std::to_string(partitioner_.lagged().ar_order) + "].");
	}
}

std::vector<int> HyperparameterSearch::seedDelays() const {
	std::vector<int> delays;
	for (int delay = 2; delay <= settings_.max_delay; ++delay) {
		delays.push_back(delay);
	}
	// With a single admissible delay there is nothing to choose from.
	if (delays.empty()) {
		delays.push_back(1);
	}
	return delays;
}

std::vector<double> HyperparameterSearch::thresholdGrid(int delay) const {
	if (delay < 1 || delay > partitioner_.lagged().ar_order) {
		throw core::ConfigurationError("Delay must lie in [1, " + std::to_string(partitioner_.lagged().ar_order) +
		                               "], got " + std::to_string(delay) + ".");
	}

	std::vector<double> values(series_.begin(), series_.end() - delay);
	std::sort(values.begin(), values.end());
	values.erase(std::unique(values.begin(), values.end()), values.end());

	const std::size_t n = values.size();
	const std::size_t trim = partitioner_.minRegimeNum();
	const std::size_t step = std::max<std::size_t>(n / static_cast<std::size_t>(settings_.threshold_grid_size), 1);

	std::vector<double> grid;
	if (n <= trim) {
		return grid;
	}
	for (std::size_t i = trim; i < n - trim; i += step) {
		grid.push_back(values[i]);
	}
	return grid;
}

std::optional<GridOptimum> HyperparameterSearch::gridSearch(const std::vector<int> &delays,
                                                            const std::vector<double> &fixed_thresholds,
                                                            const BaselineFit &baseline) {
	std::optional<GridOptimum> best;
	double best_objective = 0.0;

	std::vector<double> candidate;
	for (int delay : delays) {
		for (double threshold : thresholdGrid(delay)) {
			candidate = fixed_thresholds;
			candidate.push_back(threshold);
			std::sort(candidate.begin(), candidate.end());

			const auto result = objective_.score(delay, candidate, baseline);
			++diagnostics_.candidates_evaluated;

			switch (result.status) {
			case CandidateStatus::RegimeTooSmall:
				++diagnostics_.candidates_rejected;
				continue;
			case CandidateStatus::Degenerate:
				++diagnostics_.candidates_degenerate;
				continue;
			case CandidateStatus::Accepted:
				break;
			}

			if (result.objective > best_objective) {
				best_objective = result.objective;
				best = GridOptimum {delay, threshold, result.objective};
				REGIMEAR_TRACE("New best candidate delay={} threshold={} objective={:.6g}", delay, threshold,
				               result.objective);
			}
		}
	}
	return best;
}

void HyperparameterSearch::refine(int delay, std::vector<double> &thresholds, const BaselineFit &baseline) {
	const std::vector<int> delays {delay};
	std::vector<double> proposed = thresholds;
	std::vector<double> others;

	diagnostics_.converged = false;
	for (int sweep = 1; sweep <= settings_.max_iterations; ++sweep) {
		diagnostics_.refinement_sweeps = sweep;

		for (std::size_t j = 0; j < thresholds.size(); ++j) {
			others = thresholds;
			others.erase(others.begin() + static_cast<std::ptrdiff_t>(j));

			const auto optimum = gridSearch(delays, others, baseline);
			proposed[j] = optimum ? optimum->threshold : thresholds[j];
		}

		// The grid is a fixed discrete set, so exact comparison is the fixed point.
		if (proposed == thresholds) {
			diagnostics_.converged = true;
			REGIMEAR_DEBUG("Threshold refinement converged after {} sweeps", sweep);
			return;
		}
		thresholds = proposed;
	}

	REGIMEAR_WARN("Threshold refinement did not converge within {} sweeps; using the last proposal",
	              settings_.max_iterations);
}

SETARHyperparameters HyperparameterSearch::select(int order, std::optional<int> fixed_delay) {
	if (order < 2) {
		throw core::ConfigurationError("A threshold search needs at least two regimes.");
	}

	diagnostics_ = SearchDiagnostics {};
	const BaselineFit baseline(partitioner_.lagged());

	const std::vector<int> delays = fixed_delay ? std::vector<int> {*fixed_delay} : seedDelays();
	const auto seed = gridSearch(delays, {}, baseline);
	if (!seed) {
		throw core::HyperparameterSearchError(
		    "No threshold leaves every regime with at least " + std::to_string(partitioner_.minRegimeNum()) +
		    " observations; lower the minimum regime fraction or supply more data.");
	}
	REGIMEAR_DEBUG("Seed phase selected delay={} threshold={} (objective {:.4f})", seed->delay, seed->threshold,
	               seed->objective);

	const int delay = seed->delay;
	std::vector<double> thresholds {seed->threshold};

	while (thresholds.size() + 1 < static_cast<std::size_t>(order)) {
		const auto next = gridSearch({delay}, thresholds, baseline);
		if (!next) {
			throw core::HyperparameterSearchError("No admissible value for threshold " +
			                                      std::to_string(thresholds.size() + 1) + " at delay " +
			                                      std::to_string(delay) + ".");
		}
		REGIMEAR_DEBUG("Initial estimate for threshold {}: {}", thresholds.size() + 1, next->threshold);
		thresholds.push_back(next->threshold);
	}

	if (thresholds.size() > 1) {
		refine(delay, thresholds, baseline);
	}

	SETARHyperparameters selected;
	selected.delay = delay;
	selected.thresholds = thresholds;
	std::sort(selected.thresholds.begin(), selected.thresholds.end());

	const auto final_score = objective_.score(selected.delay, selected.thresholds, baseline);
	if (final_score.accepted()) {
		diagnostics_.objective = final_score.objective;
	}

	REGIMEAR_INFO("Selected delay={} with {} thresholds after {} candidate evaluations", selected.delay,
	              selected.thresholds.size(), diagnostics_.candidates_evaluated);
	return selected;
}

} // namespace regimear::models
