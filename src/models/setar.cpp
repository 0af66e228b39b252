#include "regime-ar/models/setar.hpp"
#include "regime-ar/core/errors.hpp"
#include "regime-ar/regression/ols_solver.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace regimear::models {

namespace {

bool allFinite(const std::vector<double> &values) {
	return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

void validateConfig(const SETARConfig &config, const std::optional<int> &delay) {
	if (config.order < 2) {
		throw core::ConfigurationError("SETAR order (number of regimes) must be at least 2, got " +
		                               std::to_string(config.order) + ".");
	}
	if (config.ar_order < 1) {
		throw core::ConfigurationError("Autoregressive order must be at least 1, got " +
		                               std::to_string(config.ar_order) + ".");
	}
	if (!(config.min_regime_frac > 0.0 && config.min_regime_frac <= 1.0)) {
		throw core::ConfigurationError("Minimum regime fraction must lie in (0, 1].");
	}
	if (config.threshold_grid_size < 1) {
		throw core::ConfigurationError("Threshold grid size must be at least 1.");
	}
	if (config.max_iterations < 1) {
		throw core::ConfigurationError("Maximum number of refinement iterations must be at least 1.");
	}

	if (delay) {
		if (*delay < 1 || *delay > config.ar_order) {
			throw core::ConfigurationError("Delay parameter must lie in [1, ar_order = " +
			                               std::to_string(config.ar_order) + "], got " + std::to_string(*delay) +
			                               ".");
		}
		return;
	}

	// A delay beyond ar_order would change the number of initial observations
	// between candidates, so the search never goes past it.
	const int max_delay = config.effectiveMaxDelay();
	if (max_delay < 1 || max_delay > config.ar_order) {
		throw core::ConfigurationError("Maximum delay for the grid search must lie in [1, ar_order = " +
		                               std::to_string(config.ar_order) + "], got " + std::to_string(max_delay) +
		                               ".");
	}
}

} // namespace

// --- Model Implementation ---

SETAR::SETAR(std::vector<double> series, SETARConfig config, std::optional<int> delay,
             std::optional<std::vector<double>> thresholds)
    : series_(std::move(series)), config_(std::move(config)), supplied_delay_(delay) {
	validateConfig(config_, delay);

	if (thresholds) {
		if (thresholds->size() + 1 != static_cast<std::size_t>(config_.order)) {
			throw core::ConfigurationError("Number of thresholds (" + std::to_string(thresholds->size()) +
			                               ") must match the order of the SETAR model (" +
			                               std::to_string(config_.order) + " regimes need " +
			                               std::to_string(config_.order - 1) + ").");
		}
		if (!allFinite(*thresholds)) {
			throw core::ConfigurationError("Thresholds must be finite.");
		}
		std::sort(thresholds->begin(), thresholds->end());
	}

	if (series_.size() <= static_cast<std::size_t>(config_.ar_order) + 1) {
		throw core::ConfigurationError("Series of length " + std::to_string(series_.size()) +
		                               " is too short for autoregressive order " + std::to_string(config_.ar_order) +
		                               ".");
	}
	if (!allFinite(series_)) {
		throw core::ConfigurationError("Series must not contain NaN or infinite values.");
	}

	lagged_ = core::LaggedDesignBuilder::build(series_, config_.ar_order);
	min_regime_num_ =
	    static_cast<std::size_t>(std::ceil(config_.min_regime_frac * static_cast<double>(lagged_.rows())));
	if (min_regime_num_ * static_cast<std::size_t>(config_.order) > lagged_.rows()) {
		throw core::ConfigurationError("Cannot place " + std::to_string(min_regime_num_) + " observations in each of " +
		                               std::to_string(config_.order) + " regimes with only " +
		                               std::to_string(lagged_.rows()) + " usable observations.");
	}

	partitioner_ = std::make_unique<RegimePartitioner>(series_, lagged_, min_regime_num_);

	if (delay && thresholds) {
		hyperparameters_ = SETARHyperparameters {*delay, std::move(*thresholds)};
	} else if (thresholds) {
		REGIMEAR_WARN("SETAR: thresholds supplied without a delay are ignored; both will be selected by grid search");
	}
}

void SETAR::requireFitted() const {
	if (!result_) {
		throw std::runtime_error("SETAR model must be fitted first.");
	}
}

SETARHyperparameters SETAR::selectHyperparameters() {
	SearchSettings settings;
	settings.max_delay = supplied_delay_ ? *supplied_delay_ : config_.effectiveMaxDelay();
	settings.threshold_grid_size = config_.threshold_grid_size;
	settings.max_iterations = config_.max_iterations;

	HyperparameterSearch search(series_, *partitioner_, settings);
	auto selected = search.select(config_.order, supplied_delay_);
	search_diagnostics_ = search.diagnostics();
	return selected;
}

PartitionedDesign SETAR::buildDatasets(int delay, const std::vector<double> &thresholds,
                                       std::optional<int> order) const {
	return partitioner_->partition(delay, thresholds, order.value_or(config_.order));
}

regression::RegressionResult SETAR::fit() {
	if (!hyperparameters_) {
		hyperparameters_ = selectHyperparameters();
	}

	auto partitioned = buildDatasets(hyperparameters_->delay, hyperparameters_->thresholds);
	auto result = regression::OLSSolver::fit(partitioned.response, partitioned.design);
	if (!result.isFullRank()) {
		throw core::NumericDegeneracyError("Regime-partitioned design is rank deficient (rank " +
		                                   std::to_string(result.rank) + " of " + std::to_string(result.n_params) +
		                                   ").");
	}

	regimes_ = std::move(partitioned.regimes);
	regime_counts_ = std::move(partitioned.regime_counts);
	result_ = result;

	REGIMEAR_INFO("SETAR({}; {}) fitted on {} observations with delay={}, RSS={:.6g}", config_.order,
	              config_.ar_order, result.n_obs, hyperparameters_->delay, result.rss);
	return result;
}

Eigen::VectorXd SETAR::regimeCoefficients(int regime) const {
	requireFitted();
	if (regime < 0 || regime >= config_.order) {
		throw std::out_of_range("Regime index " + std::to_string(regime) + " is out of range.");
	}
	const Eigen::Index k = lagged_.blockWidth();
	return result_->coefficients.segment(regime * k, k);
}

const std::vector<int> &SETAR::regimeAssignment() const {
	requireFitted();
	return regimes_;
}

const std::vector<std::size_t> &SETAR::regimeCounts() const {
	requireFitted();
	return regime_counts_;
}

core::Forecast SETAR::predict(int horizon) const {
	requireFitted();
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (horizon == 0) {
		return {};
	}

	const auto &thresholds = hyperparameters_->thresholds;
	const auto delay = static_cast<std::size_t>(hyperparameters_->delay);
	const auto p = static_cast<std::size_t>(config_.ar_order);
	const Eigen::Index k = lagged_.blockWidth();

	std::vector<double> path = series_;
	path.reserve(series_.size() + static_cast<std::size_t>(horizon));

	core::Forecast forecast;
	auto &point = forecast.primary();
	point.reserve(static_cast<std::size_t>(horizon));
	forecast.regimes.reserve(static_cast<std::size_t>(horizon));

	for (int h = 0; h < horizon; ++h) {
		const std::size_t t = path.size();
		const double z = path[t - delay];
		const auto regime =
		    static_cast<Eigen::Index>(std::lower_bound(thresholds.begin(), thresholds.end(), z) - thresholds.begin());

		const auto coefficients = result_->coefficients.segment(regime * k, k);
		double value = coefficients[0];
		for (std::size_t lag = 1; lag <= p; ++lag) {
			value += coefficients[static_cast<Eigen::Index>(lag)] * path[t - lag];
		}

		path.push_back(value);
		point.push_back(value);
		forecast.regimes.push_back(static_cast<int>(regime));
	}

	REGIMEAR_DEBUG("SETAR: predicted {} steps ahead", horizon);
	return forecast;
}

// --- Builder Implementation ---

SETARBuilder &SETARBuilder::withOrder(int order) {
	config_.order = order;
	return *this;
}

SETARBuilder &SETARBuilder::withAROrder(int ar_order) {
	config_.ar_order = ar_order;
	return *this;
}

SETARBuilder &SETARBuilder::withDelay(int delay) {
	delay_ = delay;
	return *this;
}

SETARBuilder &SETARBuilder::withThresholds(std::vector<double> thresholds) {
	thresholds_ = std::move(thresholds);
	return *this;
}

SETARBuilder &SETARBuilder::withMinRegimeFraction(double fraction) {
	config_.min_regime_frac = fraction;
	return *this;
}

SETARBuilder &SETARBuilder::withMaxDelay(int max_delay) {
	config_.max_delay = max_delay;
	return *this;
}

SETARBuilder &SETARBuilder::withThresholdGridSize(int grid_size) {
	config_.threshold_grid_size = grid_size;
	return *this;
}

SETARBuilder &SETARBuilder::withMaxIterations(int max_iterations) {
	config_.max_iterations = max_iterations;
	return *this;
}

std::unique_ptr<SETAR> SETARBuilder::build(std::vector<double> series) const {
	REGIMEAR_DEBUG("Building SETAR model with order={}, ar_order={}", config_.order, config_.ar_order);
	return std::unique_ptr<SETAR>(new SETAR(std::move(series), config_, delay_, thresholds_));
}

} // namespace regimear::models
