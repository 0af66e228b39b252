#pragma once

#include "regime-ar/core/forecast.hpp"
#include "regime-ar/core/lag_design.hpp"
#include "regime-ar/models/hyperparameter_search.hpp"
#include "regime-ar/models/regime_partitioner.hpp"
#include "regime-ar/models/setar_config.hpp"
#include "regime-ar/regression/regression_result.hpp"
#include "regime-ar/utils/logging.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace regimear::models {

class SETARBuilder; // Forward declaration

/**
 * @class SETAR
 * @brief Self-Exciting Threshold Autoregressive model.
 *
 * Each of the order regimes is an AR(ar_order) regression with intercept.
 * The regime at time t is chosen by where y[t - delay] falls among the
 * thresholds. Delay and thresholds are either supplied to the builder or
 * selected by grid search on the first call to fit(), then reused.
 *
 * Reference: Hansen, B. (1999) "Testing for Linearity", Journal of Economic Surveys 13(5).
 */
class SETAR final {
public:
	friend class SETARBuilder;

	SETAR(const SETAR &) = delete;
	SETAR &operator=(const SETAR &) = delete;

	/**
	 * @brief Fits the regime-partitioned regression.
	 *
	 * Runs the hyperparameter search when delay or thresholds are unresolved
	 * and caches the result, so later calls reuse it.
	 *
	 * @return The least-squares result over the partitioned design; coefficients
	 *         hold order blocks of [intercept, lag 1, ..., lag ar_order].
	 * @throws InvalidRegimeError if supplied hyperparameters leave a regime too small.
	 * @throws NumericDegeneracyError if the final design is rank deficient.
	 * @throws HyperparameterSearchError if no admissible threshold exists.
	 */
	regression::RegressionResult fit();

	/**
	 * @brief Runs the delay/threshold search without caching the outcome.
	 */
	SETARHyperparameters selectHyperparameters();

	/**
	 * @brief Builds the regime-partitioned response and design.
	 * @param order Number of regimes; the configured order when not given.
	 */
	PartitionedDesign buildDatasets(int delay, const std::vector<double> &thresholds,
	                                std::optional<int> order = std::nullopt) const;

	/**
	 * @brief Iterates the fitted regime recursion forward.
	 *
	 * Steps whose threshold variable lies beyond the sample use earlier
	 * point forecasts. No noise is simulated.
	 */
	core::Forecast predict(int horizon) const;

	/// Coefficients of one regime: intercept followed by lags 1..ar_order.
	Eigen::VectorXd regimeCoefficients(int regime) const;

	const std::vector<int> &regimeAssignment() const;
	const std::vector<std::size_t> &regimeCounts() const;

	const SETARConfig &config() const {
		return config_;
	}
	const std::optional<SETARHyperparameters> &hyperparameters() const {
		return hyperparameters_;
	}
	const std::optional<SearchDiagnostics> &searchDiagnostics() const {
		return search_diagnostics_;
	}
	const std::optional<regression::RegressionResult> &result() const {
		return result_;
	}
	std::size_t nobs() const {
		return lagged_.rows();
	}
	std::size_t minRegimeNum() const {
		return min_regime_num_;
	}
	bool isFitted() const {
		return result_.has_value();
	}

	std::string getName() const {
		return "SETAR";
	}

private:
	SETAR(std::vector<double> series, SETARConfig config, std::optional<int> delay,
	      std::optional<std::vector<double>> thresholds);

	void requireFitted() const;

	std::vector<double> series_;
	SETARConfig config_;
	core::LaggedDesign lagged_;
	std::size_t min_regime_num_ = 0;
	std::unique_ptr<RegimePartitioner> partitioner_;

	std::optional<int> supplied_delay_;
	std::optional<SETARHyperparameters> hyperparameters_;
	std::optional<SearchDiagnostics> search_diagnostics_;

	std::optional<regression::RegressionResult> result_;
	std::vector<int> regimes_;
	std::vector<std::size_t> regime_counts_;
};

/**
 * @class SETARBuilder
 * @brief Fluent configuration for SETAR models.
 */
class SETARBuilder {
public:
	/// Number of regimes (at least 2).
	SETARBuilder &withOrder(int order);

	/// Autoregressive order of every regime (at least 1).
	SETARBuilder &withAROrder(int ar_order);

	/// Fixes the delay; must lie in [1, ar_order].
	SETARBuilder &withDelay(int delay);

	/// Fixes the thresholds; needs order - 1 values.
	SETARBuilder &withThresholds(std::vector<double> thresholds);

	/// Minimum share of observations per regime, in (0, 1].
	SETARBuilder &withMinRegimeFraction(double fraction);

	/// Largest delay scanned by the search; defaults to ar_order.
	SETARBuilder &withMaxDelay(int max_delay);

	/// Approximate number of threshold candidates per delay.
	SETARBuilder &withThresholdGridSize(int grid_size);

	/// Cap on coordinate refinement sweeps.
	SETARBuilder &withMaxIterations(int max_iterations);

	/**
	 * @brief Validates the configuration and creates the model.
	 * @param series Observations in time order.
	 * @throws ConfigurationError on any invalid setting.
	 */
	std::unique_ptr<SETAR> build(std::vector<double> series) const;

private:
	SETARConfig config_;
	std::optional<int> delay_;
	std::optional<std::vector<double>> thresholds_;
};

} // namespace regimear::models
