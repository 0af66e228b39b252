#include <catch2/catch_test_macros.hpp>

#include "regime-ar/core/errors.hpp"
#include "regime-ar/core/lag_design.hpp"
#include "regime-ar/models/hyperparameter_search.hpp"
#include "common/setar_series.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

using regimear::core::ConfigurationError;
using regimear::core::HyperparameterSearchError;
using regimear::core::LaggedDesignBuilder;
using regimear::models::BaselineFit;
using regimear::models::HyperparameterSearch;
using regimear::models::RegimePartitioner;
using regimear::models::SearchSettings;

namespace {

struct SearchFixture {
	SearchFixture(std::vector<double> data, int ar_order, double min_regime_frac, SearchSettings settings)
	    : series(std::move(data)), lagged(LaggedDesignBuilder::build(series, ar_order)),
	      partitioner(series, lagged,
	                  static_cast<std::size_t>(std::ceil(min_regime_frac * static_cast<double>(lagged.rows())))),
	      search(series, partitioner, settings) {
	}

	std::vector<double> series;
	regimear::core::LaggedDesign lagged;
	RegimePartitioner partitioner;
	HyperparameterSearch search;
};

SearchSettings makeSettings(int max_delay, int grid_size = 100, int max_iterations = 100) {
	SearchSettings settings;
	settings.max_delay = max_delay;
	settings.threshold_grid_size = grid_size;
	settings.max_iterations = max_iterations;
	return settings;
}

} // namespace

TEST_CASE("Threshold grid is trimmed and subsampled from unique values", "[models][search][grid]") {
	std::vector<double> series;
	for (int i = 0; i < 50; ++i) {
		series.push_back(static_cast<double>(i % 25));
	}
	// 25 unique values 0..24 in y[0 .. N-1); min_regime_num = ceil(0.1 * 49) = 5.
	SearchFixture fixture(series, 1, 0.1, makeSettings(1, 10));

	const auto grid = fixture.search.thresholdGrid(1);
	// step = floor(25 / 10) = 2, indices 5, 7, ..., 19.
	REQUIRE(grid == std::vector<double> {5.0, 7.0, 9.0, 11.0, 13.0, 15.0, 17.0, 19.0});
	REQUIRE(std::is_sorted(grid.begin(), grid.end()));

	REQUIRE_THROWS_AS(fixture.search.thresholdGrid(2), ConfigurationError);
}

TEST_CASE("Threshold grid uses every interior value when the grid is large", "[models][search][grid]") {
	const auto series = tests::helpers::ar1Series(60);
	SearchFixture fixture(series, 2, 0.1, makeSettings(2, 1000));

	const auto grid = fixture.search.thresholdGrid(2);
	std::vector<double> unique(series.begin(), series.end() - 2);
	std::sort(unique.begin(), unique.end());
	unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

	const std::size_t trim = fixture.partitioner.minRegimeNum();
	REQUIRE(grid.size() == unique.size() - 2 * trim);
	REQUIRE(grid.front() == unique[trim]);
	REQUIRE(grid.back() == unique[unique.size() - trim - 1]);
}

TEST_CASE("Seed phase on a 200 point series selects delay 2 and one threshold", "[models][search]") {
	const auto series = tests::helpers::twoRegimeSeries(200);
	SearchFixture fixture(series, 2, 0.1, makeSettings(2));

	const auto selected = fixture.search.select(2);
	REQUIRE(selected.delay == 2);
	REQUIRE(selected.thresholds.size() == 1);

	const auto grid = fixture.search.thresholdGrid(2);
	REQUIRE(std::find(grid.begin(), grid.end(), selected.thresholds[0]) != grid.end());

	// The accepted threshold never produces an undersized regime.
	const auto partitioned = fixture.partitioner.partition(selected.delay, selected.thresholds, 2);
	for (std::size_t count : partitioned.regime_counts) {
		REQUIRE(count >= fixture.partitioner.minRegimeNum());
	}

	const auto &diagnostics = fixture.search.diagnostics();
	REQUIRE(diagnostics.candidates_evaluated == static_cast<int>(grid.size()));
	REQUIRE(diagnostics.refinement_sweeps == 0);
	REQUIRE(diagnostics.converged);
	REQUIRE(diagnostics.objective > 0.0);
}

TEST_CASE("Search separates the regimes of a threshold process", "[models][search]") {
	// Noise wide enough that lag 3 carries no usable regime signal.
	const auto series = tests::helpers::twoRegimeSeries(300, 2, 0.0, 3.0, 0.3, 1.0);
	SearchFixture fixture(series, 3, 0.1, makeSettings(3));

	const auto selected = fixture.search.select(2);
	REQUIRE(selected.delay == 2);

	const auto estimated = fixture.partitioner.assignRegimes(2, selected.thresholds);
	const auto threshold_var = fixture.partitioner.thresholdVariable(2);
	std::size_t agree = 0;
	for (std::size_t r = 0; r < estimated.size(); ++r) {
		const int truth = threshold_var[r] <= 0.0 ? 0 : 1;
		if (truth == estimated[r]) {
			++agree;
		}
	}
	REQUIRE(static_cast<double>(agree) >= 0.9 * static_cast<double>(estimated.size()));
}

TEST_CASE("Search is deterministic", "[models][search]") {
	const auto series = tests::helpers::ar1Series(180, 0.3, 99);
	SearchFixture first(series, 2, 0.15, makeSettings(2, 50));
	SearchFixture second(series, 2, 0.15, makeSettings(2, 50));

	const auto a = first.search.select(3);
	const auto b = second.search.select(3);
	REQUIRE(a == b);
	REQUIRE(first.search.diagnostics().candidates_evaluated == second.search.diagnostics().candidates_evaluated);
}

TEST_CASE("Multiple thresholds are sorted and refined within the sweep cap", "[models][search][refinement]") {
	const auto series = tests::helpers::twoRegimeSeries(300, 2);

	SECTION("three regimes") {
		SearchFixture fixture(series, 2, 0.1, makeSettings(2, 60));
		const auto selected = fixture.search.select(3);

		REQUIRE(selected.thresholds.size() == 2);
		REQUIRE(std::is_sorted(selected.thresholds.begin(), selected.thresholds.end()));

		const auto &diagnostics = fixture.search.diagnostics();
		REQUIRE(diagnostics.refinement_sweeps >= 1);
		REQUIRE(diagnostics.refinement_sweeps <= 100);
		if (diagnostics.converged) {
			const auto partitioned = fixture.partitioner.partition(selected.delay, selected.thresholds, 3);
			for (std::size_t count : partitioned.regime_counts) {
				REQUIRE(count >= fixture.partitioner.minRegimeNum());
			}
		}
	}

	SECTION("sweep cap of one") {
		SearchFixture fixture(series, 2, 0.1, makeSettings(2, 60, 1));
		const auto selected = fixture.search.select(4);

		REQUIRE(selected.thresholds.size() == 3);
		REQUIRE(std::is_sorted(selected.thresholds.begin(), selected.thresholds.end()));
		REQUIRE(fixture.search.diagnostics().refinement_sweeps == 1);
	}
}

TEST_CASE("Refinement flags non-convergence at the sweep cap", "[models][search][refinement]") {
	const auto series = tests::helpers::ar1Series(300, 0.5, 2);
	SearchFixture fixture(series, 2, 0.1, makeSettings(2, 60, 1));

	const auto selected = fixture.search.select(3);

	const auto &diagnostics = fixture.search.diagnostics();
	REQUIRE_FALSE(diagnostics.converged);
	REQUIRE(diagnostics.refinement_sweeps == 1);

	// The last proposal is still returned in full.
	REQUIRE(selected.thresholds.size() == 2);
	REQUIRE(std::is_sorted(selected.thresholds.begin(), selected.thresholds.end()));
}

TEST_CASE("Fixed delay restricts every phase", "[models][search]") {
	const auto series = tests::helpers::twoRegimeSeries(200, 2);
	SearchFixture fixture(series, 3, 0.1, makeSettings(3));

	const auto selected = fixture.search.select(2, 1);
	REQUIRE(selected.delay == 1);
	REQUIRE(fixture.search.diagnostics().candidates_evaluated ==
	        static_cast<int>(fixture.search.thresholdGrid(1).size()));
}

TEST_CASE("Grid search skips candidates with undersized regimes", "[models][search][validation]") {
	const auto series = tests::helpers::ar1Series(120);
	SearchFixture fixture(series, 1, 0.1, makeSettings(1));
	const BaselineFit baseline(fixture.lagged);

	// Holding the minimum fixed leaves regime 0 nearly empty for every candidate.
	const double lowest = *std::min_element(series.begin(), series.end());
	const auto optimum = fixture.search.gridSearch({1}, {lowest}, baseline);

	REQUIRE_FALSE(optimum.has_value());
	const auto &diagnostics = fixture.search.diagnostics();
	REQUIRE(diagnostics.candidates_evaluated > 0);
	REQUIRE(diagnostics.candidates_rejected == diagnostics.candidates_evaluated);
}

TEST_CASE("Grid search skips and counts degenerate candidates", "[models][search][degenerate]") {
	const auto series = tests::helpers::spikedSeries(90);
	SearchFixture fixture(series, 1, 0.05, makeSettings(1));
	const BaselineFit baseline(fixture.lagged);

	// With 4.0 held fixed the top regime holds only post-spike rows.
	const auto optimum = fixture.search.gridSearch({1}, {4.0}, baseline);

	REQUIRE_FALSE(optimum.has_value());
	const auto &diagnostics = fixture.search.diagnostics();
	REQUIRE(diagnostics.candidates_degenerate > 0);
	REQUIRE(diagnostics.candidates_degenerate + diagnostics.candidates_rejected == diagnostics.candidates_evaluated);
}

TEST_CASE("Search fails when no threshold is admissible", "[models][search][validation]") {
	const auto series = tests::helpers::ar1Series(40);
	// min_regime_num = 20 of 39 rows: the trimmed grid is empty.
	SearchFixture fixture(series, 1, 0.5, makeSettings(1));

	REQUIRE(fixture.search.thresholdGrid(1).empty());
	REQUIRE_THROWS_AS(fixture.search.select(2), HyperparameterSearchError);
}

TEST_CASE("Search settings are validated", "[models][search][validation]") {
	const auto series = tests::helpers::ar1Series(50);
	const auto lagged = LaggedDesignBuilder::build(series, 2);
	const RegimePartitioner partitioner(series, lagged, 5);

	REQUIRE_THROWS_AS(HyperparameterSearch(series, partitioner, makeSettings(3)), ConfigurationError);
	REQUIRE_THROWS_AS(HyperparameterSearch(series, partitioner, makeSettings(0)), ConfigurationError);
	REQUIRE_THROWS_AS(HyperparameterSearch(series, partitioner, makeSettings(2, 0)), ConfigurationError);
	REQUIRE_THROWS_AS(HyperparameterSearch(series, partitioner, makeSettings(2, 10, 0)), ConfigurationError);

	HyperparameterSearch search(series, partitioner, makeSettings(2));
	REQUIRE_THROWS_AS(search.select(1), ConfigurationError);
}
