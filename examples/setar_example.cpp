#include "regime-ar/core/errors.hpp"
#include "regime-ar/models/setar.hpp"
#include "regime-ar/utils/logging.hpp"
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace regimear;

namespace {

// Two regimes switching on the sign of y[t-2].
std::vector<double> generateThresholdData(std::size_t n, unsigned seed = 2024) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 0.5);

	std::vector<double> data;
	data.reserve(n);
	for (std::size_t t = 0; t < n; ++t) {
		if (t < 2) {
			data.push_back(noise(rng));
			continue;
		}
		const double intercept = data[t - 2] <= 0.0 ? 1.5 : -1.5;
		data.push_back(intercept + 0.4 * data[t - 1] + noise(rng));
	}
	return data;
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printModel(const models::SETAR &model) {
	const auto &hyper = *model.hyperparameters();
	std::cout << "  delay: " << hyper.delay << "\n  thresholds:";
	for (double threshold : hyper.thresholds) {
		std::cout << ' ' << std::fixed << std::setprecision(4) << threshold;
	}
	std::cout << '\n';

	const auto &counts = model.regimeCounts();
	for (int regime = 0; regime < model.config().order; ++regime) {
		const auto coefficients = model.regimeCoefficients(regime);
		std::cout << "  regime " << regime << " (" << counts[static_cast<std::size_t>(regime)] << " obs):";
		for (Eigen::Index i = 0; i < coefficients.size(); ++i) {
			std::cout << ' ' << std::fixed << std::setprecision(3) << coefficients[i];
		}
		std::cout << '\n';
	}
	std::cout << "  RSS: " << std::fixed << std::setprecision(4) << model.result()->rss << '\n';
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	const auto data = generateThresholdData(400);

	printHeader("Scenario 1: Two regimes, searched delay and threshold");
	auto two_regime = models::SETARBuilder().withOrder(2).withAROrder(3).withMinRegimeFraction(0.15).build(data);
	two_regime->fit();
	printModel(*two_regime);

	const auto &diagnostics = *two_regime->searchDiagnostics();
	std::cout << "  candidates evaluated: " << diagnostics.candidates_evaluated
	          << " (rejected " << diagnostics.candidates_rejected << ")\n";

	const auto forecast = two_regime->predict(8);
	std::cout << "  forecast:";
	for (std::size_t h = 0; h < forecast.horizon(); ++h) {
		std::cout << ' ' << std::fixed << std::setprecision(2) << forecast.point[h] << "[r" << forecast.regimes[h] << ']';
	}
	std::cout << '\n';
	std::cout.unsetf(std::ios::floatfield);

	printHeader("Scenario 2: Three regimes with refinement");
	auto three_regime = models::SETARBuilder().withOrder(3).withAROrder(2).withThresholdGridSize(50).build(data);
	three_regime->fit();
	printModel(*three_regime);
	std::cout << "  refinement sweeps: " << three_regime->searchDiagnostics()->refinement_sweeps
	          << (three_regime->searchDiagnostics()->converged ? " (converged)\n" : " (not converged)\n");

	printHeader("Scenario 3: Supplied threshold leaving a regime too small");
	auto fixed = models::SETARBuilder().withAROrder(2).withDelay(2).withThresholds({10.0}).build(data);
	try {
		fixed->fit();
	} catch (const core::InvalidRegimeError &e) {
		std::cout << "  rejected: " << e.what() << '\n';
	}

	return 0;
}
