#pragma once

#include <cstddef>
#include <vector>

namespace regimear::core {

/**
 * @struct Forecast
 * @brief Point predictions produced by a fitted model.
 *
 * Alongside each prediction the regime that generated it is recorded, so
 * callers can see when the forecast path crosses a threshold.
 */
struct Forecast {
	using Value = double;
	using Series = std::vector<Value>;

	/// Point forecasts, one per step ahead.
	Series point;

	/// Regime index that produced each step.
	std::vector<int> regimes;

	Series &primary() {
		return point;
	}

	const Series &primary() const {
		return point;
	}

	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}
};

} // namespace regimear::core
