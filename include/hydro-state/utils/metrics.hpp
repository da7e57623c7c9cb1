#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace hydrostate::utils {

/// Agreement-diagram statistics of a predicted series against an observed one.
struct TaylorStatistics {
	std::optional<double> correlation;
	std::optional<double> sd_ratio;
	double centered_rmsd = std::numeric_limits<double>::quiet_NaN();
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double bias(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Pearson correlation; empty when fewer than 2 pairs or either side has zero variance.
	static std::optional<double> pearson(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Squared Pearson correlation between observed and predicted values.
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Sample standard deviation (n - 1 denominator); empty for fewer than 2 values.
	static std::optional<double> stddev(const std::vector<double> &values);

	/// Root mean square of the mean-removed differences.
	static double centeredRmsd(const std::vector<double> &actual, const std::vector<double> &predicted);

	static TaylorStatistics taylor(const std::vector<double> &actual, const std::vector<double> &predicted);

	// Prediction interval coverage
	static double coverage(const std::vector<double> &actual, const std::vector<double> &lower,
	                       const std::vector<double> &upper);
};

} // namespace hydrostate::utils
