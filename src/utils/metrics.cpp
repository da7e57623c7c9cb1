#include "hydro-state/utils/metrics.hpp"
#include <algorithm>
#include <numeric>

namespace hydrostate::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

double mean(const std::vector<double> &values) {
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

double Metrics::bias(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += (predicted[i] - actual[i]);
	}
	return sum / static_cast<double>(actual.size());
}

std::optional<double> Metrics::pearson(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	if (actual.size() < 2) {
		return std::nullopt;
	}

	const double mean_actual = mean(actual);
	const double mean_predicted = mean(predicted);

	double cross = 0.0;
	double ss_actual = 0.0;
	double ss_predicted = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double da = actual[i] - mean_actual;
		const double dp = predicted[i] - mean_predicted;
		cross += da * dp;
		ss_actual += da * da;
		ss_predicted += dp * dp;
	}

	if (ss_actual < std::numeric_limits<double>::epsilon() ||
	    ss_predicted < std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}

	return std::clamp(cross / std::sqrt(ss_actual * ss_predicted), -1.0, 1.0);
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const auto r = pearson(actual, predicted);
	if (!r) {
		return std::nullopt;
	}
	return (*r) * (*r);
}

std::optional<double> Metrics::stddev(const std::vector<double> &values) {
	if (values.size() < 2) {
		return std::nullopt;
	}
	const double m = mean(values);
	double ss = 0.0;
	for (double v : values) {
		ss += (v - m) * (v - m);
	}
	return std::sqrt(ss / static_cast<double>(values.size() - 1));
}

double Metrics::centeredRmsd(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	const double mean_actual = mean(actual);
	const double mean_predicted = mean(predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = (predicted[i] - mean_predicted) - (actual[i] - mean_actual);
		sum += diff * diff;
	}
	return std::sqrt(sum / static_cast<double>(actual.size()));
}

TaylorStatistics Metrics::taylor(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);

	TaylorStatistics stats;
	stats.correlation = pearson(actual, predicted);
	stats.centered_rmsd = centeredRmsd(actual, predicted);

	const auto sd_actual = stddev(actual);
	const auto sd_predicted = stddev(predicted);
	if (sd_actual && sd_predicted && *sd_actual > std::numeric_limits<double>::epsilon()) {
		stats.sd_ratio = *sd_predicted / *sd_actual;
	}
	return stats;
}

double Metrics::coverage(const std::vector<double> &actual, const std::vector<double> &lower,
                         const std::vector<double> &upper) {
	const auto n = actual.size();
	if (n == 0) {
		throw std::invalid_argument("Metrics::coverage: Arrays must not be empty");
	}
	if (lower.size() != n || upper.size() != n) {
		throw std::invalid_argument("Metrics::coverage: Arrays must have the same length");
	}

	std::size_t in_interval = 0;
	for (std::size_t i = 0; i < n; ++i) {
		if (!std::isfinite(actual[i]) || !std::isfinite(lower[i]) || !std::isfinite(upper[i])) {
			throw std::invalid_argument("Metrics::coverage: All values must be finite");
		}
		if (lower[i] > upper[i]) {
			throw std::invalid_argument("Metrics::coverage: Lower bound must be <= upper bound");
		}
		if (actual[i] >= lower[i] && actual[i] <= upper[i]) {
			++in_interval;
		}
	}

	return static_cast<double>(in_interval) / static_cast<double>(n);
}

} // namespace hydrostate::utils
