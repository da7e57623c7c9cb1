#include "hydro-state/diagnostics/convergence.hpp"
#include "hydro-state/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace hydrostate::diagnostics {

namespace {

constexpr double kVarianceFloor = 1e-300;

std::size_t commonLength(const std::vector<std::vector<double>> &chains) {
	std::size_t len = std::numeric_limits<std::size_t>::max();
	for (const auto &chain : chains) {
		len = std::min(len, chain.size());
	}
	return chains.empty() ? 0 : len;
}

double segmentMean(const std::vector<double> &chain, std::size_t begin, std::size_t end) {
	return std::accumulate(chain.begin() + static_cast<std::ptrdiff_t>(begin),
	                       chain.begin() + static_cast<std::ptrdiff_t>(end), 0.0) /
	       static_cast<double>(end - begin);
}

// Geyer's initial positive sequence estimate of the integrated autocorrelation time.
double autocorrelationTime(const std::vector<double> &chain, std::size_t begin, std::size_t end) {
	const std::size_t n = end - begin;
	const double mean = segmentMean(chain, begin, end);

	auto autocov = [&](std::size_t lag) {
		double sum = 0.0;
		for (std::size_t i = begin; i + lag < end; ++i) {
			sum += (chain[i] - mean) * (chain[i + lag] - mean);
		}
		return sum / static_cast<double>(n);
	};

	const double gamma0 = autocov(0);
	if (gamma0 <= kVarianceFloor) {
		return 1.0;
	}

	double tau = -1.0;
	for (std::size_t k = 0; 2 * k + 1 < n; ++k) {
		const double pair = (autocov(2 * k) + autocov(2 * k + 1)) / gamma0;
		if (pair <= 0.0) {
			break;
		}
		tau += 2.0 * pair;
	}
	return std::max(tau, 1.0 / static_cast<double>(n));
}

std::string describeRatios(const std::vector<ParameterDiagnostic> &diagnostics) {
	std::ostringstream out;
	for (std::size_t i = 0; i < diagnostics.size(); ++i) {
		if (i > 0) {
			out << ", ";
		}
		out << model::parameterName(diagnostics[i].parameter) << "=" << diagnostics[i].psrf;
	}
	return out.str();
}

} // namespace

void ConvergenceConfig::validate() const {
	if (!(threshold > 1.0) || !std::isfinite(threshold)) {
		throw std::invalid_argument("Convergence threshold must be a finite value above 1.");
	}
	if (monitored.empty()) {
		throw std::invalid_argument("At least one parameter must be monitored.");
	}
	if (policy == BurnInPolicy::Adaptive) {
		if (adaptive_step == 0) {
			throw std::invalid_argument("Adaptive burn-in step must be positive.");
		}
		if (min_retained < 2) {
			throw std::invalid_argument("Adaptive burn-in must retain at least two draws.");
		}
	}
}

double ConvergenceReport::maxPsrf() const {
	double worst = 0.0;
	for (const auto &diag : parameters) {
		worst = std::max(worst, diag.psrf);
	}
	return worst;
}

ConvergenceDiagnostics::ConvergenceDiagnostics(ConvergenceConfig config) : config_(std::move(config)) {
	config_.validate();
}

double ConvergenceDiagnostics::potentialScaleReduction(const std::vector<std::vector<double>> &chains,
                                                       std::size_t begin, std::size_t end) {
	if (chains.size() < 2) {
		throw std::invalid_argument("Potential scale reduction needs at least two chains.");
	}
	end = std::min(end, commonLength(chains));
	if (end <= begin || end - begin < 2) {
		throw std::invalid_argument("Potential scale reduction needs at least two draws per chain.");
	}

	const auto n = static_cast<double>(end - begin);
	const auto m = static_cast<double>(chains.size());

	std::vector<double> means;
	double within = 0.0;
	for (const auto &chain : chains) {
		const double mean = segmentMean(chain, begin, end);
		double ss = 0.0;
		for (std::size_t i = begin; i < end; ++i) {
			ss += (chain[i] - mean) * (chain[i] - mean);
		}
		means.push_back(mean);
		within += ss / (n - 1.0);
	}
	within /= m;

	const double grand_mean = std::accumulate(means.begin(), means.end(), 0.0) / m;
	double between = 0.0;
	for (double mean : means) {
		between += (mean - grand_mean) * (mean - grand_mean);
	}
	between *= n / (m - 1.0);

	if (within <= kVarianceFloor) {
		return between <= kVarianceFloor ? 1.0 : std::numeric_limits<double>::infinity();
	}

	const double pooled = (n - 1.0) / n * within + between / n;
	return std::sqrt(pooled / within);
}

double ConvergenceDiagnostics::effectiveSampleSize(const std::vector<std::vector<double>> &chains,
                                                   std::size_t begin, std::size_t end) {
	if (chains.empty()) {
		throw std::invalid_argument("Effective sample size needs at least one chain.");
	}
	end = std::min(end, commonLength(chains));
	if (end <= begin || end - begin < 2) {
		throw std::invalid_argument("Effective sample size needs at least two draws per chain.");
	}
	double total = 0.0;
	for (const auto &chain : chains) {
		total += static_cast<double>(end - begin) / autocorrelationTime(chain, begin, end);
	}
	return total;
}

std::optional<std::size_t>
ConvergenceDiagnostics::adaptiveBurnIn(const std::vector<std::vector<std::vector<double>>> &traces) const {
	std::size_t len = std::numeric_limits<std::size_t>::max();
	for (const auto &chains : traces) {
		len = std::min(len, commonLength(chains));
	}
	if (traces.empty() || len < config_.min_retained) {
		return std::nullopt;
	}

	std::vector<std::size_t> candidates;
	for (std::size_t b = 0; b + config_.min_retained <= len; b += config_.adaptive_step) {
		candidates.push_back(b);
	}

	std::optional<std::size_t> burn_in;
	for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
		bool settled = true;
		for (const auto &chains : traces) {
			const double ratio = potentialScaleReduction(chains, *it, len);
			if (!(ratio < config_.threshold)) {
				settled = false;
				break;
			}
		}
		if (!settled) {
			break;
		}
		burn_in = *it;
	}
	return burn_in;
}

ConvergenceReport ConvergenceDiagnostics::assess(const inference::PosteriorSamples &samples) const {
	for (auto p : config_.monitored) {
		if (!samples.isActive(p)) {
			throw std::invalid_argument("Monitored parameter '" + model::parameterName(p) +
			                            "' is not active in this model.");
		}
	}
	if (config_.policy == BurnInPolicy::Fixed && config_.burn_in >= samples.iterations()) {
		throw std::invalid_argument("Burn-in must be smaller than the iteration count.");
	}

	ConvergenceReport report;
	report.chains_used = samples.survivingCount();
	report.burn_in = config_.policy == BurnInPolicy::Fixed ? config_.burn_in : samples.iterations() / 2;

	if (report.chains_used < 2) {
		report.reason = "only " + std::to_string(report.chains_used) + " chain(s) completed sampling";
		HYDRO_WARN("Convergence not assessed: {}", report.reason);
		return report;
	}

	std::vector<std::vector<std::vector<double>>> traces;
	traces.reserve(config_.monitored.size());
	for (auto p : config_.monitored) {
		traces.push_back(samples.parameterChains(p));
	}

	bool settled = true;
	if (config_.policy == BurnInPolicy::Adaptive) {
		const auto burn_in = adaptiveBurnIn(traces);
		if (burn_in) {
			report.burn_in = *burn_in;
		} else {
			settled = false;
		}
	}

	for (std::size_t i = 0; i < traces.size(); ++i) {
		ParameterDiagnostic diag{config_.monitored[i], potentialScaleReduction(traces[i], report.burn_in),
		                         effectiveSampleSize(traces[i], report.burn_in)};
		if (!(diag.psrf < config_.threshold)) {
			settled = false;
		}
		report.parameters.push_back(diag);
	}

	report.converged = settled;
	if (!settled) {
		report.reason = "potential scale reduction not below " + std::to_string(config_.threshold) + ": " +
		                describeRatios(report.parameters);
		HYDRO_WARN("Chains have not converged after burn-in {}: {}", report.burn_in, describeRatios(report.parameters));
	} else {
		HYDRO_DEBUG("Chains converged: burn-in {} ({})", report.burn_in, describeRatios(report.parameters));
	}
	return report;
}

} // namespace hydrostate::diagnostics
