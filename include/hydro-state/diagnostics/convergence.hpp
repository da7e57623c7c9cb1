#pragma once

#include "hydro-state/inference/posterior_samples.hpp"
#include "hydro-state/model/parameters.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hydrostate::diagnostics {

enum class BurnInPolicy {
	Fixed,
	Adaptive
};

struct ConvergenceConfig {
	/// Chains are accepted when every monitored ratio is below this value.
	double threshold = 1.1;
	BurnInPolicy policy = BurnInPolicy::Fixed;
	std::size_t burn_in = 1000;
	std::vector<model::Parameter> monitored{model::Parameter::TauObs, model::Parameter::TauAdd};

	/// Spacing between candidate prefixes for the adaptive policy.
	std::size_t adaptive_step = 50;
	/// Draws per chain that the adaptive policy must leave after burn-in.
	std::size_t min_retained = 100;

	/// @throws std::invalid_argument
	void validate() const;
};

struct ParameterDiagnostic {
	model::Parameter parameter;
	double psrf;
	double effective_size;
};

struct ConvergenceReport {
	bool converged = false;
	std::size_t burn_in = 0;
	std::size_t chains_used = 0;
	std::vector<ParameterDiagnostic> parameters;
	/// Empty when converged; otherwise why the chains were rejected.
	std::string reason;

	double maxPsrf() const;
};

/**
 * @class ConvergenceDiagnostics
 * @brief Between/within-chain checks on multi-chain traces.
 *
 * The verdict is a value, not an error: a rejected run is reported with its
 * ratios and the caller decides whether to sample longer.
 */
class ConvergenceDiagnostics {
public:
	explicit ConvergenceDiagnostics(ConvergenceConfig config = {});

	const ConvergenceConfig &config() const {
		return config_;
	}

	/// @throws std::invalid_argument If a monitored parameter is inactive or burn-in leaves no draws.
	ConvergenceReport assess(const inference::PosteriorSamples &samples) const;

	/**
	 * @brief Gelman-Rubin potential scale reduction over draws [begin, end) of each chain.
	 *
	 * Returns 1 for identical constant chains and +inf when chains are
	 * constant but disagree.
	 */
	static double potentialScaleReduction(const std::vector<std::vector<double>> &chains, std::size_t begin = 0,
	                                      std::size_t end = static_cast<std::size_t>(-1));

	/// Effective sample size summed across chains over draws [begin, end).
	static double effectiveSampleSize(const std::vector<std::vector<double>> &chains, std::size_t begin = 0,
	                                  std::size_t end = static_cast<std::size_t>(-1));

	/**
	 * @brief Smallest candidate prefix after which every later candidate keeps all ratios below threshold.
	 * @return The burn-in, or nothing when no candidate qualifies.
	 */
	std::optional<std::size_t> adaptiveBurnIn(const std::vector<std::vector<std::vector<double>>> &traces) const;

private:
	ConvergenceConfig config_;
};

} // namespace hydrostate::diagnostics
