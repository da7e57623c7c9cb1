#pragma once

#include "hydro-state/core/dataset.hpp"
#include "hydro-state/inference/posterior_samples.hpp"
#include "hydro-state/model/model_specification.hpp"
#include "hydro-state/utils/random.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hydrostate::inference {

/// How the latent path is refreshed each iteration. Both leave the joint posterior invariant.
enum class LatentUpdate {
	BlockFfbs,
	SingleSite
};

/// Explicit starting point of a chain; anything left empty is initialized from the data.
struct ChainInit {
	std::optional<std::vector<double>> latent;
	std::map<model::Parameter, double> parameters;
};

/**
 * @class NumericalFailure
 * @brief A non-finite or degenerate value produced while sampling.
 */
class NumericalFailure : public std::runtime_error {
public:
	NumericalFailure(std::size_t iteration, std::string variable, const std::string &detail);

	std::size_t iteration() const {
		return iteration_;
	}

	const std::string &variable() const {
		return variable_;
	}

private:
	std::size_t iteration_;
	std::string variable_;
};

/**
 * @class ChainSampler
 * @brief One Gibbs chain over latent states, parameters and missing rainfall.
 *
 * Each sweep updates, in order: the latent path, every missing rainfall
 * value, the regression block (beta_rain and the seasonal pair), beta_decay
 * and mu0 when the decay term is active, then the precisions and the
 * rainfall hyperparameters. All conditionals are conjugate; beta_decay is
 * drawn from a normal truncated to its prior bounds.
 *
 * The sampler holds references to the model and dataset, which must outlive it.
 */
class ChainSampler {
public:
	ChainSampler(const model::ModelSpecification &model, const core::TimeSeriesDataset &data, LatentUpdate scheme,
	             std::uint64_t seed, const ChainInit &init = {});

	/// One full sweep. @throws NumericalFailure
	void step();

	/**
	 * @brief Runs @p iterations sweeps and records every draw.
	 *
	 * A NumericalFailure stops the chain; the result then carries the failure
	 * and the draws recorded before it.
	 */
	ChainResult run(std::size_t chain_index, std::size_t iterations);

	const model::ParameterValues &parameters() const {
		return params_;
	}

	const Eigen::VectorXd &latent() const {
		return x_;
	}

	/// Rainfall covariate with the current imputed values at missing positions.
	const std::vector<double> &rain() const {
		return rain_;
	}

	std::size_t iteration() const {
		return iteration_;
	}

private:
	void initialize(const ChainInit &init);

	void updateLatentBlock();
	void updateLatentSingleSite();
	void updateMissingRain();
	void updateRegression();
	void updateDecay();
	void updateMu0();
	void updatePrecisions();
	void updateRainHyperparameters();

	double offset(std::size_t t) const;
	double regressionTerm(std::size_t t) const;
	double checked(double value, const std::string &variable) const;

	const model::ModelSpecification &model_;
	const core::TimeSeriesDataset &data_;
	LatentUpdate scheme_;
	utils::RandomStream rng_;
	model::ParameterValues params_;
	Eigen::VectorXd x_;
	std::vector<double> rain_;
	bool uses_rain_;
	std::size_t iteration_ = 0;
};

} // namespace hydrostate::inference
