#pragma once

#include "hydro-state/model/parameters.hpp"

#include <string>
#include <vector>

namespace hydrostate::model {

/// Terms switched on in the process equation.
struct ModelTerms {
	bool rain = false;
	bool season = false;
	bool decay = false;
	bool impute_rain = false;
};

struct GammaPrior {
	double shape;
	double rate;
};

struct NormalPrior {
	double mean;
	double variance;
};

struct UniformPrior {
	double lower;
	double upper;
};

struct Priors {
	GammaPrior tau_obs{1.0, 1.0};
	GammaPrior tau_add{1.0, 1.0};
	GammaPrior tau_rain{1.0, 1.0};
	NormalPrior mu0{0.0, 1000.0};
	NormalPrior mu_rain{0.0, 1000.0};
	NormalPrior beta_rain{0.0, 100.0};
	NormalPrior beta_season{0.0, 100.0};
	UniformPrior beta_decay{0.0, 1.0};
};

/// Prior of x[1]. With the decay term active the mean is mu0 and only the precision is used.
struct InitialCondition {
	double mean = 0.0;
	double precision = 0.01;
};

/**
 * @class ModelSpecification
 * @brief Structure and priors of one member of the state-space model family.
 *
 * Observation:  y[t] ~ Normal(x[t], 1/tau_obs)
 * Process:      x[t] ~ Normal(mu[t], 1/tau_add), t >= 2
 *               mu[t] = mu0 + beta_decay*(x[t-1] - mu0) + beta_rain*rain[t]
 *                       + beta_season_sin*season_sin[t] + beta_season_cos*season_cos[t]
 * Initial:      x[1] ~ Normal(x_ic, 1/tau_ic), or Normal(mu0, 1/tau_ic) with decay.
 * Imputation:   missing rain[t] ~ Normal(mu_rain, 1/tau_rain)
 *
 * Without the decay term the process is a random walk (beta_decay fixed at 1,
 * mu0 absent).
 */
class ModelSpecification {
public:
	class Builder {
	public:
		Builder &rain(bool enabled = true) {
			terms_.rain = enabled;
			return *this;
		}

		Builder &season(bool enabled = true) {
			terms_.season = enabled;
			return *this;
		}

		Builder &decay(bool enabled = true) {
			terms_.decay = enabled;
			return *this;
		}

		Builder &imputeRain(bool enabled = true) {
			terms_.impute_rain = enabled;
			return *this;
		}

		Builder &terms(ModelTerms terms) {
			terms_ = terms;
			return *this;
		}

		Builder &priors(Priors priors) {
			priors_ = priors;
			return *this;
		}

		Builder &observationPrecisionPrior(double shape, double rate) {
			priors_.tau_obs = {shape, rate};
			return *this;
		}

		Builder &processPrecisionPrior(double shape, double rate) {
			priors_.tau_add = {shape, rate};
			return *this;
		}

		Builder &rainPrecisionPrior(double shape, double rate) {
			priors_.tau_rain = {shape, rate};
			return *this;
		}

		Builder &decayBounds(double lower, double upper) {
			priors_.beta_decay = {lower, upper};
			return *this;
		}

		Builder &initialCondition(double mean, double precision) {
			initial_ = {mean, precision};
			return *this;
		}

		/// @throws std::invalid_argument On invalid hyperparameters or decay bounds.
		ModelSpecification build() const;

	private:
		ModelTerms terms_{};
		Priors priors_{};
		InitialCondition initial_{};
	};

	static Builder builder();

	static ModelSpecification randomWalk();
	static ModelSpecification randomWalkRain();
	static ModelSpecification randomWalkRainSeason();
	static ModelSpecification decayModel();

	const ModelTerms &terms() const {
		return terms_;
	}

	const Priors &priors() const {
		return priors_;
	}

	const InitialCondition &initialCondition() const {
		return initial_;
	}

	bool isActive(Parameter p) const;
	std::vector<Parameter> activeParameters() const;

	/// Regression coefficients updated jointly in the Gaussian block (beta_rain, season pair).
	std::vector<Parameter> regressionParameters() const;

	/// Single evaluation of mu[t]; inactive terms contribute nothing.
	double processMean(const ParameterValues &params, double x_prev, double rain, double season_sin,
	                   double season_cos) const;

	/// Part of mu[t] that does not multiply x[t-1].
	double processOffset(const ParameterValues &params, double rain, double season_sin, double season_cos) const;

	/// Coefficient on x[t-1] in mu[t].
	double decayCoefficient(const ParameterValues &params) const {
		return terms_.decay ? params.beta_decay : 1.0;
	}

	double initialMean(const ParameterValues &params) const {
		return terms_.decay ? params.mu0 : initial_.mean;
	}

	double initialPrecision() const {
		return initial_.precision;
	}

	/// Resets inactive parameters to their neutral values.
	ParameterValues neutralize(ParameterValues params) const;

	std::string name() const;

private:
	ModelSpecification(ModelTerms terms, Priors priors, InitialCondition initial);

	ModelTerms terms_;
	Priors priors_;
	InitialCondition initial_;
};

} // namespace hydrostate::model
