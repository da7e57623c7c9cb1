#include "hydro-state/model/model_specification.hpp"

#include <cmath>
#include <stdexcept>

namespace hydrostate::model {

namespace {

void validateGamma(const GammaPrior &prior, const char *name) {
	if (!(prior.shape > 0.0) || !(prior.rate > 0.0) || !std::isfinite(prior.shape) || !std::isfinite(prior.rate)) {
		throw std::invalid_argument(std::string("Gamma prior for ") + name + " requires positive finite shape and rate.");
	}
}

void validateNormal(const NormalPrior &prior, const char *name) {
	if (!std::isfinite(prior.mean)) {
		throw std::invalid_argument(std::string("Normal prior for ") + name + " requires a finite mean.");
	}
	if (!(prior.variance > 0.0) || !std::isfinite(prior.variance)) {
		throw std::invalid_argument(std::string("Normal prior for ") + name + " requires a positive finite variance.");
	}
}

} // namespace

ModelSpecification::ModelSpecification(ModelTerms terms, Priors priors, InitialCondition initial)
    : terms_(terms), priors_(priors), initial_(initial) {}

ModelSpecification::Builder ModelSpecification::builder() {
	return {};
}

ModelSpecification ModelSpecification::Builder::build() const {
	validateGamma(priors_.tau_obs, "tau_obs");
	validateGamma(priors_.tau_add, "tau_add");
	if (terms_.impute_rain) {
		validateGamma(priors_.tau_rain, "tau_rain");
		validateNormal(priors_.mu_rain, "mu_rain");
	}
	if (terms_.rain) {
		validateNormal(priors_.beta_rain, "beta_rain");
	}
	if (terms_.season) {
		validateNormal(priors_.beta_season, "beta_season");
	}
	if (terms_.decay) {
		validateNormal(priors_.mu0, "mu0");
		const auto &bounds = priors_.beta_decay;
		if (!(bounds.lower >= 0.0) || !(bounds.upper <= 1.0) || !(bounds.lower < bounds.upper)) {
			throw std::invalid_argument("Decay bounds must satisfy 0 <= lower < upper <= 1.");
		}
	}
	if (!(initial_.precision > 0.0) || !std::isfinite(initial_.precision) || !std::isfinite(initial_.mean)) {
		throw std::invalid_argument("Initial condition requires a finite mean and positive finite precision.");
	}
	return ModelSpecification(terms_, priors_, initial_);
}

ModelSpecification ModelSpecification::randomWalk() {
	return builder().build();
}

ModelSpecification ModelSpecification::randomWalkRain() {
	return builder().rain().imputeRain().build();
}

ModelSpecification ModelSpecification::randomWalkRainSeason() {
	return builder().rain().season().imputeRain().build();
}

ModelSpecification ModelSpecification::decayModel() {
	return builder().rain().season().decay().imputeRain().build();
}

bool ModelSpecification::isActive(Parameter p) const {
	switch (p) {
	case Parameter::TauObs:
	case Parameter::TauAdd:
		return true;
	case Parameter::Mu0:
	case Parameter::BetaDecay:
		return terms_.decay;
	case Parameter::BetaRain:
		return terms_.rain;
	case Parameter::BetaSeasonSin:
	case Parameter::BetaSeasonCos:
		return terms_.season;
	case Parameter::MuRain:
	case Parameter::TauRain:
		return terms_.impute_rain;
	}
	return false;
}

std::vector<Parameter> ModelSpecification::activeParameters() const {
	std::vector<Parameter> active;
	for (auto p : kAllParameters) {
		if (isActive(p)) {
			active.push_back(p);
		}
	}
	return active;
}

std::vector<Parameter> ModelSpecification::regressionParameters() const {
	std::vector<Parameter> params;
	if (terms_.rain) {
		params.push_back(Parameter::BetaRain);
	}
	if (terms_.season) {
		params.push_back(Parameter::BetaSeasonSin);
		params.push_back(Parameter::BetaSeasonCos);
	}
	return params;
}

double ModelSpecification::processOffset(const ParameterValues &params, double rain, double season_sin,
                                         double season_cos) const {
	double offset = 0.0;
	if (terms_.decay) {
		offset += params.mu0 * (1.0 - params.beta_decay);
	}
	if (terms_.rain) {
		offset += params.beta_rain * rain;
	}
	if (terms_.season) {
		offset += params.beta_season_sin * season_sin + params.beta_season_cos * season_cos;
	}
	return offset;
}

double ModelSpecification::processMean(const ParameterValues &params, double x_prev, double rain, double season_sin,
                                       double season_cos) const {
	return decayCoefficient(params) * x_prev + processOffset(params, rain, season_sin, season_cos);
}

ParameterValues ModelSpecification::neutralize(ParameterValues params) const {
	const ParameterValues neutral{};
	for (auto p : kAllParameters) {
		if (!isActive(p)) {
			params.set(p, neutral.get(p));
		}
	}
	return params;
}

std::string ModelSpecification::name() const {
	std::string label = terms_.decay ? "Decay" : "RandomWalk";
	if (terms_.rain) {
		label += "+Rain";
	}
	if (terms_.season) {
		label += "+Season";
	}
	if (terms_.impute_rain) {
		label += "+RainImputation";
	}
	return label;
}

} // namespace hydrostate::model
