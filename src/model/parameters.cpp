#include "hydro-state/model/parameters.hpp"

#include <stdexcept>

namespace hydrostate::model {

std::string parameterName(Parameter p) {
	switch (p) {
	case Parameter::TauObs:
		return "tau_obs";
	case Parameter::TauAdd:
		return "tau_add";
	case Parameter::Mu0:
		return "mu0";
	case Parameter::BetaDecay:
		return "beta_decay";
	case Parameter::BetaRain:
		return "beta_rain";
	case Parameter::BetaSeasonSin:
		return "beta_season_sin";
	case Parameter::BetaSeasonCos:
		return "beta_season_cos";
	case Parameter::MuRain:
		return "mu_rain";
	case Parameter::TauRain:
		return "tau_rain";
	}
	return "unknown";
}

std::optional<Parameter> parameterFromName(const std::string &name) {
	for (auto p : kAllParameters) {
		if (parameterName(p) == name) {
			return p;
		}
	}
	return std::nullopt;
}

double ParameterValues::get(Parameter p) const {
	switch (p) {
	case Parameter::TauObs:
		return tau_obs;
	case Parameter::TauAdd:
		return tau_add;
	case Parameter::Mu0:
		return mu0;
	case Parameter::BetaDecay:
		return beta_decay;
	case Parameter::BetaRain:
		return beta_rain;
	case Parameter::BetaSeasonSin:
		return beta_season_sin;
	case Parameter::BetaSeasonCos:
		return beta_season_cos;
	case Parameter::MuRain:
		return mu_rain;
	case Parameter::TauRain:
		return tau_rain;
	}
	throw std::invalid_argument("Unknown parameter.");
}

void ParameterValues::set(Parameter p, double value) {
	switch (p) {
	case Parameter::TauObs:
		tau_obs = value;
		return;
	case Parameter::TauAdd:
		tau_add = value;
		return;
	case Parameter::Mu0:
		mu0 = value;
		return;
	case Parameter::BetaDecay:
		beta_decay = value;
		return;
	case Parameter::BetaRain:
		beta_rain = value;
		return;
	case Parameter::BetaSeasonSin:
		beta_season_sin = value;
		return;
	case Parameter::BetaSeasonCos:
		beta_season_cos = value;
		return;
	case Parameter::MuRain:
		mu_rain = value;
		return;
	case Parameter::TauRain:
		tau_rain = value;
		return;
	}
	throw std::invalid_argument("Unknown parameter.");
}

} // namespace hydrostate::model
