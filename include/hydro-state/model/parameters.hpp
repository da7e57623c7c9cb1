#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace hydrostate::model {

/// Scalar random variables of the state-space model.
enum class Parameter {
	TauObs,
	TauAdd,
	Mu0,
	BetaDecay,
	BetaRain,
	BetaSeasonSin,
	BetaSeasonCos,
	MuRain,
	TauRain
};

constexpr std::size_t kParameterCount = 9;

constexpr std::array<Parameter, kParameterCount> kAllParameters = {
    Parameter::TauObs,        Parameter::TauAdd,        Parameter::Mu0,
    Parameter::BetaDecay,     Parameter::BetaRain,      Parameter::BetaSeasonSin,
    Parameter::BetaSeasonCos, Parameter::MuRain,        Parameter::TauRain};

constexpr std::size_t parameterIndex(Parameter p) {
	return static_cast<std::size_t>(p);
}

std::string parameterName(Parameter p);
std::optional<Parameter> parameterFromName(const std::string &name);

/**
 * @struct ParameterValues
 * @brief One assignment to every scalar parameter.
 *
 * Inactive terms keep their neutral value (coefficient 0, decay 1) so the
 * process mean can be evaluated the same way for every model variant.
 */
struct ParameterValues {
	double tau_obs = 1.0;
	double tau_add = 1.0;
	double mu0 = 0.0;
	double beta_decay = 1.0;
	double beta_rain = 0.0;
	double beta_season_sin = 0.0;
	double beta_season_cos = 0.0;
	double mu_rain = 0.0;
	double tau_rain = 1.0;

	double get(Parameter p) const;
	void set(Parameter p, double value);
};

} // namespace hydrostate::model
