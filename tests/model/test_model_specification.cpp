#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "hydro-state/model/model_specification.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace hydrostate::model;

namespace {

bool contains(const std::vector<Parameter> &params, Parameter p) {
	return std::find(params.begin(), params.end(), p) != params.end();
}

} // namespace

TEST_CASE("Presets activate the expected parameters", "[model][specification]") {
	const auto walk = ModelSpecification::randomWalk();
	REQUIRE(walk.activeParameters() == std::vector<Parameter>{Parameter::TauObs, Parameter::TauAdd});
	REQUIRE(walk.regressionParameters().empty());
	REQUIRE(walk.name() == "RandomWalk");

	const auto rain = ModelSpecification::randomWalkRain();
	REQUIRE(contains(rain.activeParameters(), Parameter::BetaRain));
	REQUIRE(contains(rain.activeParameters(), Parameter::MuRain));
	REQUIRE_FALSE(contains(rain.activeParameters(), Parameter::BetaDecay));

	const auto season = ModelSpecification::randomWalkRainSeason();
	REQUIRE(season.regressionParameters() ==
	        std::vector<Parameter>{Parameter::BetaRain, Parameter::BetaSeasonSin, Parameter::BetaSeasonCos});

	const auto decay = ModelSpecification::decayModel();
	REQUIRE(decay.activeParameters().size() == kParameterCount);
	REQUIRE(decay.name() == "Decay+Rain+Season+RainImputation");
}

TEST_CASE("Process mean follows the active terms", "[model][specification]") {
	ParameterValues params;
	params.mu0 = 2.0;
	params.beta_decay = 0.5;
	params.beta_rain = 0.3;
	params.beta_season_sin = 0.1;
	params.beta_season_cos = -0.2;

	const auto decay = ModelSpecification::decayModel();
	// 2 + 0.5 * (1 - 2) + 0.3 * 1 + 0.1 * 0.5 - 0.2 * 0.25
	REQUIRE(decay.processMean(params, 1.0, 1.0, 0.5, 0.25) == Catch::Approx(1.8));
	REQUIRE(decay.decayCoefficient(params) == Catch::Approx(0.5));
	REQUIRE(decay.initialMean(params) == Catch::Approx(2.0));

	const auto walk = ModelSpecification::randomWalk();
	REQUIRE(walk.processMean(params, 1.0, 1.0, 0.5, 0.25) == Catch::Approx(1.0));
	REQUIRE(walk.decayCoefficient(params) == Catch::Approx(1.0));
	REQUIRE(walk.initialMean(params) == Catch::Approx(0.0));
}

TEST_CASE("Neutralize resets inactive parameters", "[model][specification]") {
	ParameterValues params;
	params.beta_rain = 4.0;
	params.beta_decay = 0.2;
	params.tau_obs = 3.0;

	const auto neutral = ModelSpecification::randomWalk().neutralize(params);
	REQUIRE(neutral.beta_rain == 0.0);
	REQUIRE(neutral.beta_decay == 1.0);
	REQUIRE(neutral.tau_obs == 3.0);
}

TEST_CASE("Builder validates priors and bounds", "[model][specification][error]") {
	REQUIRE_THROWS_AS(ModelSpecification::builder().observationPrecisionPrior(0.0, 1.0).build(),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(ModelSpecification::builder().processPrecisionPrior(1.0, -1.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(ModelSpecification::builder().decay().decayBounds(0.8, 0.2).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(ModelSpecification::builder().decay().decayBounds(0.0, 1.5).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(ModelSpecification::builder().initialCondition(0.0, 0.0).build(), std::invalid_argument);

	// Decay bounds are only checked when the decay term is on.
	REQUIRE_NOTHROW(ModelSpecification::builder().decayBounds(0.8, 0.2).build());

	const auto custom = ModelSpecification::builder().initialCondition(1.5, 4.0).build();
	REQUIRE(custom.initialPrecision() == Catch::Approx(4.0));
	REQUIRE(custom.initialMean(ParameterValues{}) == Catch::Approx(1.5));
}

TEST_CASE("Parameter names round-trip", "[model][parameters]") {
	for (auto p : kAllParameters) {
		const auto parsed = parameterFromName(parameterName(p));
		REQUIRE(parsed.has_value());
		REQUIRE(*parsed == p);
	}
	REQUIRE_FALSE(parameterFromName("sigma").has_value());

	ParameterValues values;
	values.set(Parameter::TauRain, 7.0);
	REQUIRE(values.get(Parameter::TauRain) == 7.0);
}
