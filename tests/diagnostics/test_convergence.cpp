#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "hydro-state/diagnostics/convergence.hpp"

#include <cmath>
#include <optional>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace hydrostate;
using diagnostics::BurnInPolicy;
using diagnostics::ConvergenceConfig;
using diagnostics::ConvergenceDiagnostics;
using model::Parameter;

namespace {

// Unit-variance noise around a level that sits at `offset` for the first `shifted` draws, then at zero.
std::vector<double> shiftedTrace(std::size_t length, std::size_t shifted, double offset, std::uint32_t seed) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 1.0);
	std::vector<double> trace(length);
	for (std::size_t i = 0; i < length; ++i) {
		trace[i] = (i < shifted ? offset : 0.0) + noise(rng);
	}
	return trace;
}

std::vector<double> ar1Trace(std::size_t length, double phi, std::uint32_t seed) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 1.0);
	std::vector<double> trace(length);
	double value = 0.0;
	for (auto &v : trace) {
		value = phi * value + noise(rng);
		v = value;
	}
	return trace;
}

inference::ChainResult makeChain(std::size_t index, const std::vector<double> &tau_obs,
                                 const std::vector<double> &tau_add) {
	inference::ChainTrace trace(tau_obs.size(), 1, {}, {Parameter::TauObs, Parameter::TauAdd});
	for (std::size_t i = 0; i < tau_obs.size(); ++i) {
		model::ParameterValues values;
		values.tau_obs = tau_obs[i];
		values.tau_add = tau_add[i];
		trace.record(values, Eigen::VectorXd::Zero(1), {});
	}
	return inference::ChainResult{index, index, std::move(trace), std::nullopt};
}

// Two chains that start at +10 and -10 and agree after draw 300.
inference::PosteriorSamples dispersedStart(std::size_t iterations) {
	std::vector<inference::ChainResult> chains;
	chains.push_back(makeChain(0, shiftedTrace(iterations, 300, 10.0, 1), shiftedTrace(iterations, 300, 10.0, 2)));
	chains.push_back(makeChain(1, shiftedTrace(iterations, 300, -10.0, 3), shiftedTrace(iterations, 300, -10.0, 4)));
	return inference::PosteriorSamples(std::move(chains), iterations, 1, {Parameter::TauObs, Parameter::TauAdd});
}

} // namespace

TEST_CASE("Potential scale reduction separates dispersed from mixed chains", "[diagnostics][psrf]") {
	const std::vector<std::vector<double>> chains{shiftedTrace(2000, 300, 10.0, 1),
	                                              shiftedTrace(2000, 300, -10.0, 3)};

	REQUIRE(ConvergenceDiagnostics::potentialScaleReduction(chains, 0, 200) > 2.0);
	REQUIRE(ConvergenceDiagnostics::potentialScaleReduction(chains) > 1.1);
	REQUIRE(ConvergenceDiagnostics::potentialScaleReduction(chains, 400) < 1.05);
}

TEST_CASE("Potential scale reduction edge cases", "[diagnostics][psrf][edge]") {
	const std::vector<double> flat(50, 2.0);
	REQUIRE(ConvergenceDiagnostics::potentialScaleReduction({flat, flat}) == 1.0);
	REQUIRE(std::isinf(ConvergenceDiagnostics::potentialScaleReduction({flat, std::vector<double>(50, 3.0)})));

	REQUIRE_THROWS_AS(ConvergenceDiagnostics::potentialScaleReduction({flat}), std::invalid_argument);
	REQUIRE_THROWS_AS(ConvergenceDiagnostics::potentialScaleReduction({flat, flat}, 49), std::invalid_argument);
}

TEST_CASE("Effective sample size reflects autocorrelation", "[diagnostics][ess]") {
	const std::vector<std::vector<double>> independent{ar1Trace(2000, 0.0, 5), ar1Trace(2000, 0.0, 6)};
	const std::vector<std::vector<double>> sticky{ar1Trace(2000, 0.95, 5), ar1Trace(2000, 0.95, 6)};

	const double ess_independent = ConvergenceDiagnostics::effectiveSampleSize(independent);
	const double ess_sticky = ConvergenceDiagnostics::effectiveSampleSize(sticky);

	REQUIRE(ess_independent > 2500.0);
	REQUIRE(ess_sticky < 400.0);
	REQUIRE(ess_sticky > 0.0);
}

TEST_CASE("Fixed burn-in accepts or rejects chains by ratio", "[diagnostics][convergence]") {
	const auto samples = dispersedStart(2000);

	ConvergenceConfig early;
	early.burn_in = 0;
	const auto rejected = ConvergenceDiagnostics(early).assess(samples);
	REQUIRE_FALSE(rejected.converged);
	REQUIRE_FALSE(rejected.reason.empty());
	REQUIRE(rejected.maxPsrf() > 1.1);
	REQUIRE(rejected.parameters.size() == 2);

	ConvergenceConfig late;
	late.burn_in = 400;
	const auto accepted = ConvergenceDiagnostics(late).assess(samples);
	REQUIRE(accepted.converged);
	REQUIRE(accepted.reason.empty());
	REQUIRE(accepted.burn_in == 400);
	REQUIRE(accepted.chains_used == 2);
	for (const auto &diag : accepted.parameters) {
		REQUIRE(diag.psrf < 1.1);
		REQUIRE(diag.effective_size > 0.0);
	}
}

TEST_CASE("Adaptive burn-in finds the end of the transient", "[diagnostics][convergence][adaptive]") {
	const auto samples = dispersedStart(2000);

	ConvergenceConfig config;
	config.policy = BurnInPolicy::Adaptive;
	config.adaptive_step = 50;
	config.min_retained = 100;
	const auto report = ConvergenceDiagnostics(config).assess(samples);

	REQUIRE(report.converged);
	REQUIRE(report.burn_in >= 50);
	REQUIRE(report.burn_in <= 300);
	REQUIRE(report.burn_in % 50 == 0);
}

TEST_CASE("Adaptive burn-in reports chains that never agree", "[diagnostics][convergence][adaptive]") {
	const std::vector<std::vector<double>> apart{shiftedTrace(500, 500, 10.0, 1), shiftedTrace(500, 500, -10.0, 2)};

	ConvergenceConfig config;
	config.policy = BurnInPolicy::Adaptive;
	const ConvergenceDiagnostics checker(config);
	REQUIRE_FALSE(checker.adaptiveBurnIn({apart}).has_value());

	const std::vector<std::vector<double>> short_chains{std::vector<double>(50, 0.0), std::vector<double>(50, 0.0)};
	REQUIRE_FALSE(checker.adaptiveBurnIn({short_chains}).has_value());
}

TEST_CASE("Convergence assessment validates its inputs", "[diagnostics][convergence][error]") {
	const auto samples = dispersedStart(200);

	ConvergenceConfig too_long;
	too_long.burn_in = 200;
	REQUIRE_THROWS_AS(ConvergenceDiagnostics(too_long).assess(samples), std::invalid_argument);

	ConvergenceConfig inactive;
	inactive.burn_in = 10;
	inactive.monitored = {Parameter::BetaDecay};
	REQUIRE_THROWS_AS(ConvergenceDiagnostics(inactive).assess(samples), std::invalid_argument);

	ConvergenceConfig bad_threshold;
	bad_threshold.threshold = 1.0;
	REQUIRE_THROWS_AS(ConvergenceDiagnostics(bad_threshold), std::invalid_argument);
}

TEST_CASE("Failed chains are excluded from the verdict", "[diagnostics][convergence][failure]") {
	std::vector<inference::ChainResult> chains;
	chains.push_back(makeChain(0, ar1Trace(100, 0.0, 1), ar1Trace(100, 0.0, 2)));
	auto failed = makeChain(1, ar1Trace(100, 0.0, 3), ar1Trace(100, 0.0, 4));
	failed.failure = inference::ChainFailure{40, "tau_add", "non-finite value"};
	chains.push_back(std::move(failed));
	const inference::PosteriorSamples samples(std::move(chains), 100, 1, {Parameter::TauObs, Parameter::TauAdd});

	ConvergenceConfig config;
	config.burn_in = 10;
	const auto report = ConvergenceDiagnostics(config).assess(samples);
	REQUIRE(report.chains_used == 1);
	REQUIRE_FALSE(report.converged);
	REQUIRE(report.parameters.empty());
	REQUIRE_FALSE(report.reason.empty());
}
