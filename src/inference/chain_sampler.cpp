#include "hydro-state/inference/chain_sampler.hpp"
#include "hydro-state/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

namespace hydrostate::inference {

namespace {

std::string indexed(const char *name, std::size_t t) {
	return std::string(name) + "[" + std::to_string(t + 1) + "]";
}

double sampleVariance(const std::vector<double> &values) {
	if (values.size() < 2) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
	double ss = 0.0;
	for (double v : values) {
		ss += (v - mean) * (v - mean);
	}
	return ss / static_cast<double>(values.size() - 1);
}

// Linear interpolation over missing positions; the ends carry the nearest observation.
std::vector<double> interpolateMissing(const std::vector<double> &values) {
	const std::size_t n = values.size();
	std::vector<double> filled(values);
	std::vector<std::size_t> known;
	for (std::size_t t = 0; t < n; ++t) {
		if (!std::isnan(values[t])) {
			known.push_back(t);
		}
	}
	if (known.empty()) {
		return filled;
	}
	for (std::size_t t = 0; t < known.front(); ++t) {
		filled[t] = values[known.front()];
	}
	for (std::size_t t = known.back() + 1; t < n; ++t) {
		filled[t] = values[known.back()];
	}
	for (std::size_t k = 0; k + 1 < known.size(); ++k) {
		const std::size_t left = known[k];
		const std::size_t right = known[k + 1];
		for (std::size_t t = left + 1; t < right; ++t) {
			const double w = static_cast<double>(t - left) / static_cast<double>(right - left);
			filled[t] = (1.0 - w) * values[left] + w * values[right];
		}
	}
	return filled;
}

} // namespace

NumericalFailure::NumericalFailure(std::size_t iteration, std::string variable, const std::string &detail)
    : std::runtime_error("Numerical failure at iteration " + std::to_string(iteration) + " in " + variable + ": " +
                         detail),
      iteration_(iteration), variable_(std::move(variable)) {}

ChainSampler::ChainSampler(const model::ModelSpecification &model, const core::TimeSeriesDataset &data,
                           LatentUpdate scheme, std::uint64_t seed, const ChainInit &init)
    : model_(model), data_(data), scheme_(scheme), rng_(seed),
      x_(static_cast<Eigen::Index>(data.size())),
      rain_(data.size(), 0.0),
      uses_rain_(data.hasRain() && (model.terms().rain || model.terms().impute_rain)) {
	initialize(init);
}

void ChainSampler::initialize(const ChainInit &init) {
	const auto &y = data_.response();
	const std::size_t n = data_.size();

	// Bootstrap resample of the observed response sets the precision starting values.
	std::vector<double> observed;
	for (double v : y) {
		if (!std::isnan(v)) {
			observed.push_back(v);
		}
	}
	std::vector<double> resample(observed.size());
	for (auto &v : resample) {
		v = observed[rng_.index(observed.size())];
	}
	std::vector<double> diffs;
	for (std::size_t i = 1; i < resample.size(); ++i) {
		diffs.push_back(resample[i] - resample[i - 1]);
	}

	const double var_level = sampleVariance(resample);
	const double var_diff = sampleVariance(diffs);
	params_ = model::ParameterValues{};
	params_.tau_obs = (std::isfinite(var_level) && var_level > 0.0) ? 5.0 / var_level : 1.0;
	params_.tau_add = (std::isfinite(var_diff) && var_diff > 0.0) ? 1.0 / var_diff : 1.0;

	const double mean_observed =
	    observed.empty() ? 0.0 : std::accumulate(observed.begin(), observed.end(), 0.0) / observed.size();
	if (model_.terms().decay) {
		params_.mu0 = mean_observed;
		const auto &bounds = model_.priors().beta_decay;
		params_.beta_decay = 0.5 * (bounds.lower + bounds.upper);
	}

	if (uses_rain_) {
		std::vector<double> observed_rain;
		for (double r : data_.rain()) {
			if (!std::isnan(r)) {
				observed_rain.push_back(r);
			}
		}
		if (model_.terms().impute_rain) {
			params_.mu_rain = observed_rain.empty()
			                      ? model_.priors().mu_rain.mean
			                      : std::accumulate(observed_rain.begin(), observed_rain.end(), 0.0) /
			                            static_cast<double>(observed_rain.size());
			const double var_rain = sampleVariance(observed_rain);
			params_.tau_rain = (std::isfinite(var_rain) && var_rain > 0.0) ? 1.0 / var_rain : 1.0;
		}
	}

	for (const auto &entry : init.parameters) {
		if (!model_.isActive(entry.first)) {
			throw std::invalid_argument("Initial value given for inactive parameter '" +
			                            model::parameterName(entry.first) + "'.");
		}
		if (!std::isfinite(entry.second)) {
			throw std::invalid_argument("Initial value for '" + model::parameterName(entry.first) +
			                            "' must be finite.");
		}
		params_.set(entry.first, entry.second);
	}
	params_ = model_.neutralize(params_);
	if (!(params_.tau_obs > 0.0) || !(params_.tau_add > 0.0) || !(params_.tau_rain > 0.0)) {
		throw std::invalid_argument("Initial precisions must be positive.");
	}
	if (model_.terms().decay) {
		const auto &bounds = model_.priors().beta_decay;
		if (params_.beta_decay < bounds.lower || params_.beta_decay > bounds.upper) {
			throw std::invalid_argument("Initial beta_decay lies outside its bounds.");
		}
	}

	if (init.latent) {
		if (init.latent->size() != n) {
			throw std::invalid_argument("Initial latent path length must match the series length.");
		}
		for (std::size_t t = 0; t < n; ++t) {
			if (!std::isfinite((*init.latent)[t])) {
				throw std::invalid_argument("Initial latent path must be finite.");
			}
			x_[static_cast<Eigen::Index>(t)] = (*init.latent)[t];
		}
	} else {
		const auto filled = interpolateMissing(y);
		for (std::size_t t = 0; t < n; ++t) {
			x_[static_cast<Eigen::Index>(t)] = std::isnan(filled[t]) ? mean_observed : filled[t];
		}
	}

	if (uses_rain_) {
		const auto &rain = data_.rain();
		for (std::size_t t = 0; t < n; ++t) {
			rain_[t] = std::isnan(rain[t]) ? params_.mu_rain : rain[t];
		}
	}
}

double ChainSampler::checked(double value, const std::string &variable) const {
	if (!std::isfinite(value)) {
		throw NumericalFailure(iteration_, variable, "non-finite value");
	}
	return value;
}

double ChainSampler::offset(std::size_t t) const {
	return model_.processOffset(params_, rain_[t], data_.seasonSin()[t], data_.seasonCos()[t]);
}

double ChainSampler::regressionTerm(std::size_t t) const {
	double term = offset(t);
	if (model_.terms().decay) {
		term -= params_.mu0 * (1.0 - params_.beta_decay);
	}
	return term;
}

void ChainSampler::step() {
	if (scheme_ == LatentUpdate::BlockFfbs) {
		updateLatentBlock();
	} else {
		updateLatentSingleSite();
	}
	if (uses_rain_ && model_.terms().impute_rain) {
		updateMissingRain();
	}
	if (!model_.regressionParameters().empty()) {
		updateRegression();
	}
	if (model_.terms().decay) {
		updateDecay();
		updateMu0();
	}
	updatePrecisions();
	if (uses_rain_ && model_.terms().impute_rain) {
		updateRainHyperparameters();
	}
}

// Forward filtering, backward sampling of the whole path in one block.
void ChainSampler::updateLatentBlock() {
	const auto &y = data_.response();
	const std::size_t n = data_.size();
	const double phi = model_.decayCoefficient(params_);
	const double obs_var = 1.0 / params_.tau_obs;
	const double add_var = 1.0 / params_.tau_add;

	std::vector<double> m(n);
	std::vector<double> c(n);
	for (std::size_t t = 0; t < n; ++t) {
		double a;
		double r;
		if (t == 0) {
			a = model_.initialMean(params_);
			r = 1.0 / model_.initialPrecision();
		} else {
			a = offset(t) + phi * m[t - 1];
			r = phi * phi * c[t - 1] + add_var;
		}
		if (!std::isnan(y[t])) {
			const double gain = r / (r + obs_var);
			m[t] = a + gain * (y[t] - a);
			c[t] = (1.0 - gain) * r;
		} else {
			m[t] = a;
			c[t] = r;
		}
		checked(m[t], indexed("filter_mean", t));
		if (!(c[t] > 0.0)) {
			throw NumericalFailure(iteration_, indexed("filter_var", t), "non-positive variance");
		}
	}

	x_[static_cast<Eigen::Index>(n - 1)] = checked(rng_.normal(m[n - 1], std::sqrt(c[n - 1])), indexed("x", n - 1));
	for (std::size_t k = n - 1; k-- > 0;) {
		const double precision = 1.0 / c[k] + phi * phi * params_.tau_add;
		const double numerator =
		    m[k] / c[k] + phi * params_.tau_add * (x_[static_cast<Eigen::Index>(k + 1)] - offset(k + 1));
		x_[static_cast<Eigen::Index>(k)] =
		    checked(rng_.normalPrecision(numerator / precision, precision), indexed("x", k));
	}
}

void ChainSampler::updateLatentSingleSite() {
	const auto &y = data_.response();
	const std::size_t n = data_.size();
	const double phi = model_.decayCoefficient(params_);

	for (std::size_t t = 0; t < n; ++t) {
		double precision = 0.0;
		double numerator = 0.0;
		if (t == 0) {
			precision += model_.initialPrecision();
			numerator += model_.initialPrecision() * model_.initialMean(params_);
		} else {
			const double mu = offset(t) + phi * x_[static_cast<Eigen::Index>(t - 1)];
			precision += params_.tau_add;
			numerator += params_.tau_add * mu;
		}
		if (t + 1 < n) {
			precision += params_.tau_add * phi * phi;
			numerator += params_.tau_add * phi * (x_[static_cast<Eigen::Index>(t + 1)] - offset(t + 1));
		}
		if (!std::isnan(y[t])) {
			precision += params_.tau_obs;
			numerator += params_.tau_obs * y[t];
		}
		x_[static_cast<Eigen::Index>(t)] =
		    checked(rng_.normalPrecision(numerator / precision, precision), indexed("x", t));
	}
}

void ChainSampler::updateMissingRain() {
	const double phi = model_.decayCoefficient(params_);
	const bool rain_effect = model_.terms().rain;

	for (std::size_t t : data_.missingRainIndices()) {
		double precision = params_.tau_rain;
		double numerator = params_.tau_rain * params_.mu_rain;
		if (rain_effect && t > 0) {
			// Residual of x[t] with the rain contribution removed.
			const double without_rain = model_.processOffset(params_, 0.0, data_.seasonSin()[t], data_.seasonCos()[t]);
			const double residual =
			    x_[static_cast<Eigen::Index>(t)] - phi * x_[static_cast<Eigen::Index>(t - 1)] - without_rain;
			precision += params_.beta_rain * params_.beta_rain * params_.tau_add;
			numerator += params_.beta_rain * params_.tau_add * residual;
		}
		rain_[t] = checked(rng_.normalPrecision(numerator / precision, precision), indexed("rain", t));
	}
}

void ChainSampler::updateRegression() {
	const auto coefficients = model_.regressionParameters();
	const auto k = static_cast<Eigen::Index>(coefficients.size());
	const std::size_t n = data_.size();
	const double phi = model_.decayCoefficient(params_);
	const double level_offset = model_.terms().decay ? params_.mu0 * (1.0 - params_.beta_decay) : 0.0;

	Eigen::MatrixXd precision = Eigen::MatrixXd::Zero(k, k);
	Eigen::VectorXd rhs = Eigen::VectorXd::Zero(k);
	Eigen::VectorXd row(k);

	for (std::size_t t = 1; t < n; ++t) {
		for (Eigen::Index j = 0; j < k; ++j) {
			switch (coefficients[static_cast<std::size_t>(j)]) {
			case model::Parameter::BetaRain:
				row[j] = rain_[t];
				break;
			case model::Parameter::BetaSeasonSin:
				row[j] = data_.seasonSin()[t];
				break;
			default:
				row[j] = data_.seasonCos()[t];
				break;
			}
		}
		const double target =
		    x_[static_cast<Eigen::Index>(t)] - phi * x_[static_cast<Eigen::Index>(t - 1)] - level_offset;
		precision.noalias() += params_.tau_add * row * row.transpose();
		rhs.noalias() += params_.tau_add * target * row;
	}

	for (Eigen::Index j = 0; j < k; ++j) {
		const auto p = coefficients[static_cast<std::size_t>(j)];
		const auto &prior = p == model::Parameter::BetaRain ? model_.priors().beta_rain : model_.priors().beta_season;
		precision(j, j) += 1.0 / prior.variance;
		rhs[j] += prior.mean / prior.variance;
	}

	Eigen::LLT<Eigen::MatrixXd> llt(precision);
	if (llt.info() != Eigen::Success) {
		throw NumericalFailure(iteration_, "regression", "posterior precision is not positive definite");
	}
	const Eigen::VectorXd mean = llt.solve(rhs);
	Eigen::VectorXd noise(k);
	for (Eigen::Index j = 0; j < k; ++j) {
		noise[j] = rng_.standardNormal();
	}
	// precision = U^T U, so U^{-1} z has covariance precision^{-1}.
	const Eigen::VectorXd draw = mean + llt.matrixU().solve(noise);

	for (Eigen::Index j = 0; j < k; ++j) {
		const auto p = coefficients[static_cast<std::size_t>(j)];
		params_.set(p, checked(draw[j], model::parameterName(p)));
	}
}

void ChainSampler::updateDecay() {
	const std::size_t n = data_.size();
	const auto &bounds = model_.priors().beta_decay;

	double sum_uu = 0.0;
	double sum_uw = 0.0;
	for (std::size_t t = 1; t < n; ++t) {
		const double u = x_[static_cast<Eigen::Index>(t - 1)] - params_.mu0;
		const double w = x_[static_cast<Eigen::Index>(t)] - params_.mu0 - regressionTerm(t);
		sum_uu += u * u;
		sum_uw += u * w;
	}

	if (sum_uu * params_.tau_add < 1e-12) {
		// No information in the path; the conditional is the uniform prior.
		params_.beta_decay = bounds.lower + (bounds.upper - bounds.lower) * rng_.uniform();
		return;
	}

	const double mean = sum_uw / sum_uu;
	const double sd = 1.0 / std::sqrt(params_.tau_add * sum_uu);
	try {
		params_.beta_decay = checked(rng_.truncatedNormal(mean, sd, bounds.lower, bounds.upper), "beta_decay");
	} catch (const NumericalFailure &) {
		throw;
	} catch (const std::runtime_error &e) {
		throw NumericalFailure(iteration_, "beta_decay", e.what());
	}
}

void ChainSampler::updateMu0() {
	const std::size_t n = data_.size();
	const auto &prior = model_.priors().mu0;
	const double phi = params_.beta_decay;
	const double tau_ic = model_.initialPrecision();

	double precision = 1.0 / prior.variance + tau_ic;
	double numerator = prior.mean / prior.variance + tau_ic * x_[0];
	const double lever = 1.0 - phi;
	for (std::size_t t = 1; t < n; ++t) {
		const double target = x_[static_cast<Eigen::Index>(t)] - phi * x_[static_cast<Eigen::Index>(t - 1)] -
		                      regressionTerm(t);
		precision += params_.tau_add * lever * lever;
		numerator += params_.tau_add * lever * target;
	}
	params_.mu0 = checked(rng_.normalPrecision(numerator / precision, precision), "mu0");
}

void ChainSampler::updatePrecisions() {
	const auto &y = data_.response();
	const std::size_t n = data_.size();
	const double phi = model_.decayCoefficient(params_);

	double ss_obs = 0.0;
	std::size_t n_obs = 0;
	for (std::size_t t = 0; t < n; ++t) {
		if (!std::isnan(y[t])) {
			const double e = y[t] - x_[static_cast<Eigen::Index>(t)];
			ss_obs += e * e;
			++n_obs;
		}
	}

	double ss_add = 0.0;
	for (std::size_t t = 1; t < n; ++t) {
		const double e = x_[static_cast<Eigen::Index>(t)] - offset(t) - phi * x_[static_cast<Eigen::Index>(t - 1)];
		ss_add += e * e;
	}

	const auto &obs_prior = model_.priors().tau_obs;
	const auto &add_prior = model_.priors().tau_add;
	params_.tau_obs =
	    checked(rng_.gamma(obs_prior.shape + 0.5 * static_cast<double>(n_obs), obs_prior.rate + 0.5 * ss_obs),
	            "tau_obs");
	params_.tau_add = checked(
	    rng_.gamma(add_prior.shape + 0.5 * static_cast<double>(n - 1), add_prior.rate + 0.5 * ss_add), "tau_add");

	if (!(params_.tau_obs > 0.0)) {
		throw NumericalFailure(iteration_, "tau_obs", "precision underflowed to zero");
	}
	if (!(params_.tau_add > 0.0)) {
		throw NumericalFailure(iteration_, "tau_add", "precision underflowed to zero");
	}
}

void ChainSampler::updateRainHyperparameters() {
	const std::size_t n = rain_.size();
	const auto &mean_prior = model_.priors().mu_rain;
	const auto &precision_prior = model_.priors().tau_rain;

	const double total = std::accumulate(rain_.begin(), rain_.end(), 0.0);
	const double precision = 1.0 / mean_prior.variance + static_cast<double>(n) * params_.tau_rain;
	const double numerator = mean_prior.mean / mean_prior.variance + params_.tau_rain * total;
	params_.mu_rain = checked(rng_.normalPrecision(numerator / precision, precision), "mu_rain");

	double ss = 0.0;
	for (double r : rain_) {
		ss += (r - params_.mu_rain) * (r - params_.mu_rain);
	}
	params_.tau_rain = checked(
	    rng_.gamma(precision_prior.shape + 0.5 * static_cast<double>(n), precision_prior.rate + 0.5 * ss), "tau_rain");
	if (!(params_.tau_rain > 0.0)) {
		throw NumericalFailure(iteration_, "tau_rain", "precision underflowed to zero");
	}
}

ChainResult ChainSampler::run(std::size_t chain_index, std::size_t iterations) {
	const bool imputes = uses_rain_ && model_.terms().impute_rain;
	ChainResult result{chain_index, rng_.seed(),
	                   ChainTrace(iterations, data_.size(),
	                              imputes ? data_.missingRainIndices() : std::vector<std::size_t>{},
	                              model_.activeParameters()),
	                   std::nullopt};

	HYDRO_INFO("Chain {} started: model={} iterations={} seed={}", chain_index, model_.name(), iterations,
	           rng_.seed());

	for (iteration_ = 0; iteration_ < iterations; ++iteration_) {
		try {
			step();
		} catch (const NumericalFailure &failure) {
			HYDRO_ERROR("Chain {} aborted at iteration {} ({}): {}", chain_index, failure.iteration(),
			            failure.variable(), failure.what());
			result.failure = ChainFailure{failure.iteration(), failure.variable(), failure.what()};
			return result;
		}
		result.trace.record(params_, x_, rain_);
	}

	HYDRO_INFO("Chain {} finished: tau_obs={:.4f} tau_add={:.4f}", chain_index, params_.tau_obs, params_.tau_add);
	return result;
}

} // namespace hydrostate::inference
