#include "hydro-state/summary/posterior_summarizer.hpp"
#include "hydro-state/utils/logging.hpp"
#include "hydro-state/utils/random.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace hydrostate::summary {

namespace {

double sampleMean(const std::vector<double> &values) {
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double sampleSd(const std::vector<double> &values, double mean) {
	if (values.size() < 2) {
		return 0.0;
	}
	double ss = 0.0;
	for (double v : values) {
		ss += (v - mean) * (v - mean);
	}
	return std::sqrt(ss / static_cast<double>(values.size() - 1));
}

} // namespace

void SummaryConfig::validate() const {
	if (!(lower_probability > 0.0) || !(upper_probability < 1.0) || !(lower_probability < 0.5) ||
	    !(upper_probability > 0.5)) {
		throw std::invalid_argument("Interval probabilities must satisfy 0 < lower < 0.5 < upper < 1.");
	}
}

Interval toNaturalScale(const Interval &log_interval) {
	return Interval{std::exp(log_interval.lower), std::exp(log_interval.median), std::exp(log_interval.upper)};
}

Interval toLogScale(const Interval &natural_interval) {
	if (!(natural_interval.lower > 0.0) || !(natural_interval.median > 0.0) || !(natural_interval.upper > 0.0)) {
		throw std::invalid_argument("Log scale requires strictly positive interval bounds.");
	}
	return Interval{std::log(natural_interval.lower), std::log(natural_interval.median),
	                std::log(natural_interval.upper)};
}

std::vector<double> ForecastTable::naturalMedians() const {
	std::vector<double> medians;
	medians.reserve(natural.size());
	for (const auto &row : natural) {
		medians.push_back(row.median);
	}
	return medians;
}

std::vector<double> ForecastTable::logMedians() const {
	if (!log) {
		throw std::runtime_error("Forecast table was built without log-scale columns.");
	}
	std::vector<double> medians;
	medians.reserve(log->size());
	for (const auto &row : *log) {
		medians.push_back(row.median);
	}
	return medians;
}

const ParameterSummary &PosteriorSummary::parameter(model::Parameter p) const {
	for (const auto &summary : parameters) {
		if (summary.parameter == p) {
			return summary;
		}
	}
	throw std::out_of_range("No summary for parameter '" + model::parameterName(p) + "'.");
}

PosteriorSummarizer::PosteriorSummarizer(SummaryConfig config) : config_(std::move(config)) {
	config_.validate();
}

double PosteriorSummarizer::quantileSorted(const std::vector<double> &sorted, double probability) {
	if (sorted.empty()) {
		throw std::invalid_argument("Quantile of an empty sample is undefined.");
	}
	if (sorted.size() == 1) {
		return sorted.front();
	}
	const double h = (static_cast<double>(sorted.size()) - 1.0) * probability;
	const auto lo = static_cast<std::size_t>(std::floor(h));
	const auto hi = std::min(lo + 1, sorted.size() - 1);
	return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

Interval PosteriorSummarizer::interval(std::vector<double> values) const {
	std::sort(values.begin(), values.end());
	return Interval{quantileSorted(values, config_.lower_probability), quantileSorted(values, 0.5),
	                quantileSorted(values, config_.upper_probability)};
}

PosteriorSummary PosteriorSummarizer::summarize(const inference::PosteriorSamples &samples,
                                                std::size_t burn_in) const {
	const auto surviving = samples.survivingChains();
	if (surviving.empty()) {
		throw std::runtime_error("No chain completed sampling; nothing to summarize.");
	}
	if (burn_in >= samples.iterations()) {
		throw std::runtime_error("Burn-in of " + std::to_string(burn_in) + " leaves no draws out of " +
		                         std::to_string(samples.iterations()) + ".");
	}

	const std::size_t n = samples.seriesLength();
	const std::size_t kept_per_chain = samples.iterations() - burn_in;
	const std::size_t pooled = kept_per_chain * surviving.size();

	// Pooled latent draws, one column per time step.
	Eigen::MatrixXd latent(static_cast<Eigen::Index>(pooled), static_cast<Eigen::Index>(n));
	Eigen::Index row = 0;
	utils::RandomStream noise(config_.predictive_seed);
	for (const auto *chain : surviving) {
		const auto &trace = chain->trace;
		const std::vector<double> *tau_obs =
		    config_.predictive ? &trace.parameter(model::Parameter::TauObs) : nullptr;
		for (std::size_t i = burn_in; i < samples.iterations(); ++i, ++row) {
			latent.row(row) = trace.latent().row(static_cast<Eigen::Index>(i));
			if (tau_obs) {
				const double sd = 1.0 / std::sqrt((*tau_obs)[i]);
				for (Eigen::Index t = 0; t < latent.cols(); ++t) {
					latent(row, t) += noise.normal(0.0, sd);
				}
			}
		}
	}

	PosteriorSummary summary;
	summary.draws_used = pooled;
	summary.burn_in = burn_in;
	summary.forecast.natural.reserve(n);
	if (config_.include_log_scale) {
		summary.forecast.log.emplace();
		summary.forecast.log->reserve(n);
	}

	std::vector<double> column(pooled);
	for (std::size_t t = 0; t < n; ++t) {
		for (std::size_t d = 0; d < pooled; ++d) {
			column[d] = latent(static_cast<Eigen::Index>(d), static_cast<Eigen::Index>(t));
		}
		if (config_.include_log_scale) {
			summary.forecast.log->push_back(interval(column));
		}
		// Exponentiate every draw first; quantiles of exp(x) are not exp of averaged quantiles.
		for (auto &value : column) {
			value = std::exp(value);
		}
		summary.forecast.natural.push_back(interval(column));
	}

	for (auto p : samples.activeParameters()) {
		std::vector<double> draws;
		draws.reserve(pooled);
		for (const auto *chain : surviving) {
			const auto &trace = chain->trace.parameter(p);
			draws.insert(draws.end(), trace.begin() + static_cast<std::ptrdiff_t>(burn_in),
			             trace.begin() + static_cast<std::ptrdiff_t>(samples.iterations()));
		}
		const double mean = sampleMean(draws);
		summary.parameters.push_back(ParameterSummary{p, mean, sampleSd(draws, mean), interval(draws)});
	}

	const auto &missing = surviving.front()->trace.missingRainIndices();
	summary.rain.indices = missing;
	for (std::size_t k = 0; k < missing.size(); ++k) {
		std::vector<double> draws;
		draws.reserve(pooled);
		for (const auto *chain : surviving) {
			const auto &imputed = chain->trace.imputedRain();
			for (std::size_t i = burn_in; i < samples.iterations(); ++i) {
				draws.push_back(imputed(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k)));
			}
		}
		summary.rain.mean.push_back(sampleMean(draws));
		summary.rain.interval.push_back(interval(std::move(draws)));
	}

	HYDRO_DEBUG("Summarized {} pooled draws from {} chain(s) over {} time steps", pooled, surviving.size(), n);
	return summary;
}

} // namespace hydrostate::summary
