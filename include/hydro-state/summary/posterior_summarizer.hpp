#pragma once

#include "hydro-state/inference/posterior_samples.hpp"
#include "hydro-state/model/parameters.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace hydrostate::summary {

struct SummaryConfig {
	double lower_probability = 0.025;
	double upper_probability = 0.975;
	bool include_log_scale = true;

	/// Add a draw of observation noise to each latent draw before summarizing.
	bool predictive = false;
	std::uint64_t predictive_seed = 7;

	/// @throws std::invalid_argument
	void validate() const;
};

struct Interval {
	double lower;
	double median;
	double upper;
};

/// exp() of every bound.
Interval toNaturalScale(const Interval &log_interval);

/// log() of every bound. @throws std::invalid_argument On a non-positive bound.
Interval toLogScale(const Interval &natural_interval);

/**
 * @struct ForecastTable
 * @brief Per-time-step credible envelope on natural scale, optionally on log scale.
 */
struct ForecastTable {
	std::vector<Interval> natural;
	std::optional<std::vector<Interval>> log;

	std::size_t size() const {
		return natural.size();
	}

	bool hasLogScale() const {
		return log.has_value();
	}

	std::vector<double> naturalMedians() const;

	/// @throws std::runtime_error When the log-scale columns were not requested.
	std::vector<double> logMedians() const;
};

struct ParameterSummary {
	model::Parameter parameter;
	double mean;
	double sd;
	Interval interval;
};

struct RainImputationSummary {
	std::vector<std::size_t> indices;
	std::vector<double> mean;
	std::vector<Interval> interval;
};

struct PosteriorSummary {
	ForecastTable forecast;
	std::vector<ParameterSummary> parameters;
	RainImputationSummary rain;
	std::size_t draws_used = 0;
	std::size_t burn_in = 0;

	/// @throws std::out_of_range When @p p was not summarized.
	const ParameterSummary &parameter(model::Parameter p) const;
};

/**
 * @class PosteriorSummarizer
 * @brief Pools post-burn-in draws of surviving chains into decision-ready summaries.
 *
 * Natural-scale intervals are quantiles of exp(x) taken draw by draw, not
 * exp() of log-scale quantiles. Output depends only on the samples, the
 * burn-in and the config, so repeated calls agree exactly.
 */
class PosteriorSummarizer {
public:
	explicit PosteriorSummarizer(SummaryConfig config = {});

	const SummaryConfig &config() const {
		return config_;
	}

	/// @throws std::runtime_error When no chain survived or burn-in leaves no draws.
	PosteriorSummary summarize(const inference::PosteriorSamples &samples, std::size_t burn_in) const;

	/// Linear-interpolation quantile (R type 7) of already sorted values.
	static double quantileSorted(const std::vector<double> &sorted, double probability);

	/// Sorts a copy of @p values and returns the three interval quantiles.
	Interval interval(std::vector<double> values) const;

private:
	SummaryConfig config_;
};

} // namespace hydrostate::summary
