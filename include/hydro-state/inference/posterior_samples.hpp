#pragma once

#include "hydro-state/model/parameters.hpp"

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hydrostate::inference {

/// Why and where a chain stopped.
struct ChainFailure {
	std::size_t iteration = 0;
	std::string variable;
	std::string message;
};

/**
 * @class ChainTrace
 * @brief Ordered draws of one chain.
 *
 * Parameter traces are kept for active parameters only. The latent path and
 * the imputed rainfall are stored one row per draw.
 */
class ChainTrace {
public:
	ChainTrace(std::size_t iterations, std::size_t series_length, std::vector<std::size_t> missing_rain_indices,
	           std::vector<model::Parameter> active);

	void record(const model::ParameterValues &params, const Eigen::VectorXd &latent,
	            const std::vector<double> &rain);

	/// Number of draws recorded so far.
	std::size_t draws() const {
		return draws_;
	}

	std::size_t capacity() const {
		return static_cast<std::size_t>(latent_.rows());
	}

	bool hasParameter(model::Parameter p) const {
		return active_[model::parameterIndex(p)];
	}

	/// @throws std::invalid_argument If @p p is not active in this run.
	const std::vector<double> &parameter(model::Parameter p) const;

	/// Latent draws; only the first draws() rows are populated.
	const Eigen::MatrixXd &latent() const {
		return latent_;
	}

	/// Imputed rainfall draws, one column per entry of missingRainIndices().
	const Eigen::MatrixXd &imputedRain() const {
		return imputed_rain_;
	}

	const std::vector<std::size_t> &missingRainIndices() const {
		return missing_rain_indices_;
	}

private:
	std::size_t draws_ = 0;
	std::array<bool, model::kParameterCount> active_{};
	std::array<std::vector<double>, model::kParameterCount> parameters_;
	Eigen::MatrixXd latent_;
	Eigen::MatrixXd imputed_rain_;
	std::vector<std::size_t> missing_rain_indices_;
};

struct ChainResult {
	std::size_t chain = 0;
	std::uint64_t seed = 0;
	ChainTrace trace;
	std::optional<ChainFailure> failure;

	bool ok() const {
		return !failure.has_value();
	}
};

/**
 * @class PosteriorSamples
 * @brief Raw multi-chain output of one engine run.
 *
 * Nothing is discarded here; burn-in is applied by the consumers.
 */
class PosteriorSamples {
public:
	PosteriorSamples(std::vector<ChainResult> chains, std::size_t iterations, std::size_t series_length,
	                 std::vector<model::Parameter> active);

	const std::vector<ChainResult> &chains() const {
		return chains_;
	}

	std::size_t iterations() const {
		return iterations_;
	}

	std::size_t seriesLength() const {
		return series_length_;
	}

	const std::vector<model::Parameter> &activeParameters() const {
		return active_;
	}

	bool isActive(model::Parameter p) const;

	/// Chains that completed every iteration.
	std::vector<const ChainResult *> survivingChains() const;
	std::size_t survivingCount() const;

	/// Traces of @p p for every surviving chain.
	std::vector<std::vector<double>> parameterChains(model::Parameter p) const;

private:
	std::vector<ChainResult> chains_;
	std::size_t iterations_;
	std::size_t series_length_;
	std::vector<model::Parameter> active_;
};

} // namespace hydrostate::inference
