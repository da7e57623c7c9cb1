#include "hydro-state/inference/posterior_samples.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace hydrostate::inference {

ChainTrace::ChainTrace(std::size_t iterations, std::size_t series_length,
                       std::vector<std::size_t> missing_rain_indices, std::vector<model::Parameter> active)
    : latent_(static_cast<Eigen::Index>(iterations), static_cast<Eigen::Index>(series_length)),
      imputed_rain_(static_cast<Eigen::Index>(iterations), static_cast<Eigen::Index>(missing_rain_indices.size())),
      missing_rain_indices_(std::move(missing_rain_indices)) {
	for (auto p : active) {
		active_[model::parameterIndex(p)] = true;
		parameters_[model::parameterIndex(p)].reserve(iterations);
	}
}

void ChainTrace::record(const model::ParameterValues &params, const Eigen::VectorXd &latent,
                        const std::vector<double> &rain) {
	if (draws_ >= capacity()) {
		throw std::logic_error("ChainTrace capacity exceeded.");
	}
	if (latent.size() != latent_.cols()) {
		throw std::invalid_argument("Latent draw length does not match the trace.");
	}

	for (auto p : model::kAllParameters) {
		if (active_[model::parameterIndex(p)]) {
			parameters_[model::parameterIndex(p)].push_back(params.get(p));
		}
	}

	const auto row = static_cast<Eigen::Index>(draws_);
	latent_.row(row) = latent.transpose();
	for (std::size_t k = 0; k < missing_rain_indices_.size(); ++k) {
		imputed_rain_(row, static_cast<Eigen::Index>(k)) = rain.at(missing_rain_indices_[k]);
	}
	++draws_;
}

const std::vector<double> &ChainTrace::parameter(model::Parameter p) const {
	if (!active_[model::parameterIndex(p)]) {
		throw std::invalid_argument("Parameter '" + model::parameterName(p) + "' is not active in this model.");
	}
	return parameters_[model::parameterIndex(p)];
}

PosteriorSamples::PosteriorSamples(std::vector<ChainResult> chains, std::size_t iterations,
                                   std::size_t series_length, std::vector<model::Parameter> active)
    : chains_(std::move(chains)), iterations_(iterations), series_length_(series_length), active_(std::move(active)) {}

bool PosteriorSamples::isActive(model::Parameter p) const {
	return std::find(active_.begin(), active_.end(), p) != active_.end();
}

std::vector<const ChainResult *> PosteriorSamples::survivingChains() const {
	std::vector<const ChainResult *> surviving;
	for (const auto &chain : chains_) {
		if (chain.ok()) {
			surviving.push_back(&chain);
		}
	}
	return surviving;
}

std::size_t PosteriorSamples::survivingCount() const {
	return static_cast<std::size_t>(
	    std::count_if(chains_.begin(), chains_.end(), [](const ChainResult &c) { return c.ok(); }));
}

std::vector<std::vector<double>> PosteriorSamples::parameterChains(model::Parameter p) const {
	if (!isActive(p)) {
		throw std::invalid_argument("Parameter '" + model::parameterName(p) + "' is not active in this model.");
	}
	std::vector<std::vector<double>> traces;
	for (const auto *chain : survivingChains()) {
		traces.push_back(chain->trace.parameter(p));
	}
	return traces;
}

} // namespace hydrostate::inference
