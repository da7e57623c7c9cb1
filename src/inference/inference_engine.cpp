#include "hydro-state/inference/inference_engine.hpp"
#include "hydro-state/utils/logging.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

namespace hydrostate::inference {

void EngineConfig::validate() const {
	if (chains < 2) {
		throw std::invalid_argument("At least two chains are required.");
	}
	if (iterations == 0) {
		throw std::invalid_argument("Iteration count must be positive.");
	}
	if (!seeds.empty() && seeds.size() != chains) {
		throw std::invalid_argument("Seed count must match the chain count.");
	}
	if (!initial_values.empty() && initial_values.size() != chains) {
		throw std::invalid_argument("Initial value count must match the chain count.");
	}
}

std::vector<std::uint64_t> EngineConfig::chainSeeds() const {
	if (!seeds.empty()) {
		return seeds;
	}
	std::vector<std::uint64_t> derived(chains);
	for (std::size_t c = 0; c < chains; ++c) {
		derived[c] = base_seed + c;
	}
	return derived;
}

InferenceEngine::Builder InferenceEngine::builder() {
	return {};
}

InferenceEngine InferenceEngine::Builder::build() const {
	return InferenceEngine(config_);
}

InferenceEngine::InferenceEngine(EngineConfig config) : config_(std::move(config)) {
	config_.validate();
}

void InferenceEngine::validateInputs(const model::ModelSpecification &model, const core::TimeSeriesDataset &data) {
	if (data.size() == 0) {
		throw std::invalid_argument("Dataset is empty.");
	}
	if (data.observedCount() == 0) {
		throw std::invalid_argument("Response has no observed values available for fitting.");
	}
	const auto &terms = model.terms();
	if ((terms.rain || terms.impute_rain) && !data.hasRain()) {
		throw std::invalid_argument("Model '" + model.name() + "' needs a rainfall covariate.");
	}
	if (terms.rain && !terms.impute_rain && !data.missingRainIndices().empty()) {
		throw std::invalid_argument("Rainfall has " + std::to_string(data.missingRainIndices().size()) +
		                            " missing value(s) but rainfall imputation is disabled.");
	}
}

PosteriorSamples InferenceEngine::run(const model::ModelSpecification &model,
                                      const core::TimeSeriesDataset &data) const {
	validateInputs(model, data);

	const auto seeds = config_.chainSeeds();
	const std::size_t chains = config_.chains;

	// Samplers are constructed up front so initialization errors surface before any thread starts.
	std::vector<ChainSampler> samplers;
	samplers.reserve(chains);
	for (std::size_t c = 0; c < chains; ++c) {
		const ChainInit init = config_.initial_values.empty() ? ChainInit{} : config_.initial_values[c];
		samplers.emplace_back(model, data, config_.latent_update, seeds[c], init);
	}

	HYDRO_INFO("Sampling {} with {} chains x {} iterations (n={}, parallel={})", model.name(), chains,
	           config_.iterations, data.size(), config_.parallel);

	std::vector<std::optional<ChainResult>> results(chains);
	std::vector<std::exception_ptr> errors(chains);
	auto runChain = [&](std::size_t c) {
		try {
			results[c] = samplers[c].run(c, config_.iterations);
		} catch (const std::exception &) {
			errors[c] = std::current_exception();
		}
	};

	if (config_.parallel) {
		std::vector<std::thread> workers;
		workers.reserve(chains);
		for (std::size_t c = 0; c < chains; ++c) {
			workers.emplace_back(runChain, c);
		}
		for (auto &worker : workers) {
			worker.join();
		}
	} else {
		for (std::size_t c = 0; c < chains; ++c) {
			runChain(c);
		}
	}

	for (const auto &error : errors) {
		if (error) {
			std::rethrow_exception(error);
		}
	}

	std::vector<ChainResult> completed;
	completed.reserve(chains);
	std::size_t failed = 0;
	for (auto &result : results) {
		if (!result->ok()) {
			++failed;
		}
		completed.push_back(std::move(*result));
	}
	if (failed > 0) {
		HYDRO_WARN("{} of {} chains aborted with numerical failures", failed, chains);
	}

	return PosteriorSamples(std::move(completed), config_.iterations, data.size(), model.activeParameters());
}

} // namespace hydrostate::inference
