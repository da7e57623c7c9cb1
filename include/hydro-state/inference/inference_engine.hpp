#pragma once

#include "hydro-state/core/dataset.hpp"
#include "hydro-state/inference/chain_sampler.hpp"
#include "hydro-state/inference/posterior_samples.hpp"
#include "hydro-state/model/model_specification.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace hydrostate::inference {

struct EngineConfig {
	std::size_t chains = 3;
	std::size_t iterations = 5000;

	/// One seed per chain. When empty, chain c uses base_seed + c.
	std::vector<std::uint64_t> seeds;
	std::uint64_t base_seed = 20240601;

	LatentUpdate latent_update = LatentUpdate::BlockFfbs;

	/// Run chains on separate threads.
	bool parallel = true;

	/// Optional starting points, one per chain when given.
	std::vector<ChainInit> initial_values;

	/// @throws std::invalid_argument
	void validate() const;

	std::vector<std::uint64_t> chainSeeds() const;
};

/**
 * @class InferenceEngine
 * @brief Runs independent Gibbs chains over the joint posterior.
 *
 * Chains share only read-only inputs. Each owns its random stream and its
 * state; the engine waits for every chain before returning. A chain that
 * hits a numerical failure is reported in the result and does not affect
 * the others.
 */
class InferenceEngine {
public:
	class Builder {
	public:
		Builder &chains(std::size_t value) {
			config_.chains = value;
			return *this;
		}

		Builder &iterations(std::size_t value) {
			config_.iterations = value;
			return *this;
		}

		Builder &seeds(std::vector<std::uint64_t> values) {
			config_.seeds = std::move(values);
			return *this;
		}

		Builder &baseSeed(std::uint64_t value) {
			config_.base_seed = value;
			return *this;
		}

		Builder &latentUpdate(LatentUpdate value) {
			config_.latent_update = value;
			return *this;
		}

		Builder &parallel(bool value) {
			config_.parallel = value;
			return *this;
		}

		Builder &initialValues(std::vector<ChainInit> values) {
			config_.initial_values = std::move(values);
			return *this;
		}

		InferenceEngine build() const;

	private:
		EngineConfig config_{};
	};

	static Builder builder();

	explicit InferenceEngine(EngineConfig config);

	const EngineConfig &config() const {
		return config_;
	}

	/**
	 * @brief Samples the joint posterior of @p model given @p data.
	 * @throws std::invalid_argument If the inputs violate the model's data requirements.
	 */
	PosteriorSamples run(const model::ModelSpecification &model, const core::TimeSeriesDataset &data) const;

	/// Input checks performed by run() before any sampling.
	static void validateInputs(const model::ModelSpecification &model, const core::TimeSeriesDataset &data);

private:
	EngineConfig config_;
};

} // namespace hydrostate::inference
