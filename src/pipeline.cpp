#include "hydro-state/pipeline.hpp"
#include "hydro-state/utils/logging.hpp"

#include <stdexcept>
#include <string>

namespace hydrostate::pipeline {

ForecastReport runForecast(const core::TimeSeriesDataset &dataset, const model::ModelSpecification &model,
                           const inference::EngineConfig &engine, const diagnostics::ConvergenceConfig &convergence,
                           const summary::SummaryConfig &summary, validation::Scale scale) {
	engine.validate();
	convergence.validate();
	summary.validate();
	if (convergence.policy == diagnostics::BurnInPolicy::Fixed && convergence.burn_in >= engine.iterations) {
		throw std::invalid_argument("Burn-in of " + std::to_string(convergence.burn_in) +
		                            " must be smaller than the iteration count " + std::to_string(engine.iterations) +
		                            ".");
	}
	if (scale != validation::Scale::Natural && !summary.include_log_scale && dataset.heldOutCount() > 0) {
		throw std::invalid_argument("Log-scale scoring needs log-scale summary columns.");
	}

	HYDRO_INFO("Forecast run: model={} n={} observed={} held_out={} missing_rain={}", model.name(), dataset.size(),
	           dataset.observedCount(), dataset.heldOutCount(), dataset.missingRainIndices().size());

	const inference::InferenceEngine sampler(engine);
	const auto samples = sampler.run(model, dataset);

	ForecastReport report;
	for (const auto &chain : samples.chains()) {
		if (chain.failure) {
			report.failed_chains.push_back(*chain.failure);
		}
	}
	if (samples.survivingCount() == 0) {
		throw std::runtime_error("All " + std::to_string(samples.chains().size()) +
		                         " chains failed; no posterior to summarize.");
	}

	report.convergence = diagnostics::ConvergenceDiagnostics(convergence).assess(samples);
	if (!report.convergence.converged) {
		HYDRO_WARN("Summaries computed from non-converged chains: {}", report.convergence.reason);
	}

	report.summary = summary::PosteriorSummarizer(summary).summarize(samples, report.convergence.burn_in);

	if (!dataset.heldOut().empty()) {
		report.metrics = validation::ValidationEngine(scale).score(report.summary.forecast, dataset.heldOut());
	}
	return report;
}

} // namespace hydrostate::pipeline
