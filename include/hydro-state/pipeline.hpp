#pragma once

#include "hydro-state/core/dataset.hpp"
#include "hydro-state/diagnostics/convergence.hpp"
#include "hydro-state/inference/inference_engine.hpp"
#include "hydro-state/inference/posterior_samples.hpp"
#include "hydro-state/model/model_specification.hpp"
#include "hydro-state/summary/posterior_summarizer.hpp"
#include "hydro-state/validation/forecast_validation.hpp"

#include <optional>
#include <vector>

namespace hydrostate::pipeline {

struct ForecastReport {
	summary::PosteriorSummary summary;
	diagnostics::ConvergenceReport convergence;
	/// Empty when the dataset holds nothing out.
	std::optional<validation::MetricTable> metrics;
	std::vector<inference::ChainFailure> failed_chains;

	bool converged() const {
		return convergence.converged;
	}
};

/**
 * @brief Fits @p model to @p dataset and reduces the posterior to decision-ready output.
 *
 * Samples, assesses convergence, summarizes after the chosen burn-in and,
 * when the dataset carries held-out truth, scores the forecast. A
 * non-converged run still returns its summaries with the verdict attached.
 *
 * @throws std::invalid_argument On invalid configuration or inputs.
 * @throws std::runtime_error When every chain fails numerically.
 */
ForecastReport runForecast(const core::TimeSeriesDataset &dataset, const model::ModelSpecification &model,
                           const inference::EngineConfig &engine,
                           const diagnostics::ConvergenceConfig &convergence = {},
                           const summary::SummaryConfig &summary = {},
                           validation::Scale scale = validation::Scale::Both);

} // namespace hydrostate::pipeline
