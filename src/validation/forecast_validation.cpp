#include "hydro-state/validation/forecast_validation.hpp"
#include "hydro-state/utils/logging.hpp"
#include "hydro-state/utils/metrics.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace hydrostate::validation {

void MetricTable::add(std::string name, std::optional<double> value) {
	entries_.push_back(MetricEntry{std::move(name), value});
}

bool MetricTable::contains(const std::string &name) const {
	return std::any_of(entries_.begin(), entries_.end(), [&](const MetricEntry &e) { return e.name == name; });
}

std::optional<double> MetricTable::value(const std::string &name) const {
	for (const auto &entry : entries_) {
		if (entry.name == name) {
			return entry.value;
		}
	}
	throw std::out_of_range("Metric '" + name + "' not in table.");
}

void ValidationEngine::scoreSeries(MetricTable &table, const std::string &prefix,
                                   const std::vector<double> &observed,
                                   const std::vector<summary::Interval> &predicted) {
	std::vector<double> medians;
	std::vector<double> lower;
	std::vector<double> upper;
	medians.reserve(predicted.size());
	lower.reserve(predicted.size());
	upper.reserve(predicted.size());
	for (const auto &row : predicted) {
		medians.push_back(row.median);
		lower.push_back(row.lower);
		upper.push_back(row.upper);
	}

	const auto taylor = utils::Metrics::taylor(observed, medians);
	table.add(prefix + ".n", static_cast<double>(observed.size()));
	table.add(prefix + ".rmse", utils::Metrics::rmse(observed, medians));
	table.add(prefix + ".r2", utils::Metrics::r2(observed, medians));
	table.add(prefix + ".bias", utils::Metrics::bias(observed, medians));
	table.add(prefix + ".mae", utils::Metrics::mae(observed, medians));
	table.add(prefix + ".coverage", utils::Metrics::coverage(observed, lower, upper));
	table.add(prefix + ".taylor_correlation", taylor.correlation);
	table.add(prefix + ".taylor_sd_ratio", taylor.sd_ratio);
	table.add(prefix + ".taylor_crmsd", taylor.centered_rmsd);
}

MetricTable ValidationEngine::score(const summary::ForecastTable &forecast, const core::HeldOutTruth &truth) const {
	if (truth.empty()) {
		throw std::invalid_argument("No held-out values to score against.");
	}
	if (truth.indices.size() != truth.log_values.size()) {
		throw std::invalid_argument("Held-out indices and values differ in length.");
	}
	for (auto index : truth.indices) {
		if (index >= forecast.size()) {
			throw std::invalid_argument("Held-out index " + std::to_string(index) + " is outside the forecast table.");
		}
	}

	const bool want_log = scale_ != Scale::Natural;
	const bool want_natural = scale_ != Scale::Log;
	if (want_log && !forecast.hasLogScale()) {
		throw std::invalid_argument("Log-scale scoring requested but the forecast table has no log-scale columns.");
	}

	MetricTable table;
	if (want_log) {
		std::vector<summary::Interval> rows;
		rows.reserve(truth.size());
		for (auto index : truth.indices) {
			rows.push_back((*forecast.log)[index]);
		}
		scoreSeries(table, "log", truth.log_values, rows);
	}
	if (want_natural) {
		std::vector<summary::Interval> rows;
		rows.reserve(truth.size());
		for (auto index : truth.indices) {
			rows.push_back(forecast.natural[index]);
		}
		scoreSeries(table, "natural", truth.naturalValues(), rows);
	}

	if (!table.value(want_log ? "log.r2" : "natural.r2")) {
		HYDRO_WARN("R-squared undefined for {} held-out point(s)", truth.size());
	}
	return table;
}

} // namespace hydrostate::validation
