#pragma once

#include "hydro-state/core/dataset.hpp"
#include "hydro-state/summary/posterior_summarizer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hydrostate::validation {

enum class Scale {
	Log,
	Natural,
	Both
};

struct MetricEntry {
	std::string name;
	std::optional<double> value;
};

/**
 * @class MetricTable
 * @brief Named scalar skill metrics, prefixed by the scale they were computed on.
 *
 * Undefined metrics (for instance R² on a single point) are stored without a
 * value rather than as a number.
 */
class MetricTable {
public:
	void add(std::string name, std::optional<double> value);

	bool contains(const std::string &name) const;

	/// @throws std::out_of_range When @p name is not in the table.
	std::optional<double> value(const std::string &name) const;

	const std::vector<MetricEntry> &entries() const {
		return entries_;
	}

	std::size_t size() const {
		return entries_.size();
	}

private:
	std::vector<MetricEntry> entries_;
};

/**
 * @class ValidationEngine
 * @brief Scores a forecast table against held-out ground truth.
 *
 * Log- and natural-scale metrics are computed independently and never mixed.
 */
class ValidationEngine {
public:
	explicit ValidationEngine(Scale scale = Scale::Both) : scale_(scale) {}

	Scale scale() const {
		return scale_;
	}

	/**
	 * @throws std::invalid_argument On empty truth, indices outside the table,
	 * or a log-scale request against a table without log-scale columns.
	 */
	MetricTable score(const summary::ForecastTable &forecast, const core::HeldOutTruth &truth) const;

	/// Metrics of one scale, each name prefixed by @p prefix and a dot.
	static void scoreSeries(MetricTable &table, const std::string &prefix, const std::vector<double> &observed,
	                        const std::vector<summary::Interval> &predicted);

private:
	Scale scale_;
};

} // namespace hydrostate::validation
