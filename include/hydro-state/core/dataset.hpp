#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hydrostate::core {

using TimePoint = std::chrono::system_clock::time_point;

/// One row of the cleaned daily input table. NaN marks a missing value.
struct DailyRecord {
	TimePoint date{};
	double streamflow = std::numeric_limits<double>::quiet_NaN();
	double rainfall = std::numeric_limits<double>::quiet_NaN();
};

/// How irregular spacing between consecutive dates is handled.
enum class GapPolicy {
	Error,
	InsertMissing
};

/**
 * @brief Ground truth of the response at held-out positions.
 *
 * Never handed to the sampler; only the validation step reads it.
 */
struct HeldOutTruth {
	std::vector<std::size_t> indices;
	std::vector<double> log_values;

	std::size_t size() const {
		return indices.size();
	}

	bool empty() const {
		return indices.empty();
	}

	std::vector<double> naturalValues() const;

	/// Builds truth from natural-scale values; all values must be positive.
	static HeldOutTruth fromNatural(std::vector<std::size_t> indices, const std::vector<double> &natural_values);
};

/**
 * @class TimeSeriesDataset
 * @brief Immutable set of aligned daily series used to fit one model run.
 *
 * The response is kept on log scale. Positions that are missing in the
 * fitting view are either held out (truth stored in heldOut()) or were
 * never observed. The rainfall covariate is already log1p-transformed and
 * lagged; its missing positions are latent variables for the sampler.
 */
class TimeSeriesDataset {
public:
	/**
	 * @brief Builds a dataset from already log-transformed series.
	 * @param log_response Log-scale response, NaN where missing.
	 * @param rain Transformed rainfall covariate, NaN where missing. Empty means no rainfall column.
	 * @param held_out Mask of positions to withhold from fitting. Empty means none.
	 * @param day_of_year 1-based day of year per position. Empty means 1, 2, ... wrapping after 365.
	 * @throws std::invalid_argument On empty input, length mismatch or non-finite non-NaN values.
	 */
	static TimeSeriesDataset fromLogSeries(std::vector<double> log_response, std::vector<double> rain = {},
	                                       std::vector<bool> held_out = {}, std::vector<int> day_of_year = {});

	std::size_t size() const {
		return response_.size();
	}

	/// Fitting view of the log response; NaN at held-out and never-observed positions.
	const std::vector<double> &response() const {
		return response_;
	}

	bool isObserved(std::size_t t) const {
		return !std::isnan(response_.at(t));
	}

	bool hasRain() const {
		return !rain_.empty();
	}

	const std::vector<double> &rain() const {
		return rain_;
	}

	bool isRainMissing(std::size_t t) const {
		return hasRain() && std::isnan(rain_.at(t));
	}

	const std::vector<std::size_t> &missingRainIndices() const {
		return missing_rain_;
	}

	const std::vector<double> &seasonSin() const {
		return season_sin_;
	}

	const std::vector<double> &seasonCos() const {
		return season_cos_;
	}

	const std::vector<int> &dayOfYear() const {
		return day_of_year_;
	}

	/// Dates of each position; empty when the dataset was built from bare series.
	const std::vector<TimePoint> &dates() const {
		return dates_;
	}

	const std::vector<bool> &heldOutMask() const {
		return held_out_mask_;
	}

	const HeldOutTruth &heldOut() const {
		return held_out_;
	}

	std::size_t observedCount() const;
	std::size_t heldOutCount() const {
		return held_out_.size();
	}
	std::size_t neverObservedCount() const {
		return size() - observedCount() - heldOutCount();
	}

private:
	friend class DatasetBuilder;

	TimeSeriesDataset(std::vector<double> log_response, std::vector<double> rain, std::vector<bool> held_out,
	                  std::vector<int> day_of_year, std::vector<TimePoint> dates);

	std::vector<double> response_;
	std::vector<double> rain_;
	std::vector<std::size_t> missing_rain_;
	std::vector<double> season_sin_;
	std::vector<double> season_cos_;
	std::vector<int> day_of_year_;
	std::vector<TimePoint> dates_;
	std::vector<bool> held_out_mask_;
	HeldOutTruth held_out_;
};

/**
 * @class DatasetBuilder
 * @brief Turns cleaned daily records into a TimeSeriesDataset.
 *
 * Applies the log transform to streamflow, the lagged log1p transform to
 * rainfall, derives the calendar covariates and splits off held-out truth.
 */
class DatasetBuilder {
public:
	DatasetBuilder &records(std::vector<DailyRecord> rows) {
		records_ = std::move(rows);
		return *this;
	}

	DatasetBuilder &addRecord(TimePoint date, double streamflow, double rainfall) {
		records_.push_back(DailyRecord{date, streamflow, rainfall});
		return *this;
	}

	DatasetBuilder &gapPolicy(GapPolicy policy) {
		gap_policy_ = policy;
		return *this;
	}

	/// Additive shift applied to non-positive values before the log transforms.
	DatasetBuilder &degenerateOffset(double value) {
		degenerate_offset_ = value;
		return *this;
	}

	DatasetBuilder &rainLag(std::size_t days) {
		rain_lag_ = days;
		return *this;
	}

	/// Rainfall column is ignored entirely.
	DatasetBuilder &withoutRain() {
		use_rain_ = false;
		return *this;
	}

	/// Mask aligned with the supplied records; inserted gap rows are never held out.
	DatasetBuilder &heldOutMask(std::vector<bool> mask) {
		held_out_mask_ = std::move(mask);
		held_out_cutoff_.reset();
		return *this;
	}

	/// Every record dated strictly after @p cutoff is held out.
	DatasetBuilder &heldOutAfter(TimePoint cutoff) {
		held_out_cutoff_ = cutoff;
		held_out_mask_.clear();
		return *this;
	}

	TimeSeriesDataset build() const;

private:
	std::vector<DailyRecord> records_;
	GapPolicy gap_policy_ = GapPolicy::Error;
	double degenerate_offset_ = 0.001;
	std::size_t rain_lag_ = 1;
	bool use_rain_ = true;
	std::vector<bool> held_out_mask_;
	std::optional<TimePoint> held_out_cutoff_;
};

/// Days since 1970-01-01 (UTC) of the day containing @p tp.
long long daysSinceEpoch(TimePoint tp);

/// 1-based day of year of the UTC day containing @p tp.
int dayOfYear(TimePoint tp);

/// Midnight UTC of the given civil date.
TimePoint makeDate(int year, unsigned month, unsigned day);

} // namespace hydrostate::core
