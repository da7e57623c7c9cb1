#include "hydro-state/core/dataset.hpp"
#include "hydro-state/utils/logging.hpp"

#include <algorithm>
#include <utility>

namespace hydrostate::core {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;
constexpr double kDaysPerYear = 365.0;
constexpr long long kSecondsPerDay = 86400;

long long floorDiv(long long a, long long b) {
	long long q = a / b;
	if ((a % b != 0) && ((a < 0) != (b < 0))) {
		--q;
	}
	return q;
}

// Howard Hinnant's civil calendar conversions.
long long daysFromCivil(long long y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const long long era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<long long>(doe) - 719468;
}

struct CivilDate {
	long long year;
	unsigned month;
	unsigned day;
};

CivilDate civilFromDays(long long z) {
	z += 719468;
	const long long era = (z >= 0 ? z : z - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const long long y = static_cast<long long>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return CivilDate{m <= 2 ? y + 1 : y, m, d};
}

void requireFiniteOrMissing(const std::vector<double> &values, const char *what) {
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (!std::isnan(values[i]) && !std::isfinite(values[i])) {
			throw std::invalid_argument(std::string(what) + " contains a non-finite value at index " +
			                            std::to_string(i) + ".");
		}
	}
}

double shiftDegenerate(double value, double offset) {
	return value <= 0.0 ? value + offset : value;
}

} // namespace

long long daysSinceEpoch(TimePoint tp) {
	const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	return floorDiv(seconds, kSecondsPerDay);
}

int dayOfYear(TimePoint tp) {
	const long long days = daysSinceEpoch(tp);
	const CivilDate civil = civilFromDays(days);
	return static_cast<int>(days - daysFromCivil(civil.year, 1, 1)) + 1;
}

TimePoint makeDate(int year, unsigned month, unsigned day) {
	if (month < 1 || month > 12 || day < 1 || day > 31) {
		throw std::invalid_argument("Invalid calendar date.");
	}
	const long long days = daysFromCivil(year, month, day);
	return TimePoint{} + std::chrono::seconds(days * kSecondsPerDay);
}

std::vector<double> HeldOutTruth::naturalValues() const {
	std::vector<double> natural;
	natural.reserve(log_values.size());
	for (double v : log_values) {
		natural.push_back(std::exp(v));
	}
	return natural;
}

HeldOutTruth HeldOutTruth::fromNatural(std::vector<std::size_t> indices, const std::vector<double> &natural_values) {
	if (indices.size() != natural_values.size()) {
		throw std::invalid_argument("Held-out indices and values must have the same length.");
	}
	HeldOutTruth truth;
	truth.indices = std::move(indices);
	truth.log_values.reserve(natural_values.size());
	for (double v : natural_values) {
		if (!(v > 0.0) || !std::isfinite(v)) {
			throw std::invalid_argument("Held-out natural-scale values must be positive and finite.");
		}
		truth.log_values.push_back(std::log(v));
	}
	return truth;
}

TimeSeriesDataset::TimeSeriesDataset(std::vector<double> log_response, std::vector<double> rain,
                                     std::vector<bool> held_out, std::vector<int> day_of_year,
                                     std::vector<TimePoint> dates)
    : response_(std::move(log_response)), rain_(std::move(rain)), day_of_year_(std::move(day_of_year)),
      dates_(std::move(dates)), held_out_mask_(std::move(held_out)) {
	const std::size_t n = response_.size();
	if (n == 0) {
		throw std::invalid_argument("Dataset must contain at least one time step.");
	}
	if (!rain_.empty() && rain_.size() != n) {
		throw std::invalid_argument("Rainfall series length must match the response length.");
	}
	if (held_out_mask_.empty()) {
		held_out_mask_.assign(n, false);
	} else if (held_out_mask_.size() != n) {
		throw std::invalid_argument("Held-out mask length must match the response length.");
	}
	if (day_of_year_.empty()) {
		day_of_year_.resize(n);
		for (std::size_t t = 0; t < n; ++t) {
			day_of_year_[t] = static_cast<int>(t % 365) + 1;
		}
	} else if (day_of_year_.size() != n) {
		throw std::invalid_argument("Day-of-year series length must match the response length.");
	}
	if (!dates_.empty() && dates_.size() != n) {
		throw std::invalid_argument("Date series length must match the response length.");
	}

	requireFiniteOrMissing(response_, "Response");
	requireFiniteOrMissing(rain_, "Rainfall");

	season_sin_.resize(n);
	season_cos_.resize(n);
	for (std::size_t t = 0; t < n; ++t) {
		const int doy = day_of_year_[t];
		if (doy < 1 || doy > 366) {
			throw std::invalid_argument("Day of year must lie in [1, 366].");
		}
		// Leap days run slightly past a full cycle (366 / 365).
		const double angle = kTwoPi * static_cast<double>(doy) / kDaysPerYear;
		season_sin_[t] = std::sin(angle);
		season_cos_[t] = std::cos(angle);
	}

	for (std::size_t t = 0; t < n; ++t) {
		if (!held_out_mask_[t]) {
			continue;
		}
		if (!std::isnan(response_[t])) {
			held_out_.indices.push_back(t);
			held_out_.log_values.push_back(response_[t]);
		}
		response_[t] = std::numeric_limits<double>::quiet_NaN();
	}

	for (std::size_t t = 0; t < rain_.size(); ++t) {
		if (std::isnan(rain_[t])) {
			missing_rain_.push_back(t);
		}
	}

	HYDRO_DEBUG("Dataset built: n={} observed={} held_out={} never_observed={} missing_rain={}", n,
	            observedCount(), heldOutCount(), neverObservedCount(), missing_rain_.size());
}

TimeSeriesDataset TimeSeriesDataset::fromLogSeries(std::vector<double> log_response, std::vector<double> rain,
                                                   std::vector<bool> held_out, std::vector<int> day_of_year) {
	return TimeSeriesDataset(std::move(log_response), std::move(rain), std::move(held_out), std::move(day_of_year),
	                         {});
}

std::size_t TimeSeriesDataset::observedCount() const {
	return static_cast<std::size_t>(
	    std::count_if(response_.begin(), response_.end(), [](double v) { return !std::isnan(v); }));
}

TimeSeriesDataset DatasetBuilder::build() const {
	if (records_.empty()) {
		throw std::invalid_argument("DatasetBuilder requires at least one record.");
	}
	if (!(degenerate_offset_ > 0.0) || !std::isfinite(degenerate_offset_)) {
		throw std::invalid_argument("Degenerate-value offset must be positive and finite.");
	}
	if (!held_out_mask_.empty() && held_out_mask_.size() != records_.size()) {
		throw std::invalid_argument("Held-out mask length must match the number of records.");
	}

	struct Row {
		TimePoint date;
		double flow;
		double rain;
		bool held_out;
	};

	std::vector<Row> rows;
	rows.reserve(records_.size());
	long long previous_day = 0;
	for (std::size_t i = 0; i < records_.size(); ++i) {
		const auto &record = records_[i];
		const long long day = daysSinceEpoch(record.date);
		bool held = false;
		if (!held_out_mask_.empty()) {
			held = held_out_mask_[i];
		} else if (held_out_cutoff_) {
			held = record.date > *held_out_cutoff_;
		}

		if (i > 0) {
			if (day <= previous_day) {
				throw std::invalid_argument("Record dates must be strictly ascending by day.");
			}
			if (day > previous_day + 1) {
				if (gap_policy_ == GapPolicy::Error) {
					throw std::invalid_argument("Record dates must be contiguous; gap found before record " +
					                            std::to_string(i) + ".");
				}
				for (long long missing = previous_day + 1; missing < day; ++missing) {
					const TimePoint date = TimePoint{} + std::chrono::seconds(missing * kSecondsPerDay);
					rows.push_back(Row{date, std::numeric_limits<double>::quiet_NaN(),
					                   std::numeric_limits<double>::quiet_NaN(), false});
				}
				HYDRO_DEBUG("Inserted {} missing day(s) before record {}", day - previous_day - 1, i);
			}
		}
		rows.push_back(Row{record.date, record.streamflow, record.rainfall, held});
		previous_day = day;
	}

	const std::size_t n = rows.size();
	std::vector<double> log_response(n, std::numeric_limits<double>::quiet_NaN());
	std::vector<double> rain_driver(n, std::numeric_limits<double>::quiet_NaN());
	std::vector<bool> mask(n, false);
	std::vector<int> doy(n);
	std::vector<TimePoint> dates(n);

	for (std::size_t t = 0; t < n; ++t) {
		const Row &row = rows[t];
		dates[t] = row.date;
		doy[t] = dayOfYear(row.date);
		mask[t] = row.held_out;

		if (!std::isnan(row.flow)) {
			if (!std::isfinite(row.flow)) {
				throw std::invalid_argument("Streamflow must be finite at index " + std::to_string(t) + ".");
			}
			const double shifted = shiftDegenerate(row.flow, degenerate_offset_);
			if (!(shifted > 0.0)) {
				throw std::invalid_argument("Streamflow remains non-positive after shifting at index " +
				                            std::to_string(t) + ".");
			}
			log_response[t] = std::log(shifted);
		}

		if (use_rain_ && !std::isnan(row.rain)) {
			if (!std::isfinite(row.rain)) {
				throw std::invalid_argument("Rainfall must be finite at index " + std::to_string(t) + ".");
			}
			const double shifted = shiftDegenerate(row.rain, degenerate_offset_);
			if (!(shifted > -1.0)) {
				throw std::invalid_argument("Rainfall is below the log1p domain after shifting at index " +
				                            std::to_string(t) + ".");
			}
			rain_driver[t] = std::log1p(shifted);
		}
	}

	std::vector<double> rain;
	if (use_rain_) {
		rain.assign(n, std::numeric_limits<double>::quiet_NaN());
		for (std::size_t t = rain_lag_; t < n; ++t) {
			rain[t] = rain_driver[t - rain_lag_];
		}
	}

	return TimeSeriesDataset(std::move(log_response), std::move(rain), std::move(mask), std::move(doy),
	                         std::move(dates));
}

} // namespace hydrostate::core
