#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "hydro-state/core/dataset.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace hydrostate::core;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

TimePoint day(int offset) {
	return makeDate(2023, 1, 1) + std::chrono::hours(24 * offset);
}

} // namespace

TEST_CASE("Calendar helpers resolve day of year", "[core][dataset][calendar]") {
	REQUIRE(dayOfYear(makeDate(2023, 1, 1)) == 1);
	REQUIRE(dayOfYear(makeDate(2023, 3, 1)) == 60);
	REQUIRE(dayOfYear(makeDate(2024, 3, 1)) == 61);
	REQUIRE(dayOfYear(makeDate(2024, 12, 31)) == 366);
	REQUIRE(daysSinceEpoch(makeDate(1970, 1, 2)) == 1);
	REQUIRE(daysSinceEpoch(makeDate(1969, 12, 31)) == -1);
	REQUIRE_THROWS_AS(makeDate(2023, 13, 1), std::invalid_argument);
}

TEST_CASE("Dataset from log series derives seasonal covariates", "[core][dataset]") {
	const std::vector<double> y{0.1, kNaN, 0.3, 0.4};
	const auto data = TimeSeriesDataset::fromLogSeries(y, {}, {}, {1, 92, 183, 365});

	REQUIRE(data.size() == 4);
	REQUIRE_FALSE(data.hasRain());
	REQUIRE(data.observedCount() == 3);
	REQUIRE(data.neverObservedCount() == 1);
	REQUIRE_FALSE(data.isObserved(1));

	const double two_pi = 2.0 * std::acos(-1.0);
	REQUIRE(data.seasonSin()[0] == Catch::Approx(std::sin(two_pi / 365.0)));
	REQUIRE(data.seasonCos()[0] == Catch::Approx(std::cos(two_pi / 365.0)));
	REQUIRE(data.seasonSin()[3] == Catch::Approx(0.0).margin(1e-12));
	REQUIRE(data.seasonCos()[3] == Catch::Approx(1.0));
}

TEST_CASE("Held-out positions are removed from the fitting view", "[core][dataset][holdout]") {
	const std::vector<double> y{0.5, 0.6, 0.7, kNaN, 0.9};
	const std::vector<bool> mask{false, false, true, true, true};
	const auto data = TimeSeriesDataset::fromLogSeries(y, {}, mask);

	REQUIRE(data.observedCount() == 2);
	REQUIRE(std::isnan(data.response()[2]));
	REQUIRE(std::isnan(data.response()[4]));

	// Position 3 was never observed, so there is no truth to keep for it.
	const auto &truth = data.heldOut();
	REQUIRE(truth.indices == std::vector<std::size_t>{2, 4});
	REQUIRE(truth.log_values[0] == Catch::Approx(0.7));
	REQUIRE(truth.log_values[1] == Catch::Approx(0.9));
	REQUIRE(data.neverObservedCount() == 1);
}

TEST_CASE("Dataset rejects malformed series", "[core][dataset][error]") {
	REQUIRE_THROWS_AS(TimeSeriesDataset::fromLogSeries({}), std::invalid_argument);
	REQUIRE_THROWS_AS(TimeSeriesDataset::fromLogSeries({0.1, 0.2}, {0.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(TimeSeriesDataset::fromLogSeries({0.1, std::numeric_limits<double>::infinity()}),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(TimeSeriesDataset::fromLogSeries({0.1, 0.2}, {}, {true}), std::invalid_argument);
	REQUIRE_THROWS_AS(TimeSeriesDataset::fromLogSeries({0.1}, {}, {}, {0}), std::invalid_argument);
}

TEST_CASE("Builder transforms and lags raw records", "[core][dataset][builder]") {
	const auto data = DatasetBuilder()
	                      .addRecord(day(0), 2.0, 3.0)
	                      .addRecord(day(1), 0.0, 0.0)
	                      .addRecord(day(2), 5.0, kNaN)
	                      .addRecord(day(3), 4.0, 1.0)
	                      .build();

	REQUIRE(data.size() == 4);
	REQUIRE(data.response()[0] == Catch::Approx(std::log(2.0)));
	REQUIRE(data.response()[1] == Catch::Approx(std::log(0.001)));
	REQUIRE(std::isfinite(data.response()[1]));

	// rain[t] is the transformed rainfall of day t - 1.
	REQUIRE(std::isnan(data.rain()[0]));
	REQUIRE(data.rain()[1] == Catch::Approx(std::log1p(3.0)));
	REQUIRE(data.rain()[2] == Catch::Approx(std::log1p(0.001)));
	REQUIRE(std::isnan(data.rain()[3]));
	REQUIRE(data.missingRainIndices() == std::vector<std::size_t>{0, 3});

	REQUIRE(data.dayOfYear() == std::vector<int>{1, 2, 3, 4});
	REQUIRE(data.dates().size() == 4);
}

TEST_CASE("Builder handles calendar gaps by policy", "[core][dataset][builder]") {
	DatasetBuilder builder;
	builder.addRecord(day(0), 1.0, 0.5).addRecord(day(1), 1.1, 0.5).addRecord(day(4), 1.2, 0.5);

	REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);

	const auto data = builder.gapPolicy(GapPolicy::InsertMissing).build();
	REQUIRE(data.size() == 5);
	REQUIRE(std::isnan(data.response()[2]));
	REQUIRE(std::isnan(data.response()[3]));
	REQUIRE(data.observedCount() == 3);
	REQUIRE(data.dayOfYear()[4] == 5);
}

TEST_CASE("Builder rejects unordered and degenerate input", "[core][dataset][builder][error]") {
	REQUIRE_THROWS_AS(DatasetBuilder().build(), std::invalid_argument);
	REQUIRE_THROWS_AS(DatasetBuilder().addRecord(day(1), 1.0, 0.0).addRecord(day(0), 1.0, 0.0).build(),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(DatasetBuilder().addRecord(day(0), -1.0, 0.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(DatasetBuilder().addRecord(day(0), 1.0, -2.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(DatasetBuilder().addRecord(day(0), 1.0, 0.0).degenerateOffset(0.0).build(),
	                  std::invalid_argument);
}

TEST_CASE("Builder holds out records after a cutoff", "[core][dataset][holdout]") {
	DatasetBuilder builder;
	for (int i = 0; i < 10; ++i) {
		builder.addRecord(day(i), std::exp(0.1 * i), 1.0);
	}
	const auto data = builder.heldOutAfter(day(6)).build();

	REQUIRE(data.heldOutCount() == 3);
	REQUIRE(data.heldOut().indices == std::vector<std::size_t>{7, 8, 9});
	REQUIRE(data.heldOut().naturalValues()[0] == Catch::Approx(std::exp(0.7)));
	REQUIRE(data.observedCount() == 7);
}

TEST_CASE("Builder can drop the rainfall column", "[core][dataset][builder]") {
	const auto data = DatasetBuilder().addRecord(day(0), 1.0, 2.0).addRecord(day(1), 1.5, 2.0).withoutRain().build();
	REQUIRE_FALSE(data.hasRain());
	REQUIRE(data.missingRainIndices().empty());
}

TEST_CASE("Held-out truth from natural values", "[core][dataset][holdout]") {
	const auto truth = HeldOutTruth::fromNatural({3, 4}, {1.0, std::exp(2.0)});
	REQUIRE(truth.log_values[0] == Catch::Approx(0.0).margin(1e-12));
	REQUIRE(truth.log_values[1] == Catch::Approx(2.0));
	REQUIRE_THROWS_AS(HeldOutTruth::fromNatural({0}, {0.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(HeldOutTruth::fromNatural({0, 1}, {1.0}), std::invalid_argument);
}
