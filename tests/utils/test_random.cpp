#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "hydro-state/utils/random.hpp"

#include <stdexcept>

using hydrostate::utils::RandomStream;

namespace {

template <typename Draw>
double sampleMean(Draw draw, int count) {
	double total = 0.0;
	for (int i = 0; i < count; ++i) {
		total += draw();
	}
	return total / count;
}

} // namespace

TEST_CASE("Random streams are reproducible from their seed", "[utils][random]") {
	RandomStream a(99);
	RandomStream b(99);
	RandomStream c(100);

	bool differs = false;
	for (int i = 0; i < 20; ++i) {
		const double x = a.normal(0.0, 1.0);
		REQUIRE(x == b.normal(0.0, 1.0));
		differs = differs || x != c.normal(0.0, 1.0);
	}
	REQUIRE(differs);
	REQUIRE(a.seed() == 99);
}

TEST_CASE("Gamma draws use the shape-rate parameterization", "[utils][random]") {
	RandomStream rng(5);
	const double mean = sampleMean([&] { return rng.gamma(3.0, 2.0); }, 40000);
	REQUIRE(mean == Catch::Approx(1.5).margin(0.03));

	REQUIRE_THROWS_AS(rng.gamma(0.0, 1.0), std::invalid_argument);
	REQUIRE_THROWS_AS(rng.normalPrecision(0.0, 0.0), std::invalid_argument);
}

TEST_CASE("Truncated normal stays within bounds in every regime", "[utils][random][truncated]") {
	RandomStream rng(17);

	SECTION("Interval around the mode") {
		for (int i = 0; i < 2000; ++i) {
			const double z = rng.truncatedNormal(0.0, 1.0, -0.3, 0.4);
			REQUIRE(z >= -0.3);
			REQUIRE(z <= 0.4);
		}
	}

	SECTION("Far right tail") {
		double total = 0.0;
		for (int i = 0; i < 4000; ++i) {
			const double z = rng.truncatedNormal(0.0, 1.0, 6.0, 1e6);
			REQUIRE(z >= 6.0);
			total += z;
		}
		// E[Z | Z > 6] is about 6.158.
		REQUIRE(total / 4000.0 == Catch::Approx(6.158).margin(0.03));
	}

	SECTION("Far left tail on a narrow interval") {
		for (int i = 0; i < 2000; ++i) {
			const double z = rng.truncatedNormal(5.0, 0.5, 0.0, 0.2);
			REQUIRE(z >= 0.0);
			REQUIRE(z <= 0.2);
		}
	}

	SECTION("Wide interval keeps the untruncated mean") {
		const double mean = sampleMean([&] { return rng.truncatedNormal(0.5, 0.1, 0.0, 1.0); }, 20000);
		REQUIRE(mean == Catch::Approx(0.5).margin(0.005));
	}

	REQUIRE_THROWS_AS(rng.truncatedNormal(0.0, 1.0, 1.0, 0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(rng.truncatedNormal(0.0, 0.0, 0.0, 1.0), std::invalid_argument);
}

TEST_CASE("Index draws cover the range", "[utils][random]") {
	RandomStream rng(3);
	bool seen[4] = {false, false, false, false};
	for (int i = 0; i < 200; ++i) {
		const auto k = rng.index(4);
		REQUIRE(k < 4);
		seen[k] = true;
	}
	REQUIRE((seen[0] && seen[1] && seen[2] && seen[3]));
	REQUIRE_THROWS_AS(rng.index(0), std::invalid_argument);
}
