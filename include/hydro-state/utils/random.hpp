#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace hydrostate::utils {

/**
 * @class RandomStream
 * @brief Seeded random-number stream owned by a single chain.
 *
 * All draws come from one std::mt19937_64, so a stream is reproducible from
 * its seed and never shared between threads.
 */
class RandomStream {
public:
	explicit RandomStream(std::uint64_t seed) : engine_(seed), seed_(seed) {}

	std::uint64_t seed() const {
		return seed_;
	}

	double uniform();
	double standardNormal();
	double normal(double mean, double sd);

	/// Normal draw parameterized by precision (inverse variance).
	double normalPrecision(double mean, double precision);

	/// Gamma draw parameterized by shape and rate.
	double gamma(double shape, double rate);

	double exponential(double rate);

	/// Uniform index in [0, n).
	std::size_t index(std::size_t n);

	/**
	 * @brief Normal(mean, sd) restricted to [lower, upper].
	 * @throws std::runtime_error If the rejection sampler exhausts its attempt budget.
	 */
	double truncatedNormal(double mean, double sd, double lower, double upper);

private:
	double standardTruncated(double a, double b);

	std::mt19937_64 engine_;
	std::uint64_t seed_;
	std::normal_distribution<double> normal_{0.0, 1.0};
	std::uniform_real_distribution<double> uniform_{0.0, 1.0};
};

} // namespace hydrostate::utils
