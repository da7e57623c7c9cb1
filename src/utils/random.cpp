#include "hydro-state/utils/random.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hydrostate::utils {

namespace {
constexpr int kMaxRejectionAttempts = 100000;
}

double RandomStream::uniform() {
	return uniform_(engine_);
}

double RandomStream::standardNormal() {
	return normal_(engine_);
}

double RandomStream::normal(double mean, double sd) {
	return mean + sd * normal_(engine_);
}

double RandomStream::normalPrecision(double mean, double precision) {
	if (!(precision > 0.0)) {
		throw std::invalid_argument("Normal precision must be positive.");
	}
	return mean + normal_(engine_) / std::sqrt(precision);
}

double RandomStream::gamma(double shape, double rate) {
	if (!(shape > 0.0) || !(rate > 0.0)) {
		throw std::invalid_argument("Gamma shape and rate must be positive.");
	}
	std::gamma_distribution<double> dist(shape, 1.0 / rate);
	return dist(engine_);
}

double RandomStream::exponential(double rate) {
	std::exponential_distribution<double> dist(rate);
	return dist(engine_);
}

std::size_t RandomStream::index(std::size_t n) {
	if (n == 0) {
		throw std::invalid_argument("Cannot draw an index from an empty range.");
	}
	std::uniform_int_distribution<std::size_t> dist(0, n - 1);
	return dist(engine_);
}

double RandomStream::truncatedNormal(double mean, double sd, double lower, double upper) {
	if (!(sd > 0.0) || !(lower < upper)) {
		throw std::invalid_argument("Truncated normal requires sd > 0 and lower < upper.");
	}
	const double a = (lower - mean) / sd;
	const double b = (upper - mean) / sd;
	const double value = mean + sd * standardTruncated(a, b);
	// Guards against rounding at the bounds.
	return std::min(std::max(value, lower), upper);
}

// Robert (1995): normal, uniform or translated-exponential proposals
// depending on where [a, b] sits relative to the mode.
double RandomStream::standardTruncated(double a, double b) {
	if (b <= 0.0) {
		return -standardTruncated(-b, -a);
	}

	if (a <= 0.0) {
		if (b - a >= 2.0) {
			for (int attempt = 0; attempt < kMaxRejectionAttempts; ++attempt) {
				const double z = normal_(engine_);
				if (z >= a && z <= b) {
					return z;
				}
			}
		} else {
			for (int attempt = 0; attempt < kMaxRejectionAttempts; ++attempt) {
				const double z = a + (b - a) * uniform_(engine_);
				if (uniform_(engine_) <= std::exp(-0.5 * z * z)) {
					return z;
				}
			}
		}
		throw std::runtime_error("Truncated normal sampler exceeded its attempt budget.");
	}

	// a > 0: the whole interval lies in the right tail.
	const double width_limit = std::min(1.0, 1.0 / a);
	if (b - a <= width_limit) {
		for (int attempt = 0; attempt < kMaxRejectionAttempts; ++attempt) {
			const double z = a + (b - a) * uniform_(engine_);
			if (uniform_(engine_) <= std::exp(0.5 * (a * a - z * z))) {
				return z;
			}
		}
	} else {
		const double alpha = 0.5 * (a + std::sqrt(a * a + 4.0));
		for (int attempt = 0; attempt < kMaxRejectionAttempts; ++attempt) {
			const double z = a + exponential(alpha);
			if (z > b) {
				continue;
			}
			if (uniform_(engine_) <= std::exp(-0.5 * (z - alpha) * (z - alpha))) {
				return z;
			}
		}
	}
	throw std::runtime_error("Truncated normal sampler exceeded its attempt budget.");
}

} // namespace hydrostate::utils
