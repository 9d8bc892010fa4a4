#include "mtrandom.h"

#include <cmath>
#include <limits>

namespace aera {

// -----------------------------------------------------------------------
// Implement Mersenne Twister 19937 (32 bit) random bit generator

MTRandom32::MTRandom32() : engine_{std::mt19937::default_seed} {}

MTRandom32::MTRandom32(unsigned int seed) : engine_{seed} {}

void MTRandom32::seed(unsigned int seed) { engine_.seed(seed); }

unsigned int MTRandom32::operator()() { return engine_(); }

double MTRandom32::next_double() noexcept {
    // generate_canonical may round up to 1.0, keep the result in [0,1)
    auto value = std::generate_canonical<double, std::numeric_limits<double>::digits>(engine_);
    return value < 1.0 ? value : std::nextafter(1.0, 0.0);
}

std::size_t MTRandom32::next_index(std::size_t upper) {
    return std::uniform_int_distribution<std::size_t>(0, upper)(engine_);
}
} // namespace aera
