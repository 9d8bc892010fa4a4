#pragma once

#include "randombit_generator.h"
#include <random>

namespace aera {

/// @brief Mersenne Twister random number generator algorithm
///
/// All model fitting in a run is seeded from a fixed value, so repeated runs on the same
/// input produce the same cluster and outlier assignments.
class MTRandom32 final : public RandomBitGenerator {
  public:
    /// @brief Initialise a new instance of the MTRandom32 class with the default seed
    MTRandom32();

    /// @brief Initialise a new instance of the MTRandom32 class
    /// @param seed The value to initialise the internal state
    explicit MTRandom32(unsigned int seed);

    unsigned int operator()() override;

    void seed(unsigned int seed) override;

    double next_double() noexcept override;

    std::size_t next_index(std::size_t upper) override;

  private:
    std::mt19937 engine_;
};
} // namespace aera
