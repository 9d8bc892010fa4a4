#pragma once

#include <cstddef>
#include <limits>

namespace aera {

/// @brief Random number generator algorithms interface
///
/// Satisfies the UniformRandomBitGenerator requirements, so instances can be passed to the
/// standard distributions and shuffle algorithms.
class RandomBitGenerator {
  public:
    using result_type = unsigned int;

    /// @brief Destroys a RandomBitGenerator instance
    virtual ~RandomBitGenerator() = default;

    /// @brief Generates the next random number
    /// @return A pseudo-random number value in [\c min(), \c max()]
    virtual unsigned int operator()() = 0;

    /// @brief Sets the current state of the generator engine
    /// @param seed The value to initialise the internal state
    virtual void seed(unsigned int seed) = 0;

    /// @brief Generates a random floating point number in range [0,1)
    /// @return A floating point value in range [0,1).
    virtual double next_double() noexcept = 0;

    /// @brief Generates a random integer in the closed range [0, upper]
    /// @param upper The inclusive upper bound
    /// @return A uniformly distributed integer value
    virtual std::size_t next_index(std::size_t upper) = 0;

    /// @brief Gets the smallest possible value in the output range
    /// @return The minimum potentially generated value.
    static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }

    /// @brief Gets the largest possible value in the output range
    /// @return The maximum potentially generated value.
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }
};
} // namespace aera
