#pragma once

#include "feature_standardizer.h"

#include <cstddef>
#include <vector>

namespace aera {

/// @brief Density-connectivity clustering with noise detection (DBSCAN).
///
/// @details A row is a core point when at least <c>min_samples</c> rows, itself included,
/// lie within Euclidean distance <c>eps</c>. Core points reachable from each other through
/// chains of core neighbourhoods share a cluster id; border rows join the first cluster that
/// reaches them, and rows reachable from no core point are labelled as noise.
class DensityClusterer {
  public:
    /// @brief Label assigned to noise points
    static constexpr int noise = -1;

    /// @brief Default neighbourhood radius on standardised features
    static constexpr double default_eps = 1.25;

    /// @brief Initialises a new instance of the DensityClusterer class.
    /// @param eps The neighbourhood radius
    /// @param min_samples The minimum neighbourhood size of a core point
    /// @throws std::invalid_argument for non-positive radius or neighbourhood size.
    DensityClusterer(double eps, std::size_t min_samples);

    /// @brief Creates a detector with the default radius and the neighbourhood size
    ///        derived from the population size.
    /// @param population_size The number of rows to cluster
    /// @return The density clusterer instance
    static DensityClusterer for_population(std::size_t population_size);

    /// @brief Calculates the core point neighbourhood size, <c>clamp(floor(n / 20), 3, 8)</c>
    /// @param population_size The number of rows to cluster
    /// @return The minimum neighbourhood size, in [3, 8]
    static std::size_t min_samples_for(std::size_t population_size) noexcept;

    /// @brief Assigns every row to a density cluster or to noise
    /// @param data The standardised feature matrix
    /// @return One label per row, cluster ids from zero in discovery order or -1 for noise
    std::vector<int> fit_predict(const FeatureMatrix &data) const;

    /// @brief Gets the neighbourhood radius
    /// @return The radius value
    double eps() const noexcept;

    /// @brief Gets the core point neighbourhood size
    /// @return The minimum number of samples
    std::size_t min_samples() const noexcept;

  private:
    double eps_;
    std::size_t min_samples_;

    std::vector<Eigen::Index> region_query(const FeatureMatrix &data, Eigen::Index row) const;
};

/// @brief Counts the noise labels in a density assignment
/// @param labels The density cluster labels
/// @return Number of noise points
std::size_t count_noise(const std::vector<int> &labels) noexcept;

} // namespace aera
