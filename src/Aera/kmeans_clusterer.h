#pragma once

#include "feature_standardizer.h"

#include <cstddef>
#include <vector>

namespace aera {

/// @brief Centroid-based clustering parameters
struct KMeansParameters {
    /// @brief Seed of the centroid initialisation generator
    unsigned int seed{42};

    /// @brief Maximum number of Lloyd iterations
    int max_iterations{300};

    /// @brief Convergence tolerance, relative to the average feature variance
    double tolerance{1e-4};
};

/// @brief Partitions standardised rows with Lloyd's algorithm and k-means++ seeding.
///
/// @details The number of clusters derives from the population size as
/// <c>clamp(round(sqrt(n)), 2, 6)</c>. Ties between equidistant centroids resolve to the
/// lowest cluster id, and a cluster left empty by an iteration is re-seeded at the row
/// farthest from its current centroid.
class KMeansClusterer {
  public:
    /// @brief Smallest number of clusters
    static constexpr int min_clusters = 2;

    /// @brief Largest number of clusters
    static constexpr int max_clusters = 6;

    /// @brief Initialises a new instance of the KMeansClusterer class.
    /// @param parameters The clustering parameters
    explicit KMeansClusterer(KMeansParameters parameters = {});

    /// @brief Calculates the number of clusters for a population size
    /// @param population_size The number of rows to cluster
    /// @return The number of clusters, in [2, 6]
    static int cluster_count(std::size_t population_size) noexcept;

    /// @brief Fits the centroids and assigns every row to its nearest centroid
    /// @param data The standardised feature matrix, at least one row
    /// @return One cluster id per row, in [0, cluster_count(rows))
    /// @throws std::invalid_argument for an empty matrix.
    std::vector<int> fit_predict(const FeatureMatrix &data);

    /// @brief Fits a given number of centroids and assigns every row to its nearest centroid
    /// @param data The standardised feature matrix, at least one row
    /// @param clusters The number of clusters, positive
    /// @return One cluster id per row, in [0, clusters)
    /// @throws std::invalid_argument for an empty matrix or non-positive number of clusters.
    std::vector<int> fit_predict(const FeatureMatrix &data, int clusters);

    /// @brief Gets the fitted centroids, one row per cluster
    /// @return The centroids matrix
    const FeatureMatrix &centroids() const noexcept;

    /// @brief Gets the sum of squared distances of rows to their centroid
    /// @return The within-cluster sum of squares
    double inertia() const noexcept;

    /// @brief Gets the number of Lloyd iterations of the last fit
    /// @return Number of iterations
    int iterations() const noexcept;

  private:
    KMeansParameters parameters_;
    FeatureMatrix centroids_;
    double inertia_{};
    int iterations_{};

    void initialise_centroids(const FeatureMatrix &data, int clusters);
    double assign(const FeatureMatrix &data, std::vector<int> &labels) const;
};

} // namespace aera
