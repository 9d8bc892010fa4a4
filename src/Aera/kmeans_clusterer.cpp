#include "kmeans_clusterer.h"
#include "mtrandom.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace aera {

KMeansClusterer::KMeansClusterer(KMeansParameters parameters) : parameters_{parameters} {}

int KMeansClusterer::cluster_count(std::size_t population_size) noexcept {
    auto root = std::lround(std::sqrt(static_cast<double>(population_size)));
    return static_cast<int>(std::clamp<long>(root, min_clusters, max_clusters));
}

std::vector<int> KMeansClusterer::fit_predict(const FeatureMatrix &data) {
    return fit_predict(data, cluster_count(static_cast<std::size_t>(data.rows())));
}

std::vector<int> KMeansClusterer::fit_predict(const FeatureMatrix &data, int clusters) {
    if (data.rows() < 1) {
        throw std::invalid_argument("Centroid clustering requires at least one row.");
    }
    if (clusters < 1) {
        throw std::invalid_argument("The number of clusters must be positive.");
    }

    initialise_centroids(data, clusters);

    // Convergence threshold scaled by the data spread, zero for constant data
    auto average_variance = (data.rowwise() - data.colwise().mean()).array().square().mean();
    auto threshold = parameters_.tolerance * average_variance;

    auto labels = std::vector<int>(static_cast<std::size_t>(data.rows()), 0);
    iterations_ = 0;
    while (iterations_ < parameters_.max_iterations) {
        iterations_++;
        assign(data, labels);

        auto updated = FeatureMatrix::Zero(clusters, data.cols()).eval();
        auto sizes = std::vector<Eigen::Index>(static_cast<std::size_t>(clusters), 0);
        for (auto row = Eigen::Index{0}; row < data.rows(); row++) {
            auto label = labels[static_cast<std::size_t>(row)];
            updated.row(label) += data.row(row);
            sizes[static_cast<std::size_t>(label)]++;
        }

        // Distance of every row to its own centroid, consumed when re-seeding empty clusters
        auto distances = std::vector<double>(static_cast<std::size_t>(data.rows()));
        for (auto row = Eigen::Index{0}; row < data.rows(); row++) {
            auto label = labels[static_cast<std::size_t>(row)];
            distances[static_cast<std::size_t>(row)] =
                (data.row(row) - centroids_.row(label)).squaredNorm();
        }

        for (auto c = 0; c < clusters; c++) {
            auto size = sizes[static_cast<std::size_t>(c)];
            if (size > 0) {
                updated.row(c) /= static_cast<double>(size);
                continue;
            }

            auto farthest = std::max_element(distances.begin(), distances.end());
            if (*farthest > 0.0) {
                auto row = std::distance(distances.begin(), farthest);
                updated.row(c) = data.row(row);
                *farthest = 0.0;
            } else {
                updated.row(c) = centroids_.row(c);
            }
        }

        auto shift = (updated - centroids_).squaredNorm();
        centroids_ = std::move(updated);
        if (shift <= threshold) {
            break;
        }
    }

    inertia_ = assign(data, labels);
    return labels;
}

const FeatureMatrix &KMeansClusterer::centroids() const noexcept { return centroids_; }

double KMeansClusterer::inertia() const noexcept { return inertia_; }

int KMeansClusterer::iterations() const noexcept { return iterations_; }

void KMeansClusterer::initialise_centroids(const FeatureMatrix &data, int clusters) {
    auto rnd = MTRandom32{parameters_.seed};
    auto last_row = static_cast<std::size_t>(data.rows() - 1);

    centroids_ = FeatureMatrix(clusters, data.cols());
    auto first = static_cast<Eigen::Index>(rnd.next_index(last_row));
    centroids_.row(0) = data.row(first);

    auto closest = std::vector<double>(static_cast<std::size_t>(data.rows()));
    for (auto row = Eigen::Index{0}; row < data.rows(); row++) {
        closest[static_cast<std::size_t>(row)] = (data.row(row) - centroids_.row(0)).squaredNorm();
    }

    // k-means++: sample the next centre proportionally to the squared distance
    for (auto c = 1; c < clusters; c++) {
        auto total = 0.0;
        for (auto d : closest) {
            total += d;
        }

        auto chosen = Eigen::Index{0};
        if (total > 0.0) {
            auto target = rnd.next_double() * total;
            auto cumulative = 0.0;
            chosen = data.rows() - 1;
            for (auto row = Eigen::Index{0}; row < data.rows(); row++) {
                cumulative += closest[static_cast<std::size_t>(row)];
                if (cumulative > target) {
                    chosen = row;
                    break;
                }
            }
        } else {
            chosen = static_cast<Eigen::Index>(rnd.next_index(last_row));
        }

        centroids_.row(c) = data.row(chosen);
        for (auto row = Eigen::Index{0}; row < data.rows(); row++) {
            auto d = (data.row(row) - centroids_.row(c)).squaredNorm();
            auto &current = closest[static_cast<std::size_t>(row)];
            current = std::min(current, d);
        }
    }
}

double KMeansClusterer::assign(const FeatureMatrix &data, std::vector<int> &labels) const {
    auto total = 0.0;
    for (auto row = Eigen::Index{0}; row < data.rows(); row++) {
        auto best = 0;
        auto best_distance = std::numeric_limits<double>::max();
        for (auto c = Eigen::Index{0}; c < centroids_.rows(); c++) {
            auto d = (data.row(row) - centroids_.row(c)).squaredNorm();
            if (d < best_distance) {
                best_distance = d;
                best = static_cast<int>(c);
            }
        }

        labels[static_cast<std::size_t>(row)] = best;
        total += best_distance;
    }

    return total;
}

} // namespace aera
