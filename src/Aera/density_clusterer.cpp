#include "density_clusterer.h"

#include <algorithm>
#include <deque>
#include <stdexcept>

namespace {
constexpr int unvisited = -2;
} // anonymous namespace

namespace aera {

DensityClusterer::DensityClusterer(double eps, std::size_t min_samples)
    : eps_{eps}, min_samples_{min_samples} {
    if (!(eps_ > 0.0)) {
        throw std::invalid_argument("The neighbourhood radius must be positive.");
    }
    if (min_samples_ < 1) {
        throw std::invalid_argument("The minimum neighbourhood size must be positive.");
    }
}

DensityClusterer DensityClusterer::for_population(std::size_t population_size) {
    return DensityClusterer{default_eps, min_samples_for(population_size)};
}

std::size_t DensityClusterer::min_samples_for(std::size_t population_size) noexcept {
    return std::clamp<std::size_t>(population_size / 20, 3, 8);
}

std::vector<int> DensityClusterer::fit_predict(const FeatureMatrix &data) const {
    auto labels = std::vector<int>(static_cast<std::size_t>(data.rows()), unvisited);
    auto cluster_id = 0;
    for (auto row = Eigen::Index{0}; row < data.rows(); row++) {
        if (labels[static_cast<std::size_t>(row)] != unvisited) {
            continue;
        }

        auto neighbours = region_query(data, row);
        if (neighbours.size() < min_samples_) {
            labels[static_cast<std::size_t>(row)] = noise;
            continue;
        }

        // Expand the new cluster breadth-first through core points, each point queued once
        labels[static_cast<std::size_t>(row)] = cluster_id;
        auto frontier = std::deque<Eigen::Index>{};
        auto claim = [&](const std::vector<Eigen::Index> &points) {
            for (auto point : points) {
                auto &label = labels[static_cast<std::size_t>(point)];
                if (label == noise) {
                    label = cluster_id;
                } else if (label == unvisited) {
                    label = cluster_id;
                    frontier.push_back(point);
                }
            }
        };

        claim(neighbours);
        while (!frontier.empty()) {
            auto next = frontier.front();
            frontier.pop_front();

            auto reach = region_query(data, next);
            if (reach.size() >= min_samples_) {
                claim(reach);
            }
        }

        cluster_id++;
    }

    return labels;
}

double DensityClusterer::eps() const noexcept { return eps_; }

std::size_t DensityClusterer::min_samples() const noexcept { return min_samples_; }

std::vector<Eigen::Index> DensityClusterer::region_query(const FeatureMatrix &data,
                                                         Eigen::Index row) const {
    auto radius = eps_ * eps_;
    auto result = std::vector<Eigen::Index>{};
    for (auto other = Eigen::Index{0}; other < data.rows(); other++) {
        if ((data.row(other) - data.row(row)).squaredNorm() <= radius) {
            result.push_back(other);
        }
    }

    return result;
}

std::size_t count_noise(const std::vector<int> &labels) noexcept {
    return static_cast<std::size_t>(
        std::count(labels.begin(), labels.end(), DensityClusterer::noise));
}

} // namespace aera
