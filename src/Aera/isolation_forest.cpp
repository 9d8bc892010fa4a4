#include "isolation_forest.h"
#include "mtrandom.h"

#include "Aera.Core/thread_util.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>
#include <stdexcept>

namespace { // anonymous namespace

/// @brief Linear interpolation percentile, rank <c>p * (n - 1)</c> of the sorted values
double percentile(std::vector<double> values, double p) {
    std::sort(values.begin(), values.end());
    auto rank = p * static_cast<double>(values.size() - 1);
    auto lower = static_cast<std::size_t>(std::floor(rank));
    auto upper = std::min(lower + 1, values.size() - 1);
    auto fraction = rank - static_cast<double>(lower);
    return values[lower] + fraction * (values[upper] - values[lower]);
}

} // anonymous namespace

namespace aera {

void IsolationTree::fit(const FeatureMatrix &data, std::vector<Eigen::Index> rows,
                        int height_limit, RandomBitGenerator &generator) {
    nodes_.clear();
    grow(data, std::move(rows), 0, height_limit, generator);
}

std::size_t IsolationTree::grow(const FeatureMatrix &data, std::vector<Eigen::Index> rows,
                                int depth, int height_limit, RandomBitGenerator &generator) {
    auto index = nodes_.size();
    nodes_.push_back(IsolationNode{.size = rows.size()});
    if (depth >= height_limit || rows.size() <= 1) {
        return index;
    }

    // Only features with spread in this node can separate its rows
    auto candidates = std::vector<Eigen::Index>{};
    auto lower = std::vector<double>(static_cast<std::size_t>(data.cols()));
    auto upper = std::vector<double>(static_cast<std::size_t>(data.cols()));
    for (auto col = Eigen::Index{0}; col < data.cols(); col++) {
        auto [min_it, max_it] = std::minmax_element(
            rows.begin(), rows.end(),
            [&](auto left, auto right) { return data(left, col) < data(right, col); });
        auto column = static_cast<std::size_t>(col);
        lower[column] = data(*min_it, col);
        upper[column] = data(*max_it, col);
        if (lower[column] < upper[column]) {
            candidates.push_back(col);
        }
    }

    if (candidates.empty()) {
        return index;
    }

    auto feature = candidates[generator.next_index(candidates.size() - 1)];
    auto column = static_cast<std::size_t>(feature);
    auto split = lower[column] + generator.next_double() * (upper[column] - lower[column]);

    auto pivot = std::partition(rows.begin(), rows.end(),
                                [&](auto row) { return data(row, feature) < split; });
    auto left_rows = std::vector<Eigen::Index>(rows.begin(), pivot);
    auto right_rows = std::vector<Eigen::Index>(pivot, rows.end());

    auto left = grow(data, std::move(left_rows), depth + 1, height_limit, generator);
    auto right = grow(data, std::move(right_rows), depth + 1, height_limit, generator);

    auto &node = nodes_[index];
    node.feature = feature;
    node.split = split;
    node.left = left;
    node.right = right;
    return index;
}

double IsolationTree::path_length(const FeatureMatrix &data, Eigen::Index row) const {
    auto depth = 0;
    auto index = std::size_t{0};
    while (!nodes_[index].is_leaf()) {
        const auto &node = nodes_[index];
        index = data(row, node.feature) < node.split ? node.left : node.right;
        depth++;
    }

    return depth + IsolationForest::average_path_length(nodes_[index].size);
}

const std::vector<IsolationNode> &IsolationTree::nodes() const noexcept { return nodes_; }

IsolationForest::IsolationForest(IsolationForestParameters parameters)
    : parameters_{parameters} {
    if (parameters_.trees < 1 || parameters_.max_samples < 1) {
        throw std::invalid_argument("The number of trees and samples must be positive.");
    }
    if (!(parameters_.contamination > 0.0 && parameters_.contamination <= 0.5)) {
        throw std::invalid_argument("The contamination must be in range (0, 0.5].");
    }
}

double IsolationForest::average_path_length(std::size_t size) noexcept {
    if (size <= 1) {
        return 0.0;
    }
    if (size == 2) {
        return 1.0;
    }

    auto n = static_cast<double>(size);
    auto harmonic = std::log(n - 1.0) + std::numbers::egamma;
    return 2.0 * harmonic - 2.0 * (n - 1.0) / n;
}

void IsolationForest::fit(const FeatureMatrix &data) {
    if (data.rows() < 1) {
        throw std::invalid_argument("Can not fit an isolation forest without data.");
    }

    auto rows = static_cast<std::size_t>(data.rows());
    sample_size_ = std::min(parameters_.max_samples, rows);
    auto height_limit = static_cast<int>(std::ceil(std::log2(static_cast<double>(sample_size_))));

    auto master = MTRandom32{parameters_.seed};
    auto seeds = std::vector<unsigned int>(parameters_.trees);
    std::generate(seeds.begin(), seeds.end(), [&master]() { return master(); });

    trees_ = std::vector<IsolationTree>(parameters_.trees);
    core::parallel_for(std::size_t{0}, parameters_.trees, [&](std::size_t tree) {
        auto generator = MTRandom32{seeds[tree]};

        // Partial Fisher-Yates shuffle, sampling without replacement
        auto indices = std::vector<Eigen::Index>(rows);
        std::iota(indices.begin(), indices.end(), Eigen::Index{0});
        for (auto i = std::size_t{0}; i < sample_size_; i++) {
            auto j = i + generator.next_index(rows - 1 - i);
            std::swap(indices[i], indices[j]);
        }

        indices.resize(sample_size_);
        trees_[tree].fit(data, std::move(indices), height_limit, generator);
    });

    threshold_ = percentile(score_samples(data), 1.0 - parameters_.contamination);
}

std::vector<double> IsolationForest::score_samples(const FeatureMatrix &data) const {
    if (trees_.empty()) {
        throw std::logic_error("The isolation forest model is not fitted.");
    }

    auto normaliser = average_path_length(sample_size_);
    if (normaliser <= 0.0) {
        normaliser = 1.0;
    }

    auto scores = std::vector<double>(static_cast<std::size_t>(data.rows()));
    core::parallel_for(Eigen::Index{0}, data.rows(), [&](Eigen::Index row) {
        auto total = 0.0;
        for (const auto &tree : trees_) {
            total += tree.path_length(data, row);
        }

        auto mean_length = total / static_cast<double>(trees_.size());
        scores[static_cast<std::size_t>(row)] = std::pow(2.0, -mean_length / normaliser);
    });

    return scores;
}

std::vector<bool> IsolationForest::fit_predict(const FeatureMatrix &data) {
    fit(data);
    auto scores = score_samples(data);
    auto result = std::vector<bool>(scores.size());
    std::transform(scores.cbegin(), scores.cend(), result.begin(),
                   [this](double score) { return score > threshold_; });
    return result;
}

double IsolationForest::threshold() const noexcept { return threshold_; }

std::size_t IsolationForest::sample_size() const noexcept { return sample_size_; }

const std::vector<IsolationTree> &IsolationForest::trees() const noexcept { return trees_; }

std::size_t count_outliers(const std::vector<bool> &outliers) noexcept {
    return static_cast<std::size_t>(std::count(outliers.begin(), outliers.end(), true));
}

} // namespace aera
