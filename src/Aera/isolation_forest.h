#pragma once

#include "feature_standardizer.h"
#include "randombit_generator.h"

#include <cstddef>
#include <vector>

namespace aera {

/// @brief Isolation forest model parameters
struct IsolationForestParameters {
    /// @brief Number of isolation trees in the ensemble
    std::size_t trees{100};

    /// @brief Upper bound of the per-tree sub-sample size
    std::size_t max_samples{256};

    /// @brief Expected fraction of anomalous rows in the fitted data
    double contamination{0.05};

    /// @brief Seed of the master generator
    unsigned int seed{42};
};

/// @brief Isolation tree node, leaf when no split feature is assigned
struct IsolationNode {
    Eigen::Index feature{-1};
    double split{};
    std::size_t left{};
    std::size_t right{};
    std::size_t size{};

    bool is_leaf() const noexcept { return feature < 0; }
};

/// @brief Random partitioning tree, stored as a flat array of nodes with the root first
class IsolationTree {
  public:
    IsolationTree() = default;

    /// @brief Grows the tree on a sub-sample of the data rows
    /// @param data The feature matrix
    /// @param rows The sub-sample row indices
    /// @param height_limit The maximum tree depth
    /// @param generator The tree's random bit generator
    void fit(const FeatureMatrix &data, std::vector<Eigen::Index> rows, int height_limit,
             RandomBitGenerator &generator);

    /// @brief Calculates the isolation path length of a row
    /// @param data The feature matrix
    /// @param row The row index
    /// @return The leaf depth adjusted by the average path length of the leaf size
    double path_length(const FeatureMatrix &data, Eigen::Index row) const;

    /// @brief Gets the tree nodes
    /// @return The nodes, root first
    const std::vector<IsolationNode> &nodes() const noexcept;

  private:
    std::vector<IsolationNode> nodes_;

    std::size_t grow(const FeatureMatrix &data, std::vector<Eigen::Index> rows, int depth,
                     int height_limit, RandomBitGenerator &generator);
};

/// @brief Isolation-based anomaly scoring ensemble.
///
/// @details Each tree isolates rows of a random sub-sample, drawn without replacement, by
/// recursive random axis-aligned splits. Anomalous rows isolate quickly, so their average path
/// length is short and the score <c>2^(-E[h(x)] / c(psi))</c> approaches one. The decision
/// threshold is the <c>1 - contamination</c> percentile of the fitted scores; a row is an
/// outlier only when its score is strictly above the threshold.
///
/// Trees are grown concurrently, each from its own seed drawn in sequence from the master
/// generator, so the fitted ensemble does not depend on the number of worker threads.
class IsolationForest {
  public:
    /// @brief Initialises a new instance of the IsolationForest class.
    /// @param parameters The model parameters
    /// @throws std::invalid_argument for zero trees or samples, or contamination outside (0, 0.5].
    explicit IsolationForest(IsolationForestParameters parameters = {});

    /// @brief Calculates the average path length of an unsuccessful search in a binary
    ///        search tree, <c>c(n)</c>
    /// @param size The number of rows
    /// @return The average path length, zero for fewer than two rows
    static double average_path_length(std::size_t size) noexcept;

    /// @brief Fits the ensemble and the decision threshold
    /// @param data The standardised feature matrix, at least one row
    /// @throws std::invalid_argument for an empty matrix.
    void fit(const FeatureMatrix &data);

    /// @brief Calculates the anomaly score of every row
    /// @param data The feature matrix, same columns as the fitted data
    /// @return The anomaly scores, in (0, 1]
    /// @throws std::logic_error if the model is not fitted.
    std::vector<double> score_samples(const FeatureMatrix &data) const;

    /// @brief Fits the ensemble and flags the outliers of the fitted data
    /// @param data The standardised feature matrix, at least one row
    /// @return One outlier flag per row
    std::vector<bool> fit_predict(const FeatureMatrix &data);

    /// @brief Gets the fitted decision threshold
    /// @return The score threshold
    double threshold() const noexcept;

    /// @brief Gets the fitted per-tree sub-sample size
    /// @return The sub-sample size
    std::size_t sample_size() const noexcept;

    /// @brief Gets the fitted trees
    /// @return The isolation trees
    const std::vector<IsolationTree> &trees() const noexcept;

  private:
    IsolationForestParameters parameters_;
    std::vector<IsolationTree> trees_;
    std::size_t sample_size_{};
    double threshold_{};
};

/// @brief Counts the outlier flags
/// @param outliers The outlier flags
/// @return Number of outliers
std::size_t count_outliers(const std::vector<bool> &outliers) noexcept;

} // namespace aera
