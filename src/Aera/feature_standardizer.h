#pragma once

#include "Aera.Core/poco.h"
#include "Aera.Core/univariate_summary.h"

#include <Eigen/Dense>

#include <array>
#include <string>
#include <vector>

namespace aera {

/// @brief Dense feature matrix, one row per profile and one column per feature
using FeatureMatrix = Eigen::MatrixXd;

/// @brief Feature vector columns, in matrix column order
enum class Feature : Eigen::Index {
    risk_score,
    household_size,
    medication_dependency,
    insulin_dependency,
    oxygen_powered_device,
    mobility_limitation,
    transportation_access,
    financial_strain
};

/// @brief Number of columns in the feature matrix
inline constexpr Eigen::Index feature_count = 8;

/// @brief Gets the feature names, in matrix column order
/// @return The feature names
const std::array<std::string, feature_count> &feature_names();

/// @brief Projects profiles onto the numeric feature space and standardises each column.
///
/// @details Every column is centred on its mean and divided by its population standard
/// deviation. A column with negligible deviation is treated as constant and output as zero
/// for every row.
class FeatureStandardizer {
  public:
    /// @brief Builds the raw feature matrix of a population
    /// @param population The scored population, in run order
    /// @return The feature matrix, flags as 0/1 and transportation access 1 when available
    static FeatureMatrix build_features(const std::vector<core::EntityRecord> &population);

    /// @brief Fits the column statistics and standardises the feature matrix
    /// @param features The raw feature matrix, at least one row
    /// @return The standardised matrix, same shape and row order
    /// @throws std::invalid_argument for an empty feature matrix.
    FeatureMatrix fit_transform(const FeatureMatrix &features);

    /// @brief Gets the fitted column statistics
    /// @return The column summaries, in matrix column order
    const std::vector<core::UnivariateSummary> &summaries() const noexcept;

  private:
    std::vector<core::UnivariateSummary> summaries_;
};

} // namespace aera
