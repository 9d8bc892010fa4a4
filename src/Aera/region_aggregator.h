#pragma once

#include "run_context.h"

#include "Aera.Core/poco.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace aera {

/// @brief Placeholder for missing county or state identifiers
inline constexpr auto unknown_region = "UNKNOWN";

/// @brief Drift value above which a region is accelerating
inline constexpr double accelerating_drift = 0.25;

/// @brief Drift value above which a region is escalating
inline constexpr double escalating_drift = 0.15;

/// @brief Fraction of the drift applied to the 14 days projection
inline constexpr double projection_drift_weight = 0.5;

/// @brief Prior-period average risk by (county, state)
using BaselineIndex = std::map<std::pair<std::string, std::string>, double>;

/// @brief Classifies a drift value, boundary values fall to the lower tier
/// @param drift The drift value
/// @return The drift status
core::DriftStatus classify_drift(double drift) noexcept;

/// @brief Calculates the fractional change of an average against its baseline
/// @param average The current average risk score
/// @param baseline The prior-period average risk score, if any
/// @return The drift rounded to 4 decimals, zero without baseline or for a zero baseline
double calculate_drift(double average, std::optional<double> baseline) noexcept;

/// @brief Calculates the 14 days risk projection
/// @param average The current average risk score
/// @param drift The drift value
/// @return The projection rounded to 4 decimals
double project_risk(double average, double drift) noexcept;

/// @brief Builds the baseline lookup from the prior-period snapshots
/// @param baselines The prior-period snapshots, in store order
/// @return The lookup, null averages as zero and later rows replacing earlier ones
BaselineIndex index_baselines(const std::vector<core::SnapshotBaseline> &baselines);

/// @brief Per-entity model outputs, aligned with the population order
struct ModelLabels {
    std::vector<int> kmeans;
    std::vector<int> dbscan;
    std::vector<bool> outliers;
};

/// @brief Rolls entities up to region snapshots and measures drift against a baseline.
///
/// @details Entities are grouped by (county, state, organisation), with missing county or
/// state bucketed as <c>UNKNOWN</c> before grouping. The baseline is matched by (county,
/// state) only. Snapshots are returned in ascending group key order.
class RegionAggregator {
  public:
    /// @brief Initialises a new instance of the RegionAggregator class.
    /// @param context The run context stamped on the snapshots
    explicit RegionAggregator(const RunContext &context);

    /// @brief Aggregates the scored population into region snapshots
    /// @param population The scored population
    /// @param labels The model outputs, one entry per entity
    /// @param baselines The prior-period averages
    /// @return One snapshot per region group
    /// @throws std::invalid_argument for model outputs not aligned with the population.
    std::vector<core::RegionSnapshot> aggregate(const std::vector<core::EntityRecord> &population,
                                                const ModelLabels &labels,
                                                const BaselineIndex &baselines) const;

  private:
    const RunContext &context_;
};

} // namespace aera
