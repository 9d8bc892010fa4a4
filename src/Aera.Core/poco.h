#pragma once

#include "date_util.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief Records exchanged between the pipeline and its external collaborators
 *
 * POCO stands for "plain old class object". Optional members are nullable columns in
 * the population and snapshot stores.
 */
namespace aera::core {

/// @brief One vulnerability profile, as read from the population store
struct EntityRecord {
    std::string id;
    std::optional<std::string> organization_id;
    std::optional<std::string> county_id;
    std::optional<std::string> state_id;
    std::optional<double> household_size;
    std::optional<bool> medication_dependency;
    std::optional<bool> insulin_dependency;
    std::optional<bool> oxygen_powered_device;
    std::optional<bool> mobility_limitation;
    std::optional<bool> transportation_access;
    std::optional<bool> financial_strain;
    std::optional<double> risk_score;
    std::optional<std::string> updated_at;

    auto operator<=>(const EntityRecord &rhs) const = default;
};

/// @brief Risk score write-back row, keyed by profile identifier
struct ScoreUpdate {
    std::string id;
    double risk_score{};

    auto operator<=>(const ScoreUpdate &rhs) const = default;
};

/// @brief Region drift classification
enum class DriftStatus {
    /// @brief Drift at or below the escalating threshold
    stable,

    /// @brief Drift above the escalating threshold
    escalating,

    /// @brief Drift above the accelerating threshold
    accelerating
};

/// @brief Region-level trend snapshot, one per (date, county, state, organisation)
struct RegionSnapshot {
    Date snapshot_date{};
    int window_days{};
    std::optional<std::string> organization_id;
    std::string county_id;
    std::string state_id;
    std::size_t profile_count{};
    double avg_risk_score{};
    double max_risk_score{};
    double min_risk_score{};
    std::size_t anomaly_count{};
    std::optional<int> kmeans_cluster;
    std::optional<int> dbscan_cluster;
    double risk_growth_pct{};
    double drift_value{};
    DriftStatus drift_status{DriftStatus::stable};
    double projection_14d{};
    std::string model_version;
    std::string pipeline_run_id;
    std::map<std::string, std::string> metadata;

    auto operator<=>(const RegionSnapshot &rhs) const = default;
};

/// @brief Prior-period snapshot columns used as the drift baseline
struct SnapshotBaseline {
    std::optional<std::string> county_id;
    std::optional<std::string> state_id;
    std::optional<double> avg_risk_score;
    std::optional<std::string> snapshot_date;
};

/// @brief Pipeline stage completion status
enum class StageStatus { success, failed };

/// @brief A single audit metric value
using MetricValue = std::variant<std::int64_t, double, std::string>;

/// @brief Audit metrics, by name
using AuditMetrics = std::map<std::string, MetricValue>;

/// @brief Execution audit record, one per pipeline stage per run
struct AuditRecord {
    std::string run_id;
    std::string model_name;
    std::string model_version;
    std::string stage;
    StageStatus status{StageStatus::success};
    TimePoint started_at{};
    TimePoint finished_at{};
    std::int64_t duration_ms{};
    std::size_t processed_records{};
    std::vector<std::string> feature_set;
    AuditMetrics metrics;
    std::optional<std::string> error_message;
    std::string initiated_by;
};

/// @brief Converts a drift status to its stored representation
/// @param status The drift status
/// @return The upper case status name, e.g. <tt>ESCALATING</tt>
std::string to_string(DriftStatus status);

/// @brief Parses a stored drift status representation
/// @param text The upper case status name
/// @return The drift status
/// @throws std::invalid_argument for unknown status names.
DriftStatus parse_drift_status(const std::string &text);

/// @brief Converts a stage status to its stored representation
/// @param status The stage status
/// @return <tt>SUCCESS</tt> or <tt>FAILED</tt>
std::string to_string(StageStatus status);

/// @brief Creates a string representation of a metric value
/// @param value The metric value
/// @return The value string representation
std::string to_string(const MetricValue &value);

} // namespace aera::core
